/**
 * @file test_engine.cpp
 * @brief 주소창 입력 해석 / 보안 표시 단위 테스트
 */

#include <gtest/gtest.h>

#include "engine/engine_result.h"
#include "engine/url_resolver.h"

using namespace browsey::engine;

// ============================================================
// resolveInput 테스트
// ============================================================

// 1. 빈 입력은 홈
TEST(ResolveInputTest, EmptyGoesHome) {
    EXPECT_EQ(resolveInput(""), QUrl(kHomeUrl));
    EXPECT_EQ(resolveInput("   "), QUrl(kHomeUrl));
}

// 2. 도메인처럼 보이면 https 추가
TEST(ResolveInputTest, BareDomainGetsHttps) {
    EXPECT_EQ(resolveInput("example.com"), QUrl("https://example.com"));
    EXPECT_EQ(resolveInput("  qt.io/docs  "), QUrl("https://qt.io/docs"));
}

// 3. 공백이 있거나 '.' 이 없으면 검색
TEST(ResolveInputTest, WordsBecomeSearch) {
    const QUrl url = resolveInput("hello world");
    EXPECT_EQ(url.host(), "duckduckgo.com");
    EXPECT_TRUE(url.toString(QUrl::FullyEncoded).contains("q=hello%20world"))
        << "검색어는 퍼센트 인코딩되어야 합니다";

    EXPECT_EQ(resolveInput("localhost").host(), "duckduckgo.com");
    EXPECT_EQ(resolveInput("what is qt.io").host(), "duckduckgo.com");
}

// 4. 스킴이 있으면 그대로
TEST(ResolveInputTest, ExplicitSchemeKept) {
    EXPECT_EQ(resolveInput("http://example.com/a"), QUrl("http://example.com/a"));
    EXPECT_EQ(resolveInput("file:///tmp/page.html"), QUrl("file:///tmp/page.html"));
}

// ============================================================
// securityIndicatorFor 테스트
// ============================================================

// 5. 스킴별 표시
TEST(SecurityIndicatorTest, IconPerScheme) {
    const auto secure = securityIndicatorFor(QUrl("https://duckduckgo.com/"));
    EXPECT_EQ(secure.icon, QString::fromUtf8("🔒"));
    EXPECT_FALSE(secure.toolTip.isEmpty());

    const auto plain = securityIndicatorFor(QUrl("http://example.com/"));
    EXPECT_EQ(plain.icon, QString::fromUtf8("⚠️"));

    EXPECT_EQ(securityIndicatorFor(QUrl("chrome://version")).icon, QString::fromUtf8("🔒"));

    const auto local = securityIndicatorFor(QUrl("file:///tmp/x.html"));
    EXPECT_EQ(local.icon, " ");
    EXPECT_TRUE(local.toolTip.isEmpty());
}

// ============================================================
// EngineResult 테스트
// ============================================================

// 6. 적용 여부와 사유
TEST(EngineResultTest, StatusAndDetail) {
    EXPECT_TRUE(EngineResult::applied().ok());

    const auto unsupported = EngineResult::unsupported("no profile");
    EXPECT_FALSE(unsupported.ok());
    EXPECT_EQ(unsupported.status, EngineResult::Status::Unsupported);
    EXPECT_EQ(unsupported.detail, "no profile");

    EXPECT_EQ(EngineResult::failed("x").status, EngineResult::Status::Failed);
}
