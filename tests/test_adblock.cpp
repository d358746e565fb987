/**
 * @file test_adblock.cpp
 * @brief 요청 필터 단위 테스트
 *
 * 테스트 대상:
 *   - RequestFilter: 기본 패턴, 대소문자 무시, 활성화 토글, 패턴 교체, 진단 조회
 */

#include <gtest/gtest.h>

#include "adblock/request_filter.h"

using namespace browsey::adblock;

class RequestFilterTest : public ::testing::Test {
protected:
    RequestFilter filter_;
};

// 1. 기본 패턴으로 광고 URL 차단, 일반 URL 허용
TEST_F(RequestFilterTest, BlocksAdUrlWithDefaults) {
    EXPECT_TRUE(filter_.shouldBlock("https://pagead2.googlesyndication.com/ads?x=1"))
        << "기본 패턴은 googlesyndication 광고 요청을 차단해야 합니다";
    EXPECT_FALSE(filter_.shouldBlock("https://example.com/page"))
        << "일반 페이지는 차단하면 안 됩니다";
}

// 2. 기본 패턴 14개가 원문 그대로 설정됨
TEST_F(RequestFilterTest, DefaultPatternsVerbatim) {
    const auto& defaults = RequestFilter::defaultPatterns();
    ASSERT_EQ(defaults.size(), 14u);
    EXPECT_EQ(defaults.front(), "doubleclick.net");
    EXPECT_EQ(defaults.back(), "adsystem");
    EXPECT_EQ(filter_.patterns(), defaults);
    EXPECT_TRUE(filter_.isEnabled());
}

// 3. URL 대소문자 무시
TEST_F(RequestFilterTest, MatchingIsCaseInsensitive) {
    EXPECT_TRUE(filter_.shouldBlock("HTTPS://STATS.DOUBLECLICK.NET/x.gif"));
    EXPECT_TRUE(filter_.shouldBlock("https://cdn.example.com/Tracking/pixel"));
}

// 4. 패턴은 설정 시점에 소문자로 변환
TEST_F(RequestFilterTest, SetPatternsLowercases) {
    filter_.setPatterns({"BadHost.COM", "Banner"});

    ASSERT_EQ(filter_.patterns().size(), 2u);
    EXPECT_EQ(filter_.patterns()[0], "badhost.com");
    EXPECT_EQ(filter_.patterns()[1], "banner");
    EXPECT_TRUE(filter_.shouldBlock("http://badhost.com/"));
    EXPECT_TRUE(filter_.shouldBlock("http://site.org/img/BANNER.png"));
    EXPECT_FALSE(filter_.shouldBlock("https://pagead2.googlesyndication.com/ads?x=1"))
        << "교체된 목록에는 기본 패턴이 없어야 합니다";
}

// 5. 빈 목록이면 아무것도 차단하지 않음
TEST_F(RequestFilterTest, EmptyListBlocksNothing) {
    filter_.setPatterns({"custom"});
    filter_.setPatterns({});

    EXPECT_TRUE(filter_.patterns().empty());
    EXPECT_TRUE(filter_.isEnabled());
    EXPECT_FALSE(filter_.shouldBlock("https://doubleclick.net/ad.js"))
        << "빈 목록은 기본 패턴으로 바뀌면 안 됩니다";
}

// 6. 빈 문자열 패턴은 모든 URL과 매칭
TEST_F(RequestFilterTest, EmptyStringPatternMatchesEverything) {
    filter_.setPatterns({""});

    ASSERT_EQ(filter_.patterns().size(), 1u);
    EXPECT_TRUE(filter_.shouldBlock("https://example.com/"));
    EXPECT_TRUE(filter_.shouldBlock(""));
    auto hit = filter_.matchingPattern("https://example.com/");
    ASSERT_TRUE(hit.has_value());
    EXPECT_TRUE(hit->empty());
}

// 7. 비활성화하면 모든 요청 허용, 설정 목록은 유지
TEST_F(RequestFilterTest, DisabledBlocksNothing) {
    filter_.setEnabled(false);

    EXPECT_FALSE(filter_.isEnabled());
    EXPECT_TRUE(filter_.activePatterns().empty());
    EXPECT_FALSE(filter_.shouldBlock("https://doubleclick.net/ad.js"));
    EXPECT_EQ(filter_.patterns(), RequestFilter::defaultPatterns())
        << "비활성화해도 설정된 패턴은 남아 있어야 합니다";
}

// 8. true → false → true 토글 후 같은 패턴 목록
TEST_F(RequestFilterTest, ToggleRestoresExactPatterns) {
    filter_.setPatterns({"alpha", "beta.example", "/gamma?"});
    const auto before = filter_.activePatterns();

    filter_.setEnabled(false);
    filter_.setEnabled(true);

    EXPECT_EQ(filter_.activePatterns(), before);
    EXPECT_TRUE(filter_.shouldBlock("https://beta.example/"));
}

// 9. 비활성 중 패턴 교체: 다시 켤 때 새 목록이 활성
TEST_F(RequestFilterTest, SetPatternsWhileDisabled) {
    filter_.setEnabled(false);
    filter_.setPatterns({"later"});
    EXPECT_FALSE(filter_.shouldBlock("https://later.com/"));

    filter_.setEnabled(true);
    EXPECT_TRUE(filter_.shouldBlock("https://later.com/"));
}

// 10. 저장된 상태로 생성
TEST_F(RequestFilterTest, ConstructFromState) {
    FilterState state;
    state.enabled = false;
    state.patterns = {"Tracker"};

    RequestFilter restored(state);
    EXPECT_FALSE(restored.isEnabled());
    EXPECT_FALSE(restored.shouldBlock("https://tracker.io/"));

    restored.setEnabled(true);
    EXPECT_TRUE(restored.shouldBlock("https://tracker.io/"));

    const FilterState snapshot = restored.state();
    EXPECT_TRUE(snapshot.enabled);
    ASSERT_EQ(snapshot.patterns.size(), 1u);
    EXPECT_EQ(snapshot.patterns[0], "tracker");
}

// 11. 차단 원인 패턴 조회
TEST_F(RequestFilterTest, MatchingPatternReportsFirstHit) {
    auto hit = filter_.matchingPattern("https://securepubads.g.doubleclick.net/tag/js/gpt.js");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, "doubleclick.net");

    EXPECT_FALSE(filter_.matchingPattern("https://example.com/").has_value());

    filter_.setEnabled(false);
    EXPECT_FALSE(filter_.matchingPattern("https://doubleclick.net/").has_value());
}

// 12. 저장된 목록이 비어있으면 기본 패턴으로 생성
TEST_F(RequestFilterTest, EmptySavedStateUsesDefaults) {
    FilterState state;
    state.enabled = true;

    RequestFilter restored(state);
    EXPECT_EQ(restored.patterns(), RequestFilter::defaultPatterns());
    EXPECT_TRUE(restored.shouldBlock("https://doubleclick.net/ad.js"));
}

// 13. patternsOrDefaults: 비어있을 때만 기본 패턴
TEST_F(RequestFilterTest, PatternsOrDefaults) {
    EXPECT_EQ(RequestFilter::patternsOrDefaults({}), RequestFilter::defaultPatterns());

    const std::vector<std::string> saved{"only"};
    EXPECT_EQ(RequestFilter::patternsOrDefaults(saved), saved);

    const std::vector<std::string> blank{""};
    EXPECT_EQ(RequestFilter::patternsOrDefaults(blank), blank)
        << "빈 문자열 하나짜리 목록은 비어있는 목록이 아닙니다";
}

// 14. 대소문자 변환은 ASCII만: 비 ASCII는 바이트가 같아야 매칭
TEST_F(RequestFilterTest, CaseFoldingIsAsciiOnly) {
    // "광고Ä" (UTF-8)
    filter_.setPatterns({"\xea\xb4\x91\xea\xb3\xa0\xc3\x84"});

    EXPECT_TRUE(filter_.shouldBlock("https://example.com/\xea\xb4\x91\xea\xb3\xa0\xc3\x84/x"));
    // "광고ä": Ä 의 소문자 형태는 다른 바이트열
    EXPECT_FALSE(filter_.shouldBlock("https://example.com/\xea\xb4\x91\xea\xb3\xa0\xc3\xa4/x"));

    filter_.setPatterns({"Tracker"});
    EXPECT_TRUE(filter_.shouldBlock("https://TRACKER.example/"));
}
