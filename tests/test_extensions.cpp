/**
 * @file test_extensions.cpp
 * @brief 확장 레지스트리 / 주입 단위 테스트
 *
 * 테스트 대상:
 *   - ExtensionRegistry: 번들 스캔, manifest 파싱 실패 허용, 이름 충돌, 내장 번들
 *   - InjectionDriver: 주입 순서, 스타일 스크립트 인코딩, 빈 파일 생략
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonArray>
#include <QTemporaryDir>

#include "extensions/extension_registry.h"
#include "extensions/injection_driver.h"

using namespace browsey::extensions;

namespace {

// 주입된 스크립트를 순서대로 기록
class RecordingTarget : public ScriptTarget {
public:
    void runScript(const QString& source) override { scripts.append(source); }
    QStringList scripts;
};

class MockScriptTarget : public ScriptTarget {
public:
    MOCK_METHOD(void, runScript, (const QString& source), (override));
};

} // namespace

// ============================================================
// ExtensionRegistry 테스트
// ============================================================

class ExtensionRegistryTest : public ::testing::Test {
protected:
    QTemporaryDir tempDir_;
    ExtensionRegistry registry_;

    void SetUp() override {
        ASSERT_TRUE(tempDir_.isValid());
    }

    QString root() const { return tempDir_.path(); }

    // 번들 디렉토리에 파일 작성
    void writeFile(const QString& bundle, const QString& file, const QByteArray& content) {
        QDir dir(root());
        ASSERT_TRUE(dir.mkpath(bundle));
        QFile f(dir.filePath(bundle + "/" + file));
        ASSERT_TRUE(f.open(QIODevice::WriteOnly));
        ASSERT_EQ(f.write(content), content.size());
    }
};

// 1. styles.css만 있는 번들은 디렉토리 이름으로 등록
TEST_F(ExtensionRegistryTest, StylesOnlyBundleUsesDirectoryName) {
    writeFile("plain", "styles.css", "body { margin: 0; }");

    const auto& catalog = registry_.scan(root());

    ASSERT_EQ(catalog.size(), 1);
    const Extension* ext = registry_.find("plain");
    ASSERT_NE(ext, nullptr);
    ASSERT_TRUE(ext->styleSheet.has_value());
    EXPECT_EQ(*ext->styleSheet, "body { margin: 0; }");
    EXPECT_FALSE(ext->contentScript.has_value())
        << "content.js가 없으면 스크립트는 없어야 합니다";
    EXPECT_FALSE(ext->manifest.name.has_value());
}

// 2. 잘못된 manifest.json 은 무시하고 스크립트는 로드
TEST_F(ExtensionRegistryTest, MalformedManifestIsNonFatal) {
    writeFile("broken", "manifest.json", "{ this is not json");
    writeFile("broken", "content.js", "console.log('hi');");

    QStringList errors;
    QObject::connect(&registry_, &ExtensionRegistry::extensionError,
                     [&errors](const QString& name, const QString&) { errors.append(name); });

    registry_.scan(root());

    const Extension* ext = registry_.find("broken");
    ASSERT_NE(ext, nullptr) << "manifest 파싱 실패가 번들 로드를 막으면 안 됩니다";
    ASSERT_TRUE(ext->contentScript.has_value());
    EXPECT_EQ(*ext->contentScript, "console.log('hi');");
    EXPECT_FALSE(ext->manifest.name.has_value());
    EXPECT_EQ(errors, QStringList{"broken"});
}

// 3. 빈 번들은 발견되지만 카탈로그에서 제외
TEST_F(ExtensionRegistryTest, EmptyBundleExcluded) {
    ASSERT_TRUE(QDir(root()).mkpath("empty"));
    writeFile("meta-only", "manifest.json", R"({"name": "Only Meta"})");

    const auto& catalog = registry_.scan(root());

    EXPECT_TRUE(catalog.isEmpty());
    EXPECT_EQ(registry_.discoveredCount(), 2);
    EXPECT_EQ(registry_.count(), 0);
}

// 4. manifest name 이 디렉토리 이름보다 우선, 나머지 필드 보존
TEST_F(ExtensionRegistryTest, ManifestNameOverridesDirectory) {
    writeFile("dm", "manifest.json",
              R"({"name": "Dark Mode", "description": "Forces dark", "version": "1.0"})");
    writeFile("dm", "styles.css", "html { background: #000; }");

    registry_.scan(root());

    EXPECT_EQ(registry_.find("dm"), nullptr);
    const Extension* ext = registry_.find("Dark Mode");
    ASSERT_NE(ext, nullptr);
    EXPECT_EQ(ext->manifest.version.value_or(QString()), "1.0");
    EXPECT_EQ(ext->summary(), "Dark Mode 1.0: Forces dark");
}

// 5. 문자열이 아닌 manifest 필드는 없는 것으로 취급
TEST_F(ExtensionRegistryTest, NonStringManifestFieldsIgnored) {
    writeFile("numeric", "manifest.json", R"({"name": 42, "version": ["1"]})");
    writeFile("numeric", "content.js", "void 0;");

    registry_.scan(root());

    const Extension* ext = registry_.find("numeric");
    ASSERT_NE(ext, nullptr);
    EXPECT_FALSE(ext->manifest.name.has_value());
    EXPECT_FALSE(ext->manifest.version.has_value());
}

// 6. 같은 이름으로 해석되면 이름순으로 나중 번들이 이김
TEST_F(ExtensionRegistryTest, NameCollisionLastSortedWins) {
    writeFile("a-first", "manifest.json", R"({"name": "Same"})");
    writeFile("a-first", "content.js", "first();");
    writeFile("b-second", "manifest.json", R"({"name": "Same"})");
    writeFile("b-second", "content.js", "second();");

    const auto& catalog = registry_.scan(root());

    ASSERT_EQ(catalog.size(), 1);
    EXPECT_EQ(registry_.discoveredCount(), 2);
    EXPECT_EQ(*registry_.find("Same")->contentScript, "second();");
}

// 7. 루트가 없으면 생성하고 빈 카탈로그
TEST_F(ExtensionRegistryTest, MissingRootIsCreated) {
    const QString missing = QDir(root()).filePath("nested/extensions");

    const auto& catalog = registry_.scan(missing);

    EXPECT_TRUE(catalog.isEmpty());
    EXPECT_TRUE(QDir(missing).exists());
    EXPECT_EQ(registry_.rootDirectory(), missing);
}

// 8. 재스캔하면 이전 카탈로그 교체
TEST_F(ExtensionRegistryTest, RescanReplacesCatalog) {
    writeFile("one", "content.js", "1;");
    registry_.scan(root());
    ASSERT_EQ(registry_.count(), 1);

    QTemporaryDir other;
    ASSERT_TRUE(other.isValid());
    registry_.scan(other.path());
    EXPECT_EQ(registry_.count(), 0);
}

// 9. 로드/완료 시그널
TEST_F(ExtensionRegistryTest, EmitsLoadedAndFinished) {
    writeFile("x", "content.js", "x();");
    writeFile("y", "styles.css", "p{}");

    QStringList loaded;
    int finished = -1;
    QObject::connect(&registry_, &ExtensionRegistry::extensionLoaded,
                     [&loaded](const Extension& ext) { loaded.append(ext.name); });
    QObject::connect(&registry_, &ExtensionRegistry::scanFinished,
                     [&finished](int count) { finished = count; });

    registry_.scan(root());

    EXPECT_EQ(loaded, (QStringList{"x", "y"}));
    EXPECT_EQ(finished, 2);
}

// 10. 내장 번들 생성, 기존 파일은 덮어쓰지 않음
TEST_F(ExtensionRegistryTest, BundledExtensionsDoNotOverwrite) {
    ASSERT_TRUE(ExtensionRegistry::ensureBundledExtensions(root()));
    registry_.scan(root());
    const Extension* dark = registry_.find("Dark Mode");
    ASSERT_NE(dark, nullptr);
    EXPECT_TRUE(dark->styleSheet.has_value());

    writeFile("darkmode", "styles.css", "/* user edit */");
    ASSERT_TRUE(ExtensionRegistry::ensureBundledExtensions(root()));
    registry_.scan(root());
    EXPECT_EQ(*registry_.find("Dark Mode")->styleSheet, "/* user edit */")
        << "사용자가 수정한 파일은 유지되어야 합니다";
}

// 11. 읽을 수 없는 파일은 해당 항목만 빠지고 오류 한 번
TEST_F(ExtensionRegistryTest, UnreadableScriptLeavesStyleIntact) {
    // 디렉토리는 파일로 열 수 없음
    ASSERT_TRUE(QDir(root()).mkpath("unreadable/content.js"));
    writeFile("unreadable", "styles.css", "a { color: red; }");

    QStringList errors;
    QObject::connect(&registry_, &ExtensionRegistry::extensionError,
                     [&errors](const QString& name, const QString&) { errors.append(name); });

    registry_.scan(root());

    const Extension* ext = registry_.find("unreadable");
    ASSERT_NE(ext, nullptr) << "읽기 실패가 번들 전체를 빼면 안 됩니다";
    EXPECT_FALSE(ext->contentScript.has_value());
    ASSERT_TRUE(ext->styleSheet.has_value());
    EXPECT_EQ(*ext->styleSheet, "a { color: red; }");
    EXPECT_EQ(errors, QStringList{"unreadable"});
}

// 12. 점으로 시작하는 번들 디렉토리도 로드
TEST_F(ExtensionRegistryTest, HiddenBundleIsLoaded) {
    writeFile(".hidden", "content.js", "hidden();");
    writeFile("visible", "content.js", "visible();");

    registry_.scan(root());

    EXPECT_EQ(registry_.discoveredCount(), 2);
    const Extension* ext = registry_.find(".hidden");
    ASSERT_NE(ext, nullptr);
    ASSERT_TRUE(ext->contentScript.has_value());
    EXPECT_EQ(*ext->contentScript, "hidden();");
}

// ============================================================
// InjectionDriver 테스트
// ============================================================

class InjectionDriverTest : public ::testing::Test {
protected:
    InjectionDriver driver_;
    RecordingTarget target_;

    static Extension make(const QString& name,
                          std::optional<QString> css,
                          std::optional<QString> js) {
        Extension ext;
        ext.name = name;
        ext.styleSheet = std::move(css);
        ext.contentScript = std::move(js);
        return ext;
    }
};

// 1. 이름순, 확장마다 스타일 → 스크립트
TEST_F(InjectionDriverTest, InjectsInNameOrderStyleFirst) {
    ExtensionCatalog catalog;
    catalog.insert("zeta", make("zeta", std::nullopt, QString("zeta();")));
    catalog.insert("alpha", make("alpha", QString("p{}"), QString("alpha();")));

    const int pushed = driver_.onPageLoadFinished(&target_, catalog);

    ASSERT_EQ(pushed, 3);
    ASSERT_EQ(target_.scripts.size(), 3);
    EXPECT_EQ(target_.scripts[0], InjectionDriver::styleInjectionScript("p{}"));
    EXPECT_EQ(target_.scripts[1], "alpha();");
    EXPECT_EQ(target_.scripts[2], "zeta();");
}

// 2. 스크립트 호출 순서 (mock)
TEST_F(InjectionDriverTest, CallsTargetInOrder) {
    ExtensionCatalog catalog;
    catalog.insert("b", make("b", QString("b{}"), std::nullopt));
    catalog.insert("a", make("a", std::nullopt, QString("a();")));

    MockScriptTarget page;
    {
        ::testing::InSequence seq;
        EXPECT_CALL(page, runScript(QString("a();")));
        EXPECT_CALL(page, runScript(InjectionDriver::styleInjectionScript("b{}")));
    }

    EXPECT_EQ(driver_.onPageLoadFinished(&page, catalog), 2);
}

// 3. 빈 파일은 주입하지 않음
TEST_F(InjectionDriverTest, SkipsEmptyPayloads) {
    ExtensionCatalog catalog;
    catalog.insert("blank", make("blank", QString(""), QString("")));

    EXPECT_EQ(driver_.onPageLoadFinished(&target_, catalog), 0);
    EXPECT_TRUE(target_.scripts.isEmpty());
}

// 4. 대상 페이지가 없으면 아무것도 하지 않음
TEST_F(InjectionDriverTest, NullTargetIsNoop) {
    ExtensionCatalog catalog;
    catalog.insert("a", make("a", std::nullopt, QString("a();")));
    EXPECT_EQ(driver_.onPageLoadFinished(nullptr, catalog), 0);
}

// 5. 로드마다 다시 주입 (중복 제거 없음)
TEST_F(InjectionDriverTest, ReinjectsOnEveryLoad) {
    ExtensionCatalog catalog;
    catalog.insert("a", make("a", std::nullopt, QString("a();")));

    driver_.onPageLoadFinished(&target_, catalog);
    driver_.onPageLoadFinished(&target_, catalog);
    EXPECT_EQ(target_.scripts, (QStringList{"a();", "a();"}));
}

// 6. CSS 는 JS 문자열 리터럴로 안전하게 인코딩
TEST_F(InjectionDriverTest, StyleScriptEscapesCss) {
    const QString css = "a::after { content: \"it's\\\"\"; }\nb { }";
    const QString script = InjectionDriver::styleInjectionScript(css);

    EXPECT_TRUE(script.startsWith("(function(){"));
    EXPECT_TRUE(script.contains("document.createElement('style')"));
    EXPECT_TRUE(script.contains("document.head.appendChild(style)"));
    EXPECT_FALSE(script.contains('\n')) << "개행은 이스케이프되어야 합니다";

    // 리터럴을 JSON으로 다시 읽으면 원문과 같아야 함
    const QString literal = InjectionDriver::toJsStringLiteral(css);
    const QJsonDocument doc = QJsonDocument::fromJson(("[" + literal + "]").toUtf8());
    ASSERT_TRUE(doc.isArray());
    EXPECT_EQ(doc.array().at(0).toString(), css);
    EXPECT_TRUE(script.contains(literal));
}

// 7. 줄 구분자 U+2028/U+2029 이스케이프
TEST_F(InjectionDriverTest, EscapesLineSeparators) {
    const QString css = QString("a{}") + QChar(0x2028) + "b{}" + QChar(0x2029);
    const QString literal = InjectionDriver::toJsStringLiteral(css);

    EXPECT_FALSE(literal.contains(QChar(0x2028)));
    EXPECT_FALSE(literal.contains(QChar(0x2029)));
    EXPECT_EQ(literal, "\"a{}\\u2028b{}\\u2029\"");
}
