/**
 * @file main.cpp
 * @brief Browsey 메인 진입점
 *
 * QApplication 초기화, CLI 인수 파싱, 시그널 핸들링,
 * 확장 스캔과 설정 저장소 준비를 수행합니다.
 *
 * CLI 옵션:
 *   --extensions-dir <경로>  확장 번들 루트 (기본: <실행 파일 위치>/extensions)
 *   --settings-file <파일>   네이티브 설정 대신 INI 파일 사용
 *   --private                첫 창을 프라이빗 프로필로 열기
 *   [url...]                 추가 탭으로 열 URL
 */

#include <QApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QDir>
#include <QDebug>

#include <csignal>
#include <iostream>
#include <memory>

#include "data/persistence_store.h"
#include "engine/browser_window.h"
#include "engine/url_resolver.h"
#include "extensions/extension_registry.h"

namespace {

/// 시그널 핸들러에서 접근
QApplication* g_app = nullptr;

/**
 * @brief UNIX 시그널 핸들러
 *
 * SIGINT(Ctrl+C), SIGTERM 수신 시 Qt 이벤트 루프를 종료합니다.
 */
void signalHandler(int signum) {
    std::cerr << "\n[Browsey] 시그널 " << signum << " 수신, 종료 중..." << std::endl;
    if (g_app) {
        g_app->quit();
    }
}

void installSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifndef _WIN32
    std::signal(SIGPIPE, SIG_IGN);
#endif
}

QString resolveExtensionsDir(const QString& requested) {
    if (!requested.isEmpty()) {
        return QDir(requested).absolutePath();
    }
    return QDir(QCoreApplication::applicationDirPath()).filePath("extensions");
}

} // anonymous namespace


// ============================================================
// 메인 함수
// ============================================================

int main(int argc, char* argv[]) {
    // ---- Qt 애플리케이션 초기화 ----
    QApplication app(argc, argv);
    QApplication::setApplicationName("Browsey");
    QApplication::setApplicationVersion("1.0.0");
    QApplication::setOrganizationName("jacobStuff");

    g_app = &app;

    // ---- CLI 인수 파싱 ----
    QCommandLineParser parser;
    parser.setApplicationDescription("Browsey: 광고 차단과 확장을 지원하는 경량 웹 브라우저");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption extensionsOption(
        "extensions-dir",
        "확장 번들 디렉토리 경로",
        "directory",
        ""
    );
    parser.addOption(extensionsOption);

    QCommandLineOption settingsOption(
        "settings-file",
        "INI 설정 파일 경로 (포터블 모드)",
        "file",
        ""
    );
    parser.addOption(settingsOption);

    QCommandLineOption privateOption(
        "private",
        "첫 창을 프라이빗 모드로 열기"
    );
    parser.addOption(privateOption);

    parser.addPositionalArgument("url", "열 URL 또는 검색어", "[url...]");

    parser.process(app);

    installSignalHandlers();

    // ---- 설정 저장소 ----
    std::unique_ptr<browsey::data::PersistenceStore> store;
    const QString settingsFile = parser.value(settingsOption);
    if (settingsFile.isEmpty()) {
        store = std::make_unique<browsey::data::PersistenceStore>(
            QApplication::organizationName(), QApplication::applicationName());
    } else {
        store = std::make_unique<browsey::data::PersistenceStore>(settingsFile);
    }
    std::cout << "[Browsey] 설정 위치: " << store->location().toStdString() << std::endl;

    // ---- 확장 스캔 (시작 시 한 번) ----
    const QString extensionsDir = resolveExtensionsDir(parser.value(extensionsOption));
    browsey::extensions::ExtensionRegistry registry;
    QObject::connect(&registry, &browsey::extensions::ExtensionRegistry::extensionError,
                     [](const QString& name, const QString& error) {
        qWarning() << "[Browsey] 확장 오류:" << name << error;
    });

    if (!browsey::extensions::ExtensionRegistry::ensureBundledExtensions(extensionsDir)) {
        qWarning() << "[Browsey] 기본 확장 설치 실패:" << extensionsDir;
    }
    registry.scan(extensionsDir);

    // ---- 메인 윈도우 ----
    auto* window = new browsey::engine::BrowserWindow(*store, registry,
                                                      parser.isSet(privateOption));
    for (const QString& arg : parser.positionalArguments()) {
        window->createTab(browsey::engine::resolveInput(arg));
    }
    window->show();

    std::cout << "[Browsey] 브라우저 시작" << std::endl;

    // ---- 이벤트 루프 ----
    int exit_code = app.exec();

    // 시그널로 종료된 경우 열린 창의 세션/북마크 저장
    QApplication::closeAllWindows();
    if (!store->sync()) {
        std::cerr << "[Browsey] 설정 저장 실패" << std::endl;
    }

    g_app = nullptr;
    std::cout << "[Browsey] 종료 (코드: " << exit_code << ")" << std::endl;
    return exit_code;
}
