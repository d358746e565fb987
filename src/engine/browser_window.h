#pragma once
#include <QMainWindow>
#include <QTabWidget>
#include <QLineEdit>
#include <QToolBar>
#include <QLabel>
#include <QDockWidget>
#include <QListWidget>
#include <QWebEngineDownloadRequest>
#include "web_engine.h"
#include "url_resolver.h"
#include "extensions/extension_registry.h"
#include "extensions/injection_driver.h"
#include "data/persistence_store.h"

namespace browsey {
namespace engine {

class BrowserWindow : public QMainWindow {
    Q_OBJECT
public:
    BrowserWindow(data::PersistenceStore& store,
                  const extensions::ExtensionRegistry& registry,
                  bool offTheRecord = false,
                  QWidget* parent = nullptr);
    ~BrowserWindow() override;

    // 탭 관리
    BrowseyWebView* createTab(const QUrl& url = QUrl(kHomeUrl));
    void closeTab(int index);
    BrowseyWebView* currentWebView() const;
    int tabCount() const;

    // 네비게이션
    void navigateTo(const QString& input);

    // 세션 (프라이빗 창은 저장/복원 안 함)
    void saveSession();
    void restoreSession();

    BrowseyProfile* browsingProfile() const { return m_profile; }

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onTabChanged(int index);
    void onDownloadRequested(QWebEngineDownloadRequest* download);

    // 메뉴 액션
    void onNewPrivateWindow();
    void onFindInPage();
    void onViewSource();
    void onToggleAdBlock();
    void onSetUserAgent();
    void onAddBookmark();
    void onManageExtensions();

private:
    void setupUI();
    void setupToolBars();
    void setupBookmarkDock();
    void setupMenuBar();
    void setupStatusBar();

    void applyUserAgentOverride();
    void onPageLoadFinished(BrowseyWebView* view, bool ok);
    void showLoadError(BrowseyWebView* view);

    void loadBookmarks();
    void addBookmarkItem(const data::Bookmark& bookmark);
    void openBookmarkItem(QListWidgetItem* item);
    void showBookmarkContextMenu(const QPoint& pos);

    void updateAdBlockStatus();
    void updateAddressBar(const QUrl& url);
    void showStatus(const QString& message, int timeoutMs = 2000);
    void reportEngineResult(const EngineResult& result, const QString& successMessage);

    data::PersistenceStore& m_store;
    const extensions::ExtensionRegistry& m_registry;
    extensions::InjectionDriver m_injector;
    BrowseyProfile* m_profile = nullptr;

    // UI 컴포넌트
    QTabWidget* m_tabWidget = nullptr;
    QLineEdit* m_urlBar = nullptr;
    QLabel* m_securityIcon = nullptr;
    QLabel* m_adBlockLabel = nullptr;
    QDockWidget* m_bookmarkDock = nullptr;
    QListWidget* m_bookmarkList = nullptr;

    // Find bar
    QWidget* m_findBar = nullptr;
    QLineEdit* m_findInput = nullptr;
};

} // namespace engine
} // namespace browsey
