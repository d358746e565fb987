#include "browser_window.h"
#include <QApplication>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QToolButton>
#include <QStyle>
#include <QKeySequence>
#include <QShortcut>
#include <QMessageBox>
#include <QInputDialog>
#include <QMenu>
#include <QMenuBar>
#include <QStatusBar>
#include <QFileDialog>
#include <QFileInfo>
#include <QCloseEvent>
#include <QPointer>
#include <QDebug>

namespace browsey {
namespace engine {

namespace {

constexpr int kSourcePreviewLimit = 20000;

QString errorPageHtml(const QUrl& url)
{
    return QString(
        "<html><head><meta charset='utf-8'><title>페이지를 열 수 없음</title></head>"
        "<body style='font-family:sans-serif;padding:40px;color:#333'>"
        "<h2>페이지를 불러오지 못했습니다</h2>"
        "<p>%1</p>"
        "<p>주소를 확인하거나 잠시 후 다시 시도하세요.</p>"
        "</body></html>").arg(url.toString().toHtmlEscaped());
}

} // namespace

BrowserWindow::BrowserWindow(data::PersistenceStore& store,
                             const extensions::ExtensionRegistry& registry,
                             bool offTheRecord,
                             QWidget* parent)
    : QMainWindow(parent)
    , m_store(store)
    , m_registry(registry)
{
    setAttribute(Qt::WA_DeleteOnClose);

    // 저장된 광고 차단 상태로 프로필 생성
    m_profile = new BrowseyProfile(offTheRecord, m_store.loadFilterState(), this);

    setupUI();
    setupToolBars();
    setupBookmarkDock();
    setupMenuBar();
    setupStatusBar();

    reportEngineResult(m_profile->installRequestFilter(), QString());
    applyUserAgentOverride();

    connect(m_profile->profile(), &QWebEngineProfile::downloadRequested,
            this, &BrowserWindow::onDownloadRequested);
    connect(m_profile->adBlocker(), &AdBlockInterceptor::requestBlocked,
            this, [this](const QUrl&) { updateAdBlockStatus(); });

    loadBookmarks();

    if (!offTheRecord) {
        restoreSession();
    }
    if (tabCount() == 0) {
        createTab(QUrl(kHomeUrl));
    }

    updateAdBlockStatus();
}

BrowserWindow::~BrowserWindow()
{
    // 페이지가 프로필보다 먼저 사라져야 함
    while (m_tabWidget && m_tabWidget->count() > 0) {
        QWidget* widget = m_tabWidget->widget(0);
        m_tabWidget->removeTab(0);
        delete widget;
    }
}

// ============================================================
// UI 구성
// ============================================================

void BrowserWindow::setupUI()
{
    setWindowTitle(m_profile->isOffTheRecord() ? "Browsey (프라이빗)" : "Browsey");
    resize(1280, 860);

    auto* central = new QWidget(this);
    auto* layout = new QVBoxLayout(central);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);

    m_tabWidget = new QTabWidget(central);
    m_tabWidget->setTabsClosable(true);
    m_tabWidget->setMovable(true);
    m_tabWidget->setDocumentMode(true);
    layout->addWidget(m_tabWidget);

    setCentralWidget(central);

    connect(m_tabWidget, &QTabWidget::tabCloseRequested, this, &BrowserWindow::closeTab);
    connect(m_tabWidget, &QTabWidget::currentChanged, this, &BrowserWindow::onTabChanged);
}

void BrowserWindow::setupToolBars()
{
    auto* navBar = addToolBar("네비게이션");
    navBar->setMovable(false);

    auto* backAction = navBar->addAction(style()->standardIcon(QStyle::SP_ArrowBack), "뒤로");
    backAction->setShortcut(QKeySequence::Back);
    connect(backAction, &QAction::triggered, this, [this]() {
        if (auto* view = currentWebView()) view->back();
    });

    auto* forwardAction = navBar->addAction(style()->standardIcon(QStyle::SP_ArrowForward), "앞으로");
    forwardAction->setShortcut(QKeySequence::Forward);
    connect(forwardAction, &QAction::triggered, this, [this]() {
        if (auto* view = currentWebView()) view->forward();
    });

    auto* reloadAction = navBar->addAction(style()->standardIcon(QStyle::SP_BrowserReload), "새로고침");
    reloadAction->setShortcut(QKeySequence::Refresh);
    connect(reloadAction, &QAction::triggered, this, [this]() {
        if (auto* view = currentWebView()) view->reload();
    });

    auto* homeAction = navBar->addAction("🏠");
    homeAction->setToolTip("홈");
    connect(homeAction, &QAction::triggered, this, [this]() {
        if (auto* view = currentWebView()) view->navigate(QUrl(kHomeUrl));
    });

    m_securityIcon = new QLabel(" ", this);
    m_securityIcon->setMinimumWidth(24);
    m_securityIcon->setAlignment(Qt::AlignCenter);
    navBar->addWidget(m_securityIcon);

    m_urlBar = new QLineEdit(this);
    m_urlBar->setPlaceholderText("검색어 또는 URL 입력");
    m_urlBar->setClearButtonEnabled(true);
    navBar->addWidget(m_urlBar);
    connect(m_urlBar, &QLineEdit::returnPressed, this, [this]() {
        navigateTo(m_urlBar->text());
    });

    auto* newTabAction = navBar->addAction("+");
    newTabAction->setToolTip("새 탭");
    newTabAction->setShortcut(QKeySequence::AddTab);
    connect(newTabAction, &QAction::triggered, this, [this]() { createTab(QUrl(kHomeUrl)); });

    // 도구
    auto* toolsBar = addToolBar("도구");
    toolsBar->setMovable(false);

    auto* findAction = toolsBar->addAction("🔍");
    findAction->setToolTip("페이지에서 찾기");
    findAction->setShortcut(QKeySequence::Find);
    connect(findAction, &QAction::triggered, this, &BrowserWindow::onFindInPage);

    auto* sourceAction = toolsBar->addAction("</>");
    sourceAction->setToolTip("페이지 소스 보기");
    sourceAction->setShortcut(QKeySequence("Ctrl+U"));
    connect(sourceAction, &QAction::triggered, this, &BrowserWindow::onViewSource);

    auto* privateAction = toolsBar->addAction("🕶");
    privateAction->setToolTip("새 프라이빗 창");
    privateAction->setShortcut(QKeySequence("Ctrl+Shift+N"));
    connect(privateAction, &QAction::triggered, this, &BrowserWindow::onNewPrivateWindow);

    auto* closeTabShortcut = new QShortcut(QKeySequence::Close, this);
    connect(closeTabShortcut, &QShortcut::activated, this, [this]() {
        closeTab(m_tabWidget->currentIndex());
    });
    auto* focusUrlShortcut = new QShortcut(QKeySequence("Ctrl+L"), this);
    connect(focusUrlShortcut, &QShortcut::activated, this, [this]() {
        m_urlBar->setFocus();
        m_urlBar->selectAll();
    });
}

void BrowserWindow::setupBookmarkDock()
{
    m_bookmarkDock = new QDockWidget("북마크", this);
    m_bookmarkDock->setObjectName("bookmarkDock");

    m_bookmarkList = new QListWidget(m_bookmarkDock);
    m_bookmarkList->setContextMenuPolicy(Qt::CustomContextMenu);
    m_bookmarkDock->setWidget(m_bookmarkList);
    addDockWidget(Qt::LeftDockWidgetArea, m_bookmarkDock);

    connect(m_bookmarkList, &QListWidget::itemActivated,
            this, &BrowserWindow::openBookmarkItem);
    connect(m_bookmarkList, &QListWidget::customContextMenuRequested,
            this, &BrowserWindow::showBookmarkContextMenu);
}

void BrowserWindow::setupMenuBar()
{
    auto* settingsMenu = menuBar()->addMenu("설정(&S)");

    auto* adBlockAction = settingsMenu->addAction("광고 차단 켜기/끄기");
    connect(adBlockAction, &QAction::triggered, this, &BrowserWindow::onToggleAdBlock);

    auto* userAgentAction = settingsMenu->addAction("User-Agent 설정...");
    connect(userAgentAction, &QAction::triggered, this, &BrowserWindow::onSetUserAgent);

    settingsMenu->addSeparator();

    auto* bookmarkAction = settingsMenu->addAction("현재 페이지 북마크");
    bookmarkAction->setShortcut(QKeySequence("Ctrl+D"));
    connect(bookmarkAction, &QAction::triggered, this, &BrowserWindow::onAddBookmark);

    settingsMenu->addAction(m_bookmarkDock->toggleViewAction());

    settingsMenu->addSeparator();

    auto* extensionsAction = settingsMenu->addAction("확장 관리...");
    connect(extensionsAction, &QAction::triggered, this, &BrowserWindow::onManageExtensions);
}

void BrowserWindow::setupStatusBar()
{
    m_adBlockLabel = new QLabel(this);
    statusBar()->addPermanentWidget(m_adBlockLabel);
}

// ============================================================
// 탭 관리
// ============================================================

BrowseyWebView* BrowserWindow::createTab(const QUrl& url)
{
    auto* view = new BrowseyWebView(m_profile->profile(), m_tabWidget);
    view->setWindowFactory([this]() { return createTab(QUrl()); });

    int index = m_tabWidget->addTab(view, "새 탭");
    m_tabWidget->setCurrentIndex(index);

    connect(view, &QWebEngineView::titleChanged, this, [this, view](const QString& title) {
        int i = m_tabWidget->indexOf(view);
        if (i < 0) return;
        m_tabWidget->setTabText(i, title.isEmpty() ? QString("새 탭") : title.left(30));
        m_tabWidget->setTabToolTip(i, title);
    });

    connect(view, &QWebEngineView::iconChanged, this, [this, view](const QIcon& icon) {
        int i = m_tabWidget->indexOf(view);
        if (i >= 0) m_tabWidget->setTabIcon(i, icon);
    });

    connect(view, &QWebEngineView::urlChanged, this, [this, view](const QUrl& changed) {
        if (view == currentWebView()) updateAddressBar(changed);
    });

    connect(view, &QWebEngineView::loadProgress, this, [this, view](int progress) {
        if (view == currentWebView() && progress < 100) {
            showStatus(QString("로딩 중... %1%").arg(progress), 0);
        }
    });

    connect(view, &QWebEngineView::loadFinished, this, [this, view](bool ok) {
        onPageLoadFinished(view, ok);
    });

    view->navigate(url);
    return view;
}

void BrowserWindow::closeTab(int index)
{
    if (index < 0 || index >= m_tabWidget->count()) return;

    // 마지막 탭을 닫으면 홈 탭으로 대체
    if (m_tabWidget->count() == 1) {
        createTab(QUrl(kHomeUrl));
    }

    QWidget* widget = m_tabWidget->widget(index);
    m_tabWidget->removeTab(index);
    widget->deleteLater();

    saveSession();
}

BrowseyWebView* BrowserWindow::currentWebView() const
{
    return qobject_cast<BrowseyWebView*>(m_tabWidget->currentWidget());
}

int BrowserWindow::tabCount() const
{
    return m_tabWidget->count();
}

void BrowserWindow::onTabChanged(int index)
{
    Q_UNUSED(index)
    if (auto* view = currentWebView()) {
        updateAddressBar(view->url());
    }
}

// ============================================================
// 네비게이션
// ============================================================

void BrowserWindow::navigateTo(const QString& input)
{
    auto* view = currentWebView();
    if (!view) {
        view = createTab(QUrl());
    }
    view->navigate(resolveInput(input));
}

void BrowserWindow::onPageLoadFinished(BrowseyWebView* view, bool ok)
{
    // 확장 CSS/JS 주입
    m_injector.onPageLoadFinished(view->scriptTarget(), m_registry.catalog());

    if (view != currentWebView()) return;

    if (ok) {
        showStatus("완료");
    } else {
        showStatus("페이지 로딩 실패", 3000);
        showLoadError(view);
    }
    updateAdBlockStatus();
}

void BrowserWindow::showLoadError(BrowseyWebView* view)
{
    const QUrl failed = view->url();
    qWarning() << "[BrowserWindow] 로딩 실패:" << failed;
    view->setHtml(errorPageHtml(failed), failed);
}

void BrowserWindow::updateAddressBar(const QUrl& url)
{
    m_urlBar->setText(url.toString());
    m_urlBar->setCursorPosition(0);

    const SecurityIndicator indicator = securityIndicatorFor(url);
    m_securityIcon->setText(indicator.icon);
    m_securityIcon->setToolTip(indicator.toolTip);
}

// ============================================================
// 세션
// ============================================================

void BrowserWindow::saveSession()
{
    if (m_profile->isOffTheRecord()) return;

    QStringList urls;
    for (int i = 0; i < m_tabWidget->count(); ++i) {
        auto* view = qobject_cast<BrowseyWebView*>(m_tabWidget->widget(i));
        if (!view) continue;
        const QString url = view->url().toString();
        if (!url.isEmpty()) urls.append(url);
    }
    m_store.setSessionUrls(urls);
}

void BrowserWindow::restoreSession()
{
    const QStringList urls = m_store.sessionUrls();
    for (const QString& url : urls) {
        createTab(QUrl(url));
    }
    if (!urls.isEmpty()) {
        qDebug() << "[BrowserWindow] 세션 복원:" << urls.size() << "개 탭";
    }
}

void BrowserWindow::closeEvent(QCloseEvent* event)
{
    // 북마크와 광고 차단 상태는 변경 시점에 이미 저장됨
    saveSession();
    if (!m_store.sync()) {
        qWarning() << "[BrowserWindow] 설정 저장 실패:" << m_store.location();
    }
    QMainWindow::closeEvent(event);
}

// ============================================================
// 다운로드 / 프라이빗 창
// ============================================================

void BrowserWindow::onDownloadRequested(QWebEngineDownloadRequest* download)
{
    QString defaultPath = download->downloadDirectory() + "/" + download->downloadFileName();
    QString path = QFileDialog::getSaveFileName(this, "다운로드 저장", defaultPath);
    if (path.isEmpty()) {
        download->cancel();
        return;
    }

    QFileInfo fi(path);
    download->setDownloadDirectory(fi.absolutePath());
    download->setDownloadFileName(fi.fileName());
    download->accept();

    showStatus("다운로드 중: " + fi.fileName(), 0);

    connect(download, &QWebEngineDownloadRequest::isFinishedChanged, this, [this, download]() {
        if (!download->isFinished()) return;
        if (download->state() == QWebEngineDownloadRequest::DownloadCompleted) {
            showStatus("다운로드 완료: " + download->downloadFileName(), 3000);
        } else {
            showStatus("다운로드 실패: " + download->downloadFileName(), 3000);
        }
    });
}

void BrowserWindow::onNewPrivateWindow()
{
    auto* window = new BrowserWindow(m_store, m_registry, true);
    window->show();
}

// ============================================================
// 찾기 / 소스 보기
// ============================================================

void BrowserWindow::onFindInPage()
{
    if (!m_findBar) {
        m_findBar = new QWidget(this);
        auto* layout = new QHBoxLayout(m_findBar);
        layout->setContentsMargins(4, 2, 4, 2);

        m_findInput = new QLineEdit(m_findBar);
        m_findInput->setPlaceholderText("페이지에서 찾기...");
        m_findInput->setMaximumWidth(300);

        auto* findNext = new QToolButton(m_findBar);
        findNext->setText("▼");
        findNext->setToolTip("다음");

        auto* findPrev = new QToolButton(m_findBar);
        findPrev->setText("▲");
        findPrev->setToolTip("이전");

        auto* closeBtn = new QToolButton(m_findBar);
        closeBtn->setText("✕");

        layout->addWidget(m_findInput);
        layout->addWidget(findPrev);
        layout->addWidget(findNext);
        layout->addStretch();
        layout->addWidget(closeBtn);

        auto* central = qobject_cast<QVBoxLayout*>(centralWidget()->layout());
        if (central) central->addWidget(m_findBar);

        auto findForward = [this]() {
            if (auto* view = currentWebView()) view->findText(m_findInput->text());
        };
        connect(m_findInput, &QLineEdit::returnPressed, this, findForward);
        connect(m_findInput, &QLineEdit::textChanged, this, findForward);
        connect(findNext, &QToolButton::clicked, this, findForward);
        connect(findPrev, &QToolButton::clicked, this, [this]() {
            if (auto* view = currentWebView()) {
                view->findText(m_findInput->text(), QWebEnginePage::FindBackward);
            }
        });
        connect(closeBtn, &QToolButton::clicked, this, [this]() {
            m_findBar->hide();
            if (auto* view = currentWebView()) view->findText(QString());
        });
    }

    m_findBar->show();
    m_findInput->setFocus();
    m_findInput->selectAll();
}

void BrowserWindow::onViewSource()
{
    auto* view = currentWebView();
    if (!view) return;

    QPointer<BrowserWindow> self(this);
    view->page()->toHtml([self](const QString& html) {
        if (!self) return;
        QString text = html.left(kSourcePreviewLimit);
        if (html.size() > kSourcePreviewLimit) {
            text += "\n...\n[잘림]";
        }
        QMessageBox box(self);
        box.setWindowTitle("페이지 소스");
        box.setText("현재 페이지의 HTML 소스");
        box.setDetailedText(text);
        box.exec();
    });
}

// ============================================================
// 광고 차단
// ============================================================

void BrowserWindow::onToggleAdBlock()
{
    auto& filter = m_profile->filter();
    const bool enabled = !filter.isEnabled();

    m_store.setAdblockEnabled(enabled);
    if (enabled) {
        // 마지막으로 저장된 패턴 목록 복원 (없으면 기본값)
        filter.setPatterns(adblock::RequestFilter::patternsOrDefaults(
            m_store.loadFilterState().patterns));
    }
    filter.setEnabled(enabled);

    updateAdBlockStatus();
    showStatus(enabled ? "광고 차단: 켜짐" : "광고 차단: 꺼짐", 1500);
}

void BrowserWindow::updateAdBlockStatus()
{
    if (!m_profile->filter().isEnabled()) {
        m_adBlockLabel->setText("🛡 꺼짐");
        return;
    }
    m_adBlockLabel->setText(QString("🛡 %1 차단").arg(m_profile->adBlocker()->blockedCount()));
}

// ============================================================
// User-Agent
// ============================================================

void BrowserWindow::applyUserAgentOverride()
{
    const QString saved = m_store.userAgent();
    if (saved.isEmpty()) return;

    EngineResult result = m_profile->setUserAgent(saved);
    if (!result.ok()) {
        reportEngineResult(result, QString());
    }
}

void BrowserWindow::onSetUserAgent()
{
    bool ok = false;
    const QString text = QInputDialog::getText(
        this, "User-Agent 설정", "사용자 지정 User-Agent (비우면 기본값):",
        QLineEdit::Normal, m_store.userAgent(), &ok);
    if (!ok) return;

    EngineResult result = m_profile->setUserAgent(text);
    if (text.isEmpty()) {
        m_store.setUserAgent(QString());
        reportEngineResult(result, "User-Agent 기본값으로 복원");
        return;
    }
    if (result.ok()) {
        m_store.setUserAgent(text);
    }
    reportEngineResult(result, "사용자 지정 User-Agent 적용");
}

// ============================================================
// 북마크
// ============================================================

void BrowserWindow::loadBookmarks()
{
    m_bookmarkList->clear();
    const data::BookmarkList bookmarks = m_store.bookmarks();
    for (const auto& bookmark : bookmarks) {
        addBookmarkItem(bookmark);
    }
}

void BrowserWindow::addBookmarkItem(const data::Bookmark& bookmark)
{
    auto* item = new QListWidgetItem(bookmark.title, m_bookmarkList);
    item->setData(Qt::UserRole, bookmark.url);
    item->setToolTip(bookmark.url);
}

void BrowserWindow::onAddBookmark()
{
    auto* view = currentWebView();
    if (!view) return;

    const QString url = view->url().toString();
    if (url.isEmpty()) return;

    // 다른 창이 바꾼 목록 위에 추가
    m_store.addBookmark(data::Bookmark::create(view->title(), url));
    loadBookmarks();
    showStatus("북마크 추가됨");
}

void BrowserWindow::openBookmarkItem(QListWidgetItem* item)
{
    if (!item) return;
    const QString url = item->data(Qt::UserRole).toString();
    if (!url.isEmpty()) {
        createTab(QUrl(url));
    }
}

void BrowserWindow::showBookmarkContextMenu(const QPoint& pos)
{
    QListWidgetItem* item = m_bookmarkList->itemAt(pos);

    QMenu menu(this);
    if (item) {
        menu.addAction("새 탭에서 열기", this, [this, item]() { openBookmarkItem(item); });
        menu.addAction("삭제", this, [this, item]() {
            const bool removed = m_store.removeBookmark(
                data::Bookmark{item->text(), item->data(Qt::UserRole).toString()});
            // 다른 창에서 이미 지웠으면 목록만 새로고침
            loadBookmarks();
            showStatus(removed ? "북마크 삭제됨" : "북마크가 이미 삭제됨");
        });
        menu.addSeparator();
    }
    menu.addAction("현재 페이지 추가", this, &BrowserWindow::onAddBookmark);
    menu.exec(m_bookmarkList->mapToGlobal(pos));
}

// ============================================================
// 확장
// ============================================================

void BrowserWindow::onManageExtensions()
{
    const auto& catalog = m_registry.catalog();
    if (catalog.isEmpty()) {
        QMessageBox::information(this, "확장",
                                 "로드된 확장이 없습니다.\n" + m_registry.rootDirectory());
        return;
    }

    QStringList lines;
    for (const auto& extension : catalog) {
        lines.append(extension.summary());
    }
    QMessageBox::information(this, "확장",
                             QString("로드된 확장 %1개\n\n").arg(catalog.size()) + lines.join('\n'));
}

// ============================================================
// 상태 표시
// ============================================================

void BrowserWindow::showStatus(const QString& message, int timeoutMs)
{
    statusBar()->showMessage(message, timeoutMs);
}

void BrowserWindow::reportEngineResult(const EngineResult& result, const QString& successMessage)
{
    switch (result.status) {
    case EngineResult::Status::Applied:
        if (!successMessage.isEmpty()) showStatus(successMessage);
        break;
    case EngineResult::Status::Unsupported:
        qWarning() << "[BrowserWindow] 지원되지 않음:" << result.detail;
        showStatus("지원되지 않음: " + result.detail, 3000);
        break;
    case EngineResult::Status::Failed:
        qWarning() << "[BrowserWindow] 실패:" << result.detail;
        showStatus("실패: " + result.detail, 3000);
        break;
    }
}

} // namespace engine
} // namespace browsey
