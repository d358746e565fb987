#include "web_engine.h"
#include <QWebEngineUrlRequestInfo>
#include <QWebEngineSettings>
#include <QDebug>

namespace browsey {
namespace engine {

// ============================================================
// PageScriptTarget
// ============================================================

PageScriptTarget::PageScriptTarget(QWebEnginePage* page)
    : m_page(page)
{
}

void PageScriptTarget::runScript(const QString& source)
{
    if (!m_page) return;
    m_page->runJavaScript(source);
}

// ============================================================
// BrowseyWebView
// ============================================================

BrowseyWebView::BrowseyWebView(QWebEngineProfile* profile, QWidget* parent)
    : QWebEngineView(parent)
    , m_page(new QWebEnginePage(profile, this))
    , m_scriptTarget(m_page)
{
    setPage(m_page);
    settings()->setAttribute(QWebEngineSettings::JavascriptEnabled, true);
    settings()->setAttribute(QWebEngineSettings::LocalStorageEnabled, true);
    settings()->setAttribute(QWebEngineSettings::FullScreenSupportEnabled, true);
}

BrowseyWebView::~BrowseyWebView() = default;

void BrowseyWebView::navigate(const QUrl& url)
{
    if (url.isValid()) {
        load(url);
    }
}

void BrowseyWebView::setWindowFactory(WindowFactory factory)
{
    m_windowFactory = std::move(factory);
}

QWebEngineView* BrowseyWebView::createWindow(QWebEnginePage::WebWindowType type)
{
    Q_UNUSED(type)
    // 새 창 요청은 새 탭으로 처리 (BrowserWindow에서 핸들링)
    return m_windowFactory ? m_windowFactory() : nullptr;
}

// ============================================================
// AdBlockInterceptor
// ============================================================

AdBlockInterceptor::AdBlockInterceptor(const adblock::RequestFilter& filter, QObject* parent)
    : QWebEngineUrlRequestInterceptor(parent)
    , m_filter(filter)
{
}

void AdBlockInterceptor::interceptRequest(QWebEngineUrlRequestInfo& info)
{
    const QUrl url = info.requestUrl();
    const QByteArray text = url.toString().toUtf8();

    if (m_filter.shouldBlock(std::string_view(text.constData(),
                                              static_cast<size_t>(text.size())))) {
        info.block(true);
        ++m_blockedCount;
        emit requestBlocked(url);
    }
}

// ============================================================
// BrowseyProfile
// ============================================================

BrowseyProfile::BrowseyProfile(bool offTheRecord, const adblock::FilterState& filterState,
                               QObject* parent)
    : QObject(parent)
    , m_filter(filterState)
{
    // 이름 없는 프로필은 off-the-record
    m_profile = offTheRecord ? new QWebEngineProfile(this)
                             : new QWebEngineProfile("Browsey", this);
    m_defaultUserAgent = m_profile->httpUserAgent();
    m_adBlocker = new AdBlockInterceptor(m_filter, this);
}

BrowseyProfile::~BrowseyProfile() = default;

bool BrowseyProfile::isOffTheRecord() const
{
    return m_profile->isOffTheRecord();
}

EngineResult BrowseyProfile::installRequestFilter()
{
    if (!m_profile || !m_adBlocker) {
        return EngineResult::unsupported("프로필 없음");
    }
    m_profile->setUrlRequestInterceptor(m_adBlocker);
    return EngineResult::applied();
}

EngineResult BrowseyProfile::setUserAgent(const QString& userAgent)
{
    if (!m_profile) {
        return EngineResult::unsupported("프로필 없음");
    }

    const QString wanted = userAgent.isEmpty() ? m_defaultUserAgent : userAgent;
    m_profile->setHttpUserAgent(wanted);

    if (m_profile->httpUserAgent() != wanted) {
        qWarning() << "[BrowseyProfile] User-Agent 적용 실패:" << wanted;
        return EngineResult::failed("엔진이 User-Agent 변경을 반영하지 않음");
    }
    return EngineResult::applied();
}

QString BrowseyProfile::userAgent() const
{
    return m_profile->httpUserAgent();
}

} // namespace engine
} // namespace browsey
