#pragma once
#include <QObject>
#include <QPointer>
#include <QWebEngineView>
#include <QWebEnginePage>
#include <QWebEngineProfile>
#include <QWebEngineUrlRequestInterceptor>
#include <QUrl>
#include <QString>
#include <functional>

#include "adblock/request_filter.h"
#include "engine/engine_result.h"
#include "extensions/injection_driver.h"

namespace browsey {
namespace engine {

// ============================================================
// PageScriptTarget: QWebEnginePage 로 스크립트 보내기
// ============================================================
class PageScriptTarget : public extensions::ScriptTarget {
public:
    explicit PageScriptTarget(QWebEnginePage* page);

    // 결과를 기다리지 않음. 탭이 이미 닫혔으면 조용히 버림
    void runScript(const QString& source) override;

private:
    QPointer<QWebEnginePage> m_page;
};

// ============================================================
// BrowseyWebView: 탭 하나의 웹 뷰
// ============================================================
class BrowseyWebView : public QWebEngineView {
    Q_OBJECT
public:
    using WindowFactory = std::function<BrowseyWebView*()>;

    explicit BrowseyWebView(QWebEngineProfile* profile, QWidget* parent = nullptr);
    ~BrowseyWebView() override;

    void navigate(const QUrl& url);

    // target=_blank, window.open 등을 새 탭으로
    void setWindowFactory(WindowFactory factory);

    extensions::ScriptTarget* scriptTarget() { return &m_scriptTarget; }

protected:
    QWebEngineView* createWindow(QWebEnginePage::WebWindowType type) override;

private:
    QWebEnginePage* m_page = nullptr;
    PageScriptTarget m_scriptTarget;
    WindowFactory m_windowFactory;
};

// ============================================================
// AdBlockInterceptor: 요청마다 RequestFilter 판정 적용
// ============================================================
class AdBlockInterceptor : public QWebEngineUrlRequestInterceptor {
    Q_OBJECT
public:
    explicit AdBlockInterceptor(const adblock::RequestFilter& filter, QObject* parent = nullptr);

    void interceptRequest(QWebEngineUrlRequestInfo& info) override;

    // 통계
    int blockedCount() const { return m_blockedCount; }
    void resetStats() { m_blockedCount = 0; }

signals:
    void requestBlocked(const QUrl& url);

private:
    const adblock::RequestFilter& m_filter;
    int m_blockedCount = 0;
};

// ============================================================
// BrowseyProfile: 브라우징 프로필 (일반 / 프라이빗)
// ============================================================
class BrowseyProfile : public QObject {
    Q_OBJECT
public:
    BrowseyProfile(bool offTheRecord, const adblock::FilterState& filterState,
                   QObject* parent = nullptr);
    ~BrowseyProfile() override;

    QWebEngineProfile* profile() const { return m_profile; }
    bool isOffTheRecord() const;

    // 광고 차단
    adblock::RequestFilter& filter() { return m_filter; }
    const adblock::RequestFilter& filter() const { return m_filter; }
    AdBlockInterceptor* adBlocker() const { return m_adBlocker; }

    /// 인터셉터를 프로필에 설치
    EngineResult installRequestFilter();

    // User-Agent: 빈 문자열이면 엔진 기본값으로 되돌림
    EngineResult setUserAgent(const QString& userAgent);
    QString userAgent() const;
    QString defaultUserAgent() const { return m_defaultUserAgent; }

private:
    QWebEngineProfile* m_profile = nullptr;
    adblock::RequestFilter m_filter;
    AdBlockInterceptor* m_adBlocker = nullptr;
    QString m_defaultUserAgent;
};

} // namespace engine
} // namespace browsey
