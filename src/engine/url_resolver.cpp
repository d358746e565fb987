#include "url_resolver.h"

namespace browsey {
namespace engine {

QUrl resolveInput(const QString& input)
{
    const QString text = input.trimmed();
    if (text.isEmpty()) {
        return QUrl(kHomeUrl);
    }

    const bool hasSpace = text.contains(' ');
    const bool hasDot = text.contains('.');
    const bool hasScheme = text.contains("://");

    // 도메인처럼 보이면 https 붙이기
    if (!hasSpace && hasDot && !hasScheme) {
        return QUrl("https://" + text);
    }

    // 검색어로 처리 (DuckDuckGo)
    if (!hasScheme && (hasSpace || !hasDot)) {
        return QUrl(QString(kSearchUrl) + QString::fromUtf8(QUrl::toPercentEncoding(text)));
    }

    return QUrl(text);
}

SecurityIndicator securityIndicatorFor(const QUrl& url)
{
    const QString scheme = url.scheme().toLower();
    if (scheme == "https" || scheme == "chrome") {
        return {QString::fromUtf8("🔒"), "보안 연결 (HTTPS)"};
    }
    if (scheme == "http") {
        return {QString::fromUtf8("⚠️"), "안전하지 않은 연결 (HTTP)"};
    }
    return {" ", QString()};
}

} // namespace engine
} // namespace browsey
