#pragma once

/**
 * @file url_resolver.h
 * @brief 주소창 입력 해석과 보안 표시
 */

#include <QString>
#include <QUrl>

namespace browsey {
namespace engine {

inline constexpr const char* kHomeUrl = "https://duckduckgo.com/";
inline constexpr const char* kSearchUrl = "https://duckduckgo.com/?q=";

/**
 * @brief 주소창 입력 → URL
 *
 *   ""                 → 홈
 *   "example.com"      → https://example.com  (공백 없음, '.' 있음, "://" 없음)
 *   "hello world"      → DuckDuckGo 검색     ("://" 없고 공백이 있거나 '.' 없음)
 *   그 외               → 입력 그대로 URL
 */
QUrl resolveInput(const QString& input);

// 주소창 옆 자물쇠 아이콘
struct SecurityIndicator {
    QString icon;
    QString toolTip;
};

/// https/chrome → 🔒, http → ⚠️, 그 외 빈 표시
SecurityIndicator securityIndicatorFor(const QUrl& url);

} // namespace engine
} // namespace browsey
