#include "injection_driver.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>

namespace browsey::extensions {

int InjectionDriver::onPageLoadFinished(ScriptTarget* page, const ExtensionCatalog& catalog) const
{
    if (!page) return 0;

    int pushed = 0;
    for (const auto& ext : catalog) {
        // 빈 파일은 보낼 것이 없음
        if (ext.styleSheet && !ext.styleSheet->isEmpty()) {
            page->runScript(styleInjectionScript(*ext.styleSheet));
            ++pushed;
        }
        if (ext.contentScript && !ext.contentScript->isEmpty()) {
            page->runScript(*ext.contentScript);
            ++pushed;
        }
    }

    if (pushed > 0) {
        qDebug() << "[InjectionDriver] 스크립트" << pushed << "개 주입 (확장" << catalog.size() << "개)";
    }
    return pushed;
}

QString InjectionDriver::styleInjectionScript(const QString& css)
{
    return QStringLiteral(
        "(function(){"
        "var style=document.createElement('style');"
        "style.textContent=%1;"
        "document.head.appendChild(style);"
        "})();").arg(toJsStringLiteral(css));
}

QString InjectionDriver::toJsStringLiteral(const QString& text)
{
    // ["..."] 로 직렬화한 뒤 대괄호를 벗겨 JSON 문자열 리터럴만 취함
    const QByteArray json = QJsonDocument(QJsonArray{text}).toJson(QJsonDocument::Compact);
    QString literal = QString::fromUtf8(json.mid(1, json.size() - 2));

    // JSON에서는 허용되지만 구형 JS 파서에서는 줄 끝으로 취급되는 문자
    literal.replace(QChar(0x2028), QStringLiteral("\\u2028"));
    literal.replace(QChar(0x2029), QStringLiteral("\\u2029"));
    return literal;
}

} // namespace browsey::extensions
