#pragma once

/**
 * @file extension.h
 * @brief 확장 번들 정보
 *
 * 확장 디렉토리 하나(manifest.json / content.js / styles.css)에서 읽어들인
 * 내용을 담습니다. 세 파일 모두 선택 사항입니다.
 */

#include <QJsonObject>
#include <QMap>
#include <QMetaType>
#include <QString>

#include <optional>

namespace browsey::extensions {

// ============================================================
// ExtensionManifest: manifest.json 의 문자열 필드
// ============================================================
struct ExtensionManifest {
    std::optional<QString> name;
    std::optional<QString> description;
    std::optional<QString> version;

    /**
     * @brief JSON 객체에서 필드 추출
     *
     * 문자열이 아닌 값은 없는 것으로 취급합니다.
     */
    static ExtensionManifest fromJson(const QJsonObject& obj);
};

// ============================================================
// Extension: 로드된 번들
// ============================================================
struct Extension {
    QString name;                        // 카탈로그 키 (manifest name 또는 디렉토리 이름)
    QString path;                        // 번들 디렉토리 경로
    ExtensionManifest manifest;
    std::optional<QString> styleSheet;   // styles.css 원문
    std::optional<QString> contentScript; // content.js 원문

    // 스크립트도 스타일도 없으면 카탈로그에 넣지 않음
    bool hasPayload() const { return styleSheet.has_value() || contentScript.has_value(); }

    // 관리 화면용 한 줄 요약 ("Dark Mode 1.0: Forces dark mode")
    QString summary() const;
};

// 이름 → 확장. QMap이라 순회 순서가 이름 순으로 고정됨
using ExtensionCatalog = QMap<QString, Extension>;

} // namespace browsey::extensions

Q_DECLARE_METATYPE(browsey::extensions::Extension)
