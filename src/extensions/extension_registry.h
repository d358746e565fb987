#pragma once

/**
 * @file extension_registry.h
 * @brief 확장 레지스트리
 *
 * 확장 루트 디렉토리의 하위 디렉토리(번들)를 한 번 스캔하여
 * 이름 → 확장 카탈로그를 만듭니다. 핫 리로드/파일 감시는 하지 않습니다.
 *
 * 번들 구성 (모두 선택):
 *   manifest.json   { "name", "description", "version" }
 *   content.js      페이지에 실행할 스크립트
 *   styles.css      페이지에 추가할 스타일시트
 */

#include "extension.h"

#include <QObject>
#include <QString>
#include <QStringList>

#include <optional>

namespace browsey::extensions {

// ============================================================
// ExtensionRegistry: 번들 스캔 및 카탈로그 보관
// ============================================================
class ExtensionRegistry : public QObject {
    Q_OBJECT

public:
    static constexpr const char* kManifestFile = "manifest.json";
    static constexpr const char* kContentScriptFile = "content.js";
    static constexpr const char* kStyleSheetFile = "styles.css";

    explicit ExtensionRegistry(QObject* parent = nullptr);
    ~ExtensionRegistry() override;

    /**
     * @brief 루트 디렉토리 스캔
     *
     * 하위 디렉토리를 숨김 디렉토리까지 포함해 이름순으로 방문하고, 같은 이름으로 해석되는 번들은
     * 나중에 방문한 쪽이 이깁니다. 루트가 없으면 생성하고 빈 카탈로그를 반환합니다.
     * 기존 카탈로그는 스캔 결과로 교체됩니다.
     */
    const ExtensionCatalog& scan(const QString& rootDirectory);

    /**
     * @brief 번들 디렉토리 하나 로드
     * manifest 파싱 실패, 파일 읽기 실패는 extensionError로 알리고
     * 해당 항목만 없는 것으로 처리합니다.
     * @return 스크립트/스타일이 하나라도 있으면 확장, 없으면 nullopt
     */
    std::optional<Extension> loadBundle(const QString& bundleDir);

    /**
     * @brief 내장 번들 생성 (Dark Mode)
     *
     * 파일이 없을 때만 작성하며 기존 파일은 덮어쓰지 않습니다.
     * @return 쓰기 실패가 없으면 true
     */
    static bool ensureBundledExtensions(const QString& rootDirectory);

    // 조회
    const ExtensionCatalog& catalog() const { return m_catalog; }
    QStringList names() const { return m_catalog.keys(); }
    const Extension* find(const QString& name) const;
    int count() const { return static_cast<int>(m_catalog.size()); }
    int discoveredCount() const { return m_discovered; }
    QString rootDirectory() const { return m_rootDirectory; }

signals:
    void extensionLoaded(const browsey::extensions::Extension& ext);
    void extensionError(const QString& name, const QString& error);
    void scanFinished(int count);

private:
    std::optional<QString> readText(const QString& bundleName, const QString& path);
    ExtensionManifest readManifest(const QString& bundleName, const QString& path);

    ExtensionCatalog m_catalog;
    QString m_rootDirectory;
    int m_discovered = 0;
};

} // namespace browsey::extensions
