#include "extension_registry.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>

namespace browsey::extensions {

namespace {

// 내장 Dark Mode 번들
const char* DARKMODE_MANIFEST =
    "{\n"
    "  \"name\": \"Dark Mode\",\n"
    "  \"description\": \"Forces dark mode on all sites\",\n"
    "  \"version\": \"1.0\"\n"
    "}\n";

const char* DARKMODE_STYLES =
    "html, body {\n"
    "    background: #111 !important;\n"
    "    color: #eee !important;\n"
    "}\n"
    "img, video {\n"
    "    filter: brightness(0.8) contrast(1.2);\n"
    "}\n"
    "a {\n"
    "    color: #4aa3ff !important;\n"
    "}\n";

bool writeIfMissing(const QString& path, const char* content)
{
    if (QFileInfo::exists(path)) return true;

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qWarning() << "[ExtensionRegistry] 파일 생성 실패:" << path << file.errorString();
        return false;
    }
    const QByteArray data(content);
    if (file.write(data) != data.size()) {
        qWarning() << "[ExtensionRegistry] 파일 쓰기 실패:" << path << file.errorString();
        return false;
    }
    return true;
}

} // namespace

// ============================================================
// ExtensionRegistry
// ============================================================

ExtensionRegistry::ExtensionRegistry(QObject* parent)
    : QObject(parent)
{
}

ExtensionRegistry::~ExtensionRegistry() = default;

const ExtensionCatalog& ExtensionRegistry::scan(const QString& rootDirectory)
{
    m_rootDirectory = rootDirectory;
    m_catalog.clear();
    m_discovered = 0;

    QDir root(rootDirectory);
    if (!root.exists() && !QDir().mkpath(rootDirectory)) {
        qWarning() << "[ExtensionRegistry] 확장 디렉토리 생성 실패:" << rootDirectory;
    }

    // 디렉토리 나열 순서는 플랫폼마다 다르므로 이름순으로 고정, 숨김 번들도 포함
    const auto entries = root.entryList(QDir::Dirs | QDir::Hidden | QDir::NoDotAndDotDot, QDir::Name);
    for (const auto& entry : entries) {
        ++m_discovered;

        auto ext = loadBundle(root.filePath(entry));
        if (!ext) {
            qDebug() << "[ExtensionRegistry] 스크립트/스타일 없음, 건너뜀:" << entry;
            continue;
        }

        if (m_catalog.contains(ext->name)) {
            qWarning() << "[ExtensionRegistry] 이름 충돌:" << ext->name
                       << m_catalog.value(ext->name).path << "->" << ext->path;
        }
        m_catalog.insert(ext->name, *ext);

        qInfo() << "[ExtensionRegistry] 로드:" << ext->name
                << (ext->styleSheet ? "[css]" : "")
                << (ext->contentScript ? "[js]" : "");
        emit extensionLoaded(*ext);
    }

    qInfo() << "[ExtensionRegistry] 스캔 완료:" << rootDirectory
            << "번들" << m_discovered << "개 중" << m_catalog.size() << "개 활성";
    emit scanFinished(count());
    return m_catalog;
}

std::optional<Extension> ExtensionRegistry::loadBundle(const QString& bundleDir)
{
    QDir dir(bundleDir);
    const QString dirName = QFileInfo(bundleDir).fileName();

    Extension ext;
    ext.path = bundleDir;
    ext.name = dirName;

    const QString manifestPath = dir.filePath(kManifestFile);
    if (QFileInfo::exists(manifestPath)) {
        ext.manifest = readManifest(dirName, manifestPath);
        if (ext.manifest.name) {
            ext.name = *ext.manifest.name;
        }
    }

    const QString scriptPath = dir.filePath(kContentScriptFile);
    if (QFileInfo::exists(scriptPath)) {
        ext.contentScript = readText(dirName, scriptPath);
    }

    const QString stylePath = dir.filePath(kStyleSheetFile);
    if (QFileInfo::exists(stylePath)) {
        ext.styleSheet = readText(dirName, stylePath);
    }

    if (!ext.hasPayload()) return std::nullopt;
    return ext;
}

bool ExtensionRegistry::ensureBundledExtensions(const QString& rootDirectory)
{
    const QString darkmodeDir = QDir(rootDirectory).filePath("darkmode");
    if (!QDir().mkpath(darkmodeDir)) {
        qWarning() << "[ExtensionRegistry] 디렉토리 생성 실패:" << darkmodeDir;
        return false;
    }

    bool ok = writeIfMissing(QDir(darkmodeDir).filePath(kManifestFile), DARKMODE_MANIFEST);
    ok = writeIfMissing(QDir(darkmodeDir).filePath(kStyleSheetFile), DARKMODE_STYLES) && ok;
    return ok;
}

const Extension* ExtensionRegistry::find(const QString& name) const
{
    auto it = m_catalog.constFind(name);
    return it == m_catalog.constEnd() ? nullptr : &it.value();
}

std::optional<QString> ExtensionRegistry::readText(const QString& bundleName, const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        emit extensionError(bundleName, "읽기 실패: " + path + " (" + file.errorString() + ")");
        return std::nullopt;
    }

    QByteArray data = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        emit extensionError(bundleName, "읽기 실패: " + path + " (" + file.errorString() + ")");
        return std::nullopt;
    }
    return QString::fromUtf8(data);
}

ExtensionManifest ExtensionRegistry::readManifest(const QString& bundleName, const QString& path)
{
    auto text = readText(bundleName, path);
    if (!text) return {};

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(text->toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "[ExtensionRegistry]" << bundleName << "manifest.json 파싱 실패:"
                   << parseError.errorString() << "(오프셋" << parseError.offset << ")";
        emit extensionError(bundleName, "manifest.json 파싱 실패: " + parseError.errorString());
        return {};
    }
    if (!doc.isObject()) {
        qWarning() << "[ExtensionRegistry]" << bundleName << "manifest.json 최상위가 객체가 아님";
        emit extensionError(bundleName, "manifest.json 최상위가 객체가 아님");
        return {};
    }

    return ExtensionManifest::fromJson(doc.object());
}

} // namespace browsey::extensions
