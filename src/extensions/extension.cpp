#include "extension.h"

namespace browsey::extensions {

namespace {

std::optional<QString> stringField(const QJsonObject& obj, const QString& key)
{
    auto value = obj.value(key);
    if (!value.isString()) return std::nullopt;
    return value.toString();
}

} // namespace

ExtensionManifest ExtensionManifest::fromJson(const QJsonObject& obj)
{
    ExtensionManifest manifest;
    manifest.name = stringField(obj, "name");
    manifest.description = stringField(obj, "description");
    manifest.version = stringField(obj, "version");
    return manifest;
}

QString Extension::summary() const
{
    QString text = name;
    if (manifest.version && !manifest.version->isEmpty()) {
        text += " " + *manifest.version;
    }
    if (manifest.description && !manifest.description->isEmpty()) {
        text += ": " + *manifest.description;
    }
    return text;
}

} // namespace browsey::extensions
