#include "persistence_store.h"

#include <QDebug>
#include <QVariant>

namespace browsey::data {

PersistenceStore::PersistenceStore(const QString& organization, const QString& application)
    : m_settings(std::make_unique<QSettings>(organization, application))
{
    qDebug() << "[PersistenceStore] 설정 위치:" << m_settings->fileName();
}

PersistenceStore::PersistenceStore(const QString& iniFilePath)
    : m_settings(std::make_unique<QSettings>(iniFilePath, QSettings::IniFormat))
{
    qDebug() << "[PersistenceStore] 설정 파일:" << iniFilePath;
}

PersistenceStore::~PersistenceStore() = default;

// ============================================================
// 광고 차단
// ============================================================

bool PersistenceStore::adblockEnabled() const
{
    return readBool(kAdblockEnabledKey, true);
}

void PersistenceStore::setAdblockEnabled(bool enabled)
{
    m_settings->setValue(kAdblockEnabledKey, enabled);
}

QStringList PersistenceStore::adblockPatterns() const
{
    return readStringList(kAdblockPatternsKey);
}

void PersistenceStore::setAdblockPatterns(const QStringList& patterns)
{
    m_settings->setValue(kAdblockPatternsKey, patterns);
}

adblock::FilterState PersistenceStore::loadFilterState() const
{
    adblock::FilterState state;
    state.enabled = adblockEnabled();
    for (const auto& p : adblockPatterns()) {
        state.patterns.push_back(p.toStdString());
    }
    return state;
}

void PersistenceStore::saveFilterState(const adblock::FilterState& state)
{
    QStringList patterns;
    patterns.reserve(static_cast<qsizetype>(state.patterns.size()));
    for (const auto& p : state.patterns) {
        patterns.append(QString::fromStdString(p));
    }
    setAdblockEnabled(state.enabled);
    setAdblockPatterns(patterns);
}

// ============================================================
// User-Agent
// ============================================================

QString PersistenceStore::userAgent() const
{
    return readString(kUserAgentKey);
}

void PersistenceStore::setUserAgent(const QString& userAgent)
{
    m_settings->setValue(kUserAgentKey, userAgent);
}

// ============================================================
// 북마크 / 세션
// ============================================================

BookmarkList PersistenceStore::bookmarks() const
{
    return decodeBookmarks(readStringList(kBookmarksKey));
}

void PersistenceStore::setBookmarks(const BookmarkList& bookmarks)
{
    m_settings->setValue(kBookmarksKey, encodeBookmarks(bookmarks));
}

void PersistenceStore::addBookmark(const Bookmark& bookmark)
{
    BookmarkList current = bookmarks();
    current.append(bookmark);
    setBookmarks(current);
}

bool PersistenceStore::removeBookmark(const Bookmark& bookmark)
{
    BookmarkList current = bookmarks();
    if (!current.removeOne(bookmark)) {
        qWarning() << "[PersistenceStore] 삭제할 북마크 없음:" << bookmark.url;
        return false;
    }
    setBookmarks(current);
    return true;
}

QStringList PersistenceStore::sessionUrls() const
{
    return readStringList(kSessionUrlsKey);
}

void PersistenceStore::setSessionUrls(const QStringList& urls)
{
    m_settings->setValue(kSessionUrlsKey, urls);
}

bool PersistenceStore::sync()
{
    m_settings->sync();
    if (m_settings->status() != QSettings::NoError) {
        qWarning() << "[PersistenceStore] 저장 실패:" << m_settings->fileName()
                   << "(상태" << static_cast<int>(m_settings->status()) << ")";
        return false;
    }
    return true;
}

QString PersistenceStore::location() const
{
    return m_settings->fileName();
}

// ============================================================
// 방어적 읽기
// ============================================================

bool PersistenceStore::readBool(const char* key, bool defaultValue) const
{
    const QVariant value = m_settings->value(key);
    if (!value.isValid()) return defaultValue;

    switch (value.typeId()) {
    case QMetaType::Bool:
        return value.toBool();
    case QMetaType::Int:
    case QMetaType::LongLong:
    case QMetaType::UInt:
    case QMetaType::ULongLong:
        return value.toLongLong() != 0;
    case QMetaType::QString: {
        // INI 백엔드는 bool을 "true"/"false" 문자열로 돌려줌
        const QString text = value.toString().trimmed().toLower();
        if (text == "true" || text == "1") return true;
        if (text == "false" || text == "0") return false;
        break;
    }
    default:
        break;
    }

    qWarning() << "[PersistenceStore]" << key << "값 손상, 기본값 사용:" << value;
    return defaultValue;
}

QString PersistenceStore::readString(const char* key) const
{
    const QVariant value = m_settings->value(key);
    if (!value.isValid()) return {};
    if (value.typeId() == QMetaType::QString) return value.toString();

    qWarning() << "[PersistenceStore]" << key << "문자열이 아님, 기본값 사용:" << value;
    return {};
}

QStringList PersistenceStore::readStringList(const char* key) const
{
    const QVariant value = m_settings->value(key);
    if (!value.isValid()) return {};

    switch (value.typeId()) {
    case QMetaType::QStringList:
        return value.toStringList();
    case QMetaType::QString: {
        // 항목이 하나뿐인 목록은 INI에서 단일 문자열로 읽힘
        const QString single = value.toString();
        return single.isEmpty() ? QStringList{} : QStringList{single};
    }
    case QMetaType::QVariantList: {
        QStringList result;
        for (const auto& item : value.toList()) {
            if (item.typeId() != QMetaType::QString) {
                qWarning() << "[PersistenceStore]" << key << "목록에 문자열이 아닌 항목, 기본값 사용";
                return {};
            }
            result.append(item.toString());
        }
        return result;
    }
    default:
        break;
    }

    qWarning() << "[PersistenceStore]" << key << "목록이 아님, 기본값 사용:" << value;
    return {};
}

} // namespace browsey::data
