#pragma once

/**
 * @file persistence_store.h
 * @brief 설정 저장소 (QSettings 래퍼)
 *
 * 북마크, 세션 탭 목록, User-Agent, 광고 차단 상태를 타입이 있는 접근자로
 * 읽고 씁니다. 키가 없거나 값이 손상되었으면 기본값을 돌려주며
 * 예외나 오류를 밖으로 내보내지 않습니다.
 *
 * 키:
 *   adblock/enabled    bool        (기본 true)
 *   adblock/patterns   QStringList (기본 빈 목록 → 필터 기본 패턴)
 *   browser/user_agent QString     (기본 빈 문자열 → 엔진 기본값)
 *   bookmarks/list     QStringList ("<title>|<url>")
 *   session/urls       QStringList (일반 창만)
 */

#include "adblock/request_filter.h"
#include "data/bookmark.h"

#include <QSettings>
#include <QString>
#include <QStringList>

#include <memory>

namespace browsey::data {

class PersistenceStore {
public:
    static constexpr const char* kAdblockEnabledKey = "adblock/enabled";
    static constexpr const char* kAdblockPatternsKey = "adblock/patterns";
    static constexpr const char* kUserAgentKey = "browser/user_agent";
    static constexpr const char* kBookmarksKey = "bookmarks/list";
    static constexpr const char* kSessionUrlsKey = "session/urls";

    /// 조직/앱 이름 범위의 기본 백엔드
    PersistenceStore(const QString& organization, const QString& application);

    /// INI 파일 백엔드 (포터블 모드, 테스트)
    explicit PersistenceStore(const QString& iniFilePath);

    ~PersistenceStore();

    PersistenceStore(const PersistenceStore&) = delete;
    PersistenceStore& operator=(const PersistenceStore&) = delete;

    // ============================
    // 광고 차단
    // ============================

    [[nodiscard]] bool adblockEnabled() const;
    void setAdblockEnabled(bool enabled);

    [[nodiscard]] QStringList adblockPatterns() const;
    void setAdblockPatterns(const QStringList& patterns);

    /// enabled + patterns 를 한 번에
    [[nodiscard]] adblock::FilterState loadFilterState() const;
    void saveFilterState(const adblock::FilterState& state);

    // ============================
    // User-Agent
    // ============================

    [[nodiscard]] QString userAgent() const;
    void setUserAgent(const QString& userAgent);

    // ============================
    // 북마크 / 세션
    // ============================

    [[nodiscard]] BookmarkList bookmarks() const;
    void setBookmarks(const BookmarkList& bookmarks);

    /**
     * @brief 저장된 목록에 북마크 하나 추가/삭제
     *
     * 창마다 들고 있는 사본이 아니라 저장소의 현재 목록을 읽어서 고칩니다.
     * 삭제는 제목과 URL이 같은 첫 항목만 지우며, 없으면 false.
     */
    void addBookmark(const Bookmark& bookmark);
    [[nodiscard]] bool removeBookmark(const Bookmark& bookmark);

    [[nodiscard]] QStringList sessionUrls() const;
    void setSessionUrls(const QStringList& urls);

    /**
     * @brief 백엔드에 기록
     * @return 백엔드 상태가 정상이면 true
     */
    bool sync();

    /// 저장 위치 (INI 경로 또는 플랫폼 기본 위치)
    [[nodiscard]] QString location() const;

private:
    bool readBool(const char* key, bool defaultValue) const;
    QString readString(const char* key) const;
    QStringList readStringList(const char* key) const;

    std::unique_ptr<QSettings> m_settings;
};

} // namespace browsey::data
