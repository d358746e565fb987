#pragma once

/**
 * @file bookmark.h
 * @brief 북마크 항목과 저장 형식
 *
 * 저장 형식은 항목당 문자열 하나: "<title>|<url>"
 * 첫 번째 '|' 에서 나누며, '|' 가 없는 항목은 구버전 형식으로 보고
 * 전체를 제목과 URL 양쪽에 사용합니다.
 */

#include <QList>
#include <QString>
#include <QStringList>

namespace browsey::data {

struct Bookmark {
    QString title;
    QString url;

    /**
     * @brief 북마크 생성
     * @param title 비어있으면 url로 대체
     */
    static Bookmark create(const QString& title, const QString& url);

    bool operator==(const Bookmark&) const = default;
};

using BookmarkList = QList<Bookmark>;

/// "<title>|<url>"
QString encodeBookmark(const Bookmark& bookmark);

/// 첫 '|' 기준 분리, '|' 없으면 {entry, entry}
Bookmark decodeBookmark(const QString& entry);

QStringList encodeBookmarks(const BookmarkList& bookmarks);
BookmarkList decodeBookmarks(const QStringList& entries);

} // namespace browsey::data
