#include "bookmark.h"

namespace browsey::data {

namespace {
constexpr QChar kSeparator = u'|';
}

Bookmark Bookmark::create(const QString& title, const QString& url)
{
    return Bookmark{title.isEmpty() ? url : title, url};
}

QString encodeBookmark(const Bookmark& bookmark)
{
    // 제목이 비어있으면 URL로 채워서 저장
    const QString title = bookmark.title.isEmpty() ? bookmark.url : bookmark.title;
    return title + kSeparator + bookmark.url;
}

Bookmark decodeBookmark(const QString& entry)
{
    const auto sep = entry.indexOf(kSeparator);
    if (sep < 0) {
        // 구버전: URL만 저장됨
        return Bookmark{entry, entry};
    }
    return Bookmark{entry.left(sep), entry.mid(sep + 1)};
}

QStringList encodeBookmarks(const BookmarkList& bookmarks)
{
    QStringList entries;
    entries.reserve(bookmarks.size());
    for (const auto& bm : bookmarks) {
        entries.append(encodeBookmark(bm));
    }
    return entries;
}

BookmarkList decodeBookmarks(const QStringList& entries)
{
    BookmarkList bookmarks;
    bookmarks.reserve(entries.size());
    for (const auto& entry : entries) {
        bookmarks.append(decodeBookmark(entry));
    }
    return bookmarks;
}

} // namespace browsey::data
