#pragma once

#include "common.hpp"

namespace bookmarksync {

struct Bookmark {
    // Canonical location, see canonicalizeLocation.
    string location;
    string label;
};

bool operator==(const Bookmark& a, const Bookmark& b);
bool operator!=(const Bookmark& a, const Bookmark& b);
ostream& operator<<(ostream& out, const Bookmark& bookmark);

// Ordered list of bookmarks that are unique by location. Adding a bookmark
// with a location already present drops the earlier entry, so that the last
// occurrence wins and takes the position where it was added.
class BookmarkList {
public:
    // Returns true if an earlier bookmark with the same location was dropped.
    bool add(Bookmark bookmark);

    bool contains(const string& location) const;

    const vector<Bookmark>& items() const;
    size_t size() const;
    bool empty() const;

    vector<Bookmark>::const_iterator begin() const;
    vector<Bookmark>::const_iterator end() const;

private:
    vector<Bookmark> items_;
    set<string> locations_;
};

bool operator==(const BookmarkList& a, const BookmarkList& b);
bool operator!=(const BookmarkList& a, const BookmarkList& b);
ostream& operator<<(ostream& out, const BookmarkList& list);

// Normalizes a bookmark location given as a file:// URI, an absolute path or a
// path starting with ~ (expanded to baseDir) into the canonical form
// "file://" + percent-encoded absolute path without "." or ".." segments,
// repeated slashes or a trailing slash. Returns empty if the location cannot
// be turned into a local absolute path (other URI schemes, relative paths,
// broken percent escapes).
optional<string> canonicalizeLocation(const string& raw, const string& baseDir);

// Returns the percent-decoded last path segment of given location, or the
// location itself if it has no path segment.
string deriveLabel(const string& location);

// Drops invalid UTF-8, turns control characters into spaces and trims.
string sanitizeLabel(const string& label);

// Returns the sanitized label, or deriveLabel(location) if it is empty.
string effectiveLabel(const Bookmark& bookmark);

string percentEncodePath(const string& path);

// Returns empty if str contains a truncated or non-hex percent escape.
optional<string> percentDecode(const string& str);

}
