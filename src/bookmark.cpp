#include "bookmark.hpp"

namespace bookmarksync {

namespace {

const string FileScheme = "file://";

bool isAsciiAlpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

// Characters left as-is in canonical locations. Commas are escaped so that
// locations can appear in comma-separated lists.
bool isPathSafeChar(char c) {
    if(isAsciiAlpha(c) || isAsciiDigit(c)) {
        return true;
    }
    static const string extra = "-._~/!$&'()*+;=:@";
    return extra.find(c) != string::npos;
}

char hexDigit(unsigned int val) {
    val &= 15u;
    if(val < 10) {
        return (char)('0' + val);
    } else {
        return (char)('A' + (val - 10));
    }
}

int hexValue(char c) {
    if(c >= '0' && c <= '9') {
        return c - '0';
    }
    if(c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if(c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

bool startsWithNoCase(const string& str, const string& prefix) {
    if(str.size() < prefix.size()) {
        return false;
    }
    for(size_t i = 0; i < prefix.size(); ++i) {
        if(tolower((unsigned char)str[i]) != tolower((unsigned char)prefix[i])) {
            return false;
        }
    }
    return true;
}

// True if str starts with a URI scheme followed by a colon, such as "sftp:" or
// "trash:".
bool hasURIScheme(const string& str) {
    if(str.empty() || !isAsciiAlpha(str[0])) {
        return false;
    }
    size_t i = 1;
    while(
        i < str.size() &&
        (isAsciiAlpha(str[i]) || isAsciiDigit(str[i]) || str[i] == '+' || str[i] == '-' || str[i] == '.')
    ) {
        ++i;
    }
    return i < str.size() && str[i] == ':';
}

string normalizeAbsolutePath(const string& path) {
    REQUIRE(!path.empty() && path[0] == '/');

    vector<string> segments;
    for(string& segment : splitStr(path, '/')) {
        if(segment.empty() || segment == ".") {
            continue;
        }
        if(segment == "..") {
            if(!segments.empty()) {
                segments.pop_back();
            }
            continue;
        }
        segments.push_back(move(segment));
    }

    if(segments.empty()) {
        return "/";
    }
    string ret;
    for(const string& segment : segments) {
        ret.push_back('/');
        ret.append(segment);
    }
    return ret;
}

// Returns the path part of given location: everything after the authority for
// file:// URIs, the location itself otherwise.
string locationPath(const string& location) {
    if(!startsWithNoCase(location, FileScheme)) {
        return location;
    }
    size_t slash = location.find('/', FileScheme.size());
    if(slash == string::npos) {
        return "";
    }
    return location.substr(slash);
}

}

bool operator==(const Bookmark& a, const Bookmark& b) {
    return a.location == b.location && a.label == b.label;
}

bool operator!=(const Bookmark& a, const Bookmark& b) {
    return !(a == b);
}

ostream& operator<<(ostream& out, const Bookmark& bookmark) {
    return out << "{" << bookmark.location << ", \"" << bookmark.label << "\"}";
}

bool BookmarkList::add(Bookmark bookmark) {
    REQUIRE(!bookmark.location.empty());

    bool replaced = false;
    if(locations_.count(bookmark.location)) {
        items_.erase(
            remove_if(
                items_.begin(),
                items_.end(),
                [&](const Bookmark& item) {
                    return item.location == bookmark.location;
                }
            ),
            items_.end()
        );
        replaced = true;
    } else {
        locations_.insert(bookmark.location);
    }
    items_.push_back(move(bookmark));
    return replaced;
}

bool BookmarkList::contains(const string& location) const {
    return locations_.count(location) != 0;
}

const vector<Bookmark>& BookmarkList::items() const {
    return items_;
}

size_t BookmarkList::size() const {
    return items_.size();
}

bool BookmarkList::empty() const {
    return items_.empty();
}

vector<Bookmark>::const_iterator BookmarkList::begin() const {
    return items_.begin();
}

vector<Bookmark>::const_iterator BookmarkList::end() const {
    return items_.end();
}

bool operator==(const BookmarkList& a, const BookmarkList& b) {
    return a.items() == b.items();
}

bool operator!=(const BookmarkList& a, const BookmarkList& b) {
    return !(a == b);
}

ostream& operator<<(ostream& out, const BookmarkList& list) {
    out << "[";
    bool first = true;
    for(const Bookmark& bookmark : list) {
        if(!first) {
            out << ", ";
        }
        first = false;
        out << bookmark;
    }
    return out << "]";
}

optional<string> canonicalizeLocation(const string& raw, const string& baseDir) {
    optional<string> empty;

    string str = trimStr(raw);
    if(str.empty()) {
        return empty;
    }
    for(char& c : str) {
        if(c == '\\') {
            c = '/';
        }
    }

    string path;
    if(startsWithNoCase(str, FileScheme)) {
        size_t slash = str.find('/', FileScheme.size());
        if(slash == string::npos) {
            return empty;
        }
        string host = str.substr(FileScheme.size(), slash - FileScheme.size());
        for(char& c : host) {
            c = (char)tolower((unsigned char)c);
        }
        if(!host.empty() && host != "localhost") {
            return empty;
        }

        optional<string> decoded = percentDecode(str.substr(slash));
        if(!decoded) {
            return empty;
        }
        path = move(*decoded);
    } else if(hasURIScheme(str)) {
        return empty;
    } else {
        path = move(str);
        if(path[0] == '~') {
            if(path.size() > 1 && path[1] != '/') {
                return empty;
            }
            if(baseDir.empty() || baseDir[0] != '/') {
                return empty;
            }
            path = baseDir + path.substr(1);
        }
    }

    if(path.empty() || path[0] != '/' || path.find('\0') != string::npos) {
        return empty;
    }

    return FileScheme + percentEncodePath(normalizeAbsolutePath(path));
}

string deriveLabel(const string& location) {
    string path = locationPath(location);
    while(path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }

    size_t slash = path.rfind('/');
    string segment = slash == string::npos ? path : path.substr(slash + 1);
    if(segment.empty()) {
        return location;
    }

    optional<string> decoded = percentDecode(segment);
    string label = sanitizeLabel(decoded ? *decoded : segment);
    if(label.empty()) {
        return location;
    }
    return label;
}

string sanitizeLabel(const string& label) {
    string ret = sanitizeUTF8String(label);
    for(char& c : ret) {
        unsigned char uc = (unsigned char)c;
        if(uc < 0x20 || uc == 0x7F) {
            c = ' ';
        }
    }
    return trimStr(ret);
}

string effectiveLabel(const Bookmark& bookmark) {
    string label = sanitizeLabel(bookmark.label);
    if(label.empty()) {
        return deriveLabel(bookmark.location);
    }
    return label;
}

string percentEncodePath(const string& path) {
    string ret;
    for(char c : path) {
        if(isPathSafeChar(c)) {
            ret.push_back(c);
        } else {
            unsigned int val = (unsigned char)c;
            ret.push_back('%');
            ret.push_back(hexDigit(val >> 4));
            ret.push_back(hexDigit(val));
        }
    }
    return ret;
}

optional<string> percentDecode(const string& str) {
    string ret;
    for(size_t i = 0; i < str.size(); ++i) {
        if(str[i] != '%') {
            ret.push_back(str[i]);
            continue;
        }
        if(i + 2 >= str.size()) {
            optional<string> empty;
            return empty;
        }
        int high = hexValue(str[i + 1]);
        int low = hexValue(str[i + 2]);
        if(high < 0 || low < 0) {
            optional<string> empty;
            return empty;
        }
        ret.push_back((char)(high * 16 + low));
        i += 2;
    }
    return ret;
}

}
