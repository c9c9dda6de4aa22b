#include "gtk_codec.hpp"

namespace bookmarksync {

GtkCodec::GtkCodec(CKey, string baseDir)
    : baseDir_(move(baseDir))
{}

BookmarkFormat GtkCodec::format() const {
    return BookmarkFormat::Gtk;
}

DecodeResult GtkCodec::decode(const string& text) {
    DecodeResult result;
    result.bookmarks = BookmarkList();

    vector<string> lines = splitStr(stripUTF8BOM(text), '\n');
    for(size_t lineIdx = 0; lineIdx < lines.size(); ++lineIdx) {
        size_t lineNum = lineIdx + 1;
        string line = trimStr(lines[lineIdx]);
        if(line.empty() || line[0] == '#') {
            continue;
        }

        size_t sep = 0;
        while(sep < line.size() && !isspace((unsigned char)line[sep])) {
            ++sep;
        }
        string rawLocation = line.substr(0, sep);
        string label = sanitizeLabel(line.substr(sep));

        optional<string> location = canonicalizeLocation(rawLocation, baseDir_);
        if(!location) {
            result.addMalformedLocation(lineNum, rawLocation);
            continue;
        }

        if(label.empty()) {
            label = deriveLabel(*location);
        }
        result.addBookmark(lineNum, {move(*location), move(label)});
    }

    return result;
}

optional<string> GtkCodec::encode(
    const BookmarkList& list,
    const optional<string>& previous,
    string& errorMsg
) {
    string text;
    for(const Bookmark& bookmark : list) {
        text.append(bookmark.location);
        string label = sanitizeLabel(bookmark.label);
        if(!label.empty()) {
            text.push_back(' ');
            text.append(label);
        }
        text.push_back('\n');
    }
    return text;
}

}
