#include "codec.hpp"

#include "gtk_codec.hpp"
#include "kde_codec.hpp"
#include "qt_codec.hpp"

namespace bookmarksync {

const vector<BookmarkFormat>& allFormats() {
    static const vector<BookmarkFormat> formats = {
        BookmarkFormat::Gtk,
        BookmarkFormat::Kde,
        BookmarkFormat::Qt
    };
    return formats;
}

const char* formatName(BookmarkFormat format) {
    if(format == BookmarkFormat::Gtk) {
        return "gtk";
    } else if(format == BookmarkFormat::Kde) {
        return "kde";
    } else {
        REQUIRE(format == BookmarkFormat::Qt);
        return "qt";
    }
}

optional<BookmarkFormat> parseFormatName(string name) {
    for(char& c : name) {
        c = (char)tolower((unsigned char)c);
    }
    for(BookmarkFormat format : allFormats()) {
        if(name == formatName(format)) {
            return format;
        }
    }
    optional<BookmarkFormat> empty;
    return empty;
}

const char* syncErrorName(SyncError error) {
    switch(error) {
    case SyncError::SourceMissing: return "SourceMissing";
    case SyncError::MalformedDocument: return "MalformedDocument";
    case SyncError::MalformedLocation: return "MalformedLocation";
    case SyncError::FilesystemError: return "FilesystemError";
    }
    PANIC("Invalid SyncError value ", (int)error);
    return "";
}

ostream& operator<<(ostream& out, const Diagnostic& diagnostic) {
    return out << "entry " << diagnostic.position << ": " << diagnostic.message;
}

void DecodeResult::addBookmark(size_t position, Bookmark bookmark) {
    REQUIRE(bookmarks);

    string location = bookmark.location;
    if(bookmarks->add(move(bookmark))) {
        warnings.push_back({
            position,
            DiagnosticKind::DuplicateLocation,
            "Location '" + location + "' appears more than once, keeping the last occurrence"
        });
    }
}

void DecodeResult::addMalformedLocation(size_t position, const string& location) {
    warnings.push_back({
        position,
        DiagnosticKind::MalformedLocation,
        "Skipping entry with malformed location '" + location + "'"
    });
}

DecodeResult DecodeResult::malformedDocument(string error) {
    DecodeResult result;
    result.error = move(error);
    return result;
}

string BookmarkCodec::encode(const BookmarkList& list) {
    string errorMsg;
    optional<string> text = encode(list, optional<string>(), errorMsg);
    REQUIRE(text);
    return *text;
}

shared_ptr<BookmarkCodec> createCodec(BookmarkFormat format, string baseDir) {
    if(format == BookmarkFormat::Gtk) {
        return GtkCodec::create(move(baseDir));
    } else if(format == BookmarkFormat::Kde) {
        return KdeCodec::create(move(baseDir));
    } else {
        REQUIRE(format == BookmarkFormat::Qt);
        return QtCodec::create(move(baseDir));
    }
}

}
