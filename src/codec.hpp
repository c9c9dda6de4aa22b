#pragma once

#include "bookmark.hpp"

namespace bookmarksync {

// The bookmark stores that can be synchronized.
enum class BookmarkFormat {
    // Plain-text list of the GTK file chooser
    Gtk,
    // XBEL places file of KDE
    Kde,
    // INI-style configuration of the Qt file dialog
    Qt
};

const vector<BookmarkFormat>& allFormats();

const char* formatName(BookmarkFormat format);

// Case-insensitive inverse of formatName.
optional<BookmarkFormat> parseFormatName(string name);

enum class SyncError {
    SourceMissing,
    MalformedDocument,
    MalformedLocation,
    FilesystemError
};

const char* syncErrorName(SyncError error);

enum class DiagnosticKind {
    // Entry skipped because its location could not be canonicalized
    MalformedLocation,
    // Earlier entry dropped because a later entry has the same location
    DuplicateLocation
};

struct Diagnostic {
    // Line number, element index or entry index (starting from 1) of the
    // affected entry, depending on the format
    size_t position;
    DiagnosticKind kind;
    string message;
};

ostream& operator<<(ostream& out, const Diagnostic& diagnostic);

// Result of decoding a document. If the document as a whole could not be
// parsed, bookmarks is empty and error describes the problem
// (SyncError::MalformedDocument). Otherwise bookmarks holds the entries that
// could be decoded and warnings lists the entries that were skipped or
// dropped.
struct DecodeResult {
    optional<BookmarkList> bookmarks;
    string error;
    vector<Diagnostic> warnings;

    // Adds bookmark to the list, recording a warning if an earlier duplicate
    // was dropped.
    void addBookmark(size_t position, Bookmark bookmark);

    void addMalformedLocation(size_t position, const string& location);

    static DecodeResult malformedDocument(string error);
};

// Translates between the text of a bookmark file and a BookmarkList. Codecs
// do not access the filesystem.
class BookmarkCodec {
public:
    virtual ~BookmarkCodec() {}

    virtual BookmarkFormat format() const = 0;

    virtual DecodeResult decode(const string& text) = 0;

    // If previous is given, it is the current content of the target file, and
    // formats that store other data besides the bookmarks in the same file
    // keep that data in the result. Returns empty and sets errorMsg if that
    // data cannot be kept because previous cannot be parsed.
    virtual optional<string> encode(
        const BookmarkList& list,
        const optional<string>& previous,
        string& errorMsg
    ) = 0;

    // Encodes list into a new file.
    string encode(const BookmarkList& list);
};

// baseDir is used to expand locations starting with ~.
shared_ptr<BookmarkCodec> createCodec(BookmarkFormat format, string baseDir);

}
