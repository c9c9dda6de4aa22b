#pragma once

#include "codec.hpp"

namespace bookmarksync {

enum class TargetStatus {
    // The target file holds the new content
    Written,
    // The directory of the target could not be created because the file
    // system does not permit it (EACCES, EPERM or EROFS)
    Skipped,
    // Updating the target failed; the file keeps its previous content
    Failed
};

const char* targetStatusName(TargetStatus status);

struct TargetReport {
    BookmarkFormat format;
    string path;
    TargetStatus status;
    // For Written: the file already held the new content and was not touched.
    bool unchanged = false;
    optional<SyncError> error;
    string message;
};

struct SyncReport {
    BookmarkFormat source;
    string sourcePath;

    // Set if the run was aborted before any target was touched.
    optional<SyncError> error;
    string errorMessage;

    size_t bookmarkCount = 0;
    vector<Diagnostic> warnings;
    vector<TargetReport> targets;

    // True if there was no fatal error and every target was written.
    bool ok() const;
};

// Reads the bookmarks of the source format from its file under baseDir and
// writes them to the files of the other formats, in the order of
// allFormats(). Each target file is replaced atomically, but a failure of one
// target does not undo the others.
//
// No locking is done: if multiple runs operate on the same base directory
// concurrently, the last one to rename its temporary file over a target wins.
SyncReport syncBookmarks(BookmarkFormat source, const string& baseDir);

}
