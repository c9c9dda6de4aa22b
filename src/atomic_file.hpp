#pragma once

#include "common.hpp"

namespace bookmarksync {

// Creates given directory and its missing parent directories. Returns false
// and sets errorMsg if some component of the path exists but is not a
// directory (errorCode set to ENOTDIR) or creating a directory fails
// (errorCode set to the errno of mkdir).
bool ensureDirExists(const string& path, string& errorMsg, int& errorCode);
bool ensureDirExists(const string& path, string& errorMsg);

// Returns false if path does not exist (or one of its parents is not a
// directory). Other errors count as existing, so that reading the path
// reports them.
bool pathExists(const string& path);

// Returns empty and sets errorMsg if path is not a regular file or reading it
// fails.
optional<string> readFile(const string& path, string& errorMsg);

// Returns the directory part of path ("." if there is none).
string parentDirPath(const string& path);

// Replaces the content of a file by writing it into a temporary file in the
// same directory and renaming that over the target, so that readers see
// either the old or the new content. If the target is a symlink, the file it
// points to is replaced and the link is kept. The temporary file is removed
// when the writer is destroyed unless commit succeeded.
class AtomicFileWriter {
SHARED_ONLY_CLASS(AtomicFileWriter);
public:
    AtomicFileWriter(CKey, string path);
    ~AtomicFileWriter();

    // Writes the complete new content into the temporary file.
    bool write(const string& content, string& errorMsg);

    // Renames the temporary file over the target. May only be called after a
    // successful write.
    bool commit(string& errorMsg);

    // The target path with symlinks resolved.
    const string& path() const;
    const string& tempPath() const;

private:
    string path_;
    string tempPath_;
    bool written_;
    bool committed_;
};

// Convenience wrapper that writes and commits using AtomicFileWriter.
bool writeFileAtomically(const string& path, const string& content, string& errorMsg);

}
