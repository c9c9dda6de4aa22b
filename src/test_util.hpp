#pragma once

#include "common.hpp"

namespace bookmarksync {

// Temporary directory that is removed recursively when the object is
// destroyed. Used as the base directory of the bookmark files in tests.
class TestDir {
SHARED_ONLY_CLASS(TestDir);
public:
    TestDir(CKey);
    ~TestDir();

    const string& path() const;

    // Absolute path of relPath inside the directory.
    string file(const string& relPath) const;

    // Writes content to relPath, creating missing parent directories.
    void write(const string& relPath, const string& content);

    // Returns empty if relPath does not exist.
    optional<string> read(const string& relPath) const;

    bool exists(const string& relPath) const;

    // Names of the entries in the directory relPath (excluding . and ..),
    // sorted.
    vector<string> list(const string& relPath) const;

private:
    string path_;
};

// Collects log messages while it exists instead of writing them to stderr.
class LogCapture {
SHARED_ONLY_CLASS(LogCapture);
public:
    LogCapture(CKey);
    ~LogCapture();

    // Number of captured messages of given level containing substr.
    size_t count(LogLevel logLevel, const string& substr = "") const;

private:
    shared_ptr<vector<pair<LogLevel, string>>> messages_;
};

}
