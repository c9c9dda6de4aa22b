#pragma once

#include "codec.hpp"

namespace bookmarksync {

// Returns $HOME if set and non-empty, otherwise the home directory of the
// current user in the password database. Returns empty if neither is
// available.
optional<string> getHomeDirPath();

// Path of the bookmark file of given format relative to the base directory.
const char* formatRelativePath(BookmarkFormat format);

string formatPath(BookmarkFormat format, const string& baseDir);

}
