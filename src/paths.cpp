#include "paths.hpp"

#include <cerrno>

#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

namespace bookmarksync {

optional<string> getHomeDirPath() {
    const char* path = getenv("HOME");
    if(path != nullptr && *path != '\0') {
        return string(path);
    }

    uid_t uid = getuid();

    long bufSizeSuggestion = sysconf(_SC_GETPW_R_SIZE_MAX);
    size_t bufSize = bufSizeSuggestion > 0 ? (size_t)bufSizeSuggestion : (size_t)1024;

    while(true) {
        struct passwd pwd;
        vector<char> buf(bufSize);

        struct passwd* resultPtr;
        int resultCode = getpwuid_r(uid, &pwd, buf.data(), bufSize, &resultPtr);
        if(resultCode == 0 && resultPtr == &pwd) {
            if(pwd.pw_dir == nullptr || *pwd.pw_dir == '\0') {
                break;
            }
            return string(pwd.pw_dir);
        }
        if(resultCode != ERANGE) {
            break;
        }
        bufSize *= 2;
    }

    optional<string> empty;
    return empty;
}

const char* formatRelativePath(BookmarkFormat format) {
    if(format == BookmarkFormat::Gtk) {
        return ".config/gtk-3.0/bookmarks";
    } else if(format == BookmarkFormat::Kde) {
        return ".local/share/user-places.xbel";
    } else {
        REQUIRE(format == BookmarkFormat::Qt);
        return ".config/QtProject.conf";
    }
}

string formatPath(BookmarkFormat format, const string& baseDir) {
    string path = baseDir;
    while(path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    if(path != "/") {
        path.push_back('/');
    }
    return path + formatRelativePath(format);
}

}
