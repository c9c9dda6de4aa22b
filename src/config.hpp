#pragma once

#include "common.hpp"

namespace bookmarksync {

extern const char* BookmarkSyncVersion;

class Config {
SHARED_ONLY_CLASS(Config);
private:
    class Src;
    int dummy_;

public:
    Config(CKey, Src& src);

    // Returns empty pointer if reading the configuration failed or help/version
    // was shown and the program should be terminated
    static shared_ptr<Config> read(int argc, const char* const* argv);

public:
    // Name of the source format, validated by parseFormatName
    const string syncFrom;
    // Empty if the home directory should be used
    const string baseDir;
    const bool quiet;
};

}
