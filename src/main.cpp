#include "config.hpp"
#include "paths.hpp"
#include "sync.hpp"

namespace bookmarksync {

namespace {

void quietLogCallback(LogLevel logLevel, const char* location, const char* msg) {
    if(logLevel == LogLevel::Info) {
        return;
    }
    stringstream ss;
    ss << logLevelName(logLevel) << " @ " << location << " -- " << msg << '\n';
    cerr << ss.str();
}

void printTargetStatus(const TargetReport& target) {
    cout << formatName(target.format) << ": ";
    if(target.status == TargetStatus::Written) {
        if(target.unchanged) {
            cout << "up to date " << target.path << "\n";
        } else {
            cout << "written " << target.path << "\n";
        }
    } else if(target.status == TargetStatus::Skipped) {
        cout << "skipped " << target.path << " (" << target.message << ")\n";
    } else {
        REQUIRE(target.status == TargetStatus::Failed);
        cout << "FAILED " << target.path << " (" << target.message << ")\n";
    }
}

}

}

int main(int argc, char* argv[]) {
    using namespace bookmarksync;

    shared_ptr<Config> config = Config::read(argc, argv);
    if(!config) {
        return 1;
    }

    if(config->quiet) {
        setLogCallback(quietLogCallback);
    }

    optional<BookmarkFormat> source = parseFormatName(config->syncFrom);
    REQUIRE(source);

    string baseDir = config->baseDir;
    if(baseDir.empty()) {
        optional<string> homeDir = getHomeDirPath();
        if(!homeDir) {
            cerr << "ERROR: Could not determine the home directory, use --base-dir\n";
            return 1;
        }
        baseDir = *homeDir;
    }

    cout << "Running sync from " << formatName(*source) << " backend\n";

    SyncReport report = syncBookmarks(*source, baseDir);
    if(report.error) {
        cout << "Sync failed: " << report.errorMessage << "\n";
        return 1;
    }
    for(const TargetReport& target : report.targets) {
        printTargetStatus(target);
    }

    return report.ok() ? 0 : 1;
}
