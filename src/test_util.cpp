#include "test_util.hpp"

#include "atomic_file.hpp"

#include <cstdio>

#include <dirent.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace bookmarksync {

namespace {

int removeEntry(const char* path, const struct stat*, int, struct FTW*) {
    if(::remove(path) != 0) {
        WARNING_LOG("Deleting '", path, "' failed");
    }
    return 0;
}

}

TestDir::TestDir(CKey) {
    char path[] = "/tmp/bookmarksynctest_XXXXXX";
    REQUIRE(mkdtemp(path) != nullptr);
    path_ = path;
}

TestDir::~TestDir() {
    if(nftw(path_.c_str(), removeEntry, 16, FTW_DEPTH | FTW_PHYS) != 0) {
        WARNING_LOG("Deleting temporary directory ", path_, " failed");
    }
}

const string& TestDir::path() const {
    return path_;
}

string TestDir::file(const string& relPath) const {
    return path_ + "/" + relPath;
}

void TestDir::write(const string& relPath, const string& content) {
    string path = file(relPath);
    string errorMsg;
    REQUIRE(ensureDirExists(parentDirPath(path), errorMsg));

    ofstream fp;
    fp.open(path, std::ios::binary | std::ios::trunc);
    fp << content;
    fp.close();
    REQUIRE(fp.good());
}

optional<string> TestDir::read(const string& relPath) const {
    string path = file(relPath);
    if(!pathExists(path)) {
        optional<string> empty;
        return empty;
    }
    string errorMsg;
    optional<string> content = readFile(path, errorMsg);
    REQUIRE(content);
    return content;
}

bool TestDir::exists(const string& relPath) const {
    return pathExists(file(relPath));
}

vector<string> TestDir::list(const string& relPath) const {
    vector<string> ret;
    DIR* dir = opendir(file(relPath).c_str());
    REQUIRE(dir != nullptr);
    while(struct dirent* entry = readdir(dir)) {
        string name = entry->d_name;
        if(name != "." && name != "..") {
            ret.push_back(name);
        }
    }
    closedir(dir);
    sort(ret.begin(), ret.end());
    return ret;
}

LogCapture::LogCapture(CKey)
    : messages_(make_shared<vector<pair<LogLevel, string>>>())
{
    shared_ptr<vector<pair<LogLevel, string>>> messages = messages_;
    setLogCallback([messages](LogLevel logLevel, const char*, const char* msg) {
        messages->emplace_back(logLevel, msg);
    });
}

LogCapture::~LogCapture() {
    setLogCallback(nullptr);
}

size_t LogCapture::count(LogLevel logLevel, const string& substr) const {
    size_t ret = 0;
    for(const pair<LogLevel, string>& item : *messages_) {
        if(item.first == logLevel && item.second.find(substr) != string::npos) {
            ++ret;
        }
    }
    return ret;
}

}
