#include "atomic_file.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iterator>

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace bookmarksync {

namespace {

string errnoStr(int err) {
    return std::strerror(err);
}

string resolveTargetPath(const string& path) {
    char* resolved = realpath(path.c_str(), nullptr);
    if(resolved == nullptr) {
        return path;
    }
    string ret = resolved;
    free(resolved);
    return ret;
}

string tempPathFor(const string& path) {
    string dir = parentDirPath(path);
    size_t slash = path.find_last_of('/');
    string name = slash == string::npos ? path : path.substr(slash + 1);

    string tempPath = dir + "/." + name + ".tmp.";
    string charPalette = "abcdefghijklmnopqrstuvABCDEFGHIJKLMNOPQRSTUV0123456789";
    for(int i = 0; i < 16; ++i) {
        char c = charPalette[uniform_int_distribution<size_t>(0, charPalette.size() - 1)(rng)];
        tempPath.push_back(c);
    }
    return tempPath;
}

}

bool ensureDirExists(const string& path, string& errorMsg, int& errorCode) {
    string dirPath = path;
    while(dirPath.size() > 1 && dirPath.back() == '/') {
        dirPath.pop_back();
    }
    if(dirPath.empty() || dirPath == "." || dirPath == "/") {
        return true;
    }

    struct stat st;
    if(stat(dirPath.c_str(), &st) == 0) {
        if(S_ISDIR(st.st_mode)) {
            return true;
        }
        errorMsg = "'" + dirPath + "' exists but is not a directory";
        errorCode = ENOTDIR;
        return false;
    }

    size_t slash = dirPath.find_last_of('/');
    if(slash != string::npos && slash > 0) {
        if(!ensureDirExists(dirPath.substr(0, slash), errorMsg, errorCode)) {
            return false;
        }
    }

    if(mkdir(dirPath.c_str(), 0755) == 0) {
        return true;
    }
    int err = errno;
    if(err == EEXIST) {
        if(stat(dirPath.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
            return true;
        }
        errorMsg = "'" + dirPath + "' exists but is not a directory";
        errorCode = ENOTDIR;
        return false;
    }
    errorMsg = "Creating directory '" + dirPath + "' failed: " + errnoStr(err);
    errorCode = err;
    return false;
}

bool ensureDirExists(const string& path, string& errorMsg) {
    int errorCode;
    return ensureDirExists(path, errorMsg, errorCode);
}

bool pathExists(const string& path) {
    struct stat st;
    if(stat(path.c_str(), &st) == 0) {
        return true;
    }
    return errno != ENOENT && errno != ENOTDIR;
}

optional<string> readFile(const string& path, string& errorMsg) {
    optional<string> empty;

    struct stat st;
    if(stat(path.c_str(), &st) != 0) {
        errorMsg = "Accessing '" + path + "' failed: " + errnoStr(errno);
        return empty;
    }
    if(!S_ISREG(st.st_mode)) {
        errorMsg = "'" + path + "' is not a regular file";
        return empty;
    }

    ifstream fp;
    fp.open(path, std::ios::binary);
    if(!fp.is_open()) {
        errorMsg = "Opening '" + path + "' for reading failed";
        return empty;
    }

    string content(
        (std::istreambuf_iterator<char>(fp)),
        std::istreambuf_iterator<char>()
    );
    if(fp.bad()) {
        errorMsg = "Reading '" + path + "' failed";
        return empty;
    }
    return content;
}

string parentDirPath(const string& path) {
    size_t slash = path.find_last_of('/');
    if(slash == string::npos) {
        return ".";
    }
    if(slash == 0) {
        return "/";
    }
    return path.substr(0, slash);
}

AtomicFileWriter::AtomicFileWriter(CKey, string path)
    : path_(resolveTargetPath(path)),
      tempPath_(tempPathFor(path_)),
      written_(false),
      committed_(false)
{}

AtomicFileWriter::~AtomicFileWriter() {
    if(committed_) {
        return;
    }
    if(unlink(tempPath_.c_str()) != 0 && errno != ENOENT) {
        WARNING_LOG("Deleting temporary file '", tempPath_, "' failed");
    }
}

bool AtomicFileWriter::write(const string& content, string& errorMsg) {
    REQUIRE(!committed_);

    ofstream fp;
    fp.open(tempPath_, std::ios::binary | std::ios::trunc);
    if(!fp.is_open()) {
        errorMsg = "Could not create temporary file '" + tempPath_ + "'";
        return false;
    }
    fp.write(content.data(), (std::streamsize)content.size());
    fp.flush();
    fp.close();

    if(!fp.good()) {
        errorMsg = "Could not write temporary file '" + tempPath_ + "'";
        return false;
    }

    written_ = true;
    return true;
}

bool AtomicFileWriter::commit(string& errorMsg) {
    REQUIRE(written_);
    REQUIRE(!committed_);

    if(rename(tempPath_.c_str(), path_.c_str()) != 0) {
        errorMsg =
            "Renaming temporary file '" + tempPath_ + "' to '" + path_ +
            "' failed: " + errnoStr(errno);
        return false;
    }

    committed_ = true;
    return true;
}

const string& AtomicFileWriter::path() const {
    return path_;
}

const string& AtomicFileWriter::tempPath() const {
    return tempPath_;
}

bool writeFileAtomically(const string& path, const string& content, string& errorMsg) {
    shared_ptr<AtomicFileWriter> writer = AtomicFileWriter::create(path);
    return writer->write(content, errorMsg) && writer->commit(errorMsg);
}

}
