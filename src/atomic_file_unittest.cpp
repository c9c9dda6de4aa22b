#include "atomic_file.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

#include <cerrno>

#include <sys/stat.h>
#include <unistd.h>

namespace bookmarksync {

TEST(AtomicFileTest, EnsureDirExistsCreatesParents) {
    shared_ptr<TestDir> dir = TestDir::create();
    string errorMsg;
    EXPECT_TRUE(ensureDirExists(dir->file("a/b/c"), errorMsg)) << errorMsg;
    EXPECT_TRUE(dir->exists("a/b/c"));
    EXPECT_TRUE(ensureDirExists(dir->file("a/b/c/"), errorMsg)) << errorMsg;
}

TEST(AtomicFileTest, EnsureDirExistsFailsWhenFileBlocksPath) {
    shared_ptr<TestDir> dir = TestDir::create();
    dir->write("blocked", "not a directory");

    string errorMsg;
    EXPECT_FALSE(ensureDirExists(dir->file("blocked"), errorMsg));
    EXPECT_NE(errorMsg.find("not a directory"), string::npos);

    errorMsg.clear();
    EXPECT_FALSE(ensureDirExists(dir->file("blocked/sub"), errorMsg));
    EXPECT_FALSE(errorMsg.empty());

    int errorCode = 0;
    EXPECT_FALSE(ensureDirExists(dir->file("blocked/sub"), errorMsg, errorCode));
    EXPECT_EQ(errorCode, ENOTDIR);
}

TEST(AtomicFileTest, EnsureDirExistsReportsPermissionError) {
    if(geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    shared_ptr<TestDir> dir = TestDir::create();
    string errorMsg;
    ASSERT_TRUE(ensureDirExists(dir->file("locked"), errorMsg)) << errorMsg;
    ASSERT_EQ(chmod(dir->file("locked").c_str(), 0500), 0);

    int errorCode = 0;
    EXPECT_FALSE(ensureDirExists(dir->file("locked/a/b"), errorMsg, errorCode));
    EXPECT_EQ(errorCode, EACCES);
    EXPECT_NE(errorMsg.find("Creating directory"), string::npos);

    ASSERT_EQ(chmod(dir->file("locked").c_str(), 0755), 0);
}

TEST(AtomicFileTest, ReadFile) {
    shared_ptr<TestDir> dir = TestDir::create();
    dir->write("file", string("binary\0data\n", 12));
    dir->write("empty", "");

    string errorMsg;
    EXPECT_EQ(readFile(dir->file("file"), errorMsg), string("binary\0data\n", 12));
    EXPECT_EQ(readFile(dir->file("empty"), errorMsg), string());

    EXPECT_FALSE(readFile(dir->file("missing"), errorMsg));
    EXPECT_FALSE(errorMsg.empty());

    errorMsg.clear();
    EXPECT_FALSE(readFile(dir->path(), errorMsg));
    EXPECT_FALSE(errorMsg.empty());
}

TEST(AtomicFileTest, PathExists) {
    shared_ptr<TestDir> dir = TestDir::create();
    dir->write("file", "x");
    EXPECT_TRUE(pathExists(dir->file("file")));
    EXPECT_TRUE(pathExists(dir->path()));
    EXPECT_FALSE(pathExists(dir->file("missing")));
    EXPECT_FALSE(pathExists(dir->file("file/child")));
}

TEST(AtomicFileTest, ParentDirPath) {
    EXPECT_EQ(parentDirPath("/a/b"), "/a");
    EXPECT_EQ(parentDirPath("/a"), "/");
    EXPECT_EQ(parentDirPath("a"), ".");
}

TEST(AtomicFileTest, WriteCreatesAndReplaces) {
    shared_ptr<TestDir> dir = TestDir::create();
    string errorMsg;

    EXPECT_TRUE(writeFileAtomically(dir->file("target"), "first\n", errorMsg)) << errorMsg;
    EXPECT_EQ(dir->read("target"), string("first\n"));

    EXPECT_TRUE(writeFileAtomically(dir->file("target"), "second\n", errorMsg)) << errorMsg;
    EXPECT_EQ(dir->read("target"), string("second\n"));

    EXPECT_EQ(dir->list(""), vector<string>{"target"});
}

TEST(AtomicFileTest, TemporaryFileNextToTarget) {
    shared_ptr<TestDir> dir = TestDir::create();
    shared_ptr<AtomicFileWriter> writer = AtomicFileWriter::create(dir->file("target"));

    string prefix = dir->file(".target.tmp.");
    EXPECT_EQ(writer->tempPath().substr(0, prefix.size()), prefix);
    EXPECT_EQ(writer->tempPath().size(), prefix.size() + 16);
    EXPECT_EQ(writer->path(), dir->file("target"));
}

TEST(AtomicFileTest, UncommittedWriteIsDiscarded) {
    shared_ptr<TestDir> dir = TestDir::create();
    dir->write("target", "old\n");

    string errorMsg;
    {
        shared_ptr<AtomicFileWriter> writer = AtomicFileWriter::create(dir->file("target"));
        EXPECT_TRUE(writer->write("new\n", errorMsg)) << errorMsg;
        EXPECT_EQ(dir->list("").size(), (size_t)2);
    }

    EXPECT_EQ(dir->read("target"), string("old\n"));
    EXPECT_EQ(dir->list(""), vector<string>{"target"});
}

TEST(AtomicFileTest, WriteThroughSymlinkKeepsLink) {
    shared_ptr<TestDir> dir = TestDir::create();
    dir->write("real/target", "old\n");
    ASSERT_EQ(symlink(dir->file("real/target").c_str(), dir->file("link").c_str()), 0);

    string errorMsg;
    EXPECT_TRUE(writeFileAtomically(dir->file("link"), "new\n", errorMsg)) << errorMsg;

    struct stat st;
    ASSERT_EQ(lstat(dir->file("link").c_str(), &st), 0);
    EXPECT_TRUE(S_ISLNK(st.st_mode));
    EXPECT_EQ(dir->read("real/target"), string("new\n"));
    EXPECT_EQ(dir->read("link"), string("new\n"));
    EXPECT_EQ(dir->list(""), (vector<string>{"link", "real"}));
    EXPECT_EQ(dir->list("real"), vector<string>{"target"});
}

TEST(AtomicFileTest, WriteIntoMissingDirectoryFails) {
    shared_ptr<TestDir> dir = TestDir::create();
    string errorMsg;
    EXPECT_FALSE(writeFileAtomically(dir->file("missing/target"), "x", errorMsg));
    EXPECT_FALSE(errorMsg.empty());
    EXPECT_TRUE(dir->list("").empty());
}

TEST(AtomicFileTest, RenameOverDirectoryFails) {
    shared_ptr<TestDir> dir = TestDir::create();
    dir->write("target/inner", "x");

    string errorMsg;
    EXPECT_FALSE(writeFileAtomically(dir->file("target"), "y", errorMsg));
    EXPECT_NE(errorMsg.find("Renaming"), string::npos);
    EXPECT_EQ(dir->list(""), vector<string>{"target"});
    EXPECT_EQ(dir->read("target/inner"), string("x"));
}

}
