#include "sync.hpp"

#include "paths.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

#include <sys/stat.h>
#include <unistd.h>

namespace bookmarksync {

namespace {

const string GtkPath = ".config/gtk-3.0/bookmarks";
const string KdePath = ".local/share/user-places.xbel";
const string QtPath = ".config/QtProject.conf";

BookmarkList makeList(const vector<Bookmark>& bookmarks) {
    BookmarkList list;
    for(const Bookmark& bookmark : bookmarks) {
        list.add(bookmark);
    }
    return list;
}

// Decodes the file of given format in dir, failing the test if it is
// missing or malformed.
BookmarkList decodeFile(const TestDir& dir, BookmarkFormat format) {
    optional<string> text = dir.read(formatRelativePath(format));
    EXPECT_TRUE(text) << formatName(format) << " file missing";
    DecodeResult result = createCodec(format, dir.path())->decode(text.value_or(""));
    EXPECT_TRUE(result.bookmarks) << result.error;
    EXPECT_TRUE(result.warnings.empty());
    return result.bookmarks.value_or(BookmarkList());
}

}

TEST(PathsTest, FormatPaths) {
    EXPECT_EQ(formatPath(BookmarkFormat::Gtk, "/home/user"), "/home/user/" + GtkPath);
    EXPECT_EQ(formatPath(BookmarkFormat::Kde, "/home/user/"), "/home/user/" + KdePath);
    EXPECT_EQ(formatPath(BookmarkFormat::Qt, "/"), "/" + QtPath);
}

TEST(PathsTest, ParseFormatName) {
    EXPECT_EQ(parseFormatName("gtk"), BookmarkFormat::Gtk);
    EXPECT_EQ(parseFormatName("KDE"), BookmarkFormat::Kde);
    EXPECT_EQ(parseFormatName("Qt"), BookmarkFormat::Qt);
    EXPECT_FALSE(parseFormatName("gnome"));
    EXPECT_FALSE(parseFormatName(""));
}

TEST(SyncTest, GtkToOthers) {
    shared_ptr<LogCapture> logs = LogCapture::create();
    shared_ptr<TestDir> dir = TestDir::create();
    dir->write(GtkPath, "file:///home/u/Documents Documents\n");

    SyncReport report = syncBookmarks(BookmarkFormat::Gtk, dir->path());

    EXPECT_TRUE(report.ok());
    EXPECT_FALSE(report.error);
    EXPECT_EQ(report.bookmarkCount, (size_t)1);
    EXPECT_TRUE(report.warnings.empty());

    ASSERT_EQ(report.targets.size(), (size_t)2);
    EXPECT_EQ(report.targets[0].format, BookmarkFormat::Kde);
    EXPECT_EQ(report.targets[0].path, dir->file(KdePath));
    EXPECT_EQ(report.targets[0].status, TargetStatus::Written);
    EXPECT_EQ(report.targets[1].format, BookmarkFormat::Qt);
    EXPECT_EQ(report.targets[1].path, dir->file(QtPath));
    EXPECT_EQ(report.targets[1].status, TargetStatus::Written);

    BookmarkList expected = makeList({{"file:///home/u/Documents", "Documents"}});
    EXPECT_EQ(decodeFile(*dir, BookmarkFormat::Kde), expected);
    EXPECT_EQ(decodeFile(*dir, BookmarkFormat::Qt), expected);
}

TEST(SyncTest, SourceMissing) {
    shared_ptr<LogCapture> logs = LogCapture::create();
    shared_ptr<TestDir> dir = TestDir::create();

    SyncReport report = syncBookmarks(BookmarkFormat::Kde, dir->path());

    EXPECT_FALSE(report.ok());
    ASSERT_TRUE(report.error);
    EXPECT_EQ(*report.error, SyncError::SourceMissing);
    EXPECT_TRUE(report.targets.empty());
    EXPECT_TRUE(dir->list("").empty());
    EXPECT_EQ(logs->count(LogLevel::Error), (size_t)1);
}

TEST(SyncTest, SourceUnreadable) {
    shared_ptr<LogCapture> logs = LogCapture::create();
    shared_ptr<TestDir> dir = TestDir::create();
    dir->write(GtkPath + "/inner", "");

    SyncReport report = syncBookmarks(BookmarkFormat::Gtk, dir->path());

    ASSERT_TRUE(report.error);
    EXPECT_EQ(*report.error, SyncError::FilesystemError);
    EXPECT_TRUE(report.targets.empty());
    EXPECT_FALSE(dir->exists(KdePath));
    EXPECT_FALSE(dir->exists(QtPath));
}

TEST(SyncTest, MalformedSourceTouchesNothing) {
    shared_ptr<LogCapture> logs = LogCapture::create();
    shared_ptr<TestDir> dir = TestDir::create();
    dir->write(KdePath, "<xbel><bookmark href=\"file:///tmp\">");
    dir->write(GtkPath, "file:///old Old\n");

    SyncReport report = syncBookmarks(BookmarkFormat::Kde, dir->path());

    ASSERT_TRUE(report.error);
    EXPECT_EQ(*report.error, SyncError::MalformedDocument);
    EXPECT_FALSE(report.errorMessage.empty());
    EXPECT_TRUE(report.targets.empty());
    EXPECT_EQ(dir->read(GtkPath), string("file:///old Old\n"));
    EXPECT_FALSE(dir->exists(QtPath));
}

TEST(SyncTest, MalformedEntryIsSkipped) {
    shared_ptr<LogCapture> logs = LogCapture::create();
    shared_ptr<TestDir> dir = TestDir::create();
    dir->write(GtkPath, "sftp://server/srv Remote\nfile:///tmp Tmp\n");

    SyncReport report = syncBookmarks(BookmarkFormat::Gtk, dir->path());

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.bookmarkCount, (size_t)1);
    ASSERT_EQ(report.warnings.size(), (size_t)1);
    EXPECT_EQ(report.warnings[0].kind, DiagnosticKind::MalformedLocation);
    EXPECT_EQ(report.warnings[0].position, (size_t)1);
    EXPECT_EQ(logs->count(LogLevel::Warning, "sftp://server/srv"), (size_t)1);

    BookmarkList expected = makeList({{"file:///tmp", "Tmp"}});
    EXPECT_EQ(decodeFile(*dir, BookmarkFormat::Kde), expected);
    EXPECT_EQ(decodeFile(*dir, BookmarkFormat::Qt), expected);
}

TEST(SyncTest, BlockedTargetDirectory) {
    shared_ptr<LogCapture> logs = LogCapture::create();
    shared_ptr<TestDir> dir = TestDir::create();
    dir->write(GtkPath, "file:///tmp Tmp\n");
    dir->write(".local", "a file where a directory should be");

    SyncReport report = syncBookmarks(BookmarkFormat::Gtk, dir->path());

    EXPECT_FALSE(report.ok());
    EXPECT_FALSE(report.error);
    ASSERT_EQ(report.targets.size(), (size_t)2);

    const TargetReport& kde = report.targets[0];
    EXPECT_EQ(kde.format, BookmarkFormat::Kde);
    EXPECT_EQ(kde.status, TargetStatus::Failed);
    ASSERT_TRUE(kde.error);
    EXPECT_EQ(*kde.error, SyncError::FilesystemError);
    EXPECT_FALSE(kde.message.empty());

    const TargetReport& qt = report.targets[1];
    EXPECT_EQ(qt.status, TargetStatus::Written);
    EXPECT_FALSE(qt.error);
    EXPECT_EQ(decodeFile(*dir, BookmarkFormat::Qt), makeList({{"file:///tmp", "Tmp"}}));

    EXPECT_EQ(logs->count(LogLevel::Error, dir->file(KdePath)), (size_t)1);
}

TEST(SyncTest, SecondRunLeavesTargetsUntouched) {
    shared_ptr<LogCapture> logs = LogCapture::create();
    shared_ptr<TestDir> dir = TestDir::create();
    dir->write(GtkPath, "file:///tmp Tmp\n~/Music\n/srv/a%2Cb\n");

    SyncReport first = syncBookmarks(BookmarkFormat::Gtk, dir->path());
    ASSERT_TRUE(first.ok());
    optional<string> kdeText = dir->read(KdePath);
    optional<string> qtText = dir->read(QtPath);
    ASSERT_TRUE(kdeText);
    ASSERT_TRUE(qtText);

    SyncReport second = syncBookmarks(BookmarkFormat::Gtk, dir->path());
    EXPECT_TRUE(second.ok());
    ASSERT_EQ(second.targets.size(), (size_t)2);
    for(const TargetReport& target : second.targets) {
        EXPECT_EQ(target.status, TargetStatus::Written);
        EXPECT_TRUE(target.unchanged);
        EXPECT_FALSE(target.error);
    }
    EXPECT_EQ(dir->read(KdePath), kdeText);
    EXPECT_EQ(dir->read(QtPath), qtText);

    EXPECT_EQ(dir->list(".config"), (vector<string>{"QtProject.conf", "gtk-3.0"}));
    EXPECT_EQ(dir->list(".local/share"), vector<string>{"user-places.xbel"});
}

TEST(SyncTest, DuplicatesKeepLastOccurrence) {
    shared_ptr<LogCapture> logs = LogCapture::create();
    shared_ptr<TestDir> dir = TestDir::create();
    dir->write(
        QtPath,
        "[FileDialog]\n"
        "shortcuts\\size=3\n"
        "shortcuts\\1\\url=file:///a\n"
        "shortcuts\\1\\label=First\n"
        "shortcuts\\2\\url=file:///b\n"
        "shortcuts\\3\\url=file:///a/\n"
        "shortcuts\\3\\label=Second\n"
    );

    SyncReport report = syncBookmarks(BookmarkFormat::Qt, dir->path());

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.bookmarkCount, (size_t)2);
    ASSERT_EQ(report.warnings.size(), (size_t)1);
    EXPECT_EQ(report.warnings[0].kind, DiagnosticKind::DuplicateLocation);

    EXPECT_EQ(dir->read(GtkPath), string("file:///b b\nfile:///a Second\n"));
    EXPECT_EQ(
        decodeFile(*dir, BookmarkFormat::Kde),
        makeList({{"file:///b", "b"}, {"file:///a", "Second"}})
    );
}

TEST(SyncTest, KdeTargetKeepsSystemPlaces) {
    shared_ptr<LogCapture> logs = LogCapture::create();
    shared_ptr<TestDir> dir = TestDir::create();
    dir->write(GtkPath, "file:///tmp Tmp\n");
    dir->write(
        KdePath,
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<xbel>\n"
        " <bookmark href=\"file:///home/user\">\n"
        "  <title>Home</title>\n"
        "  <info><metadata owner=\"http://www.kde.org\"><isSystemItem>true</isSystemItem></metadata></info>\n"
        " </bookmark>\n"
        " <bookmark href=\"file:///old\"><title>Old</title></bookmark>\n"
        "</xbel>\n"
    );

    SyncReport report = syncBookmarks(BookmarkFormat::Gtk, dir->path());
    ASSERT_TRUE(report.ok());

    optional<string> kdeText = dir->read(KdePath);
    ASSERT_TRUE(kdeText);
    EXPECT_NE(kdeText->find("href=\"file:///home/user\""), string::npos);
    EXPECT_NE(kdeText->find("<isSystemItem>true</isSystemItem>"), string::npos);
    EXPECT_EQ(kdeText->find("file:///old"), string::npos);
    EXPECT_EQ(decodeFile(*dir, BookmarkFormat::Kde), makeList({{"file:///tmp", "Tmp"}}));
}

TEST(SyncTest, QtTargetKeepsOtherSettings) {
    shared_ptr<LogCapture> logs = LogCapture::create();
    shared_ptr<TestDir> dir = TestDir::create();
    dir->write(GtkPath, "file:///tmp Tmp\n");
    dir->write(
        QtPath,
        "[FileDialog]\n"
        "history=file:///srv\n"
        "shortcuts=file:///old\n"
        "\n"
        "[Other]\n"
        "key=value\n"
    );

    SyncReport report = syncBookmarks(BookmarkFormat::Gtk, dir->path());
    ASSERT_TRUE(report.ok());

    EXPECT_EQ(
        dir->read(QtPath),
        string(
            "[FileDialog]\n"
            "history=file:///srv\n"
            "shortcuts=file:///tmp\n"
            "shortcuts\\size=1\n"
            "shortcuts\\1\\url=file:///tmp\n"
            "shortcuts\\1\\label=Tmp\n"
            "\n"
            "[Other]\n"
            "key=value\n"
        )
    );
}

TEST(SyncTest, QtTargetHasPlainListAndArray) {
    shared_ptr<LogCapture> logs = LogCapture::create();
    shared_ptr<TestDir> dir = TestDir::create();
    dir->write(GtkPath, "file:///tmp Tmp\nfile:///srv/a%2Cb Data\n");

    SyncReport report = syncBookmarks(BookmarkFormat::Gtk, dir->path());
    ASSERT_TRUE(report.ok());

    optional<string> qtText = dir->read(QtPath);
    ASSERT_TRUE(qtText);
    EXPECT_NE(qtText->find("\nshortcuts=file:///tmp, file:///srv/a%2Cb\n"), string::npos);
    EXPECT_NE(qtText->find("\nshortcuts\\size=2\n"), string::npos);
    EXPECT_NE(qtText->find("\nshortcuts\\2\\url=file:///srv/a%2Cb\n"), string::npos);
    EXPECT_NE(qtText->find("\nshortcuts\\2\\label=Data\n"), string::npos);
    EXPECT_EQ(
        decodeFile(*dir, BookmarkFormat::Qt),
        makeList({{"file:///tmp", "Tmp"}, {"file:///srv/a%2Cb", "Data"}})
    );
}

TEST(SyncTest, QtTargetWithByteOrderMarkKeepsSettings) {
    shared_ptr<LogCapture> logs = LogCapture::create();
    shared_ptr<TestDir> dir = TestDir::create();
    dir->write(GtkPath, "file:///tmp Tmp\n");
    dir->write(
        QtPath,
        "\xEF\xBB\xBF[General]\nfontSize=12\n\n[FileDialog]\nviewMode=Detail\n"
    );

    SyncReport report = syncBookmarks(BookmarkFormat::Gtk, dir->path());
    ASSERT_TRUE(report.ok());
    ASSERT_EQ(report.targets.size(), (size_t)2);
    EXPECT_EQ(report.targets[1].status, TargetStatus::Written);

    optional<string> qtText = dir->read(QtPath);
    ASSERT_TRUE(qtText);
    EXPECT_NE(qtText->find("[General]\nfontSize=12\n"), string::npos);
    EXPECT_NE(qtText->find("viewMode=Detail\n"), string::npos);
    EXPECT_EQ(decodeFile(*dir, BookmarkFormat::Qt), makeList({{"file:///tmp", "Tmp"}}));
}

TEST(SyncTest, UnparseableQtTargetIsNotOverwritten) {
    shared_ptr<LogCapture> logs = LogCapture::create();
    shared_ptr<TestDir> dir = TestDir::create();
    dir->write(GtkPath, "file:///tmp Tmp\n");
    string broken = "[General\nfontSize=12\n";
    dir->write(QtPath, broken);

    SyncReport report = syncBookmarks(BookmarkFormat::Gtk, dir->path());

    EXPECT_FALSE(report.ok());
    EXPECT_FALSE(report.error);
    ASSERT_EQ(report.targets.size(), (size_t)2);

    EXPECT_EQ(report.targets[0].status, TargetStatus::Written);

    const TargetReport& qt = report.targets[1];
    EXPECT_EQ(qt.format, BookmarkFormat::Qt);
    EXPECT_EQ(qt.status, TargetStatus::Failed);
    ASSERT_TRUE(qt.error);
    EXPECT_EQ(*qt.error, SyncError::MalformedDocument);
    EXPECT_NE(qt.message.find("cannot be parsed"), string::npos);

    EXPECT_EQ(dir->read(QtPath), broken);
    EXPECT_EQ(dir->list(".config"), (vector<string>{"QtProject.conf", "gtk-3.0"}));
    EXPECT_EQ(logs->count(LogLevel::Error, dir->file(QtPath)), (size_t)1);
}

TEST(SyncTest, UnwritableTargetDirectoryIsSkipped) {
    if(geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    shared_ptr<LogCapture> logs = LogCapture::create();
    shared_ptr<TestDir> dir = TestDir::create();
    dir->write(GtkPath, "file:///tmp Tmp\n");
    dir->write(".local/placeholder", "");
    ASSERT_EQ(chmod(dir->file(".local").c_str(), 0500), 0);

    SyncReport report = syncBookmarks(BookmarkFormat::Gtk, dir->path());

    ASSERT_EQ(chmod(dir->file(".local").c_str(), 0755), 0);

    EXPECT_FALSE(report.ok());
    EXPECT_FALSE(report.error);
    ASSERT_EQ(report.targets.size(), (size_t)2);

    const TargetReport& kde = report.targets[0];
    EXPECT_EQ(kde.format, BookmarkFormat::Kde);
    EXPECT_EQ(kde.status, TargetStatus::Skipped);
    ASSERT_TRUE(kde.error);
    EXPECT_EQ(*kde.error, SyncError::FilesystemError);
    EXPECT_FALSE(kde.message.empty());
    EXPECT_FALSE(dir->exists(KdePath));

    EXPECT_EQ(report.targets[1].status, TargetStatus::Written);
    EXPECT_EQ(decodeFile(*dir, BookmarkFormat::Qt), makeList({{"file:///tmp", "Tmp"}}));
}

TEST(SyncTest, EmptySourceClearsTargets) {
    shared_ptr<LogCapture> logs = LogCapture::create();
    shared_ptr<TestDir> dir = TestDir::create();
    dir->write(KdePath, "<xbel/>");
    dir->write(GtkPath, "file:///old Old\n");

    SyncReport report = syncBookmarks(BookmarkFormat::Kde, dir->path());

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.bookmarkCount, (size_t)0);
    ASSERT_EQ(report.targets.size(), (size_t)2);
    EXPECT_EQ(report.targets[0].format, BookmarkFormat::Gtk);
    EXPECT_EQ(report.targets[1].format, BookmarkFormat::Qt);
    EXPECT_EQ(dir->read(GtkPath), string(""));
    EXPECT_TRUE(decodeFile(*dir, BookmarkFormat::Qt).empty());
}

}
