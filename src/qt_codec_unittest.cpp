#include "qt_codec.hpp"

#include <gtest/gtest.h>

namespace bookmarksync {

namespace {

const string Home = "/home/user";

BookmarkList makeList(const vector<Bookmark>& bookmarks) {
    BookmarkList list;
    for(const Bookmark& bookmark : bookmarks) {
        list.add(bookmark);
    }
    return list;
}

}

TEST(QtCodecTest, DecodeArray) {
    shared_ptr<QtCodec> codec = QtCodec::create(Home);
    DecodeResult result = codec->decode(R"([FileDialog]
history=file:///tmp
shortcuts\size=2
shortcuts\1\url=file:///home/user/Documents
shortcuts\1\label=Docs
shortcuts\2\url=file:///tmp
)");

    ASSERT_TRUE(result.bookmarks);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(
        *result.bookmarks,
        makeList({
            {"file:///home/user/Documents", "Docs"},
            {"file:///tmp", "tmp"}
        })
    );
}

TEST(QtCodecTest, DecodeWithoutShortcuts) {
    shared_ptr<QtCodec> codec = QtCodec::create(Home);

    DecodeResult noGroup = codec->decode("[General]\nfoo=bar\n");
    ASSERT_TRUE(noGroup.bookmarks);
    EXPECT_TRUE(noGroup.bookmarks->empty());

    DecodeResult invalid = codec->decode("[FileDialog]\nshortcuts=@Invalid()\n");
    ASSERT_TRUE(invalid.bookmarks);
    EXPECT_TRUE(invalid.bookmarks->empty());

    DecodeResult empty = codec->decode("");
    ASSERT_TRUE(empty.bookmarks);
    EXPECT_TRUE(empty.bookmarks->empty());
}

TEST(QtCodecTest, DecodeLegacyList) {
    shared_ptr<QtCodec> codec = QtCodec::create(Home);
    DecodeResult result = codec->decode(
        "[FileDialog]\n"
        "shortcuts=file:///home/user, /tmp, ftp://server/pub\n"
    );

    ASSERT_TRUE(result.bookmarks);
    EXPECT_EQ(
        *result.bookmarks,
        makeList({
            {"file:///home/user", "user"},
            {"file:///tmp", "tmp"}
        })
    );
    ASSERT_EQ(result.warnings.size(), (size_t)1);
    EXPECT_EQ(result.warnings[0].position, (size_t)3);
    EXPECT_EQ(result.warnings[0].kind, DiagnosticKind::MalformedLocation);
}

TEST(QtCodecTest, DecodeCountMismatch) {
    shared_ptr<QtCodec> codec = QtCodec::create(Home);
    vector<string> documents = {
        // Entry beyond the count
        "[FileDialog]\nshortcuts\\size=1\nshortcuts\\1\\url=file:///a\nshortcuts\\2\\url=file:///b\n",
        // Entry missing
        "[FileDialog]\nshortcuts\\size=2\nshortcuts\\1\\url=file:///a\n",
        // Count not a number
        "[FileDialog]\nshortcuts\\size=two\n",
        // Indexed entries without count
        "[FileDialog]\nshortcuts\\1\\url=file:///a\n",
        // Index not a number
        "[FileDialog]\nshortcuts\\size=1\nshortcuts\\1\\url=file:///a\nshortcuts\\x\\url=file:///b\n"
    };
    for(const string& document : documents) {
        DecodeResult result = codec->decode(document);
        EXPECT_FALSE(result.bookmarks) << document;
        EXPECT_FALSE(result.error.empty()) << document;
    }
}

TEST(QtCodecTest, DecodeMalformedIni) {
    shared_ptr<QtCodec> codec = QtCodec::create(Home);
    DecodeResult result = codec->decode("[FileDialog\nshortcuts\\size=0\n");
    EXPECT_FALSE(result.bookmarks);
    EXPECT_FALSE(result.error.empty());
}

TEST(QtCodecTest, DecodeSkipsMalformedUrl) {
    shared_ptr<QtCodec> codec = QtCodec::create(Home);
    DecodeResult result = codec->decode(R"([FileDialog]
shortcuts\size=2
shortcuts\1\url=smb://server/share
shortcuts\2\url=file:///tmp
shortcuts\2\label=Tmp
)");

    ASSERT_TRUE(result.bookmarks);
    EXPECT_EQ(*result.bookmarks, makeList({{"file:///tmp", "Tmp"}}));
    ASSERT_EQ(result.warnings.size(), (size_t)1);
    EXPECT_EQ(result.warnings[0].position, (size_t)1);
}

TEST(QtCodecTest, Encode) {
    shared_ptr<QtCodec> codec = QtCodec::create(Home);
    EXPECT_EQ(
        codec->encode(makeList({
            {"file:///home/user/Documents", "Docs, old"},
            {"file:///tmp", ""}
        })),
        R"([FileDialog]
shortcuts=file:///home/user/Documents, file:///tmp
shortcuts\size=2
shortcuts\1\url=file:///home/user/Documents
shortcuts\1\label="Docs, old"
shortcuts\2\url=file:///tmp
shortcuts\2\label=tmp
)"
    );
    EXPECT_EQ(codec->encode(BookmarkList()), "[FileDialog]\nshortcuts=\nshortcuts\\size=0\n");
}

TEST(QtCodecTest, EncodeKeepsOtherSettings) {
    shared_ptr<QtCodec> codec = QtCodec::create(Home);
    string previous = R"([General]
foo=bar

[FileDialog]
history=file:///tmp
shortcuts=file:///old
shortcuts\size=1
shortcuts\1\url=file:///old
viewMode=Detail
)";

    string errorMsg;
    optional<string> text = codec->encode(makeList({{"file:///tmp", "Tmp"}}), previous, errorMsg);
    ASSERT_TRUE(text);
    EXPECT_EQ(
        *text,
        R"([General]
foo=bar

[FileDialog]
history=file:///tmp
viewMode=Detail
shortcuts=file:///tmp
shortcuts\size=1
shortcuts\1\url=file:///tmp
shortcuts\1\label=Tmp
)"
    );
}

TEST(QtCodecTest, EncodeRefusesUnparseablePreviousFile) {
    shared_ptr<QtCodec> codec = QtCodec::create(Home);
    BookmarkList list = makeList({{"file:///tmp", "Tmp"}});
    string errorMsg;
    EXPECT_FALSE(codec->encode(list, string("[broken\n"), errorMsg));
    EXPECT_NE(errorMsg.find("cannot be parsed"), string::npos);
}

TEST(QtCodecTest, PlainListIsDecodedWithoutArray) {
    shared_ptr<QtCodec> codec = QtCodec::create(Home);
    BookmarkList list = makeList({
        {"file:///home/user/Documents", "Documents"},
        {"file:///tmp/a%2Cb", "a,b"}
    });
    string text = codec->encode(list);
    EXPECT_NE(
        text.find("\nshortcuts=file:///home/user/Documents, file:///tmp/a%2Cb\n"),
        string::npos
    );

    // Strip the array so that only the plain list remains.
    string plainOnly;
    for(const string& line : splitStr(text, '\n')) {
        if(line.compare(0, 10, "shortcuts\\") != 0 && !line.empty()) {
            plainOnly += line + "\n";
        }
    }
    DecodeResult result = codec->decode(plainOnly);
    ASSERT_TRUE(result.bookmarks);
    EXPECT_EQ(*result.bookmarks, list);
}

TEST(QtCodecTest, RoundTrip) {
    shared_ptr<QtCodec> codec = QtCodec::create(Home);
    vector<BookmarkList> lists = {
        BookmarkList(),
        makeList({{"file:///home/user/Documents", "Documents"}}),
        makeList({
            {"file:///tmp/a%2Cb%20c", "a,b c"},
            {"file:///", "\"Root\" \\ dir"},
            {"file:///home/user/%C3%A4", "; not a comment"}
        })
    };
    for(const BookmarkList& list : lists) {
        DecodeResult result = codec->decode(codec->encode(list));
        ASSERT_TRUE(result.bookmarks);
        EXPECT_EQ(*result.bookmarks, list);
        EXPECT_TRUE(result.warnings.empty());
    }
}

}
