#include "gtk_codec.hpp"

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

TEST(GtkCodecTest, DecodeLocationAndLabel) {
    shared_ptr<GtkCodec> codec = GtkCodec::create(Home);
    DecodeResult result = codec->decode("file:///home/u/Documents Documents\n");

    ASSERT_TRUE(result.bookmarks);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(
        *result.bookmarks,
        makeList({{"file:///home/u/Documents", "Documents"}})
    );
}

TEST(GtkCodecTest, DecodeSkipsByteOrderMark) {
    shared_ptr<GtkCodec> codec = GtkCodec::create(Home);
    DecodeResult result = codec->decode(
        "\xEF\xBB\xBF" "file:///home/u/Documents Documents\nfile:///tmp\n"
    );

    ASSERT_TRUE(result.bookmarks);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(
        *result.bookmarks,
        makeList({
            {"file:///home/u/Documents", "Documents"},
            {"file:///tmp", "tmp"}
        })
    );
}

TEST(GtkCodecTest, DecodeSkipsCommentsAndBlankLines) {
    shared_ptr<GtkCodec> codec = GtkCodec::create(Home);
    DecodeResult result = codec->decode(
        "# bookmarks\n"
        "\n"
        "/tmp\n"
        "file:///home/user/My%20Music   Music Files  \r\n"
        "~/Videos\n"
    );

    ASSERT_TRUE(result.bookmarks);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(
        *result.bookmarks,
        makeList({
            {"file:///tmp", "tmp"},
            {"file:///home/user/My%20Music", "Music Files"},
            {"file:///home/user/Videos", "Videos"}
        })
    );
}

TEST(GtkCodecTest, DecodeSkipsMalformedLocation) {
    shared_ptr<GtkCodec> codec = GtkCodec::create(Home);
    DecodeResult result = codec->decode(
        "sftp://server/srv Remote\n"
        "file:///tmp Tmp\n"
    );

    ASSERT_TRUE(result.bookmarks);
    EXPECT_EQ(*result.bookmarks, makeList({{"file:///tmp", "Tmp"}}));
    ASSERT_EQ(result.warnings.size(), (size_t)1);
    EXPECT_EQ(result.warnings[0].position, (size_t)1);
    EXPECT_EQ(result.warnings[0].kind, DiagnosticKind::MalformedLocation);
}

TEST(GtkCodecTest, DecodeDuplicateKeepsLast) {
    shared_ptr<GtkCodec> codec = GtkCodec::create(Home);
    DecodeResult result = codec->decode(
        "file:///a A\n"
        "file:///b B\n"
        "/a/ Second A\n"
    );

    ASSERT_TRUE(result.bookmarks);
    EXPECT_EQ(
        *result.bookmarks,
        makeList({{"file:///b", "B"}, {"file:///a", "Second A"}})
    );
    ASSERT_EQ(result.warnings.size(), (size_t)1);
    EXPECT_EQ(result.warnings[0].position, (size_t)3);
    EXPECT_EQ(result.warnings[0].kind, DiagnosticKind::DuplicateLocation);
}

TEST(GtkCodecTest, DecodeEmptyDocument) {
    shared_ptr<GtkCodec> codec = GtkCodec::create(Home);
    DecodeResult result = codec->decode("");
    ASSERT_TRUE(result.bookmarks);
    EXPECT_TRUE(result.bookmarks->empty());
    EXPECT_TRUE(result.warnings.empty());
}

TEST(GtkCodecTest, Encode) {
    shared_ptr<GtkCodec> codec = GtkCodec::create(Home);
    EXPECT_EQ(
        codec->encode(makeList({
            {"file:///tmp", "Tmp"},
            {"file:///home/user/My%20Music", ""},
            {"file:///srv", "Line\nbreak"}
        })),
        "file:///tmp Tmp\n"
        "file:///home/user/My%20Music\n"
        "file:///srv Line break\n"
    );
    EXPECT_EQ(codec->encode(BookmarkList()), "");
}

TEST(GtkCodecTest, RoundTrip) {
    shared_ptr<GtkCodec> codec = GtkCodec::create(Home);
    vector<BookmarkList> lists = {
        BookmarkList(),
        makeList({{"file:///home/user/Documents", "Documents"}}),
        makeList({
            {"file:///tmp/a%2Cb%20c", "a,b c"},
            {"file:///", "Root"},
            {"file:///home/user/%C3%A4", "\xc3\xa4 folder"}
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
