#include "kde_codec.hpp"

#include <gtest/gtest.h>

namespace bookmarksync {

namespace {

const string Home = "/home/user";

const string PlacesWithSystemItems = R"(<?xml version="1.0" encoding="UTF-8"?>
<!DOCTYPE xbel>
<xbel xmlns:bookmark="http://www.freedesktop.org/standards/desktop-bookmarks" xmlns:kdepriv="http://www.kde.org/kdepriv" xmlns:mime="http://www.freedesktop.org/standards/shared-mime-info">
 <bookmark href="file:///home/user">
  <title>Home</title>
  <info>
   <metadata owner="http://freedesktop.org">
    <bookmark:icon name="user-home"/>
   </metadata>
   <metadata owner="http://www.kde.org">
    <ID>1580000000/0</ID>
    <isSystemItem>true</isSystemItem>
   </metadata>
  </info>
 </bookmark>
 <bookmark href="file:///home/user/Projects">
  <title>Projects</title>
  <info>
   <metadata owner="http://www.kde.org"/>
  </info>
 </bookmark>
 <separator/>
 <bookmark href="trash:/">
  <title>Trash</title>
  <info>
   <metadata owner="http://www.kde.org">
    <isSystemItem>true</isSystemItem>
   </metadata>
  </info>
 </bookmark>
</xbel>
)";

BookmarkList makeList(const vector<Bookmark>& bookmarks) {
    BookmarkList list;
    for(const Bookmark& bookmark : bookmarks) {
        list.add(bookmark);
    }
    return list;
}

size_t countOccurrences(const string& str, const string& substr) {
    size_t count = 0;
    size_t pos = str.find(substr);
    while(pos != string::npos) {
        ++count;
        pos = str.find(substr, pos + substr.size());
    }
    return count;
}

}

TEST(KdeCodecTest, DecodeSkipsSystemItems) {
    shared_ptr<KdeCodec> codec = KdeCodec::create(Home);
    DecodeResult result = codec->decode(PlacesWithSystemItems);

    ASSERT_TRUE(result.bookmarks);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(
        *result.bookmarks,
        makeList({{"file:///home/user/Projects", "Projects"}})
    );
}

TEST(KdeCodecTest, DecodeEntryErrors) {
    shared_ptr<KdeCodec> codec = KdeCodec::create(Home);
    DecodeResult result = codec->decode(
        "<xbel>"
        "<bookmark><title>No href</title></bookmark>"
        "<bookmark href=\"smb://server/share\"><title>Remote</title></bookmark>"
        "<bookmark href=\"file:///home/user/My%20Music\"/>"
        "<bookmark href=\"/tmp\"><title>  </title></bookmark>"
        "</xbel>"
    );

    ASSERT_TRUE(result.bookmarks);
    EXPECT_EQ(
        *result.bookmarks,
        makeList({
            {"file:///home/user/My%20Music", "My Music"},
            {"file:///tmp", "tmp"}
        })
    );
    ASSERT_EQ(result.warnings.size(), (size_t)2);
    EXPECT_EQ(result.warnings[0].position, (size_t)1);
    EXPECT_EQ(result.warnings[0].kind, DiagnosticKind::MalformedLocation);
    EXPECT_EQ(result.warnings[1].position, (size_t)2);
    EXPECT_EQ(result.warnings[1].kind, DiagnosticKind::MalformedLocation);
}

TEST(KdeCodecTest, DecodeMalformedDocument) {
    shared_ptr<KdeCodec> codec = KdeCodec::create(Home);

    DecodeResult truncated = codec->decode("<xbel><bookmark href=\"file:///tmp\">");
    EXPECT_FALSE(truncated.bookmarks);
    EXPECT_FALSE(truncated.error.empty());

    DecodeResult wrongRoot = codec->decode("<html><body/></html>");
    EXPECT_FALSE(wrongRoot.bookmarks);
    EXPECT_FALSE(wrongRoot.error.empty());

    DecodeResult empty = codec->decode("");
    EXPECT_FALSE(empty.bookmarks);
}

TEST(KdeCodecTest, Encode) {
    shared_ptr<KdeCodec> codec = KdeCodec::create(Home);
    string text = codec->encode(makeList({
        {"file:///tmp", "Tmp & Co"},
        {"file:///srv", ""}
    }));

    EXPECT_NE(text.find("<!DOCTYPE xbel PUBLIC"), string::npos);
    EXPECT_NE(text.find("xmlns:bookmark=\"http://www.freedesktop.org/standards/desktop-bookmarks\""), string::npos);
    EXPECT_NE(text.find("<bookmark href=\"file:///tmp\">"), string::npos);
    EXPECT_NE(text.find("<title>Tmp &amp; Co</title>"), string::npos);
    EXPECT_NE(text.find("<title>srv</title>"), string::npos);
    EXPECT_EQ(countOccurrences(text, "<metadata owner=\"http://www.kde.org\"/>"), (size_t)2);
}

TEST(KdeCodecTest, EncodeKeepsSystemItemsOfPreviousFile) {
    shared_ptr<KdeCodec> codec = KdeCodec::create(Home);
    BookmarkList list = makeList({{"file:///tmp", "Tmp"}});
    string errorMsg;
    optional<string> encoded = codec->encode(list, PlacesWithSystemItems, errorMsg);
    ASSERT_TRUE(encoded);
    string text = *encoded;

    EXPECT_EQ(countOccurrences(text, "<isSystemItem>true</isSystemItem>"), (size_t)2);
    EXPECT_EQ(countOccurrences(text, "href=\"trash:/\""), (size_t)1);
    EXPECT_EQ(text.find("Projects"), string::npos);

    DecodeResult result = codec->decode(text);
    ASSERT_TRUE(result.bookmarks);
    EXPECT_EQ(*result.bookmarks, list);
    EXPECT_TRUE(result.warnings.empty());

    // Encoding again over the result does not change it.
    optional<string> again = codec->encode(list, text, errorMsg);
    ASSERT_TRUE(again);
    EXPECT_EQ(*again, text);
}

TEST(KdeCodecTest, EncodeDoesNotRepeatSystemPlaces) {
    shared_ptr<KdeCodec> codec = KdeCodec::create(Home);
    BookmarkList list = makeList({
        {"file:///home/user", "My home"},
        {"file:///tmp", "Tmp"}
    });
    string errorMsg;
    optional<string> text = codec->encode(list, PlacesWithSystemItems, errorMsg);
    ASSERT_TRUE(text);

    EXPECT_EQ(countOccurrences(*text, "href=\"file:///home/user\""), (size_t)1);
    EXPECT_EQ(text->find("My home"), string::npos);
    EXPECT_EQ(countOccurrences(*text, "href=\"file:///tmp\""), (size_t)1);

    DecodeResult result = codec->decode(*text);
    ASSERT_TRUE(result.bookmarks);
    EXPECT_EQ(*result.bookmarks, makeList({{"file:///tmp", "Tmp"}}));
}

TEST(KdeCodecTest, EncodeRefusesUnparseablePreviousFile) {
    shared_ptr<KdeCodec> codec = KdeCodec::create(Home);
    BookmarkList list = makeList({{"file:///tmp", "Tmp"}});
    string errorMsg;
    EXPECT_FALSE(codec->encode(list, string("<xbel"), errorMsg));
    EXPECT_NE(errorMsg.find("cannot be parsed"), string::npos);

    EXPECT_FALSE(codec->encode(list, string("<foo/>"), errorMsg));
}

TEST(KdeCodecTest, RoundTrip) {
    shared_ptr<KdeCodec> codec = KdeCodec::create(Home);
    vector<BookmarkList> lists = {
        BookmarkList(),
        makeList({{"file:///home/user/Documents", "Documents"}}),
        makeList({
            {"file:///tmp/a%2Cb%20c", "a,b c"},
            {"file:///", "<Root>"},
            {"file:///home/user/%C3%A4", "\xc3\xa4 \"quoted\""}
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
