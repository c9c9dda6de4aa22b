#include "bookmark.hpp"

#include <gtest/gtest.h>

namespace bookmarksync {

namespace {

const string Home = "/home/user";

string canonical(const string& raw) {
    return canonicalizeLocation(raw, Home).value_or("<malformed>");
}

}

TEST(CanonicalizeLocationTest, AbsolutePath) {
    EXPECT_EQ(canonical("/home/user/Documents"), "file:///home/user/Documents");
    EXPECT_EQ(canonical("  /tmp  "), "file:///tmp");
    EXPECT_EQ(canonical("/"), "file:///");
}

TEST(CanonicalizeLocationTest, FileURI) {
    EXPECT_EQ(canonical("file:///home/user/Documents"), "file:///home/user/Documents");
    EXPECT_EQ(canonical("file:///home/user/Documents/"), "file:///home/user/Documents");
    EXPECT_EQ(canonical("file://localhost/tmp"), "file:///tmp");
    EXPECT_EQ(canonical("FILE:///tmp"), "file:///tmp");
}

TEST(CanonicalizeLocationTest, LexicalNormalization) {
    EXPECT_EQ(canonical("/a/./b/../c//d/"), "file:///a/c/d");
    EXPECT_EQ(canonical("/../a"), "file:///a");
    EXPECT_EQ(canonical("file:///a/b/.."), "file:///a");
    EXPECT_EQ(canonical("\\srv\\share"), "file:///srv/share");
}

TEST(CanonicalizeLocationTest, PercentEncoding) {
    EXPECT_EQ(canonical("/home/user/My Documents"), "file:///home/user/My%20Documents");
    EXPECT_EQ(canonical("file:///home/user/My%20Documents"), "file:///home/user/My%20Documents");
    EXPECT_EQ(canonical("file:///tmp/a%2cb"), "file:///tmp/a%2Cb");
    EXPECT_EQ(canonical("file:///tmp/%7Euser"), "file:///tmp/~user");
    EXPECT_EQ(canonical("/tmp/\xc3\xa4"), "file:///tmp/%C3%A4");
}

TEST(CanonicalizeLocationTest, TildeExpansion) {
    EXPECT_EQ(canonical("~"), "file:///home/user");
    EXPECT_EQ(canonical("~/Music"), "file:///home/user/Music");
    EXPECT_FALSE(canonicalizeLocation("~otheruser/Music", Home));
    EXPECT_FALSE(canonicalizeLocation("~/Music", ""));
}

TEST(CanonicalizeLocationTest, Malformed) {
    EXPECT_FALSE(canonicalizeLocation("", Home));
    EXPECT_FALSE(canonicalizeLocation("   ", Home));
    EXPECT_FALSE(canonicalizeLocation("relative/path", Home));
    EXPECT_FALSE(canonicalizeLocation("sftp://host/srv", Home));
    EXPECT_FALSE(canonicalizeLocation("trash:/", Home));
    EXPECT_FALSE(canonicalizeLocation("file://otherhost/tmp", Home));
    EXPECT_FALSE(canonicalizeLocation("file://tmp", Home));
    EXPECT_FALSE(canonicalizeLocation("file:///tmp/%zz", Home));
    EXPECT_FALSE(canonicalizeLocation("file:///tmp/%4", Home));
    EXPECT_FALSE(canonicalizeLocation("file:///tmp/%00x", Home));
}

TEST(CanonicalizeLocationTest, Idempotent) {
    vector<string> inputs = {
        "/home/user/My Documents",
        "~/a,b",
        "file:///tmp/%C3%A4/x",
        "/a/./b/../c",
        "/"
    };
    for(const string& input : inputs) {
        string once = canonical(input);
        EXPECT_EQ(canonical(once), once) << "input: " << input;
    }
}

TEST(DeriveLabelTest, LastSegment) {
    EXPECT_EQ(deriveLabel("file:///home/user/Documents"), "Documents");
    EXPECT_EQ(deriveLabel("file:///home/user/My%20Documents"), "My Documents");
    EXPECT_EQ(deriveLabel("file:///"), "file:///");
}

TEST(SanitizeLabelTest, ControlCharactersAndInvalidUTF8) {
    EXPECT_EQ(sanitizeLabel("  a\tb\n "), "a b");
    EXPECT_EQ(sanitizeLabel("ok\xff"), "ok");
    EXPECT_EQ(sanitizeLabel("\xc3\xa4iti"), "\xc3\xa4iti");
    EXPECT_EQ(sanitizeLabel(""), "");
}

TEST(EffectiveLabelTest, FallsBackToDerivedLabel) {
    EXPECT_EQ(effectiveLabel({"file:///tmp/x", "X"}), "X");
    EXPECT_EQ(effectiveLabel({"file:///tmp/x", ""}), "x");
    EXPECT_EQ(effectiveLabel({"file:///tmp/x", " \n"}), "x");
}

TEST(PercentDecodeTest, Basic) {
    EXPECT_EQ(percentDecode("a%20b").value_or("<error>"), "a b");
    EXPECT_EQ(percentDecode("%41%42c").value_or("<error>"), "ABc");
    EXPECT_FALSE(percentDecode("%"));
    EXPECT_FALSE(percentDecode("%g0"));
}

TEST(BookmarkListTest, KeepsInsertionOrder) {
    BookmarkList list;
    EXPECT_TRUE(list.empty());
    EXPECT_FALSE(list.add({"file:///b", "B"}));
    EXPECT_FALSE(list.add({"file:///a", "A"}));
    ASSERT_EQ(list.size(), (size_t)2);
    EXPECT_EQ(list.items()[0].location, "file:///b");
    EXPECT_EQ(list.items()[1].location, "file:///a");
    EXPECT_TRUE(list.contains("file:///a"));
    EXPECT_FALSE(list.contains("file:///c"));
}

TEST(BookmarkListTest, LastDuplicateWins) {
    BookmarkList list;
    list.add({"file:///a", "First"});
    list.add({"file:///b", "B"});
    EXPECT_TRUE(list.add({"file:///a", "Second"}));

    ASSERT_EQ(list.size(), (size_t)2);
    EXPECT_EQ(list.items()[0], (Bookmark{"file:///b", "B"}));
    EXPECT_EQ(list.items()[1], (Bookmark{"file:///a", "Second"}));
}

TEST(BookmarkListTest, Equality) {
    BookmarkList a;
    a.add({"file:///a", "A"});
    a.add({"file:///b", "B"});

    BookmarkList b;
    b.add({"file:///b", "B"});
    b.add({"file:///a", "A"});

    EXPECT_NE(a, b);
    b.add({"file:///b", "B"});
    EXPECT_EQ(a, b);
}

}
