#include "ini_file.hpp"

#include <gtest/gtest.h>

namespace bookmarksync {

TEST(IniFileTest, ParseAndGet) {
    string errorMsg;
    shared_ptr<IniFile> ini = IniFile::parse(
        "top=1\n"
        "; comment\n"
        "[A]\n"
        "x = 2\n"
        "quoted=\"  spaced, \\\"value\\\"  \"\n"
        "[B]\n"
        "# another comment\n"
        "y=\n",
        errorMsg
    );
    ASSERT_TRUE(ini) << errorMsg;

    EXPECT_TRUE(ini->hasGroup(""));
    EXPECT_TRUE(ini->hasGroup("A"));
    EXPECT_TRUE(ini->hasGroup("B"));
    EXPECT_FALSE(ini->hasGroup("C"));

    EXPECT_EQ(ini->get("", "top").value_or("<missing>"), "1");
    EXPECT_EQ(ini->get("A", "x").value_or("<missing>"), "2");
    EXPECT_EQ(ini->get("A", "quoted").value_or("<missing>"), "  spaced, \"value\"  ");
    EXPECT_EQ(ini->get("B", "y").value_or("<missing>"), "");
    EXPECT_FALSE(ini->get("A", "y"));
    EXPECT_FALSE(ini->get("C", "x"));

    EXPECT_EQ(ini->keys("A"), (vector<string>{"x", "quoted"}));
}

TEST(IniFileTest, ParseErrors) {
    vector<string> documents = {
        "[Unterminated\n",
        "[]\n",
        "[A]\nno value\n",
        "[A]\n=value\n"
    };
    for(const string& document : documents) {
        string errorMsg;
        EXPECT_FALSE(IniFile::parse(document, errorMsg)) << document;
        EXPECT_FALSE(errorMsg.empty()) << document;
    }
}

TEST(IniFileTest, RepeatedGroupsAndKeysAreMerged) {
    string errorMsg;
    shared_ptr<IniFile> ini = IniFile::parse("[A]\nx=1\n[B]\ny=2\n[A]\nx=3\nz=4\n", errorMsg);
    ASSERT_TRUE(ini) << errorMsg;
    EXPECT_EQ(ini->get("A", "x").value_or("<missing>"), "3");
    EXPECT_EQ(ini->serialize(), "[A]\nx=3\nz=4\n\n[B]\ny=2\n");
}

TEST(IniFileTest, SerializeKeepsOrderAndRawValues) {
    string text =
        "top=1\n"
        "\n"
        "[A]\n"
        "x=\"a, b\"\n"
        "y=@Invalid()\n"
        "\n"
        "[B]\n"
        "z=3\n";
    string errorMsg;
    shared_ptr<IniFile> ini = IniFile::parse(text, errorMsg);
    ASSERT_TRUE(ini) << errorMsg;
    EXPECT_EQ(ini->serialize(), text);
}

TEST(IniFileTest, SetAndRemove) {
    shared_ptr<IniFile> ini = IniFile::create();
    ini->set("A", "x", "1");
    ini->set("A", "y", "a, b");
    ini->set("B", "z", " padded");
    ini->set("A", "x", "2");
    EXPECT_EQ(
        ini->serialize(),
        "[A]\n"
        "x=2\n"
        "y=\"a, b\"\n"
        "\n"
        "[B]\n"
        "z=\" padded\"\n"
    );
    EXPECT_EQ(ini->get("A", "y").value_or("<missing>"), "a, b");
    EXPECT_EQ(ini->get("B", "z").value_or("<missing>"), " padded");

    ini->removeKeys("A", [](const string& key) { return key != "y"; });
    EXPECT_EQ(ini->keys("A"), vector<string>{"y"});
    EXPECT_EQ(ini->keys("B"), vector<string>{"z"});
}

TEST(IniFileTest, SetRawStoresValueAsIs) {
    shared_ptr<IniFile> ini = IniFile::create();
    ini->setRaw("A", "list", "a, b");
    ini->set("A", "quoted", "a, b");
    EXPECT_EQ(
        ini->serialize(),
        "[A]\n"
        "list=a, b\n"
        "quoted=\"a, b\"\n"
    );
    EXPECT_EQ(ini->get("A", "list").value_or("<missing>"), "a, b");
}

TEST(IniFileTest, ParseSkipsByteOrderMark) {
    string errorMsg;
    shared_ptr<IniFile> ini = IniFile::parse(
        "\xEF\xBB\xBF[General]\nfontSize=12\n\n[FileDialog]\nviewMode=Detail\n",
        errorMsg
    );
    ASSERT_TRUE(ini) << errorMsg;
    EXPECT_TRUE(ini->hasGroup("General"));
    EXPECT_EQ(ini->get("General", "fontSize").value_or("<missing>"), "12");
    EXPECT_EQ(ini->get("FileDialog", "viewMode").value_or("<missing>"), "Detail");
}

TEST(IniFileTest, EmptyDocument) {
    string errorMsg;
    shared_ptr<IniFile> ini = IniFile::parse("", errorMsg);
    ASSERT_TRUE(ini) << errorMsg;
    EXPECT_FALSE(ini->hasGroup(""));
    EXPECT_EQ(ini->serialize(), "");
}

}
