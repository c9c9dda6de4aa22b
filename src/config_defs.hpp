#define CONF_FOREACH_OPT \
    CONF_FOREACH_OPT_ITEM(syncFrom) \
    CONF_FOREACH_OPT_ITEM(baseDir) \
    CONF_FOREACH_OPT_ITEM(quiet)

CONF_DEF_OPT_INFO(syncFrom) {
    const char* name = "sync-from";
    const char* valSpec = "BACKEND";
    string desc() {
        return
            "bookmark store to read the bookmarks from (gtk, kde or qt); "
            "the bookmarks of the other two stores are replaced with them";
    }
    string defaultVal() {
        return "";
    }
    string defaultValStr() {
        return "required";
    }
    bool validate(const string& val) {
        return (bool)parseFormatName(val);
    }
};

CONF_DEF_OPT_INFO(baseDir) {
    const char* name = "base-dir";
    const char* valSpec = "PATH";
    string desc() {
        return "absolute path to the directory under which the bookmark files of all stores are located";
    }
    string defaultVal() {
        return "";
    }
    string defaultValStr() {
        return "default: home directory";
    }
    bool validate(const string& val) {
        return !val.empty() && val[0] == '/';
    }
};

CONF_DEF_OPT_INFO(quiet) {
    const char* name = "quiet";
    const char* valSpec = "YES/NO";
    string desc() {
        return "if enabled, informational log messages are not shown; warnings and errors are still shown";
    }
    bool defaultVal() {
        return false;
    }
};
