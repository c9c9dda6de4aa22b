#pragma once

#include "common.hpp"

namespace bookmarksync {

// In-memory INI document that keeps groups and keys in file order. Keys that
// appear before the first group header belong to the group with empty name.
// Values of keys that are not modified are written back exactly as they were
// read.
class IniFile {
SHARED_ONLY_CLASS(IniFile);
public:
    IniFile(CKey);

    // Returns empty pointer and sets errorMsg if text contains a malformed
    // group header or a line that is not a comment, a group header or a
    // key=value pair.
    static shared_ptr<IniFile> parse(const string& text, string& errorMsg);

    bool hasGroup(const string& group) const;

    // Keys of given group in file order.
    vector<string> keys(const string& group) const;

    // Returns the value with surrounding quotes and escapes removed.
    optional<string> get(const string& group, const string& key) const;

    // Replaces the value of an existing key in place, or appends the key to
    // the end of the group (which is appended to the document if it does not
    // exist yet).
    void set(const string& group, const string& key, const string& value);

    // Like set, but stores value as-is without quoting. value must not
    // contain a line break.
    void setRaw(const string& group, const string& key, const string& value);

    // Removes the keys of given group for which pred returns true.
    void removeKeys(const string& group, function<bool(const string&)> pred);

    string serialize() const;

private:
    struct Entry {
        string key;
        string rawValue;
    };
    struct Group {
        string name;
        vector<Entry> entries;
    };

    const Group* findGroup_(const string& name) const;
    Group& groupForWrite_(const string& name);

    vector<Group> groups_;
};

}
