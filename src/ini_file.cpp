#include "ini_file.hpp"

namespace bookmarksync {

namespace {

bool valueNeedsQuotes(const string& value) {
    if(value.empty()) {
        return false;
    }
    if(
        isspace((unsigned char)value.front()) ||
        isspace((unsigned char)value.back()) ||
        value.front() == ';' ||
        value.front() == '#'
    ) {
        return true;
    }
    return value.find_first_of("\"\\,") != string::npos;
}

string quoteValue(const string& value) {
    if(!valueNeedsQuotes(value)) {
        return value;
    }
    string ret = "\"";
    for(char c : value) {
        if(c == '"' || c == '\\') {
            ret.push_back('\\');
        }
        ret.push_back(c);
    }
    ret.push_back('"');
    return ret;
}

string unquoteValue(const string& rawValue) {
    if(rawValue.size() < 2 || rawValue.front() != '"' || rawValue.back() != '"') {
        return rawValue;
    }
    string ret;
    for(size_t i = 1; i + 1 < rawValue.size(); ++i) {
        char c = rawValue[i];
        if(c == '\\' && i + 2 < rawValue.size()) {
            ++i;
            c = rawValue[i];
        }
        ret.push_back(c);
    }
    return ret;
}

}

IniFile::IniFile(CKey) {}

shared_ptr<IniFile> IniFile::parse(const string& text, string& errorMsg) {
    shared_ptr<IniFile> ini = IniFile::create();

    Group* current = nullptr;
    vector<string> lines = splitStr(stripUTF8BOM(text), '\n');
    for(size_t lineIdx = 0; lineIdx < lines.size(); ++lineIdx) {
        string line = trimStr(lines[lineIdx]);
        if(line.empty() || line[0] == ';' || line[0] == '#') {
            continue;
        }

        string lineDesc = "Line " + toString(lineIdx + 1);

        if(line[0] == '[') {
            if(line.back() != ']') {
                errorMsg = lineDesc + ": unterminated group header '" + line + "'";
                return {};
            }
            string name = trimStr(line.substr(1, line.size() - 2));
            if(name.empty()) {
                errorMsg = lineDesc + ": empty group name";
                return {};
            }
            current = &ini->groupForWrite_(name);
            continue;
        }

        size_t eq = line.find('=');
        if(eq == string::npos) {
            errorMsg = lineDesc + ": expected key=value, got '" + line + "'";
            return {};
        }
        string key = trimStr(line.substr(0, eq));
        if(key.empty()) {
            errorMsg = lineDesc + ": empty key";
            return {};
        }
        if(current == nullptr) {
            current = &ini->groupForWrite_("");
        }

        string rawValue = trimStr(line.substr(eq + 1));
        bool found = false;
        for(Entry& entry : current->entries) {
            if(entry.key == key) {
                entry.rawValue = rawValue;
                found = true;
                break;
            }
        }
        if(!found) {
            current->entries.push_back({key, rawValue});
        }
    }

    return ini;
}

bool IniFile::hasGroup(const string& group) const {
    return findGroup_(group) != nullptr;
}

vector<string> IniFile::keys(const string& group) const {
    vector<string> ret;
    if(const Group* g = findGroup_(group)) {
        for(const Entry& entry : g->entries) {
            ret.push_back(entry.key);
        }
    }
    return ret;
}

optional<string> IniFile::get(const string& group, const string& key) const {
    if(const Group* g = findGroup_(group)) {
        for(const Entry& entry : g->entries) {
            if(entry.key == key) {
                return unquoteValue(entry.rawValue);
            }
        }
    }
    optional<string> empty;
    return empty;
}

void IniFile::set(const string& group, const string& key, const string& value) {
    REQUIRE(value.find('\n') == string::npos);
    setRaw(group, key, quoteValue(value));
}

void IniFile::setRaw(const string& group, const string& key, const string& value) {
    REQUIRE(!key.empty());
    REQUIRE(key.find_first_of("=\n") == string::npos);
    REQUIRE(value.find('\n') == string::npos);

    Group& g = groupForWrite_(group);
    for(Entry& entry : g.entries) {
        if(entry.key == key) {
            entry.rawValue = value;
            return;
        }
    }
    g.entries.push_back({key, value});
}

void IniFile::removeKeys(const string& group, function<bool(const string&)> pred) {
    for(Group& g : groups_) {
        if(g.name == group) {
            g.entries.erase(
                remove_if(
                    g.entries.begin(),
                    g.entries.end(),
                    [&](const Entry& entry) { return pred(entry.key); }
                ),
                g.entries.end()
            );
        }
    }
}

string IniFile::serialize() const {
    stringstream ss;
    bool first = true;
    for(const Group& g : groups_) {
        if(g.name.empty() && g.entries.empty()) {
            continue;
        }
        if(!first) {
            ss << '\n';
        }
        first = false;

        if(!g.name.empty()) {
            ss << '[' << g.name << "]\n";
        }
        for(const Entry& entry : g.entries) {
            ss << entry.key << '=' << entry.rawValue << '\n';
        }
    }
    return ss.str();
}

const IniFile::Group* IniFile::findGroup_(const string& name) const {
    for(const Group& g : groups_) {
        if(g.name == name) {
            return &g;
        }
    }
    return nullptr;
}

IniFile::Group& IniFile::groupForWrite_(const string& name) {
    for(Group& g : groups_) {
        if(g.name == name) {
            return g;
        }
    }
    groups_.push_back({name, {}});
    return groups_.back();
}

}
