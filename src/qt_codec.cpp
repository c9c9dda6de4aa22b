#include "qt_codec.hpp"

#include "ini_file.hpp"

namespace bookmarksync {

namespace {

const string DialogGroup = "FileDialog";
const string ArrayName = "shortcuts";
const string ArrayPrefix = ArrayName + "\\";
const string SizeKey = ArrayPrefix + "size";

string entryKey(size_t index, const string& field) {
    return ArrayPrefix + toString(index) + "\\" + field;
}

bool isShortcutKey(const string& key) {
    return key == ArrayName || key.compare(0, ArrayPrefix.size(), ArrayPrefix) == 0;
}

}

QtCodec::QtCodec(CKey, string baseDir)
    : baseDir_(move(baseDir))
{}

BookmarkFormat QtCodec::format() const {
    return BookmarkFormat::Qt;
}

DecodeResult QtCodec::decode(const string& text) {
    string errorMsg;
    shared_ptr<IniFile> ini = IniFile::parse(text, errorMsg);
    if(!ini) {
        return DecodeResult::malformedDocument(errorMsg);
    }

    // Check that the indexed keys agree with the entry count before decoding
    // any entries.
    optional<size_t> count;
    if(optional<string> sizeStr = ini->get(DialogGroup, SizeKey)) {
        if(isNonEmptyNumericStr(*sizeStr)) {
            count = parseString<size_t>(*sizeStr);
        }
        if(!count) {
            return DecodeResult::malformedDocument(
                "Invalid entry count '" + *sizeStr + "' in " + SizeKey
            );
        }
    }
    for(const string& key : ini->keys(DialogGroup)) {
        if(key == ArrayName || key == SizeKey || !isShortcutKey(key)) {
            continue;
        }
        if(!count) {
            return DecodeResult::malformedDocument(
                "Key " + key + " present without " + SizeKey
            );
        }
        vector<string> parts = splitStr(key.substr(ArrayPrefix.size()), '\\', 1);
        optional<size_t> index;
        if(isNonEmptyNumericStr(parts[0])) {
            index = parseString<size_t>(parts[0]);
        }
        if(!index || *index < 1 || *index > *count) {
            return DecodeResult::malformedDocument(
                "Key " + key + " does not match entry count " + toString(*count)
            );
        }
    }

    DecodeResult result;
    result.bookmarks = BookmarkList();

    if(!count) {
        if(optional<string> legacyValue = ini->get(DialogGroup, ArrayName)) {
            decodeLegacyValue_(*legacyValue, result);
        }
        return result;
    }

    for(size_t index = 1; index <= *count; ++index) {
        optional<string> url = ini->get(DialogGroup, entryKey(index, "url"));
        if(!url) {
            return DecodeResult::malformedDocument(
                "Entry count is " + toString(*count) + " but " +
                entryKey(index, "url") + " is missing"
            );
        }

        optional<string> location = canonicalizeLocation(*url, baseDir_);
        if(!location) {
            result.addMalformedLocation(index, *url);
            continue;
        }

        string label = sanitizeLabel(
            ini->get(DialogGroup, entryKey(index, "label")).value_or("")
        );
        if(label.empty()) {
            label = deriveLabel(*location);
        }
        result.addBookmark(index, {move(*location), move(label)});
    }

    return result;
}

void QtCodec::decodeLegacyValue_(const string& value, DecodeResult& result) {
    if(trimStr(value) == "@Invalid()") {
        return;
    }

    size_t position = 0;
    for(const string& item : splitStr(value, ',')) {
        string rawLocation = trimStr(item);
        if(rawLocation.empty()) {
            continue;
        }
        ++position;

        optional<string> location = canonicalizeLocation(rawLocation, baseDir_);
        if(!location) {
            result.addMalformedLocation(position, rawLocation);
            continue;
        }
        string label = deriveLabel(*location);
        result.addBookmark(position, {move(*location), move(label)});
    }
}

optional<string> QtCodec::encode(
    const BookmarkList& list,
    const optional<string>& previous,
    string& errorMsg
) {
    shared_ptr<IniFile> ini;
    if(previous) {
        ini = IniFile::parse(*previous, errorMsg);
        if(!ini) {
            errorMsg = "Existing Qt settings file cannot be parsed: " + errorMsg;
            optional<string> empty;
            return empty;
        }
    } else {
        ini = IniFile::create();
    }

    ini->removeKeys(DialogGroup, isShortcutKey);

    // The file dialog reads the plain list; the array also carries the labels.
    string plainList;
    for(const Bookmark& bookmark : list) {
        if(!plainList.empty()) {
            plainList.append(", ");
        }
        plainList.append(bookmark.location);
    }
    ini->setRaw(DialogGroup, ArrayName, plainList);

    ini->set(DialogGroup, SizeKey, toString(list.size()));
    size_t index = 1;
    for(const Bookmark& bookmark : list) {
        ini->set(DialogGroup, entryKey(index, "url"), bookmark.location);
        ini->set(DialogGroup, entryKey(index, "label"), effectiveLabel(bookmark));
        ++index;
    }

    return ini->serialize();
}

}
