#include "kde_codec.hpp"

#include "xml_document.hpp"

namespace bookmarksync {

namespace {

const string XbelRoot = "xbel";
const string XbelPublicID =
    "+//IDN python.org//DTD XML Bookmark Exchange Language 1.0//EN//XML";
const string XbelSystemID = "http://www.python.org/topics/xml/dtds/xbel-1.0.dtd";
const string MetadataOwner = "http://www.kde.org";

// Namespaces declared by KDE on the root element; system places refer to them.
const vector<pair<string, string>> XbelNamespaces = {
    {"bookmark", "http://www.freedesktop.org/standards/desktop-bookmarks"},
    {"kdepriv", "http://www.kde.org/kdepriv"},
    {"mime", "http://www.freedesktop.org/standards/shared-mime-info"}
};

bool isSystemItem(XmlNode bookmark) {
    XmlNode info = firstChildElement(bookmark, "info");
    if(info == nullptr) {
        return false;
    }
    for(XmlNode metadata : childElements(info)) {
        if(
            elementName(metadata) == "metadata" &&
            firstChildElement(metadata, "isSystemItem") != nullptr
        ) {
            return true;
        }
    }
    return false;
}

// Returns empty pointer and sets errorMsg if text is not an XBEL document.
shared_ptr<XmlDocument> parseXbel(const string& text, string& errorMsg) {
    shared_ptr<XmlDocument> doc = XmlDocument::parse(text, errorMsg);
    if(!doc) {
        return {};
    }
    string rootName = elementName(doc->root());
    if(rootName != XbelRoot) {
        errorMsg = "Root element is '" + rootName + "', expected '" + XbelRoot + "'";
        return {};
    }
    return doc;
}

}

KdeCodec::KdeCodec(CKey, string baseDir)
    : baseDir_(move(baseDir))
{}

BookmarkFormat KdeCodec::format() const {
    return BookmarkFormat::Kde;
}

DecodeResult KdeCodec::decode(const string& text) {
    string errorMsg;
    shared_ptr<XmlDocument> doc = parseXbel(text, errorMsg);
    if(!doc) {
        return DecodeResult::malformedDocument(errorMsg);
    }

    DecodeResult result;
    result.bookmarks = BookmarkList();

    size_t position = 0;
    for(XmlNode node : childElements(doc->root())) {
        if(elementName(node) != "bookmark") {
            continue;
        }
        ++position;
        if(isSystemItem(node)) {
            continue;
        }

        optional<string> href = elementAttribute(node, "href");
        optional<string> location;
        if(href) {
            location = canonicalizeLocation(*href, baseDir_);
        }
        if(!location) {
            result.addMalformedLocation(position, href.value_or(""));
            continue;
        }

        string label;
        XmlNode title = firstChildElement(node, "title");
        if(title != nullptr) {
            label = sanitizeLabel(elementText(title));
        }
        if(label.empty()) {
            label = deriveLabel(*location);
        }
        result.addBookmark(position, {move(*location), move(label)});
    }

    return result;
}

optional<string> KdeCodec::encode(
    const BookmarkList& list,
    const optional<string>& previous,
    string& errorMsg
) {
    shared_ptr<XmlDocument> doc = XmlDocument::createWithRoot(XbelRoot);
    doc->setDoctype(XbelRoot, XbelPublicID, XbelSystemID);

    XmlNode root = doc->root();
    for(const pair<string, string>& ns : XbelNamespaces) {
        doc->declareNamespace(root, ns.first, ns.second);
    }

    // Locations of the system places, which are not repeated as user
    // bookmarks.
    set<string> systemLocations;
    if(previous) {
        shared_ptr<XmlDocument> previousDoc = parseXbel(*previous, errorMsg);
        if(!previousDoc) {
            errorMsg = "Existing places file cannot be parsed: " + errorMsg;
            optional<string> empty;
            return empty;
        }
        for(XmlNode node : childElements(previousDoc->root())) {
            if(elementName(node) == "bookmark" && isSystemItem(node)) {
                doc->appendCopy(root, node);
                if(optional<string> href = elementAttribute(node, "href")) {
                    if(optional<string> location = canonicalizeLocation(*href, baseDir_)) {
                        systemLocations.insert(*location);
                    }
                }
            }
        }
    }

    for(const Bookmark& bookmark : list) {
        if(systemLocations.count(bookmark.location)) {
            INFO_LOG(
                "Not adding bookmark ", bookmark.location,
                " to KDE places, it is already a system place"
            );
            continue;
        }
        XmlNode node = doc->appendElement(root, "bookmark");
        doc->setAttribute(node, "href", bookmark.location);
        doc->appendElement(node, "title", effectiveLabel(bookmark));
        XmlNode info = doc->appendElement(node, "info");
        XmlNode metadata = doc->appendElement(info, "metadata");
        doc->setAttribute(metadata, "owner", MetadataOwner);
    }

    return doc->serialize();
}

}
