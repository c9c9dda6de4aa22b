#pragma once

#include "common.hpp"

extern "C" {
struct _xmlDoc;
struct _xmlNode;
}

namespace bookmarksync {

typedef _xmlNode* XmlNode;

// Owning wrapper around a libxml2 document tree. Nodes returned by the
// functions below are owned by the document and are valid as long as it
// exists.
class XmlDocument {
SHARED_ONLY_CLASS(XmlDocument);
public:
    XmlDocument(CKey, _xmlDoc* doc);
    ~XmlDocument();

    // Returns empty pointer and sets errorMsg if text is not a well-formed XML
    // document. External entities, DTDs and network access are not loaded.
    static shared_ptr<XmlDocument> parse(const string& text, string& errorMsg);

    // Creates a document containing only an empty root element.
    static shared_ptr<XmlDocument> createWithRoot(const string& rootName);

    XmlNode root();

    void setDoctype(const string& name, const string& publicID, const string& systemID);

    // Appends a new child element to parent; text is escaped.
    XmlNode appendElement(XmlNode parent, const string& name, const string& text = "");

    void setAttribute(XmlNode node, const string& name, const string& value);

    void declareNamespace(XmlNode node, const string& prefix, const string& href);

    // Appends a deep copy of node (which may belong to another document) to
    // parent.
    void appendCopy(XmlNode parent, XmlNode node);

    // Serializes the document as indented UTF-8.
    string serialize();

private:
    _xmlDoc* doc_;
};

// Local name of an element, without namespace prefix.
string elementName(XmlNode node);

optional<string> elementAttribute(XmlNode node, const string& name);

// Concatenated text content of node and its descendants.
string elementText(XmlNode node);

vector<XmlNode> childElements(XmlNode node);

// Returns nullptr if node has no child element with given local name.
XmlNode firstChildElement(XmlNode node, const string& name);

}
