#include "xml_document.hpp"

#include <climits>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

namespace bookmarksync {

namespace {

const xmlChar* toXmlStr(const string& str) {
    return reinterpret_cast<const xmlChar*>(str.c_str());
}

// xmlChar*s are UTF-8, so this cast is safe.
string fromXmlStr(const xmlChar* str) {
    if(str == nullptr) {
        return string();
    }
    return string(reinterpret_cast<const char*>(str));
}

}

XmlDocument::XmlDocument(CKey, _xmlDoc* doc) {
    REQUIRE(doc != nullptr);
    doc_ = doc;
}

XmlDocument::~XmlDocument() {
    xmlFreeDoc(doc_);
}

shared_ptr<XmlDocument> XmlDocument::parse(const string& text, string& errorMsg) {
    if(text.size() > (size_t)INT_MAX) {
        errorMsg = "Document too large";
        return {};
    }

    xmlParserCtxtPtr ctxt = xmlNewParserCtxt();
    REQUIRE(ctxt != nullptr);

    xmlDocPtr doc = xmlCtxtReadMemory(
        ctxt,
        text.data(),
        (int)text.size(),
        nullptr,
        nullptr,
        XML_PARSE_NONET | XML_PARSE_NOBLANKS | XML_PARSE_NOERROR | XML_PARSE_NOWARNING
    );

    if(doc == nullptr) {
        const xmlError* err = xmlCtxtGetLastError(ctxt);
        if(err != nullptr && err->message != nullptr) {
            errorMsg = trimStr(err->message) + " (line " + toString(err->line) + ")";
        } else {
            errorMsg = "Unknown XML parse error";
        }
        xmlFreeParserCtxt(ctxt);
        return {};
    }
    xmlFreeParserCtxt(ctxt);

    if(xmlDocGetRootElement(doc) == nullptr) {
        xmlFreeDoc(doc);
        errorMsg = "Document has no root element";
        return {};
    }

    return XmlDocument::create(doc);
}

shared_ptr<XmlDocument> XmlDocument::createWithRoot(const string& rootName) {
    xmlDocPtr doc = xmlNewDoc(BAD_CAST "1.0");
    REQUIRE(doc != nullptr);
    xmlNodePtr root = xmlNewDocNode(doc, nullptr, toXmlStr(rootName), nullptr);
    REQUIRE(root != nullptr);
    xmlDocSetRootElement(doc, root);
    return XmlDocument::create(doc);
}

XmlNode XmlDocument::root() {
    return xmlDocGetRootElement(doc_);
}

void XmlDocument::setDoctype(
    const string& name,
    const string& publicID,
    const string& systemID
) {
    REQUIRE(xmlGetIntSubset(doc_) == nullptr);
    REQUIRE(xmlCreateIntSubset(
        doc_, toXmlStr(name), toXmlStr(publicID), toXmlStr(systemID)
    ) != nullptr);
}

XmlNode XmlDocument::appendElement(XmlNode parent, const string& name, const string& text) {
    REQUIRE(parent != nullptr);
    xmlNodePtr node = xmlNewTextChild(
        parent,
        nullptr,
        toXmlStr(name),
        text.empty() ? nullptr : toXmlStr(text)
    );
    REQUIRE(node != nullptr);
    return node;
}

void XmlDocument::setAttribute(XmlNode node, const string& name, const string& value) {
    REQUIRE(node != nullptr);
    REQUIRE(xmlSetProp(node, toXmlStr(name), toXmlStr(value)) != nullptr);
}

void XmlDocument::declareNamespace(XmlNode node, const string& prefix, const string& href) {
    REQUIRE(node != nullptr);
    REQUIRE(xmlNewNs(node, toXmlStr(href), toXmlStr(prefix)) != nullptr);
}

void XmlDocument::appendCopy(XmlNode parent, XmlNode node) {
    REQUIRE(parent != nullptr);
    REQUIRE(node != nullptr);
    xmlNodePtr copy = xmlDocCopyNode(node, doc_, 1);
    REQUIRE(copy != nullptr);
    REQUIRE(xmlAddChild(parent, copy) != nullptr);
}

string XmlDocument::serialize() {
    xmlChar* buf = nullptr;
    int size = 0;
    xmlDocDumpFormatMemoryEnc(doc_, &buf, &size, "UTF-8", 1);
    REQUIRE(buf != nullptr);
    string ret(reinterpret_cast<const char*>(buf), (size_t)size);
    xmlFree(buf);
    return ret;
}

string elementName(XmlNode node) {
    REQUIRE(node != nullptr);
    return fromXmlStr(node->name);
}

optional<string> elementAttribute(XmlNode node, const string& name) {
    REQUIRE(node != nullptr);
    xmlChar* value = xmlGetProp(node, toXmlStr(name));
    if(value == nullptr) {
        optional<string> empty;
        return empty;
    }
    string ret = fromXmlStr(value);
    xmlFree(value);
    return ret;
}

string elementText(XmlNode node) {
    REQUIRE(node != nullptr);
    xmlChar* content = xmlNodeGetContent(node);
    string ret = fromXmlStr(content);
    if(content != nullptr) {
        xmlFree(content);
    }
    return ret;
}

vector<XmlNode> childElements(XmlNode node) {
    REQUIRE(node != nullptr);
    vector<XmlNode> ret;
    for(xmlNodePtr child = node->children; child != nullptr; child = child->next) {
        if(child->type == XML_ELEMENT_NODE) {
            ret.push_back(child);
        }
    }
    return ret;
}

XmlNode firstChildElement(XmlNode node, const string& name) {
    for(XmlNode child : childElements(node)) {
        if(elementName(child) == name) {
            return child;
        }
    }
    return nullptr;
}

}
