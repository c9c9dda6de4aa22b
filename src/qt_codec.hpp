#pragma once

#include "codec.hpp"

namespace bookmarksync {

// Qt file dialog settings (~/.config/QtProject.conf). The bookmarks are
// stored in the FileDialog group both as a plain list and as a QSettings
// array:
//
//   [FileDialog]
//   shortcuts=file:///home/user/Documents, file:///tmp
//   shortcuts\size=2
//   shortcuts\1\url=file:///home/user/Documents
//   shortcuts\1\label=Documents
//   shortcuts\2\url=file:///tmp
//   shortcuts\2\label=tmp
//
// The plain shortcuts list is what the Qt file dialog itself reads; it is
// always written along with the array. When decoding, the array is preferred
// and its label keys are optional; without the array, the plain list is
// decoded. Other groups and keys of the file are kept when encoding over a
// previous version of the file.
class QtCodec : public BookmarkCodec {
SHARED_ONLY_CLASS(QtCodec);
public:
    QtCodec(CKey, string baseDir);

    using BookmarkCodec::encode;

    virtual BookmarkFormat format() const override;
    virtual DecodeResult decode(const string& text) override;
    virtual optional<string> encode(
        const BookmarkList& list,
        const optional<string>& previous,
        string& errorMsg
    ) override;

private:
    void decodeLegacyValue_(const string& value, DecodeResult& result);

    string baseDir_;
};

}
