#pragma once

#include "codec.hpp"

namespace bookmarksync {

// KDE places file (~/.local/share/user-places.xbel) in the XML Bookmark
// Exchange Language. Places provided by the desktop itself (marked with an
// isSystemItem metadata element) are not user bookmarks: decoding skips them
// and encoding copies them over from the previous file content. A user
// bookmark with the location of such a place is not written a second time.
class KdeCodec : public BookmarkCodec {
SHARED_ONLY_CLASS(KdeCodec);
public:
    KdeCodec(CKey, string baseDir);

    using BookmarkCodec::encode;

    virtual BookmarkFormat format() const override;
    virtual DecodeResult decode(const string& text) override;
    virtual optional<string> encode(
        const BookmarkList& list,
        const optional<string>& previous,
        string& errorMsg
    ) override;

private:
    string baseDir_;
};

}
