#pragma once

#include "codec.hpp"

namespace bookmarksync {

// GTK bookmarks file (~/.config/gtk-3.0/bookmarks): one bookmark per line,
// the location optionally followed by a space and a label.
class GtkCodec : public BookmarkCodec {
SHARED_ONLY_CLASS(GtkCodec);
public:
    GtkCodec(CKey, string baseDir);

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
