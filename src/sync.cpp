#include "sync.hpp"

#include "atomic_file.hpp"
#include "paths.hpp"

#include <cerrno>

namespace bookmarksync {

namespace {

TargetReport syncTarget(
    BookmarkFormat format,
    const string& baseDir,
    const BookmarkList& bookmarks
) {
    TargetReport report;
    report.format = format;
    report.path = formatPath(format, baseDir);

    auto fail = [&](SyncError error, string msg) {
        ERROR_LOG(
            "Writing ", formatName(format), " bookmarks to '", report.path,
            "' failed: ", msg
        );
        report.status = TargetStatus::Failed;
        report.error = error;
        report.message = move(msg);
        return report;
    };

    string errorMsg;
    int errorCode = 0;
    if(!ensureDirExists(parentDirPath(report.path), errorMsg, errorCode)) {
        if(errorCode == EACCES || errorCode == EPERM || errorCode == EROFS) {
            ERROR_LOG(
                "Skipping ", formatName(format), " bookmarks in '", report.path,
                "': ", errorMsg
            );
            report.status = TargetStatus::Skipped;
            report.error = SyncError::FilesystemError;
            report.message = move(errorMsg);
            return report;
        }
        return fail(SyncError::FilesystemError, errorMsg);
    }

    optional<string> previous;
    if(pathExists(report.path)) {
        previous = readFile(report.path, errorMsg);
        if(!previous) {
            return fail(SyncError::FilesystemError, errorMsg);
        }
    }

    shared_ptr<BookmarkCodec> codec = createCodec(format, baseDir);
    optional<string> content = codec->encode(bookmarks, previous, errorMsg);
    if(!content) {
        return fail(SyncError::MalformedDocument, errorMsg);
    }

    report.status = TargetStatus::Written;

    if(previous && *previous == *content) {
        INFO_LOG(
            "Bookmarks in '", report.path, "' are already up to date, "
            "leaving the file untouched"
        );
        report.unchanged = true;
        return report;
    }

    if(!writeFileAtomically(report.path, *content, errorMsg)) {
        return fail(SyncError::FilesystemError, errorMsg);
    }

    INFO_LOG("Wrote ", bookmarks.size(), " bookmarks to '", report.path, "'");
    return report;
}

}

const char* targetStatusName(TargetStatus status) {
    if(status == TargetStatus::Written) {
        return "Written";
    } else if(status == TargetStatus::Skipped) {
        return "Skipped";
    } else {
        REQUIRE(status == TargetStatus::Failed);
        return "Failed";
    }
}

bool SyncReport::ok() const {
    if(error) {
        return false;
    }
    for(const TargetReport& target : targets) {
        if(target.status != TargetStatus::Written) {
            return false;
        }
    }
    return true;
}

SyncReport syncBookmarks(BookmarkFormat source, const string& baseDir) {
    SyncReport report;
    report.source = source;
    report.sourcePath = formatPath(source, baseDir);

    auto fatal = [&](SyncError error, string msg) {
        ERROR_LOG("Sync from ", formatName(source), " aborted: ", msg);
        report.error = error;
        report.errorMessage = move(msg);
        return report;
    };

    if(!pathExists(report.sourcePath)) {
        return fatal(
            SyncError::SourceMissing,
            "Source file '" + report.sourcePath + "' does not exist"
        );
    }

    string errorMsg;
    optional<string> text = readFile(report.sourcePath, errorMsg);
    if(!text) {
        return fatal(SyncError::FilesystemError, errorMsg);
    }

    shared_ptr<BookmarkCodec> codec = createCodec(source, baseDir);
    DecodeResult decoded = codec->decode(*text);
    if(!decoded.bookmarks) {
        return fatal(
            SyncError::MalformedDocument,
            "Source file '" + report.sourcePath + "' is malformed: " + decoded.error
        );
    }

    for(const Diagnostic& diagnostic : decoded.warnings) {
        WARNING_LOG("'", report.sourcePath, "' ", diagnostic);
    }
    report.warnings = move(decoded.warnings);
    report.bookmarkCount = decoded.bookmarks->size();

    INFO_LOG(
        "Read ", report.bookmarkCount, " bookmarks from '", report.sourcePath, "'"
    );

    for(BookmarkFormat format : allFormats()) {
        if(format != source) {
            report.targets.push_back(syncTarget(format, baseDir, *decoded.bookmarks));
        }
    }

    return report;
}

}
