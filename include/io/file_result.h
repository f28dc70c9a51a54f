#pragma once

#include <optional>
#include <string>

#include "count/counts.h"

enum class FileErrorKind {
    NotFound,
    AccessDenied,
    IsDirectory,
    NameTooLong,
    IOError
};

struct FileError {
    std::string path;
    FileErrorKind kind;
};

// Outcome for one requested path. Failed results carry zero counts and are
// excluded from the aggregate total.
struct FileResult {
    Counts counts;
    std::optional<FileError> error;

    // Set on a repeated "-": stdin was already consumed by an earlier slot.
    bool duplicateStdin = false;

    bool ok() const { return !error.has_value(); }

    static FileResult success(const Counts& counts) {
        FileResult result;
        result.counts = counts;
        return result;
    }

    static FileResult failure(const std::string& path, FileErrorKind kind) {
        FileResult result;
        result.error = FileError{path, kind};
        return result;
    }
};

FileErrorKind fileErrorKindFromErrno(int err);
const char* describeFileError(FileErrorKind kind);
