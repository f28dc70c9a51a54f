#include "io/file_result.h"

#include <cerrno>

FileErrorKind fileErrorKindFromErrno(int err) {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return FileErrorKind::NotFound;
        case EACCES:
        case EPERM:
            return FileErrorKind::AccessDenied;
        case EISDIR:
            return FileErrorKind::IsDirectory;
        case ENAMETOOLONG:
            return FileErrorKind::NameTooLong;
        default:
            return FileErrorKind::IOError;
    }
}

const char* describeFileError(FileErrorKind kind) {
    switch (kind) {
        case FileErrorKind::NotFound:     return "No such file or directory";
        case FileErrorKind::AccessDenied: return "Permission denied";
        case FileErrorKind::IsDirectory:  return "Is a directory";
        case FileErrorKind::NameTooLong:  return "File name too long";
        case FileErrorKind::IOError:      return "I/O error";
    }
    return "I/O error";
}
