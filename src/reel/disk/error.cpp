// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/disk/error.hpp>
#include <cerrno>

namespace reel::disk {

std::error_code posix_error_to_error_code(int err) noexcept {
    switch (err) {
        case 0:             return {};
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:        return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:
        case EINVAL:        return make_error_code(DiskErrc::invalid_path);
        case EEXIST:        return make_error_code(DiskErrc::file_exists);
        case EXDEV:         return make_error_code(DiskErrc::rename_failed);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        default:            return make_error_code(DiskErrc::write_error);
    }
}

} // namespace reel::disk
