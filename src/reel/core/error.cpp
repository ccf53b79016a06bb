// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/error.hpp>
#include <reel/disk/error.hpp>

namespace reel::core {

bool is_retryable(const std::error_code& ec) noexcept {
    if (!ec) return false;

    if (ec.category() == transfer_errc_category()) {
        switch (static_cast<TransferErrc>(ec.value())) {
            case TransferErrc::invalid_url:
            case TransferErrc::invalid_task:
            case TransferErrc::invalid_config:
            case TransferErrc::finalize_failed:
            case TransferErrc::cancelled:
                return false;
            default:
                return true;
        }
    }

    if (ec.category() == disk::disk_errc_category()) {
        // A bad path or missing permission will not fix itself between attempts
        return ec != disk::DiskErrc::access_denied && ec != disk::DiskErrc::invalid_path;
    }

    return true;
}

} // namespace reel::core
