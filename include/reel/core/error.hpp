// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace reel::core {

enum class TransferErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    dns_error,
    ssl_error,
    too_many_redirects,
    connection_lost,
    not_found,
    permission_denied,
    server_error,
    http_error,
    invalid_range,
    range_not_honored,
    write_failed,
    finalize_failed,
    invalid_url,
    invalid_task,
    invalid_config,
    cancelled,
};

namespace detail {

struct TransferErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "reel::transfer";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<TransferErrc>(ev)) {
            case TransferErrc::success:             return "Success";
            case TransferErrc::network_error:       return "Network error";
            case TransferErrc::timeout:             return "Operation timed out";
            case TransferErrc::refused:             return "Connection refused";
            case TransferErrc::dns_error:           return "DNS resolution failed";
            case TransferErrc::ssl_error:           return "SSL/TLS error";
            case TransferErrc::too_many_redirects:  return "Too many redirects";
            case TransferErrc::connection_lost:     return "Connection lost";
            case TransferErrc::not_found:           return "Resource not found (404)";
            case TransferErrc::permission_denied:   return "Access denied (401/403)";
            case TransferErrc::server_error:        return "Server error (5xx)";
            case TransferErrc::http_error:          return "Unexpected HTTP status";
            case TransferErrc::invalid_range:       return "Range not satisfiable (416)";
            case TransferErrc::range_not_honored:   return "Server did not honor range; restarting from 0";
            case TransferErrc::write_failed:        return "Write to temporary file failed";
            case TransferErrc::finalize_failed:     return "Could not promote temporary file";
            case TransferErrc::invalid_url:         return "Invalid URL";
            case TransferErrc::invalid_task:        return "Invalid transfer task";
            case TransferErrc::invalid_config:      return "Invalid configuration";
            case TransferErrc::cancelled:           return "Transfer cancelled";
            default:                                return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::TransferErrcCategory& transfer_errc_category() noexcept {
    static detail::TransferErrcCategory category;
    return category;
}

inline std::error_code make_error_code(TransferErrc e) noexcept {
    return {static_cast<int>(e), transfer_errc_category()};
}

// Whether another attempt may succeed where this one failed
[[nodiscard]] bool is_retryable(const std::error_code& ec) noexcept;

} // namespace reel::core

namespace std {

template<>
struct is_error_code_enum<reel::core::TransferErrc> : true_type {};

} // namespace std
