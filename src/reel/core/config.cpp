// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/config.hpp>
#include <reel/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace reel::core {

namespace {

std::string trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return std::string(s);
}

std::chrono::milliseconds read_millis(const nlohmann::json& j, const char* key,
                                      std::chrono::milliseconds fallback) {
    if (!j.contains(key)) return fallback;
    return std::chrono::milliseconds{j[key].get<std::uint64_t>()};
}

// parseInt-like: leading digits only, anything else is 0
std::uint64_t parse_byte_count(std::string_view text) noexcept {
    std::uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') break;
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return value;
}

} // namespace

std::optional<std::string> process_env(std::string_view name) {
    const char* value = std::getenv(std::string(name).c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

std::expected<SessionConfig, std::error_code>
SessionConfig::from_json(std::string_view text) noexcept {
    try {
        auto j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(TransferErrc::invalid_config));
        }

        SessionConfig cfg;

        if (j.contains("cookie")) {
            cfg.cookie = trim(j["cookie"].get<std::string>());
        }

        if (cfg.cookie.empty() && j.contains("cookie_file")) {
            auto cookie = read_cookie_file(j["cookie_file"].get<std::string>());
            if (!cookie) {
                return std::unexpected(cookie.error());
            }
            cfg.cookie = std::move(*cookie);
        }

        if (j.contains("user_agent")) {
            cfg.user_agent = j["user_agent"].get<std::string>();
        }

        if (j.contains("accept")) {
            cfg.accept = j["accept"].get<std::string>();
        }

        if (j.contains("headers") && j["headers"].is_object()) {
            for (auto& [key, value] : j["headers"].items()) {
                cfg.headers[key] = value.get<std::string>();
            }
        }

        if (j.contains("max_retries")) {
            cfg.max_retries = j["max_retries"].get<std::uint32_t>();
            if (cfg.max_retries == 0) {
                return std::unexpected(make_error_code(TransferErrc::invalid_config));
            }
        }

        if (j.contains("sample_bytes")) {
            cfg.sample_bytes = j["sample_bytes"].get<std::uint64_t>();
        }

        cfg.probe_timeout = read_millis(j, "probe_timeout_ms", cfg.probe_timeout);
        cfg.transfer_timeout = read_millis(j, "transfer_timeout_ms", cfg.transfer_timeout);
        cfg.backoff_unit = read_millis(j, "backoff_ms", cfg.backoff_unit);
        cfg.polite_pause = read_millis(j, "polite_pause_ms", cfg.polite_pause);

        return cfg;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Invalid config: {}", e.what());
        return std::unexpected(make_error_code(TransferErrc::invalid_config));
    } catch (const std::exception& e) {
        spdlog::error("Invalid config: {}", e.what());
        return std::unexpected(make_error_code(TransferErrc::invalid_config));
    }
}

std::expected<SessionConfig, std::error_code>
SessionConfig::load(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path), std::ios::binary};
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }

        std::ostringstream ss;
        ss << file.rdbuf();
        return from_json(ss.str());
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

void SessionConfig::apply_environment(const EnvLookup& lookup) noexcept {
    try {
        if (auto cookie = lookup("REEL_COOKIE"); cookie && !trim(*cookie).empty()) {
            this->cookie = trim(*cookie);
        } else if (auto cookie_file = lookup("REEL_COOKIE_FILE"); cookie_file && !cookie_file->empty()) {
            auto value = read_cookie_file(*cookie_file);
            if (value) {
                this->cookie = std::move(*value);
            } else {
                spdlog::warn("Cannot read cookie file {}: {}", *cookie_file, value.error().message());
            }
        }

        if (sample_bytes == 0) {
            if (auto sample = lookup("REEL_SAMPLE_BYTES"); sample) {
                sample_bytes = parse_byte_count(trim(*sample));
            }
        }
    } catch (const std::exception& e) {
        spdlog::warn("Ignoring environment overrides: {}", e.what());
    }
}

std::expected<std::string, std::error_code>
read_cookie_file(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path), std::ios::binary};
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }

        std::ostringstream ss;
        ss << file.rdbuf();
        return trim(ss.str());
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

} // namespace reel::core
