// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/disk/finalizer.hpp>
#include <reel/core/config.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>

namespace fs = std::filesystem;

namespace reel::disk {

std::string part_path(std::string_view destination) {
    std::string path(destination);
    path += core::PART_SUFFIX;
    return path;
}

std::string sample_path(std::string_view destination) {
    fs::path path{std::string(destination)};
    auto stem = path.stem().string();
    auto ext = path.extension().string();

    if (stem.ends_with(core::SAMPLE_MARKER)) {
        return std::string(destination);
    }

    std::string name = stem;
    name += core::SAMPLE_MARKER;
    name += ext;
    return (path.parent_path() / name).string();
}

std::uint64_t existing_size(std::string_view path) noexcept {
    std::error_code ec;
    fs::path p{path};
    if (!fs::is_regular_file(p, ec) || ec) return 0;

    auto size = fs::file_size(p, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

bool exists(std::string_view path) noexcept {
    std::error_code ec;
    return fs::exists(fs::path{path}, ec) && !ec;
}

std::error_code ensure_parent(std::string_view path) noexcept {
    std::error_code ec;
    auto parent = fs::path{path}.parent_path();
    if (parent.empty()) return {};

    fs::create_directories(parent, ec);
    if (ec) {
        spdlog::error("Cannot create directory {}: {}", parent.string(), ec.message());
        return posix_error_to_error_code(ec.value());
    }
    return {};
}

void remove_quietly(std::string_view path) noexcept {
    std::error_code ec;
    fs::remove(fs::path{path}, ec);
    if (ec) {
        spdlog::debug("Cannot remove {}: {}", path, ec.message());
    }
}

std::error_code promote(std::string_view temp, std::string_view final_path) noexcept {
    std::error_code ec;
    fs::rename(fs::path{temp}, fs::path{final_path}, ec);
    if (!ec) return {};

    spdlog::warn("Rename {} -> {} failed ({}), copying instead", temp, final_path, ec.message());
    return promote_by_copy(temp, final_path);
}

std::error_code promote_by_copy(std::string_view temp, std::string_view final_path) noexcept {
    std::error_code ec;
    fs::path from{temp};
    fs::path to{final_path};

    fs::path staging = to;
    staging += core::PROMOTE_SUFFIX;

    fs::copy_file(from, staging, fs::copy_options::overwrite_existing, ec);
    if (!ec) {
        fs::rename(staging, to, ec);
    }
    if (ec) {
        spdlog::error("Cannot promote {} to {}: {}", temp, final_path, ec.message());
        remove_quietly(staging.string());
        return make_error_code(DiskErrc::rename_failed);
    }

    remove_quietly(temp);
    return {};
}

} // namespace reel::disk
