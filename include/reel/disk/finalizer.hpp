// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/disk/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace reel::disk {

// "<destination>.part"
[[nodiscard]] std::string part_path(std::string_view destination);

// "dir/name.ext" -> "dir/name.sample.ext"; unchanged if already a sample path
[[nodiscard]] std::string sample_path(std::string_view destination);

// Size of a regular file; 0 when missing or unreadable
[[nodiscard]] std::uint64_t existing_size(std::string_view path) noexcept;

[[nodiscard]] bool exists(std::string_view path) noexcept;

// Create the parent directory chain of path
[[nodiscard]] std::error_code ensure_parent(std::string_view path) noexcept;

// Remove a file, logging (not returning) failures
void remove_quietly(std::string_view path) noexcept;

// Move temp onto final. Falls back to copy into "<final>.promote" and rename
// when a plain rename fails; temp is removed on success.
[[nodiscard]] std::error_code promote(std::string_view temp, std::string_view final_path) noexcept;

// The copy path of promote: temp -> "<final>.promote" -> final, then drop temp
[[nodiscard]] std::error_code promote_by_copy(std::string_view temp, std::string_view final_path) noexcept;

} // namespace reel::disk
