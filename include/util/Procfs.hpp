// Helpers for reading /proc with optional root remap
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace iorate::util {

// Map an absolute /proc path to an alternate root if IORATE_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Split a procfs line on spaces, tabs and carriage returns; empty tokens are dropped
auto split_ws(std::string_view line) -> std::vector<std::string_view>;

// Whole-token unsigned decimal; 0 when the token is empty or not a number
auto parse_u64(std::string_view tok) -> uint64_t;

} // namespace iorate::util
