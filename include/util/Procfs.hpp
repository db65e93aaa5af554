// Helpers for reading /proc with optional root remap
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace herd::util {

// Map an absolute /proc path to an alternate root if HERD_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Resolve a symlink such as /proc/<pid>/exe. Returns std::nullopt on error
// (EACCES for other users' processes, ENOENT when the pid is gone).
auto read_symlink(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

// Numeric entries of /proc, in directory order.
auto list_pids() -> std::vector<int32_t>;

// Process name from /proc/<pid>/comm, else the parenthesised field of
// /proc/<pid>/stat. Empty when the process is gone.
auto read_comm(int32_t pid) -> std::string;

// Scheduler state letter from /proc/<pid>/stat (R, S, Z, ...).
auto read_state(int32_t pid) -> std::optional<char>;

// True when the remapped /proc root can be listed at all.
[[nodiscard]] bool proc_available();

} // namespace herd::util
