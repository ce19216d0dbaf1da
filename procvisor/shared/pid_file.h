#pragma once
#include <filesystem>
#include <optional>
#include <sys/types.h>

// Plain-text PID file: the decimal pid of the running supervisor, nothing else.

// Writes getpid() atomically (temp file + rename). false on I/O failure.
bool write_pid_file(const std::filesystem::path& path);

// pid of a live supervisor, or nullopt. A file naming a dead process (or
// holding garbage) is stale and gets removed.
std::optional<pid_t> read_pid_file(const std::filesystem::path& path);

// Removes the file only if it still names this process, so a shutting-down
// instance cannot delete a successor's file.
void remove_pid_file(const std::filesystem::path& path);

bool process_alive(pid_t pid);
