#pragma once
#include <filesystem>
#include <string>
#include <vector>

// Last n lines of a file, oldest first. Reads backwards from the end so large
// logs are not loaded whole. Empty when the file cannot be read.
std::vector<std::string> tail_lines(const std::filesystem::path& path, size_t n);
