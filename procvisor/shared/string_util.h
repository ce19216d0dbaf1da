#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

constexpr uint32_t fnv1a(std::string_view sv)
{
    uint32_t hash = 2166136261u;
    for (char c : sv)
        hash = (hash ^ static_cast<uint8_t>(c)) * 16777619u;
    return hash;
}

// Case-insensitive hash (converts to lowercase on the fly, no allocation)
constexpr uint32_t fnv1a_lower(std::string_view sv)
{
    uint32_t hash = 2166136261u;
    for (char c : sv)
    {
        char lower = (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
        hash = (hash ^ static_cast<uint8_t>(lower)) * 16777619u;
    }
    return hash;
}

// Plugin file stems use underscores, command names use hyphens.
inline std::string command_name_from_stem(std::string_view stem)
{
    std::string name(stem);
    for (char& c : name)
    {
        if (c == '_')
            c = '-';
    }
    return name;
}

inline std::string_view basename_of(std::string_view path)
{
    auto pos = path.find_last_of('/');
    return pos == std::string_view::npos ? path : path.substr(pos + 1);
}

inline std::string_view first_word(std::string_view s)
{
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string_view::npos)
        return {};
    size_t end = s.find_first_of(" \t", start);
    return s.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
}

inline std::string join(const std::vector<std::string>& parts, std::string_view sep)
{
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i)
    {
        if (i > 0)
            out += sep;
        out += parts[i];
    }
    return out;
}

// POSIX shell single-quote escaping
inline std::string shell_quote(std::string_view s)
{
    std::string out = "'";
    for (char c : s)
    {
        if (c == '\'')
            out += "'\\''";
        else
            out += c;
    }
    out += '\'';
    return out;
}
