#include "log_tail.h"

#include <algorithm>
#include <fstream>

std::vector<std::string> tail_lines(const std::filesystem::path& path, size_t n)
{
    std::vector<std::string> lines;
    if (n == 0)
        return lines;

    std::ifstream in(path, std::ios::binary);
    if (!in)
        return lines;

    in.seekg(0, std::ios::end);
    std::streamoff pos = in.tellg();
    if (pos <= 0)
        return lines;

    constexpr std::streamoff block = 64 * 1024;
    std::string buf;
    size_t newlines = 0;

    // Collect blocks from the end until we hold n+1 line breaks (or the file start).
    while (pos > 0 && newlines <= n)
    {
        std::streamoff len = std::min(block, pos);
        pos -= len;

        std::string chunk(static_cast<size_t>(len), '\0');
        in.seekg(pos);
        in.read(chunk.data(), len);
        if (!in)
            return lines;

        newlines += static_cast<size_t>(std::count(chunk.begin(), chunk.end(), '\n'));
        buf.insert(0, chunk);
    }

    if (!buf.empty() && buf.back() == '\n')
        buf.pop_back();

    size_t end = buf.size();
    while (lines.size() < n && end > 0)
    {
        size_t start = buf.rfind('\n', end - 1);
        if (start == std::string::npos)
        {
            if (pos == 0)
                lines.push_back(buf.substr(0, end));
            break;
        }
        lines.push_back(buf.substr(start + 1, end - start - 1));
        end = start;
    }

    std::reverse(lines.begin(), lines.end());
    return lines;
}
