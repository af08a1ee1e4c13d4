#include "Util.h"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace std::string_view_literals;

std::string ToLowerCase(std::string_view s) {
    auto r = std::string{s};
    for (auto& c : r) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return r;
}

std::string_view Trim(std::string_view s) {
    size_t first = s.find_first_not_of(" \t"sv);
    if (first == std::string_view::npos) {
        return {};
    }
    size_t last = s.find_last_not_of(" \t"sv);
    return s.substr(first, last - first + 1);
}

std::vector<std::string_view> SplitString(std::string_view s, char c) {
    std::vector<std::string_view> res;
    size_t pos = 0;
    while (pos < s.size()) {
        auto lineEnd = s.find(c, pos);
        if (lineEnd == std::string::npos) {
            lineEnd = s.size();
        }

        auto line = s.substr(pos, lineEnd - pos);
        res.push_back(line);
        pos = lineEnd + 1;
    }
    return res;
}

std::vector<std::string_view> GetLines(std::string_view data) {
    auto lines = SplitString(data, '\n');
    for (auto& line : lines) {
        // Tolerate CRLF files
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
    }
    return lines;
}

std::string ReadStream(FILE* file, const char* name) {
    std::string buffer;
    char chunk[64 * 1024];

    size_t bytesRead;
    while ((bytesRead = fread(chunk, 1, sizeof(chunk), file)) > 0) {
        buffer.append(chunk, bytesRead);
    }

    if (ferror(file)) {
        throw std::runtime_error("failed to read " + std::string{name} + ": " + std::strerror(errno));
    }
    return buffer;
}

std::string ReadFile(const char* filepath) {
    FILE* file = fopen(filepath, "rb");
    if (!file) {
        throw std::runtime_error("failed to open file " + std::string{filepath} + ": " + std::strerror(errno));
    }

    std::string buffer;
    try {
        buffer = ReadStream(file, filepath);
    } catch (const std::runtime_error&) {
        fclose(file);
        throw;
    }
    fclose(file);

    return buffer;
}
