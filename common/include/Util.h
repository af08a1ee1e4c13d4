#ifndef COMMON_UTIL_H
#define COMMON_UTIL_H

#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

std::string ToLowerCase(std::string_view s);

/**
 * @brief Strips leading and trailing spaces and tabs.
 */
std::string_view Trim(std::string_view s);

std::vector<std::string_view> SplitString(std::string_view s, char c);

std::vector<std::string_view> GetLines(std::string_view data);

/**
 * @brief Reads a whole file into memory. Throws std::runtime_error naming the
 * path if it cannot be opened or read.
 */
std::string ReadFile(const char* filepath);

/**
 * @brief Reads from an open stream until EOF. Works on pipes and terminals,
 * where the size is not known up front.
 */
std::string ReadStream(FILE* file, const char* name);

#endif
