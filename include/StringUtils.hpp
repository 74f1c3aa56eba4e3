#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <string>
#include <string_view>
#include <vector>

namespace utils {

/**
 * Convert a string to lowercase (ASCII only)
 *
 * @param str Input string
 * @return Lowercase copy
 */
std::string toLower(std::string_view str);

/**
 * Convert a string to uppercase (ASCII only)
 *
 * @param str Input string
 * @return Uppercase copy
 */
std::string toUpper(std::string_view str);

/**
 * Strip leading and trailing spaces and tabs
 *
 * @param str Input string
 * @return Trimmed copy
 */
std::string trim(std::string_view str);

/**
 * Case-insensitive equality for ASCII strings
 */
bool iequals(std::string_view a, std::string_view b);

/**
 * Check whether str begins with prefix
 */
bool startsWith(std::string_view str, std::string_view prefix);

/**
 * Check whether str ends with suffix
 */
bool endsWith(std::string_view str, std::string_view suffix);

/**
 * Split a string on every occurrence of a delimiter character
 *
 * Empty fields are kept, so "a,,b" yields three parts.
 *
 * @param str Input string
 * @param delimiter Separator character
 * @return Parts in order
 */
std::vector<std::string> split(std::string_view str, char delimiter);

/**
 * Lowercase hex encoding of a byte buffer
 */
std::string toHex(const unsigned char* data, size_t length);

} // namespace utils

#endif // STRING_UTILS_HPP
