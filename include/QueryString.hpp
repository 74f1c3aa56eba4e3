#ifndef QUERY_STRING_HPP
#define QUERY_STRING_HPP

#include <string>
#include <string_view>

#include <json/json.h>

/**
 * query_string - URL query / form-urlencoded serialization
 *
 * Two dialects are supported:
 * - flat: one level of keys, arrays repeat the key ("a=1&a=2"), nested
 *   objects collapse to an empty value (lossy)
 * - nested: bracket notation ("a%5Bb%5D=1", "list%5B0%5D=x") which
 *   round-trips through parseNested() with every leaf as a string
 */
namespace query_string {

/**
 * Percent-encode everything except A-Z a-z 0-9 - _ . ! ~ * ' ( )
 */
std::string escape(std::string_view text);

/**
 * Decode %XX sequences; malformed sequences are kept literally
 *
 * @param text Encoded text
 * @param plus_as_space Treat '+' as an encoded space (form bodies)
 */
std::string unescape(std::string_view text, bool plus_as_space = false);

/**
 * Flat serialization of a JSON object
 *
 * @param object Key/value pairs; non-object values yield ""
 * @return "k=v&k2=v2"
 */
std::string stringify(const Json::Value& object);

/**
 * Bracket-notation serialization of an arbitrarily nested JSON object
 */
std::string stringifyNested(const Json::Value& object);

/**
 * Parse a flat query string; repeated keys become arrays of strings
 */
Json::Value parse(std::string_view text);

/**
 * Parse a bracket-notation query string back into nested objects/arrays
 */
Json::Value parseNested(std::string_view text);

/**
 * Append encoded pairs to an existing query, inserting '&' when needed
 */
std::string appendQuery(const std::string& query, const std::string& addition);

} // namespace query_string

#endif // QUERY_STRING_HPP
