#pragma once

#include <string>
#include <vector>

namespace updown {
namespace text {

/**
 * ASCII lower-case copy.
 */
std::string to_lower(const std::string& s);

/**
 * Strip leading and trailing whitespace.
 */
std::string trim(const std::string& s);

/**
 * Case-insensitive substring test.
 */
bool contains_ci(const std::string& haystack, const std::string& needle);

/**
 * Case-insensitive match of phrase bounded by non-alphanumerics,
 * so "5m" does not match inside "15m".
 */
bool contains_phrase(const std::string& haystack, const std::string& phrase);

/**
 * Split into lower-case alphanumeric words.
 */
std::vector<std::string> words(const std::string& s);

/**
 * Lower-case, spaces and underscores to '-', drop other punctuation.
 */
std::string slugify(const std::string& s);

/**
 * Percent-encode for use in a query string.
 */
std::string url_encode(const std::string& s);

/**
 * At most max_bytes of s, cut on a UTF-8 code point boundary.
 * Bytes that do not form a valid sequence are replaced by '?', so the
 * result is always valid UTF-8 (upstream bodies end up in JSON output).
 */
std::string utf8_prefix(const std::string& s, size_t max_bytes);

} // namespace text
} // namespace updown
