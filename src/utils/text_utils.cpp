#include "utils/text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace updown {
namespace text {

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(s.begin(), s.end(), not_space);
    auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    if (begin >= end) return "";
    return std::string(begin, end);
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

bool contains_phrase(const std::string& haystack, const std::string& phrase) {
    if (phrase.empty()) return false;
    std::string h = to_lower(haystack);
    std::string p = to_lower(phrase);

    for (size_t pos = h.find(p); pos != std::string::npos; pos = h.find(p, pos + 1)) {
        bool left_ok = pos == 0 || !std::isalnum(static_cast<unsigned char>(h[pos - 1]));
        size_t end = pos + p.size();
        bool right_ok = end >= h.size() || !std::isalnum(static_cast<unsigned char>(h[end]));
        if (left_ok && right_ok) return true;
    }
    return false;
}

std::vector<std::string> words(const std::string& s) {
    std::vector<std::string> out;
    std::string current;
    for (unsigned char c : s) {
        if (std::isalnum(c)) {
            current += static_cast<char>(std::tolower(c));
        } else if (!current.empty()) {
            out.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) out.push_back(current);
    return out;
}

std::string slugify(const std::string& s) {
    std::string out;
    for (unsigned char c : trim(s)) {
        if (std::isalnum(c)) {
            out += static_cast<char>(std::tolower(c));
        } else if ((c == ' ' || c == '_' || c == '-') && !out.empty() && out.back() != '-') {
            out += '-';
        }
    }
    while (!out.empty() && out.back() == '-') out.pop_back();
    return out;
}

std::string url_encode(const std::string& s) {
    std::ostringstream ss;
    ss << std::hex << std::uppercase;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            ss << c;
        } else {
            ss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return ss.str();
}

std::string utf8_prefix(const std::string& s, size_t max_bytes) {
    std::string out;
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len = 0;
        if (c < 0x80) len = 1;
        else if (c >= 0xC2 && c <= 0xDF) len = 2;
        else if (c >= 0xE0 && c <= 0xEF) len = 3;
        else if (c >= 0xF0 && c <= 0xF4) len = 4;

        bool valid = len > 0 && i + len <= s.size();
        for (size_t k = 1; valid && k < len; k++) {
            valid = (static_cast<unsigned char>(s[i + k]) & 0xC0) == 0x80;
        }
        // Overlong and surrogate forms
        if (valid && len == 3) {
            unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
            if ((c == 0xE0 && c1 < 0xA0) || (c == 0xED && c1 > 0x9F)) valid = false;
        }
        if (valid && len == 4) {
            unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
            if ((c == 0xF0 && c1 < 0x90) || (c == 0xF4 && c1 > 0x8F)) valid = false;
        }

        size_t width = valid ? len : 1;
        if (out.size() + width > max_bytes) break;
        if (valid) {
            out.append(s, i, len);
        } else {
            out += '?';
        }
        i += width;
    }
    return out;
}

} // namespace text
} // namespace updown
