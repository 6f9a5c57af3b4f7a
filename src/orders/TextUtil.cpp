#include "orders/TextUtil.hpp"
#include <cctype>
#include <cstdint>

namespace textutil {

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && std::isspace((unsigned char)s[i])) ++i;
    while (j > i && std::isspace((unsigned char)s[j - 1])) --j;
    return s.substr(i, j - i);
}

// length of the well-formed UTF-8 sequence starting at i, 0 if there is none
static size_t utf8_sequence_length(const std::string& s, size_t i) {
    const unsigned char c = static_cast<unsigned char>(s[i]);
    if (c < 0x80) return 1;

    size_t len = 0;
    unsigned char lo = 0x80, hi = 0xBF;  // bounds for the second byte
    if (c >= 0xC2 && c <= 0xDF) len = 2;
    else if (c == 0xE0) { len = 3; lo = 0xA0; }
    else if (c == 0xED) { len = 3; hi = 0x9F; }  // no surrogates
    else if (c >= 0xE1 && c <= 0xEF) len = 3;
    else if (c == 0xF0) { len = 4; lo = 0x90; }
    else if (c >= 0xF1 && c <= 0xF3) len = 4;
    else if (c == 0xF4) { len = 4; hi = 0x8F; }
    else return 0;

    if (i + len > s.size()) return 0;
    for (size_t k = 1; k < len; ++k) {
        const unsigned char b = static_cast<unsigned char>(s[i + k]);
        if (k == 1 ? (b < lo || b > hi) : (b < 0x80 || b > 0xBF)) return 0;
    }
    return len;
}

static void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// 0x80..0x9F in Windows-1252; holes map to U+FFFD
static uint32_t cp1252_high(unsigned char c) {
    static const uint16_t table[32] = {
        0x20AC, 0xFFFD, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
        0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0xFFFD, 0x017D, 0xFFFD,
        0xFFFD, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
        0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0xFFFD, 0x017E, 0x0178,
    };
    if (c >= 0x80 && c <= 0x9F) return table[c - 0x80];
    return c;
}

std::string to_valid_utf8(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        const size_t len = utf8_sequence_length(s, i);
        if (len > 0) {
            out.append(s, i, len);
            i += len;
        } else {
            append_utf8(out, cp1252_high(static_cast<unsigned char>(s[i])));
            ++i;
        }
    }
    return out;
}

std::string to_lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string collapse_spaces(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    for (unsigned char c : s) {
        bool space = std::isspace(c) || std::iscntrl(c);
        if (space) {
            if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
        } else {
            out.push_back(static_cast<char>(c));
            prev_space = false;
        }
    }

    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::string normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    for (unsigned char ch : s) {
        unsigned char c = static_cast<unsigned char>(std::tolower(ch));

        bool keep =
            (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9') ||
            (c == '+') || (c == '&'); // bundle markers: "wings + fries", "fish & chips"

        if (keep) {
            out.push_back(static_cast<char>(c));
            prev_space = false;
        } else {
            if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
        }
    }

    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::string lookup_key(const std::string& s) {
    return to_lower(collapse_spaces(to_valid_utf8(s)));
}

bool contains_phrase(const std::string& normalized_haystack, const std::string& normalized_phrase) {
    // pad with spaces to enforce word boundaries
    std::string h = " " + normalized_haystack + " ";
    std::string p = " " + normalized_phrase + " ";
    return h.find(p) != std::string::npos;
}

std::vector<std::string> split_any(const std::string& s, const std::string& delims) {
    std::vector<std::string> out;
    std::string cur;

    for (char c : s) {
        if (delims.find(c) != std::string::npos) {
            out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    out.push_back(cur);
    return out;
}

std::vector<std::string> tokenize(const std::string& normalized) {
    std::vector<std::string> tokens;
    std::string cur;

    for (char c : normalized) {
        if (c == ' ') {
            if (!cur.empty()) {
                tokens.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) tokens.push_back(cur);
    return tokens;
}

}
