#pragma once
#include <string>
#include <vector>

namespace textutil {

std::string trim(const std::string& s);

// valid UTF-8 passes through unchanged; each byte that does not start a
// well-formed sequence is read as Windows-1252 and re-encoded, so legacy
// exports keep distinct names ("Caf\xe9" -> "Café")
std::string to_valid_utf8(const std::string& s);

std::string to_lower(std::string s);

// whitespace runs (incl. tabs, newlines, control chars) -> single space, then trim
std::string collapse_spaces(const std::string& s);

// lowercase, keep letters/digits/+/&, turn everything else into spaces, collapse spaces
std::string normalize(const std::string& s);

// case-insensitive lookup key: to_valid_utf8 + collapse_spaces + lowercase
std::string lookup_key(const std::string& s);

// normalized_* must come from normalize(); matches whole words only
bool contains_phrase(const std::string& normalized_haystack, const std::string& normalized_phrase);

// split on any of the delimiter chars, empty pieces are kept
std::vector<std::string> split_any(const std::string& s, const std::string& delims);

// split normalized text into tokens
std::vector<std::string> tokenize(const std::string& normalized);

}
