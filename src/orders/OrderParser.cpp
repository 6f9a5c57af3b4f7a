#include "orders/OrderParser.hpp"
#include "orders/TextUtil.hpp"

#include <cctype>
#include <unordered_set>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace smartcart {

static const char* const kNameKeys[] = {"item_name", "name", "item"};

// Nesting bound for hostile input
static const int kMaxDepth = 32;

static void collect_names(const json& j, std::vector<std::string>& out, int depth) {
    if (depth > kMaxDepth) return;

    if (j.is_object()) {
        for (const char* key : kNameKeys) {
            auto it = j.find(key);
            if (it != j.end() && it->is_string()) {
                out.push_back(it->get<std::string>());
                break;
            }
        }
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (it->is_structured()) collect_names(*it, out, depth + 1);
        }
        return;
    }

    if (j.is_array()) {
        for (const auto& e : j) {
            if (e.is_string()) out.push_back(e.get<std::string>());
            else if (e.is_structured()) collect_names(e, out, depth + 1);
        }
    }
}

// Reads a quoted string starting at s[i] (which must be the quote char).
// Handles backslash escapes. Returns false if the quote never closes.
static bool read_quoted(const std::string& s, size_t& i, std::string& out) {
    const char q = s[i];
    ++i;
    out.clear();
    while (i < s.size()) {
        char c = s[i];
        if (c == '\\' && i + 1 < s.size()) {
            out.push_back(s[i + 1]);
            i += 2;
            continue;
        }
        if (c == q) {
            ++i;
            return true;
        }
        out.push_back(c);
        ++i;
    }
    return false;
}

// Fallback for records that look like JSON but do not parse: finds
// item_name: "..." fragments, with either quote style.
static std::vector<std::string> scan_item_name_fields(const std::string& s) {
    std::vector<std::string> out;
    const std::string key = "item_name";

    size_t pos = 0;
    while ((pos = s.find(key, pos)) != std::string::npos) {
        size_t i = pos + key.size();
        pos = i;

        if (i < s.size() && (s[i] == '"' || s[i] == '\'')) ++i;
        while (i < s.size() && std::isspace((unsigned char)s[i])) ++i;
        if (i >= s.size() || s[i] != ':') continue;
        ++i;
        while (i < s.size() && std::isspace((unsigned char)s[i])) ++i;
        if (i >= s.size() || (s[i] != '"' && s[i] != '\'')) continue;

        std::string value;
        if (!read_quoted(s, i, value)) break;
        out.push_back(value);
        pos = i;
    }
    return out;
}

static std::vector<std::string> split_delimited(const std::string& s) {
    std::vector<std::string> out;
    for (auto& piece : textutil::split_any(s, "|;,\n\r")) {
        if (!textutil::trim(piece).empty()) out.push_back(piece);
    }
    return out;
}

std::vector<std::string> extract_item_names(const std::string& raw) {
    const std::string s = textutil::trim(raw);
    if (s.empty() || is_placeholder_token(s)) return {};

    const char first = s.front();
    if (first == '{' || first == '[' || first == '"') {
        json j = json::parse(s, nullptr, false);
        if (!j.is_discarded()) {
            // double-encoded record: a JSON string holding JSON
            if (j.is_string()) {
                const std::string inner = j.get<std::string>();
                json k = json::parse(inner, nullptr, false);
                if (k.is_discarded() || !k.is_structured()) return split_delimited(inner);
                j = std::move(k);
            }

            std::vector<std::string> out;
            collect_names(j, out, 0);
            return out;
        }

        auto scanned = scan_item_name_fields(s);
        if (!scanned.empty()) return scanned;
    }

    return split_delimited(s);
}

bool is_placeholder_token(const std::string& s) {
    static const std::unordered_set<std::string> placeholders = {
        "nan", "none", "null", "nil", "n/a", "na", "-", "--", "?",
        "unknown", "undefined", "[]", "{}", "\"\"", "''",
    };
    return placeholders.count(textutil::lookup_key(s)) > 0;
}

static bool is_digits(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) if (!std::isdigit(c)) return false;
    return true;
}

static bool is_x(const std::string& s) {
    return s == "x" || s == "X";
}

// "2x" / "x2" / "(x2)" / "(2)"
static bool is_quantity_marker(const std::string& tok) {
    std::string t = tok;
    if (t.size() >= 2 && t.front() == '(' && t.back() == ')') t = t.substr(1, t.size() - 2);
    if (t.size() >= 2 && is_x(t.substr(t.size() - 1)) && is_digits(t.substr(0, t.size() - 1))) return true;
    if (t.size() >= 2 && is_x(t.substr(0, 1)) && is_digits(t.substr(1))) return true;
    if (tok.size() >= 3 && tok.front() == '(' && tok.back() == ')' && is_digits(t)) return true;
    return false;
}

static std::string strip_punctuation(const std::string& s) {
    static const std::string junk = "\"'`[]{},;:.*#|\\";
    size_t i = 0, j = s.size();
    while (i < j && (junk.find(s[i]) != std::string::npos || std::isspace((unsigned char)s[i]))) ++i;
    while (j > i && (junk.find(s[j - 1]) != std::string::npos || std::isspace((unsigned char)s[j - 1]))) --j;
    return s.substr(i, j - i);
}

static std::string strip_quantities(const std::string& s) {
    std::vector<std::string> toks = textutil::split_any(s, " ");

    // leading: "2x Wings", "2 x Wings"
    while (!toks.empty()) {
        if (is_quantity_marker(toks.front())) {
            toks.erase(toks.begin());
        } else if (toks.size() >= 3 && is_digits(toks[0]) && is_x(toks[1])) {
            toks.erase(toks.begin(), toks.begin() + 2);
        } else {
            break;
        }
    }

    // trailing: "Wings x2", "Wings x 2", "Wings (2)"
    while (!toks.empty()) {
        const size_t n = toks.size();
        if (n >= 2 && is_quantity_marker(toks.back())) {
            toks.pop_back();
        } else if (n >= 3 && is_digits(toks[n - 1]) && is_x(toks[n - 2])) {
            toks.resize(n - 2);
        } else {
            break;
        }
    }

    std::string out;
    for (const auto& t : toks) {
        if (t.empty()) continue;
        if (!out.empty()) out.push_back(' ');
        out += t;
    }
    return out;
}

std::string clean_item_name(const std::string& raw) {
    std::string s = strip_punctuation(textutil::collapse_spaces(textutil::to_valid_utf8(raw)));
    s = strip_punctuation(strip_quantities(s));
    if (s.empty() || is_placeholder_token(s)) return "";
    return s;
}

Order clean_item_list(const std::vector<std::string>& names) {
    Order out;
    out.reserve(names.size());
    for (const auto& n : names) {
        std::string c = clean_item_name(n);
        if (!c.empty()) out.push_back(std::move(c));
    }
    return out;
}

Order parse_order_record(const std::string& raw) {
    return clean_item_list(extract_item_names(raw));
}

}  // namespace smartcart
