#pragma once
#include <string>
#include <vector>

namespace smartcart {

// Cleaned item names of one order, in the order they were mentioned.
using Order = std::vector<std::string>;

// Pulls raw item mentions out of one order record. Accepts JSON documents
// (item names under "item_name" / "name" / "item" at any depth, or a plain
// array of strings), garbled JSON with scannable "item_name" fragments, and
// delimiter-separated text (| ; , newline). Never throws; malformed input
// yields an empty list.
std::vector<std::string> extract_item_names(const std::string& raw);

// Whitespace collapse, quantity markers ("2x", "x2", "(x2)") and surrounding
// punctuation stripped. Placeholder tokens ("nan", "null", ...) become "".
std::string clean_item_name(const std::string& raw);

// clean_item_name over every entry, empty results dropped.
Order clean_item_list(const std::vector<std::string>& names);

// extract_item_names + clean_item_list
Order parse_order_record(const std::string& raw);

bool is_placeholder_token(const std::string& s);

}  // namespace smartcart
