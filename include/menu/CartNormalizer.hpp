#pragma once
#include <string>
#include <vector>

#include "menu/Catalog.hpp"

namespace smartcart {

constexpr size_t kMaxCartItems = 3;

// Canonical, deduplicated cart of at most kMaxCartItems items.
struct Cart {
    std::vector<ItemId> items;

    bool empty() const { return items.empty(); }
    size_t size() const { return items.size(); }
    bool contains(ItemId id) const;
};

// Looks up the first kMaxCartItems user strings case-insensitively.
// Unknown names are dropped; duplicates collapse to one entry.
Cart normalize_cart(const std::vector<std::string>& user_items, const Catalog& catalog);

std::vector<std::string> cart_names(const Cart& cart, const Catalog& catalog);

}  // namespace smartcart
