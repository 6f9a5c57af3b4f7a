#include "menu/CartNormalizer.hpp"

#include <algorithm>

namespace smartcart {

bool Cart::contains(ItemId id) const {
    return std::find(items.begin(), items.end(), id) != items.end();
}

Cart normalize_cart(const std::vector<std::string>& user_items, const Catalog& catalog) {
    Cart cart;
    const size_t n = std::min(user_items.size(), kMaxCartItems);

    for (size_t i = 0; i < n; ++i) {
        auto id = catalog.find(user_items[i]);
        if (!id) continue;
        if (cart.contains(*id)) continue;
        cart.items.push_back(*id);
    }
    return cart;
}

std::vector<std::string> cart_names(const Cart& cart, const Catalog& catalog) {
    std::vector<std::string> out;
    out.reserve(cart.items.size());
    for (ItemId id : cart.items) out.push_back(catalog.item(id).name);
    return out;
}

}  // namespace smartcart
