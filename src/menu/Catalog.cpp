#include "menu/Catalog.hpp"
#include "orders/TextUtil.hpp"

#include <algorithm>
#include <stdexcept>

namespace smartcart {

const char* category_str(Category c) {
    switch (c) {
        case Category::Main: return "main";
        case Category::Side: return "side";
        case Category::Drink: return "drink";
        case Category::Dip: return "dip";
        case Category::Dessert: return "dessert";
        case Category::Other: return "other";
        default: return "other";
    }
}

bool parse_category(const std::string& s, Category& out) {
    const std::string k = textutil::to_lower(textutil::trim(s));
    for (Category c : kAllCategories) {
        if (k == category_str(c)) {
            out = c;
            return true;
        }
    }
    return false;
}

size_t category_index(Category c) {
    return static_cast<size_t>(c);
}

std::vector<std::string> attribute_names(uint8_t attributes) {
    std::vector<std::string> out;
    if (attributes & kVegetarian) out.push_back("vegetarian");
    if (attributes & kSpicy) out.push_back("spicy");
    if (attributes & kCombo) out.push_back("combo");
    return out;
}

bool parse_attribute(const std::string& s, Attribute& out) {
    const std::string k = textutil::to_lower(textutil::trim(s));
    if (k == "vegetarian") { out = kVegetarian; return true; }
    if (k == "spicy") { out = kSpicy; return true; }
    if (k == "combo") { out = kCombo; return true; }
    return false;
}

Catalog::Catalog(std::vector<Item> items) : m_items(std::move(items)) {
    m_by_key.reserve(m_items.size() * 2 + 8);

    for (size_t i = 0; i < m_items.size(); ++i) {
        // stored names must survive a JSON round trip byte for byte
        m_items[i].name = textutil::to_valid_utf8(m_items[i].name);
        const std::string key = textutil::lookup_key(m_items[i].name);
        if (key.empty()) {
            throw std::runtime_error("catalog item " + std::to_string(i) + " has an empty name");
        }
        if (!m_by_key.emplace(key, static_cast<ItemId>(i)).second) {
            throw std::runtime_error("duplicate catalog item: " + m_items[i].name);
        }
        m_top[category_index(m_items[i].category)].push_back(static_cast<ItemId>(i));
    }

    // ids are already in first-seen order, so a stable sort keeps that as the tie-break
    for (auto& ids : m_top) {
        std::stable_sort(ids.begin(), ids.end(), [this](ItemId a, ItemId b) {
            return m_items[a].frequency > m_items[b].frequency;
        });
    }
}

std::optional<ItemId> Catalog::find(const std::string& name) const {
    auto it = m_by_key.find(textutil::lookup_key(name));
    if (it == m_by_key.end()) return std::nullopt;
    return it->second;
}

const std::vector<ItemId>& Catalog::top_by_category(Category c) const {
    return m_top.at(category_index(c));
}

}  // namespace smartcart
