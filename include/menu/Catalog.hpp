#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace smartcart {

enum class Category {
    Main,
    Side,
    Drink,
    Dip,
    Dessert,
    Other
};

constexpr size_t kCategoryCount = 6;

// Fixed order used for printing and for fallback cycling
constexpr std::array<Category, kCategoryCount> kAllCategories = {
    Category::Main, Category::Side, Category::Drink,
    Category::Dip, Category::Dessert, Category::Other
};

enum Attribute : uint8_t {
    kVegetarian = 1u << 0,
    kSpicy      = 1u << 1,
    kCombo      = 1u << 2,
};

const char* category_str(Category c);
bool parse_category(const std::string& s, Category& out);
size_t category_index(Category c);

std::vector<std::string> attribute_names(uint8_t attributes);
bool parse_attribute(const std::string& s, Attribute& out);

// Index into Catalog::items(); also the first-seen order.
using ItemId = uint32_t;

struct Item {
    std::string name;                 // canonical spelling (first seen)
    Category category = Category::Other;
    uint8_t attributes = 0;           // Attribute bits
    uint64_t frequency = 0;           // mentions across all parsed orders

    bool has(Attribute a) const { return (attributes & a) != 0; }
};

// Distinct items of one dataset snapshot. Read-only once constructed.
class Catalog {
public:
    Catalog() = default;

    // items[i] gets ItemId i; names must be unique case-insensitively
    explicit Catalog(std::vector<Item> items);

    size_t size() const { return m_items.size(); }
    bool empty() const { return m_items.empty(); }

    const Item& item(ItemId id) const { return m_items.at(id); }
    const std::vector<Item>& items() const { return m_items; }

    // case-insensitive, whitespace-tolerant name lookup
    std::optional<ItemId> find(const std::string& name) const;

    // items of category c, frequency desc, ties by first-seen order
    const std::vector<ItemId>& top_by_category(Category c) const;

    size_t count_in(Category c) const { return top_by_category(c).size(); }

private:
    std::vector<Item> m_items;
    std::unordered_map<std::string, ItemId> m_by_key;
    std::array<std::vector<ItemId>, kCategoryCount> m_top;
};

}  // namespace smartcart
