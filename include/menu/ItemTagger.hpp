#pragma once
#include <string>
#include <vector>

#include "menu/Catalog.hpp"
#include "orders/OrderParser.hpp"

namespace smartcart {

// One classification rule. Rules are evaluated in table order and the
// first match wins; nothing matching means Category::Other.
struct CategoryRule {
    const char* label;
    Category category;
    bool (*matches)(const std::string& normalized_name);
};

// Priority order:
//   1. bundle   -> main     (combo / meal / bundle / platter / "+" / "&")
//   2. drink    -> drink
//   3. dessert  -> dessert
//   4. dip      -> dip      (dip / sauce / dressing / gravy / queso ...)
//   5. main     -> main     (wings / tenders / sandwich / burger ...)
//   6. side     -> side     (fries / corn / veggie sticks / slaw ...)
//   7. condiment-> dip      (ranch / blue cheese / honey mustard ...)
const std::vector<CategoryRule>& category_rules();

Category classify_category(const std::string& name);

// vegetarian: veg token, or a non-main category with no meat token
// spicy: spicy / hot / cajun / buffalo / ... token
// combo: bundle naming (same predicate as rule 1)
uint8_t classify_attributes(const std::string& name, Category category);

// Every distinct item (case-insensitive) across all orders, tagged, with
// mention counts and per-category rankings. Deterministic for a given
// order collection.
Catalog build_catalog(const std::vector<Order>& orders);

}  // namespace smartcart
