#include "menu/ItemTagger.hpp"
#include "orders/TextUtil.hpp"

#include <unordered_map>

namespace smartcart {

static bool has_any(const std::string& norm, const std::vector<std::string>& phrases) {
    for (const auto& p : phrases) {
        if (textutil::contains_phrase(norm, p)) return true;
    }
    return false;
}

static bool is_bundle(const std::string& norm) {
    static const std::vector<std::string> words = {
        "combo", "combos", "meal", "meals", "bundle", "platter", "feast",
        "family pack", "party pack", "value pack", "box meal",
    };
    if (norm.find('+') != std::string::npos) return true;
    if (norm.find('&') != std::string::npos) return true;
    return has_any(norm, words);
}

static bool is_drink(const std::string& norm) {
    static const std::vector<std::string> words = {
        "drink", "drinks", "soda", "cola", "coke", "diet coke", "pepsi",
        "sprite", "dr pepper", "fanta", "root beer", "water", "bottled water",
        "tea", "sweet tea", "iced tea", "lemonade", "juice", "coffee", "milk",
        "beverage", "fountain", "shake", "milkshake", "smoothie",
    };
    return has_any(norm, words);
}

static bool is_dessert(const std::string& norm) {
    static const std::vector<std::string> words = {
        "dessert", "desserts", "brownie", "brownies", "cookie", "cookies",
        "cake", "cheesecake", "pie", "ice cream", "sundae", "churro", "churros",
        "donut", "donuts", "muffin", "pudding", "cinnamon", "funnel cake",
    };
    return has_any(norm, words);
}

static bool is_dip(const std::string& norm) {
    static const std::vector<std::string> words = {
        "dip", "dips", "sauce", "sauces", "dressing", "gravy", "queso",
        "aioli", "salsa", "cup of sauce",
    };
    return has_any(norm, words);
}

static bool is_main(const std::string& norm) {
    static const std::vector<std::string> words = {
        "wing", "wings", "boneless", "tender", "tenders", "strip", "strips",
        "sandwich", "sandwiches", "burger", "burgers", "sub", "wrap", "wraps",
        "chicken", "nugget", "nuggets", "thigh", "thighs", "drums", "drumsticks",
        "flats", "pizza", "bowl", "taco", "tacos", "quesadilla", "pc", "piece",
    };
    return has_any(norm, words);
}

static bool is_side(const std::string& norm) {
    static const std::vector<std::string> words = {
        "side", "sides", "fries", "fry", "corn", "fried corn", "veggie sticks",
        "sticks", "celery", "carrots", "coleslaw", "slaw", "salad", "bread",
        "roll", "rolls", "rice", "beans", "onion rings", "rings", "mac", "chips",
        "potato", "potatoes", "tots", "pickles", "okra", "mozzarella sticks",
    };
    return has_any(norm, words);
}

static bool is_condiment(const std::string& norm) {
    static const std::vector<std::string> words = {
        "ranch", "blue cheese", "bleu cheese", "honey mustard", "mustard",
        "ketchup", "mayo", "buffalo", "bbq", "hot honey", "garlic parmesan",
    };
    return has_any(norm, words);
}

const std::vector<CategoryRule>& category_rules() {
    static const std::vector<CategoryRule> rules = {
        {"bundle", Category::Main, &is_bundle},
        {"drink", Category::Drink, &is_drink},
        {"dessert", Category::Dessert, &is_dessert},
        {"dip", Category::Dip, &is_dip},
        {"main", Category::Main, &is_main},
        {"side", Category::Side, &is_side},
        {"condiment", Category::Dip, &is_condiment},
    };
    return rules;
}

Category classify_category(const std::string& name) {
    const std::string norm = textutil::normalize(name);
    if (norm.empty()) return Category::Other;

    for (const auto& rule : category_rules()) {
        if (rule.matches(norm)) return rule.category;
    }
    return Category::Other;
}

uint8_t classify_attributes(const std::string& name, Category category) {
    static const std::vector<std::string> veg = {
        "veg", "veggie", "veggies", "vegetarian", "vegan", "plant based",
        "paneer", "tofu", "impossible",
    };
    static const std::vector<std::string> meat = {
        "chicken", "wing", "wings", "boneless", "tender", "tenders", "beef",
        "pork", "bacon", "ham", "turkey", "sausage", "fish", "shrimp", "thigh",
        "thighs", "drums", "flats", "pepperoni", "steak", "gravy",
    };
    static const std::vector<std::string> spicy = {
        "spicy", "hot", "cajun", "buffalo", "jalapeno", "jalapenos", "habanero",
        "nashville", "chili", "chilli", "fiery", "sriracha", "atomic",
        "mango habanero", "ghost pepper", "inferno", "voodoo",
    };

    const std::string norm = textutil::normalize(name);
    uint8_t attrs = 0;

    const bool has_meat = has_any(norm, meat);
    if (!has_meat) {
        if (has_any(norm, veg)) attrs |= kVegetarian;
        else if (category != Category::Main && category != Category::Other) attrs |= kVegetarian;
    }

    if (has_any(norm, spicy)) attrs |= kSpicy;
    if (is_bundle(norm)) attrs |= kCombo;

    return attrs;
}

Catalog build_catalog(const std::vector<Order>& orders) {
    std::vector<Item> items;
    std::unordered_map<std::string, ItemId> index;

    for (const auto& order : orders) {
        for (const auto& name : order) {
            const std::string key = textutil::lookup_key(name);
            if (key.empty()) continue;

            auto it = index.find(key);
            if (it == index.end()) {
                it = index.emplace(key, static_cast<ItemId>(items.size())).first;
                Item item;
                item.name = textutil::collapse_spaces(textutil::to_valid_utf8(name));
                items.push_back(std::move(item));
            }
            items[it->second].frequency += 1;
        }
    }

    for (auto& item : items) {
        item.category = classify_category(item.name);
        item.attributes = classify_attributes(item.name, item.category);
    }

    return Catalog(std::move(items));
}

}  // namespace smartcart
