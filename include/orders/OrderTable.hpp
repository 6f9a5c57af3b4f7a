#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "io/CsvIO.hpp"
#include "orders/OrderParser.hpp"

namespace smartcart {

struct OrderTableConfig {
    std::string orders_column = "ORDERS";
};

struct OrderTable {
    std::vector<Order> orders;  // one per CSV row, possibly empty
    size_t rows = 0;
    size_t empty_rows = 0;      // no item survived parsing
    size_t mentions = 0;
};

// Throws std::runtime_error if the orders column is missing.
OrderTable parse_order_table(const CsvTable& csv, const OrderTableConfig& cfg = {});
OrderTable load_order_table(const std::filesystem::path& path, const OrderTableConfig& cfg = {});

}  // namespace smartcart
