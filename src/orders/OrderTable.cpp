#include "orders/OrderTable.hpp"

#include <stdexcept>

namespace smartcart {

OrderTable parse_order_table(const CsvTable& csv, const OrderTableConfig& cfg) {
    const int col = csv.column(cfg.orders_column);
    if (col < 0) {
        throw std::runtime_error("orders table missing required column: " + cfg.orders_column);
    }

    OrderTable t;
    t.orders.reserve(csv.rows.size());

    for (const auto& row : csv.rows) {
        Order order = parse_order_record(row[static_cast<size_t>(col)]);
        t.rows += 1;
        t.mentions += order.size();
        if (order.empty()) t.empty_rows += 1;
        t.orders.push_back(std::move(order));
    }

    return t;
}

OrderTable load_order_table(const std::filesystem::path& path, const OrderTableConfig& cfg) {
    return parse_order_table(read_csv_file(path), cfg);
}

}  // namespace smartcart
