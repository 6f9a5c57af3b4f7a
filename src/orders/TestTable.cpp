#include "orders/TestTable.hpp"
#include "orders/OrderParser.hpp"

#include <stdexcept>

namespace smartcart {

static std::string join(const std::vector<std::string>& v, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out += sep;
        out += v[i];
    }
    return out;
}

TestTable parse_test_table(const CsvTable& csv, const TestTableConfig& cfg) {
    std::vector<size_t> cart_cols;
    for (const auto& name : cfg.cart_columns) {
        const int c = csv.column(name);
        if (c >= 0) cart_cols.push_back(static_cast<size_t>(c));
    }
    if (cart_cols.empty()) {
        throw std::runtime_error("test table missing cart columns: " + join(cfg.cart_columns, ","));
    }

    const int truth_col = cfg.truth_column.empty() ? -1 : csv.column(cfg.truth_column);
    const int id_col = cfg.id_column.empty() ? -1 : csv.column(cfg.id_column);

    TestTable t;
    t.has_truth = truth_col >= 0;
    t.rows.reserve(csv.rows.size());

    for (size_t r = 0; r < csv.rows.size(); ++r) {
        const auto& row = csv.rows[r];

        TestRow tr;
        tr.row_id = (id_col >= 0) ? row[static_cast<size_t>(id_col)] : "";
        if (tr.row_id.empty()) tr.row_id = std::to_string(r + 1);

        if (cart_cols.size() == 1) {
            // a single cell may hold a whole list
            tr.cart = parse_order_record(row[cart_cols[0]]);
        } else {
            for (size_t c : cart_cols) {
                std::string name = clean_item_name(row[c]);
                if (!name.empty()) tr.cart.push_back(std::move(name));
            }
        }

        if (tr.cart.size() > 3) {
            tr.cart.resize(3);
            t.truncated_carts += 1;
        }

        if (truth_col >= 0) tr.truth = parse_order_record(row[static_cast<size_t>(truth_col)]);

        t.rows.push_back(std::move(tr));
    }

    return t;
}

TestTable load_test_table(const std::filesystem::path& path, const TestTableConfig& cfg) {
    return parse_test_table(read_csv_file(path), cfg);
}

}  // namespace smartcart
