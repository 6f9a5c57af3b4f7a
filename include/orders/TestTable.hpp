#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "io/CsvIO.hpp"

namespace smartcart {

// One labelled (or unlabelled) cart from the test set.
struct TestRow {
    std::string row_id;
    std::vector<std::string> cart;   // raw names, at most 3
    std::vector<std::string> truth;  // follow-on items; empty = unlabelled
};

struct TestTableConfig {
    // one column per cart slot, or a single column holding a list
    std::vector<std::string> cart_columns = {"item1", "item2", "item3"};
    std::string truth_column = "truth";   // optional
    std::string id_column = "ORDER_ID";   // optional, else 1-based row number
};

struct TestTable {
    std::vector<TestRow> rows;
    bool has_truth = false;
    size_t truncated_carts = 0;  // rows whose cart listed more than 3 items
};

// Throws std::runtime_error if none of the cart columns is present.
TestTable parse_test_table(const CsvTable& csv, const TestTableConfig& cfg = {});
TestTable load_test_table(const std::filesystem::path& path, const TestTableConfig& cfg = {});

}  // namespace smartcart
