#include <gtest/gtest.h>

#include <sstream>

#include "io/CsvIO.hpp"
#include "menu/ItemTagger.hpp"
#include "reco/BatchReport.hpp"

namespace smartcart::test {

class BatchReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        const std::vector<Order> orders = {
            {"Wings", "Fries"},
            {"Wings", "Ranch"},
            {"Wings", "Fries", "Ranch"},
            {"Soda"},
        };
        catalog = build_catalog(orders);
        matrix = build_affinity_matrix(catalog, orders);

        TestRow labeled;
        labeled.row_id = "A1";
        labeled.cart = {"Wings"};
        labeled.truth = {"Ranch"};

        TestRow unlabeled;
        unlabeled.row_id = "A2";
        unlabeled.cart = {"Lobster", "Wings"};

        report.snapshot_id = "deadbeef";
        report.test_path = "test.csv";
        report.result = evaluate_batch({labeled, unlabeled}, catalog, matrix, report.score_cfg);
    }

    Catalog catalog;
    AffinityMatrix matrix;
    BatchReport report;
};

TEST_F(BatchReportTest, CsvHasOneLinePerRowWithSlotsAndHits) {
    std::ostringstream out;
    report.write_csv(out);

    std::istringstream in(out.str());
    const CsvTable t = read_csv(in);

    EXPECT_EQ(t.header, BatchReport::csv_header());
    ASSERT_EQ(t.rows.size(), 2u);

    const auto& r0 = t.rows[0];
    EXPECT_EQ(r0[t.column("row_id")], "A1");
    EXPECT_EQ(r0[t.column("rec1")], "Fries");
    EXPECT_EQ(r0[t.column("score1")], "0.8167");
    EXPECT_EQ(r0[t.column("rec2")], "Ranch");
    EXPECT_EQ(r0[t.column("rec3")], "Soda");
    EXPECT_EQ(r0[t.column("score3")], "0.0000");
    EXPECT_EQ(r0[t.column("hit1")], "0");
    EXPECT_EQ(r0[t.column("hit2")], "1");
    EXPECT_EQ(r0[t.column("hit_rank")], "2");
    EXPECT_EQ(r0[t.column("truth_hits")], "1");
    EXPECT_EQ(r0[t.column("truth_missed")], "");

    const auto& r1 = t.rows[1];
    EXPECT_EQ(r1[t.column("cart")], "Lobster | Wings");
    EXPECT_EQ(r1[t.column("truth")], "");
    EXPECT_EQ(r1[t.column("hit1")], "");
    EXPECT_EQ(r1[t.column("hit_rank")], "");
    EXPECT_EQ(r1[t.column("truth_hits")], "");
    EXPECT_EQ(r1[t.column("truth_missed")], "");
}

TEST_F(BatchReportTest, CsvNamesTheTruthItemsThatWereMissed) {
    TestRow row;
    row.row_id = "B1";
    row.cart = {"Wings"};
    row.truth = {"Ranch", "Brownie", "Fries", "Cookie"};
    report.result = evaluate_batch({row}, catalog, matrix, report.score_cfg);

    std::ostringstream out;
    report.write_csv(out);

    std::istringstream in(out.str());
    const CsvTable t = read_csv(in);
    ASSERT_EQ(t.rows.size(), 1u);

    const auto& r = t.rows[0];
    EXPECT_EQ(r[t.column("truth")], "Ranch | Brownie | Fries | Cookie");
    EXPECT_EQ(r[t.column("truth_hits")], "2");
    EXPECT_EQ(r[t.column("truth_missed")], "Brownie | Cookie");
    EXPECT_EQ(r[t.column("hit1")], "1");
    EXPECT_EQ(r[t.column("hit2")], "1");
    EXPECT_EQ(r[t.column("hit3")], "0");
}

TEST_F(BatchReportTest, MetricsJsonCarriesConfigAndScores) {
    const nlohmann::json j = report.metrics_json();

    EXPECT_EQ(j["snapshot_id"], "deadbeef");
    EXPECT_EQ(j["rows"], 2);
    EXPECT_EQ(j["labeled_rows"], 1);
    EXPECT_DOUBLE_EQ(j["recall_at_3"].get<double>(), 1.0);
    EXPECT_DOUBLE_EQ(j["top1_accuracy"].get<double>(), 0.0);
    EXPECT_EQ(j["score_config"]["aggregation"], "sum");
    EXPECT_DOUBLE_EQ(j["score_config"]["category_bias"].get<double>(), 0.15);
}

TEST_F(BatchReportTest, MetricsAreNullWithoutLabels) {
    TestRow row;
    row.row_id = "1";
    row.cart = {"Wings"};
    report.result = evaluate_batch({row}, catalog, matrix);

    const nlohmann::json j = report.metrics_json();
    EXPECT_TRUE(j["recall_at_3"].is_null());
    EXPECT_TRUE(j["precision_at_3"].is_null());
    EXPECT_TRUE(j["top1_accuracy"].is_null());
}

}  // namespace smartcart::test
