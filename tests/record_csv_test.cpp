// record_csv_test.cpp — tests for CSV record loading and the CSV artifact
// writers

#include <gtest/gtest.h>
#include "io/record_csv.hpp"
#include "selection/random_selection.hpp"
#include "test_record_helpers.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace {

ColumnMapping wafer_mapping() {
    ColumnMapping m;
    m.score_columns = {"risk_score", "severity"};
    m.predicate_columns = {"edge_ring"};
    return m;
}

}  // anonymous namespace

// ===========================================================================
// Reading
// ===========================================================================
TEST(RecordCsvTest, ReadsMappedColumns) {
    std::istringstream in(
        "wafer_id,lot,yield,risk_score,severity,edge_ring,pred_label\n"
        "W1,L7,0.91,0.1,0.3,0,Center\n"
        "W2,L7,0.42,0.8,0.9,1,Edge-Ring\n"
        "W3,L8,0.77,0.3,,false,\"Scratch, minor\"\n");
    auto rs = read_records_csv(in, wafer_mapping());
    ASSERT_EQ(rs.size(), 3u);
    EXPECT_EQ(rs.records[1].id, "W2");
    EXPECT_DOUBLE_EQ(rs.records[1].outcome, 0.42);
    EXPECT_DOUBLE_EQ(rs.records[1].scores[1], 0.9);
    EXPECT_TRUE(rs.records[1].predicates[0]);
    EXPECT_FALSE(rs.records[2].predicates[0]);
    EXPECT_TRUE(std::isnan(rs.records[2].scores[1]));
    EXPECT_EQ(rs.records[2].predicted_label, "Scratch, minor");
    EXPECT_EQ(rs.score_names, (std::vector<std::string>{"risk_score", "severity"}));
}

TEST(RecordCsvTest, MissingLabelColumnLeavesLabelsBlank) {
    std::istringstream in("wafer_id,yield,risk_score\nW1,0.5,0.5\n");
    auto rs = read_records_csv(in, ColumnMapping{});
    EXPECT_EQ(rs.records[0].predicted_label, "");
}

TEST(RecordCsvTest, MissingRequiredColumnIsConfigurationError) {
    std::istringstream in("wafer_id,yield\nW1,0.5\n");
    EXPECT_THROW(read_records_csv(in, ColumnMapping{}), ConfigurationError);
}

TEST(RecordCsvTest, MalformedRowsAreDataIntegrityErrors) {
    std::istringstream ragged("wafer_id,yield,risk_score\nW1,0.5\n");
    EXPECT_THROW(read_records_csv(ragged, ColumnMapping{}), DataIntegrityError);

    std::istringstream text("wafer_id,yield,risk_score\nW1,high,0.5\n");
    EXPECT_THROW(read_records_csv(text, ColumnMapping{}), DataIntegrityError);

    std::istringstream dup("wafer_id,yield,risk_score\nW1,0.5,0.1\nW1,0.6,0.2\n");
    EXPECT_THROW(read_records_csv(dup, ColumnMapping{}), DataIntegrityError);

    std::istringstream empty("");
    EXPECT_THROW(read_records_csv(empty, ColumnMapping{}), DataIntegrityError);
}

TEST(RecordCsvTest, BadFlagIsDataIntegrityError) {
    ColumnMapping m;
    m.predicate_columns = {"edge_ring"};
    std::istringstream in("wafer_id,yield,risk_score,edge_ring\nW1,0.5,0.1,maybe\n");
    EXPECT_THROW(read_records_csv(in, m), DataIntegrityError);
}

TEST(RecordCsvTest, UnreadablePathThrows) {
    EXPECT_THROW(read_records_csv("/nonexistent_dir_xyz/records.csv", ColumnMapping{}),
                 std::runtime_error);
}

// ===========================================================================
// Writing
// ===========================================================================
TEST(RecordCsvTest, SelectionCsvListsSelectedThenRemainder) {
    auto rs = test_helpers::make_uniform_records(20);
    RandomSelectionConfig cfg;
    cfg.rate = 0.1;
    cfg.unit_cost = 2.5;
    auto sel = selection::random_select(rs, cfg);

    std::ostringstream out;
    write_selection_csv(out, sel);
    std::istringstream in(out.str());
    std::string line;
    std::getline(in, line);
    EXPECT_EQ(line, "row,id,method,selected,cost,score,reason,budget_overrun");

    std::vector<std::vector<std::string>> rows;
    while (std::getline(in, line)) rows.push_back(record_io::split_csv_line(line));
    ASSERT_EQ(rows.size(), 20u);
    EXPECT_EQ(rows[0][3], "1");
    EXPECT_EQ(rows[0][4], "2.5");
    EXPECT_EQ(rows[0][6], selection_reason::RANDOM_SAMPLE);
    EXPECT_EQ(rows[1][3], "1");
    EXPECT_EQ(rows[2][3], "0");
}

TEST(RecordCsvTest, MethodComparisonCsvIsRelativeToFirstMethod) {
    Metrics random;
    random.method = "random";
    random.n_selected = 10;
    random.total_cost = 10.0;
    random.recall = 0.1;
    random.fn = 18;
    Metrics framework;
    framework.method = "budgeted_mandatory";
    framework.n_selected = 4;
    framework.total_cost = 5.0;
    framework.recall = 0.35;
    framework.fn = 13;
    framework.cost_per_catch = 5.0 / 7.0;

    std::ostringstream out;
    write_method_comparison_csv(out, compare_methods({random, framework}));
    std::istringstream in(out.str());
    std::string line;
    std::getline(in, line);
    EXPECT_EQ(line, "method,n_selected,selection_rate,recall,precision,f1,cost_per_catch,"
                    "missed_high_risk,delta_selected,delta_cost_pct,delta_recall");

    std::vector<std::vector<std::string>> rows;
    while (std::getline(in, line)) rows.push_back(record_io::split_csv_line(line));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0][0], "random");
    EXPECT_EQ(rows[0][6], "inf");
    EXPECT_EQ(rows[0][8], "0");
    EXPECT_EQ(rows[1][0], "budgeted_mandatory");
    EXPECT_EQ(rows[1][7], "13");
    EXPECT_EQ(rows[1][8], "-6");
    EXPECT_EQ(rows[1][9], "-50");
    EXPECT_NEAR(std::stod(rows[1][10]), 0.25, 1e-12);
}

TEST(RecordCsvTest, CsvFieldQuotesWhenNeeded) {
    EXPECT_EQ(record_io::csv_field("plain"), "plain");
    EXPECT_EQ(record_io::csv_field("a,b"), "\"a,b\"");
    EXPECT_EQ(record_io::csv_field("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(record_io::split_csv_line("\"a,b\",\"x\"\"y\",z"),
              (std::vector<std::string>{"a,b", "x\"y", "z"}));
    EXPECT_EQ(record_io::csv_num(std::numeric_limits<double>::infinity()), "inf");
}

TEST(RecordCsvTest, SeedSweepCsvHasOneRowPerSeed) {
    MultiSeedConfig cfg;
    cfg.n_seeds = 3;
    auto res = run_multi_seed_sweep({true, false, true, false, false, true, false, false, false, true},
                                    cfg);
    std::ostringstream out;
    write_seed_sweep_csv(out, res);
    std::istringstream in(out.str());
    std::string line;
    int n = 0;
    std::getline(in, line);
    EXPECT_EQ(line, "seed,tp,fn,recall");
    while (std::getline(in, line)) ++n;
    EXPECT_EQ(n, 3);
}
