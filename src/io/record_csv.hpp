#pragma once

#include "errors.hpp"
#include "evaluation/evaluator.hpp"
#include "records/record.hpp"
#include "selection/selection_result.hpp"
#include "sweep/multi_seed_sweep.hpp"
#include "sweep/sensitivity_sweep.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

// ---------------------------------------------------------------------------
// ColumnMapping — which source columns feed a RecordSet
//
// An empty outcome_column loads a set without outcomes (scoring-only input).
// An empty label_column leaves predicted labels blank.
// ---------------------------------------------------------------------------
struct ColumnMapping {
    std::string id_column = "wafer_id";
    std::string outcome_column = "yield";
    std::vector<std::string> score_columns = {"risk_score"};
    std::vector<std::string> predicate_columns;
    std::string label_column = "pred_label";
};

namespace record_io {

// Splits one CSV line. Double-quoted fields may contain commas and "" escapes.
inline std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string cur;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                cur += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                cur += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(cur);
            cur.clear();
        } else if (c != '\r') {
            cur += c;
        }
    }
    fields.push_back(cur);
    return fields;
}

inline double parse_double(const std::string& s, const std::string& column, size_t line_no) {
    if (s.empty() || s == "nan" || s == "NaN") return std::nan("");
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0') {
        throw DataIntegrityError("line " + std::to_string(line_no) + ": column '" + column +
                                 "' value '" + s + "' is not numeric");
    }
    return v;
}

inline bool parse_flag(const std::string& s, const std::string& column, size_t line_no) {
    if (s == "1" || s == "true" || s == "True" || s == "TRUE" || s == "1.0") return true;
    if (s.empty() || s == "0" || s == "false" || s == "False" || s == "FALSE" || s == "0.0") {
        return false;
    }
    throw DataIntegrityError("line " + std::to_string(line_no) + ": column '" + column +
                             "' value '" + s + "' is not a boolean");
}

inline std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += "\"\"";
        else out += c;
    }
    return out + "\"";
}

inline std::string csv_num(double v) {
    if (std::isnan(v)) return "";
    if (std::isinf(v)) return v > 0 ? "inf" : "-inf";
    std::ostringstream ss;
    ss << std::setprecision(12) << v;
    return ss.str();
}

}  // namespace record_io

inline RecordSet read_records_csv(std::istream& in, const ColumnMapping& mapping) {
    std::string line;
    if (!std::getline(in, line)) {
        throw DataIntegrityError("record CSV is empty");
    }
    auto header = record_io::split_csv_line(line);
    std::unordered_map<std::string, size_t> col;
    for (size_t i = 0; i < header.size(); ++i) col[header[i]] = i;

    auto require = [&](const std::string& name) {
        auto it = col.find(name);
        if (it == col.end()) {
            throw ConfigurationError("required column '" + name + "' is not present");
        }
        return it->second;
    };

    size_t id_col = require(mapping.id_column);
    bool has_outcome = !mapping.outcome_column.empty();
    size_t outcome_col = has_outcome ? require(mapping.outcome_column) : 0;
    std::vector<size_t> score_cols, pred_cols;
    for (const auto& s : mapping.score_columns) score_cols.push_back(require(s));
    for (const auto& p : mapping.predicate_columns) pred_cols.push_back(require(p));
    bool has_label = !mapping.label_column.empty() && col.count(mapping.label_column) > 0;
    size_t label_col = has_label ? col[mapping.label_column] : 0;

    RecordSet rs;
    rs.has_outcome = has_outcome;
    if (has_outcome) rs.outcome_name = mapping.outcome_column;
    rs.score_names = mapping.score_columns;
    rs.predicate_names = mapping.predicate_columns;

    size_t line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty() || line == "\r") continue;
        auto f = record_io::split_csv_line(line);
        if (f.size() != header.size()) {
            throw DataIntegrityError("line " + std::to_string(line_no) + " has " +
                                     std::to_string(f.size()) + " fields, header has " +
                                     std::to_string(header.size()));
        }
        Record r;
        r.id = f[id_col];
        if (has_outcome) {
            r.outcome = record_io::parse_double(f[outcome_col], mapping.outcome_column, line_no);
        }
        for (size_t k = 0; k < score_cols.size(); ++k) {
            r.scores.push_back(
                record_io::parse_double(f[score_cols[k]], mapping.score_columns[k], line_no));
        }
        for (size_t k = 0; k < pred_cols.size(); ++k) {
            r.predicates.push_back(
                record_io::parse_flag(f[pred_cols[k]], mapping.predicate_columns[k], line_no));
        }
        if (has_label) r.predicted_label = f[label_col];
        rs.records.push_back(std::move(r));
    }
    rs.validate();
    return rs;
}

inline RecordSet read_records_csv(const std::string& path, const ColumnMapping& mapping) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open record file: " + path);
    }
    return read_records_csv(in, mapping);
}

// Selected rows first, then the remainder.
inline void write_selection_csv(std::ostream& out, const SelectionResult& sel) {
    out << "row,id,method,selected,cost,score,reason,budget_overrun\n";
    for (const auto& s : sel.table()) {
        out << s.row << "," << record_io::csv_field(s.id) << ","
            << record_io::csv_field(sel.method) << "," << (s.selected ? 1 : 0) << ","
            << record_io::csv_num(s.cost) << "," << record_io::csv_num(s.score) << ","
            << record_io::csv_field(s.reason) << "," << (sel.budget_overrun ? 1 : 0) << "\n";
    }
}

// Delta table against the first method, one row per method.
inline void write_method_comparison_csv(std::ostream& out, const std::vector<MethodDelta>& rows) {
    out << "method,n_selected,selection_rate,recall,precision,f1,cost_per_catch,"
           "missed_high_risk,delta_selected,delta_cost_pct,delta_recall\n";
    for (const auto& d : rows) {
        out << record_io::csv_field(d.method) << "," << d.n_selected << ","
            << record_io::csv_num(d.selection_rate) << "," << record_io::csv_num(d.recall) << ","
            << record_io::csv_num(d.precision) << "," << record_io::csv_num(d.f1) << ","
            << record_io::csv_num(d.cost_per_catch) << "," << d.missed_high_risk << ","
            << d.delta_selected << "," << record_io::csv_num(d.delta_cost_pct) << ","
            << record_io::csv_num(d.delta_recall) << "\n";
    }
}

inline void write_sensitivity_csv(std::ostream& out, const SensitivitySweepResult& r) {
    out << "r,method,selection_rate,recall,normalized_cost,cost_per_catch,dominance_type\n";
    for (const auto& row : r.rows) {
        out << record_io::csv_num(row.r) << "," << record_io::csv_field(row.method) << ","
            << record_io::csv_num(row.selection_rate) << "," << record_io::csv_num(row.recall)
            << "," << record_io::csv_num(row.normalized_cost) << ","
            << record_io::csv_num(row.cost_per_catch) << ","
            << (row.dominance ? to_string(*row.dominance) : "") << "\n";
    }
}

inline void write_seed_sweep_csv(std::ostream& out, const MultiSeedResult& r) {
    out << "seed,tp,fn,recall\n";
    for (const auto& row : r.rows) {
        out << row.seed << "," << row.tp << "," << row.fn << ","
            << record_io::csv_num(row.recall) << "\n";
    }
}

template <typename Writer, typename T>
void write_csv_file(const std::string& path, Writer writer, const T& value) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    writer(out, value);
    if (!out) {
        throw std::runtime_error("Failed writing: " + path);
    }
}
