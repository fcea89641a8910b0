#pragma once

#include "errors.hpp"
#include "io/record_csv.hpp"
#include "records/record.hpp"
#include "selection/selection_result.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace parquet_io {

inline void check(const arrow::Status& st, const std::string& what) {
    if (!st.ok()) {
        throw std::runtime_error(what + ": " + st.ToString());
    }
}

inline std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder& b, const std::string& column) {
    std::shared_ptr<arrow::Array> arr;
    check(b.Finish(&arr), "finishing column '" + column + "'");
    return arr;
}

inline void write_table(const arrow::Table& table, const std::string& path) {
    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet output file: " + path + ": " +
                                 outfile_result.status().ToString());
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    int64_t chunk = std::max<int64_t>(1, table.num_rows());
    check(parquet::arrow::WriteTable(table, arrow::default_memory_pool(), outfile, chunk, props),
          "Failed to write Parquet " + path);
    check(outfile->Close(), "closing " + path);
}

inline std::shared_ptr<arrow::Table> read_table(const std::string& path) {
    auto infile_result = arrow::io::ReadableFile::Open(path);
    if (!infile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file: " + path + ": " +
                                 infile_result.status().ToString());
    }
    parquet::arrow::FileReaderBuilder builder;
    check(builder.Open(*infile_result), "opening Parquet " + path);
    std::unique_ptr<parquet::arrow::FileReader> reader;
    check(builder.Build(&reader), "building Parquet reader for " + path);
    std::shared_ptr<arrow::Table> table;
    check(reader->ReadTable(&table), "reading Parquet " + path);
    return table;
}

inline std::shared_ptr<arrow::ChunkedArray> column(const arrow::Table& table,
                                                   const std::string& name) {
    auto col = table.GetColumnByName(name);
    if (!col) {
        throw ConfigurationError("required column '" + name + "' is not present");
    }
    return col;
}

// Numeric column as doubles; nulls become NaN.
inline std::vector<double> doubles(const arrow::ChunkedArray& col, const std::string& name) {
    std::vector<double> out;
    out.reserve(col.length());
    for (const auto& chunk : col.chunks()) {
        for (int64_t i = 0; i < chunk->length(); ++i) {
            if (chunk->IsNull(i)) { out.push_back(std::nan("")); continue; }
            switch (chunk->type_id()) {
                case arrow::Type::DOUBLE:
                    out.push_back(std::static_pointer_cast<arrow::DoubleArray>(chunk)->Value(i));
                    break;
                case arrow::Type::FLOAT:
                    out.push_back(std::static_pointer_cast<arrow::FloatArray>(chunk)->Value(i));
                    break;
                case arrow::Type::INT64:
                    out.push_back(static_cast<double>(
                        std::static_pointer_cast<arrow::Int64Array>(chunk)->Value(i)));
                    break;
                case arrow::Type::INT32:
                    out.push_back(std::static_pointer_cast<arrow::Int32Array>(chunk)->Value(i));
                    break;
                default:
                    throw DataIntegrityError("column '" + name + "' has non-numeric type " +
                                             chunk->type()->ToString());
            }
        }
    }
    return out;
}

inline std::vector<bool> flags(const arrow::ChunkedArray& col, const std::string& name) {
    std::vector<bool> out;
    out.reserve(col.length());
    for (const auto& chunk : col.chunks()) {
        if (chunk->type_id() == arrow::Type::BOOL) {
            auto arr = std::static_pointer_cast<arrow::BooleanArray>(chunk);
            for (int64_t i = 0; i < arr->length(); ++i) {
                out.push_back(!arr->IsNull(i) && arr->Value(i));
            }
            continue;
        }
        arrow::ChunkedArray single(chunk);
        for (double v : doubles(single, name)) {
            if (!std::isnan(v) && v != 0.0 && v != 1.0) {
                throw DataIntegrityError("column '" + name + "' is not a 0/1 flag");
            }
            out.push_back(v == 1.0);
        }
    }
    return out;
}

// String or integer column as text.
inline std::vector<std::string> strings(const arrow::ChunkedArray& col, const std::string& name) {
    std::vector<std::string> out;
    out.reserve(col.length());
    for (const auto& chunk : col.chunks()) {
        for (int64_t i = 0; i < chunk->length(); ++i) {
            if (chunk->IsNull(i)) { out.emplace_back(); continue; }
            switch (chunk->type_id()) {
                case arrow::Type::STRING:
                    out.push_back(std::static_pointer_cast<arrow::StringArray>(chunk)->GetString(i));
                    break;
                case arrow::Type::INT64:
                    out.push_back(std::to_string(
                        std::static_pointer_cast<arrow::Int64Array>(chunk)->Value(i)));
                    break;
                case arrow::Type::INT32:
                    out.push_back(std::to_string(
                        std::static_pointer_cast<arrow::Int32Array>(chunk)->Value(i)));
                    break;
                default:
                    throw DataIntegrityError("column '" + name + "' has unsupported type " +
                                             chunk->type()->ToString());
            }
        }
    }
    return out;
}

}  // namespace parquet_io

inline RecordSet read_records_parquet(const std::string& path, const ColumnMapping& mapping) {
    auto table = parquet_io::read_table(path);

    RecordSet rs;
    rs.has_outcome = !mapping.outcome_column.empty();
    if (rs.has_outcome) rs.outcome_name = mapping.outcome_column;
    rs.score_names = mapping.score_columns;
    rs.predicate_names = mapping.predicate_columns;

    auto ids = parquet_io::strings(*parquet_io::column(*table, mapping.id_column),
                                   mapping.id_column);
    std::vector<double> outcomes;
    if (rs.has_outcome) {
        outcomes = parquet_io::doubles(*parquet_io::column(*table, mapping.outcome_column),
                                       mapping.outcome_column);
    }
    std::vector<std::vector<double>> scores;
    for (const auto& s : mapping.score_columns) {
        scores.push_back(parquet_io::doubles(*parquet_io::column(*table, s), s));
    }
    std::vector<std::vector<bool>> preds;
    for (const auto& p : mapping.predicate_columns) {
        preds.push_back(parquet_io::flags(*parquet_io::column(*table, p), p));
    }
    std::vector<std::string> labels;
    if (!mapping.label_column.empty() && table->GetColumnByName(mapping.label_column)) {
        labels = parquet_io::strings(*table->GetColumnByName(mapping.label_column),
                                     mapping.label_column);
    }

    rs.records.resize(ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        auto& r = rs.records[i];
        r.id = ids[i];
        if (rs.has_outcome) r.outcome = outcomes[i];
        for (const auto& col : scores) r.scores.push_back(col[i]);
        for (const auto& col : preds) r.predicates.push_back(col[i]);
        if (!labels.empty()) r.predicted_label = labels[i];
    }
    rs.validate();
    return rs;
}

// Column names follow `mapping` so read_records_parquet can load the file back.
inline void write_records_parquet(const RecordSet& rs, const std::string& path,
                                  const ColumnMapping& mapping = {}) {
    arrow::FieldVector fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;

    {
        arrow::StringBuilder b;
        for (const auto& r : rs.records) parquet_io::check(b.Append(r.id), mapping.id_column);
        fields.push_back(arrow::field(mapping.id_column, arrow::utf8()));
        arrays.push_back(parquet_io::finish(b, mapping.id_column));
    }
    if (rs.has_outcome) {
        arrow::DoubleBuilder b;
        for (const auto& r : rs.records) parquet_io::check(b.Append(r.outcome), rs.outcome_name);
        fields.push_back(arrow::field(rs.outcome_name, arrow::float64()));
        arrays.push_back(parquet_io::finish(b, rs.outcome_name));
    }
    for (size_t k = 0; k < rs.score_names.size(); ++k) {
        arrow::DoubleBuilder b;
        for (const auto& r : rs.records) parquet_io::check(b.Append(r.scores[k]), rs.score_names[k]);
        fields.push_back(arrow::field(rs.score_names[k], arrow::float64()));
        arrays.push_back(parquet_io::finish(b, rs.score_names[k]));
    }
    for (size_t k = 0; k < rs.predicate_names.size(); ++k) {
        arrow::BooleanBuilder b;
        for (const auto& r : rs.records) {
            parquet_io::check(b.Append(r.predicates[k]), rs.predicate_names[k]);
        }
        fields.push_back(arrow::field(rs.predicate_names[k], arrow::boolean()));
        arrays.push_back(parquet_io::finish(b, rs.predicate_names[k]));
    }
    if (!mapping.label_column.empty()) {
        arrow::StringBuilder b;
        for (const auto& r : rs.records) {
            parquet_io::check(b.Append(r.predicted_label), mapping.label_column);
        }
        fields.push_back(arrow::field(mapping.label_column, arrow::utf8()));
        arrays.push_back(parquet_io::finish(b, mapping.label_column));
    }

    auto table = arrow::Table::Make(arrow::schema(fields), arrays);
    parquet_io::write_table(*table, path);
}

inline void write_selection_parquet(const SelectionResult& sel, const std::string& path) {
    auto rows = sel.table();
    arrow::Int64Builder row_b;
    arrow::StringBuilder id_b, method_b, reason_b;
    arrow::BooleanBuilder selected_b, overrun_b;
    arrow::DoubleBuilder cost_b, score_b;
    for (const auto& s : rows) {
        parquet_io::check(row_b.Append(static_cast<int64_t>(s.row)), "row");
        parquet_io::check(id_b.Append(s.id), "id");
        parquet_io::check(method_b.Append(sel.method), "method");
        parquet_io::check(selected_b.Append(s.selected), "selected");
        parquet_io::check(cost_b.Append(s.cost), "cost");
        parquet_io::check(score_b.Append(s.score), "score");
        parquet_io::check(reason_b.Append(s.reason), "reason");
        parquet_io::check(overrun_b.Append(sel.budget_overrun), "budget_overrun");
    }

    auto schema = arrow::schema({
        arrow::field("row", arrow::int64()),
        arrow::field("id", arrow::utf8()),
        arrow::field("method", arrow::utf8()),
        arrow::field("selected", arrow::boolean()),
        arrow::field("cost", arrow::float64()),
        arrow::field("score", arrow::float64()),
        arrow::field("reason", arrow::utf8()),
        arrow::field("budget_overrun", arrow::boolean()),
    });
    std::vector<std::shared_ptr<arrow::Array>> arrays = {
        parquet_io::finish(row_b, "row"),
        parquet_io::finish(id_b, "id"),
        parquet_io::finish(method_b, "method"),
        parquet_io::finish(selected_b, "selected"),
        parquet_io::finish(cost_b, "cost"),
        parquet_io::finish(score_b, "score"),
        parquet_io::finish(reason_b, "reason"),
        parquet_io::finish(overrun_b, "budget_overrun"),
    };
    auto table = arrow::Table::Make(schema, arrays);
    parquet_io::write_table(*table, path);
}
