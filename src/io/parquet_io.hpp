#pragma once

#include "core/results_store.hpp"
#include "core/seed.hpp"
#include "summary/summary.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <parquet/properties.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Parquet persistence of results and summaries. Missing values are written as
// nulls; store parameters travel as schema key-value metadata.
// ---------------------------------------------------------------------------
namespace store_io {

inline void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) throw std::runtime_error(what + ": " + status.ToString());
}

inline std::string format_exact(double v) {
    std::ostringstream ss;
    ss << std::setprecision(17) << v;
    return ss.str();
}

// ---------------------------------------------------------------------------
// Column builders
// ---------------------------------------------------------------------------
template <typename Row, typename Get>
std::shared_ptr<arrow::Array> double_column(const std::vector<Row>& rows, Get get) {
    arrow::DoubleBuilder b;
    check(b.Reserve(static_cast<int64_t>(rows.size())), "reserve");
    for (const auto& row : rows) {
        double v = get(row);
        if (std::isnan(v)) check(b.AppendNull(), "append");
        else check(b.Append(v), "append");
    }
    std::shared_ptr<arrow::Array> arr;
    check(b.Finish(&arr), "finish column");
    return arr;
}

template <typename Row, typename Get>
std::shared_ptr<arrow::Array> string_column(const std::vector<Row>& rows, Get get) {
    arrow::StringBuilder b;
    for (const auto& row : rows) check(b.Append(get(row)), "append");
    std::shared_ptr<arrow::Array> arr;
    check(b.Finish(&arr), "finish column");
    return arr;
}

template <typename Builder, typename Row, typename Get>
std::shared_ptr<arrow::Array> integer_column(const std::vector<Row>& rows, Get get) {
    Builder b;
    check(b.Reserve(static_cast<int64_t>(rows.size())), "reserve");
    for (const auto& row : rows) check(b.Append(get(row)), "append");
    std::shared_ptr<arrow::Array> arr;
    check(b.Finish(&arr), "finish column");
    return arr;
}

// ---------------------------------------------------------------------------
// Column readers
// ---------------------------------------------------------------------------
inline std::shared_ptr<arrow::ChunkedArray> require_column(const arrow::Table& table,
                                                           const std::string& name,
                                                           arrow::Type::type type) {
    auto col = table.GetColumnByName(name);
    if (!col) throw std::runtime_error("Parquet file has no column '" + name + "'");
    if (col->type()->id() != type) {
        throw std::runtime_error("Column '" + name + "' has type " + col->type()->ToString());
    }
    return col;
}

inline std::vector<double> read_doubles(const arrow::Table& table, const std::string& name) {
    auto col = require_column(table, name, arrow::Type::DOUBLE);
    std::vector<double> out;
    out.reserve(static_cast<size_t>(col->length()));
    for (const auto& chunk : col->chunks()) {
        auto arr = std::static_pointer_cast<arrow::DoubleArray>(chunk);
        for (int64_t i = 0; i < arr->length(); ++i) {
            out.push_back(arr->IsNull(i) ? NA : arr->Value(i));
        }
    }
    return out;
}

inline std::vector<std::string> read_strings(const arrow::Table& table, const std::string& name) {
    auto col = require_column(table, name, arrow::Type::STRING);
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(col->length()));
    for (const auto& chunk : col->chunks()) {
        auto arr = std::static_pointer_cast<arrow::StringArray>(chunk);
        for (int64_t i = 0; i < arr->length(); ++i) out.push_back(arr->GetString(i));
    }
    return out;
}

template <typename ArrayType, typename T>
std::vector<T> read_integers(const arrow::Table& table, const std::string& name,
                             arrow::Type::type type) {
    auto col = require_column(table, name, type);
    std::vector<T> out;
    out.reserve(static_cast<size_t>(col->length()));
    for (const auto& chunk : col->chunks()) {
        auto arr = std::static_pointer_cast<ArrayType>(chunk);
        for (int64_t i = 0; i < arr->length(); ++i) out.push_back(static_cast<T>(arr->Value(i)));
    }
    return out;
}

inline std::string require_metadata(const arrow::Table& table, const std::string& key) {
    auto meta = table.schema()->metadata();
    if (!meta) throw std::runtime_error("Parquet file carries no metadata");
    int idx = meta->FindKey(key);
    if (idx < 0) throw std::runtime_error("Parquet metadata has no key '" + key + "'");
    return meta->value(idx);
}

// ---------------------------------------------------------------------------
// File access
// ---------------------------------------------------------------------------
inline void write_table(const std::shared_ptr<arrow::Table>& table, const std::string& path) {
    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet output file: " + path + ": " +
                                 outfile_result.status().ToString());
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();
    auto arrow_props = parquet::ArrowWriterProperties::Builder().store_schema()->build();

    int64_t chunk = std::max<int64_t>(table->num_rows(), 1);
    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, chunk,
                                     props, arrow_props),
          "Failed to write Parquet " + path);
    check(outfile->Close(), "Failed to close " + path);
}

inline std::shared_ptr<arrow::Table> read_table(const std::string& path) {
    auto open_result = arrow::io::ReadableFile::Open(path);
    if (!open_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file: " + path + ": " +
                                 open_result.status().ToString());
    }
    auto file_reader_result =
        parquet::arrow::OpenFile(open_result.ValueOrDie(), arrow::default_memory_pool());
    if (!file_reader_result.ok()) {
        throw std::runtime_error("Not a Parquet file: " + path + ": " +
                                 file_reader_result.status().ToString());
    }
    auto reader = file_reader_result.MoveValueUnsafe();

    std::shared_ptr<arrow::Table> table;
    check(reader->ReadTable(&table), "Failed to read Parquet " + path);
    return table;
}

// ---------------------------------------------------------------------------
// ResultsStore
// ---------------------------------------------------------------------------
inline const std::vector<std::string>& result_core_columns() {
    static const std::vector<std::string> cols = {
        "ID", "count", "depth", "proportion", "replication",
        "method", "coefficient", "pvalue", "qvalue"};
    return cols;
}

inline void write_results_parquet(const ResultsStore& store, const std::string& path) {
    const auto& rows = store.rows();
    auto ext = store.extension_columns();

    arrow::FieldVector fields;
    fields.push_back(arrow::field("ID", arrow::utf8()));
    fields.push_back(arrow::field("count", arrow::float64()));
    fields.push_back(arrow::field("depth", arrow::int64()));
    fields.push_back(arrow::field("proportion", arrow::float64()));
    fields.push_back(arrow::field("replication", arrow::int32()));
    fields.push_back(arrow::field("method", arrow::utf8()));
    fields.push_back(arrow::field("coefficient", arrow::float64()));
    fields.push_back(arrow::field("pvalue", arrow::float64()));
    fields.push_back(arrow::field("qvalue", arrow::float64()));
    for (const auto& name : ext) fields.push_back(arrow::field(name, arrow::float64()));

    auto metadata = arrow::key_value_metadata({"seed"}, {std::to_string(store.seed())});
    auto schema = arrow::schema(fields, metadata);

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    arrays.push_back(string_column(rows, [](const ResultRow& r) { return r.id; }));
    arrays.push_back(double_column(rows, [](const ResultRow& r) { return r.count; }));
    arrays.push_back(integer_column<arrow::Int64Builder>(
        rows, [](const ResultRow& r) { return r.depth; }));
    arrays.push_back(double_column(rows, [](const ResultRow& r) { return r.proportion; }));
    arrays.push_back(integer_column<arrow::Int32Builder>(
        rows, [](const ResultRow& r) { return static_cast<int32_t>(r.replication); }));
    arrays.push_back(string_column(rows, [](const ResultRow& r) { return r.method; }));
    arrays.push_back(double_column(rows, [](const ResultRow& r) { return r.coefficient; }));
    arrays.push_back(double_column(rows, [](const ResultRow& r) { return r.pvalue; }));
    arrays.push_back(double_column(rows, [](const ResultRow& r) { return r.qvalue; }));
    for (const auto& name : ext) {
        arrays.push_back(
            double_column(rows, [&name](const ResultRow& r) { return r.extension(name); }));
    }

    write_table(arrow::Table::Make(schema, arrays), path);
}

inline ResultsStore read_results_parquet(const std::string& path) {
    auto table = read_table(path);
    Seed seed = std::stoull(require_metadata(*table, "seed"));

    auto ids = read_strings(*table, "ID");
    auto count = read_doubles(*table, "count");
    auto depth = read_integers<arrow::Int64Array, int64_t>(*table, "depth", arrow::Type::INT64);
    auto proportion = read_doubles(*table, "proportion");
    auto replication =
        read_integers<arrow::Int32Array, int>(*table, "replication", arrow::Type::INT32);
    auto method = read_strings(*table, "method");
    auto coefficient = read_doubles(*table, "coefficient");
    auto pvalue = read_doubles(*table, "pvalue");
    auto qvalue = read_doubles(*table, "qvalue");

    const auto& core = result_core_columns();
    std::set<std::string> core_set(core.begin(), core.end());
    std::vector<std::pair<std::string, std::vector<double>>> ext;
    for (const auto& field : table->schema()->fields()) {
        if (core_set.count(field->name())) continue;
        ext.emplace_back(field->name(), read_doubles(*table, field->name()));
    }

    std::vector<ResultRow> rows(ids.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        auto& r = rows[i];
        r.id = ids[i];
        r.count = count[i];
        r.depth = depth[i];
        r.proportion = proportion[i];
        r.replication = replication[i];
        r.method = method[i];
        r.coefficient = coefficient[i];
        r.pvalue = pvalue[i];
        r.qvalue = qvalue[i];
        for (const auto& [name, values] : ext) r.extra[name] = values[i];
    }
    return ResultsStore(seed, std::move(rows));
}

// ---------------------------------------------------------------------------
// SummaryStore
// ---------------------------------------------------------------------------
inline void write_summary_parquet(const SummaryStore& summary, const std::string& path) {
    const auto& rows = summary.rows();

    arrow::FieldVector fields;
    fields.push_back(arrow::field("depth", arrow::float64()));
    fields.push_back(arrow::field("proportion", arrow::float64()));
    fields.push_back(arrow::field("method", arrow::utf8()));
    fields.push_back(arrow::field("replication", arrow::int32()));
    for (const char* name : {"significant", "pearson", "spearman", "concordance", "MSE",
                             "estFDP", "rFDP", "percent"}) {
        fields.push_back(arrow::field(name, arrow::float64()));
    }

    auto metadata = arrow::key_value_metadata(
        {"seed", "FDRLevel", "pAdjustMethod", "average"},
        {std::to_string(summary.seed()), format_exact(summary.fdr_level()),
         summary.p_adjust_method(), summary.averaged() ? "true" : "false"});
    auto schema = arrow::schema(fields, metadata);

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    arrays.push_back(double_column(rows, [](const SummaryRow& r) { return r.depth; }));
    arrays.push_back(double_column(rows, [](const SummaryRow& r) { return r.proportion; }));
    arrays.push_back(string_column(rows, [](const SummaryRow& r) { return r.method; }));
    arrays.push_back(integer_column<arrow::Int32Builder>(
        rows, [](const SummaryRow& r) { return static_cast<int32_t>(r.replication); }));
    arrays.push_back(double_column(rows, [](const SummaryRow& r) { return r.significant; }));
    arrays.push_back(double_column(rows, [](const SummaryRow& r) { return r.pearson; }));
    arrays.push_back(double_column(rows, [](const SummaryRow& r) { return r.spearman; }));
    arrays.push_back(double_column(rows, [](const SummaryRow& r) { return r.concordance; }));
    arrays.push_back(double_column(rows, [](const SummaryRow& r) { return r.mse; }));
    arrays.push_back(double_column(rows, [](const SummaryRow& r) { return r.est_fdp; }));
    arrays.push_back(double_column(rows, [](const SummaryRow& r) { return r.r_fdp; }));
    arrays.push_back(double_column(rows, [](const SummaryRow& r) { return r.percent; }));

    write_table(arrow::Table::Make(schema, arrays), path);
}

inline SummaryStore read_summary_parquet(const std::string& path) {
    auto table = read_table(path);
    Seed seed = std::stoull(require_metadata(*table, "seed"));
    double fdr_level = std::stod(require_metadata(*table, "FDRLevel"));
    std::string p_adjust_method = require_metadata(*table, "pAdjustMethod");
    bool averaged = require_metadata(*table, "average") == "true";

    auto depth = read_doubles(*table, "depth");
    auto proportion = read_doubles(*table, "proportion");
    auto method = read_strings(*table, "method");
    auto replication =
        read_integers<arrow::Int32Array, int>(*table, "replication", arrow::Type::INT32);
    auto significant = read_doubles(*table, "significant");
    auto pearson = read_doubles(*table, "pearson");
    auto spearman = read_doubles(*table, "spearman");
    auto concordance = read_doubles(*table, "concordance");
    auto mse = read_doubles(*table, "MSE");
    auto est_fdp = read_doubles(*table, "estFDP");
    auto r_fdp = read_doubles(*table, "rFDP");
    auto percent = read_doubles(*table, "percent");

    std::vector<SummaryRow> rows(depth.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        auto& r = rows[i];
        r.depth = depth[i];
        r.proportion = proportion[i];
        r.method = method[i];
        r.replication = replication[i];
        r.significant = significant[i];
        r.pearson = pearson[i];
        r.spearman = spearman[i];
        r.concordance = concordance[i];
        r.mse = mse[i];
        r.est_fdp = est_fdp[i];
        r.r_fdp = r_fdp[i];
        r.percent = percent[i];
    }
    return SummaryStore(seed, fdr_level, std::move(p_adjust_method), averaged, std::move(rows));
}

}  // namespace store_io
