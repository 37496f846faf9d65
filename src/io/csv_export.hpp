#pragma once

#include "summary/summary.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ExportConfig
// ---------------------------------------------------------------------------
struct ExportConfig {
    std::string output_path;
    bool include_metadata = true;   // "# key=value" lines before the header
};

// ---------------------------------------------------------------------------
// SummaryCsvExporter - summary table as CSV for external plotting
// ---------------------------------------------------------------------------
class SummaryCsvExporter {
public:
    SummaryCsvExporter() = default;
    explicit SummaryCsvExporter(const ExportConfig& config) : config_(config) {}

    std::string header_line() const {
        return "depth,proportion,method,replication,significant,pearson,spearman,"
               "concordance,MSE,estFDP,rFDP,percent";
    }

    std::vector<std::string> metadata_lines(const SummaryStore& summary) const {
        return {
            "# seed=" + std::to_string(summary.seed()),
            "# FDRLevel=" + format_double(summary.fdr_level()),
            "# pAdjustMethod=" + summary.p_adjust_method(),
            std::string("# average=") + (summary.averaged() ? "true" : "false"),
        };
    }

    std::string format_row(const SummaryRow& row) const {
        std::ostringstream ss;
        ss << format_double(row.depth);
        ss << "," << format_double(row.proportion);
        ss << "," << row.method;
        ss << "," << row.replication;
        ss << "," << format_double(row.significant);
        ss << "," << format_double(row.pearson);
        ss << "," << format_double(row.spearman);
        ss << "," << format_double(row.concordance);
        ss << "," << format_double(row.mse);
        ss << "," << format_double(row.est_fdp);
        ss << "," << format_double(row.r_fdp);
        ss << "," << format_double(row.percent);
        return ss.str();
    }

    void export_csv(const SummaryStore& summary) {
        export_csv_filtered(summary, [](const SummaryRow&) { return true; });
    }

    // Only the rows of the listed methods.
    void export_csv(const SummaryStore& summary, const std::vector<std::string>& methods) {
        export_csv_filtered(summary, [&methods](const SummaryRow& row) {
            for (const auto& m : methods) {
                if (row.method == m) return true;
            }
            return false;
        });
    }

private:
    ExportConfig config_;

    void export_csv_filtered(const SummaryStore& summary,
                             std::function<bool(const SummaryRow&)> keep) {
        if (config_.output_path.empty()) return;

        auto parent = std::filesystem::path(config_.output_path).parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent)) {
            throw std::runtime_error("Output directory does not exist: " + parent.string());
        }

        std::ofstream file(config_.output_path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open output file: " + config_.output_path);
        }

        if (config_.include_metadata) {
            for (const auto& line : metadata_lines(summary)) file << line << "\n";
        }
        file << header_line() << "\n";
        for (const auto& row : summary.rows()) {
            if (!keep(row)) continue;
            file << format_row(row) << "\n";
        }
    }

    static std::string format_double(double val) {
        if (std::isnan(val)) return "NA";
        if (std::isinf(val)) return val > 0 ? "Inf" : "-Inf";
        std::ostringstream ss;
        ss << std::setprecision(15) << val;
        return ss.str();
    }
};
