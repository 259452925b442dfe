#pragma once
#include "types.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

/// Raw CSV contents: header names and string cells.
struct CSVTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    /// @return column index, or std::nullopt if absent
    std::optional<size_t> column_index(const std::string& name) const;
};

struct CleaningOptions {
    bool remove_duplicates = true;
    bool remove_outliers = false;
    std::string handle_missing = "remove";  ///< "remove" drops rows with a missing x or y
    bool remove_strings = true;
};

struct CleaningSummary {
    size_t original_rows = 0;
    size_t cleaned_rows = 0;
    size_t samples_removed = 0;
    size_t duplicates_removed = 0;
    size_t outliers_removed = 0;
    size_t missing_values_removed = 0;
    size_t non_numeric_removed = 0;
};

struct DataQualityReport {
    size_t total_rows = 0;
    std::string x_column;
    std::string y_column;
    std::vector<std::string> summary;
};

/// Training-ready feature/target columns.
struct CleanedDataset {
    Series x;
    Series y;

    size_t size() const { return x.size(); }
};

/**
 * @brief Reads, inspects and cleans a CSV for two selected columns.
 *
 * Cleaning runs in a fixed order: duplicate rows, IQR outliers, missing
 * values, non-numeric cells. The result is validated before it is returned.
 */
class CSVLoader {
  public:
    static constexpr size_t MIN_SAMPLES = 10;
    static constexpr double IQR_FACTOR = 1.5;

    CSVLoader(std::string x_column, std::string y_column);

    /**
     * @brief Parses CSV text; the first line is the header.
     * @throws std::runtime_error on an empty input or a row with a wrong field count
     */
    static CSVTable read_csv(std::istream& in);
    static CSVTable read_csv_file(const std::string& path);

    /**
     * @brief Reports duplicates, missing and non-numeric cells without modifying the table.
     * @throws std::invalid_argument if a configured column is missing
     */
    DataQualityReport analyze_data_quality(const CSVTable& table) const;

    /**
     * @brief Applies the requested cleaning steps and validates the result.
     * @throws std::runtime_error "Data cleaning failed: ..." on any failure
     */
    CleanedDataset clean_data(const CSVTable& table, const CleaningOptions& options = CleaningOptions());

    const CleaningSummary& get_cleaning_summary() const { return cleaning_summary; }

    static bool is_missing(const std::string& cell);
    static std::optional<double> parse_number(const std::string& cell);

  private:
    std::string x_colname;
    std::string y_colname;
    CleaningSummary cleaning_summary;
};
