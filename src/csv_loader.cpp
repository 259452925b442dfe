#include "../include/csv_loader.hpp"
#include "../include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace {

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    return s.substr(i, j - i);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Splits one CSV record; double quotes group fields and "" escapes a quote
std::vector<std::string> split_record(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                current.push_back('"');
                ++i;
            } else if (c == '"') {
                in_quotes = false;
            } else {
                current.push_back(c);
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(trim(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    fields.push_back(trim(current));
    return fields;
}

// Linear interpolation between closest ranks
double quantile(std::vector<double> values, double q) {
    std::sort(values.begin(), values.end());
    double pos = q * (values.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(pos));
    size_t upper = std::min(lower + 1, values.size() - 1);
    double frac = pos - lower;
    return values[lower] + (values[upper] - values[lower]) * frac;
}

} // namespace

std::optional<size_t> CSVTable::column_index(const std::string& name) const {
    auto it = std::find(header.begin(), header.end(), name);
    if (it == header.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(header.begin(), it));
}

CSVLoader::CSVLoader(std::string x_column, std::string y_column)
    : x_colname(std::move(x_column)), y_colname(std::move(y_column)) {}

bool CSVLoader::is_missing(const std::string& cell) {
    static const std::set<std::string> missing_tokens = {"", "nan", "na", "n/a", "null", "none"};
    return missing_tokens.count(to_lower(trim(cell))) > 0;
}

std::optional<double> CSVLoader::parse_number(const std::string& cell) {
    if (is_missing(cell)) {
        return std::nullopt;
    }
    std::string token = trim(cell);
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(token.c_str(), &end);
    if (end == token.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return value;
}

CSVTable CSVLoader::read_csv(std::istream& in) {
    CSVTable table;
    std::string line;
    size_t line_num = 0;
    bool have_header = false;

    while (std::getline(in, line)) {
        ++line_num;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) {
            continue;
        }

        std::vector<std::string> fields = split_record(line);
        if (!have_header) {
            table.header = std::move(fields);
            have_header = true;
            continue;
        }

        if (fields.size() > table.header.size()) {
            std::ostringstream oss;
            oss << "Expected " << table.header.size() << " fields at line " << line_num
                << ", saw " << fields.size();
            throw std::runtime_error(oss.str());
        }
        fields.resize(table.header.size());
        table.rows.push_back(std::move(fields));
    }

    if (!have_header) {
        throw std::runtime_error("CSV input is empty");
    }
    return table;
}

CSVTable CSVLoader::read_csv_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open CSV file: " + path);
    }
    CSVTable table = read_csv(file);
    Logger::getInstance().log("Read CSV " + path + ": " + std::to_string(table.rows.size()) +
                              " rows, " + std::to_string(table.header.size()) + " columns");
    return table;
}

DataQualityReport CSVLoader::analyze_data_quality(const CSVTable& table) const {
    auto x_idx = table.column_index(x_colname);
    auto y_idx = table.column_index(y_colname);
    if (!x_idx || !y_idx) {
        throw std::invalid_argument("Column not found: " + (x_idx ? y_colname : x_colname));
    }

    DataQualityReport report;
    report.total_rows = table.rows.size();
    report.x_column = x_colname;
    report.y_column = y_colname;

    std::set<std::vector<std::string>> seen;
    size_t duplicates = 0;
    size_t x_missing = 0, y_missing = 0;
    size_t x_strings = 0, y_strings = 0;

    for (const auto& row : table.rows) {
        if (!seen.insert(row).second) {
            duplicates++;
        }
        const std::string& x_cell = row[*x_idx];
        const std::string& y_cell = row[*y_idx];
        if (is_missing(x_cell)) {
            x_missing++;
        } else if (!parse_number(x_cell)) {
            x_strings++;
        }
        if (is_missing(y_cell)) {
            y_missing++;
        } else if (!parse_number(y_cell)) {
            y_strings++;
        }
    }

    if (duplicates > 0) {
        report.summary.push_back(std::to_string(duplicates) + " rows have duplicates");
    }
    if (x_missing > 0) {
        report.summary.push_back(std::to_string(x_missing) + " rows have NaN in X column");
    }
    if (y_missing > 0) {
        report.summary.push_back(std::to_string(y_missing) + " rows have NaN in Y column");
    }
    if (x_strings > 0) {
        report.summary.push_back(x_strings == report.total_rows
                                     ? std::string("X column is all string")
                                     : std::to_string(x_strings) + " rows have string in X column");
    }
    if (y_strings > 0) {
        report.summary.push_back(y_strings == report.total_rows
                                     ? std::string("Y column is all string")
                                     : std::to_string(y_strings) + " rows have string in Y column");
    }
    if (report.summary.empty()) {
        report.summary.push_back("Data looks clean!");
    }
    return report;
}

CleanedDataset CSVLoader::clean_data(const CSVTable& table, const CleaningOptions& options) {
    try {
        auto x_idx = table.column_index(x_colname);
        auto y_idx = table.column_index(y_colname);
        if (!x_idx || !y_idx) {
            throw std::invalid_argument("Column not found: " + (x_idx ? y_colname : x_colname));
        }

        cleaning_summary = CleaningSummary();
        cleaning_summary.original_rows = table.rows.size();
        std::vector<std::vector<std::string>> rows = table.rows;

        if (options.remove_duplicates) {
            std::set<std::vector<std::string>> seen;
            size_t before = rows.size();
            rows.erase(std::remove_if(rows.begin(), rows.end(),
                                      [&](const std::vector<std::string>& row) {
                                          return !seen.insert(row).second;
                                      }),
                       rows.end());
            cleaning_summary.duplicates_removed = before - rows.size();
        }

        if (options.remove_outliers) {
            size_t before = rows.size();
            for (size_t col : {*x_idx, *y_idx}) {
                std::vector<double> values;
                bool numeric_column = true;
                for (const auto& row : rows) {
                    if (is_missing(row[col])) {
                        continue;
                    }
                    auto value = parse_number(row[col]);
                    if (!value) {
                        numeric_column = false;
                        break;
                    }
                    values.push_back(*value);
                }
                // Non-numeric columns are left for the string pass
                if (!numeric_column || values.empty()) {
                    continue;
                }

                double q1 = quantile(values, 0.25);
                double q3 = quantile(values, 0.75);
                double iqr = q3 - q1;
                double lower = q1 - IQR_FACTOR * iqr;
                double upper = q3 + IQR_FACTOR * iqr;

                rows.erase(std::remove_if(rows.begin(), rows.end(),
                                          [&](const std::vector<std::string>& row) {
                                              auto value = parse_number(row[col]);
                                              return !value || *value < lower || *value > upper;
                                          }),
                           rows.end());
            }
            cleaning_summary.outliers_removed = before - rows.size();
        }

        if (options.handle_missing == "remove") {
            size_t before = rows.size();
            rows.erase(std::remove_if(rows.begin(), rows.end(),
                                      [&](const std::vector<std::string>& row) {
                                          return is_missing(row[*x_idx]) || is_missing(row[*y_idx]);
                                      }),
                       rows.end());
            cleaning_summary.missing_values_removed = before - rows.size();
        }

        if (options.remove_strings) {
            size_t before = rows.size();
            rows.erase(std::remove_if(rows.begin(), rows.end(),
                                      [&](const std::vector<std::string>& row) {
                                          return !parse_number(row[*x_idx]) ||
                                                 !parse_number(row[*y_idx]);
                                      }),
                       rows.end());
            cleaning_summary.non_numeric_removed = before - rows.size();
        }

        CleanedDataset dataset;
        dataset.x.reserve(rows.size());
        dataset.y.reserve(rows.size());
        for (const auto& row : rows) {
            for (size_t col : {*x_idx, *y_idx}) {
                if (!is_missing(row[col]) && !parse_number(row[col])) {
                    throw std::runtime_error("Data contains non-numeric value '" + row[col] +
                                             "' in column " + table.header[col]);
                }
            }
            dataset.x.push_back(parse_number(row[*x_idx]).value_or(std::nan("")));
            dataset.y.push_back(parse_number(row[*y_idx]).value_or(std::nan("")));
        }

        // Validate final dataset
        if (dataset.size() == 0) {
            throw std::runtime_error("Cleaning resulted in empty dataset");
        }
        if (dataset.size() < MIN_SAMPLES) {
            throw std::runtime_error("Cleaned dataset too small (minimum " +
                                     std::to_string(MIN_SAMPLES) + " samples required)");
        }
        auto has = [](const Series& s, bool (*pred)(double)) {
            return std::any_of(s.begin(), s.end(), pred);
        };
        if (has(dataset.x, [](double v) { return std::isnan(v); }) ||
            has(dataset.y, [](double v) { return std::isnan(v); })) {
            throw std::runtime_error("Data contains NaN values after cleaning");
        }
        if (has(dataset.x, [](double v) { return std::isinf(v); }) ||
            has(dataset.y, [](double v) { return std::isinf(v); })) {
            throw std::runtime_error("Data contains infinite values");
        }

        cleaning_summary.cleaned_rows = dataset.size();
        cleaning_summary.samples_removed = cleaning_summary.original_rows - dataset.size();
        Logger::getInstance().log("Cleaned data: " + std::to_string(cleaning_summary.original_rows) +
                                  " rows -> " + std::to_string(dataset.size()) + " rows");
        return dataset;
    } catch (const std::exception& e) {
        throw std::runtime_error("Data cleaning failed: " + std::string(e.what()));
    }
}
