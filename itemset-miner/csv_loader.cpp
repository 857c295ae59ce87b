#include "csv_loader.h"
#include "errors.h"
#include "timer.h"
#include <fstream>
#include <iostream>
#include <algorithm>
#include <omp.h>

std::vector<std::vector<std::string>> parse_csv(std::istream& in, char delimiter) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> currentRow;
    std::string currentField;
    bool inQuotes = false;
    bool rowStarted = false;
    char c;

    while (in.get(c)) {
        if (inQuotes) {
            if (c == '"') {
                if (in.peek() == '"') {
                    currentField += '"';
                    in.get();
                } else {
                    inQuotes = false;
                }
            } else {
                currentField += c;
            }
        } else {
            if (c == '"') {
                inQuotes = true;
                rowStarted = true;
            } else if (c == delimiter) {
                currentRow.push_back(std::move(currentField));
                currentField.clear();
                rowStarted = true;
            } else if (c == '\n' || c == '\r') {
                if (rowStarted || !currentField.empty()) {
                    currentRow.push_back(std::move(currentField));
                    records.push_back(std::move(currentRow));
                    currentRow.clear();
                    currentField.clear();
                    rowStarted = false;
                }
                if (c == '\r' && in.peek() == '\n') in.get();
            } else {
                currentField += c;
                rowStarted = true;
            }
        }
    }
    if (rowStarted || !currentField.empty()) {
        currentRow.push_back(std::move(currentField));
        records.push_back(std::move(currentRow));
    }
    return records;
}

std::vector<std::vector<std::string>> read_transactions_csv(std::istream& in,
                                                            const ItemExtractor& extractor,
                                                            const CsvOptions& options) {
    std::vector<std::vector<std::string>> records = parse_csv(in, options.delimiter);
    if (records.empty()) return {};

    std::vector<std::string>& header = records.front();
    // UTF-8 byte order mark
    if (!header.empty() && header[0].compare(0, 3, "\xEF\xBB\xBF") == 0) {
        header[0].erase(0, 3);
    }

    auto col_it = std::find(header.begin(), header.end(), options.items_column);
    if (col_it == header.end()) {
        throw DataIngestionError("CSV header has no '" + options.items_column + "' column");
    }
    size_t col = (size_t)(col_it - header.begin());

    size_t n = records.size() - 1;
    for (size_t i = 0; i < n; ++i) {
        if (records[i + 1].size() <= col) {
            throw DataIngestionError("Row " + std::to_string(i + 1) + " is missing the '" +
                                     options.items_column + "' field");
        }
    }

    std::vector<std::vector<std::string>> transactions(n);

    // Exceptions cannot leave an OpenMP region; keep the first failing row and rethrow after
    size_t bad_row = n;
    std::string bad_reason;

    #pragma omp parallel for
    for (size_t i = 0; i < n; ++i) {
        try {
            transactions[i] = extractor.extract(records[i + 1][col]);
        } catch (const DataIngestionError& e) {
            #pragma omp critical
            {
                if (i < bad_row) {
                    bad_row = i;
                    bad_reason = e.what();
                }
            }
        }
        records[i + 1].clear();
    }

    if (bad_row < n) {
        throw DataIngestionError("Row " + std::to_string(bad_row + 1) + ": " + bad_reason);
    }
    return transactions;
}

std::vector<std::vector<std::string>> load_transactions_csv(const std::string& path,
                                                            const ItemExtractor& extractor,
                                                            const CsvOptions& options) {
    auto total_start = start_timer();
    std::cout << "[LOG] Loading CSV: " << path << " (Delimiter: '" << options.delimiter
              << "', Column: " << options.items_column << ", Items: " << extractor.name() << ")" << std::endl;

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw DataIngestionError("Could not open CSV file: " + path);
    }

    auto transactions = read_transactions_csv(file, extractor, options);
    std::cout << "[LOG] Read " << transactions.size() << " transactions" << std::endl;
    stop_timer("CSV Loading", total_start);
    return transactions;
}
