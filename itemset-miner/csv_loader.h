#ifndef CSV_LOADER_H
#define CSV_LOADER_H

#include <vector>
#include <string>
#include <istream>
#include "item_extractor.h"

struct CsvOptions {
    char delimiter = ',';
    std::string items_column = "items";
};

// Splits a delimited stream into records. Handles quoted fields with "" escapes,
// delimiters and newlines inside quotes, and CRLF. Blank lines are skipped.
std::vector<std::vector<std::string>> parse_csv(std::istream& in, char delimiter);

// First record is the header; every following record is one transaction made
// from its items column. Empty input gives no transactions. Throws
// DataIngestionError when the column is missing from the header or from a row.
std::vector<std::vector<std::string>> read_transactions_csv(std::istream& in,
                                                            const ItemExtractor& extractor,
                                                            const CsvOptions& options = CsvOptions{});

std::vector<std::vector<std::string>> load_transactions_csv(const std::string& path,
                                                            const ItemExtractor& extractor,
                                                            const CsvOptions& options = CsvOptions{});

#endif // CSV_LOADER_H
