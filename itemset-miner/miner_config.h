#ifndef MINER_CONFIG_H
#define MINER_CONFIG_H

#include <string>
#include <ostream>
#include "csv_loader.h"

struct MinerConfig {
    std::string data_file = "data/test.csv";
    int min_support = 2;               // absolute transaction count
    std::string items_column = "items";
    char delimiter = ',';
    std::string algorithm = "dfs";
    std::string tokenization = "chars";
    int threads = 0;                   // 0 for all cores
    bool require_non_empty = false;
    bool show_table = true;
    bool show_help = false;
};

// Defaults overridden by DATA_FILE, MIN_SUPPORT, MINER_ALGO and MINER_THREADS.
MinerConfig config_from_env();

// Command line wins over the environment. The first positional argument is the data file.
void apply_cli_args(MinerConfig& config, int argc, char** argv);

CsvOptions csv_options(const MinerConfig& config);

void print_usage(std::ostream& out);

#endif // MINER_CONFIG_H
