#include "miner_config.h"
#include "errors.h"
#include <cstdlib>
#include <stdexcept>

namespace {

int parse_int(const std::string& name, const std::string& value) {
    size_t used = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw ConfigError(name + " expects an integer, got '" + value + "'");
    }
    if (used != value.size()) {
        throw ConfigError(name + " expects an integer, got '" + value + "'");
    }
    return parsed;
}

int parse_threshold(const std::string& name, const std::string& value) {
    try {
        return parse_int(name, value);
    } catch (const ConfigError& e) {
        throw InvalidThresholdError(e.what());
    }
}

char parse_delimiter(const std::string& delim) {
    if (delim == "\\t") return '\t';
    if (delim.size() != 1) throw ConfigError("--csv-delimiter expects a single character, got '" + delim + "'");
    return delim[0];
}

}  // namespace

MinerConfig config_from_env() {
    MinerConfig config;
    if (const char* v = std::getenv("DATA_FILE")) config.data_file = v;
    if (const char* v = std::getenv("MIN_SUPPORT")) config.min_support = parse_threshold("MIN_SUPPORT", v);
    if (const char* v = std::getenv("MINER_ALGO")) config.algorithm = v;
    if (const char* v = std::getenv("MINER_THREADS")) config.threads = parse_int("MINER_THREADS", v);
    return config;
}

void apply_cli_args(MinerConfig& config, int argc, char** argv) {
    bool have_path = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") config.show_help = true;
        else if (arg == "--n" && has_value) config.min_support = parse_threshold("--n", argv[++i]);
        else if (arg == "--algo" && has_value) config.algorithm = argv[++i];
        else if (arg == "--column" && has_value) config.items_column = argv[++i];
        else if (arg == "--csv-delimiter" && has_value) config.delimiter = parse_delimiter(argv[++i]);
        else if (arg == "--tokens") config.tokenization = "tokens";
        else if (arg == "--threads" && has_value) config.threads = parse_int("--threads", argv[++i]);
        else if (arg == "--require-non-empty") config.require_non_empty = true;
        else if (arg == "--no-table") config.show_table = false;
        else if (arg.rfind("--", 0) == 0) throw ConfigError("Unknown or incomplete option: " + arg);
        else if (!have_path) {
            config.data_file = arg;
            have_path = true;
        }
        else throw ConfigError("Unexpected argument: " + arg);
    }
}

CsvOptions csv_options(const MinerConfig& config) {
    CsvOptions options;
    options.delimiter = config.delimiter;
    options.items_column = config.items_column;
    return options;
}

void print_usage(std::ostream& out) {
    out << "Usage: ./itemset_miner [data.csv] [options]\n"
        << "Options:\n"
        << "  --n <int>              Min support, absolute transaction count (default: 2, env MIN_SUPPORT)\n"
        << "  --algo <name>          Mining algorithm: dfs or apriori (default: dfs, env MINER_ALGO)\n"
        << "  --column <name>        Items column in the CSV header (default: items)\n"
        << "  --csv-delimiter <c>    Field delimiter, \\t for tab (default: ,)\n"
        << "  --tokens               Items are words instead of single characters\n"
        << "  --threads <int>        Max CPU threads (0 for all, env MINER_THREADS)\n"
        << "  --require-non-empty    Fail on an empty transaction collection\n"
        << "  --no-table             Only print maximal and closed itemsets\n"
        << "The data file defaults to env DATA_FILE, then data/test.csv.\n"
        << std::endl;
}
