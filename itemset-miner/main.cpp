#include "miner_config.h"
#include "csv_loader.h"
#include "item_extractor.h"
#include "transaction_store.h"
#include "algorithm_factory.h"
#include "summary_extractor.h"
#include "result_printer.h"
#include "signal_handler.h"
#include "timer.h"
#include <iostream>
#include <exception>

int main(int argc, char** argv) {
    install_signal_handler();

    try {
        MinerConfig config = config_from_env();
        apply_cli_args(config, argc, argv);

        if (config.show_help) {
            print_usage(std::cout);
            return 0;
        }

        auto run_start = start_timer();
        std::cout << "[START] Initializing Miner..." << std::endl;
        if (config.threads > 0) std::cout << "[MODE] Threads limited to: " << config.threads << std::endl;

        auto extractor = make_item_extractor(parse_tokenization_kind(config.tokenization));
        auto algo = make_algorithm(parse_algorithm_kind(config.algorithm));

        auto rows = load_transactions_csv(config.data_file, *extractor, csv_options(config));
        TransactionStore store(rows, config.require_non_empty);
        rows.clear();
        std::cout << "[LOG] Indexed " << store.num_transactions() << " transactions, "
                  << store.num_items() << " distinct items" << std::endl;

        if (config.min_support == 0) {
            std::cerr << "[WARNING] min_support=0 makes every combination of "
                      << store.num_items() << " items frequent" << std::endl;
        }

        MiningParams params{config.min_support, config.threads};
        std::cout << "[START] Beginning mining with algorithm=" << algo->name()
                  << ", min_support=" << params.min_support << std::endl;
        FrequentItemsetTable table = algo->mine(store, params);

        auto summary_start = start_timer();
        ItemsetSupportMap maximal = maximal_itemsets(table);
        ItemsetSupportMap closed = closed_itemsets(table);
        stop_timer("Maximal & Closed Extraction", summary_start);

        if (config.show_table) print_table(std::cout, store, table);
        print_itemsets(std::cout, store, "Maximal itemsets", maximal);
        print_itemsets(std::cout, store, "Closed itemsets", closed);
        print_statistics(std::cout, table, maximal, closed);

        stop_timer("Total Run", run_start);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }

    std::cout << "[DONE] Process finished." << std::endl;
    return 0;
}
