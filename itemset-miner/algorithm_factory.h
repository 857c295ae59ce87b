#pragma once

#include <memory>
#include <string>
#include "mining_algorithm.h"
#include "errors.h"
#include "dfs/dfs_miner.h"
#include "apriori/apriori_miner.h"

enum class AlgorithmKind {
    Dfs,
    Apriori,
};

inline AlgorithmKind parse_algorithm_kind(const std::string& name) {
    if (name == "dfs" || name == "default")
        return AlgorithmKind::Dfs;
    if (name == "apriori" || name == "bfs")
        return AlgorithmKind::Apriori;

    throw ConfigError("Unknown algorithm name: " + name);
}

inline std::unique_ptr<IMiningAlgorithm> make_algorithm(AlgorithmKind kind) {
    switch (kind) {
        case AlgorithmKind::Dfs:
            return std::make_unique<DfsMiner>();
        case AlgorithmKind::Apriori:
            return std::make_unique<AprioriMiner>();
    }
    throw ConfigError("Unsupported algorithm kind");
}
