#include "pg_registry.hpp"
#include "../registry/signature_file.hpp"
#include "../utils/config.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <signatures.bin> <identities.txt> [dim] [config.ini]" << std::endl;
        return 1;
    }

    std::string signatures_file = argv[1];
    std::string identities_file = argv[2];
    std::string config_path = argc > 4 ? argv[4] : "config.ini";

    Config config;
    if (!config.load(config_path)) {
        return 1;
    }

    size_t embedding_dim = static_cast<size_t>(config.embedding_dim);
    if (argc > 3) {
        try {
            embedding_dim = std::stoul(argv[3]);
        } catch (const std::exception&) {
            std::cerr << "[import] Invalid dimension: " << argv[3] << std::endl;
            return 1;
        }
    }

    std::vector<Signature> signatures;
    std::vector<std::string> identities;
    if (!read_signatures(signatures_file, signatures, embedding_dim)) {
        return 1;
    }
    if (!read_identities(identities_file, identities)) {
        return 1;
    }
    if (signatures.size() != identities.size()) {
        std::cerr << "[import] Data mismatch: " << signatures.size() << " signatures but "
                  << identities.size() << " identity ids" << std::endl;
        return 1;
    }

    size_t stored = 0;
    size_t replaced = 0;
    size_t failed = 0;
    try {
        auto db = std::make_shared<Postgres>(config.connectionString());
        db->ensure_schema(embedding_dim);
        PgSignatureRegistry registry(db, embedding_dim);

        for (size_t i = 0; i < signatures.size(); ++i) {
            try {
                if (registry.upsert(identities[i], signatures[i])) {
                    ++replaced;
                }
                ++stored;
            } catch (const std::invalid_argument& e) {
                std::cerr << "[import] Skipping " << identities[i] << ": " << e.what() << std::endl;
                ++failed;
            }
            if ((i + 1) % 100 == 0 || (i + 1) == signatures.size()) {
                std::cout << "[import] Progress: " << (i + 1) << "/" << signatures.size() << std::endl;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[import] Database error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "[import] Done. stored=" << stored << " replaced=" << replaced
              << " failed=" << failed << std::endl;
    return failed == 0 ? 0 : 2;
}
