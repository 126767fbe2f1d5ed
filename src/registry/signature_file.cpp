#include "signature_file.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>

bool read_signatures(const std::string& filepath,
                     std::vector<Signature>& signatures,
                     size_t embedding_dim) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[import] Failed to open signatures file: " << filepath << std::endl;
        return false;
    }

    int32_t count = 0;
    int32_t dim = 0;
    file.read(reinterpret_cast<char*>(&count), sizeof(int32_t));
    file.read(reinterpret_cast<char*>(&dim), sizeof(int32_t));
    if (!file || count < 0) {
        std::cerr << "[import] Truncated or invalid header in " << filepath << std::endl;
        return false;
    }

    if (dim != static_cast<int32_t>(embedding_dim)) {
        std::cerr << "[import] Signature dimension mismatch. Expected: " << embedding_dim
                  << ", Got: " << dim << std::endl;
        return false;
    }

    std::streampos body_start = file.tellg();
    file.seekg(0, std::ios::end);
    std::streamoff body_size = file.tellg() - body_start;
    file.seekg(body_start);
    if (dim == 0 || static_cast<uint64_t>(count) * static_cast<uint64_t>(dim) * sizeof(float) > static_cast<uint64_t>(body_size)) {
        std::cerr << "[import] Header claims " << count << " signatures of dimension " << dim
                  << " but the file holds only " << body_size << " data bytes" << std::endl;
        return false;
    }

    std::cout << "[import] Reading " << count << " signatures of dimension " << dim << std::endl;

    signatures.reserve(count);
    for (int32_t i = 0; i < count; ++i) {
        Signature signature(dim);
        file.read(reinterpret_cast<char*>(signature.data()), dim * sizeof(float));
        if (!file) {
            std::cerr << "[import] File ends after " << i << " of " << count << " signatures" << std::endl;
            return false;
        }
        signatures.push_back(std::move(signature));
    }
    return true;
}

bool read_identities(const std::string& filepath, std::vector<std::string>& identities) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[import] Failed to open identities file: " << filepath << std::endl;
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line.erase(line.find_last_not_of(" \n\r\t") + 1);
        if (!line.empty()) {
            identities.push_back(line);
        }
    }
    std::cout << "[import] Loaded " << identities.size() << " identity ids" << std::endl;
    return true;
}
