#pragma once

#include <string>
#include <vector>

#include "signature_registry.hpp"

// Reads "int32 count, int32 dim, count * dim float32" as written by the
// offline export. Fails on a dimension other than embedding_dim and on a
// header that claims more data than the file holds.
bool read_signatures(const std::string& filepath,
                     std::vector<Signature>& signatures,
                     size_t embedding_dim);

// One identity id per non-blank line, in export order.
bool read_identities(const std::string& filepath, std::vector<std::string>& identities);
