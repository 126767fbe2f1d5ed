#include <gtest/gtest.h>

#include <cstdint>
#include <cstdio>
#include <fstream>

#include "../registry/signature_file.hpp"

namespace {

std::string writeExport(const std::string& name, int32_t count, int32_t dim, const std::vector<float>& values) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(&count), sizeof(int32_t));
    out.write(reinterpret_cast<const char*>(&dim), sizeof(int32_t));
    out.write(reinterpret_cast<const char*>(values.data()), values.size() * sizeof(float));
    return path;
}

}

TEST(SignatureFile, ReadsExportedSignatures) {
    std::string path = writeExport("rollcall_ok.bin", 2, 3, {1, 0, 0, 0, 0.5f, 0.5f});

    std::vector<Signature> signatures;
    ASSERT_TRUE(read_signatures(path, signatures, 3));
    ASSERT_EQ(signatures.size(), 2u);
    EXPECT_EQ(signatures[1], (Signature{0, 0.5f, 0.5f}));
    std::remove(path.c_str());
}

TEST(SignatureFile, RejectsDimensionMismatch) {
    std::string path = writeExport("rollcall_dim.bin", 1, 3, {1, 0, 0});

    std::vector<Signature> signatures;
    EXPECT_FALSE(read_signatures(path, signatures, 4));
    std::remove(path.c_str());
}

TEST(SignatureFile, RejectsCountLargerThanFile) {
    std::string path = writeExport("rollcall_huge.bin", 0x7fffffff, 3, {1, 0, 0});

    std::vector<Signature> signatures;
    EXPECT_NO_THROW(EXPECT_FALSE(read_signatures(path, signatures, 3)));
    EXPECT_TRUE(signatures.empty());
    std::remove(path.c_str());
}

TEST(SignatureFile, ReadsIdentitiesSkippingBlankLines) {
    std::string path = ::testing::TempDir() + "rollcall_ids.txt";
    {
        std::ofstream out(path);
        out << "alice\r\n\nbob  \n";
    }

    std::vector<std::string> identities;
    ASSERT_TRUE(read_identities(path, identities));
    EXPECT_EQ(identities, (std::vector<std::string>{"alice", "bob"}));
    std::remove(path.c_str());
}
