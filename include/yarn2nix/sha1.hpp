#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>

namespace yarn2nix {

// Incremental SHA-1 (FIPS 180-4). Yarn v1 records tarball hashes as the
// hex SHA-1 after the '#' of a resolved URL, and fetchurl checks the same.
class SHA1 {
public:
    SHA1();

    // Feed data in chunks
    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Finalize and return the 20-byte digest. Object should not be
    // reused after this call.
    std::array<uint8_t, 20> finalize();

    // One-shot helpers
    static std::string hash_hex(const std::string& input);
    static std::string bytes_to_hex(const std::array<uint8_t, 20>& bytes);

private:
    void process_block(const uint8_t block[64]);

    std::array<uint32_t, 5> state_;   // H0..H4
    uint64_t total_bytes_;             // total bytes fed so far
    uint8_t  buffer_[64];              // partial block accumulator
    size_t   buffer_len_;              // bytes in buffer_
};

} // namespace yarn2nix
