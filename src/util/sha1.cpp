#include <yarn2nix/sha1.hpp>
#include <cstring>

namespace yarn2nix {

// ---- Round constants (FIPS 180-4 section 4.2.1) ----

static constexpr uint32_t K[4] = {
    0x5a827999, 0x6ed9eba1, 0x8f1bbcdc, 0xca62c1d6
};

// ---- Bit manipulation helpers ----

static inline uint32_t rotl(uint32_t x, unsigned n) {
    return (x << n) | (x >> (32 - n));
}

// f_t from FIPS 180-4 section 4.1.1, selected by round.
static inline uint32_t round_fn(int t, uint32_t b, uint32_t c, uint32_t d) {
    if (t < 20) return (b & c) | (~b & d);        // Ch
    if (t < 40) return b ^ c ^ d;                 // Parity
    if (t < 60) return (b & c) | (b & d) | (c & d); // Maj
    return b ^ c ^ d;                             // Parity
}

// Read a big-endian 32-bit word from a byte pointer.
static inline uint32_t read_be32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24)
         | (uint32_t(p[1]) << 16)
         | (uint32_t(p[2]) <<  8)
         | (uint32_t(p[3]));
}

// Write a big-endian 32-bit word to a byte pointer.
static inline void write_be32(uint8_t* p, uint32_t v) {
    p[0] = uint8_t(v >> 24);
    p[1] = uint8_t(v >> 16);
    p[2] = uint8_t(v >>  8);
    p[3] = uint8_t(v);
}

// Write a big-endian 64-bit word to a byte pointer.
static inline void write_be64(uint8_t* p, uint64_t v) {
    p[0] = uint8_t(v >> 56);
    p[1] = uint8_t(v >> 48);
    p[2] = uint8_t(v >> 40);
    p[3] = uint8_t(v >> 32);
    p[4] = uint8_t(v >> 24);
    p[5] = uint8_t(v >> 16);
    p[6] = uint8_t(v >>  8);
    p[7] = uint8_t(v);
}

// ---- SHA1 implementation ----

SHA1::SHA1() {
    // Initial hash value, FIPS 180-4 section 5.3.1.
    state_ = {
        0x67452301, 0xefcdab89, 0x98badcfe, 0x10325476, 0xc3d2e1f0
    };
    total_bytes_ = 0;
    buffer_len_ = 0;
}

void SHA1::process_block(const uint8_t block[64]) {
    // 1. Prepare the message schedule W[0..79].
    uint32_t W[80];
    for (int t = 0; t < 16; ++t) {
        W[t] = read_be32(block + t * 4);
    }
    for (int t = 16; t < 80; ++t) {
        W[t] = rotl(W[t-3] ^ W[t-8] ^ W[t-14] ^ W[t-16], 1);
    }

    // 2. Initialize working variables.
    uint32_t a = state_[0];
    uint32_t b = state_[1];
    uint32_t c = state_[2];
    uint32_t d = state_[3];
    uint32_t e = state_[4];

    // 3. Compression: 80 rounds.
    for (int t = 0; t < 80; ++t) {
        uint32_t T = rotl(a, 5) + round_fn(t, b, c, d) + e + K[t / 20] + W[t];
        e = d;
        d = c;
        c = rotl(b, 30);
        b = a;
        a = T;
    }

    // 4. Update state.
    state_[0] += a;
    state_[1] += b;
    state_[2] += c;
    state_[3] += d;
    state_[4] += e;
}

void SHA1::update(const uint8_t* data, size_t len) {
    total_bytes_ += len;

    if (buffer_len_ > 0) {
        size_t space = 64 - buffer_len_;
        size_t copy = (len < space) ? len : space;
        std::memcpy(buffer_ + buffer_len_, data, copy);
        buffer_len_ += copy;
        data += copy;
        len -= copy;

        if (buffer_len_ == 64) {
            process_block(buffer_);
            buffer_len_ = 0;
        }
    }

    while (len >= 64) {
        process_block(data);
        data += 64;
        len -= 64;
    }

    if (len > 0) {
        std::memcpy(buffer_, data, len);
        buffer_len_ = len;
    }
}

void SHA1::update(const std::string& s) {
    update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

std::array<uint8_t, 20> SHA1::finalize() {
    // Same padding as SHA-256 (FIPS 180-4 section 5.1.1): 0x80, zeros up
    // to 56 mod 64, then the message length in bits, big-endian.
    uint64_t total_bits = total_bytes_ * 8;

    uint8_t pad_byte = 0x80;
    update(&pad_byte, 1);

    if (buffer_len_ > 56) {
        while (buffer_len_ < 64) {
            buffer_[buffer_len_++] = 0;
        }
        process_block(buffer_);
        buffer_len_ = 0;
    }
    while (buffer_len_ < 56) {
        buffer_[buffer_len_++] = 0;
    }

    write_be64(buffer_ + 56, total_bits);
    process_block(buffer_);

    std::array<uint8_t, 20> digest;
    for (int i = 0; i < 5; ++i) {
        write_be32(digest.data() + i * 4, state_[i]);
    }
    return digest;
}

std::string SHA1::bytes_to_hex(const std::array<uint8_t, 20>& bytes) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string out;
    out.reserve(40);
    for (uint8_t b : bytes) {
        out += hex_chars[b >> 4];
        out += hex_chars[b & 0x0f];
    }
    return out;
}

std::string SHA1::hash_hex(const std::string& input) {
    SHA1 ctx;
    ctx.update(input);
    return bytes_to_hex(ctx.finalize());
}

} // namespace yarn2nix
