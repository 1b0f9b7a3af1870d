#pragma once
// SHA-256 (FIPS 180-4) used for message fingerprints and content hashes.
// Self-contained so the fingerprint tokens do not depend on a crypto library.
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace chatingest {

class SHA256 {
public:
    static constexpr size_t DIGEST_SIZE = 32;
    static constexpr size_t BLOCK_SIZE = 64;

    using Digest = std::array<uint8_t, DIGEST_SIZE>;

    SHA256() noexcept { reset(); }

    void reset() noexcept;
    void update(const void* data, size_t len) noexcept;
    void update(std::string_view text) noexcept { update(text.data(), text.size()); }

    // Pads, produces the digest and leaves the context unusable until reset()
    Digest finalize() noexcept;

    static Digest hash(std::string_view text);
    static std::string hash_hex(std::string_view text);

    // Leading `hex_chars` characters of the hex digest (clamped to 64)
    static std::string truncated_hex(std::string_view text, size_t hex_chars);

    static std::string to_hex(const Digest& digest);

private:
    uint32_t state_[8]{};
    uint8_t buf_[BLOCK_SIZE]{};
    size_t buf_len_ = 0;
    uint64_t count_ = 0;

    void compress(const uint8_t* block) noexcept;
};

} // namespace chatingest
