#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace keel::hash {

// Incremental SHA-256. Used for event-log hash chains and state digests.
class Sha256 {
public:
    Sha256();

    void update(const uint8_t* data, size_t n);
    void update(const std::string& s) { update(reinterpret_cast<const uint8_t*>(s.data()), s.size()); }

    // Finalizes and returns the digest. The object must not be updated afterwards.
    std::array<uint8_t, 32> finish();

private:
    void compress(const uint8_t block[64]);

    std::array<uint32_t, 8> h_;
    std::array<uint8_t, 64> buf_{};
    size_t buf_len_{0};
    uint64_t total_len_{0};
};

std::string to_hex(const uint8_t* data, size_t n);
std::string sha256_hex(const std::string& s);

} // namespace keel::hash
