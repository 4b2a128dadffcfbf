#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace gradebench::hash {

// Incremental SHA-256 for the grading log hash chain.
class Sha256 {
public:
    Sha256();

    void update(const void* data, size_t n);
    void update(const std::string& s) { update(s.data(), s.size()); }

    // Finalizes; the object must not be updated afterwards.
    std::array<uint8_t, 32> finish();

private:
    void block(const uint8_t* p);

    uint32_t h_[8];
    uint8_t buf_[64];
    size_t buf_len_{0};
    uint64_t total_{0};
};

std::string to_hex(const uint8_t* data, size_t n);

// Hex digest of the concatenation a || b.
std::string sha256_hex(const std::string& a, const std::string& b = std::string());

} // namespace gradebench::hash
