/*
 * SHA-256 digest used for model integrity hashes and message signing
 */

#ifndef FEDCORE_SHA256_H
#define FEDCORE_SHA256_H

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace fedcore {

class SHA256 {
public:
    static constexpr size_t DIGEST_SIZE = 32;
    using Digest = std::array<uint8_t, DIGEST_SIZE>;

    SHA256();

    void update(const uint8_t* data, size_t len);
    void update(const void* data, size_t len) {
        update(static_cast<const uint8_t*>(data), len);
    }
    void update(const std::string& data) {
        update(data.data(), data.size());
    }

    // Finishes the hash; the object must not be updated afterwards
    Digest digest();
    std::string finalHex();

    static Digest hash(const void* data, size_t len);
    static std::string hashHex(const void* data, size_t len);
    static std::string hashHex(const std::string& data);

    static std::string toHex(const uint8_t* data, size_t len);
    static std::vector<uint8_t> fromHex(const std::string& hex);

private:
    uint32_t state_[8];
    uint8_t buffer_[64];
    size_t buffer_size_;
    uint64_t total_size_;
    bool finalized_;

    void processBlock(const uint8_t* block);

    static const uint32_t k_[64];
};

} // namespace fedcore

#endif // FEDCORE_SHA256_H
