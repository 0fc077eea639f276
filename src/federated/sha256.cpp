/*
 * SHA-256 (FIPS 180-4)
 */

#include "federated/sha256.h"
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace fedcore {

const uint32_t SHA256::k_[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

namespace {

inline uint32_t rotr(uint32_t x, uint32_t n) {
    return (x >> n) | (x << (32 - n));
}

inline uint32_t bigSigma0(uint32_t x) { return rotr(x, 2) ^ rotr(x, 13) ^ rotr(x, 22); }
inline uint32_t bigSigma1(uint32_t x) { return rotr(x, 6) ^ rotr(x, 11) ^ rotr(x, 25); }
inline uint32_t smallSigma0(uint32_t x) { return rotr(x, 7) ^ rotr(x, 18) ^ (x >> 3); }
inline uint32_t smallSigma1(uint32_t x) { return rotr(x, 17) ^ rotr(x, 19) ^ (x >> 10); }

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

SHA256::SHA256()
    : state_{0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
             0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19},
      buffer_{},
      buffer_size_(0),
      total_size_(0),
      finalized_(false) {}

void SHA256::processBlock(const uint8_t* block) {
    uint32_t w[64];
    for (int i = 0; i < 16; ++i) {
        w[i] = (uint32_t(block[i * 4]) << 24) | (uint32_t(block[i * 4 + 1]) << 16) |
               (uint32_t(block[i * 4 + 2]) << 8) | uint32_t(block[i * 4 + 3]);
    }
    for (int i = 16; i < 64; ++i) {
        w[i] = smallSigma1(w[i - 2]) + w[i - 7] + smallSigma0(w[i - 15]) + w[i - 16];
    }

    uint32_t s[8];
    std::copy(state_, state_ + 8, s);

    for (int i = 0; i < 64; ++i) {
        uint32_t choose = (s[4] & s[5]) ^ (~s[4] & s[6]);
        uint32_t majority = (s[0] & s[1]) ^ (s[0] & s[2]) ^ (s[1] & s[2]);
        uint32_t t1 = s[7] + bigSigma1(s[4]) + choose + k_[i] + w[i];
        uint32_t t2 = bigSigma0(s[0]) + majority;
        s[7] = s[6];
        s[6] = s[5];
        s[5] = s[4];
        s[4] = s[3] + t1;
        s[3] = s[2];
        s[2] = s[1];
        s[1] = s[0];
        s[0] = t1 + t2;
    }

    for (int i = 0; i < 8; ++i) {
        state_[i] += s[i];
    }
}

void SHA256::update(const uint8_t* data, size_t len) {
    if (finalized_) {
        throw std::logic_error("SHA256::update called after digest");
    }
    total_size_ += len;

    if (buffer_size_ > 0) {
        size_t take = std::min(len, sizeof(buffer_) - buffer_size_);
        std::memcpy(buffer_ + buffer_size_, data, take);
        buffer_size_ += take;
        data += take;
        len -= take;
        if (buffer_size_ == sizeof(buffer_)) {
            processBlock(buffer_);
            buffer_size_ = 0;
        }
    }

    while (len >= 64) {
        processBlock(data);
        data += 64;
        len -= 64;
    }

    if (len > 0) {
        std::memcpy(buffer_, data, len);
        buffer_size_ = len;
    }
}

SHA256::Digest SHA256::digest() {
    uint64_t bit_length = total_size_ * 8;

    uint8_t padding[72] = {0};
    padding[0] = 0x80;
    size_t pad_len = (buffer_size_ < 56) ? (56 - buffer_size_) : (120 - buffer_size_);
    for (int i = 0; i < 8; ++i) {
        padding[pad_len + i] = static_cast<uint8_t>(bit_length >> (56 - i * 8));
    }
    update(padding, pad_len + 8);
    finalized_ = true;

    Digest out{};
    for (int i = 0; i < 8; ++i) {
        out[i * 4] = static_cast<uint8_t>(state_[i] >> 24);
        out[i * 4 + 1] = static_cast<uint8_t>(state_[i] >> 16);
        out[i * 4 + 2] = static_cast<uint8_t>(state_[i] >> 8);
        out[i * 4 + 3] = static_cast<uint8_t>(state_[i]);
    }
    return out;
}

std::string SHA256::finalHex() {
    Digest d = digest();
    return toHex(d.data(), d.size());
}

SHA256::Digest SHA256::hash(const void* data, size_t len) {
    SHA256 sha;
    sha.update(data, len);
    return sha.digest();
}

std::string SHA256::hashHex(const void* data, size_t len) {
    SHA256 sha;
    sha.update(data, len);
    return sha.finalHex();
}

std::string SHA256::hashHex(const std::string& data) {
    return hashHex(data.data(), data.size());
}

std::string SHA256::toHex(const uint8_t* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

std::vector<uint8_t> SHA256::fromHex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("Hex string has odd length");
    }
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hexValue(hex[i]);
        int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

} // namespace fedcore
