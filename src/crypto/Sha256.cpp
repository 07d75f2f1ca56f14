#include "sectionnode/crypto/Sha256.hpp"

#include <algorithm>

namespace sectionnode::crypto {

namespace {

constexpr std::array<std::uint32_t, 8> kInitialState{
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
    0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u};

constexpr std::array<std::uint32_t, 64> kK{
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u, 0xab1c5ed5u,
    0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u, 0xc19bf174u,
    0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau,
    0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u, 0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u,
    0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu, 0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u,
    0xa2bfe8a1u, 0xa81a664bu, 0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u,
    0x19a4c116u, 0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u};

constexpr std::uint32_t rotate_right(std::uint32_t value, unsigned shift) noexcept {
    return (value >> shift) | (value << (32u - shift));
}

void compress(std::array<std::uint32_t, 8>& state, const std::uint8_t* block) {
    std::array<std::uint32_t, 64> words{};
    for (std::size_t i = 0; i < 16; ++i) {
        const auto* p = block + i * 4;
        words[i] = (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16)
            | (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
    }
    for (std::size_t i = 16; i < 64; ++i) {
        const auto s0 = rotate_right(words[i - 15], 7) ^ rotate_right(words[i - 15], 18) ^ (words[i - 15] >> 3);
        const auto s1 = rotate_right(words[i - 2], 17) ^ rotate_right(words[i - 2], 19) ^ (words[i - 2] >> 10);
        words[i] = words[i - 16] + s0 + words[i - 7] + s1;
    }

    // Working variables a..h.
    auto v = state;
    for (std::size_t i = 0; i < 64; ++i) {
        const auto sum1 = rotate_right(v[4], 6) ^ rotate_right(v[4], 11) ^ rotate_right(v[4], 25);
        const auto choose = (v[4] & v[5]) ^ (~v[4] & v[6]);
        const auto t1 = v[7] + sum1 + choose + kK[i] + words[i];
        const auto sum0 = rotate_right(v[0], 2) ^ rotate_right(v[0], 13) ^ rotate_right(v[0], 22);
        const auto majority = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
        const auto t2 = sum0 + majority;

        std::rotate(v.rbegin(), v.rbegin() + 1, v.rend());
        v[4] += t1;
        v[0] = t1 + t2;
    }

    for (std::size_t i = 0; i < state.size(); ++i) {
        state[i] += v[i];
    }
}

}  // namespace

Sha256::Sha256() noexcept
    : state_(kInitialState) {}

Sha256& Sha256::update(std::span<const std::uint8_t> data) {
    total_bytes_ += data.size();
    for (const auto byte : data) {
        block_[block_fill_++] = byte;
        if (block_fill_ == block_.size()) {
            compress(state_, block_.data());
            block_fill_ = 0;
        }
    }
    return *this;
}

Sha256& Sha256::update_u64(std::uint64_t value) {
    std::array<std::uint8_t, 8> bytes{};
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<std::uint8_t>((value >> (56 - i * 8)) & 0xFFu);
    }
    return update(bytes);
}

Digest Sha256::finalize() {
    const std::uint64_t bit_length = total_bytes_ * 8;

    block_[block_fill_++] = 0x80;
    if (block_fill_ > 56) {
        std::fill(block_.begin() + static_cast<std::ptrdiff_t>(block_fill_), block_.end(), std::uint8_t{0});
        compress(state_, block_.data());
        block_fill_ = 0;
    }
    std::fill(block_.begin() + static_cast<std::ptrdiff_t>(block_fill_), block_.begin() + 56, std::uint8_t{0});
    for (std::size_t i = 0; i < 8; ++i) {
        block_[56 + i] = static_cast<std::uint8_t>((bit_length >> (56 - i * 8)) & 0xFFu);
    }
    compress(state_, block_.data());

    Digest out{};
    for (std::size_t i = 0; i < state_.size(); ++i) {
        out[i * 4] = static_cast<std::uint8_t>(state_[i] >> 24);
        out[i * 4 + 1] = static_cast<std::uint8_t>(state_[i] >> 16);
        out[i * 4 + 2] = static_cast<std::uint8_t>(state_[i] >> 8);
        out[i * 4 + 3] = static_cast<std::uint8_t>(state_[i]);
    }

    state_ = kInitialState;
    block_.fill(0);
    block_fill_ = 0;
    total_bytes_ = 0;
    return out;
}

Digest Sha256::digest(std::span<const std::uint8_t> data) {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

}  // namespace sectionnode::crypto
