#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace sectionnode::crypto {

using Digest = std::array<std::uint8_t, 32>;

class Sha256 {
public:
    Sha256() noexcept;

    Sha256& update(std::span<const std::uint8_t> data);
    Sha256& update_u64(std::uint64_t value);
    Digest finalize();

    static Digest digest(std::span<const std::uint8_t> data);

private:
    std::array<std::uint32_t, 8> state_;
    std::array<std::uint8_t, 64> block_{};
    std::size_t block_fill_{0};
    std::uint64_t total_bytes_{0};
};

}  // namespace sectionnode::crypto
