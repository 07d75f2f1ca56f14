#include "sectionnode/routing/Prefix.hpp"

#include <algorithm>

namespace sectionnode::routing {

namespace {

bool bit_at(const XorName& name, std::size_t index) {
    const auto byte = name[index / 8];
    return ((byte >> (7 - (index % 8))) & 0x1u) != 0;
}

void set_bit(XorName& name, std::size_t index, bool value) {
    const auto mask = static_cast<std::uint8_t>(0x80u >> (index % 8));
    if (value) {
        name[index / 8] = static_cast<std::uint8_t>(name[index / 8] | mask);
    } else {
        name[index / 8] = static_cast<std::uint8_t>(name[index / 8] & ~mask);
    }
}

XorName masked(const XorName& name, std::size_t bit_count) {
    XorName result{};
    for (std::size_t i = 0; i < bit_count; ++i) {
        set_bit(result, i, bit_at(name, i));
    }
    return result;
}

}  // namespace

Prefix::Prefix(const XorName& name, std::size_t bit_count)
    : name_(masked(name, std::min(bit_count, kMaxBits))),
      bit_count_(std::min(bit_count, kMaxBits)) {}

bool Prefix::matches(const XorName& name) const {
    for (std::size_t i = 0; i < bit_count_; ++i) {
        if (bit_at(name, i) != bit_at(name_, i)) {
            return false;
        }
    }
    return true;
}

bool Prefix::is_compatible(const Prefix& other) const {
    const auto common = std::min(bit_count_, other.bit_count_);
    for (std::size_t i = 0; i < common; ++i) {
        if (bit_at(name_, i) != bit_at(other.name_, i)) {
            return false;
        }
    }
    return true;
}

Prefix Prefix::pushed(bool bit) const {
    if (bit_count_ >= kMaxBits) {
        return *this;
    }
    XorName name = name_;
    set_bit(name, bit_count_, bit);
    return Prefix(name, bit_count_ + 1);
}

Prefix Prefix::popped() const {
    if (bit_count_ == 0) {
        return *this;
    }
    return Prefix(name_, bit_count_ - 1);
}

Prefix Prefix::sibling() const {
    if (bit_count_ == 0) {
        return *this;
    }
    XorName name = name_;
    set_bit(name, bit_count_ - 1, !bit_at(name_, bit_count_ - 1));
    return Prefix(name, bit_count_);
}

std::string Prefix::to_string() const {
    std::string bits;
    bits.reserve(bit_count_ + 8);
    bits += "Prefix(";
    for (std::size_t i = 0; i < bit_count_; ++i) {
        bits.push_back(bit_at(name_, i) ? '1' : '0');
    }
    bits += ")";
    return bits;
}

XorName xor_distance(const XorName& lhs, const XorName& rhs) {
    XorName distance{};
    for (std::size_t i = 0; i < distance.size(); ++i) {
        distance[i] = static_cast<std::uint8_t>(lhs[i] ^ rhs[i]);
    }
    return distance;
}

bool closer_to(const XorName& target, const XorName& lhs, const XorName& rhs) {
    return xor_distance(target, lhs) < xor_distance(target, rhs);
}

}  // namespace sectionnode::routing
