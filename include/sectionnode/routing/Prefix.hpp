#pragma once

#include "sectionnode/Types.hpp"

#include <cstddef>
#include <string>

namespace sectionnode::routing {

class Prefix {
public:
    static constexpr std::size_t kMaxBits = XorName{}.size() * 8;

    Prefix() = default;
    Prefix(const XorName& name, std::size_t bit_count);

    [[nodiscard]] std::size_t bit_count() const noexcept { return bit_count_; }
    // The prefix bits followed by zeros.
    [[nodiscard]] const XorName& name() const noexcept { return name_; }

    [[nodiscard]] bool matches(const XorName& name) const;
    [[nodiscard]] bool is_compatible(const Prefix& other) const;
    [[nodiscard]] Prefix pushed(bool bit) const;
    [[nodiscard]] Prefix popped() const;
    [[nodiscard]] Prefix sibling() const;

    std::string to_string() const;

    bool operator==(const Prefix& other) const = default;

private:
    XorName name_{};
    std::size_t bit_count_{0};
};

XorName xor_distance(const XorName& lhs, const XorName& rhs);
// True when lhs is strictly closer to target than rhs.
bool closer_to(const XorName& target, const XorName& lhs, const XorName& rhs);

}  // namespace sectionnode::routing
