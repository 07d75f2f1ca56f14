#pragma once

#include "sectionnode/Types.hpp"
#include "sectionnode/routing/Prefix.hpp"

#include <vector>

namespace sectionnode::routing {

struct SectionElders {
    Prefix prefix;
    PublicKey key{};
    std::vector<XorName> names;

    bool operator==(const SectionElders&) const = default;
};

}  // namespace sectionnode::routing
