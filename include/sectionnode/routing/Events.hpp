#pragma once

#include "sectionnode/Types.hpp"
#include "sectionnode/routing/SectionElders.hpp"

#include <optional>
#include <variant>
#include <vector>

namespace sectionnode::routing {

enum class SelfStatusChange {
    None,
    Promoted,
    Demoted,
};

struct PromotedToElder {};

struct MemberLeft {
    XorName name{};
    Age age{0};
};

struct MemberJoined {
    XorName name{};
    std::optional<XorName> previous_name;
    Age age{0};
    bool startup_relocation{false};
};

struct MessageReceived {
    std::vector<std::uint8_t> content;
    XorName src{};
    XorName dst{};
};

struct EldersChanged {
    SectionElders elders;
    // Present when the change is a split.
    std::optional<SectionElders> sibling_elders;
    SelfStatusChange self_status_change{SelfStatusChange::None};
};

struct Relocated {
    XorName previous_name{};
};

struct Demoted {};

struct RelocationStarted {
    XorName previous_name{};
};

using RoutingEvent = std::variant<PromotedToElder,
                                  MemberLeft,
                                  MemberJoined,
                                  MessageReceived,
                                  EldersChanged,
                                  Relocated,
                                  Demoted,
                                  RelocationStarted>;

}  // namespace sectionnode::routing
