#pragma once

#include "sectionnode/Config.hpp"
#include "sectionnode/Types.hpp"
#include "sectionnode/core/Duties.hpp"
#include "sectionnode/core/DutyDispatcher.hpp"
#include "sectionnode/core/NetworkEvents.hpp"
#include "sectionnode/core/NodeRole.hpp"
#include "sectionnode/core/SubsystemFactory.hpp"
#include "sectionnode/routing/Events.hpp"
#include "sectionnode/routing/Network.hpp"

#include <optional>
#include <string_view>

namespace sectionnode {

namespace test {
class NodeTestAccess;
}

namespace core {

class Node {
public:
    Node(routing::Network& network, SubsystemFactory& factory, Config config = {});

    NodeDuties handle(const NodeDuty& duty);
    std::optional<NodeDuty> process_network_event(const routing::RoutingEvent& event) const;

    void set_address_policy(AddressPolicy policy);

    std::string_view role() const noexcept { return role_name(role_); }
    bool is_elder() const noexcept { return std::holds_alternative<ElderRole>(role_); }
    bool is_adult() const noexcept { return std::holds_alternative<AdultRole>(role_); }
    const NodeInfo& info() const noexcept { return dispatcher_.node_info(); }

private:
    friend class sectionnode::test::NodeTestAccess;

    NodeRole role_{Uninitialized{}};
    DutyDispatcher dispatcher_;
    NetworkEvents events_;
};

}  // namespace core

}  // namespace sectionnode
