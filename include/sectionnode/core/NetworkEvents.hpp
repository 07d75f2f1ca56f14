#pragma once

#include "sectionnode/Config.hpp"
#include "sectionnode/core/Duties.hpp"
#include "sectionnode/core/NodeRole.hpp"
#include "sectionnode/protocol/Envelope.hpp"
#include "sectionnode/routing/Events.hpp"
#include "sectionnode/routing/Network.hpp"

#include <optional>

namespace sectionnode::core {

// Maps routing events into duties. Promotion and demotion signals are checked
// against our current age and role, which win over the event.
class NetworkEvents {
public:
    NetworkEvents(const routing::Network& network, Config config = {});

    std::optional<NodeDuty> process_network_event(const routing::RoutingEvent& event, const NodeRole& role) const;

private:
    std::optional<NodeDuty> evaluate_msg(const routing::MessageReceived& received) const;
    std::optional<NodeDuty> elders_changed(const routing::EldersChanged& changed, const NodeRole& role) const;
    std::optional<NodeDuty> setup_as_adult(const NodeRole& role, std::string_view reason) const;
    bool is_adult_age() const;

    const routing::Network& network_;
    Config config_;
};

// The duty a decoded node message asks for. `src` is the sending node.
NodeDuty duty_for_message(const protocol::Envelope& envelope, const XorName& src);

}  // namespace sectionnode::core
