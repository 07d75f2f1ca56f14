#pragma once

#include "sectionnode/Config.hpp"
#include "sectionnode/Types.hpp"
#include "sectionnode/core/Duties.hpp"
#include "sectionnode/core/NodeRole.hpp"
#include "sectionnode/core/SubsystemFactory.hpp"
#include "sectionnode/routing/Network.hpp"

#include <functional>

namespace sectionnode::core {

// Decides whether a data address is served by this section. Addresses that
// are not get forwarded to their section instead of being handled here.
using AddressPolicy = std::function<bool(const XorName& address)>;

class DutyDispatcher {
public:
    DutyDispatcher(routing::Network& network,
                   SubsystemFactory& factory,
                   NodeInfo info,
                   Config config = {},
                   AddressPolicy address_policy = {});

    // Runs one duty against `role` and returns its follow-up duties. Throws
    // NodeError; on a throw `role` is left as it was.
    NodeDuties handle(const NodeDuty& duty, NodeRole& role);

    void set_address_policy(AddressPolicy policy);
    const NodeInfo& node_info() const noexcept { return info_; }

private:
    bool is_ours(const XorName& address) const;
    NodeDuty forward(protocol::NodeMessage msg, const MessageId& id, const XorName& address) const;

    void level_up(NodeRole& role, bool genesis);
    void level_down(NodeRole& role);
    NodeDuties elders_changed(const duty::EldersChanged& changed, NodeRole& role);
    NodeDuties section_split(const duty::SectionSplit& split, NodeRole& role);
    NodeDuty push_state(const ElderRole& elder,
                        transfers::TransferLedger& transfers,
                        const routing::SectionElders& elders,
                        const MessageId& msg_id) const;
    Age member_age(const XorName& node_id) const;

    routing::Network& network_;
    SubsystemFactory& factory_;
    NodeInfo info_;
    Config config_;
    AddressPolicy address_policy_;
};

}  // namespace sectionnode::core
