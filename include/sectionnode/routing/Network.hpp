#pragma once

#include "sectionnode/Types.hpp"
#include "sectionnode/protocol/Messages.hpp"
#include "sectionnode/routing/Prefix.hpp"
#include "sectionnode/routing/SectionElders.hpp"

#include <map>
#include <vector>

namespace sectionnode::routing {

// Live membership and transport of the section this node belongs to.
class Network {
public:
    virtual ~Network() = default;

    virtual XorName our_name() const = 0;
    virtual Age our_age() const = 0;
    virtual Prefix our_prefix() const = 0;
    virtual PublicKey section_public_key() const = 0;
    virtual std::map<XorName, Age> our_members() const = 0;
    virtual SectionElders our_elders() const = 0;
    virtual std::vector<XorName> our_adults() const = 0;
    virtual bool is_elder() const = 0;

    virtual void set_joins_allowed(bool joins_allowed) = 0;
    virtual void send(const protocol::OutgoingMsg& msg) = 0;
    virtual void send_to_nodes(const std::vector<XorName>& targets,
                               const protocol::NodeMessage& msg,
                               const MessageId& id) = 0;
};

}  // namespace sectionnode::routing
