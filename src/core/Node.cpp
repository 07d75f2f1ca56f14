#include "sectionnode/core/Node.hpp"

namespace sectionnode::core {

namespace {

NodeInfo make_info(const routing::Network& network, const Config& config) {
    NodeInfo info{};
    info.node_name = network.our_name();
    info.root_dir = config.root_dir;
    return info;
}

}  // namespace

Node::Node(routing::Network& network, SubsystemFactory& factory, Config config)
    : dispatcher_(network, factory, make_info(network, config), config),
      events_(network, config) {}

NodeDuties Node::handle(const NodeDuty& duty) {
    return dispatcher_.handle(duty, role_);
}

std::optional<NodeDuty> Node::process_network_event(const routing::RoutingEvent& event) const {
    return events_.process_network_event(event, role_);
}

void Node::set_address_policy(AddressPolicy policy) {
    dispatcher_.set_address_policy(std::move(policy));
}

}  // namespace sectionnode::core
