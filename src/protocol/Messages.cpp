#include "sectionnode/protocol/Messages.hpp"

namespace sectionnode::protocol {

Destination to_node(const XorName& name) {
    return Destination{DestinationKind::Node, name};
}

Destination to_section(const XorName& name) {
    return Destination{DestinationKind::Section, name};
}

Destination to_end_user(const PublicKey& client) {
    return Destination{DestinationKind::EndUser, xor_name_from_key(client)};
}

OutgoingMsg reply_to(const Destination& origin, const MessageId& correlation_id, QueryResult result) {
    OutgoingMsg out{};
    out.msg = ClientResponse{QueryResponse{correlation_id, std::move(result)}};
    out.id = random_message_id();
    out.dst = origin;
    out.aggregation = origin.kind == DestinationKind::EndUser ? Aggregation::AtDestination : Aggregation::None;
    return out;
}

OutgoingMsg ack_to(const Destination& origin, const MessageId& correlation_id, std::string error) {
    CmdAck ack{};
    ack.correlation_id = correlation_id;
    ack.ok = error.empty();
    ack.error = std::move(error);

    OutgoingMsg out{};
    out.msg = ClientResponse{std::move(ack)};
    out.id = random_message_id();
    out.dst = origin;
    return out;
}

}  // namespace sectionnode::protocol
