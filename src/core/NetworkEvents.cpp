#include "sectionnode/core/NetworkEvents.hpp"

#include "sectionnode/Errors.hpp"
#include "sectionnode/daemon/StructuredLogger.hpp"

#include <type_traits>

namespace sectionnode::core {

namespace {

using daemon::StructuredLogger;

template <typename>
inline constexpr bool kAlwaysFalse = false;

bool is_elder(const NodeRole& role) {
    return std::holds_alternative<ElderRole>(role);
}

}  // namespace

NetworkEvents::NetworkEvents(const routing::Network& network, Config config)
    : network_(network),
      config_(std::move(config)) {}

std::optional<NodeDuty> NetworkEvents::process_network_event(const routing::RoutingEvent& event,
                                                             const NodeRole& role) const {
    return std::visit(
        [&](const auto& e) -> std::optional<NodeDuty> {
            using E = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<E, routing::PromotedToElder>) {
                if (is_elder(role) || !is_adult_age()) {
                    daemon::log_event(StructuredLogger::Level::Info,
                                      "events.promotion_ignored",
                                      {{"age", std::to_string(network_.our_age())},
                                       {"role", std::string(role_name(role))}});
                    return std::nullopt;
                }
                daemon::log_event(StructuredLogger::Level::Info, "events.promoted_to_elder");
                return NodeDuty{duty::EldersChanged{network_.section_public_key(), network_.our_prefix(), true}};
            } else if constexpr (std::is_same_v<E, routing::MemberLeft>) {
                if (!is_elder(role)) {
                    return std::nullopt;
                }
                return NodeDuty{duty::ProcessLostMember{e.name, e.age}};
            } else if constexpr (std::is_same_v<E, routing::MemberJoined>) {
                if (!is_elder(role)) {
                    return std::nullopt;
                }
                if (e.startup_relocation) {
                    return NodeDuty{duty::ProcessNewMember{e.name}};
                }
                if (e.previous_name.has_value()) {
                    return NodeDuty{duty::ProcessRelocatedMember{*e.previous_name, e.name, e.age}};
                }
                return std::nullopt;
            } else if constexpr (std::is_same_v<E, routing::MessageReceived>) {
                return evaluate_msg(e);
            } else if constexpr (std::is_same_v<E, routing::EldersChanged>) {
                return elders_changed(e, role);
            } else if constexpr (std::is_same_v<E, routing::Relocated>) {
                return setup_as_adult(role, "relocated");
            } else if constexpr (std::is_same_v<E, routing::Demoted>) {
                return setup_as_adult(role, "demoted");
            } else if constexpr (std::is_same_v<E, routing::RelocationStarted>) {
                return std::nullopt;
            } else {
                static_assert(kAlwaysFalse<E>, "unhandled routing event");
            }
        },
        event);
}

std::optional<NodeDuty> NetworkEvents::evaluate_msg(const routing::MessageReceived& received) const {
    const auto envelope = protocol::decode_envelope(received.content);
    if (!envelope.has_value()) {
        const auto error = errors::decode("undecodable message from " + name_to_string(received.src));
        daemon::log_event(StructuredLogger::Level::Error,
                          "events.decode_failed",
                          {{"src", name_to_string(received.src)},
                           {"bytes", std::to_string(received.content.size())},
                           {"kind", std::string(error_kind_to_string(error.kind()))},
                           {"code", error.code()},
                           {"message", error.what()}});
        return std::nullopt;
    }
    daemon::log_event(StructuredLogger::Level::Debug,
                      "events.message_received",
                      {{"src", name_to_string(received.src)},
                       {"id", message_id_to_string(envelope->id)}});
    return duty_for_message(*envelope, received.src);
}

std::optional<NodeDuty> NetworkEvents::elders_changed(const routing::EldersChanged& changed,
                                                      const NodeRole& role) const {
    const auto& ours = changed.elders;
    switch (changed.self_status_change) {
        case routing::SelfStatusChange::Promoted:
            // Already an Elder: a repeated promotion is an ordinary churn.
            if (is_elder(role)) {
                daemon::log_event(StructuredLogger::Level::Info,
                                  "events.promotion_repeated",
                                  {{"role", std::string(role_name(role))}});
                break;
            }
            if (!is_adult_age()) {
                daemon::log_event(StructuredLogger::Level::Info,
                                  "events.promotion_ignored",
                                  {{"age", std::to_string(network_.our_age())}});
                return std::nullopt;
            }
            if (changed.sibling_elders.has_value()) {
                return NodeDuty{duty::SectionSplit{ours.key, ours.prefix, changed.sibling_elders->key, true}};
            }
            return NodeDuty{duty::EldersChanged{ours.key, ours.prefix, true}};
        case routing::SelfStatusChange::Demoted:
            return setup_as_adult(role, "demoted_on_churn");
        case routing::SelfStatusChange::None:
            break;
    }

    if (!is_elder(role)) {
        return std::nullopt;
    }
    if (changed.sibling_elders.has_value()) {
        return NodeDuty{duty::SectionSplit{ours.key, ours.prefix, changed.sibling_elders->key, false}};
    }
    return NodeDuty{duty::EldersChanged{ours.key, ours.prefix, false}};
}

std::optional<NodeDuty> NetworkEvents::setup_as_adult(const NodeRole& role, std::string_view reason) const {
    const auto age = network_.our_age();
    if (!is_adult_age() || std::holds_alternative<AdultRole>(role)) {
        daemon::log_event(StructuredLogger::Level::Info,
                          "events.adult_setup_skipped",
                          {{"reason", std::string(reason)},
                           {"age", std::to_string(age)},
                           {"role", std::string(role_name(role))}});
        return std::nullopt;
    }
    daemon::log_event(StructuredLogger::Level::Info,
                      "events.setup_as_adult",
                      {{"reason", std::string(reason)}, {"age", std::to_string(age)}});
    return NodeDuty{duty::LevelDown{}};
}

bool NetworkEvents::is_adult_age() const {
    return network_.our_age() > config_.min_age;
}

NodeDuty duty_for_message(const protocol::Envelope& envelope, const XorName& src) {
    const auto& id = envelope.id;
    const auto sender = protocol::to_node(src);
    return std::visit(
        [&](const auto& msg) -> NodeDuty {
            using M = std::decay_t<decltype(msg)>;
            if constexpr (std::is_same_v<M, protocol::ReadChunkMsg>) {
                return duty::ReadChunk{msg.read, id, msg.origin};
            } else if constexpr (std::is_same_v<M, protocol::WriteChunkMsg>) {
                return duty::WriteChunk{msg.write, id, msg.origin};
            } else if constexpr (std::is_same_v<M, protocol::DataQueryMsg>) {
                return duty::ProcessRead{msg.query, id, msg.origin};
            } else if constexpr (std::is_same_v<M, protocol::DataCmdMsg>) {
                return duty::ProcessWrite{msg.cmd, id, msg.origin};
            } else if constexpr (std::is_same_v<M, protocol::DataPaymentMsg>) {
                return duty::ProcessDataPayment{msg.payment, id, msg.origin};
            } else if constexpr (std::is_same_v<M, protocol::ReplicateChunkMsg>) {
                return duty::ReplicateChunk{msg.address, msg.current_holders, id};
            } else if constexpr (std::is_same_v<M, protocol::GetChunkForReplicationMsg>) {
                return duty::GetChunkForReplication{msg.address, msg.new_holder, id};
            } else if constexpr (std::is_same_v<M, protocol::StoreChunkForReplicationMsg>) {
                return duty::StoreChunkForReplication{msg.chunk, id};
            } else if constexpr (std::is_same_v<M, protocol::StorageFullMsg>) {
                return duty::IncrementFullNodeCount{msg.node_id};
            } else if constexpr (std::is_same_v<M, rewards::RewardProposal>) {
                return duty::ReceiveRewardProposal{msg};
            } else if constexpr (std::is_same_v<M, rewards::RewardAccumulation>) {
                return duty::ReceiveRewardAccumulation{msg};
            } else if constexpr (std::is_same_v<M, protocol::RegisterWalletMsg>) {
                return duty::SetNodeWallet{msg.wallet, msg.node_id, id, sender};
            } else if constexpr (std::is_same_v<M, protocol::PropagateCreditMsg>) {
                return duty::PropagateTransfer{msg.proof, id, sender};
            } else if constexpr (std::is_same_v<M, protocol::CreditPaymentMsg>) {
                return duty::AddPayment{msg.proof};
            } else if constexpr (std::is_same_v<M, protocol::SynchStateMsg>) {
                return duty::SynchState{msg.node_rewards, msg.user_wallets};
            } else if constexpr (std::is_same_v<M, protocol::GetSectionEldersMsg>) {
                return duty::GetSectionElders{id, sender};
            } else if constexpr (std::is_same_v<M, protocol::GetWalletKeyMsg>) {
                return duty::GetNodeWalletKey{msg.node_name, id, sender};
            } else if constexpr (std::is_same_v<M, protocol::GetReplicaEventsMsg>) {
                return duty::GetTransferReplicaEvents{id, sender};
            } else if constexpr (std::is_same_v<M, protocol::ValidateTransferMsg>) {
                return duty::ValidateClientTransfer{msg.signed_transfer, id, msg.origin};
            } else if constexpr (std::is_same_v<M, protocol::RegisterTransferMsg>) {
                return duty::RegisterTransfer{msg.proof, id};
            } else if constexpr (std::is_same_v<M, protocol::SimulatePayoutMsg>) {
                return duty::SimulatePayout{msg.transfer, id, msg.origin};
            } else if constexpr (std::is_same_v<M, protocol::GetBalanceMsg>) {
                return duty::GetBalance{msg.at, id, msg.origin};
            } else if constexpr (std::is_same_v<M, protocol::GetHistoryMsg>) {
                return duty::GetTransfersHistory{msg.at, msg.since_version, id, msg.origin};
            } else if constexpr (std::is_same_v<M, protocol::GetStoreCostMsg>) {
                return duty::GetStoreCost{msg.requester, msg.bytes, id, msg.origin};
            } else {
                static_assert(kAlwaysFalse<M>, "unhandled node message");
            }
        },
        envelope.message);
}

}  // namespace sectionnode::core
