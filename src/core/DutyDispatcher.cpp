#include "sectionnode/core/DutyDispatcher.hpp"

#include "sectionnode/Errors.hpp"
#include "sectionnode/daemon/StructuredLogger.hpp"
#include "sectionnode/rewards/RewardCalc.hpp"
#include "sectionnode/rewards/RewardProcess.hpp"

#include <algorithm>
#include <iterator>
#include <type_traits>

namespace sectionnode::core {

namespace {

using daemon::StructuredLogger;

template <typename>
inline constexpr bool kAlwaysFalse = false;

NodeDuties with_storage_check(NodeDuty first, storage::Chunks& chunks) {
    NodeDuties duties{std::move(first)};
    auto checks = chunks.check_storage();
    duties.insert(duties.end(), std::make_move_iterator(checks.begin()), std::make_move_iterator(checks.end()));
    return duties;
}

}  // namespace

DutyDispatcher::DutyDispatcher(routing::Network& network,
                               SubsystemFactory& factory,
                               NodeInfo info,
                               Config config,
                               AddressPolicy address_policy)
    : network_(network),
      factory_(factory),
      info_(std::move(info)),
      config_(std::move(config)),
      address_policy_(std::move(address_policy)) {}

void DutyDispatcher::set_address_policy(AddressPolicy policy) {
    address_policy_ = std::move(policy);
}

NodeDuties DutyDispatcher::handle(const NodeDuty& duty, NodeRole& role) {
    daemon::log_event(StructuredLogger::Level::Debug,
                      "node.duty",
                      {{"duty", std::string(duty_name(duty))}, {"role", std::string(role_name(role))}});

    return std::visit(
        [&](const auto& d) -> NodeDuties {
            using D = std::decay_t<decltype(d)>;

            // Lifecycle.
            if constexpr (std::is_same_v<D, duty::Genesis>) {
                level_up(role, true);
                return {};
            } else if constexpr (std::is_same_v<D, duty::EldersChanged>) {
                return elders_changed(d, role);
            } else if constexpr (std::is_same_v<D, duty::SectionSplit>) {
                return section_split(d, role);
            } else if constexpr (std::is_same_v<D, duty::LevelDown>) {
                level_down(role);
                return {};
            } else if constexpr (std::is_same_v<D, duty::GetSectionElders>) {
                return {send(protocol::reply_to(d.origin, d.msg_id, protocol::SectionEldersResult{network_.our_elders()}))};

            // Section funds.
            } else if constexpr (std::is_same_v<D, duty::ReceiveRewardProposal>) {
                return require_section_funds(role).receive_churn_proposal(d.proposal);
            } else if constexpr (std::is_same_v<D, duty::ReceiveRewardAccumulation>) {
                return require_section_funds(role).receive_wallet_accumulation(d.accumulation);
            } else if constexpr (std::is_same_v<D, duty::SetNodeWallet>) {
                auto& funds = require_section_funds(role);
                funds.set_node_wallet(d.node_id, d.wallet_id, member_age(d.node_id));
                return {};
            } else if constexpr (std::is_same_v<D, duty::GetNodeWalletKey>) {
                const auto& funds = require_section_funds(role);
                std::optional<PublicKey> wallet;
                if (const auto entry = funds.wallets().get(d.node_name)) {
                    wallet = entry->wallet;
                }
                return {send(protocol::reply_to(d.origin, d.msg_id, protocol::WalletKeyResult{wallet}))};
            } else if constexpr (std::is_same_v<D, duty::ProcessLostMember>) {
                auto& funds = require_section_funds(role);
                auto& metadata = require_metadata(role);
                daemon::log_event(StructuredLogger::Level::Info,
                                  "node.member_lost",
                                  {{"name", name_to_string(d.name)}, {"age", std::to_string(d.age)}});
                auto duties = metadata.trigger_chunk_replication(d.name);
                funds.remove_node_wallet(d.name);
                return duties;
            } else if constexpr (std::is_same_v<D, duty::ProcessNewMember>) {
                daemon::log_event(StructuredLogger::Level::Info,
                                  "node.member_joined",
                                  {{"name", name_to_string(d.name)}});
                return {};
            } else if constexpr (std::is_same_v<D, duty::ProcessRelocatedMember>) {
                auto& funds = require_section_funds(role);
                const auto age = member_age(d.new_node_id);
                if (!funds.relocate_node_wallet(d.old_node_id, d.new_node_id, age)) {
                    daemon::log_event(StructuredLogger::Level::Debug,
                                      "node.relocated_without_wallet",
                                      {{"old_name", name_to_string(d.old_node_id)},
                                       {"new_name", name_to_string(d.new_node_id)}});
                }
                return {};
            } else if constexpr (std::is_same_v<D, duty::SynchState>) {
                auto& elder = require_elder(role);
                auto& transfers = require_transfers(role);
                transfers.merge_user_wallets(d.user_wallets);
                elder.section_funds.replace_node_wallets(d.node_rewards);
                return {};
            } else if constexpr (std::is_same_v<D, duty::AddPayment>) {
                require_section_funds(role).add_payment(d.credit);
                return {};

            // Transfers.
            } else if constexpr (std::is_same_v<D, duty::GetTransferReplicaEvents>) {
                return {require_transfers(role).all_events(d.msg_id, d.origin)};
            } else if constexpr (std::is_same_v<D, duty::PropagateTransfer>) {
                return {require_transfers(role).receive_propagated(d.proof, d.msg_id, d.origin)};
            } else if constexpr (std::is_same_v<D, duty::ValidateClientTransfer>) {
                return {require_transfers(role).validate(d.signed_transfer, d.msg_id, d.origin)};
            } else if constexpr (std::is_same_v<D, duty::SimulatePayout>) {
                return {require_transfers(role).credit_without_proof(d.transfer)};
            } else if constexpr (std::is_same_v<D, duty::GetTransfersHistory>) {
                return {require_transfers(role).history(d.at, d.since_version, d.msg_id, d.origin)};
            } else if constexpr (std::is_same_v<D, duty::GetBalance>) {
                return {require_transfers(role).balance(d.at, d.msg_id, d.origin)};
            } else if constexpr (std::is_same_v<D, duty::GetStoreCost>) {
                return require_transfers(role).store_cost(d.bytes, d.msg_id, d.origin);
            } else if constexpr (std::is_same_v<D, duty::RegisterTransfer>) {
                return {require_transfers(role).register_transfer(d.proof, d.msg_id)};
            } else if constexpr (std::is_same_v<D, duty::IncrementFullNodeCount>) {
                require_transfers(role).increase_full_node_count(d.node_id);
                return {};
            } else if constexpr (std::is_same_v<D, duty::ProcessDataPayment>) {
                return require_transfers(role).process_payment(d.payment, d.msg_id, d.origin);

            // Chunks.
            } else if constexpr (std::is_same_v<D, duty::ReadChunk>) {
                const auto address = protocol::dst_address(d.read);
                if (!is_ours(address)) {
                    return {forward(protocol::ReadChunkMsg{d.read, d.origin}, d.msg_id, address)};
                }
                auto& chunks = require_chunks(role);
                return with_storage_check(chunks.read(d.read, d.msg_id, d.origin), chunks);
            } else if constexpr (std::is_same_v<D, duty::WriteChunk>) {
                const auto address = protocol::dst_address(d.write);
                if (!is_ours(address)) {
                    return {forward(protocol::WriteChunkMsg{d.write, d.origin}, d.msg_id, address)};
                }
                auto& chunks = require_chunks(role);
                return with_storage_check(chunks.write(d.write, d.msg_id, d.origin), chunks);
            } else if constexpr (std::is_same_v<D, duty::ReachingMaxCapacity>) {
                protocol::OutgoingMsg out{};
                out.msg = protocol::NodeMessage{protocol::StorageFullMsg{info_.node_name}};
                out.id = random_message_id();
                out.dst = protocol::to_section(info_.node_name);
                return {send(std::move(out))};
            } else if constexpr (std::is_same_v<D, duty::ReplicateChunk>) {
                return {require_chunks(role).replicate_chunk(d.address, d.current_holders, d.id)};
            } else if constexpr (std::is_same_v<D, duty::GetChunkForReplication>) {
                return {require_chunks(role).get_chunk_for_replication(d.address, d.id, d.new_holder)};
            } else if constexpr (std::is_same_v<D, duty::StoreChunkForReplication>) {
                // The replication request id was derived from the chunk and its new holder.
                const auto expected = combine_message_ids({d.data.address, network_.our_name()});
                if (expected != d.correlation_id) {
                    daemon::log_event(StructuredLogger::Level::Warning,
                                      "chunks.replication_rejected",
                                      {{"address", name_to_string(d.data.address)},
                                       {"correlation_id", message_id_to_string(d.correlation_id)}});
                    return {};
                }
                return require_chunks(role).store_replicated_chunk(d.data);

            // Metadata.
            } else if constexpr (std::is_same_v<D, duty::ProcessRead>) {
                const auto address = protocol::dst_address(d.query);
                if (!is_ours(address)) {
                    return {forward(protocol::DataQueryMsg{d.query, d.origin}, d.id, address)};
                }
                return {require_metadata(role).read(d.query, d.id, d.origin)};
            } else if constexpr (std::is_same_v<D, duty::ProcessWrite>) {
                const auto address = protocol::dst_address(d.cmd);
                if (!is_ours(address)) {
                    return {forward(protocol::DataCmdMsg{d.cmd, d.origin}, d.id, address)};
                }
                return {require_metadata(role).write(d.cmd, d.id, d.origin)};

            // Outbound.
            } else if constexpr (std::is_same_v<D, duty::Send>) {
                network_.send(d.msg);
                return {};
            } else if constexpr (std::is_same_v<D, duty::SendToNodes>) {
                network_.send_to_nodes(d.targets, d.msg, d.msg_id);
                return {};
            } else if constexpr (std::is_same_v<D, duty::SetNodeJoinsAllowed>) {
                network_.set_joins_allowed(d.joins_allowed);
                return {};
            } else if constexpr (std::is_same_v<D, duty::NoOp>) {
                return {};
            } else {
                static_assert(kAlwaysFalse<D>, "unhandled duty");
            }
        },
        duty);
}

bool DutyDispatcher::is_ours(const XorName& address) const {
    if (!config_.forward_foreign_addresses) {
        return true;
    }
    if (address_policy_) {
        return address_policy_(address);
    }
    return network_.our_prefix().matches(address);
}

NodeDuty DutyDispatcher::forward(protocol::NodeMessage msg, const MessageId& id, const XorName& address) const {
    daemon::log_event(StructuredLogger::Level::Debug,
                      "node.forward",
                      {{"address", name_to_string(address)}});
    protocol::OutgoingMsg out{};
    out.msg = std::move(msg);
    out.id = id;
    out.dst = protocol::to_section(address);
    return send(std::move(out));
}

void DutyDispatcher::level_up(NodeRole& role, bool genesis) {
    const auto elders = network_.our_elders();
    auto info = info_;
    info.genesis = genesis;

    ElderRole elder{};
    elder.metadata = factory_.make_metadata(info);
    elder.transfers = factory_.make_transfers(info, elders);
    elder.signing = factory_.make_signing(info, elders);
    if (!elder.metadata || !elder.transfers || !elder.signing) {
        throw errors::collaborator("E_SUBSYSTEM", "Elder subsystems could not be created");
    }

    const auto previous = role_name(role);
    role = std::move(elder);
    daemon::log_event(StructuredLogger::Level::Info,
                      "node.level_up",
                      {{"from", std::string(previous)},
                       {"genesis", genesis ? "true" : "false"},
                       {"prefix", elders.prefix.to_string()}});
}

void DutyDispatcher::level_down(NodeRole& role) {
    auto chunks = std::make_unique<storage::Chunks>(info_.node_name, info_.root_dir / config_.chunks_subdir, config_);
    const auto previous = role_name(role);
    role = AdultRole{std::move(chunks)};
    daemon::log_event(StructuredLogger::Level::Info,
                      "node.level_down",
                      {{"from", std::string(previous)}});
}

NodeDuties DutyDispatcher::elders_changed(const duty::EldersChanged& changed, NodeRole& role) {
    if (changed.newbie) {
        level_up(role, false);
        return {};
    }

    auto& elder = require_elder(role);
    auto& transfers = require_transfers(role);
    const auto elders = network_.our_elders();

    auto signing = factory_.make_signing(info_, elders);
    if (!signing) {
        throw errors::collaborator("E_SUBSYSTEM", "Elder signing could not be created");
    }
    transfers.update_replicas(elders);

    const auto msg_id = combine_message_ids({changed.our_prefix.name(), xor_name_from_key(changed.our_key)});
    NodeDuties duties{push_state(elder, transfers, elders, msg_id)};

    const auto balance = transfers.section_balance();
    if (balance > 0) {
        auto credits = rewards::distribute_rewards(balance, elder.section_funds.wallets(), changed.our_key);
        rewards::RewardProcess process(changed.our_key, info_.node_name, elders.names, signing);
        duties.push_back(elder.section_funds.begin_churn(std::move(process), credits));
    }
    elder.signing = std::move(signing);

    daemon::log_event(StructuredLogger::Level::Info,
                      "node.elders_changed",
                      {{"prefix", changed.our_prefix.to_string()},
                       {"section_key", key_to_string(changed.our_key)},
                       {"balance", std::to_string(balance)}});
    return duties;
}

NodeDuties DutyDispatcher::section_split(const duty::SectionSplit& split, NodeRole& role) {
    if (split.newbie) {
        daemon::log_event(StructuredLogger::Level::Info,
                          "node.split_as_newbie",
                          {{"prefix", split.our_prefix.to_string()}});
        level_up(role, false);
        return {};
    }

    auto& elder = require_elder(role);
    auto& transfers = require_transfers(role);
    const auto elders = network_.our_elders();

    auto signing = factory_.make_signing(info_, elders);
    if (!signing) {
        throw errors::collaborator("E_SUBSYSTEM", "Elder signing could not be created");
    }
    transfers.update_replicas(elders);

    const auto balance = transfers.section_balance();
    daemon::log_event(StructuredLogger::Level::Info,
                      "node.split_as_oldie",
                      {{"prefix", split.our_prefix.to_string()},
                       {"section_key", key_to_string(split.our_key)},
                       {"sibling_key", key_to_string(split.sibling_key)},
                       {"balance", std::to_string(balance)}});

    NodeDuties duties;
    const auto credits = rewards::split_section_funds(balance, split.our_key, split.sibling_key);
    if (!credits.empty()) {
        rewards::RewardProcess process(split.our_key, info_.node_name, elders.names, signing);
        duties.push_back(elder.section_funds.begin_churn(std::move(process), credits));
    }
    elder.signing = std::move(signing);
    return duties;
}

NodeDuty DutyDispatcher::push_state(const ElderRole& elder,
                                    transfers::TransferLedger& transfers,
                                    const routing::SectionElders& elders,
                                    const MessageId& msg_id) const {
    std::vector<XorName> targets;
    std::copy_if(elders.names.begin(), elders.names.end(), std::back_inserter(targets),
                 [&](const XorName& name) { return name != info_.node_name; });

    protocol::SynchStateMsg state{};
    state.node_rewards = elder.section_funds.wallets().node_wallets();
    state.user_wallets = transfers.user_wallets();
    return duty::SendToNodes{std::move(targets), protocol::NodeMessage{std::move(state)}, msg_id};
}

Age DutyDispatcher::member_age(const XorName& node_id) const {
    const auto members = network_.our_members();
    const auto it = members.find(node_id);
    if (it == members.end()) {
        daemon::log_event(StructuredLogger::Level::Debug,
                          "node.member_not_found",
                          {{"name", name_to_string(node_id)},
                           {"prefix", network_.our_prefix().to_string()}});
        throw errors::node_not_found_for_reward(name_to_string(node_id));
    }
    return it->second;
}

}  // namespace sectionnode::core
