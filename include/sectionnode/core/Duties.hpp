#pragma once

#include "sectionnode/Types.hpp"
#include "sectionnode/protocol/Data.hpp"
#include "sectionnode/protocol/Messages.hpp"
#include "sectionnode/rewards/Credit.hpp"
#include "sectionnode/routing/Prefix.hpp"
#include "sectionnode/transfers/TransferTypes.hpp"

#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

namespace sectionnode::core {

using protocol::Destination;

namespace duty {

// Role and section lifecycle.
struct Genesis {};

struct EldersChanged {
    PublicKey our_key{};
    routing::Prefix our_prefix;
    bool newbie{false};
};

struct SectionSplit {
    PublicKey our_key{};
    routing::Prefix our_prefix;
    PublicKey sibling_key{};
    bool newbie{false};
};

struct LevelDown {};

struct GetSectionElders {
    MessageId msg_id{};
    Destination origin;
};

// Section funds.
struct ReceiveRewardProposal {
    rewards::RewardProposal proposal;
};

struct ReceiveRewardAccumulation {
    rewards::RewardAccumulation accumulation;
};

struct SetNodeWallet {
    PublicKey wallet_id{};
    XorName node_id{};
    MessageId msg_id{};
    Destination origin;
};

struct GetNodeWalletKey {
    XorName node_name{};
    MessageId msg_id{};
    Destination origin;
};

struct ProcessLostMember {
    XorName name{};
    Age age{0};
};

struct ProcessNewMember {
    XorName name{};
};

struct ProcessRelocatedMember {
    XorName old_node_id{};
    XorName new_node_id{};
    Age age{0};
};

struct SynchState {
    rewards::NodeWallets node_rewards;
    transfers::UserWallets user_wallets;
};

struct AddPayment {
    rewards::CreditAgreementProof credit;
};

// Transfers.
struct GetTransferReplicaEvents {
    MessageId msg_id{};
    Destination origin;
};

struct PropagateTransfer {
    rewards::CreditAgreementProof proof;
    MessageId msg_id{};
    Destination origin;
};

struct ValidateClientTransfer {
    transfers::SignedTransfer signed_transfer;
    MessageId msg_id{};
    Destination origin;
};

struct SimulatePayout {
    transfers::Transfer transfer;
    MessageId msg_id{};
    Destination origin;
};

struct GetTransfersHistory {
    PublicKey at{};
    std::uint64_t since_version{0};
    MessageId msg_id{};
    Destination origin;
};

struct GetBalance {
    PublicKey at{};
    MessageId msg_id{};
    Destination origin;
};

struct GetStoreCost {
    PublicKey requester{};
    std::uint64_t bytes{0};
    MessageId msg_id{};
    Destination origin;
};

struct RegisterTransfer {
    transfers::TransferAgreementProof proof;
    MessageId msg_id{};
};

struct IncrementFullNodeCount {
    XorName node_id{};
};

struct ProcessDataPayment {
    transfers::DataPayment payment;
    MessageId msg_id{};
    Destination origin;
};

// Chunks (Adult).
struct ReadChunk {
    protocol::ChunkRead read;
    MessageId msg_id{};
    Destination origin;
};

struct WriteChunk {
    protocol::ChunkWrite write;
    MessageId msg_id{};
    Destination origin;
};

struct ReachingMaxCapacity {};

struct ReplicateChunk {
    XorName address{};
    std::vector<XorName> current_holders;
    MessageId id{};
};

struct GetChunkForReplication {
    XorName address{};
    XorName new_holder{};
    MessageId id{};
};

struct StoreChunkForReplication {
    protocol::Chunk data;
    MessageId correlation_id{};
};

// Metadata (Elder).
struct ProcessRead {
    protocol::DataQuery query;
    MessageId id{};
    Destination origin;
};

struct ProcessWrite {
    protocol::DataCmd cmd;
    MessageId id{};
    Destination origin;
};

// Outbound and misc.
struct Send {
    protocol::OutgoingMsg msg;
};

struct SendToNodes {
    std::vector<XorName> targets;
    protocol::NodeMessage msg;
    MessageId msg_id{};
};

struct SetNodeJoinsAllowed {
    bool joins_allowed{false};
};

struct NoOp {};

}  // namespace duty

using NodeDuty = std::variant<duty::Genesis,
                              duty::EldersChanged,
                              duty::SectionSplit,
                              duty::LevelDown,
                              duty::GetSectionElders,
                              duty::ReceiveRewardProposal,
                              duty::ReceiveRewardAccumulation,
                              duty::SetNodeWallet,
                              duty::GetNodeWalletKey,
                              duty::ProcessLostMember,
                              duty::ProcessNewMember,
                              duty::ProcessRelocatedMember,
                              duty::SynchState,
                              duty::AddPayment,
                              duty::GetTransferReplicaEvents,
                              duty::PropagateTransfer,
                              duty::ValidateClientTransfer,
                              duty::SimulatePayout,
                              duty::GetTransfersHistory,
                              duty::GetBalance,
                              duty::GetStoreCost,
                              duty::RegisterTransfer,
                              duty::IncrementFullNodeCount,
                              duty::ProcessDataPayment,
                              duty::ReadChunk,
                              duty::WriteChunk,
                              duty::ReachingMaxCapacity,
                              duty::ReplicateChunk,
                              duty::GetChunkForReplication,
                              duty::StoreChunkForReplication,
                              duty::ProcessRead,
                              duty::ProcessWrite,
                              duty::Send,
                              duty::SendToNodes,
                              duty::SetNodeJoinsAllowed,
                              duty::NoOp>;

using NodeDuties = std::vector<NodeDuty>;

std::string_view duty_name(const NodeDuty& duty);

inline NodeDuty send(protocol::OutgoingMsg msg) {
    return duty::Send{std::move(msg)};
}

}  // namespace sectionnode::core
