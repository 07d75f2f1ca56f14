#include "sectionnode/core/Duties.hpp"

#include <array>

namespace sectionnode::core {

namespace {

constexpr std::array<std::string_view, 36> kDutyNames{
    "Genesis",
    "EldersChanged",
    "SectionSplit",
    "LevelDown",
    "GetSectionElders",
    "ReceiveRewardProposal",
    "ReceiveRewardAccumulation",
    "SetNodeWallet",
    "GetNodeWalletKey",
    "ProcessLostMember",
    "ProcessNewMember",
    "ProcessRelocatedMember",
    "SynchState",
    "AddPayment",
    "GetTransferReplicaEvents",
    "PropagateTransfer",
    "ValidateClientTransfer",
    "SimulatePayout",
    "GetTransfersHistory",
    "GetBalance",
    "GetStoreCost",
    "RegisterTransfer",
    "IncrementFullNodeCount",
    "ProcessDataPayment",
    "ReadChunk",
    "WriteChunk",
    "ReachingMaxCapacity",
    "ReplicateChunk",
    "GetChunkForReplication",
    "StoreChunkForReplication",
    "ProcessRead",
    "ProcessWrite",
    "Send",
    "SendToNodes",
    "SetNodeJoinsAllowed",
    "NoOp",
};

static_assert(kDutyNames.size() == std::variant_size_v<NodeDuty>, "every duty needs a name");

}  // namespace

std::string_view duty_name(const NodeDuty& duty) {
    return kDutyNames[duty.index()];
}

}  // namespace sectionnode::core
