#pragma once

#include "sectionnode/Types.hpp"
#include "sectionnode/protocol/Data.hpp"
#include "sectionnode/rewards/Credit.hpp"
#include "sectionnode/routing/SectionElders.hpp"
#include "sectionnode/transfers/TransferTypes.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sectionnode::protocol {

enum class DestinationKind : std::uint8_t {
    Node = 0x01,
    Section = 0x02,
    EndUser = 0x03,
};

struct Destination {
    DestinationKind kind{DestinationKind::Node};
    XorName name{};

    bool operator==(const Destination&) const = default;
};

Destination to_node(const XorName& name);
Destination to_section(const XorName& name);
Destination to_end_user(const PublicKey& client);

enum class Aggregation : std::uint8_t {
    None,
    AtDestination,
    AtSource,
};

// Node to node messages. Client requests arrive already wrapped with their origin.
struct ReadChunkMsg {
    ChunkRead read;
    Destination origin;
};

struct WriteChunkMsg {
    ChunkWrite write;
    Destination origin;
};

struct DataQueryMsg {
    DataQuery query;
    Destination origin;
};

struct DataCmdMsg {
    DataCmd cmd;
    Destination origin;
};

struct DataPaymentMsg {
    transfers::DataPayment payment;
    Destination origin;
};

struct ReplicateChunkMsg {
    XorName address{};
    std::vector<XorName> current_holders;
};

struct GetChunkForReplicationMsg {
    XorName address{};
    XorName new_holder{};
};

struct StoreChunkForReplicationMsg {
    Chunk chunk;
};

struct StorageFullMsg {
    XorName node_id{};
};

struct RegisterWalletMsg {
    PublicKey wallet{};
    XorName node_id{};
};

struct PropagateCreditMsg {
    rewards::CreditAgreementProof proof;
};

struct CreditPaymentMsg {
    rewards::CreditAgreementProof proof;
};

struct SynchStateMsg {
    rewards::NodeWallets node_rewards;
    transfers::UserWallets user_wallets;
};

struct GetSectionEldersMsg {};

struct GetWalletKeyMsg {
    XorName node_name{};
};

struct GetReplicaEventsMsg {};

struct ValidateTransferMsg {
    transfers::SignedTransfer signed_transfer;
    Destination origin;
};

struct RegisterTransferMsg {
    transfers::TransferAgreementProof proof;
};

struct SimulatePayoutMsg {
    transfers::Transfer transfer;
    Destination origin;
};

struct GetBalanceMsg {
    PublicKey at{};
    Destination origin;
};

struct GetHistoryMsg {
    PublicKey at{};
    std::uint64_t since_version{0};
    Destination origin;
};

struct GetStoreCostMsg {
    PublicKey requester{};
    std::uint64_t bytes{0};
    Destination origin;
};

using NodeMessage = std::variant<ReadChunkMsg,
                                 WriteChunkMsg,
                                 DataQueryMsg,
                                 DataCmdMsg,
                                 DataPaymentMsg,
                                 ReplicateChunkMsg,
                                 GetChunkForReplicationMsg,
                                 StoreChunkForReplicationMsg,
                                 StorageFullMsg,
                                 rewards::RewardProposal,
                                 rewards::RewardAccumulation,
                                 RegisterWalletMsg,
                                 PropagateCreditMsg,
                                 CreditPaymentMsg,
                                 SynchStateMsg,
                                 GetSectionEldersMsg,
                                 GetWalletKeyMsg,
                                 GetReplicaEventsMsg,
                                 ValidateTransferMsg,
                                 RegisterTransferMsg,
                                 SimulatePayoutMsg,
                                 GetBalanceMsg,
                                 GetHistoryMsg,
                                 GetStoreCostMsg>;

// Replies to whoever issued a query or command.
struct ChunkResult {
    std::optional<Chunk> chunk;
};

struct DataResult {
    std::optional<ChunkData> value;
};

struct SectionEldersResult {
    routing::SectionElders elders;
};

struct WalletKeyResult {
    std::optional<PublicKey> wallet;
};

struct BalanceResult {
    Token balance{0};
};

struct HistoryResult {
    std::vector<transfers::TransferAgreementProof> history;
};

struct StoreCostResult {
    Token cost{0};
};

struct ReplicaEventsResult {
    std::vector<transfers::TransferAgreementProof> events;
};

struct ValidationResult {
    bool accepted{false};
    std::string error;
};

using QueryResult = std::variant<ChunkResult,
                                 DataResult,
                                 SectionEldersResult,
                                 WalletKeyResult,
                                 BalanceResult,
                                 HistoryResult,
                                 StoreCostResult,
                                 ReplicaEventsResult,
                                 ValidationResult>;

struct QueryResponse {
    MessageId correlation_id{};
    QueryResult result;
};

struct CmdAck {
    MessageId correlation_id{};
    bool ok{true};
    std::string error;
};

using ClientResponse = std::variant<QueryResponse, CmdAck>;
using OutboundMessage = std::variant<NodeMessage, ClientResponse>;

struct OutgoingMsg {
    OutboundMessage msg;
    MessageId id{};
    Destination dst;
    bool section_source{false};
    Aggregation aggregation{Aggregation::None};
};

OutgoingMsg reply_to(const Destination& origin, const MessageId& correlation_id, QueryResult result);
OutgoingMsg ack_to(const Destination& origin, const MessageId& correlation_id, std::string error = {});

}  // namespace sectionnode::protocol
