#include "sectionnode/Errors.hpp"
#include "test_support.hpp"

#include <cassert>
#include <filesystem>
#include <string>
#include <vector>

using namespace sectionnode;
using sectionnode::test::NodeTestAccess;
using sectionnode::test::make_key;
using sectionnode::test::make_name;
using sectionnode::test::make_test_node;
using sectionnode::test::temp_root;

namespace {

template <typename Fn>
std::string error_code_of(Fn&& fn, ErrorKind expected_kind) {
    try {
        fn();
    } catch (const NodeError& error) {
        assert(error.kind() == expected_kind);
        return error.code();
    }
    return {};
}

template <typename Result>
const Result& reply_result(const core::NodeDuty& duty) {
    const auto& out = std::get<core::duty::Send>(duty).msg;
    const auto& response = std::get<protocol::QueryResponse>(std::get<protocol::ClientResponse>(out.msg));
    return std::get<Result>(response.result);
}

}  // namespace

int main() {
    const auto root = temp_root("dispatch");
    const auto config = sectionnode::test::test_config(root);
    const auto client = protocol::to_end_user(make_key(0xC1));
    const auto chunk = protocol::make_chunk({1, 2, 3, 4});

    // An uninitialized node owns no subsystem.
    {
        auto fresh = make_test_node(make_name(1), 10, config);
        auto& node = *fresh.node;
        assert(node.role() == "uninitialized");
        assert(error_code_of([&] { (void)node.handle(core::duty::ReadChunk{{chunk.address}, random_message_id(), client}); },
                             ErrorKind::RoleMismatch) == "E_NO_CHUNKS");
        assert(error_code_of([&] { (void)node.handle(core::duty::GetBalance{make_key(2), random_message_id(), client}); },
                             ErrorKind::RoleMismatch) == "E_NO_TRANSFERS");
    }

    auto member = make_test_node(make_name(1), 10, config, 250);
    auto& network = *member.network;
    auto& node = *member.node;
    network.set_elders(routing::SectionElders{routing::Prefix{}, network.section_public_key(), {make_name(1), make_name(2)}});

    // Adult: chunks only.
    (void)node.handle(core::duty::LevelDown{});
    assert(node.is_adult());
    {
        const auto written = node.handle(core::duty::WriteChunk{{chunk}, random_message_id(), client});
        assert(!written.empty());
        const auto read = node.handle(core::duty::ReadChunk{{chunk.address}, random_message_id(), client});
        assert(reply_result<protocol::ChunkResult>(read.front()).chunk == chunk);

        assert(error_code_of([&] { (void)node.handle(core::duty::ReceiveRewardProposal{}); }, ErrorKind::RoleMismatch) ==
               "E_NO_SECTION_FUNDS");
        assert(error_code_of([&] { (void)node.handle(core::duty::ProcessRead{{chunk.address}, random_message_id(), client}); },
                             ErrorKind::RoleMismatch) == "E_NO_METADATA");
        assert(error_code_of([&] { (void)node.handle(core::duty::GetStoreCost{make_key(3), 10, random_message_id(), client}); },
                             ErrorKind::RoleMismatch) == "E_NO_TRANSFERS");
        assert(node.is_adult());

        // A write whose address does not match the content is refused with an error ack.
        auto forged = chunk;
        forged.value.push_back(9);
        const auto refused = node.handle(core::duty::WriteChunk{{forged}, random_message_id(), client});
        const auto& ack = std::get<protocol::CmdAck>(
            std::get<protocol::ClientResponse>(std::get<core::duty::Send>(refused.front()).msg.msg));
        assert(!ack.error.empty());
    }

    // Elder: metadata, transfers and section funds, no chunks.
    (void)node.handle(core::duty::Genesis{});
    assert(node.is_elder());
    auto* ledger = member.factory->last_ledger;
    assert(ledger != nullptr);
    {
        assert(error_code_of([&] { (void)node.handle(core::duty::ReadChunk{{chunk.address}, random_message_id(), client}); },
                             ErrorKind::RoleMismatch) == "E_NO_CHUNKS");

        const auto balance = node.handle(core::duty::GetBalance{make_key(2), random_message_id(), client});
        assert(reply_result<protocol::BalanceResult>(balance.front()).balance == 250);

        const auto elders = node.handle(core::duty::GetSectionElders{random_message_id(), protocol::to_node(make_name(9))});
        assert(reply_result<protocol::SectionEldersResult>(elders.front()).elders.names.size() == 2);

        (void)node.handle(core::duty::IncrementFullNodeCount{make_name(7)});
        assert(ledger->full_nodes.count(make_name(7)) == 1);
        const auto cost = node.handle(core::duty::GetStoreCost{make_key(3), 10, random_message_id(), client});
        assert(reply_result<protocol::StoreCostResult>(cost.front()).cost == 20);

        // A paid write comes back as a metadata write.
        transfers::DataPayment payment{};
        payment.cmd = protocol::PutData{make_name(0x44), {7, 7}};
        payment.payment.signed_transfer.amount = 5;
        const auto paid = node.handle(core::duty::ProcessDataPayment{payment, random_message_id(), client});
        assert(paid.size() == 1);
        const auto stored = node.handle(paid.front());
        assert(std::get<protocol::CmdAck>(std::get<protocol::ClientResponse>(std::get<core::duty::Send>(stored.front()).msg.msg)).ok);
        const auto data = node.handle(core::duty::ProcessRead{{make_name(0x44)}, random_message_id(), client});
        assert(reply_result<protocol::DataResult>(data.front()).value == ChunkData({7, 7}));

        payment.payment.signed_transfer.amount = 0;
        assert(error_code_of([&] { (void)node.handle(core::duty::ProcessDataPayment{payment, random_message_id(), client}); },
                             ErrorKind::Collaborator) == "E_TRANSFER");

        (void)node.handle(core::duty::SetNodeJoinsAllowed{true});
        assert(network.joins_allowed());
    }

    // Wallet registration uses the live membership age.
    {
        const auto wallet = make_key(0x55);
        assert(error_code_of([&] {
                   (void)node.handle(core::duty::SetNodeWallet{wallet, make_name(0x30), random_message_id(), client});
               },
               ErrorKind::NotFound) == "E_NODE_NOT_FOUND");
        assert(NodeTestAccess::funds(node).wallets().empty());

        network.add_member(make_name(0x30), 12);
        (void)node.handle(core::duty::SetNodeWallet{wallet, make_name(0x30), random_message_id(), client});
        assert(NodeTestAccess::funds(node).wallets().get(make_name(0x30))->age == 12);

        const auto key_reply = node.handle(core::duty::GetNodeWalletKey{make_name(0x30), random_message_id(), client});
        assert(reply_result<protocol::WalletKeyResult>(key_reply.front()).wallet == wallet);

        network.remove_member(make_name(0x30));
        network.add_member(make_name(0x31), 13);
        (void)node.handle(core::duty::ProcessRelocatedMember{make_name(0x30), make_name(0x31), 0});
        assert(!NodeTestAccess::funds(node).wallets().get(make_name(0x30)).has_value());
        assert(NodeTestAccess::funds(node).wallets().get(make_name(0x31))->age == 13);

        (void)node.handle(core::duty::ProcessLostMember{make_name(0x31), 13});
        assert(NodeTestAccess::funds(node).wallets().empty());

        // Replicated state replaces the registry.
        rewards::NodeWallets synced{{make_name(0x32), rewards::NodeWallet{make_key(0x32), 6}}};
        (void)node.handle(core::duty::SynchState{synced, {}});
        assert(NodeTestAccess::funds(node).wallets().node_wallets() == synced);
    }

    // Foreign addresses are forwarded to their section without touching a subsystem.
    {
        node.set_address_policy([](const XorName& address) { return address[0] < 0x80; });
        XorName foreign = make_name(0x90);
        const auto forwarded = node.handle(core::duty::ReadChunk{{foreign}, make_name(5), client});
        const auto& out = std::get<core::duty::Send>(forwarded.front()).msg;
        assert(out.dst == protocol::to_section(foreign));
        assert(out.id == make_name(5));
        assert(std::holds_alternative<protocol::ReadChunkMsg>(std::get<protocol::NodeMessage>(out.msg)));

        const auto query = node.handle(core::duty::ProcessRead{{foreign}, random_message_id(), client});
        assert(std::holds_alternative<protocol::DataQueryMsg>(
            std::get<protocol::NodeMessage>(std::get<core::duty::Send>(query.front()).msg.msg)));
    }

    // Outbound duties reach the network.
    {
        const auto before = network.sent().size();
        const auto duties = node.handle(core::duty::ReachingMaxCapacity{});
        (void)node.handle(duties.front());
        assert(network.sent().size() == before + 1);
        assert(std::holds_alternative<protocol::StorageFullMsg>(std::get<protocol::NodeMessage>(network.sent().back().msg)));
    }

    // A repeated promotion signal leaves an Elder's wallets and payments in place.
    {
        auto elder = make_test_node(make_name(3), 10, config, 100);
        auto& elder_net = *elder.network;
        auto& elder_node = *elder.node;
        (void)elder_node.handle(core::duty::Genesis{});
        assert(elder_node.is_elder());

        elder_net.add_member(make_name(0x60), 8);
        (void)elder_node.handle(core::duty::SetNodeWallet{make_key(0x60), make_name(0x60), random_message_id(), client});
        rewards::CreditAgreementProof payment{};
        payment.credit = rewards::make_credit(make_key(0x61), elder_net.section_public_key(), 3, 0, "payment");
        payment.section_key = make_key(0x61);
        (void)elder_node.handle(core::duty::AddPayment{payment});

        const routing::SectionElders ours{routing::Prefix{}, elder_net.section_public_key(), {make_name(3)}};
        const auto duty = elder_node.process_network_event(
            routing::EldersChanged{ours, std::nullopt, routing::SelfStatusChange::Promoted});
        assert(duty.has_value());
        assert(!std::get<core::duty::EldersChanged>(*duty).newbie);
        (void)elder_node.handle(*duty);

        assert(elder_node.is_elder());
        assert(NodeTestAccess::funds(elder_node).wallets().node_wallets().size() == 1);
        assert(NodeTestAccess::funds(elder_node).payments().size() == 1);

        // When the new signer cannot be built, the ledger keeps its old replica set.
        auto* elder_ledger = elder.factory->last_ledger;
        const auto replica_updates = elder_ledger->replica_updates.size();
        elder.factory->signing_available = false;
        assert(error_code_of([&] { (void)elder_node.handle(*duty); }, ErrorKind::Collaborator) == "E_SUBSYSTEM");
        assert(elder_ledger->replica_updates.size() == replica_updates);
        const core::duty::SectionSplit split{elder_net.section_public_key(), routing::Prefix{}.pushed(false), make_key(0x62), false};
        assert(error_code_of([&] { (void)elder_node.handle(split); }, ErrorKind::Collaborator) == "E_SUBSYSTEM");
        assert(elder_ledger->replica_updates.size() == replica_updates);
        assert(elder_node.is_elder());
        elder.factory->signing_available = true;
    }

    std::filesystem::remove_all(root);
    return 0;
}
