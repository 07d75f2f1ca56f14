#include "sectionnode/storage/Chunks.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <iterator>
#include <set>
#include <vector>

using namespace sectionnode;
using sectionnode::test::LogCapture;
using sectionnode::test::NodeTestAccess;
using sectionnode::test::TestNode;
using sectionnode::test::deliver_all;
using sectionnode::test::make_name;
using sectionnode::test::make_test_node;
using sectionnode::test::temp_root;

namespace {

TestNode& find(std::vector<TestNode>& nodes, const XorName& name) {
    for (auto& node : nodes) {
        if (node.network->our_name() == name) {
            return node;
        }
    }
    assert(false && "unknown node");
    return nodes.front();
}

}  // namespace

int main() {
    LogCapture capture;
    const auto root = temp_root("replication");

    const auto elder_name = make_name(1);
    const std::vector<XorName> adults{make_name(0x10), make_name(0x20), make_name(0x30), make_name(0x40)};

    std::vector<TestNode> nodes;
    {
        auto config = sectionnode::test::test_config(root / "elder");
        config.chunk_copy_count = 2;
        auto elder = make_test_node(elder_name, 20, config);
        elder.network->set_elders(routing::SectionElders{routing::Prefix{}, elder.network->section_public_key(), {elder_name}});
        elder.network->set_adults(adults);
        nodes.push_back(std::move(elder));
    }
    for (const auto& name : adults) {
        auto adult = make_test_node(name, 10, sectionnode::test::test_config(root / name_to_string(name)));
        const auto report = adult.runner->run({core::duty::LevelDown{}});
        assert(report.failures.empty());
        assert(adult.node->is_adult());
        nodes.push_back(std::move(adult));
    }

    auto& elder = nodes.front();
    assert(elder.runner->run({core::duty::Genesis{}}).failures.empty());

    // Store through the elder lands on the two closest adults.
    const auto chunk = protocol::make_chunk({'r', 'e', 'p', 'l', 'i', 'c', 'a'});
    const auto client = protocol::to_end_user(sectionnode::test::make_key(0xC1));
    const auto write = elder.runner->run({core::duty::ProcessWrite{protocol::StoreChunk{chunk}, random_message_id(), client}});
    assert(write.failures.empty());
    assert(deliver_all(nodes).failures.empty());

    auto& metadata = static_cast<metadata::ChunkHolderMetadata&>(
        *std::get<core::ElderRole>(NodeTestAccess::role(*elder.node)).metadata);
    const auto holders = metadata.holders_of(chunk.address);
    assert(holders.size() == 2);
    for (const auto& holder : holders) {
        assert(NodeTestAccess::chunks(*find(nodes, holder).node).store().has(chunk.address));
    }

    // Losing a holder replicates the chunk to a fresh adult through the remaining one.
    const auto lost = *holders.begin();
    const auto survivor = *std::next(holders.begin());
    const auto lost_report = elder.runner->run_event(routing::MemberLeft{lost, 10});
    assert(lost_report.failures.empty());

    const auto& requests = elder.network->sent_to_nodes();
    assert(requests.size() == 1);
    assert(requests[0].targets.size() == 1);
    const auto new_holder = requests[0].targets[0];
    assert(holders.count(new_holder) == 0);
    assert(new_holder != lost);
    assert(requests[0].id == combine_message_ids({chunk.address, new_holder}));
    const auto& replicate = std::get<protocol::ReplicateChunkMsg>(requests[0].msg);
    assert(replicate.current_holders == std::vector<XorName>{survivor});

    nodes.erase(std::remove_if(nodes.begin(), nodes.end(),
                               [&](const TestNode& node) { return node.network->our_name() == lost; }),
                nodes.end());
    const auto replication = deliver_all(nodes);
    assert(replication.failures.empty());
    assert(NodeTestAccess::chunks(*find(nodes, new_holder).node).store().has(chunk.address));
    assert(capture.contains("chunks.replicated"));
    assert(metadata.holders_of(chunk.address).count(new_holder) == 1);
    assert(metadata.holders_of(chunk.address).count(lost) == 0);

    // A stored copy nobody asked for is refused.
    auto& bystander = [&]() -> TestNode& {
        for (auto& node : nodes) {
            const auto name = node.network->our_name();
            if (name != elder_name && name != survivor && name != new_holder) {
                return node;
            }
        }
        assert(false && "no bystander");
        return nodes.front();
    }();
    const auto stray = protocol::make_chunk({'s', 't', 'r', 'a', 'y'});
    const auto wrong_id = combine_message_ids({stray.address, survivor});
    const auto rejected = bystander.node->handle(core::duty::StoreChunkForReplication{stray, wrong_id});
    assert(rejected.empty());
    assert(!NodeTestAccess::chunks(*bystander.node).store().has(stray.address));
    assert(capture.contains("chunks.replication_rejected"));

    const auto right_id = combine_message_ids({stray.address, bystander.network->our_name()});
    (void)bystander.node->handle(core::duty::StoreChunkForReplication{stray, right_id});
    assert(NodeTestAccess::chunks(*bystander.node).store().has(stray.address));

    // A holder that already has the chunk does not ask for it again.
    const auto again = find(nodes, survivor).node->handle(
        core::duty::ReplicateChunk{chunk.address, {new_holder}, combine_message_ids({chunk.address, survivor})});
    assert(again.size() == 1);
    assert(std::holds_alternative<core::duty::NoOp>(again[0]));

    std::filesystem::remove_all(root);
    return 0;
}
