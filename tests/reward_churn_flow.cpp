#include "test_support.hpp"

#include <cassert>
#include <memory>
#include <vector>

using namespace sectionnode;
using sectionnode::test::FakeNetwork;
using sectionnode::test::NodeTestAccess;
using sectionnode::test::TestNode;
using sectionnode::test::deliver_all;
using sectionnode::test::make_test_node;
using sectionnode::test::make_key;
using sectionnode::test::make_name;

namespace {

void set_section(std::vector<TestNode>& nodes, const routing::SectionElders& elders) {
    for (auto& node : nodes) {
        node.network->set_elders(elders);
    }
}

std::vector<rewards::CreditAgreementProof> propagated_credits(FakeNetwork& network) {
    std::vector<rewards::CreditAgreementProof> proofs;
    for (const auto& out : network.sent()) {
        const auto* node_msg = std::get_if<protocol::NodeMessage>(&out.msg);
        if (node_msg == nullptr) {
            continue;
        }
        if (const auto* propagate = std::get_if<protocol::PropagateCreditMsg>(node_msg)) {
            proofs.push_back(propagate->proof);
        }
    }
    return proofs;
}

}  // namespace

int main() {
    const std::vector<XorName> names{make_name(1), make_name(2), make_name(3)};
    const auto section_key = make_key(0xE1);
    routing::SectionElders elders{routing::Prefix{}, section_key, names};

    Config config{};
    std::vector<TestNode> members;
    for (const auto& name : names) {
        auto member = make_test_node(name, 10, config, 100, 3);
        member.network->set_elders(elders);
        for (const auto& peer : names) {
            member.network->add_member(peer, 10);
        }
        members.push_back(std::move(member));
    }

    for (auto& member : members) {
        const auto report = member.runner->run({core::duty::Genesis{}});
        assert(report.failures.empty());
        assert(member.node->is_elder());
    }

    // Elder churn with a pending section balance of 100 and no node wallets.
    for (auto& member : members) {
        const auto report = member.runner->run_event(routing::EldersChanged{elders, std::nullopt, routing::SelfStatusChange::None});
        assert(report.failures.empty());
        assert(NodeTestAccess::funds(*member.node).is_churning());
        assert(member.factory->last_ledger->replica_updates.size() == 1);
    }

    const auto first_round = deliver_all(members);
    assert(first_round.delivered > 0);
    assert(first_round.failures.empty());

    for (auto& member : members) {
        assert(!NodeTestAccess::funds(*member.node).is_churning());
        const auto proofs = propagated_credits(*member.network);
        assert(proofs.size() == 1);
        assert(proofs[0].amount() == 100);
        assert(proofs[0].credit.recipient == section_key);
        assert(proofs[0].section_key == section_key);
    }

    // Every elder produced the same proof.
    assert(propagated_credits(*members[0].network)[0] == propagated_credits(*members[1].network)[0]);
    assert(propagated_credits(*members[1].network)[0] == propagated_credits(*members[2].network)[0]);

    // Split: our half and the sibling's half go out as two credits.
    const auto our_key = make_key(0xE2);
    const auto sibling_key = make_key(0xE3);
    const routing::SectionElders ours{routing::Prefix{}.pushed(false), our_key, names};
    const routing::SectionElders sibling{routing::Prefix{}.pushed(true), sibling_key, {make_name(7)}};
    set_section(members, ours);

    for (auto& member : members) {
        const auto report = member.runner->run_event(routing::EldersChanged{ours, sibling, routing::SelfStatusChange::None});
        assert(report.failures.empty());
        assert(NodeTestAccess::funds(*member.node).is_churning());
    }

    assert(deliver_all(members).failures.empty());

    for (auto& member : members) {
        assert(!NodeTestAccess::funds(*member.node).is_churning());
        const auto proofs = propagated_credits(*member.network);
        assert(proofs.size() == 3);
        Token split_total = 0;
        bool sibling_paid = false;
        for (std::size_t i = 1; i < proofs.size(); ++i) {
            split_total += proofs[i].amount();
            sibling_paid = sibling_paid || proofs[i].credit.recipient == sibling_key;
        }
        assert(split_total == 100);
        assert(sibling_paid);
    }

    return 0;
}
