#include "sectionnode/Errors.hpp"
#include "sectionnode/rewards/RewardCalc.hpp"
#include "sectionnode/rewards/RewardProcess.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cassert>
#include <memory>
#include <optional>
#include <vector>

using namespace sectionnode;
using sectionnode::test::FakeElderSigning;
using sectionnode::test::make_key;
using sectionnode::test::make_name;

namespace {

const PublicKey kSectionKey = make_key(0x40);

rewards::RewardAccumulation vote_from(const FakeElderSigning& signing,
                                      const XorName& signer,
                                      const rewards::Credits& credits) {
    rewards::RewardAccumulation vote{};
    vote.section_key = kSectionKey;
    vote.signer = signer;
    for (const auto& credit : credits) {
        vote.shares.push_back(rewards::CreditShare{credit, signing.share_for(credit, signer)});
    }
    return vote;
}

template <typename Fn>
bool throws_churn_evidence(Fn&& fn) {
    try {
        fn();
    } catch (const NodeError& error) {
        return error.code() == "E_CHURN_EVIDENCE";
    }
    return false;
}

}  // namespace

int main() {
    const std::vector<XorName> elders{make_name(1), make_name(2), make_name(3)};
    auto signing = std::make_shared<FakeElderSigning>(elders[0], kSectionKey, 2);

    const rewards::Credits credits = rewards::split_section_funds(101, kSectionKey, make_key(0x41));
    assert(credits.size() == 2);
    assert(credits[0].amount == 51);
    assert(credits[0].recipient == kSectionKey);
    assert(credits[1].amount == 50);

    // Proposal goes to every elder, ourselves included.
    {
        rewards::RewardProcess process(kSectionKey, elders[0], elders, signing);
        const auto duty = process.propose(credits);
        const auto* send = std::get_if<core::duty::SendToNodes>(&duty);
        assert(send != nullptr);
        assert(send->targets == elders);
        const auto& proposal = std::get<rewards::RewardProposal>(send->msg);
        assert(proposal.proposer == elders[0]);
        assert(proposal.credits == credits);

        assert(std::holds_alternative<core::duty::NoOp>(process.propose({})));
    }

    // Adopting the first proposal casts one vote; later identical ones are no-ops.
    {
        rewards::RewardProcess process(kSectionKey, elders[0], elders, signing);
        const auto duty = process.receive_churn_proposal({kSectionKey, elders[1], credits});
        const auto& vote = std::get<rewards::RewardAccumulation>(std::get<core::duty::SendToNodes>(duty).msg);
        assert(vote.signer == elders[0]);
        assert(vote.shares.size() == credits.size());
        assert(std::holds_alternative<rewards::Accumulating>(process.stage()));

        const auto again = process.receive_churn_proposal({kSectionKey, elders[2], credits});
        assert(std::holds_alternative<core::duty::NoOp>(again));

        // A different proposal in the same round is rejected without changing the stage.
        const auto before = process.stage();
        const rewards::Credits other = rewards::split_section_funds(10, kSectionKey, make_key(0x41));
        assert(throws_churn_evidence([&] { (void)process.receive_churn_proposal({kSectionKey, elders[2], other}); }));
        assert(process.stage() == before);

        assert(!process.receive_wallet_accumulation(vote_from(*signing, elders[1], credits)).has_value());
        const auto proofs = process.receive_wallet_accumulation(vote_from(*signing, elders[2], credits));
        assert(proofs.has_value());
        assert(proofs->size() == 2);
        assert(proofs->sum() == 101);
        assert(std::holds_alternative<rewards::Completed>(process.stage()));

        // Late evidence after completion is ignored.
        assert(!process.receive_wallet_accumulation(vote_from(*signing, elders[0], credits)).has_value());
        assert(std::holds_alternative<core::duty::NoOp>(process.receive_churn_proposal({kSectionKey, elders[1], credits})));
    }

    // Votes seen before any proposal are kept and count once it is adopted.
    {
        rewards::RewardProcess process(kSectionKey, elders[0], elders, signing);
        assert(!process.receive_wallet_accumulation(vote_from(*signing, elders[1], credits)).has_value());
        assert(!process.receive_wallet_accumulation(vote_from(*signing, elders[2], credits)).has_value());
        assert(std::holds_alternative<rewards::AwaitingProposals>(process.stage()));

        (void)process.receive_churn_proposal({kSectionKey, elders[1], credits});
        const auto& accumulating = std::get<rewards::Accumulating>(process.stage());
        assert(accumulating.state.completed.size() == 2);
    }

    // Evidence from outside the elder set or for another key is rejected.
    {
        rewards::RewardProcess process(kSectionKey, elders[0], elders, signing);
        assert(throws_churn_evidence([&] { (void)process.receive_churn_proposal({kSectionKey, make_name(9), credits}); }));
        assert(throws_churn_evidence([&] { (void)process.receive_churn_proposal({make_key(0x99), elders[1], credits}); }));
        assert(throws_churn_evidence([&] { (void)process.receive_churn_proposal({kSectionKey, elders[1], {}}); }));
        assert(throws_churn_evidence([&] {
            (void)process.receive_churn_proposal({kSectionKey, elders[1], {credits[0], credits[0]}});
        }));

        auto mixed = vote_from(*signing, elders[1], credits);
        mixed.shares[0].share = signing->share_for(credits[0], elders[2]);
        assert(throws_churn_evidence([&] { (void)process.receive_wallet_accumulation(mixed); }));
        assert(std::holds_alternative<rewards::AwaitingProposals>(process.stage()));
    }

    // Shares for credits outside the adopted proposal are dropped; forged ones are rejected.
    {
        rewards::RewardProcess process(kSectionKey, elders[0], elders, signing);
        (void)process.receive_churn_proposal({kSectionKey, elders[1], credits});
        const auto before = process.stage();
        const rewards::Credits foreign{rewards::make_credit(kSectionKey, make_key(0x42), 7, 0, "other")};
        assert(!process.receive_wallet_accumulation(vote_from(*signing, elders[1], foreign)).has_value());
        assert(process.stage() == before);

        auto forged = vote_from(*signing, elders[1], foreign);
        forged.shares[0].share.bytes[0] ^= 0xFF;
        assert(throws_churn_evidence([&] { (void)process.receive_wallet_accumulation(forged); }));
        assert(process.stage() == before);
    }

    // Proposal and votes reach the same outcome in every arrival order, even when
    // one vote also carries a share for a credit outside the proposal.
    {
        const rewards::Credit extra = rewards::make_credit(kSectionKey, make_key(0x43), 9, 0, "extra");
        rewards::Credits with_extra = credits;
        with_extra.push_back(extra);
        const rewards::RewardProposal proposal{kSectionKey, elders[1], credits};
        const auto noisy_vote = vote_from(*signing, elders[1], with_extra);
        const auto clean_vote = vote_from(*signing, elders[2], credits);

        std::vector<int> order{0, 1, 2};
        std::optional<rewards::RewardStage> first_stage;
        do {
            rewards::RewardProcess process(kSectionKey, elders[0], elders, signing);
            std::optional<rewards::RewardAccumulation> own_vote;
            for (const int step : order) {
                if (step == 0) {
                    const auto duty = process.receive_churn_proposal(proposal);
                    own_vote = std::get<rewards::RewardAccumulation>(std::get<core::duty::SendToNodes>(duty).msg);
                } else {
                    (void)process.receive_wallet_accumulation(step == 1 ? noisy_vote : clean_vote);
                }
            }
            assert(own_vote.has_value());
            (void)process.receive_wallet_accumulation(*own_vote);

            const auto* completed = std::get_if<rewards::Completed>(&process.stage());
            assert(completed != nullptr);
            assert(completed->proofs.size() == 2);
            assert(completed->proofs.sum() == 101);
            if (!first_stage.has_value()) {
                first_stage = process.stage();
            }
            assert(process.stage() == *first_stage);
        } while (std::next_permutation(order.begin(), order.end()));
    }

    // Age-weighted distribution with the remainder to the section.
    {
        rewards::RewardWallets wallets;
        wallets.set_node_wallet(make_name(10), make_key(0x10), 5);
        wallets.set_node_wallet(make_name(20), make_key(0x20), 10);
        const auto paid = rewards::distribute_rewards(100, wallets, kSectionKey);
        Token total = 0;
        for (const auto& credit : paid) {
            total += credit.amount;
        }
        assert(total == 100);
        assert(paid.size() == 3);
        assert(paid.back().recipient == kSectionKey);
        assert(paid.back().amount == 1);
        assert(rewards::distribute_rewards(0, wallets, kSectionKey).empty());

        const auto unassigned = rewards::distribute_rewards(100, {}, kSectionKey);
        assert(unassigned.size() == 1);
        assert(unassigned[0].amount == 100);
    }

    return 0;
}
