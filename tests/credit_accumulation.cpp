#include "sectionnode/Errors.hpp"
#include "sectionnode/rewards/CreditAccumulator.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cassert>
#include <vector>

using namespace sectionnode;
using sectionnode::test::FakeElderSigning;
using sectionnode::test::make_key;
using sectionnode::test::make_name;

int main() {
    const auto section_key = make_key(0x51);
    FakeElderSigning signing(make_name(1), section_key, 3);

    const auto credit = rewards::make_credit(section_key, make_key(0x77), 100, 0, "reward");
    std::vector<rewards::CreditShare> evidence;
    for (std::uint8_t seed : {1, 2, 3, 4}) {
        evidence.push_back(rewards::CreditShare{credit, signing.share_for(credit, make_name(seed))});
    }

    // Any order of the same evidence ends in the same state.
    std::vector<std::size_t> order{0, 1, 2, 3};
    std::optional<rewards::AccumulationState> reference;
    do {
        rewards::AccumulationState state{};
        for (const auto index : order) {
            state = rewards::merge(state, evidence[index], signing).state;
        }
        assert(state.completed.contains(credit.id));
        assert(state.pending.empty());
        if (!reference) {
            reference = state;
        } else {
            assert(state == *reference);
        }
    } while (std::next_permutation(order.begin(), order.end()));

    // Completion is reported once, on the share that reaches the threshold.
    {
        rewards::AccumulationState state{};
        auto first = rewards::merge(state, evidence[0], signing);
        assert(first.newly_completed.empty());
        auto second = rewards::merge(first.state, evidence[1], signing);
        assert(second.newly_completed.empty());
        assert(second.state.pending.at(credit.id).shares.size() == 2);
        auto third = rewards::merge(second.state, evidence[2], signing);
        assert(third.newly_completed.count(credit.id) == 1);
        auto fourth = rewards::merge(third.state, evidence[3], signing);
        assert(fourth.newly_completed.empty());
        assert(fourth.state == third.state);
    }

    // Duplicate evidence from one signer counts once.
    {
        rewards::AccumulationState state{};
        for (int i = 0; i < 5; ++i) {
            state = rewards::merge(state, evidence[0], signing).state;
        }
        assert(state.pending.at(credit.id).shares.size() == 1);
        assert(!state.completed.contains(credit.id));

        auto merged = rewards::merge_all(state, {evidence[0], evidence[1], evidence[1]}, signing);
        assert(merged.state.pending.at(credit.id).shares.size() == 2);
    }

    // A forged share is rejected and the input state is untouched.
    {
        auto state = rewards::merge({}, evidence[0], signing).state;
        const auto before = state;
        auto forged = evidence[1];
        forged.share.bytes[0] ^= 0xFF;
        bool threw = false;
        try {
            (void)rewards::merge(state, forged, signing);
        } catch (const NodeError& error) {
            threw = true;
            assert(error.kind() == ErrorKind::Protocol);
        }
        assert(threw);
        assert(state == before);
    }

    // Same id with a different credit body conflicts.
    {
        auto state = rewards::merge({}, evidence[0], signing).state;
        auto altered = credit;
        altered.amount = 101;
        bool threw = false;
        try {
            (void)rewards::merge(state, rewards::CreditShare{altered, signing.share_for(altered, make_name(2))}, signing);
        } catch (const NodeError& error) {
            threw = true;
            assert(error.code() == "E_CHURN_EVIDENCE");
        }
        assert(threw);
    }

    // restrict_to drops entries outside the id set.
    {
        const auto other = rewards::make_credit(section_key, make_key(0x78), 5, 1, "reward");
        auto state = rewards::merge({}, evidence[0], signing).state;
        state = rewards::merge(state, rewards::CreditShare{other, signing.share_for(other, make_name(1))}, signing).state;
        assert(state.pending.size() == 2);
        const auto restricted = rewards::restrict_to(state, {other.id});
        assert(restricted.pending.size() == 1);
        assert(restricted.pending.count(other.id) == 1);
    }

    return 0;
}
