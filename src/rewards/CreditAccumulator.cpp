#include "sectionnode/rewards/CreditAccumulator.hpp"

#include "sectionnode/Errors.hpp"

namespace sectionnode::rewards {

MergeResult merge(const AccumulationState& state, const CreditShare& evidence, const ElderSigning& signing) {
    const auto& id = evidence.credit.id;

    if (const auto* done = state.completed.find(id)) {
        if (!(done->credit == evidence.credit)) {
            throw errors::invalid_churn_evidence("conflicting credit for completed id " + credit_id_to_string(id));
        }
        return MergeResult{state, {}};
    }

    const auto existing = state.pending.find(id);
    if (existing != state.pending.end() && !(existing->second.credit == evidence.credit)) {
        throw errors::invalid_churn_evidence("conflicting credit for id " + credit_id_to_string(id));
    }
    if (existing != state.pending.end() && existing->second.shares.count(evidence.share.signer) > 0) {
        return MergeResult{state, {}};
    }
    if (!signing.verify(evidence.credit, evidence.share)) {
        throw errors::invalid_churn_evidence("bad signature share from " + name_to_string(evidence.share.signer));
    }

    MergeResult result{state, {}};
    auto& pending = result.state.pending[id];
    pending.credit = evidence.credit;
    pending.shares.emplace(evidence.share.signer, evidence.share);

    if (pending.shares.size() < signing.threshold()) {
        return result;
    }

    auto proof = signing.combine(pending.credit, pending.shares);
    if (!proof.has_value()) {
        throw errors::invalid_churn_evidence("shares did not combine for id " + credit_id_to_string(id));
    }
    result.state.completed.insert(std::move(*proof));
    result.state.pending.erase(id);
    result.newly_completed.insert(id);
    return result;
}

MergeResult merge_all(const AccumulationState& state,
                      const std::vector<CreditShare>& evidence,
                      const ElderSigning& signing) {
    MergeResult result{state, {}};
    for (const auto& share : evidence) {
        auto step = merge(result.state, share, signing);
        result.state = std::move(step.state);
        result.newly_completed.insert(step.newly_completed.begin(), step.newly_completed.end());
    }
    return result;
}

AccumulationState restrict_to(const AccumulationState& state, const std::set<CreditId>& ids) {
    AccumulationState filtered{};
    for (const auto& [id, pending] : state.pending) {
        if (ids.count(id) > 0) {
            filtered.pending.emplace(id, pending);
        }
    }
    for (const auto& [id, proof] : state.completed) {
        if (ids.count(id) > 0) {
            filtered.completed.insert(proof);
        }
    }
    return filtered;
}

}  // namespace sectionnode::rewards
