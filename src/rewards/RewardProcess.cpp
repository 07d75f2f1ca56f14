#include "sectionnode/rewards/RewardProcess.hpp"

#include "sectionnode/Errors.hpp"
#include "sectionnode/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <set>
#include <vector>

namespace sectionnode::rewards {

namespace {

using daemon::StructuredLogger;

std::set<CreditId> ids_of(const Credits& credits) {
    std::set<CreditId> ids;
    for (const auto& credit : credits) {
        ids.insert(credit.id);
    }
    return ids;
}

const Credit* find_credit(const Credits& credits, const CreditId& id) {
    const auto it = std::find_if(credits.begin(), credits.end(), [&](const Credit& credit) {
        return credit.id == id;
    });
    return it == credits.end() ? nullptr : &*it;
}

// Keeps only early evidence that agrees with the adopted credits.
AccumulationState adopt_early(const AccumulationState& early, const Credits& credits) {
    AccumulationState adopted = restrict_to(early, ids_of(credits));
    for (auto it = adopted.pending.begin(); it != adopted.pending.end();) {
        const auto* proposed = find_credit(credits, it->first);
        if (proposed == nullptr || !(*proposed == it->second.credit)) {
            it = adopted.pending.erase(it);
        } else {
            ++it;
        }
    }
    CreditProofs agreeing;
    for (const auto& [id, proof] : adopted.completed) {
        const auto* proposed = find_credit(credits, id);
        if (proposed != nullptr && *proposed == proof.credit) {
            agreeing.insert(proof);
        }
    }
    adopted.completed = std::move(agreeing);
    return adopted;
}

bool all_completed(const Credits& credits, const AccumulationState& state) {
    return std::all_of(credits.begin(), credits.end(), [&](const Credit& credit) {
        return state.completed.contains(credit.id);
    });
}

}  // namespace

RewardProcess::RewardProcess(PublicKey section_key,
                             XorName our_name,
                             std::vector<XorName> elders,
                             std::shared_ptr<ElderSigning> signing)
    : section_key_(section_key),
      our_name_(our_name),
      elders_(std::move(elders)),
      signing_(std::move(signing)) {}

core::NodeDuty RewardProcess::propose(const Credits& credits) const {
    if (credits.empty()) {
        return core::duty::NoOp{};
    }
    RewardProposal proposal{};
    proposal.section_key = section_key_;
    proposal.proposer = our_name_;
    proposal.credits = credits;

    const auto msg_id = combine_message_ids({xor_name_from_key(section_key_), our_name_, credits.front().id});
    return core::duty::SendToNodes{elders_, protocol::NodeMessage{std::move(proposal)}, msg_id};
}

core::NodeDuty RewardProcess::receive_churn_proposal(const RewardProposal& proposal) {
    check_source(proposal.section_key, proposal.proposer);
    if (proposal.credits.empty()) {
        throw errors::invalid_churn_evidence("empty reward proposal from " + name_to_string(proposal.proposer));
    }
    if (ids_of(proposal.credits).size() != proposal.credits.size()) {
        throw errors::invalid_churn_evidence("duplicate credit ids in proposal from " + name_to_string(proposal.proposer));
    }

    if (std::holds_alternative<Completed>(stage_)) {
        return core::duty::NoOp{};
    }
    if (const auto* accumulating = std::get_if<Accumulating>(&stage_)) {
        if (accumulating->credits != proposal.credits) {
            throw errors::invalid_churn_evidence("proposal from " + name_to_string(proposal.proposer) +
                                                 " conflicts with the adopted one");
        }
        return core::duty::NoOp{};
    }

    const auto& awaiting = std::get<AwaitingProposals>(stage_);

    RewardAccumulation vote{};
    vote.section_key = section_key_;
    vote.signer = our_name_;
    for (const auto& credit : proposal.credits) {
        vote.shares.push_back(CreditShare{credit, signing_->sign(credit)});
    }

    auto adopted = adopt_early(awaiting.early, proposal.credits);
    stage_ = Accumulating{proposal.credits, std::move(adopted)};

    daemon::log_event(StructuredLogger::Level::Info,
                      "rewards.proposal_adopted",
                      {{"section_key", key_to_string(section_key_)},
                       {"proposer", name_to_string(proposal.proposer)},
                       {"credits", std::to_string(proposal.credits.size())}});

    const auto msg_id = combine_message_ids({xor_name_from_key(section_key_), our_name_});
    return core::duty::SendToNodes{elders_, protocol::NodeMessage{std::move(vote)}, msg_id};
}

std::optional<CreditProofs> RewardProcess::receive_wallet_accumulation(const RewardAccumulation& accumulation) {
    check_source(accumulation.section_key, accumulation.signer);
    for (const auto& share : accumulation.shares) {
        if (share.share.signer != accumulation.signer) {
            throw errors::invalid_churn_evidence("share signer does not match accumulation signer " +
                                                 name_to_string(accumulation.signer));
        }
    }

    if (std::holds_alternative<Completed>(stage_)) {
        return std::nullopt;
    }

    if (auto* awaiting = std::get_if<AwaitingProposals>(&stage_)) {
        auto merged = merge_all(awaiting->early, accumulation.shares, *signing_);
        awaiting->early = std::move(merged.state);
        return std::nullopt;
    }

    // Shares for credits outside the adopted proposal are verified and then
    // dropped, the same as early evidence is on adoption.
    auto& accumulating = std::get<Accumulating>(stage_);
    std::vector<CreditShare> relevant;
    relevant.reserve(accumulation.shares.size());
    for (const auto& share : accumulation.shares) {
        const auto* proposed = find_credit(accumulating.credits, share.credit.id);
        if (proposed != nullptr && *proposed == share.credit) {
            relevant.push_back(share);
            continue;
        }
        if (!signing_->verify(share.credit, share.share)) {
            throw errors::invalid_churn_evidence("bad signature share from " + name_to_string(share.share.signer));
        }
        daemon::log_event(StructuredLogger::Level::Debug,
                          "rewards.share_dropped",
                          {{"credit", credit_id_to_string(share.credit.id)},
                           {"signer", name_to_string(share.share.signer)}});
    }

    auto merged = merge_all(accumulating.state, relevant, *signing_);
    if (!all_completed(accumulating.credits, merged.state)) {
        accumulating.state = std::move(merged.state);
        return std::nullopt;
    }

    auto proofs = merged.state.completed;
    stage_ = Completed{proofs};
    return proofs;
}

bool RewardProcess::is_elder(const XorName& name) const {
    return std::find(elders_.begin(), elders_.end(), name) != elders_.end();
}

void RewardProcess::check_source(const PublicKey& section_key, const XorName& sender) const {
    if (section_key != section_key_) {
        throw errors::invalid_churn_evidence("evidence for section key " + key_to_string(section_key) +
                                             " in round of " + key_to_string(section_key_));
    }
    if (!is_elder(sender)) {
        throw errors::invalid_churn_evidence("evidence from non-elder " + name_to_string(sender));
    }
}

}  // namespace sectionnode::rewards
