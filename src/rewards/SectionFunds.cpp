#include "sectionnode/rewards/SectionFunds.hpp"

#include "sectionnode/daemon/StructuredLogger.hpp"

namespace sectionnode::rewards {

namespace {

using daemon::StructuredLogger;

}  // namespace

SectionFunds::SectionFunds(RewardWallets wallets, Payments payments)
    : state_(KeepingNodeWallets{std::move(wallets), std::move(payments)}) {}

bool SectionFunds::is_churning() const noexcept {
    return std::holds_alternative<Churning>(state_);
}

const RewardProcess* SectionFunds::churn_process() const noexcept {
    if (const auto* churning = std::get_if<Churning>(&state_)) {
        return &churning->process;
    }
    return nullptr;
}

const RewardWallets& SectionFunds::wallets() const {
    return std::visit([](const auto& state) -> const RewardWallets& { return state.wallets; }, state_);
}

const Payments& SectionFunds::payments() const {
    return std::visit([](const auto& state) -> const Payments& { return state.payments; }, state_);
}

RewardWallets& SectionFunds::mutable_wallets() {
    return std::visit([](auto& state) -> RewardWallets& { return state.wallets; }, state_);
}

void SectionFunds::set_node_wallet(const XorName& node_id, const PublicKey& wallet, Age age) {
    mutable_wallets().set_node_wallet(node_id, wallet, age);
}

bool SectionFunds::remove_node_wallet(const XorName& node_id) {
    return mutable_wallets().remove_node_wallet(node_id);
}

bool SectionFunds::relocate_node_wallet(const XorName& old_node_id, const XorName& new_node_id, Age age) {
    return mutable_wallets().relocate(old_node_id, new_node_id, age);
}

void SectionFunds::replace_node_wallets(const NodeWallets& wallets) {
    mutable_wallets() = RewardWallets(wallets);
}

void SectionFunds::add_payment(const CreditAgreementProof& credit) {
    std::visit([&](auto& state) { state.payments.insert_or_assign(credit.id(), credit); }, state_);
}

core::NodeDuty SectionFunds::begin_churn(RewardProcess process, const Credits& credits) {
    auto proposal = process.propose(credits);

    Churning next{std::move(process), wallets(), payments()};
    if (const auto* previous = churn_process()) {
        daemon::log_event(StructuredLogger::Level::Warning,
                          "rewards.round_superseded",
                          {{"previous_key", key_to_string(previous->section_key())},
                           {"section_key", key_to_string(next.process.section_key())}});
    }
    state_ = std::move(next);
    return proposal;
}

core::NodeDuties SectionFunds::receive_churn_proposal(const RewardProposal& proposal) {
    auto* churning = std::get_if<Churning>(&state_);
    if (churning == nullptr) {
        daemon::log_event(StructuredLogger::Level::Debug,
                          "rewards.proposal_ignored",
                          {{"proposer", name_to_string(proposal.proposer)}});
        return {};
    }
    return {churning->process.receive_churn_proposal(proposal)};
}

core::NodeDuties SectionFunds::receive_wallet_accumulation(const RewardAccumulation& accumulation) {
    auto* churning = std::get_if<Churning>(&state_);
    if (churning == nullptr) {
        daemon::log_event(StructuredLogger::Level::Debug,
                          "rewards.accumulation_ignored",
                          {{"signer", name_to_string(accumulation.signer)}});
        return {};
    }

    auto proofs = churning->process.receive_wallet_accumulation(accumulation);
    if (!proofs.has_value()) {
        return {};
    }

    auto duties = propagate_credits(*proofs);
    daemon::log_event(StructuredLogger::Level::Info,
                      "rewards.completed",
                      {{"section_key", key_to_string(churning->process.section_key())},
                       {"credits", std::to_string(proofs->size())},
                       {"total_paid", std::to_string(proofs->sum())}});

    KeepingNodeWallets keeping{std::move(churning->wallets), std::move(churning->payments)};
    state_ = std::move(keeping);
    return duties;
}

core::NodeDuties propagate_credits(const CreditProofs& proofs) {
    core::NodeDuties duties;
    for (const auto& [id, proof] : proofs) {
        protocol::OutgoingMsg out{};
        out.msg = protocol::NodeMessage{protocol::PropagateCreditMsg{proof}};
        out.id = combine_message_ids({id});
        out.dst = protocol::to_section(xor_name_from_key(proof.credit.recipient));
        out.section_source = true;
        out.aggregation = protocol::Aggregation::AtDestination;
        duties.push_back(core::send(std::move(out)));
    }
    return duties;
}

}  // namespace sectionnode::rewards
