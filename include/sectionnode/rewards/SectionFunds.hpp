#pragma once

#include "sectionnode/Types.hpp"
#include "sectionnode/core/Duties.hpp"
#include "sectionnode/rewards/Credit.hpp"
#include "sectionnode/rewards/RewardProcess.hpp"
#include "sectionnode/rewards/RewardWallets.hpp"

#include <map>
#include <variant>

namespace sectionnode::rewards {

// Credits paid to the section while it holds funds, keyed by id.
using Payments = std::map<CreditId, CreditAgreementProof>;

struct KeepingNodeWallets {
    RewardWallets wallets;
    Payments payments;
};

struct Churning {
    RewardProcess process;
    RewardWallets wallets;
    Payments payments;
};

class SectionFunds {
public:
    SectionFunds() = default;
    explicit SectionFunds(RewardWallets wallets, Payments payments = {});

    [[nodiscard]] bool is_churning() const noexcept;
    const RewardProcess* churn_process() const noexcept;

    const RewardWallets& wallets() const;
    const Payments& payments() const;

    void set_node_wallet(const XorName& node_id, const PublicKey& wallet, Age age);
    bool remove_node_wallet(const XorName& node_id);
    bool relocate_node_wallet(const XorName& old_node_id, const XorName& new_node_id, Age age);
    void replace_node_wallets(const NodeWallets& wallets);
    void add_payment(const CreditAgreementProof& credit);

    // Opens a new round, dropping any round still in progress. Wallets and
    // payments carry over. Returns our proposal broadcast.
    core::NodeDuty begin_churn(RewardProcess process, const Credits& credits);

    // Outside a round both are ignored.
    core::NodeDuties receive_churn_proposal(const RewardProposal& proposal);
    // On completion returns one propagation per proof and goes back to
    // keeping wallets.
    core::NodeDuties receive_wallet_accumulation(const RewardAccumulation& accumulation);

private:
    RewardWallets& mutable_wallets();

    std::variant<KeepingNodeWallets, Churning> state_{KeepingNodeWallets{}};
};

// One PropagateCredit per proof, to the recipient's section.
core::NodeDuties propagate_credits(const CreditProofs& proofs);

}  // namespace sectionnode::rewards
