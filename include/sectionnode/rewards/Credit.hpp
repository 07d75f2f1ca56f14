#pragma once

#include "sectionnode/Types.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace sectionnode::rewards {

struct Credit {
    CreditId id{};
    Token amount{0};
    PublicKey recipient{};
    std::string msg;

    bool operator==(const Credit&) const = default;
};

using Credits = std::vector<Credit>;

// Every Elder of a round derives the same id for the same payout.
CreditId credit_id_for(const PublicKey& debiting_key,
                       const PublicKey& recipient,
                       Token amount,
                       std::uint64_t position);

Credit make_credit(const PublicKey& debiting_key,
                   const PublicKey& recipient,
                   Token amount,
                   std::uint64_t position,
                   std::string msg);

struct CreditAgreementProof {
    Credit credit;
    Signature section_signature;
    PublicKey section_key{};

    [[nodiscard]] const CreditId& id() const noexcept { return credit.id; }
    [[nodiscard]] Token amount() const noexcept { return credit.amount; }

    bool operator==(const CreditAgreementProof&) const = default;
};

class CreditProofs {
public:
    using Map = std::map<CreditId, CreditAgreementProof>;

    bool insert(CreditAgreementProof proof);
    [[nodiscard]] bool contains(const CreditId& id) const;
    const CreditAgreementProof* find(const CreditId& id) const;

    [[nodiscard]] Token sum() const;
    [[nodiscard]] std::size_t size() const noexcept { return proofs_.size(); }
    [[nodiscard]] bool empty() const noexcept { return proofs_.empty(); }

    Map::const_iterator begin() const noexcept { return proofs_.begin(); }
    Map::const_iterator end() const noexcept { return proofs_.end(); }

    bool operator==(const CreditProofs&) const = default;

private:
    Map proofs_;
};

struct SignatureShare {
    XorName signer{};
    std::size_t index{0};
    Signature bytes;

    bool operator==(const SignatureShare&) const = default;
};

// One Elder's evidence for one credit.
struct CreditShare {
    Credit credit;
    SignatureShare share;

    bool operator==(const CreditShare&) const = default;
};

struct RewardProposal {
    PublicKey section_key{};
    XorName proposer{};
    Credits credits;

    bool operator==(const RewardProposal&) const = default;
};

struct RewardAccumulation {
    PublicKey section_key{};
    XorName signer{};
    std::vector<CreditShare> shares;

    bool operator==(const RewardAccumulation&) const = default;
};

struct NodeWallet {
    PublicKey wallet{};
    Age age{0};

    bool operator==(const NodeWallet&) const = default;
};

using NodeWallets = std::map<XorName, NodeWallet>;

}  // namespace sectionnode::rewards
