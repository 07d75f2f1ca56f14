#include "sectionnode/rewards/Credit.hpp"

#include "sectionnode/crypto/Sha256.hpp"

#include <numeric>

namespace sectionnode::rewards {

CreditId credit_id_for(const PublicKey& debiting_key,
                       const PublicKey& recipient,
                       Token amount,
                       std::uint64_t position) {
    crypto::Sha256 hasher;
    hasher.update(debiting_key);
    hasher.update(recipient);
    hasher.update_u64(amount);
    hasher.update_u64(position);
    return hasher.finalize();
}

Credit make_credit(const PublicKey& debiting_key,
                   const PublicKey& recipient,
                   Token amount,
                   std::uint64_t position,
                   std::string msg) {
    Credit credit{};
    credit.id = credit_id_for(debiting_key, recipient, amount, position);
    credit.amount = amount;
    credit.recipient = recipient;
    credit.msg = std::move(msg);
    return credit;
}

bool CreditProofs::insert(CreditAgreementProof proof) {
    const auto id = proof.id();
    return proofs_.emplace(id, std::move(proof)).second;
}

bool CreditProofs::contains(const CreditId& id) const {
    return proofs_.find(id) != proofs_.end();
}

const CreditAgreementProof* CreditProofs::find(const CreditId& id) const {
    const auto it = proofs_.find(id);
    return it == proofs_.end() ? nullptr : &it->second;
}

Token CreditProofs::sum() const {
    return std::accumulate(proofs_.begin(), proofs_.end(), Token{0}, [](Token total, const auto& entry) {
        return total + entry.second.amount();
    });
}

}  // namespace sectionnode::rewards
