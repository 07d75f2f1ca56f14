#pragma once

#include "sectionnode/Types.hpp"
#include "sectionnode/rewards/Credit.hpp"

#include <cstddef>
#include <map>
#include <optional>

namespace sectionnode::rewards {

// Threshold signing by the current Elders. Owns quorum size and share validity.
class ElderSigning {
public:
    virtual ~ElderSigning() = default;

    // Number of distinct valid shares needed to combine.
    virtual std::size_t threshold() const = 0;
    virtual PublicKey section_key() const = 0;

    virtual SignatureShare sign(const Credit& credit) = 0;
    virtual bool verify(const Credit& credit, const SignatureShare& share) const = 0;
    // The combined proof must not depend on which qualifying subset is used.
    virtual std::optional<CreditAgreementProof> combine(const Credit& credit,
                                                        const std::map<XorName, SignatureShare>& shares) const = 0;
};

}  // namespace sectionnode::rewards
