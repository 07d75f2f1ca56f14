#pragma once

#include "sectionnode/Types.hpp"
#include "sectionnode/rewards/Credit.hpp"
#include "sectionnode/rewards/ElderSigning.hpp"

#include <map>
#include <set>
#include <vector>

namespace sectionnode::rewards {

struct PendingCredit {
    Credit credit;
    std::map<XorName, SignatureShare> shares;

    bool operator==(const PendingCredit&) const = default;
};

struct AccumulationState {
    std::map<CreditId, PendingCredit> pending;
    CreditProofs completed;

    bool operator==(const AccumulationState&) const = default;
};

struct MergeResult {
    AccumulationState state;
    std::set<CreditId> newly_completed;
};

// Folds one share into a copy of `state`. Throws NodeError(Protocol) on an
// invalid share or a credit that conflicts with one already seen under the
// same id; `state` is never modified. A second share from the same signer is
// ignored.
MergeResult merge(const AccumulationState& state, const CreditShare& evidence, const ElderSigning& signing);

MergeResult merge_all(const AccumulationState& state,
                      const std::vector<CreditShare>& evidence,
                      const ElderSigning& signing);

// Drops every entry whose id is not in `ids`.
AccumulationState restrict_to(const AccumulationState& state, const std::set<CreditId>& ids);

}  // namespace sectionnode::rewards
