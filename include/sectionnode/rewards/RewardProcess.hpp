#pragma once

#include "sectionnode/Types.hpp"
#include "sectionnode/core/Duties.hpp"
#include "sectionnode/rewards/Credit.hpp"
#include "sectionnode/rewards/CreditAccumulator.hpp"
#include "sectionnode/rewards/ElderSigning.hpp"

#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace sectionnode::rewards {

// Shares that arrive before any proposal are kept here.
struct AwaitingProposals {
    AccumulationState early;

    bool operator==(const AwaitingProposals&) const = default;
};

struct Accumulating {
    Credits credits;
    AccumulationState state;

    bool operator==(const Accumulating&) const = default;
};

struct Completed {
    CreditProofs proofs;

    bool operator==(const Completed&) const = default;
};

using RewardStage = std::variant<AwaitingProposals, Accumulating, Completed>;

// One reward round among the Elders of a section key. Each Elder votes once,
// for the first proposal it sees, by broadcasting a share per credit. The
// round completes once every proposed credit has a combined proof.
class RewardProcess {
public:
    RewardProcess(PublicKey section_key,
                  XorName our_name,
                  std::vector<XorName> elders,
                  std::shared_ptr<ElderSigning> signing);

    // Broadcasts our proposal to all Elders, ourselves included.
    core::NodeDuty propose(const Credits& credits) const;

    core::NodeDuty receive_churn_proposal(const RewardProposal& proposal);
    // Returns the proofs when this accumulation completes the round.
    [[nodiscard]] std::optional<CreditProofs> receive_wallet_accumulation(const RewardAccumulation& accumulation);

    const RewardStage& stage() const noexcept { return stage_; }
    const PublicKey& section_key() const noexcept { return section_key_; }
    const std::vector<XorName>& elders() const noexcept { return elders_; }

private:
    bool is_elder(const XorName& name) const;
    void check_source(const PublicKey& section_key, const XorName& sender) const;

    PublicKey section_key_{};
    XorName our_name_{};
    std::vector<XorName> elders_;
    std::shared_ptr<ElderSigning> signing_;
    RewardStage stage_{AwaitingProposals{}};
};

}  // namespace sectionnode::rewards
