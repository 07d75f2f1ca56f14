#pragma once

#include "sectionnode/metadata/Metadata.hpp"
#include "sectionnode/rewards/ElderSigning.hpp"
#include "sectionnode/rewards/SectionFunds.hpp"
#include "sectionnode/storage/Chunks.hpp"
#include "sectionnode/transfers/TransferLedger.hpp"

#include <memory>
#include <string_view>
#include <variant>

namespace sectionnode::core {

struct Uninitialized {};

struct AdultRole {
    std::unique_ptr<storage::Chunks> chunks;
};

struct ElderRole {
    std::unique_ptr<metadata::Metadata> metadata;
    std::unique_ptr<transfers::TransferLedger> transfers;
    rewards::SectionFunds section_funds;
    std::shared_ptr<rewards::ElderSigning> signing;
};

// Replaced wholesale on every role transition.
using NodeRole = std::variant<Uninitialized, AdultRole, ElderRole>;

std::string_view role_name(const NodeRole& role) noexcept;

// Each throws the role mismatch error for its subsystem.
storage::Chunks& require_chunks(NodeRole& role);
metadata::Metadata& require_metadata(NodeRole& role);
transfers::TransferLedger& require_transfers(NodeRole& role);
rewards::SectionFunds& require_section_funds(NodeRole& role);
ElderRole& require_elder(NodeRole& role);

}  // namespace sectionnode::core
