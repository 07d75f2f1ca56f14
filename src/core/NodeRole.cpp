#include "sectionnode/core/NodeRole.hpp"

#include "sectionnode/Errors.hpp"

namespace sectionnode::core {

std::string_view role_name(const NodeRole& role) noexcept {
    if (std::holds_alternative<AdultRole>(role)) {
        return "adult";
    }
    if (std::holds_alternative<ElderRole>(role)) {
        return "elder";
    }
    return "uninitialized";
}

storage::Chunks& require_chunks(NodeRole& role) {
    auto* adult = std::get_if<AdultRole>(&role);
    if (adult == nullptr || !adult->chunks) {
        throw errors::no_chunks();
    }
    return *adult->chunks;
}

metadata::Metadata& require_metadata(NodeRole& role) {
    auto* elder = std::get_if<ElderRole>(&role);
    if (elder == nullptr || !elder->metadata) {
        throw errors::no_metadata();
    }
    return *elder->metadata;
}

transfers::TransferLedger& require_transfers(NodeRole& role) {
    auto* elder = std::get_if<ElderRole>(&role);
    if (elder == nullptr || !elder->transfers) {
        throw errors::no_transfers();
    }
    return *elder->transfers;
}

rewards::SectionFunds& require_section_funds(NodeRole& role) {
    auto* elder = std::get_if<ElderRole>(&role);
    if (elder == nullptr) {
        throw errors::no_section_funds();
    }
    return elder->section_funds;
}

ElderRole& require_elder(NodeRole& role) {
    auto* elder = std::get_if<ElderRole>(&role);
    if (elder == nullptr || !elder->signing) {
        throw errors::no_section_funds();
    }
    return *elder;
}

}  // namespace sectionnode::core
