#pragma once

#include "sectionnode/Types.hpp"
#include "sectionnode/metadata/Metadata.hpp"
#include "sectionnode/rewards/ElderSigning.hpp"
#include "sectionnode/routing/SectionElders.hpp"
#include "sectionnode/transfers/TransferLedger.hpp"

#include <filesystem>
#include <memory>

namespace sectionnode::core {

struct NodeInfo {
    XorName node_name{};
    std::filesystem::path root_dir;
    // True for the first node of the network.
    bool genesis{false};
};

// Builds the Elder subsystems on promotion.
class SubsystemFactory {
public:
    virtual ~SubsystemFactory() = default;

    virtual std::unique_ptr<metadata::Metadata> make_metadata(const NodeInfo& info) = 0;
    virtual std::unique_ptr<transfers::TransferLedger> make_transfers(const NodeInfo& info,
                                                                     const routing::SectionElders& elders) = 0;
    virtual std::shared_ptr<rewards::ElderSigning> make_signing(const NodeInfo& info,
                                                                const routing::SectionElders& elders) = 0;
};

}  // namespace sectionnode::core
