#pragma once

#include "sectionnode/Config.hpp"
#include "sectionnode/metadata/Metadata.hpp"
#include "sectionnode/routing/Network.hpp"

#include <map>
#include <optional>
#include <set>
#include <vector>

namespace sectionnode::metadata {

class ChunkHolderMetadata : public Metadata {
public:
    ChunkHolderMetadata(const routing::Network& network, Config config = {});

    core::NodeDuty read(const protocol::DataQuery& query,
                        const MessageId& msg_id,
                        const core::Destination& origin) override;
    core::NodeDuty write(const protocol::DataCmd& cmd,
                         const MessageId& msg_id,
                         const core::Destination& origin) override;
    core::NodeDuties trigger_chunk_replication(const XorName& lost_node) override;
    void record_chunk_holder(const XorName& address, const XorName& holder) override;

    std::set<XorName> holders_of(const XorName& address) const;

private:
    // Adults XOR-closest to `address`, skipping `excluded`.
    std::vector<XorName> closest_adults(const XorName& address,
                                        std::size_t count,
                                        const std::set<XorName>& excluded) const;

    const routing::Network& network_;
    Config config_;
    std::map<XorName, std::set<XorName>> chunk_holders_;
    std::map<XorName, ChunkData> data_;
};

}  // namespace sectionnode::metadata
