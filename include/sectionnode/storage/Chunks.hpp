#pragma once

#include "sectionnode/Config.hpp"
#include "sectionnode/Types.hpp"
#include "sectionnode/core/Duties.hpp"
#include "sectionnode/storage/ChunkStore.hpp"

#include <filesystem>
#include <vector>

namespace sectionnode::storage {

// Adult chunk duties on top of a ChunkStore.
class Chunks {
public:
    Chunks(XorName our_name, const std::filesystem::path& root, Config config = {});

    core::NodeDuty read(const protocol::ChunkRead& read, const MessageId& msg_id, const core::Destination& origin) const;
    core::NodeDuty write(const protocol::ChunkWrite& write, const MessageId& msg_id, const core::Destination& origin);

    // Asks the current holders for a copy; `id` travels with the request so
    // the reply can be matched on arrival.
    core::NodeDuty replicate_chunk(const XorName& address,
                                   const std::vector<XorName>& current_holders,
                                   const MessageId& id) const;
    core::NodeDuty get_chunk_for_replication(const XorName& address,
                                             const MessageId& id,
                                             const XorName& new_holder) const;
    core::NodeDuties store_replicated_chunk(const protocol::Chunk& chunk);

    // Emits ReachingMaxCapacity once each time usage crosses the warning ratio.
    core::NodeDuties check_storage();

    const ChunkStore& store() const noexcept { return store_; }

private:
    XorName our_name_{};
    Config config_;
    ChunkStore store_;
    bool capacity_reported_{false};
};

}  // namespace sectionnode::storage
