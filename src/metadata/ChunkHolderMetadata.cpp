#include "sectionnode/metadata/ChunkHolderMetadata.hpp"

#include "sectionnode/daemon/StructuredLogger.hpp"
#include "sectionnode/routing/Prefix.hpp"

#include <algorithm>
#include <type_traits>

namespace sectionnode::metadata {

namespace {

using daemon::StructuredLogger;

}  // namespace

ChunkHolderMetadata::ChunkHolderMetadata(const routing::Network& network, Config config)
    : network_(network),
      config_(config) {}

core::NodeDuty ChunkHolderMetadata::read(const protocol::DataQuery& query,
                                         const MessageId& msg_id,
                                         const core::Destination& origin) {
    if (const auto it = data_.find(query.address); it != data_.end()) {
        return core::send(protocol::reply_to(origin, msg_id, protocol::DataResult{it->second}));
    }

    const auto holders = holders_of(query.address);
    if (holders.empty()) {
        return core::send(protocol::reply_to(origin, msg_id, protocol::DataResult{std::nullopt}));
    }
    return core::duty::SendToNodes{std::vector<XorName>(holders.begin(), holders.end()),
                                   protocol::NodeMessage{protocol::ReadChunkMsg{protocol::ChunkRead{query.address}, origin}},
                                   msg_id};
}

core::NodeDuty ChunkHolderMetadata::write(const protocol::DataCmd& cmd,
                                          const MessageId& msg_id,
                                          const core::Destination& origin) {
    return std::visit(
        [&](const auto& value) -> core::NodeDuty {
            using CmdType = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<CmdType, protocol::StoreChunk>) {
                const auto targets = closest_adults(value.chunk.address, config_.chunk_copy_count, {});
                if (targets.empty()) {
                    return core::send(protocol::ack_to(origin, msg_id, "no adults available to hold the chunk"));
                }
                for (const auto& target : targets) {
                    record_chunk_holder(value.chunk.address, target);
                }
                return core::duty::SendToNodes{targets,
                                               protocol::NodeMessage{protocol::WriteChunkMsg{protocol::ChunkWrite{value.chunk}, origin}},
                                               msg_id};
            } else if constexpr (std::is_same_v<CmdType, protocol::PutData>) {
                data_.insert_or_assign(value.address, value.value);
                return core::send(protocol::ack_to(origin, msg_id));
            } else {
                if (data_.erase(value.address) == 0) {
                    return core::send(protocol::ack_to(origin, msg_id, "no data at " + name_to_string(value.address)));
                }
                return core::send(protocol::ack_to(origin, msg_id));
            }
        },
        cmd);
}

core::NodeDuties ChunkHolderMetadata::trigger_chunk_replication(const XorName& lost_node) {
    core::NodeDuties duties;
    for (auto& [address, holders] : chunk_holders_) {
        if (holders.erase(lost_node) == 0) {
            continue;
        }
        if (holders.empty()) {
            daemon::log_event(StructuredLogger::Level::Warning,
                              "metadata.chunk_lost",
                              {{"address", name_to_string(address)}});
            continue;
        }

        auto excluded = holders;
        excluded.insert(lost_node);
        const auto candidates = closest_adults(address, 1, excluded);
        if (candidates.empty()) {
            daemon::log_event(StructuredLogger::Level::Warning,
                              "metadata.no_replication_target",
                              {{"address", name_to_string(address)}});
            continue;
        }

        const auto& new_holder = candidates.front();
        std::vector<XorName> current(holders.begin(), holders.end());
        holders.insert(new_holder);
        duties.push_back(core::duty::SendToNodes{{new_holder},
                                                 protocol::NodeMessage{protocol::ReplicateChunkMsg{address, std::move(current)}},
                                                 combine_message_ids({address, new_holder})});
    }
    return duties;
}

void ChunkHolderMetadata::record_chunk_holder(const XorName& address, const XorName& holder) {
    chunk_holders_[address].insert(holder);
}

std::set<XorName> ChunkHolderMetadata::holders_of(const XorName& address) const {
    const auto it = chunk_holders_.find(address);
    if (it == chunk_holders_.end()) {
        return {};
    }
    return it->second;
}

std::vector<XorName> ChunkHolderMetadata::closest_adults(const XorName& address,
                                                         std::size_t count,
                                                         const std::set<XorName>& excluded) const {
    std::vector<XorName> adults;
    for (const auto& adult : network_.our_adults()) {
        if (excluded.count(adult) == 0) {
            adults.push_back(adult);
        }
    }
    std::sort(adults.begin(), adults.end(), [&](const XorName& lhs, const XorName& rhs) {
        return routing::closer_to(address, lhs, rhs);
    });
    if (adults.size() > count) {
        adults.resize(count);
    }
    return adults;
}

}  // namespace sectionnode::metadata
