#include "sectionnode/storage/Chunks.hpp"

#include "sectionnode/Errors.hpp"
#include "sectionnode/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <iterator>

namespace sectionnode::storage {

namespace {

using daemon::StructuredLogger;

}  // namespace

Chunks::Chunks(XorName our_name, const std::filesystem::path& root, Config config)
    : our_name_(our_name),
      config_(config),
      store_(root, config) {}

core::NodeDuty Chunks::read(const protocol::ChunkRead& read,
                            const MessageId& msg_id,
                            const core::Destination& origin) const {
    auto chunk = store_.get(read.address);
    if (!chunk.has_value()) {
        daemon::log_event(StructuredLogger::Level::Debug,
                          "chunks.read_miss",
                          {{"address", name_to_string(read.address)}});
    }
    return core::send(protocol::reply_to(origin, msg_id, protocol::ChunkResult{std::move(chunk)}));
}

core::NodeDuty Chunks::write(const protocol::ChunkWrite& write,
                             const MessageId& msg_id,
                             const core::Destination& origin) {
    if (!protocol::is_valid_chunk(write.chunk)) {
        daemon::log_event(StructuredLogger::Level::Warning,
                          "chunks.invalid_address",
                          {{"address", name_to_string(write.chunk.address)}});
        return core::send(protocol::ack_to(origin, msg_id, "chunk address does not match its content"));
    }
    store_.put(write.chunk);
    return core::send(protocol::ack_to(origin, msg_id));
}

core::NodeDuty Chunks::replicate_chunk(const XorName& address,
                                       const std::vector<XorName>& current_holders,
                                       const MessageId& id) const {
    if (store_.has(address)) {
        return core::duty::NoOp{};
    }
    std::vector<XorName> targets;
    std::copy_if(current_holders.begin(), current_holders.end(), std::back_inserter(targets),
                 [&](const XorName& holder) { return holder != our_name_; });
    if (targets.empty()) {
        daemon::log_event(StructuredLogger::Level::Warning,
                          "chunks.no_holders",
                          {{"address", name_to_string(address)}});
        return core::duty::NoOp{};
    }
    return core::duty::SendToNodes{std::move(targets),
                                   protocol::NodeMessage{protocol::GetChunkForReplicationMsg{address, our_name_}},
                                   id};
}

core::NodeDuty Chunks::get_chunk_for_replication(const XorName& address,
                                                 const MessageId& id,
                                                 const XorName& new_holder) const {
    auto chunk = store_.get(address);
    if (!chunk.has_value()) {
        throw errors::collaborator("E_CHUNK_STORE", "No chunk " + name_to_string(address) + " to replicate");
    }
    return core::duty::SendToNodes{{new_holder},
                                   protocol::NodeMessage{protocol::StoreChunkForReplicationMsg{std::move(*chunk)}},
                                   id};
}

core::NodeDuties Chunks::store_replicated_chunk(const protocol::Chunk& chunk) {
    if (!protocol::is_valid_chunk(chunk)) {
        throw errors::collaborator("E_CHUNK_STORE", "Replicated chunk " + name_to_string(chunk.address) +
                                                        " does not match its content");
    }
    store_.put(chunk);
    daemon::log_event(StructuredLogger::Level::Info,
                      "chunks.replicated",
                      {{"address", name_to_string(chunk.address)}});
    return check_storage();
}

core::NodeDuties Chunks::check_storage() {
    const auto ratio = store_.used_ratio();
    if (ratio < config_.capacity_warning_ratio) {
        capacity_reported_ = false;
        return {};
    }
    if (capacity_reported_) {
        return {};
    }
    capacity_reported_ = true;
    daemon::log_event(StructuredLogger::Level::Warning,
                      "chunks.reaching_capacity",
                      {{"used", std::to_string(store_.used_space())},
                       {"max", std::to_string(store_.max_capacity())}});
    return {core::duty::ReachingMaxCapacity{}};
}

}  // namespace sectionnode::storage
