#include "sectionnode/protocol/Data.hpp"

#include <type_traits>

namespace sectionnode::protocol {

Chunk make_chunk(ChunkData value) {
    Chunk chunk{};
    chunk.address = chunk_address(value);
    chunk.value = std::move(value);
    return chunk;
}

bool is_valid_chunk(const Chunk& chunk) {
    return chunk.address == chunk_address(chunk.value);
}

XorName dst_address(const ChunkRead& read) {
    return read.address;
}

XorName dst_address(const ChunkWrite& write) {
    return write.chunk.address;
}

XorName dst_address(const DataQuery& query) {
    return query.address;
}

XorName dst_address(const DataCmd& cmd) {
    return std::visit(
        [](const auto& value) -> XorName {
            using CmdType = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<CmdType, StoreChunk>) {
                return value.chunk.address;
            } else {
                return value.address;
            }
        },
        cmd);
}

}  // namespace sectionnode::protocol
