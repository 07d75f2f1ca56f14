#pragma once

#include "sectionnode/Types.hpp"

#include <variant>

namespace sectionnode::protocol {

// Immutable content-addressed blob; the address is the SHA-256 of the value.
struct Chunk {
    XorName address{};
    ChunkData value;

    bool operator==(const Chunk&) const = default;
};

Chunk make_chunk(ChunkData value);
bool is_valid_chunk(const Chunk& chunk);

struct ChunkRead {
    XorName address{};
};

struct ChunkWrite {
    Chunk chunk;
};

struct DataQuery {
    XorName address{};
};

struct StoreChunk {
    Chunk chunk;
};

struct PutData {
    XorName address{};
    ChunkData value;
};

struct DeleteData {
    XorName address{};
};

using DataCmd = std::variant<StoreChunk, PutData, DeleteData>;

XorName dst_address(const ChunkRead& read);
XorName dst_address(const ChunkWrite& write);
XorName dst_address(const DataQuery& query);
XorName dst_address(const DataCmd& cmd);

}  // namespace sectionnode::protocol
