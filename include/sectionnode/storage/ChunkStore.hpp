#pragma once

#include "sectionnode/Config.hpp"
#include "sectionnode/Types.hpp"
#include "sectionnode/protocol/Data.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sectionnode::storage {

struct ChunkRecord {
    protocol::Chunk chunk;
    bool persisted{false};
    std::filesystem::path file_path;
};

// Chunks kept in memory and, when enabled, mirrored to `<root>/<hex>.chunk`.
class ChunkStore {
public:
    ChunkStore(std::filesystem::path root, Config config = {});

    // Throws NodeError(Collaborator, E_CHUNK_STORE) when the chunk does not fit.
    void put(const protocol::Chunk& chunk);
    std::optional<protocol::Chunk> get(const XorName& address) const;
    [[nodiscard]] bool has(const XorName& address) const;

    std::size_t size() const noexcept;
    std::uint64_t used_space() const noexcept;
    std::uint64_t max_capacity() const noexcept { return max_capacity_; }
    // Fraction of capacity in use, 0.0 to 1.0.
    double used_ratio() const noexcept;
    std::vector<XorName> addresses() const;

    const std::filesystem::path& root() const noexcept { return storage_root_; }

private:
    Config config_;
    std::unordered_map<std::string, ChunkRecord> chunks_;
    bool persistent_enabled_{false};
    std::uint8_t wipe_passes_{1};
    std::uint64_t max_capacity_{0};
    std::uint64_t used_space_{0};
    std::filesystem::path storage_root_;
    mutable std::mutex chunks_mutex_;

    std::filesystem::path chunk_path_for_key(const std::string& key) const;
    bool ensure_storage_directory();
    void load_persisted_chunks();
    bool persist_chunk_to_disk(const std::string& key, const ChunkRecord& record);
    bool secure_wipe_file(const std::filesystem::path& path) const;
};

}  // namespace sectionnode::storage
