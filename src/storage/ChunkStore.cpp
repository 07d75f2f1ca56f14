#include "sectionnode/storage/ChunkStore.hpp"

#include "sectionnode/Errors.hpp"
#include "sectionnode/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <utility>
#include <vector>

namespace sectionnode::storage {

namespace {

using daemon::StructuredLogger;

constexpr const char* kChunkExtension = ".chunk";

}  // namespace

ChunkStore::ChunkStore(std::filesystem::path root, Config config)
    : config_(std::move(config)),
      persistent_enabled_(config_.chunk_persistence_enabled),
      wipe_passes_(std::max<std::uint8_t>(config_.chunk_wipe_passes, static_cast<std::uint8_t>(1))),
      max_capacity_(config_.max_capacity_bytes),
      storage_root_(std::move(root)) {
    if (persistent_enabled_) {
        if (!ensure_storage_directory()) {
            daemon::log_event(StructuredLogger::Level::Warning,
                              "chunks.persistence_disabled",
                              {{"root", storage_root_.string()}});
            persistent_enabled_ = false;
        } else {
            load_persisted_chunks();
        }
    }
}

void ChunkStore::put(const protocol::Chunk& chunk) {
    std::scoped_lock lock(chunks_mutex_);
    const auto key = name_to_string(chunk.address);
    if (chunks_.find(key) != chunks_.end()) {
        return;
    }
    const auto size = static_cast<std::uint64_t>(chunk.value.size());
    if (used_space_ + size > max_capacity_) {
        throw errors::collaborator("E_CHUNK_STORE", "Chunk store is full, cannot hold " + key);
    }

    ChunkRecord record{};
    record.chunk = chunk;

    if (persistent_enabled_) {
        record.file_path = chunk_path_for_key(key);
        if (persist_chunk_to_disk(key, record)) {
            record.persisted = true;
        } else {
            record.file_path.clear();
            throw errors::collaborator("E_CHUNK_STORE", "Failed to persist chunk " + key);
        }
    }

    used_space_ += size;
    chunks_.insert_or_assign(key, std::move(record));
}

std::optional<protocol::Chunk> ChunkStore::get(const XorName& address) const {
    std::scoped_lock lock(chunks_mutex_);
    const auto it = chunks_.find(name_to_string(address));
    if (it == chunks_.end()) {
        return std::nullopt;
    }
    return it->second.chunk;
}

bool ChunkStore::has(const XorName& address) const {
    std::scoped_lock lock(chunks_mutex_);
    return chunks_.find(name_to_string(address)) != chunks_.end();
}

std::size_t ChunkStore::size() const noexcept {
    std::scoped_lock lock(chunks_mutex_);
    return chunks_.size();
}

std::uint64_t ChunkStore::used_space() const noexcept {
    std::scoped_lock lock(chunks_mutex_);
    return used_space_;
}

double ChunkStore::used_ratio() const noexcept {
    std::scoped_lock lock(chunks_mutex_);
    if (max_capacity_ == 0) {
        return 1.0;
    }
    return static_cast<double>(used_space_) / static_cast<double>(max_capacity_);
}

std::vector<XorName> ChunkStore::addresses() const {
    std::scoped_lock lock(chunks_mutex_);
    std::vector<XorName> result;
    result.reserve(chunks_.size());
    for (const auto& [key, record] : chunks_) {
        result.push_back(record.chunk.address);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::filesystem::path ChunkStore::chunk_path_for_key(const std::string& key) const {
    if (!persistent_enabled_) {
        return {};
    }
    return storage_root_ / (key + kChunkExtension);
}

bool ChunkStore::ensure_storage_directory() {
    std::error_code ec;
    if (storage_root_.empty()) {
        storage_root_ = std::filesystem::current_path();
    }
    if (std::filesystem::exists(storage_root_, ec)) {
        return std::filesystem::is_directory(storage_root_, ec);
    }
    return std::filesystem::create_directories(storage_root_, ec);
}

void ChunkStore::load_persisted_chunks() {
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(storage_root_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != kChunkExtension) {
            continue;
        }
        const auto address = name_from_string(entry.path().stem().string());
        if (!address.has_value()) {
            continue;
        }

        std::ifstream stream(entry.path(), std::ios::binary);
        ChunkRecord record{};
        record.chunk.address = *address;
        record.chunk.value.assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
        if (!protocol::is_valid_chunk(record.chunk)) {
            daemon::log_event(StructuredLogger::Level::Warning,
                              "chunks.corrupt_file",
                              {{"path", entry.path().string()}});
            continue;
        }
        record.persisted = true;
        record.file_path = entry.path();
        used_space_ += record.chunk.value.size();
        chunks_.insert_or_assign(name_to_string(*address), std::move(record));
    }
}

bool ChunkStore::persist_chunk_to_disk(const std::string& key, const ChunkRecord& record) {
    if (!persistent_enabled_ || !ensure_storage_directory()) {
        return false;
    }

    const auto path = chunk_path_for_key(key);
    if (std::filesystem::exists(path) && !secure_wipe_file(path)) {
        return false;
    }

    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    if (!stream) {
        return false;
    }

    const auto& data = record.chunk.value;
    stream.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    stream.flush();
    if (!stream) {
        stream.close();
        if (!secure_wipe_file(path)) {
            daemon::log_event(StructuredLogger::Level::Warning,
                              "chunks.wipe_failed",
                              {{"path", path.string()}});
        }
        return false;
    }
    return true;
}

bool ChunkStore::secure_wipe_file(const std::filesystem::path& path) const {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return true;
    }

    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return false;
    }

    std::fstream stream(path, std::ios::binary | std::ios::in | std::ios::out);
    if (!stream) {
        return false;
    }

    std::vector<char> buffer(4096, 0);
    for (std::uint8_t pass = 0; pass < wipe_passes_; ++pass) {
        stream.seekp(0, std::ios::beg);
        std::uint64_t remaining = size;
        while (remaining > 0) {
            const auto chunk = static_cast<std::streamsize>(std::min<std::uint64_t>(buffer.size(), remaining));
            stream.write(buffer.data(), chunk);
            remaining -= static_cast<std::uint64_t>(chunk);
        }
        stream.flush();
        if (!stream) {
            break;
        }
    }
    stream.close();

    std::filesystem::remove(path, ec);
    return !std::filesystem::exists(path, ec);
}

}  // namespace sectionnode::storage
