#include "sectionnode/Errors.hpp"
#include "sectionnode/storage/ChunkStore.hpp"
#include "test_support.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>

using namespace sectionnode;

int main() {
    const auto root = sectionnode::test::temp_root("chunk_store");

    Config config{};
    config.max_capacity_bytes = 16;
    config.chunk_wipe_passes = 2;

    const auto first = protocol::make_chunk({1, 2, 3, 4, 5, 6, 7, 8});
    const auto second = protocol::make_chunk({9, 9, 9, 9});
    {
        storage::ChunkStore store(root, config);
        store.put(first);
        store.put(first);
        store.put(second);
        assert(store.size() == 2);
        assert(store.used_space() == 12);
        assert(store.used_ratio() == 0.75);
        assert(std::filesystem::exists(root / (name_to_string(first.address) + ".chunk")));

        bool full = false;
        try {
            store.put(protocol::make_chunk({0, 0, 0, 0, 0, 0}));
        } catch (const NodeError& error) {
            full = error.code() == "E_CHUNK_STORE";
        }
        assert(full);
        assert(store.size() == 2);
    }

    // A corrupt file is skipped on reload.
    {
        std::ofstream corrupt(root / (name_to_string(first.address) + ".chunk"), std::ios::binary | std::ios::trunc);
        corrupt << "tampered";
    }
    {
        storage::ChunkStore reloaded(root, config);
        assert(reloaded.size() == 1);
        assert(reloaded.get(second.address) == second);
        assert(!reloaded.has(first.address));

        // Storing the chunk again wipes the corrupt file and writes a fresh copy.
        reloaded.put(first);
        assert(reloaded.used_space() == 12);
    }
    {
        storage::ChunkStore restored(root, config);
        assert(restored.size() == 2);
        assert(restored.get(first.address) == first);
    }

    // Memory-only stores leave the disk alone.
    {
        const auto memory_root = root / "memory";
        Config memory = config;
        memory.chunk_persistence_enabled = false;
        storage::ChunkStore store(memory_root, memory);
        store.put(second);
        assert(store.has(second.address));
        assert(!std::filesystem::exists(memory_root));
    }

    std::filesystem::remove_all(root);
    return 0;
}
