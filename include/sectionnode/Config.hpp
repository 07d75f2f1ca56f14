#pragma once

#include "sectionnode/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace sectionnode {

struct Config {
    std::string root_dir{"sectionnode"};
    std::string chunks_subdir{"chunks"};
    bool chunk_persistence_enabled{true};
    std::uint8_t chunk_wipe_passes{1};
    std::uint64_t max_capacity_bytes{2ull * 1024ull * 1024ull * 1024ull};
    double capacity_warning_ratio{0.9};
    Age min_age{4};
    std::size_t chunk_copy_count{4};
    bool forward_foreign_addresses{true};
    bool logging_enabled{true};
    std::string log_level{"info"};
};

}  // namespace sectionnode
