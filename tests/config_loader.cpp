#include "sectionnode/config/ConfigLoader.hpp"
#include "test_support.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace sectionnode;

namespace {

std::string error_code(const std::string& yaml) {
    try {
        Config config{};
        config::apply_document(config::parse_yaml(yaml), config);
    } catch (const config::ConfigError& error) {
        return error.code;
    }
    return {};
}

}  // namespace

int main() {
    const std::string yaml =
        "# section node settings\n"
        "node:\n"
        "  root_dir: \"/var/lib/sectionnode\"\n"
        "  min_age: 6\n"
        "  forward_foreign_addresses: false\n"
        "chunks:\n"
        "  directory: blobs   # relative to root_dir\n"
        "  persistent: false\n"
        "  wipe_passes: 3\n"
        "  max_capacity_bytes: 4096\n"
        "  capacity_warning_ratio: 0.75\n"
        "metadata:\n"
        "  chunk_copy_count: 3\n"
        "logging:\n"
        "  enabled: true\n"
        "  level: warning\n";

    const auto document = config::parse_yaml(yaml);
    assert(config::get_string(document, {"chunks", "directory"}) == std::optional<std::string>("blobs"));
    assert(config::get_int64(document, {"node", "min_age"}) == std::optional<std::int64_t>(6));
    assert(!config::get_string(document, {"node", "missing"}).has_value());

    Config config{};
    config::apply_document(document, config);
    assert(config.root_dir == "/var/lib/sectionnode");
    assert(config.min_age == 6);
    assert(!config.forward_foreign_addresses);
    assert(config.chunks_subdir == "blobs");
    assert(!config.chunk_persistence_enabled);
    assert(config.chunk_wipe_passes == 3);
    assert(config.max_capacity_bytes == 4096);
    assert(config.capacity_warning_ratio == 0.75);
    assert(config.chunk_copy_count == 3);
    assert(config.logging_enabled);
    assert(config.log_level == "warning");

    // Keys left out keep their defaults.
    Config partial{};
    config::apply_document(config::parse_yaml("chunks:\n  wipe_passes: 2\n"), partial);
    assert(partial.chunk_wipe_passes == 2);
    assert(partial.min_age == Config{}.min_age);
    assert(partial.root_dir == Config{}.root_dir);

    assert(error_code("node:\n   min_age: 5\n") == "E_CONFIG_PARSE");
    assert(error_code("node\n") == "E_CONFIG_PARSE");
    assert(error_code("node:\n  min_age: old\n") == "E_CONFIG_TYPE");
    assert(error_code("node:\n  min_age: 300\n") == "E_CONFIG_VALUE");
    assert(error_code("chunks:\n  capacity_warning_ratio: 1.5\n") == "E_CONFIG_VALUE");
    assert(error_code("logging:\n  level: chatty\n") == "E_CONFIG_VALUE");

    // Logging switches reach the logger.
    {
        auto& logger = daemon::StructuredLogger::instance();
        config::apply_logging(config);
        assert(logger.enabled());
        assert(logger.minimum_level() == daemon::StructuredLogger::Level::Warning);

        Config quiet{};
        quiet.logging_enabled = false;
        quiet.log_level = "error";
        config::apply_logging(quiet);
        assert(!logger.enabled());
        assert(logger.minimum_level() == daemon::StructuredLogger::Level::Error);

        config::apply_logging(Config{});
        assert(logger.enabled());
        assert(logger.minimum_level() == daemon::StructuredLogger::Level::Info);
    }

    // File loading with the storage override from the environment.
    const auto root = sectionnode::test::temp_root("config");
    std::filesystem::create_directories(root);
    const auto path = root / "node.yaml";
    {
        std::ofstream out(path);
        out << yaml;
    }

    ::unsetenv("SECTIONNODE_STORAGE_DIR");
    assert(config::load_config_file(path).root_dir == "/var/lib/sectionnode");
    ::setenv("SECTIONNODE_STORAGE_DIR", "/tmp/override", 1);
    assert(config::load_config_file(path).root_dir == "/tmp/override");
    ::unsetenv("SECTIONNODE_STORAGE_DIR");

    bool missing = false;
    try {
        (void)config::load_config_file(root / "absent.yaml");
    } catch (const config::ConfigError& error) {
        missing = error.code == "E_CONFIG_NOT_FOUND";
    }
    assert(missing);

    std::filesystem::remove_all(root);
    return 0;
}
