#include "sectionnode/config/ConfigLoader.hpp"

#include "sectionnode/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace sectionnode::config {

namespace {

std::string trim_left(std::string value) {
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch) {
                    return !std::isspace(ch);
                }));
    return value;
}

std::string trim_right(std::string value) {
    value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char ch) {
                    return !std::isspace(ch);
                }).base(),
                value.end());
    return value;
}

std::string trim_copy(const std::string& value) {
    return trim_right(trim_left(value));
}

std::string unescape_double_quoted(const std::string& inner) {
    std::string result;
    result.reserve(inner.size());
    for (std::size_t i = 0; i < inner.size(); ++i) {
        const char ch = inner[i];
        if (ch != '\\') {
            result.push_back(ch);
            continue;
        }
        if (i + 1 >= inner.size()) {
            throw ConfigError("E_CONFIG_PARSE", "Incomplete escape sequence in YAML string");
        }
        const char next = inner[++i];
        switch (next) {
            case '"':
            case '\\':
            case '/':
                result.push_back(next);
                break;
            case 'n':
                result.push_back('\n');
                break;
            case 't':
                result.push_back('\t');
                break;
            default:
                throw ConfigError("E_CONFIG_PARSE", std::string("Unsupported escape sequence \\") + next);
        }
    }
    return result;
}

Value parse_yaml_scalar(const std::string& text) {
    const std::string trimmed = trim_copy(text);
    if (trimmed.empty()) {
        return Value();
    }
    if (trimmed.size() >= 2 && trimmed.front() == '"' && trimmed.back() == '"') {
        return Value(unescape_double_quoted(trimmed.substr(1, trimmed.size() - 2)));
    }
    if (trimmed.size() >= 2 && trimmed.front() == '\'' && trimmed.back() == '\'') {
        return Value(trimmed.substr(1, trimmed.size() - 2));
    }
    if (trimmed == "true" || trimmed == "True") {
        return Value(true);
    }
    if (trimmed == "false" || trimmed == "False") {
        return Value(false);
    }
    if (trimmed == "null" || trimmed == "~") {
        return Value();
    }

    std::int64_t integer{};
    const auto int_result = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), integer);
    if (int_result.ec == std::errc{} && int_result.ptr == trimmed.data() + trimmed.size()) {
        return Value(integer);
    }

    const bool looks_numeric = std::all_of(trimmed.begin(), trimmed.end(), [](unsigned char ch) {
        return std::isdigit(ch) || ch == '.' || ch == '-' || ch == '+';
    });
    if (looks_numeric) {
        std::istringstream iss(trimmed);
        iss.imbue(std::locale::classic());
        double number{};
        iss >> number;
        if (!iss.fail() && iss.eof()) {
            return Value(number);
        }
    }
    return Value(trimmed);
}

std::string strip_comment(const std::string& line) {
    bool in_single = false;
    bool in_double = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (ch == '"' && !in_single) {
            in_double = !in_double;
        } else if (ch == '\'' && !in_double) {
            in_single = !in_single;
        } else if (ch == '#' && !in_single && !in_double) {
            return line.substr(0, i);
        }
    }
    return line;
}

std::string join_path(const std::vector<std::string>& path) {
    std::string combined;
    for (std::size_t i = 0; i < path.size(); ++i) {
        combined += path[i];
        if (i + 1 < path.size()) {
            combined += '.';
        }
    }
    return combined.empty() ? std::string{"<root>"} : combined;
}

}  // namespace

std::map<std::string, Value>& Value::ensure_object() {
    if (type != ValueType::Object) {
        type = ValueType::Object;
        object_value.clear();
        array_value.clear();
        string_value.clear();
    }
    return object_value;
}

std::vector<Value>& Value::ensure_array() {
    if (type != ValueType::Array) {
        type = ValueType::Array;
        array_value.clear();
        object_value.clear();
        string_value.clear();
    }
    return array_value;
}

ConfigError::ConfigError(std::string c, std::string m, std::string h)
    : code(std::move(c)), message(std::move(m)), hint(std::move(h)) {
    formatted = code.empty() ? message : "[" + code + "] " + message;
}

Value parse_yaml(const std::string& text) {
    Value root = Value::make_object();
    struct Context {
        std::size_t indent;
        Value* node;
    };
    std::vector<Context> stack;
    stack.push_back({0, &root});

    std::istringstream input(text);
    std::string line;
    while (std::getline(input, line)) {
        const std::string content_line = trim_right(strip_comment(trim_right(line)));
        if (content_line.empty()) {
            continue;
        }

        std::size_t indent = 0;
        while (indent < content_line.size() && content_line[indent] == ' ') {
            ++indent;
        }
        if (indent % 2 != 0) {
            throw ConfigError("E_CONFIG_PARSE", "YAML indentation must be multiples of two spaces");
        }
        const std::string content = trim_left(content_line.substr(indent));

        while (!stack.empty() && indent < stack.back().indent) {
            stack.pop_back();
        }
        if (stack.empty()) {
            throw ConfigError("E_CONFIG_PARSE", "Invalid indentation in YAML config");
        }

        Value* current = stack.back().node;
        if (content.front() == '-') {
            current->ensure_array().push_back(parse_yaml_scalar(content.substr(1)));
            continue;
        }

        const auto colon = content.find(':');
        if (colon == std::string::npos) {
            throw ConfigError("E_CONFIG_PARSE", "Expected ':' in YAML mapping entry");
        }
        const std::string key = trim_copy(content.substr(0, colon));
        const std::string value_part = trim_copy(content.substr(colon + 1));

        auto& object = current->ensure_object();
        if (value_part.empty()) {
            Value& child = object[key];
            if (child.is_null()) {
                child = Value::make_object();
            }
            stack.push_back({indent + 2, &child});
        } else {
            object[key] = parse_yaml_scalar(value_part);
        }
    }

    return root;
}

const Value* find_path(const Value& root, const std::vector<std::string>& path) {
    const Value* node = &root;
    for (const auto& segment : path) {
        if (!node->is_object()) {
            return nullptr;
        }
        const auto it = node->object_value.find(segment);
        if (it == node->object_value.end()) {
            return nullptr;
        }
        node = &it->second;
    }
    return node;
}

std::optional<std::string> get_string(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_string()) {
        return node->string_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected string at config path " + join_path(path));
}

std::optional<bool> get_bool(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_boolean()) {
        return node->boolean_value;
    }
    if (node->is_string()) {
        std::string lowered = node->string_value;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        if (lowered == "yes" || lowered == "on") {
            return true;
        }
        if (lowered == "no" || lowered == "off") {
            return false;
        }
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected boolean at config path " + join_path(path));
}

std::optional<std::int64_t> get_int64(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_integer()) {
        return node->integer_value;
    }
    if (node->is_double()) {
        const double rounded = std::floor(node->double_value + 0.5);
        if (std::abs(node->double_value - rounded) < 1e-9) {
            return static_cast<std::int64_t>(rounded);
        }
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected integer at config path " + join_path(path));
}

std::optional<double> get_double(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_double()) {
        return node->double_value;
    }
    if (node->is_integer()) {
        return static_cast<double>(node->integer_value);
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected number at config path " + join_path(path));
}

void apply_document(const Value& document, Config& config) {
    if (!document.is_object()) {
        throw ConfigError("E_CONFIG_TYPE", "Configuration root must be a mapping");
    }

    if (auto root_dir = get_string(document, {"node", "root_dir"})) {
        if (root_dir->empty()) {
            throw ConfigError("E_CONFIG_VALUE", "node.root_dir must not be empty");
        }
        config.root_dir = *root_dir;
    }
    if (auto min_age = get_int64(document, {"node", "min_age"})) {
        if (*min_age < 0 || *min_age > std::numeric_limits<Age>::max()) {
            throw ConfigError("E_CONFIG_VALUE", "node.min_age must be between 0 and 255");
        }
        config.min_age = static_cast<Age>(*min_age);
    }
    if (auto forward = get_bool(document, {"node", "forward_foreign_addresses"})) {
        config.forward_foreign_addresses = *forward;
    }

    if (auto subdir = get_string(document, {"chunks", "directory"})) {
        config.chunks_subdir = *subdir;
    }
    if (auto persistent = get_bool(document, {"chunks", "persistent"})) {
        config.chunk_persistence_enabled = *persistent;
    }
    if (auto passes = get_int64(document, {"chunks", "wipe_passes"})) {
        if (*passes <= 0 || *passes > 255) {
            throw ConfigError("E_CONFIG_VALUE", "chunks.wipe_passes must be between 1 and 255");
        }
        config.chunk_wipe_passes = static_cast<std::uint8_t>(*passes);
    }
    if (auto capacity = get_int64(document, {"chunks", "max_capacity_bytes"})) {
        if (*capacity <= 0) {
            throw ConfigError("E_CONFIG_VALUE", "chunks.max_capacity_bytes must be positive");
        }
        config.max_capacity_bytes = static_cast<std::uint64_t>(*capacity);
    }
    if (auto ratio = get_double(document, {"chunks", "capacity_warning_ratio"})) {
        if (*ratio <= 0.0 || *ratio > 1.0) {
            throw ConfigError("E_CONFIG_VALUE", "chunks.capacity_warning_ratio must be in (0, 1]");
        }
        config.capacity_warning_ratio = *ratio;
    }

    if (auto copies = get_int64(document, {"metadata", "chunk_copy_count"})) {
        if (*copies <= 0 || *copies > 64) {
            throw ConfigError("E_CONFIG_VALUE", "metadata.chunk_copy_count must be between 1 and 64");
        }
        config.chunk_copy_count = static_cast<std::size_t>(*copies);
    }

    if (auto enabled = get_bool(document, {"logging", "enabled"})) {
        config.logging_enabled = *enabled;
    }
    if (auto level = get_string(document, {"logging", "level"})) {
        if (!daemon::StructuredLogger::level_from_string(*level).has_value()) {
            throw ConfigError("E_CONFIG_VALUE", "Unknown logging.level: " + *level,
                              "Use one of debug, info, warning, error");
        }
        config.log_level = *level;
    }
}

Config load_config_file(const std::filesystem::path& path) {
    const auto absolute = std::filesystem::absolute(path);
    std::ifstream input(absolute);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND", "Configuration file not found: " + absolute.string(),
                          "Verify the path or provide an absolute path");
    }
    std::stringstream buffer;
    buffer << input.rdbuf();

    Config config{};
    apply_document(parse_yaml(buffer.str()), config);

    if (const char* storage_dir = std::getenv("SECTIONNODE_STORAGE_DIR")) {
        if (*storage_dir != '\0') {
            config.root_dir = storage_dir;
        }
    }
    return config;
}

void apply_logging(const Config& config) {
    auto& logger = daemon::StructuredLogger::instance();
    const auto level = daemon::StructuredLogger::level_from_string(config.log_level);
    if (!level.has_value()) {
        throw ConfigError("E_CONFIG_VALUE", "Unknown logging.level: " + config.log_level,
                          "Use one of debug, info, warning, error");
    }
    logger.set_enabled(config.logging_enabled);
    logger.set_minimum_level(*level);
}

}  // namespace sectionnode::config
