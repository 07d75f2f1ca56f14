#pragma once

#include "sectionnode/Config.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sectionnode::config {

enum class ValueType {
    Null,
    Boolean,
    Integer,
    Double,
    String,
    Object,
    Array
};

struct Value {
    ValueType type{ValueType::Null};
    bool boolean_value{false};
    std::int64_t integer_value{0};
    double double_value{0.0};
    std::string string_value;
    std::map<std::string, Value> object_value;
    std::vector<Value> array_value;

    Value() = default;
    explicit Value(bool value) : type(ValueType::Boolean), boolean_value(value) {}
    explicit Value(std::int64_t value) : type(ValueType::Integer), integer_value(value) {}
    explicit Value(double value) : type(ValueType::Double), double_value(value) {}
    explicit Value(std::string value) : type(ValueType::String), string_value(std::move(value)) {}

    static Value make_object() {
        Value value;
        value.type = ValueType::Object;
        return value;
    }

    bool is_null() const { return type == ValueType::Null; }
    bool is_boolean() const { return type == ValueType::Boolean; }
    bool is_integer() const { return type == ValueType::Integer; }
    bool is_double() const { return type == ValueType::Double; }
    bool is_number() const { return is_integer() || is_double(); }
    bool is_string() const { return type == ValueType::String; }
    bool is_object() const { return type == ValueType::Object; }
    bool is_array() const { return type == ValueType::Array; }

    std::map<std::string, Value>& ensure_object();
    std::vector<Value>& ensure_array();
};

struct ConfigError : public std::exception {
    std::string code;
    std::string message;
    std::string hint;
    std::string formatted;

    ConfigError(std::string c, std::string m, std::string h = {});

    const char* what() const noexcept override { return formatted.c_str(); }
};

Value parse_yaml(const std::string& text);
const Value* find_path(const Value& root, const std::vector<std::string>& path);

std::optional<std::string> get_string(const Value& root, const std::vector<std::string>& path);
std::optional<bool> get_bool(const Value& root, const std::vector<std::string>& path);
std::optional<std::int64_t> get_int64(const Value& root, const std::vector<std::string>& path);
std::optional<double> get_double(const Value& root, const std::vector<std::string>& path);

// Overlays the recognised keys of `document` onto `config`.
void apply_document(const Value& document, Config& config);

// Reads the file, applies it over defaults, then environment overrides.
Config load_config_file(const std::filesystem::path& path);

// Pushes the logging switches of `config` into the process-wide logger.
void apply_logging(const Config& config);

}  // namespace sectionnode::config
