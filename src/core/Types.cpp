#include "sectionnode/Types.hpp"

#include "sectionnode/crypto/Sha256.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace sectionnode {

namespace {

std::string array_to_hex_string(const std::array<std::uint8_t, 32>& array) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setfill('0');
    for (const auto byte : array) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

}  // namespace

std::string name_to_string(const XorName& name) {
    return array_to_hex_string(name);
}

std::string key_to_string(const PublicKey& key) {
    return array_to_hex_string(key);
}

std::string message_id_to_string(const MessageId& id) {
    return array_to_hex_string(id);
}

std::string credit_id_to_string(const CreditId& id) {
    return array_to_hex_string(id);
}

std::optional<XorName> name_from_string(const std::string& text) {
    if (text.size() != XorName{}.size() * 2) {
        return std::nullopt;
    }

    XorName name{};
    for (std::size_t index = 0; index < name.size(); ++index) {
        const auto byte_text = text.substr(index * 2, 2);
        std::istringstream iss(byte_text);
        int value = 0;
        iss >> std::hex >> value;
        if (iss.fail() || value < 0 || value > 0xFF) {
            return std::nullopt;
        }
        name[index] = static_cast<std::uint8_t>(value);
    }
    return name;
}

XorName xor_name_from_key(const PublicKey& key) {
    return crypto::Sha256::digest(key);
}

XorName chunk_address(const ChunkData& value) {
    return crypto::Sha256::digest(value);
}

MessageId combine_message_ids(const std::vector<XorName>& names) {
    crypto::Sha256 hasher;
    for (const auto& name : names) {
        hasher.update(name);
    }
    return hasher.finalize();
}

MessageId random_message_id() {
    static thread_local std::mt19937_64 generator{std::random_device{}()};
    MessageId id{};
    std::uniform_int_distribution<int> distribution(0, 0xFF);
    for (auto& byte : id) {
        byte = static_cast<std::uint8_t>(distribution(generator));
    }
    return id;
}

}  // namespace sectionnode
