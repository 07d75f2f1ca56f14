#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sectionnode {

using XorName = std::array<std::uint8_t, 32>;
using PublicKey = std::array<std::uint8_t, 32>;
using MessageId = std::array<std::uint8_t, 32>;
using CreditId = std::array<std::uint8_t, 32>;
using ChunkData = std::vector<std::uint8_t>;
using Signature = std::vector<std::uint8_t>;

// Nano-units.
using Token = std::uint64_t;
using Age = std::uint8_t;

std::string name_to_string(const XorName& name);
std::string key_to_string(const PublicKey& key);
std::string message_id_to_string(const MessageId& id);
std::string credit_id_to_string(const CreditId& id);
std::optional<XorName> name_from_string(const std::string& text);

XorName xor_name_from_key(const PublicKey& key);
XorName chunk_address(const ChunkData& value);

// Deterministic id over the concatenation of the given names.
MessageId combine_message_ids(const std::vector<XorName>& names);
MessageId random_message_id();

}  // namespace sectionnode
