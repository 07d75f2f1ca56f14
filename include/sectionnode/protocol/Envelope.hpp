#pragma once

#include "sectionnode/Types.hpp"
#include "sectionnode/protocol/Messages.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace sectionnode::protocol {

inline constexpr std::uint8_t kMinimumEnvelopeVersion = 1;
inline constexpr std::uint8_t kCurrentEnvelopeVersion = 1;

bool is_supported_envelope_version(std::uint8_t version) noexcept;

// Layout: version, kind, message id, payload. Integers are big-endian and
// variable-length fields carry a u32 length prefix. The kind byte is the
// NodeMessage alternative index plus one.
struct Envelope {
    std::uint8_t version{kCurrentEnvelopeVersion};
    MessageId id{};
    NodeMessage message;
};

std::vector<std::uint8_t> encode_envelope(const Envelope& envelope);
std::optional<Envelope> decode_envelope(std::span<const std::uint8_t> buffer);

}  // namespace sectionnode::protocol
