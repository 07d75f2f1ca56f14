#include "sectionnode/protocol/Envelope.hpp"

#include <cstring>
#include <type_traits>
#include <utility>

namespace sectionnode::protocol {

namespace {

using Bytes = std::vector<std::uint8_t>;
using Name = std::array<std::uint8_t, 32>;

void write_u8(Bytes& out, std::uint8_t value) {
    out.push_back(value);
}

void write_u32(Bytes& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

void write_u64(Bytes& out, std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
    }
}

void write_name(Bytes& out, const Name& name) {
    out.insert(out.end(), name.begin(), name.end());
}

void write_blob(Bytes& out, const std::vector<std::uint8_t>& blob) {
    write_u32(out, static_cast<std::uint32_t>(blob.size()));
    out.insert(out.end(), blob.begin(), blob.end());
}

void write_string(Bytes& out, const std::string& text) {
    write_u32(out, static_cast<std::uint32_t>(text.size()));
    out.insert(out.end(), text.begin(), text.end());
}

// Bounds-checked cursor; every read fails once the input runs out.
class Reader {
public:
    explicit Reader(std::span<const std::uint8_t> data) : data_(data) {}

    bool u8(std::uint8_t& value) {
        if (!has(1)) {
            return false;
        }
        value = data_[offset_++];
        return true;
    }

    bool u32(std::uint32_t& value) {
        if (!has(4)) {
            return false;
        }
        value = (static_cast<std::uint32_t>(data_[offset_]) << 24) |
                (static_cast<std::uint32_t>(data_[offset_ + 1]) << 16) |
                (static_cast<std::uint32_t>(data_[offset_ + 2]) << 8) |
                static_cast<std::uint32_t>(data_[offset_ + 3]);
        offset_ += 4;
        return true;
    }

    bool u64(std::uint64_t& value) {
        if (!has(8)) {
            return false;
        }
        value = 0;
        for (int index = 0; index < 8; ++index) {
            value = (value << 8) | static_cast<std::uint64_t>(data_[offset_ + index]);
        }
        offset_ += 8;
        return true;
    }

    bool name(Name& value) {
        if (!has(value.size())) {
            return false;
        }
        std::memcpy(value.data(), data_.data() + offset_, value.size());
        offset_ += value.size();
        return true;
    }

    bool blob(std::vector<std::uint8_t>& value) {
        std::uint32_t length = 0;
        if (!u32(length) || !has(length)) {
            return false;
        }
        value.assign(data_.begin() + offset_, data_.begin() + offset_ + length);
        offset_ += length;
        return true;
    }

    bool string(std::string& value) {
        std::uint32_t length = 0;
        if (!u32(length) || !has(length)) {
            return false;
        }
        value.assign(reinterpret_cast<const char*>(data_.data() + offset_), length);
        offset_ += length;
        return true;
    }

    // Element counts can never exceed the bytes left.
    bool count(std::uint32_t& value) {
        return u32(value) && value <= remaining();
    }

    bool boolean(bool& value) {
        std::uint8_t raw = 0;
        if (!u8(raw) || raw > 1) {
            return false;
        }
        value = raw == 1;
        return true;
    }

    std::size_t remaining() const noexcept { return data_.size() - offset_; }

private:
    bool has(std::size_t bytes) const noexcept { return remaining() >= bytes; }

    std::span<const std::uint8_t> data_;
    std::size_t offset_{0};
};

void write_destination(Bytes& out, const Destination& dst) {
    write_u8(out, static_cast<std::uint8_t>(dst.kind));
    write_name(out, dst.name);
}

bool read_destination(Reader& in, Destination& dst) {
    std::uint8_t kind = 0;
    if (!in.u8(kind) || kind < static_cast<std::uint8_t>(DestinationKind::Node) ||
        kind > static_cast<std::uint8_t>(DestinationKind::EndUser)) {
        return false;
    }
    dst.kind = static_cast<DestinationKind>(kind);
    return in.name(dst.name);
}

void write_names(Bytes& out, const std::vector<XorName>& names) {
    write_u32(out, static_cast<std::uint32_t>(names.size()));
    for (const auto& name : names) {
        write_name(out, name);
    }
}

bool read_names(Reader& in, std::vector<XorName>& names) {
    std::uint32_t count = 0;
    if (!in.count(count)) {
        return false;
    }
    names.resize(count);
    for (auto& name : names) {
        if (!in.name(name)) {
            return false;
        }
    }
    return true;
}

void write_chunk(Bytes& out, const Chunk& chunk) {
    write_name(out, chunk.address);
    write_blob(out, chunk.value);
}

bool read_chunk(Reader& in, Chunk& chunk) {
    return in.name(chunk.address) && in.blob(chunk.value);
}

void write_credit(Bytes& out, const rewards::Credit& credit) {
    write_name(out, credit.id);
    write_u64(out, credit.amount);
    write_name(out, credit.recipient);
    write_string(out, credit.msg);
}

bool read_credit(Reader& in, rewards::Credit& credit) {
    return in.name(credit.id) && in.u64(credit.amount) && in.name(credit.recipient) && in.string(credit.msg);
}

void write_credit_proof(Bytes& out, const rewards::CreditAgreementProof& proof) {
    write_credit(out, proof.credit);
    write_blob(out, proof.section_signature);
    write_name(out, proof.section_key);
}

bool read_credit_proof(Reader& in, rewards::CreditAgreementProof& proof) {
    return read_credit(in, proof.credit) && in.blob(proof.section_signature) && in.name(proof.section_key);
}

void write_share(Bytes& out, const rewards::SignatureShare& share) {
    write_name(out, share.signer);
    write_u64(out, static_cast<std::uint64_t>(share.index));
    write_blob(out, share.bytes);
}

bool read_share(Reader& in, rewards::SignatureShare& share) {
    std::uint64_t index = 0;
    if (!in.name(share.signer) || !in.u64(index) || !in.blob(share.bytes)) {
        return false;
    }
    share.index = static_cast<std::size_t>(index);
    return true;
}

void write_signed_transfer(Bytes& out, const transfers::SignedTransfer& transfer) {
    write_name(out, transfer.sender);
    write_name(out, transfer.recipient);
    write_u64(out, transfer.amount);
    write_u64(out, transfer.counter);
    write_blob(out, transfer.signature);
}

bool read_signed_transfer(Reader& in, transfers::SignedTransfer& transfer) {
    return in.name(transfer.sender) && in.name(transfer.recipient) && in.u64(transfer.amount) &&
           in.u64(transfer.counter) && in.blob(transfer.signature);
}

void write_transfer_proof(Bytes& out, const transfers::TransferAgreementProof& proof) {
    write_signed_transfer(out, proof.signed_transfer);
    write_blob(out, proof.debiting_replicas_sig);
    write_name(out, proof.replicas_key);
}

bool read_transfer_proof(Reader& in, transfers::TransferAgreementProof& proof) {
    return read_signed_transfer(in, proof.signed_transfer) && in.blob(proof.debiting_replicas_sig) &&
           in.name(proof.replicas_key);
}

enum class DataCmdTag : std::uint8_t {
    StoreChunk = 1,
    PutData = 2,
    DeleteData = 3,
};

void write_data_cmd(Bytes& out, const DataCmd& cmd) {
    std::visit(
        [&](const auto& value) {
            using CmdType = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<CmdType, StoreChunk>) {
                write_u8(out, static_cast<std::uint8_t>(DataCmdTag::StoreChunk));
                write_chunk(out, value.chunk);
            } else if constexpr (std::is_same_v<CmdType, PutData>) {
                write_u8(out, static_cast<std::uint8_t>(DataCmdTag::PutData));
                write_name(out, value.address);
                write_blob(out, value.value);
            } else if constexpr (std::is_same_v<CmdType, DeleteData>) {
                write_u8(out, static_cast<std::uint8_t>(DataCmdTag::DeleteData));
                write_name(out, value.address);
            }
        },
        cmd);
}

bool read_data_cmd(Reader& in, DataCmd& cmd) {
    std::uint8_t tag = 0;
    if (!in.u8(tag)) {
        return false;
    }
    switch (static_cast<DataCmdTag>(tag)) {
        case DataCmdTag::StoreChunk: {
            StoreChunk value{};
            if (!read_chunk(in, value.chunk)) {
                return false;
            }
            cmd = std::move(value);
            return true;
        }
        case DataCmdTag::PutData: {
            PutData value{};
            if (!in.name(value.address) || !in.blob(value.value)) {
                return false;
            }
            cmd = std::move(value);
            return true;
        }
        case DataCmdTag::DeleteData: {
            DeleteData value{};
            if (!in.name(value.address)) {
                return false;
            }
            cmd = value;
            return true;
        }
    }
    return false;
}

void encode_payload(Bytes& out, const NodeMessage& message) {
    std::visit(
        [&](const auto& msg) {
            using MsgType = std::decay_t<decltype(msg)>;
            if constexpr (std::is_same_v<MsgType, ReadChunkMsg>) {
                write_name(out, msg.read.address);
                write_destination(out, msg.origin);
            } else if constexpr (std::is_same_v<MsgType, WriteChunkMsg>) {
                write_chunk(out, msg.write.chunk);
                write_destination(out, msg.origin);
            } else if constexpr (std::is_same_v<MsgType, DataQueryMsg>) {
                write_name(out, msg.query.address);
                write_destination(out, msg.origin);
            } else if constexpr (std::is_same_v<MsgType, DataCmdMsg>) {
                write_data_cmd(out, msg.cmd);
                write_destination(out, msg.origin);
            } else if constexpr (std::is_same_v<MsgType, DataPaymentMsg>) {
                write_data_cmd(out, msg.payment.cmd);
                write_transfer_proof(out, msg.payment.payment);
                write_destination(out, msg.origin);
            } else if constexpr (std::is_same_v<MsgType, ReplicateChunkMsg>) {
                write_name(out, msg.address);
                write_names(out, msg.current_holders);
            } else if constexpr (std::is_same_v<MsgType, GetChunkForReplicationMsg>) {
                write_name(out, msg.address);
                write_name(out, msg.new_holder);
            } else if constexpr (std::is_same_v<MsgType, StoreChunkForReplicationMsg>) {
                write_chunk(out, msg.chunk);
            } else if constexpr (std::is_same_v<MsgType, StorageFullMsg>) {
                write_name(out, msg.node_id);
            } else if constexpr (std::is_same_v<MsgType, rewards::RewardProposal>) {
                write_name(out, msg.section_key);
                write_name(out, msg.proposer);
                write_u32(out, static_cast<std::uint32_t>(msg.credits.size()));
                for (const auto& credit : msg.credits) {
                    write_credit(out, credit);
                }
            } else if constexpr (std::is_same_v<MsgType, rewards::RewardAccumulation>) {
                write_name(out, msg.section_key);
                write_name(out, msg.signer);
                write_u32(out, static_cast<std::uint32_t>(msg.shares.size()));
                for (const auto& share : msg.shares) {
                    write_credit(out, share.credit);
                    write_share(out, share.share);
                }
            } else if constexpr (std::is_same_v<MsgType, RegisterWalletMsg>) {
                write_name(out, msg.wallet);
                write_name(out, msg.node_id);
            } else if constexpr (std::is_same_v<MsgType, PropagateCreditMsg> ||
                                 std::is_same_v<MsgType, CreditPaymentMsg>) {
                write_credit_proof(out, msg.proof);
            } else if constexpr (std::is_same_v<MsgType, SynchStateMsg>) {
                write_u32(out, static_cast<std::uint32_t>(msg.node_rewards.size()));
                for (const auto& [name, wallet] : msg.node_rewards) {
                    write_name(out, name);
                    write_name(out, wallet.wallet);
                    write_u8(out, wallet.age);
                }
                write_u32(out, static_cast<std::uint32_t>(msg.user_wallets.size()));
                for (const auto& [key, history] : msg.user_wallets) {
                    write_name(out, key);
                    write_u32(out, static_cast<std::uint32_t>(history.size()));
                    for (const auto& proof : history) {
                        write_transfer_proof(out, proof);
                    }
                }
            } else if constexpr (std::is_same_v<MsgType, GetSectionEldersMsg> ||
                                 std::is_same_v<MsgType, GetReplicaEventsMsg>) {
                // No payload.
            } else if constexpr (std::is_same_v<MsgType, GetWalletKeyMsg>) {
                write_name(out, msg.node_name);
            } else if constexpr (std::is_same_v<MsgType, ValidateTransferMsg>) {
                write_signed_transfer(out, msg.signed_transfer);
                write_destination(out, msg.origin);
            } else if constexpr (std::is_same_v<MsgType, RegisterTransferMsg>) {
                write_transfer_proof(out, msg.proof);
            } else if constexpr (std::is_same_v<MsgType, SimulatePayoutMsg>) {
                write_name(out, msg.transfer.recipient);
                write_u64(out, msg.transfer.amount);
                write_string(out, msg.transfer.msg);
                write_destination(out, msg.origin);
            } else if constexpr (std::is_same_v<MsgType, GetBalanceMsg>) {
                write_name(out, msg.at);
                write_destination(out, msg.origin);
            } else if constexpr (std::is_same_v<MsgType, GetHistoryMsg>) {
                write_name(out, msg.at);
                write_u64(out, msg.since_version);
                write_destination(out, msg.origin);
            } else if constexpr (std::is_same_v<MsgType, GetStoreCostMsg>) {
                write_name(out, msg.requester);
                write_u64(out, msg.bytes);
                write_destination(out, msg.origin);
            }
        },
        message);
}

template <typename T, typename ReadFn>
std::optional<NodeMessage> decode_as(Reader& in, ReadFn read) {
    T msg{};
    if (!read(in, msg)) {
        return std::nullopt;
    }
    return NodeMessage{std::move(msg)};
}

std::optional<NodeMessage> decode_payload(std::size_t index, Reader& in) {
    switch (index) {
        case 0:
            return decode_as<ReadChunkMsg>(in, [](Reader& r, ReadChunkMsg& m) {
                return r.name(m.read.address) && read_destination(r, m.origin);
            });
        case 1:
            return decode_as<WriteChunkMsg>(in, [](Reader& r, WriteChunkMsg& m) {
                return read_chunk(r, m.write.chunk) && read_destination(r, m.origin);
            });
        case 2:
            return decode_as<DataQueryMsg>(in, [](Reader& r, DataQueryMsg& m) {
                return r.name(m.query.address) && read_destination(r, m.origin);
            });
        case 3:
            return decode_as<DataCmdMsg>(in, [](Reader& r, DataCmdMsg& m) {
                return read_data_cmd(r, m.cmd) && read_destination(r, m.origin);
            });
        case 4:
            return decode_as<DataPaymentMsg>(in, [](Reader& r, DataPaymentMsg& m) {
                return read_data_cmd(r, m.payment.cmd) && read_transfer_proof(r, m.payment.payment) &&
                       read_destination(r, m.origin);
            });
        case 5:
            return decode_as<ReplicateChunkMsg>(in, [](Reader& r, ReplicateChunkMsg& m) {
                return r.name(m.address) && read_names(r, m.current_holders);
            });
        case 6:
            return decode_as<GetChunkForReplicationMsg>(in, [](Reader& r, GetChunkForReplicationMsg& m) {
                return r.name(m.address) && r.name(m.new_holder);
            });
        case 7:
            return decode_as<StoreChunkForReplicationMsg>(in, [](Reader& r, StoreChunkForReplicationMsg& m) {
                return read_chunk(r, m.chunk);
            });
        case 8:
            return decode_as<StorageFullMsg>(in, [](Reader& r, StorageFullMsg& m) {
                return r.name(m.node_id);
            });
        case 9:
            return decode_as<rewards::RewardProposal>(in, [](Reader& r, rewards::RewardProposal& m) {
                std::uint32_t count = 0;
                if (!r.name(m.section_key) || !r.name(m.proposer) || !r.count(count)) {
                    return false;
                }
                m.credits.resize(count);
                for (auto& credit : m.credits) {
                    if (!read_credit(r, credit)) {
                        return false;
                    }
                }
                return true;
            });
        case 10:
            return decode_as<rewards::RewardAccumulation>(in, [](Reader& r, rewards::RewardAccumulation& m) {
                std::uint32_t count = 0;
                if (!r.name(m.section_key) || !r.name(m.signer) || !r.count(count)) {
                    return false;
                }
                m.shares.resize(count);
                for (auto& share : m.shares) {
                    if (!read_credit(r, share.credit) || !read_share(r, share.share)) {
                        return false;
                    }
                }
                return true;
            });
        case 11:
            return decode_as<RegisterWalletMsg>(in, [](Reader& r, RegisterWalletMsg& m) {
                return r.name(m.wallet) && r.name(m.node_id);
            });
        case 12:
            return decode_as<PropagateCreditMsg>(in, [](Reader& r, PropagateCreditMsg& m) {
                return read_credit_proof(r, m.proof);
            });
        case 13:
            return decode_as<CreditPaymentMsg>(in, [](Reader& r, CreditPaymentMsg& m) {
                return read_credit_proof(r, m.proof);
            });
        case 14:
            return decode_as<SynchStateMsg>(in, [](Reader& r, SynchStateMsg& m) {
                std::uint32_t wallets = 0;
                if (!r.count(wallets)) {
                    return false;
                }
                for (std::uint32_t i = 0; i < wallets; ++i) {
                    XorName name{};
                    rewards::NodeWallet wallet{};
                    if (!r.name(name) || !r.name(wallet.wallet) || !r.u8(wallet.age)) {
                        return false;
                    }
                    m.node_rewards.insert_or_assign(name, wallet);
                }
                std::uint32_t users = 0;
                if (!r.count(users)) {
                    return false;
                }
                for (std::uint32_t i = 0; i < users; ++i) {
                    PublicKey key{};
                    std::uint32_t entries = 0;
                    if (!r.name(key) || !r.count(entries)) {
                        return false;
                    }
                    auto& history = m.user_wallets[key];
                    history.resize(entries);
                    for (auto& proof : history) {
                        if (!read_transfer_proof(r, proof)) {
                            return false;
                        }
                    }
                }
                return true;
            });
        case 15:
            return NodeMessage{GetSectionEldersMsg{}};
        case 16:
            return decode_as<GetWalletKeyMsg>(in, [](Reader& r, GetWalletKeyMsg& m) {
                return r.name(m.node_name);
            });
        case 17:
            return NodeMessage{GetReplicaEventsMsg{}};
        case 18:
            return decode_as<ValidateTransferMsg>(in, [](Reader& r, ValidateTransferMsg& m) {
                return read_signed_transfer(r, m.signed_transfer) && read_destination(r, m.origin);
            });
        case 19:
            return decode_as<RegisterTransferMsg>(in, [](Reader& r, RegisterTransferMsg& m) {
                return read_transfer_proof(r, m.proof);
            });
        case 20:
            return decode_as<SimulatePayoutMsg>(in, [](Reader& r, SimulatePayoutMsg& m) {
                return r.name(m.transfer.recipient) && r.u64(m.transfer.amount) && r.string(m.transfer.msg) &&
                       read_destination(r, m.origin);
            });
        case 21:
            return decode_as<GetBalanceMsg>(in, [](Reader& r, GetBalanceMsg& m) {
                return r.name(m.at) && read_destination(r, m.origin);
            });
        case 22:
            return decode_as<GetHistoryMsg>(in, [](Reader& r, GetHistoryMsg& m) {
                return r.name(m.at) && r.u64(m.since_version) && read_destination(r, m.origin);
            });
        case 23:
            return decode_as<GetStoreCostMsg>(in, [](Reader& r, GetStoreCostMsg& m) {
                return r.name(m.requester) && r.u64(m.bytes) && read_destination(r, m.origin);
            });
        default:
            return std::nullopt;
    }
}

static_assert(std::variant_size_v<NodeMessage> == 24, "decode_payload must cover every NodeMessage");

}  // namespace

bool is_supported_envelope_version(std::uint8_t version) noexcept {
    return version >= kMinimumEnvelopeVersion && version <= kCurrentEnvelopeVersion;
}

std::vector<std::uint8_t> encode_envelope(const Envelope& envelope) {
    Bytes out;
    out.reserve(2 + envelope.id.size() + 64);
    write_u8(out, is_supported_envelope_version(envelope.version) ? envelope.version : kCurrentEnvelopeVersion);
    write_u8(out, static_cast<std::uint8_t>(envelope.message.index() + 1));
    write_name(out, envelope.id);
    encode_payload(out, envelope.message);
    return out;
}

std::optional<Envelope> decode_envelope(std::span<const std::uint8_t> buffer) {
    Reader in(buffer);
    std::uint8_t version = 0;
    std::uint8_t kind = 0;
    Envelope envelope{};
    if (!in.u8(version) || !in.u8(kind) || !in.name(envelope.id)) {
        return std::nullopt;
    }
    if (!is_supported_envelope_version(version) || kind == 0) {
        return std::nullopt;
    }

    auto message = decode_payload(static_cast<std::size_t>(kind - 1), in);
    if (!message.has_value() || in.remaining() != 0) {
        return std::nullopt;
    }

    envelope.version = version;
    envelope.message = std::move(*message);
    return envelope;
}

}  // namespace sectionnode::protocol
