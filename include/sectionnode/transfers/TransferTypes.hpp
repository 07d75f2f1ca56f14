#pragma once

#include "sectionnode/Types.hpp"
#include "sectionnode/protocol/Data.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace sectionnode::transfers {

struct SignedTransfer {
    PublicKey sender{};
    PublicKey recipient{};
    Token amount{0};
    std::uint64_t counter{0};
    Signature signature;

    bool operator==(const SignedTransfer&) const = default;
};

// A transfer the sender's replicas agreed on.
struct TransferAgreementProof {
    SignedTransfer signed_transfer;
    Signature debiting_replicas_sig;
    PublicKey replicas_key{};

    bool operator==(const TransferAgreementProof&) const = default;
};

struct Transfer {
    PublicKey recipient{};
    Token amount{0};
    std::string msg;

    bool operator==(const Transfer&) const = default;
};

struct DataPayment {
    protocol::DataCmd cmd;
    TransferAgreementProof payment;
};

using UserWallets = std::map<PublicKey, std::vector<TransferAgreementProof>>;

}  // namespace sectionnode::transfers
