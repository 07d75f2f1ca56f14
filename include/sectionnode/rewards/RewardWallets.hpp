#pragma once

#include "sectionnode/Types.hpp"
#include "sectionnode/rewards/Credit.hpp"

#include <cstddef>
#include <optional>

namespace sectionnode::rewards {

class RewardWallets {
public:
    RewardWallets() = default;
    explicit RewardWallets(NodeWallets wallets);

    void set_node_wallet(const XorName& node_id, const PublicKey& wallet, Age age);
    // Returns false when the node had no wallet.
    bool remove_node_wallet(const XorName& node_id);
    // Moves the wallet of a relocated node to its new name.
    bool relocate(const XorName& old_node_id, const XorName& new_node_id, Age age);

    std::optional<NodeWallet> get(const XorName& node_id) const;
    const NodeWallets& node_wallets() const noexcept { return wallets_; }

    [[nodiscard]] std::size_t size() const noexcept { return wallets_.size(); }
    [[nodiscard]] bool empty() const noexcept { return wallets_.empty(); }

    bool operator==(const RewardWallets&) const = default;

private:
    NodeWallets wallets_;
};

}  // namespace sectionnode::rewards
