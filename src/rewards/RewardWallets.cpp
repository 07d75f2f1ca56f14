#include "sectionnode/rewards/RewardWallets.hpp"

namespace sectionnode::rewards {

RewardWallets::RewardWallets(NodeWallets wallets) : wallets_(std::move(wallets)) {}

void RewardWallets::set_node_wallet(const XorName& node_id, const PublicKey& wallet, Age age) {
    wallets_.insert_or_assign(node_id, NodeWallet{wallet, age});
}

bool RewardWallets::remove_node_wallet(const XorName& node_id) {
    return wallets_.erase(node_id) > 0;
}

bool RewardWallets::relocate(const XorName& old_node_id, const XorName& new_node_id, Age age) {
    const auto it = wallets_.find(old_node_id);
    if (it == wallets_.end()) {
        return false;
    }
    const auto wallet = it->second.wallet;
    wallets_.erase(it);
    wallets_.insert_or_assign(new_node_id, NodeWallet{wallet, age});
    return true;
}

std::optional<NodeWallet> RewardWallets::get(const XorName& node_id) const {
    const auto it = wallets_.find(node_id);
    if (it == wallets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace sectionnode::rewards
