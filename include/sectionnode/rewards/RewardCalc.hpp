#pragma once

#include "sectionnode/Types.hpp"
#include "sectionnode/rewards/Credit.hpp"
#include "sectionnode/rewards/RewardWallets.hpp"

namespace sectionnode::rewards {

// Halves the section balance between the two post-split sections. The odd
// nano goes to our side.
Credits split_section_funds(Token balance, const PublicKey& our_key, const PublicKey& sibling_key);

// Pays the balance out to registered node wallets in proportion to node age.
// Whatever cannot be assigned is credited to the section key.
Credits distribute_rewards(Token balance, const RewardWallets& wallets, const PublicKey& section_key);

}  // namespace sectionnode::rewards
