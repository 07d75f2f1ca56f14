#include "sectionnode/rewards/RewardCalc.hpp"

namespace sectionnode::rewards {

Credits split_section_funds(Token balance, const PublicKey& our_key, const PublicKey& sibling_key) {
    Credits credits;
    if (balance == 0) {
        return credits;
    }
    const Token sibling_share = balance / 2;
    const Token our_share = balance - sibling_share;

    std::uint64_t position = 0;
    credits.push_back(make_credit(our_key, our_key, our_share, position++, "Section split, our half"));
    if (sibling_share > 0) {
        credits.push_back(make_credit(our_key, sibling_key, sibling_share, position++, "Section split, sibling half"));
    }
    return credits;
}

Credits distribute_rewards(Token balance, const RewardWallets& wallets, const PublicKey& section_key) {
    Credits credits;
    if (balance == 0) {
        return credits;
    }

    std::uint64_t total_weight = 0;
    for (const auto& [name, wallet] : wallets.node_wallets()) {
        total_weight += wallet.age;
    }

    std::uint64_t position = 0;
    Token paid = 0;
    if (total_weight > 0) {
        for (const auto& [name, wallet] : wallets.node_wallets()) {
            // Split to keep balance * age from overflowing.
            const Token share = (balance / total_weight) * wallet.age +
                                (balance % total_weight) * wallet.age / total_weight;
            if (share == 0) {
                continue;
            }
            credits.push_back(make_credit(section_key, wallet.wallet, share, position++,
                                          "Reward for node " + name_to_string(name)));
            paid += share;
        }
    }

    if (paid < balance) {
        credits.push_back(make_credit(section_key, section_key, balance - paid, position++, "Unassigned rewards"));
    }
    return credits;
}

}  // namespace sectionnode::rewards
