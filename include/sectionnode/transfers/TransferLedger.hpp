#pragma once

#include "sectionnode/Types.hpp"
#include "sectionnode/core/Duties.hpp"
#include "sectionnode/rewards/Credit.hpp"
#include "sectionnode/routing/SectionElders.hpp"
#include "sectionnode/transfers/TransferTypes.hpp"

#include <cstdint>

namespace sectionnode::transfers {

// Section replica of client and section wallets. Balance and signature
// checks live behind this interface; failures throw NodeError(Collaborator).
class TransferLedger {
public:
    virtual ~TransferLedger() = default;

    virtual core::NodeDuty validate(const SignedTransfer& transfer,
                                    const MessageId& msg_id,
                                    const protocol::Destination& origin) = 0;
    virtual core::NodeDuty register_transfer(const TransferAgreementProof& proof,
                                             const MessageId& msg_id) = 0;
    virtual core::NodeDuty receive_propagated(const rewards::CreditAgreementProof& proof,
                                              const MessageId& msg_id,
                                              const protocol::Destination& origin) = 0;
    virtual core::NodeDuty history(const PublicKey& at,
                                   std::uint64_t since_version,
                                   const MessageId& msg_id,
                                   const protocol::Destination& origin) = 0;
    virtual core::NodeDuty balance(const PublicKey& at,
                                   const MessageId& msg_id,
                                   const protocol::Destination& origin) = 0;
    virtual core::NodeDuties store_cost(std::uint64_t bytes,
                                        const MessageId& msg_id,
                                        const protocol::Destination& origin) = 0;
    virtual core::NodeDuty all_events(const MessageId& msg_id,
                                      const protocol::Destination& origin) = 0;
    virtual core::NodeDuty credit_without_proof(const Transfer& transfer) = 0;
    virtual core::NodeDuties process_payment(const DataPayment& payment,
                                             const MessageId& msg_id,
                                             const protocol::Destination& origin) = 0;

    virtual void increase_full_node_count(const XorName& node_id) = 0;
    virtual void update_replicas(const routing::SectionElders& elders) = 0;

    virtual Token section_balance() const = 0;
    virtual UserWallets user_wallets() const = 0;
    virtual void merge_user_wallets(const UserWallets& wallets) = 0;
};

}  // namespace sectionnode::transfers
