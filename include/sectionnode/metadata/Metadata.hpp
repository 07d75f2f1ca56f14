#pragma once

#include "sectionnode/Types.hpp"
#include "sectionnode/core/Duties.hpp"
#include "sectionnode/protocol/Data.hpp"

namespace sectionnode::metadata {

// Elder view of where the section's data lives.
class Metadata {
public:
    virtual ~Metadata() = default;

    virtual core::NodeDuty read(const protocol::DataQuery& query,
                                const MessageId& msg_id,
                                const core::Destination& origin) = 0;
    virtual core::NodeDuty write(const protocol::DataCmd& cmd,
                                 const MessageId& msg_id,
                                 const core::Destination& origin) = 0;

    // One replication instruction per chunk the lost node held.
    virtual core::NodeDuties trigger_chunk_replication(const XorName& lost_node) = 0;
    virtual void record_chunk_holder(const XorName& address, const XorName& holder) = 0;
};

}  // namespace sectionnode::metadata
