#pragma once

#include "sectionnode/Errors.hpp"
#include "sectionnode/core/Duties.hpp"
#include "sectionnode/core/Node.hpp"
#include "sectionnode/routing/Events.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace sectionnode::core {

struct DutyFailure {
    std::string duty;
    ErrorKind kind{ErrorKind::Collaborator};
    std::string code;
    std::string message;
};

struct RunReport {
    std::size_t handled{0};
    std::vector<DutyFailure> failures;
    // Duties still queued when the step budget ran out.
    std::size_t abandoned{0};
};

// Drains follow-up duties breadth first. A failing duty is logged and
// recorded; the rest of the queue still runs.
class DutyRunner {
public:
    explicit DutyRunner(Node& node, std::size_t max_steps = 10000);

    RunReport run(NodeDuties initial);
    RunReport run_event(const routing::RoutingEvent& event);

private:
    Node& node_;
    std::size_t max_steps_;
};

}  // namespace sectionnode::core
