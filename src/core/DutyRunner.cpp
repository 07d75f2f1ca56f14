#include "sectionnode/core/DutyRunner.hpp"

#include "sectionnode/daemon/StructuredLogger.hpp"

#include <deque>
#include <iterator>

namespace sectionnode::core {

namespace {

using daemon::StructuredLogger;

}  // namespace

DutyRunner::DutyRunner(Node& node, std::size_t max_steps)
    : node_(node),
      max_steps_(max_steps) {}

RunReport DutyRunner::run(NodeDuties initial) {
    RunReport report{};
    std::deque<NodeDuty> queue(std::make_move_iterator(initial.begin()), std::make_move_iterator(initial.end()));

    while (!queue.empty()) {
        if (report.handled >= max_steps_) {
            report.abandoned = queue.size();
            daemon::log_event(StructuredLogger::Level::Warning,
                              "runner.budget_exhausted",
                              {{"handled", std::to_string(report.handled)},
                               {"abandoned", std::to_string(report.abandoned)}});
            break;
        }

        auto duty = std::move(queue.front());
        queue.pop_front();
        ++report.handled;

        try {
            auto follow_ups = node_.handle(duty);
            for (auto& next : follow_ups) {
                queue.push_back(std::move(next));
            }
        } catch (const NodeError& error) {
            daemon::log_event(StructuredLogger::Level::Error,
                              "runner.duty_failed",
                              {{"duty", std::string(duty_name(duty))},
                               {"kind", std::string(error_kind_to_string(error.kind()))},
                               {"code", error.code()},
                               {"message", error.what()}});
            report.failures.push_back(
                DutyFailure{std::string(duty_name(duty)), error.kind(), error.code(), error.what()});
        }
    }
    return report;
}

RunReport DutyRunner::run_event(const routing::RoutingEvent& event) {
    auto duty = node_.process_network_event(event);
    if (!duty.has_value()) {
        return RunReport{};
    }
    return run(NodeDuties{std::move(*duty)});
}

}  // namespace sectionnode::core
