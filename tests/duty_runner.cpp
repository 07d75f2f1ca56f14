#include "sectionnode/core/DutyRunner.hpp"
#include "test_support.hpp"

#include <cassert>
#include <filesystem>

using namespace sectionnode;
using sectionnode::test::LogCapture;
using sectionnode::test::make_key;
using sectionnode::test::make_name;
using sectionnode::test::make_test_node;

int main() {
    LogCapture capture;
    const auto root = sectionnode::test::temp_root("runner");
    auto member = make_test_node(make_name(1), 10, sectionnode::test::test_config(root), 40);
    auto& runner = *member.runner;
    const auto client = protocol::to_end_user(make_key(0xC1));

    // Follow-ups run after the duties already queued.
    {
        const auto report = runner.run({core::duty::Genesis{},
                                        core::duty::GetBalance{make_key(2), random_message_id(), client},
                                        core::duty::SetNodeJoinsAllowed{true}});
        assert(report.failures.empty());
        assert(report.handled == 4);
        assert(member.network->joins_allowed());
        assert(member.network->sent().size() == 1);
    }

    // A failing duty is recorded and the rest of the queue still runs.
    {
        const auto report = runner.run({core::duty::ReadChunk{{make_name(3)}, random_message_id(), client},
                                        core::duty::SetNodeJoinsAllowed{false}});
        assert(report.handled == 2);
        assert(report.failures.size() == 1);
        assert(report.failures[0].code == "E_NO_CHUNKS");
        assert(report.failures[0].kind == ErrorKind::RoleMismatch);
        assert(report.failures[0].duty == "ReadChunk");
        assert(!member.network->joins_allowed());
        assert(capture.contains("runner.duty_failed"));
        assert(member.node->is_elder());
    }

    // The step budget bounds a run.
    {
        core::DutyRunner limited(*member.node, 2);
        const auto report = limited.run({core::duty::NoOp{}, core::duty::NoOp{}, core::duty::NoOp{}});
        assert(report.handled == 2);
        assert(report.abandoned == 1);
        assert(capture.contains("runner.budget_exhausted"));
    }

    // Events that map to nothing run nothing.
    {
        const auto report = runner.run_event(routing::RelocationStarted{make_name(4)});
        assert(report.handled == 0);
    }

    std::filesystem::remove_all(root);
    return 0;
}
