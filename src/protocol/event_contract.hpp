#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include "protocol/run_execution_contract.hpp"

namespace ael::protocol {

    // Lifecycle events observed by frontends and the trace writer. Delivered
    // one at a time and in order per run, from engine threads.
    struct RunStartedEvent {
        std::string run_id;
        std::string workflow_name;
        std::size_t step_count = 0;
    };
    struct StepStartedEvent {
        std::string run_id;
        std::string step_id;
        std::uint32_t attempt = 0;
    };
    struct StepFinishedEvent {
        std::string run_id;
        StepResult result;
    };
    struct RunFinishedEvent {
        std::string run_id;
        ExecutionReport report;
    };

    using LifecycleEvent = std::variant<
        RunStartedEvent,
        StepStartedEvent,
        StepFinishedEvent,
        RunFinishedEvent
    >;

    using EventSink = std::function<void(const LifecycleEvent&)>;

} // namespace ael::protocol
