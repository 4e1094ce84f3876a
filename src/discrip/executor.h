#pragma once

// discrip - Disc video ripper
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <chrono>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "discrip/discrip.h"
#include "events.h"
#include "process.h"
#include "progress.h"

namespace discrip::detail {

using ReporterFactory = std::function<std::unique_ptr<ProgressReporter>(
    const DiscRipPlan&, EventSink&)>;

struct ExecutionResult {
    std::vector<std::string> command;
    int exit_code{0};
    std::optional<uint64_t> bytes;
};

struct ExecutionFailure {
    DiscRipErrorKinds kind{DISCRIP_ERROR_NONE};
    int exit_code{DISCRIP_EXIT_RIP_FAILED};
    int process_status{0};
    std::string message;
    std::string reason;
};

enum class ExecutionOutcome {
    Skipped,
    Succeeded,
    Failed,
};

// Runs rip plans one at a time. There is no way to abort a running
// backend; execute() returns only after the process has exited.
class RipExecutor {
public:
    RipExecutor(
        EventSink& sink,
        ProcessLauncher& launcher,
        ReporterFactory reporters,
        std::chrono::milliseconds poll_interval,
        std::ostream& out);

    ExecutionOutcome execute(
        const DiscRipPlan& plan,
        ExecutionResult& result,
        ExecutionFailure& failure);

private:
    ExecutionOutcome fail(
        const DiscRipPlan& plan,
        ProgressReporter* reporter,
        DiscRipErrorKinds kind,
        int process_status,
        const std::string& message,
        const std::string& reason,
        ExecutionFailure& failure);

    void supervise(
        ChildProcess& child,
        ProgressReporter& reporter);

    EventSink& sink_;
    ProcessLauncher& launcher_;
    ReporterFactory reporters_;
    std::chrono::milliseconds poll_interval_;
    std::ostream& out_;
};

}  // namespace discrip::detail
