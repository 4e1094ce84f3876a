#pragma once

// discrip - Disc video ripper
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <memory>
#include <string>
#include <vector>

#include "discrip/discrip.h"
#include "progress.h"

namespace discrip::detail {

struct LaunchFailure {
    DiscRipErrorKinds kind{DISCRIP_ERROR_NONE};
    std::string message;
};

// A running external process with independently readable stdout/stderr.
// read_line() is called from one reader thread per stream; the other
// members are called from the supervising thread only.
class ChildProcess {
public:
    virtual ~ChildProcess() = default;

    // False at end-of-stream. err is filled when the stream failed.
    virtual bool read_line(StreamKind stream, std::string& line, std::string& err) = 0;
    // Closes our end of a failed stream so the child cannot block writing to it.
    virtual bool close_stream(StreamKind stream, std::string& err) = 0;
    // Non-blocking.
    virtual bool poll_exited() = 0;
    // Blocks until exit; status is the exit code, or 128 + signal.
    virtual bool wait(int& status, std::string& err) = 0;
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // Null on failure with failure.kind in TOOL_NOT_FOUND / PERMISSION_DENIED / IO.
    virtual std::unique_ptr<ChildProcess> launch(
        const std::vector<std::string>& argv,
        LaunchFailure& failure) = 0;
};

// Spawns through GSubprocess, searching PATH for argv[0].
class GioProcessLauncher final : public ProcessLauncher {
public:
    std::unique_ptr<ChildProcess> launch(
        const std::vector<std::string>& argv,
        LaunchFailure& failure) override;
};

}  // namespace discrip::detail
