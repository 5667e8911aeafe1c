#pragma once

#include "config.h"
#include "language.h"
#include "sandbox.h"
#include "submission.h"
#include <optional>
#include <string>

namespace contestrun {

class WorkerIdentity;

// Verdict for a finished sandbox run. Priority: time, memory, exit status,
// then expected output when the job carries one.
Verdict classify(const RawExecutionOutcome& outcome,
                 Language language,
                 const SandboxLimits& limits,
                 const std::optional<std::string>& expected_output);

// Per-job state machine: validate, execute, classify, sign
class ExecutionCoordinator {
public:
    ExecutionCoordinator(SandboxDriver& driver,
                         const WorkerIdentity& identity,
                         std::string worker_id,
                         const WorkerConfig& config);

    // Exactly one signed result per call. Sandbox failures become
    // SYSTEM_ERROR results; a signing failure throws IdentityError.
    SignedResult run(const SubmissionJob& job);

    // Job limits resolved against the worker's defaults and ceilings.
    // nullopt (with reason) for non-positive limits.
    std::optional<SandboxLimits> resolve_limits(const SubmissionJob& job, std::string& reason) const;

    // Sign the canonical encoding of result
    SignedResult sign(ExecutionResult result) const;

private:
    ExecutionResult execute(const SubmissionJob& job, Language language);
    ExecutionResult system_error(const SubmissionJob& job, const std::string& message,
                                 int64_t total_test_cases) const;

    SandboxDriver& driver_;
    const WorkerIdentity& identity_;
    std::string worker_id_;
    WorkerConfig config_;
};

} // namespace contestrun
