#include "execution_coordinator.h"
#include "constants.h"
#include "worker_identity.h"
#include <algorithm>
#include <iostream>

namespace contestrun {

Verdict classify(const RawExecutionOutcome& outcome,
                 Language language,
                 const SandboxLimits& limits,
                 const std::optional<std::string>& expected_output) {
    if (outcome.killed_by_deadline || outcome.wall_time.count() > limits.time_limit_ms) {
        return Verdict::TIME_LIMIT_EXCEEDED;
    }
    if (outcome.oom_killed || outcome.peak_memory_bytes > limits.memory_limit_bytes) {
        return Verdict::MEMORY_LIMIT_EXCEEDED;
    }
    if (outcome.exit_code != 0) {
        return is_compilation_error(language, outcome.exit_code, outcome.stderr_output)
            ? Verdict::COMPILATION_ERROR
            : Verdict::RUNTIME_ERROR;
    }
    if (expected_output &&
        normalize_output(outcome.stdout_output) != normalize_output(*expected_output)) {
        return Verdict::WRONG_ANSWER;
    }
    return Verdict::ACCEPTED;
}

ExecutionCoordinator::ExecutionCoordinator(SandboxDriver& driver,
                                           const WorkerIdentity& identity,
                                           std::string worker_id,
                                           const WorkerConfig& config)
    : driver_(driver), identity_(identity), worker_id_(std::move(worker_id)), config_(config) {}

std::optional<SandboxLimits> ExecutionCoordinator::resolve_limits(const SubmissionJob& job,
                                                                  std::string& reason) const {
    SandboxLimits limits;
    limits.grace_period_ms = config_.grace_period_ms;
    limits.network_enabled = !config_.network_disabled;
    limits.pids_limit = MAX_PROCESSES_PER_JOB;

    if (job.time_limit_ms && *job.time_limit_ms <= 0) {
        reason = "Invalid time limit: " + std::to_string(*job.time_limit_ms);
        return std::nullopt;
    }
    if (job.memory_limit_mb && *job.memory_limit_mb <= 0) {
        reason = "Invalid memory limit: " + std::to_string(*job.memory_limit_mb);
        return std::nullopt;
    }

    limits.time_limit_ms = job.time_limit_ms
        ? std::min<int64_t>(*job.time_limit_ms, config_.max_execution_time_ms)
        : config_.max_execution_time_ms;

    // Clamp in megabytes so the byte count cannot wrap
    uint64_t requested_mb = static_cast<uint64_t>(job.memory_limit_mb.value_or(0));
    limits.memory_limit_bytes = (!job.memory_limit_mb || requested_mb >= (config_.max_memory_bytes >> 20))
        ? config_.max_memory_bytes
        : requested_mb * 1024 * 1024;
    return limits;
}

SignedResult ExecutionCoordinator::run(const SubmissionJob& job) {
    if (!job.language) {
        std::cerr << "[Coordinator] Submission " << job.submission_id
                  << " rejected: unsupported language '" << job.language_name << "'" << std::endl;
        return sign(system_error(job, "Unsupported language: " + job.language_name, 0));
    }

    ExecutionResult result = execute(job, *job.language);
    std::cout << "[Coordinator] Submission " << job.submission_id << " ("
              << language_name(*job.language) << "): " << verdict_to_string(result.verdict)
              << " in " << result.execution_time_ms << "ms" << std::endl;
    return sign(std::move(result));
}

ExecutionResult ExecutionCoordinator::execute(const SubmissionJob& job, Language language) {
    if (job.source.size() > MAX_SOURCE_BYTES) {
        std::cerr << "[Coordinator] Submission " << job.submission_id << " rejected: source is "
                  << job.source.size() << " bytes" << std::endl;
        return system_error(job, "Source exceeds " + std::to_string(MAX_SOURCE_BYTES) + " bytes", 1);
    }

    std::string reason;
    std::optional<SandboxLimits> limits = resolve_limits(job, reason);
    if (!limits) {
        std::cerr << "[Coordinator] Submission " << job.submission_id << " rejected: "
                  << reason << std::endl;
        return system_error(job, reason, 1);
    }

    RawExecutionOutcome outcome;
    try {
        outcome = driver_.execute(job, language_profile(language), *limits);
    } catch (const std::exception& e) {
        std::cerr << "[Coordinator] Submission " << job.submission_id
                  << " failed in sandbox: " << e.what() << std::endl;
        return system_error(job, e.what(), 1);
    }

    ExecutionResult result;
    result.submission_id = job.submission_id;
    result.verdict = classify(outcome, language, *limits, job.expected_output);
    result.execution_time_ms = outcome.wall_time.count();
    result.memory_used_bytes = static_cast<int64_t>(outcome.peak_memory_bytes);
    result.total_test_cases = 1;
    if (result.verdict == Verdict::ACCEPTED) {
        result.score = FULL_SCORE;
        result.test_cases_passed = 1;
    }
    result.output = outcome.stdout_output;
    result.error = outcome.stderr_output;
    return result;
}

ExecutionResult ExecutionCoordinator::system_error(const SubmissionJob& job,
                                                   const std::string& message,
                                                   int64_t total_test_cases) const {
    ExecutionResult result;
    result.submission_id = job.submission_id;
    result.verdict = Verdict::SYSTEM_ERROR;
    result.total_test_cases = total_test_cases;
    result.error = sanitize_and_truncate_utf8(message, MAX_OUTPUT_BYTES);
    return result;
}

SignedResult ExecutionCoordinator::sign(ExecutionResult result) const {
    SignedResult signed_result;
    signed_result.signature = identity_.sign(result.canonical_json());
    signed_result.worker_id = worker_id_;
    signed_result.result = std::move(result);
    return signed_result;
}

} // namespace contestrun
