#pragma once

#include "language.h"
#include <cstdint>
#include <optional>
#include <string>

namespace contestrun {

enum class Verdict {
    ACCEPTED,
    WRONG_ANSWER,
    TIME_LIMIT_EXCEEDED,
    MEMORY_LIMIT_EXCEEDED,
    RUNTIME_ERROR,
    COMPILATION_ERROR,
    SYSTEM_ERROR
};

std::string verdict_to_string(Verdict verdict);
std::optional<Verdict> verdict_from_string(const std::string& name);

// Unit of work pulled from the queue. Immutable once dispatched.
struct SubmissionJob {
    std::string submission_id;
    std::string language_name;           // As received on the wire
    std::optional<Language> language;    // nullopt: unsupported
    std::string source;
    std::string problem_id;
    std::optional<int64_t> time_limit_ms;    // nullopt: use worker default
    std::optional<int64_t> memory_limit_mb;  // nullopt: use worker default
    std::optional<std::string> expected_output;

    // Parse the queue's JSON job body. Throws std::invalid_argument when the
    // body is not an object or lacks a submission identifier.
    static SubmissionJob from_json(const std::string& body);
};

// Outcome of one job. Created once, never modified after signing.
struct ExecutionResult {
    std::string submission_id;
    Verdict verdict = Verdict::SYSTEM_ERROR;
    int64_t score = 0;
    int64_t execution_time_ms = 0;
    int64_t memory_used_bytes = 0;
    int64_t test_cases_passed = 0;
    int64_t total_test_cases = 0;
    std::string output;                  // Truncated stdout
    std::string error;                   // Truncated stderr or diagnostic

    // Exact bytes that are signed and that a verifier reconstructs: compact
    // JSON, keys in ascending byte order, integers only, UTF-8 unescaped.
    std::string canonical_json() const;
};

struct SignedResult {
    ExecutionResult result;
    std::string worker_id;
    std::string signature;               // base64 Ed25519 over canonical_json()

    // Transmission body: canonical fields plus runnerId and signature
    std::string to_json() const;

    // Rebuild from a transmission body (verifier side, tests)
    static SignedResult from_json(const std::string& body);
};

// Replace invalid UTF-8 sequences with U+FFFD
std::string sanitize_utf8(const std::string& input);

// Valid UTF-8 of at most max_bytes, cut on a code point boundary
std::string sanitize_and_truncate_utf8(const std::string& input, size_t max_bytes);

// Output comparison used for WRONG_ANSWER: CRLF folded to LF, trailing
// whitespace per line and trailing blank lines dropped
std::string normalize_output(const std::string& output);

} // namespace contestrun
