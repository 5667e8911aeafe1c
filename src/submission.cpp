#include "submission.h"
#include <json/json.h>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace contestrun {

namespace {

Json::Value parse_object(const std::string& body) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
        throw std::invalid_argument("Malformed JSON: " + errors);
    }
    if (!root.isObject()) {
        throw std::invalid_argument("JSON body is not an object");
    }
    return root;
}

std::string string_field(const Json::Value& root, const char* key) {
    const Json::Value& value = root[key];
    return value.isString() ? value.asString() : "";
}

// Absent limit: nullopt (worker default). Present but not a number, or out
// of the int64 range: -1, which the coordinator rejects as a configuration
// error.
std::optional<int64_t> limit_field(const Json::Value& root, const char* key) {
    if (!root.isMember(key) || root[key].isNull()) {
        return std::nullopt;
    }
    const Json::Value& value = root[key];
    if (!value.isNumeric()) {
        return -1;
    }
    if (value.isIntegral()) {
        return value.isInt64() ? value.asInt64() : -1;
    }
    double number = value.asDouble();
    if (!(number >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
          number < static_cast<double>(std::numeric_limits<int64_t>::max()))) {
        return -1;
    }
    return static_cast<int64_t>(number);
}

int64_t int_field(const Json::Value& root, const char* key) {
    const Json::Value& value = root[key];
    return value.isIntegral() ? value.asInt64() : 0;
}

std::string write_compact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["commentStyle"] = "None";
    builder["emitUTF8"] = true;
    builder["enableYAMLCompatibility"] = false;
    builder["dropNullPlaceholders"] = false;
    return Json::writeString(builder, value);
}

Json::Value result_fields(const ExecutionResult& result) {
    Json::Value json(Json::objectValue);
    json["submissionId"] = result.submission_id;
    json["verdict"] = verdict_to_string(result.verdict);
    json["score"] = static_cast<Json::Int64>(result.score);
    json["executionTime"] = static_cast<Json::Int64>(result.execution_time_ms);
    json["memoryUsed"] = static_cast<Json::Int64>(result.memory_used_bytes);
    json["testCasesPassed"] = static_cast<Json::Int64>(result.test_cases_passed);
    json["totalTestCases"] = static_cast<Json::Int64>(result.total_test_cases);
    json["output"] = result.output;
    json["error"] = result.error;
    return json;
}

} // namespace

std::string verdict_to_string(Verdict verdict) {
    switch (verdict) {
        case Verdict::ACCEPTED: return "ACCEPTED";
        case Verdict::WRONG_ANSWER: return "WRONG_ANSWER";
        case Verdict::TIME_LIMIT_EXCEEDED: return "TIME_LIMIT_EXCEEDED";
        case Verdict::MEMORY_LIMIT_EXCEEDED: return "MEMORY_LIMIT_EXCEEDED";
        case Verdict::RUNTIME_ERROR: return "RUNTIME_ERROR";
        case Verdict::COMPILATION_ERROR: return "COMPILATION_ERROR";
        case Verdict::SYSTEM_ERROR: return "SYSTEM_ERROR";
    }
    return "SYSTEM_ERROR";
}

std::optional<Verdict> verdict_from_string(const std::string& name) {
    static const Verdict all[] = {
        Verdict::ACCEPTED, Verdict::WRONG_ANSWER, Verdict::TIME_LIMIT_EXCEEDED,
        Verdict::MEMORY_LIMIT_EXCEEDED, Verdict::RUNTIME_ERROR,
        Verdict::COMPILATION_ERROR, Verdict::SYSTEM_ERROR
    };
    for (Verdict verdict : all) {
        if (verdict_to_string(verdict) == name) {
            return verdict;
        }
    }
    return std::nullopt;
}

SubmissionJob SubmissionJob::from_json(const std::string& body) {
    Json::Value root = parse_object(body);

    SubmissionJob job;
    job.submission_id = string_field(root, "submissionId");
    if (job.submission_id.empty()) {
        throw std::invalid_argument("Job has no submissionId");
    }
    job.language_name = string_field(root, "language");
    job.language = parse_language(job.language_name);
    job.source = string_field(root, "code");
    job.problem_id = string_field(root, "problemId");
    job.time_limit_ms = limit_field(root, "timeLimit");
    job.memory_limit_mb = limit_field(root, "memoryLimit");
    if (root["expectedOutput"].isString()) {
        job.expected_output = root["expectedOutput"].asString();
    }
    return job;
}

std::string ExecutionResult::canonical_json() const {
    // Json::Value keeps object members in byte-wise key order, which fixes
    // the field order independently of insertion order.
    return write_compact(result_fields(*this));
}

std::string SignedResult::to_json() const {
    Json::Value json = result_fields(result);
    json["runnerId"] = worker_id;
    json["signature"] = signature;
    return write_compact(json);
}

SignedResult SignedResult::from_json(const std::string& body) {
    Json::Value root = parse_object(body);

    SignedResult signed_result;
    ExecutionResult& result = signed_result.result;
    result.submission_id = string_field(root, "submissionId");
    auto verdict = verdict_from_string(string_field(root, "verdict"));
    if (!verdict) {
        throw std::invalid_argument("Unknown verdict");
    }
    result.verdict = *verdict;
    result.score = int_field(root, "score");
    result.execution_time_ms = int_field(root, "executionTime");
    result.memory_used_bytes = int_field(root, "memoryUsed");
    result.test_cases_passed = int_field(root, "testCasesPassed");
    result.total_test_cases = int_field(root, "totalTestCases");
    result.output = string_field(root, "output");
    result.error = string_field(root, "error");
    signed_result.worker_id = string_field(root, "runnerId");
    signed_result.signature = string_field(root, "signature");
    return signed_result;
}

std::string sanitize_utf8(const std::string& input) {
    static const char REPLACEMENT[] = "\xEF\xBF\xBD";
    std::string output;
    output.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        unsigned char lead = static_cast<unsigned char>(input[i]);
        size_t length = 0;
        uint32_t min_code = 0;
        if (lead < 0x80) {
            output += static_cast<char>(lead);
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2; min_code = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3; min_code = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4; min_code = 0x10000;
        } else {
            output += REPLACEMENT;
            ++i;
            continue;
        }

        if (i + length > input.size()) {
            output += REPLACEMENT;
            ++i;
            continue;
        }

        uint32_t code = lead & (0xFF >> (length + 1));
        bool valid = true;
        for (size_t k = 1; k < length; ++k) {
            unsigned char next = static_cast<unsigned char>(input[i + k]);
            if ((next & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            code = (code << 6) | (next & 0x3F);
        }
        // Overlong forms, surrogates and code points past U+10FFFF
        if (valid && (code < min_code || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF))) {
            valid = false;
        }

        if (valid) {
            output.append(input, i, length);
            i += length;
        } else {
            output += REPLACEMENT;
            ++i;
        }
    }
    return output;
}

std::string sanitize_and_truncate_utf8(const std::string& input, size_t max_bytes) {
    std::string output = sanitize_utf8(input);
    if (output.size() <= max_bytes) {
        return output;
    }
    size_t cut = max_bytes;
    // Back off continuation bytes so the cut lands before a lead byte
    while (cut > 0 && (static_cast<unsigned char>(output[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    output.resize(cut);
    return output;
}

std::string normalize_output(const std::string& output) {
    std::vector<std::string> lines;
    std::string line;
    std::istringstream stream(output);
    while (std::getline(stream, line)) {
        size_t end = line.find_last_not_of(" \t\r");
        lines.push_back(end == std::string::npos ? "" : line.substr(0, end + 1));
    }
    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }

    std::string normalized;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            normalized += '\n';
        }
        normalized += lines[i];
    }
    return normalized;
}

} // namespace contestrun
