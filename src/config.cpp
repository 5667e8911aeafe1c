#include "config.h"
#include "errors.h"
#include "worker_identity.h"
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace contestrun {

namespace {

int64_t parse_integer(const std::string& name, const std::string& value) {
    if (value.empty()) {
        throw ConfigError(name + " is empty");
    }
    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(value.c_str(), &end, 10);
    if (errno != 0 || end == value.c_str() || *end != '\0') {
        throw ConfigError(name + " is not an integer: '" + value + "'");
    }
    return static_cast<int64_t>(parsed);
}

bool env_value(const char* name, std::string& out) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return false;
    }
    out = value;
    return true;
}

} // namespace

WorkerConfig WorkerConfig::from_env() {
    WorkerConfig config;
    std::string value;

    if (env_value("RUNNER_ID", value)) config.runner_id = value;
    if (env_value("PRIVATE_KEY_PATH", value)) config.private_key_path = value;
    if (env_value("PUBLIC_KEY_PATH", value)) config.public_key_path = value;
    if (env_value("API_URL", value)) config.api_url = value;
    if (env_value("DOCKER_SOCKET", value)) config.docker_socket = value;
    if (env_value("CONCURRENCY", value)) {
        config.concurrency = static_cast<int>(parse_integer("CONCURRENCY", value));
    }
    if (env_value("MAX_EXECUTION_TIME", value)) {
        config.max_execution_time_ms = parse_integer("MAX_EXECUTION_TIME", value);
    }
    if (env_value("MAX_MEMORY", value)) {
        int64_t bytes = parse_integer("MAX_MEMORY", value);
        if (bytes <= 0) {
            throw ConfigError("MAX_MEMORY must be positive");
        }
        config.max_memory_bytes = static_cast<uint64_t>(bytes);
    }
    // Only an explicit "false" opens the network
    if (env_value("NETWORK_DISABLED", value)) config.network_disabled = value != "false";
    if (env_value("POLL_INTERVAL_MS", value)) {
        config.poll_interval_ms = parse_integer("POLL_INTERVAL_MS", value);
    }
    if (env_value("HEARTBEAT_INTERVAL_MS", value)) {
        config.heartbeat_interval_ms = parse_integer("HEARTBEAT_INTERVAL_MS", value);
    }
    if (env_value("GRACE_PERIOD_MS", value)) {
        config.grace_period_ms = parse_integer("GRACE_PERIOD_MS", value);
    }
    if (env_value("SHUTDOWN_TIMEOUT_MS", value)) {
        config.shutdown_timeout_ms = parse_integer("SHUTDOWN_TIMEOUT_MS", value);
    }
    return config;
}

void WorkerConfig::apply_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ConfigError(flag + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--runner-id") {
            runner_id = next(arg);
        } else if (arg == "--private-key") {
            private_key_path = next(arg);
        } else if (arg == "--public-key") {
            public_key_path = next(arg);
        } else if (arg == "--api-url") {
            api_url = next(arg);
        } else if (arg == "--docker-socket") {
            docker_socket = next(arg);
        } else if (arg == "--concurrency") {
            concurrency = static_cast<int>(parse_integer(arg, next(arg)));
        } else if (arg == "--max-execution-time") {
            max_execution_time_ms = parse_integer(arg, next(arg));
        } else if (arg == "--max-memory") {
            int64_t bytes = parse_integer(arg, next(arg));
            if (bytes <= 0) {
                throw ConfigError(arg + " must be positive");
            }
            max_memory_bytes = static_cast<uint64_t>(bytes);
        } else if (arg == "--enable-network") {
            network_disabled = false;
        } else if (arg == "--poll-interval") {
            poll_interval_ms = parse_integer(arg, next(arg));
        } else if (arg == "--heartbeat-interval") {
            heartbeat_interval_ms = parse_integer(arg, next(arg));
        } else if (arg == "--grace-period") {
            grace_period_ms = parse_integer(arg, next(arg));
        } else if (arg == "--shutdown-timeout") {
            shutdown_timeout_ms = parse_integer(arg, next(arg));
        } else if (arg == "--generate-key") {
            generate_key = true;
        } else if (arg == "--help" || arg == "-h") {
            show_help = true;
        } else {
            throw ConfigError("unknown option " + arg);
        }
    }
}

WorkerConfig WorkerConfig::load(int argc, char* argv[]) {
    WorkerConfig config = from_env();
    config.apply_args(argc, argv);
    return config;
}

void WorkerConfig::validate() const {
    if (concurrency <= 0) {
        throw ConfigError("concurrency must be positive");
    }
    if (max_execution_time_ms <= 0) {
        throw ConfigError("max execution time must be positive");
    }
    if (max_memory_bytes == 0) {
        throw ConfigError("max memory must be positive");
    }
    if (poll_interval_ms <= 0 || heartbeat_interval_ms <= 0) {
        throw ConfigError("poll and heartbeat intervals must be positive");
    }
    if (grace_period_ms < 0) {
        throw ConfigError("grace period must not be negative");
    }
    if (shutdown_timeout_ms <= 0) {
        throw ConfigError("shutdown timeout must be positive");
    }
    if (api_url.empty()) {
        throw ConfigError("API URL is empty");
    }
    if (docker_socket.empty()) {
        throw ConfigError("docker socket path is empty");
    }
    if (private_key_path.empty() || public_key_path.empty()) {
        throw ConfigError("key paths must be set");
    }
}

std::string WorkerConfig::resolve_worker_id(const WorkerIdentity& identity) const {
    if (!runner_id.empty()) {
        return runner_id;
    }
    return "runner-" + identity.fingerprint().substr(0, 16);
}

std::string WorkerConfig::usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --runner-id ID              Worker identifier (RUNNER_ID)\n"
        << "  --private-key PATH          Ed25519 private key (PRIVATE_KEY_PATH)\n"
        << "  --public-key PATH           Public key PEM (PUBLIC_KEY_PATH)\n"
        << "  --api-url URL               Queue and registry endpoint (API_URL)\n"
        << "  --docker-socket PATH        Docker Engine socket (DOCKER_SOCKET)\n"
        << "  --concurrency N             Jobs in flight (CONCURRENCY)\n"
        << "  --max-execution-time MS     Time limit default and ceiling (MAX_EXECUTION_TIME)\n"
        << "  --max-memory BYTES          Memory limit default and ceiling (MAX_MEMORY)\n"
        << "  --enable-network            Give sandboxes network access (NETWORK_DISABLED=false)\n"
        << "  --poll-interval MS          Job poll tick (POLL_INTERVAL_MS)\n"
        << "  --heartbeat-interval MS     Heartbeat tick (HEARTBEAT_INTERVAL_MS)\n"
        << "  --grace-period MS           Backstop buffer (GRACE_PERIOD_MS)\n"
        << "  --shutdown-timeout MS       Drain bound (SHUTDOWN_TIMEOUT_MS)\n"
        << "  --generate-key              Write a fresh keypair and exit\n";
    return out.str();
}

} // namespace contestrun
