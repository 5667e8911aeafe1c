/*
 * ContestRun - Untrusted code execution worker
 * Pulls submissions, runs them in Docker sandboxes, reports signed verdicts
 */

#include "active_sandboxes.h"
#include "api_client.h"
#include "config.h"
#include "docker_client.h"
#include "errors.h"
#include "worker.h"
#include "worker_identity.h"
#include <signal.h>
#include <pthread.h>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <thread>

using namespace contestrun;

namespace {

int generate_key(const WorkerConfig& config) {
    std::cout << "Generating new worker identity..." << std::endl;
    auto identity = WorkerIdentity::generate();
    if (!identity) {
        std::cerr << "Failed to generate worker identity" << std::endl;
        return 1;
    }
    if (!identity->save_to_file(config.private_key_path) ||
        !identity->save_public_key(config.public_key_path)) {
        std::cerr << "Failed to save worker key to " << config.private_key_path << std::endl;
        return 1;
    }
    std::cout << "Saved private key to: " << config.private_key_path << std::endl;
    std::cout << "Saved public key to:  " << config.public_key_path << std::endl;
    std::cout << "Worker ID: " << config.resolve_worker_id(*identity) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    WorkerConfig config;
    try {
        config = WorkerConfig::load(argc, argv);
        if (config.show_help) {
            std::cout << WorkerConfig::usage(argv[0]);
            return 0;
        }
        config.validate();
    } catch (const ConfigError& e) {
        std::cerr << "[Worker] " << e.what() << std::endl;
        std::cerr << WorkerConfig::usage(argv[0]);
        return 1;
    }

    if (config.generate_key) {
        return generate_key(config);
    }

    // Termination signals are taken by sigwait below; block them before any
    // thread exists so every thread inherits the mask
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGINT);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    std::unique_ptr<WorkerIdentity> identity;
    try {
        identity = WorkerIdentity::load_or_create(config.private_key_path, config.public_key_path);
    } catch (const IdentityError& e) {
        std::cerr << "[Worker] " << e.what() << std::endl;
        return 1;
    }
    std::string worker_id = config.resolve_worker_id(*identity);

    std::cout << "ContestRun worker" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;
    std::cout << "Worker ID:   " << worker_id << std::endl;
    std::cout << "API:         " << config.api_url << std::endl;
    std::cout << "Docker:      " << config.docker_socket << std::endl;
    std::cout << "Concurrency: " << config.concurrency << std::endl;
    std::cout << "Limits:      " << config.max_execution_time_ms << "ms, "
              << config.max_memory_bytes / (1024 * 1024) << "MB, network "
              << (config.network_disabled ? "disabled" : "enabled") << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    DockerClient docker(config.docker_socket);
    HttpApiClient api(config.api_url, worker_id, *identity);
    ActiveSandboxes active;

    Worker worker(WorkerContext{config, worker_id, *identity, docker, api, api, active});
    worker.start();

    int signal_number = 0;
    if (sigwait(&signals, &signal_number) != 0) {
        std::cerr << "[Worker] sigwait failed, shutting down" << std::endl;
    } else {
        std::cout << "[Worker] " << strsignal(signal_number) << " received" << std::endl;
    }

    // A hung cleanup must not keep the process alive past the timeout
    std::chrono::milliseconds timeout(config.shutdown_timeout_ms);
    std::thread([timeout]() {
        std::this_thread::sleep_for(timeout);
        std::cerr << "[Worker] Shutdown timeout expired, exiting" << std::endl;
        std::_Exit(1);
    }).detach();

    if (!worker.shutdown()) {
        // Job threads are still running; destructors would join them
        std::_Exit(1);
    }
    return 0;
}
