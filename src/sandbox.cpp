#include "sandbox.h"
#include "active_sandboxes.h"
#include "container_runtime.h"
#include "errors.h"
#include "output_capture.h"
#include "submission.h"
#include "tar_archive.h"
#include <json/json.h>
#include <signal.h>
#include <algorithm>
#include <cctype>
#include <atomic>
#include <condition_variable>
#include <ctime>
#include <functional>
#include <future>
#include <iostream>
#include <mutex>
#include <thread>

namespace contestrun {

namespace {

// Thread that is stopped and joined when it leaves scope, so an exception
// on the driver's main path never leaves a running reader behind
class ScopedThread {
public:
    ScopedThread(std::function<void()> body, std::function<void()> stop)
        : stop_(std::move(stop)), thread_(std::move(body)) {}

    ~ScopedThread() { join(); }

    ScopedThread(const ScopedThread&) = delete;
    ScopedThread& operator=(const ScopedThread&) = delete;

    void join() {
        if (thread_.joinable()) {
            stop_();
            thread_.join();
        }
    }

private:
    std::function<void()> stop_;
    std::thread thread_;
};

std::string short_id(const std::string& container_id) {
    return container_id.substr(0, 12);
}

// Docker names allow [a-zA-Z0-9_.-]
std::string name_fragment(const std::string& submission_id) {
    std::string fragment;
    for (char c : submission_id) {
        bool allowed = std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
        fragment += allowed ? c : '_';
        if (fragment.size() >= 48) {
            break;
        }
    }
    return fragment.empty() ? "job" : fragment;
}

// Inline seccomp profile: everything a compiler toolchain and language
// runtime needs, nothing that reconfigures the kernel or other processes
const std::string& seccomp_profile() {
    static const std::string profile = []() {
        static const char* const allowed[] = {
            "read", "write", "readv", "writev", "pread64", "pwrite64", "preadv", "pwritev",
            "open", "openat", "close", "close_range", "creat",
            "stat", "fstat", "lstat", "newfstatat", "statx", "statfs", "fstatfs",
            "lseek", "access", "faccessat", "faccessat2", "readlink", "readlinkat",
            "getdents", "getdents64", "getcwd", "chdir", "fchdir",
            "mkdir", "mkdirat", "rmdir", "unlink", "unlinkat", "rename", "renameat", "renameat2",
            "link", "linkat", "symlink", "symlinkat", "chmod", "fchmod", "fchmodat", "umask",
            "utimensat", "ftruncate", "fsync", "fdatasync", "flock", "fadvise64",
            "mmap", "munmap", "mprotect", "mremap", "madvise", "brk", "mlock", "munlock",
            "memfd_create", "membarrier", "rseq",
            "rt_sigaction", "rt_sigprocmask", "rt_sigreturn", "rt_sigsuspend", "sigaltstack",
            "kill", "tgkill", "tkill",
            "clone", "clone3", "fork", "vfork", "execve", "execveat",
            "wait4", "waitid", "exit", "exit_group",
            "futex", "set_robust_list", "get_robust_list", "set_tid_address",
            "sched_yield", "sched_getaffinity", "sched_getparam", "sched_getscheduler",
            "nanosleep", "clock_nanosleep", "clock_gettime", "clock_getres", "gettimeofday", "time",
            "getpid", "getppid", "gettid", "getpgrp", "getpgid", "setpgid", "getsid",
            "getuid", "geteuid", "getgid", "getegid", "getgroups", "getresuid", "getresgid",
            "getrlimit", "prlimit64", "getrusage", "sysinfo", "uname", "arch_prctl", "prctl",
            "capget", "capset", "getrandom", "ioctl", "fcntl", "personality", "restart_syscall",
            "setuid", "setgid", "setresuid", "setresgid", "setgroups", "setrlimit",
            "getpriority", "setpriority", "sched_setaffinity", "sched_get_priority_max",
            "sched_get_priority_min", "getitimer", "setitimer", "alarm", "pause",
            "rt_sigpending", "rt_sigtimedwait", "rt_sigqueueinfo", "mincore", "msync",
            "getxattr", "lgetxattr", "fgetxattr", "listxattr", "sendfile", "copy_file_range",
            "chown", "fchown", "fchownat", "lchown", "inotify_init1", "inotify_add_watch",
            "inotify_rm_watch", "pidfd_open",
            // 32-bit variants
            "mmap2", "_llseek", "fstat64", "stat64", "lstat64", "fstatat64", "fcntl64",
            "ugetrlimit", "set_thread_area", "get_thread_area", "socketcall",
            "pipe", "pipe2", "dup", "dup2", "dup3",
            "poll", "ppoll", "select", "pselect6",
            "epoll_create", "epoll_create1", "epoll_ctl", "epoll_wait", "epoll_pwait",
            "eventfd", "eventfd2", "timerfd_create", "timerfd_settime", "timerfd_gettime",
            // Socket calls stay allowed; network isolation comes from NetworkMode
            // so connection attempts fail as unreachable instead of EPERM
            "socket", "socketpair", "connect", "bind", "listen", "accept", "accept4",
            "getsockname", "getpeername", "getsockopt", "setsockopt",
            "sendto", "recvfrom", "sendmsg", "recvmsg", "shutdown"
        };

        Json::Value root(Json::objectValue);
        root["defaultAction"] = "SCMP_ACT_ERRNO";
        Json::Value arches(Json::arrayValue);
        arches.append("SCMP_ARCH_X86_64");
        arches.append("SCMP_ARCH_X86");
        arches.append("SCMP_ARCH_AARCH64");
        root["architectures"] = arches;

        Json::Value rule(Json::objectValue);
        for (const char* name : allowed) {
            rule["names"].append(name);
        }
        rule["action"] = "SCMP_ACT_ALLOW";
        root["syscalls"].append(rule);

        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        return Json::writeString(builder, root);
    }();
    return profile;
}

} // namespace

SandboxHandle::SandboxHandle(ContainerRuntime& runtime, ActiveSandboxes& active,
                             std::string container_id, std::string submission_id)
    : runtime_(runtime), active_(active),
      container_id_(std::move(container_id)), submission_id_(std::move(submission_id)) {
    active_.add(container_id_, submission_id_);
}

SandboxHandle::~SandboxHandle() {
    destroy();
}

bool SandboxHandle::destroy() {
    if (destroyed_) {
        return true;
    }

    try {
        runtime_.kill(container_id_);
    } catch (const std::exception& e) {
        // Removal below is forced, so a failed kill is not fatal
        std::cerr << "[Sandbox] Kill failed for " << short_id(container_id_)
                  << " (submission " << submission_id_ << "): " << e.what() << std::endl;
    }

    try {
        runtime_.remove(container_id_);
    } catch (const std::exception& e) {
        std::cerr << "[Sandbox] Remove failed for " << short_id(container_id_)
                  << " (submission " << submission_id_ << "), left for shutdown sweep: "
                  << e.what() << std::endl;
        return false;
    }

    active_.remove(container_id_);
    active_.take_reclaimed(container_id_);
    destroyed_ = true;
    return true;
}

class SandboxDriver::Impl {
public:
    ContainerRuntime& runtime_;
    ActiveSandboxes& active_;
    std::string worker_id_;
    std::atomic<uint64_t> sequence_{0};

    Impl(ContainerRuntime& runtime, ActiveSandboxes& active, std::string worker_id)
        : runtime_(runtime), active_(active), worker_id_(std::move(worker_id)) {}

    ContainerSpec build_spec(const SubmissionJob& job,
                             const LanguageProfile& profile,
                             const SandboxLimits& limits) {
        ContainerSpec spec;
        spec.name = "contestrun-" + name_fragment(job.submission_id) + "-" +
                    std::to_string(++sequence_);
        spec.image = profile.image;
        spec.command = profile.command;
        spec.working_dir = "/workspace";
        spec.workspace_volume = "/workspace";

        // Fixed locale, timezone and hash seed: identical input, identical output
        spec.env = {
            "LANG=C.UTF-8",
            "LC_ALL=C.UTF-8",
            "TZ=UTC",
            "PYTHONDONTWRITEBYTECODE=1",
            "PYTHONHASHSEED=0",
            "NODE_ENV=production",
            "HOME=/tmp",
            "GOCACHE=/tmp/go-cache"
        };

        spec.labels["contestrun.worker"] = worker_id_;
        spec.labels["contestrun.submission"] = job.submission_id;

        spec.memory_bytes = limits.memory_limit_bytes;
        spec.nano_cpus = NANO_CPUS_PER_JOB;
        spec.pids_limit = limits.pids_limit;
        spec.network_disabled = !limits.network_enabled;
        spec.readonly_rootfs = true;
        spec.tmpfs["/tmp"] = "rw,noexec,nosuid,size=" + std::to_string(TMPFS_SIZE_MB) + "m";
        spec.security_opts = {
            "no-new-privileges:true",
            "seccomp=" + seccomp_profile()
        };
        spec.max_open_files = MAX_OPEN_FILES;
        spec.max_file_size_bytes = MAX_FILE_SIZE_BYTES;
        spec.log_max_size = "1m";
        return spec;
    }

    RawExecutionOutcome execute(const SubmissionJob& job,
                                const LanguageProfile& profile,
                                const SandboxLimits& limits) {
        ContainerSpec spec = build_spec(job, profile, limits);
        std::string archive = make_single_file_tar(profile.file_name, job.source, 0644,
                                                   std::time(nullptr));

        std::string container_id = runtime_.create(spec);
        SandboxHandle handle(runtime_, active_, container_id, job.submission_id);
        std::cout << "[Sandbox] Provisioned " << short_id(container_id)
                  << " (" << spec.image << ") for submission " << job.submission_id << std::endl;

        runtime_.put_archive(container_id, spec.workspace_volume, archive);

        OutputCapture capture(MAX_OUTPUT_BYTES);
        std::atomic<bool> cancel_logs{false};
        std::string capture_error;          // Reader thread only, read after join

        std::mutex state_mutex;
        std::condition_variable state_cv;
        bool finished = false;
        std::atomic<bool> killed_by_deadline{false};
        uint64_t peak_memory = 0;           // Monitor thread only, read after join

        runtime_.start(container_id);
        auto started = std::chrono::steady_clock::now();
        auto deadline = started + std::chrono::milliseconds(limits.time_limit_ms);

        std::promise<void> logs_done;
        std::future<void> logs_future = logs_done.get_future();
        ScopedThread reader(
            [&]() {
                try {
                    runtime_.stream_logs(container_id, capture, cancel_logs);
                } catch (const std::exception& e) {
                    capture_error = e.what();
                }
                logs_done.set_value();
            },
            [&]() { cancel_logs = true; });

        // Enforces the declared time limit and samples peak memory
        ScopedThread monitor(
            [&]() {
                bool sampling = true;
                std::unique_lock<std::mutex> lock(state_mutex);
                while (!finished) {
                    auto now = std::chrono::steady_clock::now();
                    if (!killed_by_deadline && now >= deadline) {
                        killed_by_deadline = true;
                        lock.unlock();
                        try {
                            runtime_.kill(container_id);
                            std::cout << "[Sandbox] Submission " << job.submission_id
                                      << " killed at time limit (" << limits.time_limit_ms
                                      << "ms)" << std::endl;
                        } catch (const std::exception& e) {
                            std::cerr << "[Sandbox] Kill at time limit failed for submission "
                                      << job.submission_id << ": " << e.what() << std::endl;
                        }
                        lock.lock();
                        continue;
                    }

                    lock.unlock();
                    if (sampling) {
                        try {
                            peak_memory = std::max(peak_memory, runtime_.memory_usage(container_id));
                        } catch (const std::exception& e) {
                            sampling = false;
                            std::cerr << "[Sandbox] Memory sampling stopped for submission "
                                      << job.submission_id << ": " << e.what() << std::endl;
                        }
                    }
                    lock.lock();

                    auto wake = now + std::chrono::milliseconds(MEMORY_SAMPLE_INTERVAL_MS);
                    if (!killed_by_deadline) {
                        wake = std::min(wake, deadline);
                    }
                    state_cv.wait_until(lock, wake, [&]() { return finished; });
                }
            },
            [&]() {
                {
                    std::lock_guard<std::mutex> lock(state_mutex);
                    finished = true;
                }
                state_cv.notify_all();
            });

        // Backstop: the in-sandbox kill may fail or hang, the wait may not
        auto backstop = std::chrono::milliseconds(limits.time_limit_ms + limits.grace_period_ms);
        std::optional<int> status = runtime_.wait(container_id, backstop);
        auto elapsed = std::chrono::steady_clock::now() - started;
        monitor.join();

        if (!status) {
            killed_by_deadline = true;
            std::cerr << "[Sandbox] Submission " << job.submission_id
                      << " still running at grace deadline, forcing kill" << std::endl;
            try {
                runtime_.kill(container_id);
            } catch (const std::exception& e) {
                std::cerr << "[Sandbox] Forced kill failed for submission " << job.submission_id
                          << ": " << e.what() << std::endl;
            }
        }

        if (logs_future.wait_for(std::chrono::milliseconds(LOG_DRAIN_TIMEOUT_MS)) !=
            std::future_status::ready) {
            std::cerr << "[Sandbox] Log stream for submission " << job.submission_id
                      << " did not close, cancelling" << std::endl;
        }
        reader.join();

        if (active_.take_reclaimed(container_id)) {
            throw SandboxError("sandbox reclaimed by worker shutdown");
        }

        RawExecutionOutcome outcome;
        outcome.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed);
        outcome.killed_by_deadline = killed_by_deadline;
        if (status) {
            outcome.exit_code = *status;
            outcome.oom_killed = runtime_.inspect(container_id).oom_killed;
        } else {
            outcome.exit_code = 128 + SIGKILL;
        }

        if (!capture_error.empty()) {
            throw SandboxError("output capture failed: " + capture_error);
        }

        // Replacement characters can grow the text, so the ceiling applies again
        std::string raw_stdout = capture.stdout_buffer().str();
        std::string raw_stderr = capture.stderr_buffer().str();
        outcome.stdout_output = sanitize_and_truncate_utf8(raw_stdout, MAX_OUTPUT_BYTES);
        outcome.stderr_output = sanitize_and_truncate_utf8(raw_stderr, MAX_OUTPUT_BYTES);
        outcome.stdout_truncated = capture.stdout_buffer().truncated() ||
                                   outcome.stdout_output.size() < sanitize_utf8(raw_stdout).size();
        outcome.stderr_truncated = capture.stderr_buffer().truncated() ||
                                   outcome.stderr_output.size() < sanitize_utf8(raw_stderr).size();
        outcome.peak_memory_bytes = peak_memory;
        if (outcome.oom_killed) {
            outcome.peak_memory_bytes = std::max<uint64_t>(peak_memory, limits.memory_limit_bytes);
        }

        handle.destroy();

        std::cout << "[Sandbox] Submission " << job.submission_id << " exited " << outcome.exit_code
                  << " after " << outcome.wall_time.count() << "ms, peak "
                  << outcome.peak_memory_bytes / (1024 * 1024) << "MB, stderr "
                  << outcome.stderr_output.size() << " bytes" << std::endl;
        return outcome;
    }
};

SandboxDriver::SandboxDriver(ContainerRuntime& runtime, ActiveSandboxes& active, std::string worker_id)
    : impl(std::make_unique<Impl>(runtime, active, std::move(worker_id))) {}

SandboxDriver::~SandboxDriver() = default;

RawExecutionOutcome SandboxDriver::execute(const SubmissionJob& job,
                                           const LanguageProfile& profile,
                                           const SandboxLimits& limits) {
    return impl->execute(job, profile, limits);
}

ContainerSpec SandboxDriver::build_spec(const SubmissionJob& job,
                                        const LanguageProfile& profile,
                                        const SandboxLimits& limits) {
    return impl->build_spec(job, profile, limits);
}

} // namespace contestrun
