//
// Created by gregorian-rayne on 1/9/26.
//

#include "cova/runner/process.hpp"
#include "cova/utils/string_utils.hpp"

#include <redlog.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace cova::runner {

    namespace {

        redlog::logger log_ = redlog::get_logger("cova.process");

        constexpr int kStageChdir = 1;
        constexpr int kStageExec = 2;

        /**
         * Reported by the child through a close-on-exec pipe when it fails
         * before execve() replaces it.
         */
        struct ChildFailure {
            int stage = 0;
            int error = 0;
        };

        /**
         * Splits streamed chunks into lines for one stream while also
         * appending them to the combined transcript.
         */
        class LineCollector {
        public:
            LineCollector(std::vector<std::string>& stream, std::vector<std::string>& combined)
                : stream_(stream), combined_(combined) {}

            void append(const char* data, const std::size_t size) {
                partial_.append(data, size);
                std::size_t start = 0;
                std::size_t newline;
                while ((newline = partial_.find('\n', start)) != std::string::npos) {
                    push(partial_.substr(start, newline - start));
                    start = newline + 1;
                }
                partial_.erase(0, start);
            }

            void finish() {
                if (!partial_.empty()) {
                    push(std::move(partial_));
                    partial_.clear();
                }
            }

        private:
            void push(std::string line) {
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                stream_.push_back(line);
                combined_.push_back(std::move(line));
            }

            std::vector<std::string>& stream_;
            std::vector<std::string>& combined_;
            std::string partial_;
        };

        bool make_pipe(int fds[2]) {
#if defined(__linux__)
            return pipe2(fds, O_CLOEXEC) == 0;
#else
            if (pipe(fds) != 0) {
                return false;
            }
            fcntl(fds[0], F_SETFD, FD_CLOEXEC);
            fcntl(fds[1], F_SETFD, FD_CLOEXEC);
            return true;
#endif
        }

        void close_pipe(int fds[2]) {
            if (fds[0] >= 0) close(fds[0]);
            if (fds[1] >= 0) close(fds[1]);
            fds[0] = fds[1] = -1;
        }

        void drain(const int fd, LineCollector& collector) {
            char buffer[4096];
            ssize_t n;
            while ((n = read(fd, buffer, sizeof(buffer))) > 0) {
                collector.append(buffer, static_cast<std::size_t>(n));
            }
        }

        bool is_executable_file(const fs::path& path) {
            std::error_code ec;
            return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
        }

        std::vector<std::string> build_environment(
            const std::vector<std::pair<std::string, std::string>>& overrides
        ) {
            std::vector<std::string> env;
            for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
                std::string item(*entry);
                const std::string key = item.substr(0, item.find('='));
                const bool overridden = std::ranges::any_of(overrides, [&key](const auto& kv) {
                    return kv.first == key;
                });
                if (!overridden) {
                    env.push_back(std::move(item));
                }
            }
            for (const auto& [key, value] : overrides) {
                env.push_back(key + "=" + value);
            }
            return env;
        }

        std::vector<char*> to_c_array(std::vector<std::string>& strings) {
            std::vector<char*> result;
            result.reserve(strings.size() + 1);
            for (auto& s : strings) {
                result.push_back(s.data());
            }
            result.push_back(nullptr);
            return result;
        }

        /**
         * SIGTERM to the group, then SIGKILL once the grace period runs
         * out or the leader exits. Always reaps the leader.
         */
        void terminate_group(const pid_t pid, const std::chrono::milliseconds grace, int& status) {
            kill(-pid, SIGTERM);

            const auto deadline = std::chrono::steady_clock::now() + grace;
            while (std::chrono::steady_clock::now() < deadline) {
                if (waitpid(pid, &status, WNOHANG) == pid) {
                    kill(-pid, SIGKILL);
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }

            kill(-pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        }

        [[noreturn]] void child_fail(const int error_fd, const int stage) {
            const ChildFailure failure{stage, errno};
            [[maybe_unused]] const auto written = write(error_fd, &failure, sizeof(failure));
            _exit(127);
        }

    }  // namespace

    fs::path find_executable(const std::string& name) {
        if (name.empty()) {
            return {};
        }

        if (name.find('/') != std::string::npos) {
            if (is_executable_file(name)) {
                std::error_code ec;
                auto absolute = fs::absolute(name, ec);
                return ec ? fs::path(name) : absolute;
            }
            return {};
        }

        const char* path_env = std::getenv("PATH");
        if (path_env == nullptr) {
            return {};
        }

        for (const auto dir : string_utils::split(path_env, ':')) {
            const fs::path candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / name;
            if (is_executable_file(candidate)) {
                return candidate;
            }
        }
        return {};
    }

    ProcessResult run_process(
        const ProcessSpec& spec,
        const Duration timeout,
        const CancellationToken& cancel
    ) {
        ProcessResult result;
        const auto start_time = std::chrono::steady_clock::now();

        if (spec.argv.empty()) {
            result.launch_error = "No command given";
            return result;
        }

        const fs::path executable = find_executable(spec.argv.front());
        if (executable.empty()) {
            result.launch_error = "Executable not found: " + spec.argv.front();
            log_.wrn("executable not found", redlog::field("name", spec.argv.front()));
            return result;
        }

        if (cancel.is_cancelled()) {
            result.outcome = ProcessOutcome::Cancelled;
            return result;
        }

        // Everything the child touches is prepared before fork().
        std::vector<std::string> argv_storage = spec.argv;
        std::vector<std::string> env_storage = build_environment(spec.environment);
        std::vector<char*> argv = to_c_array(argv_storage);
        std::vector<char*> envp = to_c_array(env_storage);
        const std::string exe_path = executable.string();
        const std::string working_dir = spec.working_dir.string();

        int stdout_pipe[2] = {-1, -1};
        int stderr_pipe[2] = {-1, -1};
        int error_pipe[2] = {-1, -1};

        if (!make_pipe(stdout_pipe) || !make_pipe(stderr_pipe) || !make_pipe(error_pipe)) {
            result.launch_error = std::string("Failed to create pipes: ") + std::strerror(errno);
            close_pipe(stdout_pipe);
            close_pipe(stderr_pipe);
            close_pipe(error_pipe);
            return result;
        }

        const pid_t pid = fork();
        if (pid < 0) {
            result.launch_error = std::string("fork() failed: ") + std::strerror(errno);
            close_pipe(stdout_pipe);
            close_pipe(stderr_pipe);
            close_pipe(error_pipe);
            return result;
        }

        if (pid == 0) {
            // Child: async-signal-safe calls only.
            setpgid(0, 0);

            dup2(stdout_pipe[1], STDOUT_FILENO);
            dup2(stderr_pipe[1], STDERR_FILENO);
            if (const int null_fd = open("/dev/null", O_RDONLY); null_fd >= 0) {
                dup2(null_fd, STDIN_FILENO);
                close(null_fd);
            }

            if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
                child_fail(error_pipe[1], kStageChdir);
            }

            execve(exe_path.c_str(), argv.data(), envp.data());
            child_fail(error_pipe[1], kStageExec);
        }

        setpgid(pid, pid);

        close(stdout_pipe[1]);
        close(stderr_pipe[1]);
        close(error_pipe[1]);

        ChildFailure failure;
        ssize_t failure_bytes;
        while ((failure_bytes = read(error_pipe[0], &failure, sizeof(failure))) < 0 && errno == EINTR) {}
        close(error_pipe[0]);

        int status = 0;

        if (failure_bytes == static_cast<ssize_t>(sizeof(failure))) {
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            result.launch_error = failure.stage == kStageChdir
                ? "Cannot enter working directory '" + working_dir + "': " + std::strerror(failure.error)
                : "Failed to launch '" + spec.argv.front() + "': " + std::strerror(failure.error);
            result.elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start_time);
            log_.wrn("process launch failed", redlog::field("command", spec.argv.front()),
                     redlog::field("error", result.launch_error));
            return result;
        }

        fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
        fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

        LineCollector out(result.stdout_lines, result.output_lines);
        LineCollector err(result.stderr_lines, result.output_lines);

        log_.dbg("process started", redlog::field("pid", static_cast<int>(pid)),
                 redlog::field("command", spec.argv.front()), redlog::field("cwd", working_dir));

        const bool bounded = timeout > Duration::zero();
        const auto timeout_point = start_time + timeout;

        while (true) {
            drain(stdout_pipe[0], out);
            drain(stderr_pipe[0], err);

            const pid_t wpid = waitpid(pid, &status, WNOHANG);
            if (wpid == pid) {
                if (WIFEXITED(status)) {
                    result.outcome = ProcessOutcome::Exited;
                    result.exit_code = WEXITSTATUS(status);
                } else if (WIFSIGNALED(status)) {
                    result.outcome = ProcessOutcome::Signaled;
                    result.exit_code = WTERMSIG(status);
                }
                break;
            }
            if (wpid < 0 && errno != EINTR) {
                result.launch_error = std::string("waitpid() failed: ") + std::strerror(errno);
                kill(-pid, SIGKILL);
                break;
            }

            if (cancel.is_cancelled()) {
                log_.inf("cancelling process", redlog::field("pid", static_cast<int>(pid)));
                terminate_group(pid, spec.kill_grace, status);
                result.outcome = ProcessOutcome::Cancelled;
                break;
            }

            if (bounded && std::chrono::steady_clock::now() >= timeout_point) {
                log_.wrn("process timed out", redlog::field("pid", static_cast<int>(pid)),
                         redlog::field("command", spec.argv.front()));
                terminate_group(pid, spec.kill_grace, status);
                result.outcome = ProcessOutcome::TimedOut;
                break;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        drain(stdout_pipe[0], out);
        drain(stderr_pipe[0], err);
        out.finish();
        err.finish();

        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        result.elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start_time);

        log_.dbg("process finished", redlog::field("outcome", to_string(result.outcome)),
                 redlog::field("exit_code", result.exit_code),
                 redlog::field("lines", result.output_lines.size()));

        return result;
    }

}  // namespace cova::runner
