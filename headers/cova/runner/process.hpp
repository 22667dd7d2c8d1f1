//
// Created by gregorian-rayne on 1/9/26.
//

#ifndef COVA_PROCESS_HPP
#define COVA_PROCESS_HPP

/**
 * @file process.hpp
 * @brief External process execution with timeout and cancellation.
 *
 * Each child runs in its own process group. On timeout or cancellation the
 * whole group receives SIGTERM, then SIGKILL after a grace period, so test
 * hosts spawned by the test tool do not outlive the run.
 */

#include "cova/types.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cova::runner {

    /**
     * Shared cancellation flag.
     *
     * Copies observe the same flag, so one token handed to every worker
     * cancels all of them at once.
     */
    class CancellationToken {
    public:
        CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

        void cancel() const noexcept {
            flag_->store(true, std::memory_order_release);
        }

        [[nodiscard]] bool is_cancelled() const noexcept {
            return flag_->load(std::memory_order_acquire);
        }

    private:
        std::shared_ptr<std::atomic<bool>> flag_;
    };

    /**
     * What to run. argv[0] is searched on PATH when it has no slash.
     */
    struct ProcessSpec {
        std::vector<std::string> argv;
        fs::path working_dir;
        std::vector<std::pair<std::string, std::string>> environment;
        std::chrono::milliseconds kill_grace{2000};
    };

    enum class ProcessOutcome {
        Exited,
        Signaled,
        TimedOut,
        Cancelled,
        LaunchFailed
    };

    inline const char* to_string(ProcessOutcome outcome) noexcept {
        switch (outcome) {
            case ProcessOutcome::Exited:       return "Exited";
            case ProcessOutcome::Signaled:     return "Signaled";
            case ProcessOutcome::TimedOut:     return "TimedOut";
            case ProcessOutcome::Cancelled:    return "Cancelled";
            case ProcessOutcome::LaunchFailed: return "LaunchFailed";
        }
        return "LaunchFailed";
    }

    struct ProcessResult {
        ProcessOutcome outcome = ProcessOutcome::LaunchFailed;
        /// Exit status for Exited, signal number for Signaled, -1 otherwise.
        int exit_code = -1;
        std::vector<std::string> stdout_lines;
        std::vector<std::string> stderr_lines;
        /// Both streams interleaved in the order chunks were read.
        std::vector<std::string> output_lines;
        Duration elapsed = Duration::zero();
        std::string launch_error;

        [[nodiscard]] bool exited_cleanly() const noexcept {
            return outcome == ProcessOutcome::Exited && exit_code == 0;
        }
    };

    /**
     * Resolves @p name against PATH. Names containing '/' are checked as-is.
     *
     * @return Absolute path of an executable file, or empty if none found.
     */
    [[nodiscard]] fs::path find_executable(const std::string& name);

    /**
     * Runs a process to completion, timeout or cancellation.
     *
     * Never throws for process-level failures; they are reported through
     * ProcessResult::outcome. No locks are held while waiting.
     */
    [[nodiscard]] ProcessResult run_process(
        const ProcessSpec& spec,
        Duration timeout,
        const CancellationToken& cancel = CancellationToken{}
    );

}  // namespace cova::runner

#endif //COVA_PROCESS_HPP
