//
// Created by gregorian-rayne on 1/2/26.
//

#ifndef COVA_PROGRESS_HPP
#define COVA_PROGRESS_HPP

/**
 * @file progress.hpp
 * @brief Terminal progress indicators.
 *
 * The spinner animates from a background thread while a long operation
 * (a whole test run) blocks the caller, showing the seconds elapsed so far.
 * Output goes to stderr so JSON on stdout stays clean. On non-terminals
 * only the start and end lines are printed.
 */

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace cova::cli
{
    bool is_tty();

    std::size_t terminal_width();

    class Spinner {
    public:
        explicit Spinner(std::string_view message);
        ~Spinner();

        Spinner(const Spinner&) = delete;
        Spinner& operator=(const Spinner&) = delete;

        /**
         * Ends with a check mark. Without a message the line reports how
         * long the operation took.
         */
        void success(std::string_view msg = {});
        void fail(std::string_view msg = "Failed");

        /**
         * Stops and clears the line without a final message.
         */
        void stop();

        [[nodiscard]] std::chrono::steady_clock::duration elapsed() const;

    private:
        void animate();
        void render();
        void finish(std::string_view mark, std::string_view msg);
        bool halt();

        std::mutex mutex_;
        std::string message_;
        std::chrono::steady_clock::time_point started_;
        std::size_t frame_ = 0;
        std::atomic<bool> stopped_{false};
        bool is_tty_ = true;
        std::thread worker_;
    };

}  // namespace cova::cli

#endif //COVA_PROGRESS_HPP
