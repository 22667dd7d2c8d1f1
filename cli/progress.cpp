//
// Created by gregorian-rayne on 1/2/26.
//

#include "cova/cli/progress.hpp"
#include "cova/cli/formatter.hpp"

#include <array>
#include <cstdio>
#include <iostream>

#include <unistd.h>
#include <sys/ioctl.h>

namespace cova::cli
{
    namespace {

        constexpr std::array<std::string_view, 10> kFrames = {
            "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"
        };

        constexpr auto kFrameInterval = std::chrono::milliseconds(100);

        void clear_line() {
            std::cerr << "\r" << std::string(terminal_width() - 1, ' ') << "\r";
        }

        // Spinner glyph, a space, the message and " NNNs" must fit on one row.
        std::string fit(const std::string& message, const std::size_t reserved) {
            const auto width = terminal_width();
            if (width <= reserved + 4 || message.size() + reserved < width) {
                return message;
            }
            return message.substr(0, width - reserved - 4) + "...";
        }

    }  // namespace

    bool is_tty() {
        return isatty(fileno(stdout)) != 0;
    }

    std::size_t terminal_width() {
        struct winsize w{};
        if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
            return w.ws_col;
        }
        return 80;
    }

    Spinner::Spinner(const std::string_view message)
        : message_(message)
        , started_(std::chrono::steady_clock::now())
        , is_tty_(isatty(STDERR_FILENO) != 0)
    {
        if (is_tty_) {
            worker_ = std::thread([this] { animate(); });
        } else {
            std::cerr << message_ << "...\n";
        }
    }

    Spinner::~Spinner() {
        stop();
    }

    std::chrono::steady_clock::duration Spinner::elapsed() const {
        return std::chrono::steady_clock::now() - started_;
    }

    void Spinner::success(const std::string_view msg) {
        if (!msg.empty()) {
            finish("✓", msg);
            return;
        }
        finish("✓", "done in " + format_duration(std::chrono::duration_cast<Duration>(elapsed())));
    }

    void Spinner::fail(const std::string_view msg) {
        finish("✗", msg);
    }

    void Spinner::stop() {
        if (halt() && is_tty_) {
            std::lock_guard lock(mutex_);
            clear_line();
            std::cerr << std::flush;
        }
    }

    bool Spinner::halt() {
        const bool first = !stopped_.exchange(true);
        if (worker_.joinable()) {
            worker_.join();
        }
        return first;
    }

    void Spinner::animate() {
        while (!stopped_) {
            render();
            std::this_thread::sleep_for(kFrameInterval);
        }
    }

    void Spinner::render() {
        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(elapsed()).count();

        std::lock_guard lock(mutex_);
        frame_ = (frame_ + 1) % kFrames.size();
        clear_line();
        std::cerr << kFrames[frame_] << " " << fit(message_, 8);
        if (seconds > 0) {
            std::cerr << " " << seconds << "s";
        }
        std::cerr << std::flush;
    }

    void Spinner::finish(const std::string_view mark, const std::string_view msg) {
        if (!halt()) {
            return;
        }

        std::lock_guard lock(mutex_);
        if (is_tty_) {
            clear_line();
            std::cerr << mark << " ";
        }
        std::cerr << message_;
        if (!msg.empty()) {
            std::cerr << ": " << msg;
        }
        std::cerr << "\n" << std::flush;
    }

}  // namespace cova::cli
