#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <mutex>
#include <string>

/**
 * Process-wide shutdown coordination for the serve command.
 * - SIGINT/SIGTERM/SIGQUIT only set async-signal-safe flags
 * - waitForShutdown() turns those flags into a shutdown request
 * - Other components (a failed HTTP listener) can request shutdown directly
 */
class ShutdownManager
{
public:
    static ShutdownManager &getInstance();

    void installSignalHandlers();

    // Safe from any thread, not from a signal handler
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    // Block until a signal arrives or requestShutdown() is called
    void waitForShutdown(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    void reset() noexcept;

private:
    ShutdownManager() = default;
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    static void handleSignal(int sig) noexcept;

    // Move a pending signal flag into the shutdown state
    void consumePendingSignal() noexcept;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};
