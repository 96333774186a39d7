#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <cstring>

volatile sig_atomic_t ShutdownManager::signal_flag_ = 0;
volatile sig_atomic_t ShutdownManager::signal_num_ = 0;

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

void ShutdownManager::installSignalHandlers()
{
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = &ShutdownManager::handleSignal;
    sigemptyset(&action.sa_mask);

    for (int sig : {SIGINT, SIGTERM, SIGQUIT})
    {
        if (sigaction(sig, &action, nullptr) != 0)
        {
            Logger::warn("ShutdownManager: could not install handler for signal " + std::to_string(sig) +
                         ": " + std::strerror(errno));
        }
    }
    Logger::debug("ShutdownManager: signal handlers installed");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    signal_num_ = sig;
    signal_flag_ = 1;
}

void ShutdownManager::consumePendingSignal() noexcept
{
    if (signal_flag_)
    {
        const int sig = signal_num_;
        signal_flag_ = 0;
        requestShutdown("Signal received", sig);
    }
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (shutdown_requested_.load())
            return;
        reason_ = reason;
        last_signal_.store(signal_number);
        shutdown_requested_.store(true);
    }
    cv_.notify_all();

    if (signal_number != 0)
        Logger::info("ShutdownManager: received signal " + std::to_string(signal_number) + ", shutting down");
    else
        Logger::info("ShutdownManager: shutdown requested - " + reason);
}

void ShutdownManager::waitForShutdown(std::chrono::milliseconds poll_interval)
{
    std::unique_lock<std::mutex> lk(mutex_);
    while (!shutdown_requested_.load())
    {
        cv_.wait_for(lk, poll_interval, [this]
                     { return shutdown_requested_.load() || signal_flag_ != 0; });
        if (signal_flag_ && !shutdown_requested_.load())
        {
            lk.unlock();
            consumePendingSignal();
            lk.lock();
        }
    }
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    std::lock_guard<std::mutex> lk(mutex_);
    shutdown_requested_.store(false);
    last_signal_.store(0);
    signal_flag_ = 0;
    signal_num_ = 0;
    reason_.clear();
}
