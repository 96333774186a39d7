#pragma once

#include <httplib.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

/**
 * @brief Owns the HTTP server and its listener thread
 *
 * Routes are installed through a callback so the manager knows nothing about
 * the analysis API. If the listener cannot bind, shutdown is requested so the
 * serve command exits instead of hanging.
 */
class HttpServerManager
{
public:
    static HttpServerManager &getInstance();

    using RouteSetupCallback = std::function<void(httplib::Server &)>;
    void setRouteSetupCallback(RouteSetupCallback callback);

    // Payload limit applied to the next start()
    void setMaxPayloadBytes(size_t max_bytes);

    void start(const std::string &host, int port);
    void stop();
    bool isRunning() const;
    bool listenFailed() const { return listen_failed_.load(); }

    std::string getCurrentHost() const;
    int getCurrentPort() const;

private:
    HttpServerManager();
    ~HttpServerManager();
    HttpServerManager(const HttpServerManager &) = delete;
    HttpServerManager &operator=(const HttpServerManager &) = delete;

    void serverThread(std::string host, int port);
    void stopLocked();

    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> listen_failed_{false};

    std::string current_host_;
    int current_port_;
    size_t max_payload_bytes_;

    RouteSetupCallback route_setup_callback_;

    mutable std::mutex server_mutex_;
};
