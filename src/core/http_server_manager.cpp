#include "core/http_server_manager.hpp"
#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include "server_config.hpp"

HttpServerManager::HttpServerManager()
    : current_host_("0.0.0.0"), current_port_(5000), max_payload_bytes_(16 * 1024 * 1024)
{
}

HttpServerManager::~HttpServerManager()
{
    stop();
}

HttpServerManager &HttpServerManager::getInstance()
{
    static HttpServerManager instance;
    return instance;
}

void HttpServerManager::setRouteSetupCallback(RouteSetupCallback callback)
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    route_setup_callback_ = std::move(callback);
}

void HttpServerManager::setMaxPayloadBytes(size_t max_bytes)
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    max_payload_bytes_ = max_bytes;
}

void HttpServerManager::start(const std::string &host, int port)
{
    std::lock_guard<std::mutex> lock(server_mutex_);

    if (running_.load())
    {
        Logger::warn("HttpServerManager: Server is already running. Stopping current instance first.");
        stopLocked();
    }

    current_host_ = host;
    current_port_ = port;
    listen_failed_.store(false);

    server_ = std::make_unique<httplib::Server>();
    server_->set_payload_max_length(max_payload_bytes_);
    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep)
                                   {
        std::string message = "Internal server error";
        try
        {
            if (ep)
                std::rethrow_exception(ep);
        }
        catch (const std::exception &e)
        {
            message = e.what();
        }
        catch (...)
        {
            message = "Unknown error";
        }
        Logger::error("HttpServerManager: unhandled error on " + req.path + ": " + message);
        res.status = 500;
        res.set_content(R"({"error": "Internal server error"})", "application/json"); });

    if (route_setup_callback_)
    {
        route_setup_callback_(*server_);
    }
    else
    {
        Logger::warn("HttpServerManager: No route setup callback registered");
    }

    running_.store(true);
    server_thread_ = std::thread(&HttpServerManager::serverThread, this, host, port);

    Logger::info("HttpServerManager: Server starting on " + ServerConfig::getServerUrl(host, port));
}

void HttpServerManager::stop()
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    stopLocked();
}

void HttpServerManager::stopLocked()
{
    if (server_)
    {
        server_->stop();
    }

    if (server_thread_.joinable())
    {
        server_thread_.join();
    }

    if (server_)
    {
        server_.reset();
        Logger::info("HttpServerManager: Server stopped");
    }
    running_.store(false);
}

bool HttpServerManager::isRunning() const
{
    return running_.load();
}

std::string HttpServerManager::getCurrentHost() const
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    return current_host_;
}

int HttpServerManager::getCurrentPort() const
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    return current_port_;
}

void HttpServerManager::serverThread(std::string host, int port)
{
    try
    {
        Logger::info("API documentation available at: " + ServerConfig::getServerUrl(host, port) +
                     ServerConfig::SWAGGER_JSON_PATH);

        if (!server_->listen(host, port))
        {
            Logger::error("HttpServerManager: Failed to start server on " + host + ":" + std::to_string(port));
            listen_failed_.store(true);
            running_.store(false);
            ShutdownManager::getInstance().requestShutdown("HTTP server could not listen on port " + std::to_string(port));
            return;
        }

        Logger::info("HttpServerManager: Server thread completed");
    }
    catch (const std::exception &e)
    {
        Logger::error("HttpServerManager: Server thread error: " + std::string(e.what()));
        listen_failed_.store(true);
        running_.store(false);
        ShutdownManager::getInstance().requestShutdown("HTTP server thread failed");
    }
    running_.store(false);
}
