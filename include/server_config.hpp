#pragma once

#include <string>

class ServerConfig
{
public:
    static constexpr const char *APP_NAME = "invoice_forensics";
    static constexpr const char *VERSION = "1.0.0";
    static constexpr const char *DEFAULT_CONFIG_PATH = "config/config.json";

    static constexpr const char *ANALYZE_PATH = "/api/analyze";
    static constexpr const char *HEALTH_PATH = "/api/health";
    static constexpr const char *CONFIG_PATH = "/api/config";
    static constexpr const char *SWAGGER_JSON_PATH = "/swagger.json";
    static constexpr const char *UPLOAD_FIELD = "file";

    static std::string getServerUrl(const std::string &host, int port)
    {
        const std::string display_host = (host == "0.0.0.0") ? "localhost" : host;
        return "http://" + display_host + ":" + std::to_string(port);
    }
};
