#pragma once

#include "core/config_manager.hpp"
#include "core/file_utils.hpp"
#include "core/fraud_scorer.hpp"
#include "core/invoice_loader.hpp"
#include "core/report_serializer.hpp"
#include "logging/logger.hpp"
#include "server_config.hpp"
#include "web/openapi_docs.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using json = nlohmann::json;

class RouteHandlers
{
public:
    /**
     * @brief Install the analysis API on a server
     * @param scorer Scorer shared by every request
     * @param results_directory Directory holding ELA visualizations
     * @param public_results_prefix URL prefix the visualizations are served under (empty: not served)
     */
    static void setupRoutes(httplib::Server &svr, std::shared_ptr<const FraudScorer> scorer,
                            const std::string &results_directory, const std::string &public_results_prefix,
                            const std::string &host, int port)
    {
        svr.Post(ServerConfig::ANALYZE_PATH, [scorer](const httplib::Request &req, httplib::Response &res)
                 { handleAnalyze(req, res, *scorer); });

        svr.Get(ServerConfig::HEALTH_PATH, [scorer](const httplib::Request &req, httplib::Response &res)
                { handleHealth(req, res, *scorer); });

        svr.Get(ServerConfig::CONFIG_PATH, [](const httplib::Request &req, httplib::Response &res)
                { handleGetConfig(req, res); });

        svr.Options(R"(/api/.*)", [](const httplib::Request &, httplib::Response &res)
                    {
            addCorsHeaders(res);
            res.status = 204; });

        svr.Get(ServerConfig::SWAGGER_JSON_PATH, [host, port](const httplib::Request &, httplib::Response &res)
                { res.set_content(OpenApiDocs::getSpec(host, port), "application/json"); });

        if (!public_results_prefix.empty())
        {
            FileUtils::ensureDirectory(results_directory);
            std::string mount = public_results_prefix;
            while (mount.size() > 1 && mount.back() == '/')
                mount.pop_back();
            if (!svr.set_mount_point(mount, results_directory))
            {
                Logger::error("Could not serve " + results_directory + " under " + mount);
            }
            else
            {
                Logger::info("Serving ELA visualizations from " + results_directory + " at " + mount);
            }
        }
    }

    static bool isAllowedUpload(const std::string &filename)
    {
        static const std::vector<std::string> allowed = {"jpg", "jpeg", "png", "pdf"};
        const std::string ext = FileUtils::getFileExtension(filename);
        return std::find(allowed.begin(), allowed.end(), ext) != allowed.end();
    }

    // Body of GET /api/config: the configuration the server was started with
    static json configDocument()
    {
        return json{{"status", "success"}, {"config", ConfigManager::getInstance().getAll()}};
    }

private:
    static void addCorsHeaders(httplib::Response &res)
    {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    }

    static void sendError(httplib::Response &res, int status, const std::string &message)
    {
        res.status = status;
        res.set_content(ReportSerializer::dump(json{{"error", message}}), "application/json");
    }

    static void handleAnalyze(const httplib::Request &req, httplib::Response &res, const FraudScorer &scorer)
    {
        Logger::trace("Received analyze request");
        addCorsHeaders(res);

        if (!req.has_file(ServerConfig::UPLOAD_FIELD))
        {
            sendError(res, 400, "Missing file field 'file'.");
            return;
        }

        const auto upload = req.get_file_value(ServerConfig::UPLOAD_FIELD);
        if (!isAllowedUpload(upload.filename))
        {
            sendError(res, 400, "Invalid file type. Allowed: jpg, jpeg, png, pdf.");
            return;
        }

        try
        {
            Logger::info("Analyzing upload " + upload.filename + " (" + std::to_string(upload.content.size()) + " bytes)");
            const std::vector<uint8_t> data(upload.content.begin(), upload.content.end());
            const InvoiceImage invoice = InvoiceLoader::loadFromMemory(data, upload.filename, scorer.options().pdf_dpi);
            const FraudReport report = scorer.analyzeImage(invoice);
            res.set_content(ReportSerializer::dump(ReportSerializer::toJson(report)), "application/json");
        }
        catch (const InvalidInvoiceError &e)
        {
            Logger::warn("Invoice analysis rejected: " + std::string(e.what()));
            sendError(res, 400, e.what());
        }
        catch (const std::exception &e)
        {
            Logger::error("Invoice analysis failed: " + std::string(e.what()));
            sendError(res, 500, e.what());
        }
    }

    static void handleGetConfig(const httplib::Request &, httplib::Response &res)
    {
        Logger::trace("Received get config request");
        addCorsHeaders(res);
        try
        {
            res.set_content(ReportSerializer::dump(configDocument()), "application/json");
        }
        catch (const std::exception &e)
        {
            Logger::error("Get config error: " + std::string(e.what()));
            sendError(res, 500, "Internal server error");
        }
    }

    static void handleHealth(const httplib::Request &, httplib::Response &res, const FraudScorer &scorer)
    {
        addCorsHeaders(res);
        try
        {
            const OcrEngineStatus ocr = scorer.ocrValidator().engineStatus();
            const json response = {
                {"status", "ok"},
                {"ocr_available", ocr.available}};
            res.set_content(ReportSerializer::dump(response), "application/json");
        }
        catch (const std::exception &e)
        {
            Logger::error("Health check failed: " + std::string(e.what()));
            sendError(res, 500, "Internal server error");
        }
    }
};
