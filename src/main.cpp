#include "core/config_manager.hpp"
#include "core/fraud_scorer.hpp"
#include "core/http_server_manager.hpp"
#include "core/invoice_loader.hpp"
#include "core/report_serializer.hpp"
#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include "server_config.hpp"
#include "web/route_handlers.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace
{
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_ERROR = 1;
    constexpr int EXIT_REJECTED = 2;

    void printUsage(const char *program, std::ostream &out)
    {
        out << "Invoice Forensics - invoice tampering risk scoring" << std::endl;
        out << "Usage: " << program << " [options] <command>" << std::endl;
        out << "Commands:" << std::endl;
        out << "  analyze <invoice> [--pretty]  Score one JPG/PNG/TIFF image or the first page of a PDF" << std::endl;
        out << "  serve                         Run the HTTP API until interrupted" << std::endl;
        out << "Options:" << std::endl;
        out << "  --config, -c <file>  Configuration file (default: " << ServerConfig::DEFAULT_CONFIG_PATH << ")" << std::endl;
        out << "  --pretty, -p         Indent the JSON report" << std::endl;
        out << "  --help, -h           Show this help message" << std::endl;
    }

    int runAnalyze(const ConfigManager &config, const std::string &invoice_path, bool pretty)
    {
        try
        {
            const FraudScorer scorer(config.getElaOptions(), config.getOcrOptions(), config.getScorerOptions());
            const FraudReport report = scorer.analyzeFile(invoice_path);
            std::cout << ReportSerializer::dump(ReportSerializer::toJson(report), pretty) << std::endl;
            return EXIT_OK;
        }
        catch (const InvalidInvoiceError &e)
        {
            Logger::error("Invoice rejected: " + std::string(e.what()));
            std::cout << ReportSerializer::dump(json{{"error", e.what()}}, pretty) << std::endl;
            return EXIT_REJECTED;
        }
        catch (const std::exception &e)
        {
            Logger::error("Analysis failed: " + std::string(e.what()));
            std::cout << ReportSerializer::dump(json{{"error", e.what()}}, pretty) << std::endl;
            return EXIT_ERROR;
        }
    }

    int runServe(const ConfigManager &config)
    {
        auto &shutdown = ShutdownManager::getInstance();
        shutdown.installSignalHandlers();

        const std::string host = config.getServerHost();
        const int port = config.getServerPort();
        const std::string results_directory = config.getResultsDirectory();
        const std::string public_prefix = config.getPublicResultsPrefix();

        std::shared_ptr<const FraudScorer> scorer;
        try
        {
            scorer = std::make_shared<const FraudScorer>(config.getElaOptions(), config.getOcrOptions(),
                                                         config.getScorerOptions());
            const OcrEngineStatus ocr = scorer->ocrValidator().engineStatus();
            if (ocr.available)
                Logger::info("Tesseract " + ocr.version + " ready");
            else
                Logger::warn("Tesseract is not available, OCR checks will be inconclusive: " + ocr.error);
        }
        catch (const std::exception &e)
        {
            Logger::error("Failed to initialize analysis pipeline: " + std::string(e.what()));
            return EXIT_ERROR;
        }

        auto &http = HttpServerManager::getInstance();
        http.setMaxPayloadBytes(config.getMaxUploadBytes());
        http.setRouteSetupCallback([=](httplib::Server &svr)
                                   { RouteHandlers::setupRoutes(svr, scorer, results_directory, public_prefix, host, port); });

        try
        {
            http.start(host, port);
        }
        catch (const std::exception &e)
        {
            Logger::error("Failed to start HTTP server: " + std::string(e.what()));
            return EXIT_ERROR;
        }

        shutdown.waitForShutdown();
        Logger::info("Shutting down: " + shutdown.getReason());
        http.stop();

        return http.listenFailed() ? EXIT_ERROR : EXIT_OK;
    }
}

int main(int argc, char *argv[])
{
    std::string config_path = ServerConfig::DEFAULT_CONFIG_PATH;
    bool pretty = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0], std::cout);
            return EXIT_OK;
        }
        else if (arg == "--config" || arg == "-c")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << arg << " requires a file path" << std::endl;
                return EXIT_ERROR;
            }
            config_path = argv[++i];
        }
        else if (arg == "--pretty" || arg == "-p")
        {
            pretty = true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0], std::cerr);
            return EXIT_ERROR;
        }
        else
        {
            positional.push_back(arg);
        }
    }

    if (positional.empty())
    {
        printUsage(argv[0], std::cerr);
        return EXIT_ERROR;
    }

    Logger::init("INFO");
    auto &config = ConfigManager::getInstance();
    if (!config.load(config_path))
    {
        Logger::warn("Could not load configuration from " + config_path + ", using defaults");
    }
    Logger::init(config.getLogLevel());

    const std::string &command = positional[0];
    if (command == "analyze" && positional.size() == 2)
    {
        return runAnalyze(config, positional[1], pretty);
    }
    if (command == "serve" && positional.size() == 1)
    {
        Logger::info("Starting " + std::string(ServerConfig::APP_NAME) + " " + ServerConfig::VERSION);
        return runServe(config);
    }

    std::cerr << "Error: invalid command line" << std::endl;
    printUsage(argv[0], std::cerr);
    return EXIT_ERROR;
}
