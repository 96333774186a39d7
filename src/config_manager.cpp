#include "core/config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

ConfigManager::ConfigManager()
{
    cfg_ = new JSONConfiguration();
}

bool ConfigManager::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.good())
        return false;

    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        cfg_ = tmp;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to parse config " + path + ": " + e.displayText());
        return false;
    }
    return true;
}

void ConfigManager::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = new JSONConfiguration();
}

nlohmann::json ConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    const std::string text = ss.str();
    return text.empty() ? nlohmann::json::object() : nlohmann::json::parse(text);
}

std::string ConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int ConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getInt(key, def);
    }
    catch (const Poco::SyntaxException &)
    {
        Logger::warn("Config key " + key + " is not an integer, using " + std::to_string(def));
        return def;
    }
}

bool ConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getBool(key, def);
    }
    catch (const Poco::SyntaxException &)
    {
        Logger::warn("Config key " + key + " is not a boolean, using " + (def ? "true" : "false"));
        return def;
    }
}

double ConfigManager::getDouble(const std::string &key, double def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getDouble(key, def);
    }
    catch (const Poco::SyntaxException &)
    {
        Logger::warn("Config key " + key + " is not a number, using " + std::to_string(def));
        return def;
    }
}

std::string ConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

std::string ConfigManager::getServerHost() const
{
    return getString("server.host", "0.0.0.0");
}

int ConfigManager::getServerPort() const
{
    return getInt("server.port", 5000);
}

size_t ConfigManager::getMaxUploadBytes() const
{
    const int limit = getInt("storage.max_upload_bytes", 16 * 1024 * 1024);
    return limit > 0 ? static_cast<size_t>(limit) : 16 * 1024 * 1024;
}

std::string ConfigManager::getResultsDirectory() const
{
    return getString("storage.results_directory", "static/results");
}

std::string ConfigManager::getPublicResultsPrefix() const
{
    return getString("storage.public_results_prefix", "/static/results");
}

ElaOptions ConfigManager::getElaOptions() const
{
    ElaOptions options;
    options.results_directory = getResultsDirectory();
    const std::string prefix = getPublicResultsPrefix();
    if (prefix.empty())
        options.public_results_prefix.reset();
    else
        options.public_results_prefix = prefix;
    options.jpeg_quality = getInt("analysis.jpeg_quality", 90);
    return options;
}

OcrOptions ConfigManager::getOcrOptions() const
{
    OcrOptions options;
    options.language = getString("ocr.language", "eng");
    options.tessdata_path = getString("ocr.tessdata_path", "");
    options.page_seg_mode = getInt("ocr.page_seg_mode", 3);
    return options;
}

FraudScorerOptions ConfigManager::getScorerOptions() const
{
    FraudScorerOptions options;
    options.max_image_width_px = getInt("analysis.max_image_width_px", 2000);
    options.tolerance_ratio = getDouble("analysis.tolerance_ratio", OcrValidator::DEFAULT_TOLERANCE_RATIO);
    options.pdf_dpi = getInt("analysis.pdf_dpi", 200);
    options.parallel_detectors = getBool("analysis.parallel_detectors", true);
    return options;
}
