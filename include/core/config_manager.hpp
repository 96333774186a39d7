#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "core/ela_analyzer.hpp"
#include "core/fraud_scorer.hpp"
#include "core/ocr_engine.hpp"

/**
 * @brief Process-wide JSON configuration
 *
 * Keys are dotted paths into the JSON document ("analysis.jpeg_quality").
 * Every getter takes a default, so a missing file or key is never fatal.
 */
class ConfigManager
{
public:
    static ConfigManager &getInstance()
    {
        static ConfigManager instance;
        return instance;
    }

    /**
     * @brief Replace the configuration with the contents of a JSON file
     * @return false if the file is missing or malformed; the previous values stay active
     */
    bool load(const std::string &path);

    // Drop all values so only defaults apply
    void reset();

    // Active configuration as JSON ({} when nothing is loaded)
    nlohmann::json getAll() const;

    // Convenience getters
    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    bool getBool(const std::string &key, bool def) const;
    double getDouble(const std::string &key, double def) const;

    std::string getLogLevel() const;
    std::string getServerHost() const;
    int getServerPort() const;
    size_t getMaxUploadBytes() const;
    std::string getResultsDirectory() const;
    std::string getPublicResultsPrefix() const;

    ElaOptions getElaOptions() const;
    OcrOptions getOcrOptions() const;
    FraudScorerOptions getScorerOptions() const;

private:
    ConfigManager();
    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
