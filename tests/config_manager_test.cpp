#include "test_base.hpp"
#include "core/config_manager.hpp"
#include "web/route_handlers.hpp"

class ConfigManagerTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        ConfigManager::getInstance().reset();
    }

    void TearDown() override
    {
        ConfigManager::getInstance().reset();
        TestBase::TearDown();
    }

    std::string writeConfig(const std::string &name, const std::string &text) const
    {
        return writeFile(name, std::vector<uint8_t>(text.begin(), text.end()));
    }
};

TEST_F(ConfigManagerTest, DefaultsWithoutFile)
{
    auto &config = ConfigManager::getInstance();

    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_EQ(config.getServerHost(), "0.0.0.0");
    EXPECT_EQ(config.getServerPort(), 5000);
    EXPECT_EQ(config.getMaxUploadBytes(), 16u * 1024u * 1024u);

    const ElaOptions ela = config.getElaOptions();
    EXPECT_EQ(ela.results_directory, "static/results");
    ASSERT_TRUE(ela.public_results_prefix.has_value());
    EXPECT_EQ(*ela.public_results_prefix, "/static/results");
    EXPECT_EQ(ela.jpeg_quality, 90);

    const FraudScorerOptions scorer = config.getScorerOptions();
    EXPECT_EQ(scorer.max_image_width_px, 2000);
    EXPECT_DOUBLE_EQ(scorer.tolerance_ratio, 0.15);
    EXPECT_EQ(scorer.pdf_dpi, 200);
    EXPECT_TRUE(scorer.parallel_detectors);

    const OcrOptions ocr = config.getOcrOptions();
    EXPECT_EQ(ocr.language, "eng");
    EXPECT_TRUE(ocr.tessdata_path.empty());
    EXPECT_EQ(ocr.page_seg_mode, 3);
}

TEST_F(ConfigManagerTest, LoadsJsonFile)
{
    const std::string path = writeConfig("config.json", R"({
        "log_level": "DEBUG",
        "server": {"host": "127.0.0.1", "port": 8080},
        "analysis": {"jpeg_quality": 75, "tolerance_ratio": 0.05, "parallel_detectors": false},
        "storage": {"results_directory": "/tmp/ela", "public_results_prefix": ""},
        "ocr": {"language": "deu", "page_seg_mode": 6}
    })");

    auto &config = ConfigManager::getInstance();
    ASSERT_TRUE(config.load(path));

    EXPECT_EQ(config.getLogLevel(), "DEBUG");
    EXPECT_EQ(config.getServerHost(), "127.0.0.1");
    EXPECT_EQ(config.getServerPort(), 8080);

    const ElaOptions ela = config.getElaOptions();
    EXPECT_EQ(ela.results_directory, "/tmp/ela");
    EXPECT_FALSE(ela.public_results_prefix.has_value());
    EXPECT_EQ(ela.jpeg_quality, 75);

    const FraudScorerOptions scorer = config.getScorerOptions();
    EXPECT_DOUBLE_EQ(scorer.tolerance_ratio, 0.05);
    EXPECT_FALSE(scorer.parallel_detectors);
    EXPECT_EQ(scorer.max_image_width_px, 2000);

    EXPECT_EQ(config.getOcrOptions().language, "deu");
    EXPECT_EQ(config.getOcrOptions().page_seg_mode, 6);
}

TEST_F(ConfigManagerTest, FailedLoadKeepsPreviousValues)
{
    auto &config = ConfigManager::getInstance();
    ASSERT_TRUE(config.load(writeConfig("good.json", R"({"server": {"port": 9000}})")));

    EXPECT_FALSE(config.load(testPath("missing.json")));
    EXPECT_FALSE(config.load(writeConfig("bad.json", "{ not json")));
    EXPECT_EQ(config.getServerPort(), 9000);
}

TEST_F(ConfigManagerTest, MalformedValuesFallBackToDefaults)
{
    auto &config = ConfigManager::getInstance();
    ASSERT_TRUE(config.load(writeConfig("typos.json",
                                        R"({"server": {"port": "eighty"}, "analysis": {"parallel_detectors": "maybe"}})")));

    EXPECT_EQ(config.getServerPort(), 5000);
    EXPECT_TRUE(config.getScorerOptions().parallel_detectors);
}

TEST_F(ConfigManagerTest, GetAllReflectsLoadedFile)
{
    auto &config = ConfigManager::getInstance();
    EXPECT_TRUE(config.getAll().empty());

    ASSERT_TRUE(config.load(writeConfig("config.json", R"({"analysis": {"jpeg_quality": 60}, "log_level": "WARN"})")));
    const nlohmann::json all = config.getAll();
    EXPECT_EQ(all.at("analysis").at("jpeg_quality"), 60);
    EXPECT_EQ(all.at("log_level"), "WARN");

    config.reset();
    EXPECT_TRUE(config.getAll().empty());
    EXPECT_EQ(config.getLogLevel(), "INFO");
}

TEST_F(ConfigManagerTest, ConfigEndpointServesActiveConfiguration)
{
    auto &config = ConfigManager::getInstance();
    ASSERT_TRUE(config.load(writeConfig("config.json", R"({"server": {"port": 7070}})")));

    const nlohmann::json body = RouteHandlers::configDocument();
    EXPECT_EQ(body.at("status"), "success");
    EXPECT_EQ(body.at("config").at("server").at("port"), 7070);
}

TEST_F(ConfigManagerTest, ShippedDefaultsMatchBuiltIns)
{
    auto &config = ConfigManager::getInstance();
    const std::string shipped = std::string(INVOICE_FORENSICS_SOURCE_DIR) + "/config/config.json";
    ASSERT_TRUE(config.load(shipped));

    EXPECT_EQ(config.getServerPort(), 5000);
    EXPECT_EQ(config.getElaOptions().jpeg_quality, 90);
    EXPECT_EQ(config.getMaxUploadBytes(), 16u * 1024u * 1024u);
}
