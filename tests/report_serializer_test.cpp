#include "test_base.hpp"
#include "core/report_serializer.hpp"

using json = nlohmann::json;

namespace
{
    ElaOutcome sampleEla()
    {
        ElaFindings findings;
        findings.score = 12.5;
        findings.verdict = "LOW ELA RISK";
        findings.visualization_path = "/static/results/ela_20240301_090000_abcd.png";
        findings.metrics = ElaMetrics{3.2, 15.75, 42, 90};
        return ElaOutcome::success(findings);
    }

    MetadataOutcome sampleMetadata()
    {
        MetadataFindings findings;
        findings.score = 30.0;
        findings.verdict = "LOW METADATA RISK";
        findings.flags = {"Edited with: GIMP 2.10"};
        findings.metadata = {{"Make", "Canon"}, {"Software", "GIMP 2.10"}};
        return MetadataOutcome::success(findings);
    }

    OcrOutcome sampleOcr()
    {
        OcrFindings findings;
        findings.score = 0.0;
        findings.verdict = "LOW OCR RISK";
        findings.extracted_text = "Total $10.00";
        findings.amounts = {{"$10.00", 10.0}};
        return OcrOutcome::success(findings);
    }
}

TEST(ReportSerializerTest, ReportShape)
{
    const FraudReport report(14.0, "LOW RISK - Appears Authentic", sampleEla(), sampleMetadata(), sampleOcr());
    const json doc = ReportSerializer::toJson(report);

    EXPECT_DOUBLE_EQ(doc.at("final_score").get<double>(), 14.0);
    EXPECT_EQ(doc.at("verdict"), "LOW RISK - Appears Authentic");

    const json &ela = doc.at("ela");
    EXPECT_EQ(ela.at("visualization_path"), "/static/results/ela_20240301_090000_abcd.png");
    EXPECT_EQ(ela.at("metrics").at("max_pixel_difference"), 42);
    EXPECT_EQ(ela.at("metrics").at("jpeg_quality"), 90);
    EXPECT_DOUBLE_EQ(ela.at("metrics").at("brightness_variance").get<double>(), 15.75);
    EXPECT_TRUE(ela.at("error").is_null());

    const json &metadata = doc.at("metadata");
    EXPECT_EQ(metadata.at("flags").size(), 1u);
    EXPECT_EQ(metadata.at("metadata").at("Make"), "Canon");
    EXPECT_TRUE(metadata.at("error").is_null());

    const json &ocr = doc.at("ocr");
    EXPECT_EQ(ocr.at("extracted_text"), "Total $10.00");
    ASSERT_EQ(ocr.at("amounts").size(), 1u);
    EXPECT_EQ(ocr.at("amounts")[0].at("raw"), "$10.00");
    EXPECT_DOUBLE_EQ(ocr.at("amounts")[0].at("value").get<double>(), 10.0);
}

TEST(ReportSerializerTest, FailedDetectorsUseFallbackShape)
{
    const json ela = ReportSerializer::elaToJson(ElaOutcome::failure(FailureReason::INPUT_UNREADABLE, "bad file"));
    EXPECT_DOUBLE_EQ(ela.at("score").get<double>(), 50.0);
    EXPECT_EQ(ela.at("verdict"), "INCONCLUSIVE - ELA read failed");
    EXPECT_TRUE(ela.at("visualization_path").is_null());
    EXPECT_TRUE(ela.at("metrics").is_object());
    EXPECT_TRUE(ela.at("metrics").empty());
    EXPECT_EQ(ela.at("error"), "bad file");

    const json metadata =
        ReportSerializer::metadataToJson(MetadataOutcome::failure(FailureReason::PROCESSING_FAILED, "boom"));
    EXPECT_TRUE(metadata.at("metadata").is_object());
    EXPECT_EQ(metadata.at("flags").size(), 1u);
    EXPECT_EQ(metadata.at("error"), "boom");

    const json ocr =
        ReportSerializer::ocrToJson(OcrOutcome::failure(FailureReason::ENGINE_UNAVAILABLE, "Tesseract not found"));
    EXPECT_DOUBLE_EQ(ocr.at("score").get<double>(), 40.0);
    EXPECT_EQ(ocr.at("verdict"), "INCONCLUSIVE - Tesseract not installed");
    EXPECT_EQ(ocr.at("extracted_text"), "");
    EXPECT_TRUE(ocr.at("amounts").is_array());
    EXPECT_TRUE(ocr.at("amounts").empty());
}

TEST(ReportSerializerTest, EmptyMetadataIsAnObject)
{
    MetadataFindings findings;
    findings.score = 50.0;
    findings.verdict = "SUSPICIOUS - No EXIF metadata found";
    const json doc = ReportSerializer::metadataToJson(MetadataOutcome::success(findings));
    EXPECT_TRUE(doc.at("metadata").is_object());
    EXPECT_TRUE(doc.at("flags").is_array());
}

TEST(ReportSerializerTest, DumpToleratesInvalidUtf8)
{
    OcrFindings findings;
    findings.verdict = "LOW OCR RISK";
    findings.extracted_text = std::string("Total \xff\xfe 10.00");

    const json doc = ReportSerializer::ocrToJson(OcrOutcome::success(findings));
    std::string text;
    EXPECT_NO_THROW(text = ReportSerializer::dump(doc));
    EXPECT_NE(text.find("\xEF\xBF\xBD"), std::string::npos);
    json parsed;
    EXPECT_NO_THROW(parsed = json::parse(text));

    const std::string pretty = ReportSerializer::dump(doc, true);
    EXPECT_NE(pretty.find('\n'), std::string::npos);
}
