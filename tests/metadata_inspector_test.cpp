#include "test_base.hpp"
#include "core/exif_reader.hpp"
#include "core/metadata_inspector.hpp"

class MetadataInspectorTest : public TestBase
{
protected:
    static CaptureMetadataExtraction fields(std::map<std::string, std::string> values)
    {
        return CaptureMetadata{std::move(values)};
    }

    static bool hasFlagContaining(const MetadataFindings &findings, const std::string &needle)
    {
        for (const auto &flag : findings.flags)
        {
            if (flag.find(needle) != std::string::npos)
                return true;
        }
        return false;
    }

    MetadataInspector inspector_;
};

TEST_F(MetadataInspectorTest, NoMetadataScoresFifty)
{
    const auto outcome = inspector_.inspect(NoCaptureMetadata{"no EXIF block"});

    ASSERT_TRUE(outcome.ok());
    const auto &findings = outcome.findings();
    EXPECT_DOUBLE_EQ(findings.score, 50.0);
    EXPECT_EQ(findings.verdict, MetadataInspector::NO_EXIF_VERDICT);
    ASSERT_EQ(findings.flags.size(), 1u);
    EXPECT_TRUE(findings.metadata.empty());
}

TEST_F(MetadataInspectorTest, EmptyFieldMapCountsAsNoMetadata)
{
    const auto outcome = inspector_.inspect(fields({}));
    ASSERT_TRUE(outcome.ok());
    EXPECT_DOUBLE_EQ(outcome.findings().score, 50.0);
    EXPECT_EQ(outcome.findings().verdict, MetadataInspector::NO_EXIF_VERDICT);
}

TEST_F(MetadataInspectorTest, EditedResavedAndIncompleteIsHighRisk)
{
    const auto outcome = inspector_.inspect(fields({{"Software", "Adobe Photoshop 24.0"},
                                                    {"DateTime", "2024:03:02 10:00:00"},
                                                    {"DateTimeOriginal", "2024:03:01 09:00:00"}}));

    ASSERT_TRUE(outcome.ok());
    const auto &findings = outcome.findings();
    EXPECT_DOUBLE_EQ(findings.score, 65.0);
    EXPECT_EQ(findings.verdict, "HIGH METADATA RISK");
    ASSERT_EQ(findings.flags.size(), 3u);
    EXPECT_EQ(findings.flags[0], "Edited with: Adobe Photoshop 24.0");
    EXPECT_TRUE(hasFlagContaining(findings, "DateTimeOriginal"));
    EXPECT_EQ(findings.flags[2], "Missing critical EXIF fields: Make, Model");
}

TEST_F(MetadataInspectorTest, CompleteCameraMetadataIsLowRisk)
{
    const auto outcome = inspector_.inspect(fields({{"Make", "Canon"},
                                                    {"Model", "EOS 80D"},
                                                    {"Software", "Firmware 1.0.2"},
                                                    {"DateTime", "2024:03:01 09:00:00"},
                                                    {"DateTimeOriginal", "2024:03:01 09:00:00"}}));

    ASSERT_TRUE(outcome.ok());
    EXPECT_DOUBLE_EQ(outcome.findings().score, 0.0);
    EXPECT_EQ(outcome.findings().verdict, "LOW METADATA RISK");
    EXPECT_TRUE(outcome.findings().flags.empty());
    EXPECT_EQ(outcome.findings().metadata.at("Model"), "EOS 80D");
}

TEST_F(MetadataInspectorTest, EmptyValuesCountAsMissing)
{
    const auto outcome = inspector_.inspect(fields({{"Make", ""},
                                                    {"Model", "Pixel 7"},
                                                    {"DateTime", "2024:03:01 09:00:00"},
                                                    {"DateTimeOriginal", ""}}));

    ASSERT_TRUE(outcome.ok());
    // Empty DateTimeOriginal skips the timestamp check
    EXPECT_DOUBLE_EQ(outcome.findings().score, 15.0);
    ASSERT_EQ(outcome.findings().flags.size(), 1u);
    EXPECT_EQ(outcome.findings().flags[0], "Missing critical EXIF fields: Make");
}

TEST_F(MetadataInspectorTest, ProcessingSoftwareIsUsedWhenSoftwareAbsent)
{
    const auto outcome = inspector_.inspect(fields({{"Make", "Canon"},
                                                    {"Model", "EOS 80D"},
                                                    {"DateTime", "2024:03:01 09:00:00"},
                                                    {"ProcessingSoftware", "GIMP 2.10"}}));

    ASSERT_TRUE(outcome.ok());
    EXPECT_DOUBLE_EQ(outcome.findings().score, 30.0);
    EXPECT_EQ(outcome.findings().flags[0], "Edited with: GIMP 2.10");
}

TEST_F(MetadataInspectorTest, EditorDetectionIsCaseInsensitive)
{
    EXPECT_TRUE(MetadataInspector::detectEditingSoftware({{"Software", "PAINT.NET 5.0"}}).has_value());
    EXPECT_TRUE(MetadataInspector::detectEditingSoftware({{"Software", "Corel Paint Shop Pro"}}).has_value());
    EXPECT_FALSE(MetadataInspector::detectEditingSoftware({{"Software", "Samsung Camera"}}).has_value());
    EXPECT_FALSE(MetadataInspector::detectEditingSoftware({}).has_value());
    EXPECT_FALSE(MetadataInspector::detectEditingSoftware({{"Software", ""}, {"ProcessingSoftware", "darktable"}})
                     .has_value());
}

TEST_F(MetadataInspectorTest, LongValuesAreTruncatedForDisplay)
{
    const std::string long_value(250, 'x');
    const auto outcome = inspector_.inspect(fields({{"Make", "Canon"},
                                                    {"Model", "EOS 80D"},
                                                    {"DateTime", "2024:03:01 09:00:00"},
                                                    {"ImageDescription", long_value}}));

    ASSERT_TRUE(outcome.ok());
    const std::string &shown = outcome.findings().metadata.at("ImageDescription");
    EXPECT_LT(shown.size(), long_value.size());
    EXPECT_EQ(shown.substr(0, 99), std::string(99, 'x'));
}

TEST_F(MetadataInspectorTest, InspectFileReadsJpegExif)
{
    const auto tiff = TiffBuilder()
                          .ascii(0x010F, "Canon")
                          .ascii(0x0110, "EOS 80D")
                          .ascii(0x0131, "Adobe Photoshop CC")
                          .ascii(0x0132, "2024:03:02 10:00:00")
                          .ascii(0x9003, "2024:03:01 09:00:00", true)
                          .build();
    const std::string path = writeFile("edited.jpg", TiffBuilder::jpegWithExif(syntheticInvoice(64, 48), tiff));

    const auto outcome = inspector_.inspectFile(path);
    ASSERT_TRUE(outcome.ok());
    EXPECT_DOUBLE_EQ(outcome.findings().score, 50.0);
    EXPECT_EQ(outcome.findings().verdict, "MEDIUM METADATA RISK");
    EXPECT_EQ(outcome.findings().metadata.at("Make"), "Canon");
}

TEST_F(MetadataInspectorTest, InspectFileWithoutExif)
{
    const std::string path = writeFile("plain.png", encode(syntheticInvoice(64, 48), ".png"));

    const auto outcome = inspector_.inspectFile(path);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.findings().verdict, MetadataInspector::NO_EXIF_VERDICT);
}

TEST_F(MetadataInspectorTest, UnreadableFilesAreInconclusive)
{
    const auto missing = inspector_.inspectFile(testPath("missing.jpg"));
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().reason, FailureReason::INPUT_UNREADABLE);
    EXPECT_EQ(missing.resolved().verdict, "INCONCLUSIVE - Metadata read failed");
    EXPECT_DOUBLE_EQ(missing.score(), 50.0);

    const std::string junk = writeFile("junk.jpg", {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'});
    const auto not_image = inspector_.inspectFile(junk);
    ASSERT_FALSE(not_image.ok());
    EXPECT_EQ(not_image.error().reason, FailureReason::INPUT_UNREADABLE);
}

TEST_F(MetadataInspectorTest, PdfFindingsAreFixed)
{
    const auto findings = MetadataInspector::pdfFindings();
    EXPECT_DOUBLE_EQ(findings.score, 50.0);
    EXPECT_EQ(findings.verdict, MetadataInspector::NO_EXIF_VERDICT);
    EXPECT_EQ(findings.flags.size(), 1u);
    EXPECT_TRUE(findings.metadata.empty());
}
