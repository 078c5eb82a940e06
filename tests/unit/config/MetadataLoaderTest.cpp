/**
 * @file MetadataLoaderTest.cpp
 * @brief Unit tests for certificate metadata loading
 */

#include "config/MetadataLoader.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using testing::HasSubstr;

class MetadataLoaderTest : public TempDirFixture {};

TEST_F(MetadataLoaderTest, ParseMetadata_AllGroups) {
    auto metadata = config::parse_metadata(R"({
        "personPerformingSanitization": {"name": "Jordan Lee", "phone": "555-0100"},
        "mediaInformation": {"mediaPropertyNumber": "ASSET-7", "classification": "Secret"},
        "sanitizationDetails": {"verificationMethod": "Sampling", "notes": "Rack 3"},
        "mediaDestination": {"destination": "Disposal", "details": "Shredder vendor"},
        "validation": {"validatorName": "Sam Ortiz", "validationDate": "2024-05-02"}
    })");

    ASSERT_TRUE(metadata.has_value()) << metadata.error().describe();
    EXPECT_EQ(metadata->operator_info.sanitizer.name, "Jordan Lee");
    EXPECT_EQ(metadata->operator_info.sanitizer.phone, "555-0100");
    EXPECT_EQ(metadata->media.media_property_number, "ASSET-7");
    EXPECT_EQ(metadata->media.classification, "Secret");
    EXPECT_EQ(metadata->operator_info.verification_method, "Sampling");
    EXPECT_EQ(metadata->operator_info.notes, "Rack 3");
    EXPECT_EQ(metadata->operator_info.destination, "Disposal");
    EXPECT_EQ(metadata->operator_info.destination_details, "Shredder vendor");
    EXPECT_EQ(metadata->operator_info.validator.name, "Sam Ortiz");
    EXPECT_EQ(metadata->operator_info.validation_date, "2024-05-02");
}

TEST_F(MetadataLoaderTest, ParseMetadata_EmptyObject_AllFieldsEmpty) {
    auto metadata = config::parse_metadata("{}");

    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->operator_info, OperatorMetadata{});
    EXPECT_EQ(metadata->media, MediaMetadata{});
}

TEST_F(MetadataLoaderTest, ParseMetadata_GeneratedFieldsIgnored) {
    auto metadata = config::parse_metadata(R"({
        "sanitizationDetails": {"methodType": "Purge", "toolUsed": "other"},
        "report_uuid": "0d1e2f3a-4b5c-4d6e-8f70-8192a3b4c5d6"
    })");

    ASSERT_TRUE(metadata.has_value());
    EXPECT_TRUE(metadata->operator_info.verification_method.empty());
}

TEST_F(MetadataLoaderTest, ParseMetadata_InvalidJson_ConfigurationError) {
    auto metadata = config::parse_metadata("{ not json");

    ASSERT_FALSE(metadata.has_value());
    EXPECT_EQ(metadata.error().kind, util::ErrorKind::CONFIGURATION);
}

TEST_F(MetadataLoaderTest, ParseMetadata_TopLevelArray_ConfigurationError) {
    auto metadata = config::parse_metadata("[]");

    ASSERT_FALSE(metadata.has_value());
    EXPECT_EQ(metadata.error().kind, util::ErrorKind::CONFIGURATION);
}

TEST_F(MetadataLoaderTest, ParseMetadata_NonStringValue_NamesTheField) {
    auto metadata = config::parse_metadata(R"({"mediaInformation": {"serialNumber": 12345}})");

    ASSERT_FALSE(metadata.has_value());
    EXPECT_THAT(metadata.error().message, HasSubstr("mediaInformation.serialNumber"));
}

TEST_F(MetadataLoaderTest, ParseMetadata_GroupNotObject_ConfigurationError) {
    auto metadata = config::parse_metadata(R"({"validation": "pending"})");

    ASSERT_FALSE(metadata.has_value());
    EXPECT_THAT(metadata.error().message, HasSubstr("validation"));
}

TEST_F(MetadataLoaderTest, LoadMetadata_FromFile) {
    const auto path = temp_dir / "metadata.json";
    WriteFile(path, R"({"personPerformingSanitization": {"name": "Jordan Lee"}})");

    auto metadata = config::load_metadata(path);

    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->operator_info.sanitizer.name, "Jordan Lee");
}

TEST_F(MetadataLoaderTest, LoadMetadata_Missing_ConfigurationError) {
    auto metadata = config::load_metadata(temp_dir / "absent.json");

    ASSERT_FALSE(metadata.has_value());
    EXPECT_EQ(metadata.error().kind, util::ErrorKind::CONFIGURATION);
}

TEST_F(MetadataLoaderTest, FillMediaDefaults_OnlyEmptyFieldsFilled) {
    MediaMetadata media;
    media.serial_number = "OPERATOR-SERIAL";
    DeviceInfo device{.path = "/dev/sda",
                      .vendor = "ATA",
                      .model = "WDC WD10EZEX",
                      .serial = "WD-123",
                      .category = DeviceCategory::SATA,
                      .rotational = RotationalState::ROTATIONAL};

    config::fill_media_defaults(media, {device});

    EXPECT_EQ(media.make_vendor, "ATA");
    EXPECT_EQ(media.model_number, "WDC WD10EZEX");
    EXPECT_EQ(media.serial_number, "OPERATOR-SERIAL");
    EXPECT_EQ(media.media_type, "SATA HDD");
}

TEST_F(MetadataLoaderTest, FillMediaDefaults_Nvme_MediaType) {
    MediaMetadata media;
    DeviceInfo device{.path = "/dev/nvme0n1",
                      .category = DeviceCategory::NVME,
                      .rotational = RotationalState::SOLID_STATE};

    config::fill_media_defaults(media, {device});

    EXPECT_EQ(media.media_type, "NVMe SSD");
}

TEST_F(MetadataLoaderTest, FillMediaDefaults_TwoDevices_ListedInJobOrder) {
    MediaMetadata media;
    media.make_vendor = "Mixed lot";
    const std::vector<DeviceInfo> devices{
        DeviceInfo{.path = "/dev/sda",
                   .vendor = "ATA",
                   .model = "WDC WD10EZEX",
                   .serial = "WD-123",
                   .category = DeviceCategory::SATA,
                   .rotational = RotationalState::ROTATIONAL},
        DeviceInfo{.path = "/dev/nvme0n1",
                   .vendor = {},
                   .model = "Samsung SSD 980",
                   .serial = "S64DNX0R",
                   .category = DeviceCategory::NVME,
                   .rotational = RotationalState::SOLID_STATE},
    };

    config::fill_media_defaults(media, devices);

    EXPECT_EQ(media.make_vendor, "Mixed lot");
    EXPECT_EQ(media.model_number, "/dev/sda: WDC WD10EZEX, /dev/nvme0n1: Samsung SSD 980");
    EXPECT_EQ(media.serial_number, "/dev/sda: WD-123, /dev/nvme0n1: S64DNX0R");
    EXPECT_EQ(media.media_type, "/dev/sda: SATA HDD, /dev/nvme0n1: NVMe SSD");
}

TEST_F(MetadataLoaderTest, FillMediaDefaults_NoDevices_Unchanged) {
    MediaMetadata media;
    config::fill_media_defaults(media, {});
    EXPECT_EQ(media, MediaMetadata{});
}
