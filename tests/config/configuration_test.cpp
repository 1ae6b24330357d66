// tests/config/configuration_test.cpp

#include <gtest/gtest.h>

#include "common/errors.hpp"
#include "config/configuration.hpp"
#include "../common/temporary_directory.hpp"

using config::Configuration;

class ConfigurationTest : public ::testing::Test {
protected:
    const YAML::Node root = YAML::Load(R"(
classifier:
  match_threshold: 18.5
  review_threshold: 40
capture:
  layout: prefixed
  left:
    name: live
  extensions: [.png, .jpg]
pipeline:
  parallel: true
)");
};

TEST_F(ConfigurationTest, FlattensNestedKeys) {
    const Configuration configuration(root);
    EXPECT_TRUE(configuration.contains("classifier.match_threshold"));
    EXPECT_TRUE(configuration.contains("capture.left.name"));
    EXPECT_FALSE(configuration.contains("capture.left"));
    EXPECT_FALSE(configuration.contains("classifier"));
}

TEST_F(ConfigurationTest, ReadsTypedValues) {
    const Configuration configuration(root);
    EXPECT_DOUBLE_EQ(configuration.get("classifier.match_threshold", 0.0), 18.5);
    EXPECT_DOUBLE_EQ(configuration.get("classifier.review_threshold", 0.0), 40.0);
    EXPECT_EQ(configuration.get("capture.layout", "runs"), "prefixed");
    EXPECT_TRUE(configuration.get("pipeline.parallel", false));

    const auto extensions = configuration.get<std::vector<std::string>>("capture.extensions");
    ASSERT_TRUE(extensions.has_value());
    EXPECT_EQ(*extensions, (std::vector<std::string>{".png", ".jpg"}));
}

TEST_F(ConfigurationTest, MissingKeysUseDefaults) {
    const Configuration configuration(root);
    EXPECT_FALSE(configuration.get<double>("classifier.unknown").has_value());
    EXPECT_EQ(configuration.get("output.report", "report.md"), "report.md");
    EXPECT_EQ(configuration.get("capture.right.name", "script"), "script");
}

TEST_F(ConfigurationTest, WrongTypeFallsBackToDefault) {
    const Configuration configuration(root);
    EXPECT_DOUBLE_EQ(configuration.get("capture.layout", 1.5), 1.5);
}

TEST_F(ConfigurationTest, RequireThrowsForMissingOrMistypedKeys) {
    const Configuration configuration(root);
    EXPECT_EQ(configuration.require<std::string>("capture.left.name"), "live");
    EXPECT_THROW((void) configuration.require<std::string>("capture.left.directory"), common::ConfigurationError);
    EXPECT_THROW((void) configuration.require<double>("capture.layout"), common::ConfigurationError);
}

TEST_F(ConfigurationTest, RequireWithDefaultRejectsUnparseableValues) {
    const Configuration configuration(YAML::Load("classifier: {match_threshold: abc}\ncapture: {extensions: .jpg}\n"));

    EXPECT_THROW((void) configuration.require("classifier.match_threshold", 22.0), common::ConfigurationError);
    EXPECT_THROW((void) configuration.require<std::vector<std::string>>("capture.extensions", {".png"}),
                 common::ConfigurationError);
    EXPECT_DOUBLE_EQ(configuration.require("classifier.review_threshold", 30.0), 30.0);
}

TEST_F(ConfigurationTest, RequireWithDefaultReadsPresentValues) {
    const Configuration configuration(root);
    EXPECT_DOUBLE_EQ(configuration.require("classifier.match_threshold", 22.0), 18.5);
    EXPECT_EQ(configuration.require<std::vector<std::string>>("capture.extensions", {".png"}),
              (std::vector<std::string>{".png", ".jpg"}));
    EXPECT_TRUE(configuration.require("pipeline.parallel", false));
}

TEST_F(ConfigurationTest, SetOverridesValues) {
    Configuration configuration(root);
    EXPECT_TRUE(configuration.set("classifier.match_threshold", 10.0));
    EXPECT_TRUE(configuration.set("output.directory", std::string("/tmp/out")));
    EXPECT_DOUBLE_EQ(configuration.get("classifier.match_threshold", 0.0), 10.0);
    EXPECT_EQ(configuration.get("output.directory", ""), "/tmp/out");
}

TEST(ConfigurationFileTest, LoadsFromFile) {
    TemporaryDirectory directory;
    const auto file = directory.writeText("configuration.yaml", "classifier:\n  review_threshold: 35.0\n");

    const Configuration configuration(file.string());
    EXPECT_DOUBLE_EQ(configuration.get("classifier.review_threshold", 0.0), 35.0);
    EXPECT_EQ(configuration.source(), file.string());
}

TEST(ConfigurationFileTest, MissingFileIsAConfigurationError) {
    TemporaryDirectory directory;
    EXPECT_THROW(Configuration((directory.path() / "absent.yaml").string()), common::ConfigurationError);
}

TEST(ConfigurationFileTest, MalformedFileIsAConfigurationError) {
    TemporaryDirectory directory;
    const auto file = directory.writeText("broken.yaml", "classifier: [unterminated\n");
    EXPECT_THROW(Configuration(file.string()), common::ConfigurationError);
}

TEST(ConfigurationNodeTest, EmptyDocumentIsEmptyConfiguration) {
    const Configuration configuration{YAML::Node()};
    EXPECT_FALSE(configuration.contains("classifier.match_threshold"));
    EXPECT_DOUBLE_EQ(configuration.get("classifier.match_threshold", 22.0), 22.0);
}

TEST(ConfigurationNodeTest, ScalarRootIsRejected) {
    EXPECT_THROW(Configuration{YAML::Load("just a string")}, common::ConfigurationError);
}
