#include <gtest/gtest.h>
#include <scenebridge/core/config.hpp>

#include <fstream>
#include <string>

using namespace scenebridge;
using json = nlohmann::json;

TEST(ConfigTest, EmptyObjectKeepsDefaults) {
    auto config = configFromJson(json::object());
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config.value().baseSize, 1920);
    EXPECT_DOUBLE_EQ(config.value().defaultAspectRatio, 9.0 / 16.0);
    EXPECT_DOUBLE_EQ(config.value().nodeStopCeiling, 3600.0);
    EXPECT_DOUBLE_EQ(config.value().driftTolerance, 0.1);
    EXPECT_EQ(config.value().fitMode, FitMode::Contain);
    EXPECT_EQ(config.value().logLevel, "info");
}

TEST(ConfigTest, ReadsEveryKey) {
    json j = {
        {"baseSize", 1280},
        {"defaultAspectRatio", 1.0},
        {"nodeStopCeiling", 300.0},
        {"driftTolerance", 0.25},
        {"fitMode", "cover"},
        {"log", {{"level", "debug"}, {"file", "bridge.log"}}},
    };

    auto config = configFromJson(j);
    ASSERT_TRUE(config.ok());
    const BridgeConfig& c = config.value();
    EXPECT_EQ(c.baseSize, 1280);
    EXPECT_DOUBLE_EQ(c.defaultAspectRatio, 1.0);
    EXPECT_DOUBLE_EQ(c.nodeStopCeiling, 300.0);
    EXPECT_DOUBLE_EQ(c.driftTolerance, 0.25);
    EXPECT_EQ(c.fitMode, FitMode::Cover);
    EXPECT_EQ(c.logLevel, "debug");
    EXPECT_EQ(c.logFile, "bridge.log");
}

TEST(ConfigTest, RejectsInvalidValues) {
    EXPECT_FALSE(configFromJson(json::array()).ok());
    EXPECT_FALSE(configFromJson({{"baseSize", 0}}).ok());
    EXPECT_FALSE(configFromJson({{"defaultAspectRatio", -1.0}}).ok());
    EXPECT_FALSE(configFromJson({{"nodeStopCeiling", 0.0}}).ok());
    EXPECT_FALSE(configFromJson({{"driftTolerance", -0.5}}).ok());

    auto fit = configFromJson({{"fitMode", "stretch"}});
    ASSERT_FALSE(fit.ok());
    EXPECT_EQ(fit.error().code(), ErrorCode::InvalidArgument);

    auto wrongType = configFromJson({{"baseSize", "large"}});
    ASSERT_FALSE(wrongType.ok());
    EXPECT_EQ(wrongType.error().code(), ErrorCode::InvalidArgument);
}

TEST(ConfigTest, ToJsonReadsBack) {
    BridgeConfig original;
    original.baseSize = 720;
    original.fitMode = FitMode::Cover;

    auto back = configFromJson(configToJson(original));
    ASSERT_TRUE(back.ok());
    EXPECT_EQ(back.value().baseSize, 720);
    EXPECT_EQ(back.value().fitMode, FitMode::Cover);
    EXPECT_STREQ(fitModeToString(FitMode::Cover), "cover");
}

TEST(ConfigTest, MissingFile) {
    auto config = loadConfigFile("/nonexistent/scenebridge.json");
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(config.error().code(), ErrorCode::FileNotFound);
}

TEST(ConfigTest, LoadsFileAndReportsParseErrors) {
    std::string good = ::testing::TempDir() + "scenebridge_good.json";
    {
        std::ofstream out(good);
        out << R"({"baseSize": 640, "log": {"level": "warn"}})";
    }
    auto config = loadConfigFile(good);
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config.value().baseSize, 640);
    EXPECT_EQ(config.value().logLevel, "warn");

    std::string bad = ::testing::TempDir() + "scenebridge_bad.json";
    {
        std::ofstream out(bad);
        out << "{ baseSize: ";
    }
    auto broken = loadConfigFile(bad);
    ASSERT_FALSE(broken.ok());
    EXPECT_EQ(broken.error().code(), ErrorCode::ParseError);
}
