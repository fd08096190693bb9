// tests/test_ConfigManager.cpp
#include "TestSupport.hpp"
#include "utils/ConfigManager.hpp"
#include <usb-audio/Constants.hpp>

namespace usb_audio {
namespace testing {

class ConfigManagerTest : public QtTest {
protected:
    ConfigManager config;
};

TEST_F(ConfigManagerTest, Defaults) {
    EXPECT_EQ(config.getString("rulesFile"), DEFAULT_RULES_FILE);
    EXPECT_EQ(config.getString("streamHost"), "localhost");
    EXPECT_EQ(config.getInt("streamPort"), DEFAULT_STREAM_PORT);
    EXPECT_EQ(config.getString("audioCodec"), "libmp3lame");
    EXPECT_EQ(config.getString("audioBitrate"), "160k");
    EXPECT_EQ(config.getInt("inputChannels"), 1);
    EXPECT_EQ(config.getInt("outputChannels"), 2);
    EXPECT_EQ(config.getInt("staggerDelayMs"), STAGGER_DELAY);
    EXPECT_TRUE(config.getList("extraDenylist").empty());
}

TEST_F(ConfigManagerTest, TypeMismatchReturnsDefault) {
    EXPECT_EQ(config.getInt("streamHost", 42), 42);
    EXPECT_EQ(config.getString("missing", "fallback"), "fallback");
    EXPECT_DOUBLE_EQ(config.getDouble("streamPort"), DEFAULT_STREAM_PORT);
}

TEST_F(ConfigManagerTest, LoadKeepsNumberTypes) {
    const QString file = path("config.json");
    ASSERT_TRUE(writeFile(file,
        "{\n"
        "  \"global\": {\n"
        "    \"streamPort\": 9554,\n"
        "    \"gain\": 1.5,\n"
        "    \"streamHost\": \"0.0.0.0\",\n"
        "    \"extraDenylist\": \"Loopback, Dummy ,\"\n"
        "  },\n"
        "  \"devices\": {\n"
        "    \"0D8C:0014\": { \"inputChannels\": 2, \"audioBitrate\": \"96k\" }\n"
        "  }\n"
        "}\n"));

    ASSERT_TRUE(config.loadFromFile(file.toStdString()));

    EXPECT_EQ(config.getInt("streamPort"), 9554);
    EXPECT_DOUBLE_EQ(config.getDouble("gain"), 1.5);
    EXPECT_EQ(config.getInt("gain", -1), -1);
    EXPECT_EQ(config.getString("streamHost"), "0.0.0.0");
    EXPECT_EQ(config.getList("extraDenylist"), (std::vector<std::string>{"Loopback", "Dummy"}));

    // Keys not in the file keep their defaults.
    EXPECT_EQ(config.getString("audioCodec"), "libmp3lame");

    EXPECT_EQ(config.deviceInt("0d8c", "0014", "inputChannels"), 2);
    EXPECT_EQ(config.deviceString("0d8c", "0014", "audioBitrate"), "96k");
    EXPECT_EQ(config.deviceString("0d8c", "0014", "audioCodec"), "libmp3lame");
    EXPECT_EQ(config.deviceInt("046d", "0825", "inputChannels"), 1);
}

TEST_F(ConfigManagerTest, MalformedFileLeavesSettingsUntouched) {
    const QString file = path("broken.json");
    ASSERT_TRUE(writeFile(file, "{ \"global\": { \"streamPort\": "));

    EXPECT_FALSE(config.loadFromFile(file.toStdString()));
    EXPECT_FALSE(config.loadFromFile(path("absent.json").toStdString()));
    EXPECT_EQ(config.getInt("streamPort"), DEFAULT_STREAM_PORT);
}

TEST_F(ConfigManagerTest, SaveAndReload) {
    config.setString("streamHost", "192.168.1.20");
    config.setInt("rescanIntervalMs", 5000);
    config.setBool("verbose", true);
    config.setDeviceSettings("0d8c", "0014", {{"outputChannels", 1}});

    const QString file = path("nested/dir/config.json");
    ASSERT_TRUE(config.saveToFile(file.toStdString()));

    ConfigManager reloaded;
    ASSERT_TRUE(reloaded.loadFromFile(file.toStdString()));
    EXPECT_EQ(reloaded.getString("streamHost"), "192.168.1.20");
    EXPECT_EQ(reloaded.getInt("rescanIntervalMs"), 5000);
    EXPECT_TRUE(reloaded.getBool("verbose"));
    EXPECT_EQ(reloaded.deviceInt("0d8c", "0014", "outputChannels"), 1);
}

TEST_F(ConfigManagerTest, ResetDropsOverrides) {
    config.setInt("streamPort", 1);
    config.setDeviceSettings("0d8c", "0014", {{"inputChannels", 2}});

    config.resetToDefaults();

    EXPECT_EQ(config.getInt("streamPort"), DEFAULT_STREAM_PORT);
    EXPECT_TRUE(config.getDeviceSettings("0d8c", "0014").empty());
}

TEST(ConfigSearchPathTest, SystemPathIsLast) {
    auto paths = ConfigManager::searchPaths();
    ASSERT_FALSE(paths.empty());
    EXPECT_EQ(paths.back(), "/etc/usb-audio-rtsp/config.json");
}

} // namespace testing
} // namespace usb_audio
