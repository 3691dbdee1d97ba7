#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <random>

#include <linux/videodev2.h>

#include "common/errors.hpp"
#include "config/app_config.hpp"

using namespace sorter;
namespace fs = std::filesystem;

namespace {

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        std::random_device rd;
        m_path = fs::temp_directory_path() / ("sorter_config_" + std::to_string(rd()) + ".json");
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove(m_path, ec);
    }

    std::string write(const std::string& content)
    {
        std::ofstream(m_path) << content;
        return m_path.string();
    }

    fs::path m_path;
};

app_config complete_config()
{
    app_config config;
    config.detection_url = "https://detect.example/m/1";
    config.detection_api_key = "a";
    config.gemini_api_key = "b";
    config.backend_url = "https://project.example";
    config.backend_key = "c";
    return config;
}

} // namespace

TEST_F(ConfigFileTest, OverlaysOnlyPresentFields)
{
    app_config config;
    apply_config_file(config, write(R"({
        "camera": "2",
        "width": 1280,
        "pixel_format": "MJPG",
        "max_cycles": 5,
        "retry_enabled": false,
        "device_label": "lobby",
        "gemini_model": null
    })"));

    EXPECT_EQ(config.camera, "2");
    EXPECT_EQ(config.width, 1280u);
    EXPECT_EQ(config.height, 480u);
    EXPECT_EQ(config.pixel_format, static_cast<unsigned int>(V4L2_PIX_FMT_MJPEG));
    EXPECT_EQ(config.max_cycles, 5u);
    EXPECT_FALSE(config.retry_enabled);
    EXPECT_EQ(config.device_label, "lobby");
    EXPECT_EQ(config.gemini_model, "gemini-flash-latest");
}

TEST_F(ConfigFileTest, RejectsBadFiles)
{
    app_config config;
    EXPECT_THROW(apply_config_file(config, (m_path.parent_path() / "does-not-exist.json").string()),
                 configuration_error);
    EXPECT_THROW(apply_config_file(config, write("[1, 2]")), configuration_error);
    EXPECT_THROW(apply_config_file(config, write("{\"width\": \"wide\"}")), configuration_error);
    EXPECT_THROW(apply_config_file(config, write("{\"pixel_format\": \"H264\"}")), configuration_error);
}

TEST(ConfigEnvironmentTest, EnvironmentOverridesAndIgnoresEmptyValues)
{
    std::map<std::string, std::string> env = {
        {"ROBOFLOW_MODEL_URL", "https://detect.example/m/2"},
        {"ROBOFLOW_MODE", "workflow"},
        {"GEMINI_API_KEY", "g"},
        {"SUPABASE_URL", ""},
        {"EDGE_DEVICE_LABEL", "gym"},
    };
    auto lookup = [&env](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    };

    app_config config;
    config.backend_url = "https://from-file.example";
    apply_environment(config, lookup);

    EXPECT_EQ(config.detection_url, "https://detect.example/m/2");
    EXPECT_EQ(config.detection_mode, "workflow");
    EXPECT_EQ(config.gemini_api_key, "g");
    EXPECT_EQ(config.backend_url, "https://from-file.example");
    EXPECT_EQ(config.device_label, "gym");
    EXPECT_TRUE(config.detection_api_key.empty());
}

TEST(ConfigValidateTest, ListsEveryMissingCredential)
{
    try {
        validate(app_config());
        FAIL() << "expected configuration_error";
    } catch (const configuration_error& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("ROBOFLOW_MODEL_URL"), std::string::npos);
        EXPECT_NE(message.find("ROBOFLOW_API_KEY"), std::string::npos);
        EXPECT_NE(message.find("GEMINI_API_KEY"), std::string::npos);
        EXPECT_NE(message.find("SUPABASE_URL"), std::string::npos);
        EXPECT_NE(message.find("SUPABASE_SERVICE_ROLE_KEY"), std::string::npos);
    }
}

TEST(ConfigValidateTest, AcceptsCompleteConfigAndChecksValues)
{
    app_config config = complete_config();
    EXPECT_NO_THROW(validate(config));

    config.detection_mode = "batch";
    EXPECT_THROW(validate(config), configuration_error);

    config = complete_config();
    config.camera = "webcam";
    EXPECT_THROW(validate(config), configuration_error);

    config = complete_config();
    config.poll_interval_ms = 0;
    EXPECT_THROW(validate(config), configuration_error);

    config = complete_config();
    config.device_label.clear();
    EXPECT_THROW(validate(config), configuration_error);
}

TEST(ConfigValidateTest, RejectsUnsupportedBaudRates)
{
    app_config config = complete_config();
    config.baud = 115200;
    EXPECT_NO_THROW(validate(config));

    config.baud = 14400;
    EXPECT_THROW(validate(config), configuration_error);

    config.baud = 0;
    EXPECT_THROW(validate(config), configuration_error);
}

TEST(CameraPathTest, IndexesAndPaths)
{
    EXPECT_EQ(camera_device_path("0"), "/dev/video0");
    EXPECT_EQ(camera_device_path("12"), "/dev/video12");
    EXPECT_EQ(camera_device_path("/dev/v4l/by-id/usb-cam"), "/dev/v4l/by-id/usb-cam");
    EXPECT_THROW(camera_device_path(""), configuration_error);
    EXPECT_THROW(camera_device_path("-1"), configuration_error);
    EXPECT_THROW(camera_device_path("/dev/"), configuration_error);
}

TEST(PixelFormatTest, KnownNames)
{
    EXPECT_EQ(parse_pixel_format("YUYV"), static_cast<unsigned int>(V4L2_PIX_FMT_YUYV));
    EXPECT_EQ(parse_pixel_format("MJPEG"), static_cast<unsigned int>(V4L2_PIX_FMT_MJPEG));
    EXPECT_THROW(parse_pixel_format("yuyv"), configuration_error);
}
