#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>

#include "common/errors.hpp"
#include "serial/port_scanner.hpp"

using namespace sorter;
namespace fs = std::filesystem;

TEST(ResolvePortTest, PicksTheSingleKnownAdapter)
{
    std::vector<port_descriptor> ports = {
        {"/dev/ttyS0", "ttyS0", ""},
        {"/dev/ttyS1", "n/a", ""},
        {"/dev/ttyUSB0", "USB-SERIAL CH340", "QinHeng Electronics"},
        {"/dev/ttyAMA0", "ttyAMA0", ""},
    };
    EXPECT_EQ(resolve_port(ports, ""), "/dev/ttyUSB0");
}

TEST(ResolvePortTest, PrefersTheHighestScore)
{
    std::vector<port_descriptor> ports = {
        {"/dev/ttyUSB0", "USB Serial", ""},
        {"/dev/ttyACM0", "Arduino Uno USB VID:PID=2341:0043", "Arduino (www.arduino.cc)"},
    };
    EXPECT_EQ(resolve_port(ports, ""), "/dev/ttyACM0");
}

TEST(ResolvePortTest, FallsBackToTheFirstPort)
{
    std::vector<port_descriptor> ports = {
        {"/dev/ttyS0", "ttyS0", ""},
        {"/dev/ttyS1", "ttyS1", ""},
    };
    EXPECT_EQ(resolve_port(ports, ""), "/dev/ttyS0");
}

TEST(ResolvePortTest, OverrideWinsEvenWithoutPorts)
{
    EXPECT_EQ(resolve_port({}, "/dev/ttyFAKE"), "/dev/ttyFAKE");
}

TEST(ResolvePortTest, NoPortsIsAnError)
{
    EXPECT_THROW(resolve_port({}, ""), no_port_found_error);
}

TEST(ScorePortTest, MatchesIsCaseInsensitive)
{
    EXPECT_GT(score_port({"/dev/ttyUSB0", "cp2102 usb to uart", "Silicon Labs"}), 0);
    EXPECT_EQ(score_port({"/dev/ttyS0", "ttyS0", ""}), 0);
}

class EnumeratePortsTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        std::random_device rd;
        m_root = fs::temp_directory_path() / ("sorter_sysfs_" + std::to_string(rd()));
        fs::create_directories(m_root / "class/tty");
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(m_root, ec);
    }

    static void write(const fs::path& path, const std::string& value)
    {
        std::ofstream(path) << value << "\n";
    }

    fs::path m_root;
};

TEST_F(EnumeratePortsTest, DescribesUsbAdaptersAndSkipsVirtualTtys)
{
    fs::path usb = m_root / "devices/usb1/1-1";
    fs::path iface = usb / "1-1:1.0/ttyUSB0";
    fs::create_directories(iface);
    write(usb / "idVendor", "1a86");
    write(usb / "idProduct", "7523");
    write(usb / "product", "USB2.0-Serial");
    write(usb / "manufacturer", "QinHeng");

    fs::path platform = m_root / "devices/platform/serial8250/tty/ttyS0";
    fs::create_directories(platform);

    fs::create_directories(m_root / "class/tty/ttyUSB0");
    fs::create_directory_symlink(iface, m_root / "class/tty/ttyUSB0/device");
    fs::create_directories(m_root / "class/tty/ttyS0");
    fs::create_directory_symlink(platform, m_root / "class/tty/ttyS0/device");
    fs::create_directories(m_root / "class/tty/tty1");   // virtual console, no device link

    std::vector<port_descriptor> ports = enumerate_serial_ports((m_root / "class/tty").string());

    ASSERT_EQ(ports.size(), 2u);
    EXPECT_EQ(ports[0].device_path, "/dev/ttyS0");
    EXPECT_EQ(ports[1].device_path, "/dev/ttyUSB0");
    EXPECT_EQ(ports[1].manufacturer, "QinHeng");
    EXPECT_NE(ports[1].description.find("USB2.0-Serial"), std::string::npos);
    EXPECT_NE(ports[1].description.find("1a86:7523"), std::string::npos);

    EXPECT_EQ(resolve_port(ports, ""), "/dev/ttyUSB0");
}

TEST_F(EnumeratePortsTest, MissingDirectoryYieldsNothing)
{
    EXPECT_TRUE(enumerate_serial_ports((m_root / "nope").string()).empty());
}
