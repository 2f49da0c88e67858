#include <gtest/gtest.h>

#include "SerialDevice/PortDescriptor.hpp"

using namespace SerialDevice;

TEST(PortDescriptor, ParsesUsbStyleHardwareId) {
    std::string vid, pid;
    ASSERT_TRUE(parseHardwareId("USB VID:PID=16C0:0483 SNR=2145930", vid, pid));
    EXPECT_EQ(vid, "16c0");
    EXPECT_EQ(pid, "0483");
}

TEST(PortDescriptor, ParsesWindowsStyleHardwareId) {
    std::string vid, pid;
    ASSERT_TRUE(parseHardwareId("FTDIBUS\\VID_0403+PID_6001+A600\\0000", vid, pid));
    EXPECT_EQ(vid, "0403");
    EXPECT_EQ(pid, "6001");
}

TEST(PortDescriptor, RejectsHardwareIdWithoutUsbIds) {
    std::string vid = "keep";
    std::string pid = "keep";
    EXPECT_FALSE(parseHardwareId("n/a", vid, pid));
    EXPECT_FALSE(parseHardwareId("PNP0501", vid, pid));
    EXPECT_EQ(vid, "keep");
    EXPECT_EQ(pid, "keep");
}

TEST(PortDescriptor, FormatsHardwareId) {
    EXPECT_EQ(formatHardwareId("2341", "0043", ""), "USB VID:PID=2341:0043");
    EXPECT_EQ(formatHardwareId("2341", "0043", "7543"), "USB VID:PID=2341:0043 SER=7543");
    EXPECT_EQ(formatHardwareId("", "0043", "7543"), "n/a");
}

TEST(PortDescriptor, VidPidRequiresBothIds) {
    PortDescriptor port("/dev/ttyUSB0");
    EXPECT_FALSE(port.hasUsbIds());
    EXPECT_EQ(port.vidPid(), "");

    port.vendorId = "0403";
    EXPECT_EQ(port.vidPid(), "");

    port.productId = "6001";
    EXPECT_TRUE(port.hasUsbIds());
    EXPECT_EQ(port.vidPid(), "0403:6001");
}

TEST(PortDescriptor, FromJsonDerivesIdsFromHardwareId) {
    json j = {
        {"devicePath", "/dev/ttyACM0"},
        {"hardwareId", "USB VID:PID=2341:0043 SER=7543"}
    };

    PortDescriptor port = PortDescriptor::fromJson(j);

    EXPECT_EQ(port.devicePath, "/dev/ttyACM0");
    EXPECT_EQ(port.vendorId, "2341");
    EXPECT_EQ(port.productId, "0043");
    EXPECT_EQ(port.description, "");
}

TEST(PortDescriptor, FromJsonLowercasesExplicitIds) {
    PortDescriptor port = PortDescriptor::fromJson({{"devicePath", "/dev/ttyUSB3"},
                                                    {"vendorId", "10C4"},
                                                    {"productId", "EA60"}});
    EXPECT_EQ(port.vidPid(), "10c4:ea60");
}

TEST(PortDescriptor, JsonKeepsEveryField) {
    PortDescriptor port("/dev/ttyUSB0");
    port.description = "FT232R USB UART";
    port.vendorId = "0403";
    port.productId = "6001";
    port.serialNumber = "A600XYZ";
    port.manufacturer = "FTDI";
    port.hardwareId = formatHardwareId(port.vendorId, port.productId, port.serialNumber);

    json j = port.toJson();
    EXPECT_EQ(j["manufacturer"], "FTDI");
    EXPECT_EQ(j["hardwareId"], "USB VID:PID=0403:6001 SER=A600XYZ");
    EXPECT_EQ(PortDescriptor::fromJson(j), port);
}

TEST(PortDescriptor, PortsToJsonKeepsOrder) {
    json j = portsToJson({PortDescriptor("/dev/ttyUSB1"), PortDescriptor("/dev/ttyACM0")});
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0]["devicePath"], "/dev/ttyUSB1");
    EXPECT_EQ(j[1]["devicePath"], "/dev/ttyACM0");
}
