#include <gtest/gtest.h>

#include "SerialDevice/ConnectionConfig.hpp"
#include <stdexcept>

using namespace SerialDevice;

TEST(ConnectionConfig, DefaultsAreValid) {
    ConnectionConfig config;
    EXPECT_EQ(config.baudrate, 115200);
    EXPECT_EQ(config.dataBits, 8);
    EXPECT_EQ(config.parity, Parity::NONE);
    EXPECT_EQ(config.stopBits, 1);
    EXPECT_EQ(config.flowControl, FlowControl::NONE);
    EXPECT_TRUE(config.exclusive);
    EXPECT_NO_THROW(config.validate());
}

TEST(ConnectionConfig, ValidateRejectsUnsupportedSettings) {
    ConnectionConfig config;
    config.baudrate = 12345;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = ConnectionConfig();
    config.dataBits = 9;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = ConnectionConfig();
    config.stopBits = 3;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = ConnectionConfig();
    config.readTimeoutMs = -1;
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(ConnectionConfig, SupportedBaudrates) {
    EXPECT_TRUE(isSupportedBaudrate(9600));
    EXPECT_TRUE(isSupportedBaudrate(921600));
    EXPECT_FALSE(isSupportedBaudrate(0));
    EXPECT_FALSE(isSupportedBaudrate(100));
}

TEST(ConnectionConfig, FromJsonKeepsDefaultsForMissingKeys) {
    ConnectionConfig config = ConnectionConfig::fromJson({{"baudrate", 9600}, {"parity", "EVEN"}});

    EXPECT_EQ(config.baudrate, 9600);
    EXPECT_EQ(config.parity, Parity::EVEN);
    EXPECT_EQ(config.dataBits, 8);
    EXPECT_EQ(config.readTimeoutMs, 500);
}

TEST(ConnectionConfig, ToJsonUsesNames) {
    ConnectionConfig config;
    config.parity = Parity::ODD;
    config.flowControl = FlowControl::HARDWARE;
    config.stopBits = 2;

    json j = config.toJson();
    EXPECT_EQ(j["parity"], "odd");
    EXPECT_EQ(j["flowControl"], "hardware");

    ConnectionConfig parsed = ConnectionConfig::fromJson(j);
    EXPECT_EQ(parsed.parity, Parity::ODD);
    EXPECT_EQ(parsed.flowControl, FlowControl::HARDWARE);
    EXPECT_EQ(parsed.stopBits, 2);
}

TEST(ConnectionConfig, FlowControlAliases) {
    EXPECT_EQ(flowControlFromString("rtscts"), FlowControl::HARDWARE);
    EXPECT_EQ(flowControlFromString("XonXoff"), FlowControl::SOFTWARE);
    EXPECT_THROW(flowControlFromString("dtrdsr"), std::invalid_argument);
    EXPECT_THROW(parityFromString("mark"), std::invalid_argument);
}
