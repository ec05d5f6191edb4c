/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <celltrack/sensors.hpp>

namespace celltrack {
namespace {

class SensorsTest : public ::testing::Test {
protected:
    Sensors sensors{DEFAULT_LATITUDE, DEFAULT_LONGITUDE, 12345};
};

TEST_F(SensorsTest, Readings_StayInRange) {
    for (int i = 0; i < 500; i++) {
        double temperature = sensors.readTemperature();
        EXPECT_GE(temperature, 18.0);
        EXPECT_LE(temperature, 24.0);

        double humidity = sensors.readHumidity();
        EXPECT_GE(humidity, 35.0);
        EXPECT_LE(humidity, 50.0);
    }
}

TEST_F(SensorsTest, Battery_DrainsAndResets) {
    uint8_t previous = 100;
    bool reset = false;
    for (int i = 0; i < 1000; i++) {
        uint8_t battery = sensors.readBattery();
        EXPECT_GE(battery, 5);
        EXPECT_LE(battery, 100);
        if (battery > previous) {
            EXPECT_EQ(battery, 100);
            reset = true;
        } else {
            EXPECT_LE(previous - battery, 1);
        }
        previous = battery;
    }
    EXPECT_TRUE(reset);
}

TEST_F(SensorsTest, Location_DriftsEast) {
    auto start = sensors.readLocation();
    GnssLocation last = start;
    for (int i = 0; i < 100; i++) {
        last = sensors.readLocation();
    }
    EXPECT_GT(last.longitude, start.longitude);
    EXPECT_NEAR(last.latitude, start.latitude, 0.01);
}

TEST_F(SensorsTest, Steps_ScaleWithWindow) {
    for (int i = 0; i < 100; i++) {
        uint32_t steps = sensors.readSteps(600);
        EXPECT_GE(steps, 480u - 5u);
        EXPECT_LE(steps, 1080u + 5u);
    }
    EXPECT_LE(sensors.readSteps(0), 7u);
}

TEST_F(SensorsTest, SameSeed_SameReadings) {
    Sensors other{DEFAULT_LATITUDE, DEFAULT_LONGITUDE, 12345};
    EXPECT_DOUBLE_EQ(sensors.readTemperature(), other.readTemperature());
    EXPECT_EQ(sensors.readSteps(60), other.readSteps(60));
}

} // namespace
} // namespace celltrack
