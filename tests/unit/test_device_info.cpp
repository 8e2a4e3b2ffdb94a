/**
 * @file test_device_info.cpp
 * @brief Unit tests for the device model and dimension matching.
 */

#include "model/device_info.hpp"

#include <gtest/gtest.h>

using namespace lab_alloc;

TEST(DimensionMatchTest, PlainValuesIgnoreCase) {
    EXPECT_TRUE(dimension_value_matches("Pixel 7", "pixel 7"));
    EXPECT_FALSE(dimension_value_matches("pixel 7", "pixel 7 pro"));
}

TEST(DimensionMatchTest, RegexValuesFullMatch) {
    EXPECT_TRUE(dimension_value_matches("regex:3[0-9]", "34"));
    EXPECT_FALSE(dimension_value_matches("regex:3[0-9]", "340"));
    EXPECT_FALSE(dimension_value_matches("regex:([", "34"));
}

TEST(DimensionSetTest, AddAndGet) {
    DimensionSet set;
    EXPECT_TRUE(set.empty());
    set.add("label", "a");
    set.add("label", "b");
    set.add("model", "pixel");

    EXPECT_EQ(set.get("label"), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(set.get("absent").empty());
    EXPECT_TRUE(set.has("model"));
    EXPECT_EQ(set.size(), 3u);
}

TEST(DeviceDimensionsTest, UnsupportedJobDimensions) {
    DeviceDimensions dims;
    dims.supported.add("model", "pixel 7");
    dims.required.add("pool_name", "private");

    JobDimensions job{{"model", "PIXEL 7"}, {"pool_name", "private"}, {"sdk_version", "34"}};
    auto unsupported = dims.unsupported_job_dimensions(job);
    EXPECT_EQ(unsupported, (JobDimensions{{"sdk_version", "34"}}));
}

TEST(DeviceDimensionsTest, UnsatisfiedDeviceDimensions) {
    DeviceDimensions dims;
    dims.required.add("pool_name", "private");
    dims.required.add("label", "team-a");

    auto unsatisfied = dims.unsatisfied_device_dimensions(JobDimensions{{"pool_name", "private"}});
    ASSERT_EQ(unsatisfied.size(), 1u);
    EXPECT_EQ(unsatisfied.at("label"), (std::set<std::string>{"team-a"}));

    auto satisfied = dims.unsatisfied_device_dimensions(
        JobDimensions{{"pool_name", "private"}, {"label", "regex:team-.*"}});
    EXPECT_TRUE(satisfied.empty());
}

TEST(DeviceInfoTest, OwnersSupport) {
    DeviceInfo device;
    EXPECT_TRUE(device.owners_support("anyone"));

    device.owners = {"alice", "lab-team"};
    EXPECT_TRUE(device.owners_support("alice"));
    EXPECT_FALSE(device.owners_support("bob"));
}

TEST(DeviceInfoTest, UnsupportedDecorators) {
    DeviceInfo device;
    device.decorators = {"AndroidLogCatDecorator", "AndroidFilePullerDecorator"};

    auto unsupported = device.unsupported_decorators(
        {"AndroidLogCatDecorator", "AndroidHdVideoDecorator"});
    EXPECT_EQ(unsupported, (std::set<std::string>{"AndroidHdVideoDecorator"}));
}

TEST(DeviceLocatorTest, UniversalId) {
    DeviceLocator locator{"serial-1", LabLocator{"10.0.0.1", "host"}};
    EXPECT_EQ(locator.universal_id(), "serial-1@10.0.0.1");
}
