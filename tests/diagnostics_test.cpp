#include "diagnose/diagnostics.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace capture_bench;

TEST(Diagnostics, CaptureRelatedUsbLines) {
    EXPECT_TRUE(Diagnostics::isCaptureRelatedUsbLine(
        "Bus 001 Device 004: ID 0fd9:0066 Elgato Systems GmbH Cam Link 4K"));
    EXPECT_TRUE(Diagnostics::isCaptureRelatedUsbLine(
        "Bus 002 Device 002: ID 534d:2109 MacroSilicon USB Video"));
    EXPECT_TRUE(Diagnostics::isCaptureRelatedUsbLine(
        "Bus 001 Device 005: ID 07ca:0553 AVerMedia Technologies, Inc. Live Gamer Portable 2"));
    EXPECT_FALSE(Diagnostics::isCaptureRelatedUsbLine(
        "Bus 001 Device 001: ID 1d6b:0002 Linux Foundation 2.0 root hub"));
}

TEST(Diagnostics, LastLinesOfFile) {
    test::TempDir dir;
    test::writeFile(dir.file("err.log"), "one\ntwo\nthree\nfour\n");

    EXPECT_EQ(Diagnostics::lastLines(dir.file("err.log"), 2),
              (std::vector<std::string>{"three", "four"}));
    EXPECT_EQ(Diagnostics::lastLines(dir.file("err.log"), 10).size(), 4u);
    EXPECT_TRUE(Diagnostics::lastLines(dir.file("missing.log"), 5).empty());
}

TEST(Diagnostics, UnknownGroupHasNoMembers) {
    EXPECT_FALSE(Diagnostics::userInGroup("no-such-group-for-capture-bench"));
}

TEST(Diagnostics, RunsWithoutDevicesOrFfmpeg) {
    test::TempDir dir;
    DiagnosticsOptions options;
    options.ffmpeg_path = "/nonexistent/ffmpeg";
    options.dev_dir = dir.path().string();
    Diagnostics(options).run();
}
