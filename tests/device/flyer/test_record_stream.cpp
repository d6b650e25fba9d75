/*
 * test_record_stream.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-2

Description: Tests for RecordStream and acquisition types

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "device/flyer/acquisition_types.hpp"
#include "device/flyer/record_stream.hpp"

#include <vector>

using namespace flyscan::device;

namespace {

std::vector<AcquisitionRecord> makeRecords(int count) {
    std::vector<AcquisitionRecord> records;
    for (int i = 1; i <= count; ++i) {
        AcquisitionRecord record;
        record.time = 1000.0 + i;
        record.seqNum = i;
        record.data["det_file"] = "/data/spin_00000" + std::to_string(i) + ".h5";
        record.timestamps["det_file"] = 999.0 + i;
        records.push_back(record);
    }
    return records;
}

}  // namespace

// ========== RecordStream Tests ==========

TEST(RecordStreamTest, Empty_IsExhausted) {
    RecordStream stream;
    EXPECT_TRUE(stream.exhausted());
    EXPECT_EQ(stream.remaining(), 0u);
    EXPECT_FALSE(stream.next().has_value());
}

TEST(RecordStreamTest, Next_YieldsInsertionOrder) {
    RecordStream stream(makeRecords(3));
    EXPECT_EQ(stream.remaining(), 3u);

    EXPECT_EQ(stream.next()->seqNum, 1);
    EXPECT_EQ(stream.next()->seqNum, 2);
    EXPECT_EQ(stream.remaining(), 1u);
    EXPECT_EQ(stream.next()->seqNum, 3);
    EXPECT_FALSE(stream.next().has_value());
}

TEST(RecordStreamTest, RangeFor_ConsumesStream) {
    RecordStream stream(makeRecords(4));

    std::vector<int> seen;
    for (const auto& record : stream) {
        seen.push_back(record.seqNum);
    }
    EXPECT_THAT(seen, ::testing::ElementsAre(1, 2, 3, 4));
    EXPECT_TRUE(stream.exhausted());

    int secondPass = 0;
    for (const auto& record : stream) {
        (void)record;
        ++secondPass;
    }
    EXPECT_EQ(secondPass, 0);
}

TEST(RecordStreamTest, RangeFor_ResumesAfterNext) {
    RecordStream stream(makeRecords(3));
    ASSERT_EQ(stream.next()->seqNum, 1);

    std::vector<int> seen;
    for (const auto& record : stream) {
        seen.push_back(record.seqNum);
    }
    EXPECT_THAT(seen, ::testing::ElementsAre(2, 3));
}

TEST(RecordStreamTest, MovedStream_KeepsPosition) {
    RecordStream stream(makeRecords(2));
    ASSERT_TRUE(stream.next().has_value());

    RecordStream moved(std::move(stream));
    EXPECT_EQ(moved.remaining(), 1u);
    EXPECT_EQ(moved.next()->seqNum, 2);
}

// ========== AcquisitionRecord Tests ==========

TEST(AcquisitionRecordTest, ToJson_UsesEventLayout) {
    auto record = makeRecords(1).front();
    auto json = record.toJson();

    EXPECT_DOUBLE_EQ(json["time"].get<double>(), 1001.0);
    EXPECT_EQ(json["seq_num"], 1);
    EXPECT_EQ(json["data"]["det_file"], "/data/spin_000001.h5");
    EXPECT_DOUBLE_EQ(json["timestamps"]["det_file"].get<double>(), 1000.0);
}

// ========== Command Parsing Tests ==========

TEST(FlyerCommandTest, Parse_IsCaseInsensitive) {
    EXPECT_EQ(parseFlyerCommand("taxi").value(), FlyerCommand::Taxi);
    EXPECT_EQ(parseFlyerCommand("FLY").value(), FlyerCommand::Fly);
    EXPECT_EQ(parseFlyerCommand("Return").value(), FlyerCommand::Return);
}

TEST(FlyerCommandTest, Parse_RejectsUnknownToken) {
    for (const char* token : {"Spin", "", "taxi ", "kickoff"}) {
        auto result = parseFlyerCommand(token);
        ASSERT_FALSE(result.has_value()) << token;
        EXPECT_EQ(result.error().code, DeviceErrorCode::InvalidArgument);
    }
}

TEST(FlyerCommandTest, ToString_RoundTripsThroughParse) {
    for (auto command :
         {FlyerCommand::Taxi, FlyerCommand::Fly, FlyerCommand::Return}) {
        EXPECT_EQ(parseFlyerCommand(flyerCommandToString(command)).value(),
                  command);
    }
}

TEST(FlyerCommandTest, StateAndPhaseNames) {
    EXPECT_EQ(acquisitionStateToString(AcquisitionState::Taxiing), "Taxiing");
    EXPECT_EQ(acquisitionStateToString(AcquisitionState::Busy), "Busy");
    EXPECT_EQ(protocolPhaseToString(ProtocolPhase::Completed), "Completed");
}
