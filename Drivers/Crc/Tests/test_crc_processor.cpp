#include <optional>
#include <random>
#include <vector>
#include <gtest/gtest.h>

#include "Drivers/Crc/CrcProcessor.hpp"
#include "Drivers/Runtime/Claims.hpp"
#include "Drivers/STM32HAL/stm32hal.h"

using namespace Drivers::Crc;
USING_SIMULATOR_NAMESPACE;

namespace {
    const std::vector<uint8_t> kWriteGoal = {
        0xFF, 0xFF, 0xFD, 0x00, 0x01, 0x09, 0x00, 0x03, 0x74, 0x00, 0x00, 0x02, 0x00, 0x00 };
    const std::vector<uint8_t> kReadPosition = {
        0xFF, 0xFF, 0xFD, 0x00, 0x01, 0x07, 0x00, 0x02, 0x84, 0x00, 0x04, 0x00 };
}

class CrcProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        SIM_ResetAll();
        Drivers::Runtime::resetClaims();

        hcrc = CRC_HandleTypeDef();
        hcrc.Instance = CRC;
    }

    CrcBytes calc(CrcProcessor& crc, const std::vector<uint8_t>& data) {
        const std::optional<CrcBytes> value = crc.calculate(data.data(), data.size());
        if (!value) ADD_FAILURE() << "CRC unit unexpectedly busy";
        return value.value_or(CrcBytes{ 0xEE, 0xEE });
    }

    CRC_HandleTypeDef hcrc;
};

TEST_F(CrcProcessorTest, ConfiguresTheUnit) {
    CrcProcessor crc({ &hcrc });

    EXPECT_EQ(hcrc.State, HAL_CRC_STATE_READY);
    EXPECT_EQ(CRC->POL, 0x8005u);
    EXPECT_EQ(CRC->INIT, 0u);
    EXPECT_TRUE(Drivers::Runtime::isClaimed(CRC, 0));
}

TEST_F(CrcProcessorTest, KnownVectors) {
    CrcProcessor crc({ &hcrc });

    EXPECT_EQ(calc(crc, kWriteGoal),    (CrcBytes{ 0xCA, 0x89 }));
    EXPECT_EQ(calc(crc, kReadPosition), (CrcBytes{ 0x1D, 0x15 }));
    EXPECT_EQ(calc(crc, {}),            (CrcBytes{ 0x00, 0x00 }));
}

TEST_F(CrcProcessorTest, Idempotent) {
    CrcProcessor crc({ &hcrc });

    const CrcBytes first = calc(crc, kWriteGoal);
    EXPECT_EQ(calc(crc, kWriteGoal), first);
    EXPECT_EQ(calc(crc, kWriteGoal), first);
}

TEST_F(CrcProcessorTest, CorruptionIsDetected) {
    CrcProcessor crc({ &hcrc });

    std::vector<uint8_t> corrupted = kWriteGoal;
    corrupted[11] ^= 0x01;
    EXPECT_NE(calc(crc, corrupted), calc(crc, kWriteGoal));
}

TEST_F(CrcProcessorTest, AgreesWithSoftwareForms) {
    CrcProcessor crc({ &hcrc });
    std::mt19937 rng(0x5EED);

    for (size_t len = 0; len < 300; len += 7) {
        std::vector<uint8_t> data(len);
        for (uint8_t& byte : data) byte = (uint8_t)rng();

        const CrcBytes hw = calc(crc, data);
        EXPECT_EQ(hw, toLittleEndian(crc16Table(data.data(), data.size()))) << "len " << len;
        EXPECT_EQ(hw, toLittleEndian(crc16Bitwise(data.data(), data.size()))) << "len " << len;
    }
}

TEST_F(CrcProcessorTest, SessionFeedsInChunks) {
    CrcProcessor crc({ &hcrc });

    std::optional<CrcProcessor::Session> session = crc.tryBegin();
    ASSERT_TRUE(session.has_value());
    EXPECT_TRUE(crc.busy());

    session->feed(kWriteGoal.data(), 5);
    session->feed(kWriteGoal.data() + 5, kWriteGoal.size() - 5);
    EXPECT_EQ(session->finish(), (CrcBytes{ 0xCA, 0x89 }));
    EXPECT_FALSE(session->active());
    EXPECT_FALSE(crc.busy());
}

TEST_F(CrcProcessorTest, EmptySessionIsZero) {
    CrcProcessor crc({ &hcrc });
    calc(crc, kWriteGoal);

    std::optional<CrcProcessor::Session> session = crc.tryBegin();
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->finish(), (CrcBytes{ 0x00, 0x00 }));
}

TEST_F(CrcProcessorTest, SecondUserWaitsForTheSession) {
    CrcProcessor crc({ &hcrc });

    std::optional<CrcProcessor::Session> first = crc.tryBegin();
    ASSERT_TRUE(first.has_value());
    first->feed(kReadPosition.data(), 6);

    // Another task polls while the first one is suspended mid-computation
    EXPECT_FALSE(crc.tryBegin().has_value());

    first->feed(kReadPosition.data() + 6, kReadPosition.size() - 6);
    EXPECT_EQ(first->finish(), (CrcBytes{ 0x1D, 0x15 }));

    std::optional<CrcProcessor::Session> second = crc.tryBegin();
    ASSERT_TRUE(second.has_value());
    second->feed(kWriteGoal.data(), kWriteGoal.size());
    EXPECT_EQ(second->finish(), (CrcBytes{ 0xCA, 0x89 }));
}

TEST_F(CrcProcessorTest, DroppedSessionReleasesTheUnit) {
    CrcProcessor crc({ &hcrc });
    {
        std::optional<CrcProcessor::Session> session = crc.tryBegin();
        ASSERT_TRUE(session.has_value());
        EXPECT_TRUE(crc.busy());
    }
    EXPECT_FALSE(crc.busy());
    EXPECT_EQ(calc(crc, kWriteGoal), (CrcBytes{ 0xCA, 0x89 }));
}

TEST_F(CrcProcessorTest, CalculateDuringSessionIsToldToRetry) {
    CrcProcessor crc({ &hcrc });

    // One task is suspended halfway through its packet
    std::optional<CrcProcessor::Session> session = crc.tryBegin();
    ASSERT_TRUE(session.has_value());
    session->feed(kReadPosition.data(), 4);

    // Another task polls and wants a one-shot checksum
    EXPECT_FALSE(crc.calculate(kWriteGoal.data(), 8).has_value());
    EXPECT_TRUE(crc.busy());

    // The held computation is not disturbed
    session->feed(kReadPosition.data() + 4, kReadPosition.size() - 4);
    EXPECT_EQ(session->finish(), (CrcBytes{ 0x1D, 0x15 }));

    // Next poll goes through
    const std::optional<CrcBytes> retried = crc.calculate(kWriteGoal.data(), kWriteGoal.size());
    ASSERT_TRUE(retried.has_value());
    EXPECT_EQ(*retried, (CrcBytes{ 0xCA, 0x89 }));
    EXPECT_FALSE(crc.busy());
}

TEST_F(CrcProcessorTest, FinishedSessionCannotBeReused) {
    CrcProcessor crc({ &hcrc });
    std::optional<CrcProcessor::Session> session = crc.tryBegin();
    session->finish();

    EXPECT_THROW(session->feed(kWriteGoal.data(), 1), std::runtime_error);
    EXPECT_THROW(session->finish(), std::runtime_error);
}

TEST_F(CrcProcessorTest, UnitClaimedOnce) {
    CrcProcessor crc({ &hcrc });
    CRC_HandleTypeDef other = CRC_HandleTypeDef();
    other.Instance = CRC;

    EXPECT_THROW(CrcProcessor({ &other }), std::runtime_error);
}
