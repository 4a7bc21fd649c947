#include "space/space_evaluator.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

namespace SpaceCheck::Space
{
namespace
{

using Probe::CapacityInfo;
using Probe::MakeCapacityInfo;
using Probe::ProbeErrc;
using Probe::ProbeResult;

constexpr std::int64_t kGigabyte = 1'000'000'000LL;

ProbeResult<CapacityInfo> Capacity(std::int64_t total, std::int64_t free, std::int64_t available)
{
    return MakeCapacityInfo(total, free, available);
}

ProbeResult<CapacityInfo> FailedProbe()
{
    return std::unexpected(make_error_code(ProbeErrc::AllStrategiesFailed));
}

TEST(SpaceEvaluatorTest, AmpleSpaceIsSufficientWithoutWarning)
{
    const auto verdict =
        Evaluate("/backup", Capacity(1000 * kGigabyte, 500 * kGigabyte, 500 * kGigabyte), 10 * kGigabyte);

    EXPECT_TRUE(verdict.sufficient);
    EXPECT_FALSE(verdict.low_free_after_copy);
    EXPECT_NEAR(verdict.percent_free_after_copy, 49.0, 1e-9);
    EXPECT_EQ(verdict.total_required_bytes, 10 * kGigabyte + 100'000'000);
    EXPECT_FALSE(verdict.warning_message.has_value());
    EXPECT_FALSE(verdict.error_message.has_value());
    EXPECT_FALSE(verdict.BlocksCopy());
}

TEST(SpaceEvaluatorTest, InsufficientSpaceCitesRequiredAndAvailable)
{
    const auto verdict = Evaluate(
        "/backup", Capacity(1000 * kGigabyte, 500 * kGigabyte, 500 * kGigabyte), 990 * kGigabyte
    );

    EXPECT_FALSE(verdict.sufficient);
    ASSERT_TRUE(verdict.error_message.has_value());
    EXPECT_EQ(*verdict.error_message, "Insufficient space: Need 990.1 GB but only 500.0 GB available");
    EXPECT_FALSE(verdict.warning_message.has_value());
    EXPECT_TRUE(verdict.BlocksCopy());
}

TEST(SpaceEvaluatorTest, LowFreeAfterCopyWarnsButDoesNotBlock)
{
    const auto verdict = Evaluate(
        "/backup", Capacity(100 * kGigabyte, 15 * kGigabyte, 15 * kGigabyte), 6 * kGigabyte
    );

    EXPECT_TRUE(verdict.sufficient);
    EXPECT_TRUE(verdict.low_free_after_copy);
    EXPECT_NEAR(verdict.percent_free_after_copy, 9.0, 1e-9);
    ASSERT_TRUE(verdict.warning_message.has_value());
    EXPECT_EQ(
        *verdict.warning_message, "Low disk space warning: After backup, only 9.0% will remain free"
    );
    EXPECT_FALSE(verdict.error_message.has_value());
    EXPECT_FALSE(verdict.BlocksCopy());
}

TEST(SpaceEvaluatorTest, InsufficientAndLowFreeReportsOnlyTheError)
{
    const auto verdict = Evaluate(
        "/backup", Capacity(100 * kGigabyte, 5 * kGigabyte, 5 * kGigabyte), 50 * kGigabyte
    );

    EXPECT_FALSE(verdict.sufficient);
    EXPECT_TRUE(verdict.low_free_after_copy);
    EXPECT_TRUE(verdict.error_message.has_value());
    EXPECT_FALSE(verdict.warning_message.has_value());
}

TEST(SpaceEvaluatorTest, PercentAfterCopyMayBeNegative)
{
    const auto verdict = Evaluate(
        "/backup", Capacity(100 * kGigabyte, 10 * kGigabyte, 10 * kGigabyte), 30 * kGigabyte
    );

    EXPECT_NEAR(verdict.percent_free_after_copy, -20.0, 1e-9);
    EXPECT_TRUE(verdict.low_free_after_copy);
}

TEST(SpaceEvaluatorTest, ExactFitIncludingBufferIsSufficient)
{
    EvaluationPolicy policy;
    policy.safety_buffer_bytes = 1000;
    const auto verdict =
        Evaluate("/backup", Capacity(100'000, 50'000, 50'000), 49'000, policy);

    EXPECT_TRUE(verdict.sufficient);
    EXPECT_EQ(verdict.total_required_bytes, 50'000);
}

TEST(SpaceEvaluatorTest, FailedProbeIsInsufficientAndLow)
{
    const auto verdict = Evaluate("/gone", FailedProbe(), 1);

    EXPECT_FALSE(verdict.sufficient);
    EXPECT_TRUE(verdict.low_free_after_copy);
    ASSERT_TRUE(verdict.error_message.has_value());
    EXPECT_EQ(*verdict.error_message, "Unable to determine available disk space");
    EXPECT_FALSE(verdict.warning_message.has_value());
    EXPECT_EQ(verdict.capacity, CapacityInfo{});
}

TEST(SpaceEvaluatorTest, ZeroRequiredStillNeedsTheBuffer)
{
    const auto verdict = Evaluate("/backup", Capacity(1'000'000'000, 50'000'000, 50'000'000), 0);

    EXPECT_EQ(verdict.total_required_bytes, 100'000'000);
    EXPECT_FALSE(verdict.sufficient);
}

TEST(SpaceEvaluatorTest, CustomThresholdControlsWarning)
{
    EvaluationPolicy policy;
    policy.low_free_threshold_percent = 50.0;
    const auto verdict = Evaluate(
        "/backup", Capacity(1000 * kGigabyte, 500 * kGigabyte, 500 * kGigabyte), 10 * kGigabyte,
        policy
    );

    EXPECT_TRUE(verdict.sufficient);
    EXPECT_TRUE(verdict.low_free_after_copy);
    ASSERT_TRUE(verdict.warning_message.has_value());
    EXPECT_EQ(
        *verdict.warning_message,
        "Low disk space warning: After backup, only 49.0% will remain free"
    );
}

TEST(SpaceEvaluatorTest, HugeRequiredSaturatesInsteadOfOverflowing)
{
    const auto verdict = Evaluate(
        "/backup", Capacity(1000 * kGigabyte, 500 * kGigabyte, 500 * kGigabyte),
        std::numeric_limits<std::int64_t>::max()
    );

    EXPECT_EQ(verdict.total_required_bytes, std::numeric_limits<std::int64_t>::max());
    EXPECT_FALSE(verdict.sufficient);
}

TEST(SpaceEvaluatorTest, SameInputsGiveSameVerdict)
{
    const auto capacity = Capacity(100 * kGigabyte, 15 * kGigabyte, 14 * kGigabyte);
    EXPECT_EQ(Evaluate("/a", capacity, kGigabyte), Evaluate("/a", capacity, kGigabyte));
}

TEST(SpaceEvaluatorTest, VerdictEchoesInputs)
{
    const auto capacity = Capacity(100 * kGigabyte, 40 * kGigabyte, 30 * kGigabyte);
    const auto verdict  = Evaluate("/data/backups", capacity, 2 * kGigabyte);

    EXPECT_EQ(verdict.destination, std::filesystem::path("/data/backups"));
    EXPECT_EQ(verdict.required_bytes, 2 * kGigabyte);
    EXPECT_EQ(verdict.capacity, *capacity);
    EXPECT_EQ(verdict.FormattedRequired(), "2.0 GB");
}

TEST(EvaluationPolicyTest, Validity)
{
    EXPECT_TRUE(EvaluationPolicy{}.IsValid());

    EvaluationPolicy negative_buffer;
    negative_buffer.safety_buffer_bytes = -1;
    EXPECT_FALSE(negative_buffer.IsValid());

    EvaluationPolicy zero_threshold;
    zero_threshold.low_free_threshold_percent = 0.0;
    EXPECT_FALSE(zero_threshold.IsValid());

    EvaluationPolicy over_hundred;
    over_hundred.low_free_threshold_percent = 100.5;
    EXPECT_FALSE(over_hundred.IsValid());
}

}  // namespace
}  // namespace SpaceCheck::Space
