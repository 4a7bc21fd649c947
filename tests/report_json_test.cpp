#include "space/report_json.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

namespace SpaceCheck::Space
{
namespace
{

SpaceVerdict HealthyVerdict()
{
    SpaceVerdict verdict;
    verdict.destination                = "/mnt/nas";
    verdict.capacity                   = Probe::MakeCapacityInfo(1000, 400, 300);
    verdict.capacity.source            = Probe::CapacitySource::LowLevelStatistics;
    verdict.capacity.filesystem_type   = "nfs";
    verdict.capacity.is_network_mount  = true;
    verdict.required_bytes             = 100;
    verdict.total_required_bytes       = 200;
    verdict.percent_free_after_copy    = 30.0;
    verdict.sufficient                 = true;
    return verdict;
}

TEST(ReportJsonTest, CapacityFields)
{
    const auto j = CapacityToJson(HealthyVerdict().capacity);

    EXPECT_EQ(j.at("total_bytes"), 1000);
    EXPECT_EQ(j.at("free_bytes"), 400);
    EXPECT_EQ(j.at("available_bytes"), 300);
    EXPECT_DOUBLE_EQ(j.at("percent_free").get<double>(), 40.0);
    EXPECT_DOUBLE_EQ(j.at("percent_available").get<double>(), 30.0);
    EXPECT_EQ(j.at("formatted_available"), "300 bytes");
    EXPECT_EQ(j.at("free_space_level"), "healthy");
    EXPECT_EQ(j.at("source"), "low_level_statistics");
    EXPECT_EQ(j.at("filesystem_type"), "nfs");
    EXPECT_EQ(j.at("is_network_mount"), true);
}

TEST(ReportJsonTest, UnknownFilesystemTypeIsOmitted)
{
    const auto j = CapacityToJson(Probe::CapacityInfo{});
    EXPECT_FALSE(j.contains("filesystem_type"));
    EXPECT_EQ(j.at("source"), "none");
    EXPECT_EQ(j.at("free_space_level"), "critical");
}

TEST(ReportJsonTest, VerdictCarriesOnlyPresentMessages)
{
    auto verdict = HealthyVerdict();
    auto j       = VerdictToJson(verdict);

    EXPECT_EQ(j.at("destination"), "/mnt/nas");
    EXPECT_EQ(j.at("name"), "nas");
    EXPECT_EQ(j.at("sufficient"), true);
    EXPECT_EQ(j.at("blocks_copy"), false);
    EXPECT_EQ(j.at("total_required_bytes"), 200);
    EXPECT_FALSE(j.contains("warning"));
    EXPECT_FALSE(j.contains("error"));

    verdict.sufficient    = false;
    verdict.error_message = "Unable to determine available disk space";
    j                     = VerdictToJson(verdict);
    EXPECT_EQ(j.at("blocks_copy"), true);
    EXPECT_EQ(j.at("error"), "Unable to determine available disk space");
}

TEST(ReportJsonTest, ReportHasDecisionAndDestinations)
{
    AggregateReport report;
    report.verdicts.push_back(HealthyVerdict());
    report.decision.can_proceed = false;
    report.decision.errors      = {"nas: Insufficient space"};

    const auto j = ReportToJson(report);
    EXPECT_EQ(j.at("can_proceed"), false);
    ASSERT_EQ(j.at("errors").size(), 1u);
    EXPECT_EQ(j.at("errors")[0], "nas: Insufficient space");
    EXPECT_TRUE(j.at("warnings").empty());
    ASSERT_EQ(j.at("destinations").size(), 1u);
    EXPECT_EQ(j.at("destinations")[0].at("name"), "nas");
}

TEST(ReportJsonTest, EmptyReportStillHasDestinationsArray)
{
    const auto j = ReportToJson(AggregateReport{});
    EXPECT_EQ(j.at("can_proceed"), true);
    EXPECT_TRUE(j.at("destinations").is_array());
}

}  // namespace
}  // namespace SpaceCheck::Space
