#include <limits>

#include <gtest/gtest.h>

#include "config/Config.hpp"
#include "errors/InvalidInputError.hpp"

TEST(ConfigTest, DefaultsMatchTheUsualEvaluationSetup)
{
    const config::EvaluationConfig defaults = config::defaultConfig();

    EXPECT_DOUBLE_EQ(defaults.pascal.iouThreshold, 0.5);
    EXPECT_EQ(defaults.pascal.interpolation, config::Interpolation::EveryPoint);
    EXPECT_FALSE(defaults.pascal.generateTable);
    EXPECT_EQ(defaults.metrics.metrics().size(), 14u);
    EXPECT_TRUE(defaults.metrics.anyCoco());
    EXPECT_TRUE(defaults.metrics.anyPascal());

    ASSERT_EQ(defaults.coco.iouThresholds.size(), 10u);
    EXPECT_DOUBLE_EQ(defaults.coco.iouThresholds.front(), 0.5);
    EXPECT_DOUBLE_EQ(defaults.coco.iouThresholds.back(), 0.95);
    EXPECT_NEAR(defaults.coco.iouThresholds[5], 0.75, 1e-12);
    EXPECT_EQ(defaults.coco.maxDetections[0], 1u);
    EXPECT_EQ(defaults.coco.maxDetections[1], 10u);
    EXPECT_EQ(defaults.coco.maxDetections[2], 100u);
    EXPECT_DOUBLE_EQ(defaults.coco.smallAreaLimit, 1024.0);
    EXPECT_DOUBLE_EQ(defaults.coco.largeAreaLimit, 9216.0);
    EXPECT_EQ(defaults.coco.recallSamples, 101);

    EXPECT_NO_THROW(config::validate(defaults));
}

TEST(ConfigTest, PascalThresholdMustLieInHalfOpenUnitInterval)
{
    config::PascalConfig pascal;
    pascal.iouThreshold = 0.0;
    EXPECT_THROW(config::validate(pascal), errors::InvalidInputError);
    pascal.iouThreshold = 1.01;
    EXPECT_THROW(config::validate(pascal), errors::InvalidInputError);
    pascal.iouThreshold = 1.0;
    EXPECT_NO_THROW(config::validate(pascal));
}

TEST(ConfigTest, RejectsBrokenCocoSettings)
{
    config::CocoConfig coco;
    coco.iouThresholds.clear();
    EXPECT_THROW(config::validate(coco), errors::InvalidInputError);

    coco = config::CocoConfig{};
    coco.iouThresholds.push_back(1.2);
    EXPECT_THROW(config::validate(coco), errors::InvalidInputError);

    coco = config::CocoConfig{};
    coco.maxDetections[0] = 0;
    EXPECT_THROW(config::validate(coco), errors::InvalidInputError);

    coco = config::CocoConfig{};
    coco.largeAreaLimit = coco.smallAreaLimit;
    EXPECT_THROW(config::validate(coco), errors::InvalidInputError);

    coco = config::CocoConfig{};
    coco.recallSamples = 1;
    EXPECT_THROW(config::validate(coco), errors::InvalidInputError);
}

TEST(ConfigTest, MetricNamesFollowTheSummaryKeys)
{
    EXPECT_EQ(config::toString(config::Metric::CocoAP), "AP");
    EXPECT_EQ(config::toString(config::Metric::CocoAPSmall), "APsmall");
    EXPECT_EQ(config::toString(config::Metric::CocoAR100), "AR100");
    EXPECT_EQ(config::toString(config::Metric::CocoARLarge), "ARlarge");
    EXPECT_EQ(config::toString(config::Metric::PascalAP), "per_class");
    EXPECT_EQ(config::toString(config::Metric::PascalMAP), "mAP");
}

TEST(ConfigTest, MetricSelectionAddAndRemove)
{
    config::MetricSelection selection{config::Metric::PascalMAP};
    EXPECT_FALSE(selection.anyCoco());
    EXPECT_TRUE(selection.anyPascal());

    selection.add(config::Metric::CocoAR10).remove(config::Metric::PascalMAP);
    EXPECT_TRUE(selection.anyCoco());
    EXPECT_FALSE(selection.anyPascal());
    EXPECT_TRUE(selection.contains(config::Metric::CocoAR10));

    EXPECT_TRUE(config::MetricSelection{}.empty());
}

TEST(ConfigTest, IouThresholdBounds)
{
    EXPECT_NO_THROW(config::validateIouThreshold(1.0));
    EXPECT_NO_THROW(config::validateIouThreshold(0.05));
    EXPECT_THROW(config::validateIouThreshold(0.0), errors::InvalidInputError);
    EXPECT_THROW(config::validateIouThreshold(1.2), errors::InvalidInputError);
    EXPECT_THROW(config::validateIouThreshold(std::numeric_limits<double>::quiet_NaN()), errors::InvalidInputError);
}
