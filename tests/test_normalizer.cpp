#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include "../sensor_frame_normalizer.hpp"

namespace {

void expectInUnitRange(const cv::Mat& grid) {
    for (int r = 0; r < grid.rows; ++r) {
        for (int c = 0; c < grid.cols; ++c) {
            const float v = grid.at<float>(r, c);
            EXPECT_GE(v, 0.0f) << "at " << r << "," << c;
            EXPECT_LE(v, 1.0f) << "at " << r << "," << c;
        }
    }
}

}  // namespace

TEST(SensorFrameNormalizerTest, FlatFrameIsAllZeroInAdaptiveMode) {
    SensorFrameNormalizer normalizer(NormalizationMode::ADAPTIVE);
    cv::Mat frame(8, 8, CV_32F, cv::Scalar(25.0f));
    cv::Mat out = cv::Mat::ones(8, 8, CV_32F);

    EXPECT_FALSE(normalizer.normalize(frame, out));
    EXPECT_EQ(cv::countNonZero(out), 0);
}

TEST(SensorFrameNormalizerTest, RangeWithinNoiseFloorIsFlat) {
    SensorFrameNormalizer normalizer(NormalizationMode::ADAPTIVE, 0.0f, 80.0f, 1.0f);
    cv::Mat frame(8, 8, CV_32F, cv::Scalar(25.0f));
    frame.at<float>(3, 3) = 25.5f;
    cv::Mat out(8, 8, CV_32F);

    EXPECT_FALSE(normalizer.normalize(frame, out));
    EXPECT_EQ(cv::countNonZero(out), 0);
}

TEST(SensorFrameNormalizerTest, ZeroNoiseFloorStillHandlesFlatFrame) {
    SensorFrameNormalizer normalizer(NormalizationMode::ADAPTIVE, 0.0f, 80.0f, 0.0f);
    cv::Mat frame(8, 8, CV_32F, cv::Scalar(31.0f));
    cv::Mat out(8, 8, CV_32F);

    EXPECT_FALSE(normalizer.normalize(frame, out));
    EXPECT_EQ(cv::countNonZero(out), 0);
}

TEST(SensorFrameNormalizerTest, AdaptiveStretchesToFullRange) {
    SensorFrameNormalizer normalizer(NormalizationMode::ADAPTIVE);
    cv::Mat frame(2, 2, CV_32F);
    frame.at<float>(0, 0) = 20.0f;
    frame.at<float>(0, 1) = 22.5f;
    frame.at<float>(1, 0) = 25.0f;
    frame.at<float>(1, 1) = 30.0f;
    cv::Mat out(2, 2, CV_32F);

    EXPECT_TRUE(normalizer.normalize(frame, out));
    EXPECT_NEAR(out.at<float>(0, 0), 0.0f, 1e-6);
    EXPECT_NEAR(out.at<float>(0, 1), 0.25f, 1e-6);
    EXPECT_NEAR(out.at<float>(1, 0), 0.5f, 1e-6);
    EXPECT_NEAR(out.at<float>(1, 1), 1.0f, 1e-6);
}

TEST(SensorFrameNormalizerTest, FixedRangeUsesSensorBoundsAndClamps) {
    SensorFrameNormalizer normalizer(NormalizationMode::FIXED_RANGE, 0.0f, 80.0f);
    cv::Mat frame(1, 4, CV_32F);
    frame.at<float>(0, 0) = 40.0f;
    frame.at<float>(0, 1) = 20.0f;
    frame.at<float>(0, 2) = -15.0f;
    frame.at<float>(0, 3) = 120.0f;
    cv::Mat out(1, 4, CV_32F);

    EXPECT_TRUE(normalizer.normalize(frame, out));
    EXPECT_NEAR(out.at<float>(0, 0), 0.5f, 1e-6);
    EXPECT_NEAR(out.at<float>(0, 1), 0.25f, 1e-6);
    EXPECT_FLOAT_EQ(out.at<float>(0, 2), 0.0f);
    EXPECT_FLOAT_EQ(out.at<float>(0, 3), 1.0f);
}

TEST(SensorFrameNormalizerTest, FixedRangeFlatFrameIsNotDegenerate) {
    SensorFrameNormalizer normalizer(NormalizationMode::FIXED_RANGE, 0.0f, 80.0f);
    cv::Mat frame(8, 8, CV_32F, cv::Scalar(20.0f));
    cv::Mat out(8, 8, CV_32F);

    EXPECT_TRUE(normalizer.normalize(frame, out));
    EXPECT_NEAR(out.at<float>(4, 4), 0.25f, 1e-6);
}

TEST(SensorFrameNormalizerTest, EveryCellInUnitRangeForBothModes) {
    cv::Mat frame(8, 8, CV_32F);
    cv::RNG rng(1234);
    rng.fill(frame, cv::RNG::UNIFORM, -40.0, 200.0);
    cv::Mat out(8, 8, CV_32F);

    SensorFrameNormalizer fixed(NormalizationMode::FIXED_RANGE);
    fixed.normalize(frame, out);
    expectInUnitRange(out);

    SensorFrameNormalizer adaptive(NormalizationMode::ADAPTIVE);
    EXPECT_TRUE(adaptive.normalize(frame, out));
    expectInUnitRange(out);
    double min_v, max_v;
    cv::minMaxLoc(out, &min_v, &max_v);
    EXPECT_NEAR(min_v, 0.0, 1e-6);
    EXPECT_NEAR(max_v, 1.0, 1e-6);
}

TEST(SensorFrameNormalizerTest, GarbageReadingsAreClampedNotRaised) {
    cv::Mat frame(8, 8, CV_32F, cv::Scalar(22.0f));
    frame.at<float>(0, 0) = std::numeric_limits<float>::quiet_NaN();
    frame.at<float>(1, 1) = 35.0f;
    cv::Mat out(8, 8, CV_32F);

    SensorFrameNormalizer adaptive(NormalizationMode::ADAPTIVE);
    EXPECT_NO_THROW(adaptive.normalize(frame, out));
    expectInUnitRange(out);

    SensorFrameNormalizer fixed(NormalizationMode::FIXED_RANGE);
    EXPECT_NO_THROW(fixed.normalize(frame, out));
    expectInUnitRange(out);
}

TEST(SensorFrameNormalizerTest, ReusesPreallocatedOutput) {
    SensorFrameNormalizer normalizer;
    cv::Mat frame(8, 8, CV_32F);
    cv::randu(frame, 20.0, 30.0);
    cv::Mat out(8, 8, CV_32F);
    const uchar* data = out.data;

    normalizer.normalize(frame, out);
    EXPECT_EQ(out.data, data);
}

TEST(SensorFrameNormalizerTest, RejectsInvalidBounds) {
    EXPECT_THROW(SensorFrameNormalizer(NormalizationMode::FIXED_RANGE, 50.0f, 50.0f),
                 std::invalid_argument);
    EXPECT_THROW(SensorFrameNormalizer(NormalizationMode::FIXED_RANGE, 80.0f, 0.0f),
                 std::invalid_argument);
    EXPECT_THROW(SensorFrameNormalizer(NormalizationMode::ADAPTIVE, 0.0f, 80.0f, -1.0f),
                 std::invalid_argument);
}

TEST(SensorFrameNormalizerTest, ModeNames) {
    EXPECT_EQ(SensorFrameNormalizer::modeFromString("fixed"), NormalizationMode::FIXED_RANGE);
    EXPECT_EQ(SensorFrameNormalizer::modeFromString("adaptive"), NormalizationMode::ADAPTIVE);
    EXPECT_EQ(SensorFrameNormalizer::modeToString(NormalizationMode::FIXED_RANGE), "fixed");
    EXPECT_THROW(SensorFrameNormalizer::modeFromString("auto"), std::invalid_argument);
}
