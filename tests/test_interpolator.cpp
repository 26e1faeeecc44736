#include <gtest/gtest.h>
#include <stdexcept>
#include "../spatial_interpolator.hpp"

TEST(SpatialInterpolatorTest, OnePassOutputShape) {
    SpatialInterpolator interpolator(InterpolationMode::BILINEAR_ONE_PASS);

    EXPECT_EQ(interpolator.outputSize(8, 8), cv::Size(15, 15));
    EXPECT_EQ(interpolator.outputSize(3, 4), cv::Size(7, 5));

    cv::Mat grid(3, 4, CV_32F);
    cv::randu(grid, 0.0, 1.0);
    cv::Mat out;
    interpolator.interpolate(grid, out);
    EXPECT_EQ(out.rows, 5);
    EXPECT_EQ(out.cols, 7);
    EXPECT_EQ(out.type(), CV_32F);
}

TEST(SpatialInterpolatorTest, KnownSamplesAreCopiedExactly) {
    SpatialInterpolator interpolator;
    cv::Mat grid(8, 8, CV_32F);
    cv::randu(grid, 0.0, 1.0);
    cv::Mat out(15, 15, CV_32F);

    interpolator.interpolate(grid, out);

    for (int r = 0; r < 8; ++r) {
        for (int c = 0; c < 8; ++c) {
            EXPECT_EQ(out.at<float>(2 * r, 2 * c), grid.at<float>(r, c)) << r << "," << c;
        }
    }
    EXPECT_EQ(out.at<float>(0, 0), grid.at<float>(0, 0));
    EXPECT_EQ(out.at<float>(0, 14), grid.at<float>(0, 7));
    EXPECT_EQ(out.at<float>(14, 0), grid.at<float>(7, 0));
    EXPECT_EQ(out.at<float>(14, 14), grid.at<float>(7, 7));
}

TEST(SpatialInterpolatorTest, VerticalThenHorizontalAveraging) {
    SpatialInterpolator interpolator;
    cv::Mat grid = (cv::Mat_<float>(2, 2) << 0.0f, 0.2f,
                                              0.4f, 1.0f);
    cv::Mat out;
    interpolator.interpolate(grid, out);

    ASSERT_EQ(out.size(), cv::Size(3, 3));
    // Odd row from the rows above and below
    EXPECT_FLOAT_EQ(out.at<float>(1, 0), 0.2f);
    EXPECT_FLOAT_EQ(out.at<float>(1, 2), 0.6f);
    // Odd columns
    EXPECT_FLOAT_EQ(out.at<float>(0, 1), 0.1f);
    EXPECT_FLOAT_EQ(out.at<float>(2, 1), 0.7f);
    // Center from the vertically filled row
    EXPECT_FLOAT_EQ(out.at<float>(1, 1), (out.at<float>(1, 0) + out.at<float>(1, 2)) / 2.0f);
    EXPECT_FLOAT_EQ(out.at<float>(1, 1), 0.4f);
}

TEST(SpatialInterpolatorTest, SingleRowAndColumnInputs) {
    SpatialInterpolator interpolator;
    cv::Mat row = (cv::Mat_<float>(1, 3) << 0.0f, 0.5f, 1.0f);
    cv::Mat out;
    interpolator.interpolate(row, out);
    ASSERT_EQ(out.size(), cv::Size(5, 1));
    EXPECT_FLOAT_EQ(out.at<float>(0, 1), 0.25f);
    EXPECT_FLOAT_EQ(out.at<float>(0, 3), 0.75f);

    cv::Mat single = (cv::Mat_<float>(1, 1) << 0.3f);
    interpolator.interpolate(single, out);
    ASSERT_EQ(out.size(), cv::Size(1, 1));
    EXPECT_FLOAT_EQ(out.at<float>(0, 0), 0.3f);
}

TEST(SpatialInterpolatorTest, PassThroughModeCopiesGrid) {
    SpatialInterpolator interpolator(InterpolationMode::NONE);
    EXPECT_EQ(interpolator.outputSize(8, 8), cv::Size(8, 8));

    cv::Mat grid(8, 8, CV_32F);
    cv::randu(grid, 0.0, 1.0);
    cv::Mat out(8, 8, CV_32F);
    const uchar* data = out.data;
    interpolator.interpolate(grid, out);

    EXPECT_EQ(out.data, data);
    EXPECT_EQ(cv::norm(grid, out, cv::NORM_INF), 0.0);
}

TEST(SpatialInterpolatorTest, ReusesPreallocatedOutput) {
    SpatialInterpolator interpolator;
    cv::Mat grid(8, 8, CV_32F, cv::Scalar(0.5f));
    cv::Mat out(15, 15, CV_32F);
    const uchar* data = out.data;

    interpolator.interpolate(grid, out);
    interpolator.interpolate(grid, out);
    EXPECT_EQ(out.data, data);
}

TEST(SpatialInterpolatorTest, ModeNames) {
    EXPECT_EQ(SpatialInterpolator::modeFromString("none"), InterpolationMode::NONE);
    EXPECT_EQ(SpatialInterpolator::modeFromString("bilinear"), InterpolationMode::BILINEAR_ONE_PASS);
    EXPECT_EQ(SpatialInterpolator::modeToString(InterpolationMode::NONE), "none");
    EXPECT_THROW(SpatialInterpolator::modeFromString("bicubic"), std::invalid_argument);
}
