#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <set>
#include "backgroundestimator.h"

namespace {

std::vector<Square> squaresWithDensities(const std::vector<double>& densities) {
    std::vector<Square> squares;
    for (size_t i = 0; i < densities.size(); ++i) {
        const int n = static_cast<int>(i);
        Square square(n, 0, n, n, 0.0, n + 1.0, 1.0);
        square.setRawDensity(densities[i]);
        square.setTrackIndices(std::vector<int>(densities[i] > 10.0 ? 5 : 1, 0));
        squares.push_back(square);
    }
    return squares;
}

} // namespace

TEST(BackgroundEstimatorTest, SampleIsDeterministicForASeed) {
    const std::vector<int> first = BackgroundEstimator::sampleIndices(400, 60, 42);
    const std::vector<int> second = BackgroundEstimator::sampleIndices(400, 60, 42);
    EXPECT_EQ(first, second);

    ASSERT_EQ(first.size(), 60u);
    EXPECT_TRUE(std::is_sorted(first.begin(), first.end()));
    EXPECT_EQ(std::set<int>(first.begin(), first.end()).size(), 60u);
    EXPECT_GE(first.front(), 0);
    EXPECT_LT(first.back(), 400);
}

TEST(BackgroundEstimatorTest, DifferentSeedsGiveDifferentSamples) {
    EXPECT_NE(BackgroundEstimator::sampleIndices(400, 60, 42), BackgroundEstimator::sampleIndices(400, 60, 7));
}

TEST(BackgroundEstimatorTest, SmallPopulationIsUsedWhole) {
    const std::vector<int> indices = BackgroundEstimator::sampleIndices(16, 60, 42);
    ASSERT_EQ(indices.size(), 16u);
    for (int i = 0; i < 16; ++i) {
        EXPECT_EQ(indices[i], i);
    }
    EXPECT_TRUE(BackgroundEstimator::sampleIndices(16, 0, 42).empty());
}

TEST(BackgroundEstimatorTest, RandomSampleAveragesRawDensities) {
    const std::vector<Square> squares = squaresWithDensities({ 1.0, 2.0, 3.0, 6.0 });
    const BackgroundEstimate estimate = BackgroundEstimator::estimateRandomSample(squares, 60, 42);

    EXPECT_DOUBLE_EQ(estimate.density, 3.0);
    EXPECT_EQ(estimate.squareNumbers, std::vector<int>({ 0, 1, 2, 3 }));
    EXPECT_EQ(estimate.numberOfTracks, 4);
    EXPECT_DOUBLE_EQ(estimate.averageTracks, 1.0);
}

TEST(BackgroundEstimatorTest, RandomSampleMatchesItsSquares) {
    std::vector<double> densities;
    for (int i = 0; i < 100; ++i) {
        densities.push_back(0.01 * i);
    }
    const std::vector<Square> squares = squaresWithDensities(densities);
    const BackgroundEstimate estimate = BackgroundEstimator::estimateRandomSample(squares, 10, 42);

    ASSERT_EQ(estimate.squareNumbers.size(), 10u);
    double sum = 0.0;
    for (int number : estimate.squareNumbers) {
        sum += squares[number].getRawDensity();
    }
    EXPECT_NEAR(estimate.density, sum / 10.0, 1e-12);
}

TEST(BackgroundEstimatorTest, NoSquaresGiveUndefinedBackground) {
    EXPECT_TRUE(std::isnan(BackgroundEstimator::estimateRandomSample({}, 60, 42).density));
    EXPECT_TRUE(std::isnan(BackgroundEstimator::estimateIterativeClipping({}).density));
}

TEST(BackgroundEstimatorTest, IterativeClippingDropsDenseSquares) {
    std::vector<double> densities(20, 1.0);
    densities.push_back(100.0);
    const std::vector<Square> squares = squaresWithDensities(densities);

    const BackgroundEstimate estimate = BackgroundEstimator::estimateIterativeClipping(squares);
    EXPECT_DOUBLE_EQ(estimate.density, 1.0);
    EXPECT_EQ(estimate.squareNumbers.size(), 20u);
    EXPECT_EQ(std::count(estimate.squareNumbers.begin(), estimate.squareNumbers.end(), 20), 0);
}

TEST(BackgroundEstimatorTest, IterativeClippingOfEmptyRecordingIsZero) {
    const std::vector<Square> squares = squaresWithDensities({ 0.0, 0.0, 0.0 });
    const BackgroundEstimate estimate = BackgroundEstimator::estimateIterativeClipping(squares);
    EXPECT_DOUBLE_EQ(estimate.density, 0.0);
    EXPECT_EQ(estimate.squareNumbers.size(), 3u);
}

TEST(BackgroundEstimatorTest, EstimateUsesConfiguredMethod) {
    std::vector<double> densities(20, 1.0);
    densities.push_back(100.0);
    const std::vector<Square> squares = squaresWithDensities(densities);

    Squares::GenerateSquaresSettings settings;
    settings.backgroundMethod = Squares::BackgroundMethod::RandomSample;
    settings.backgroundSampleCount = 60;
    EXPECT_NEAR(BackgroundEstimator::estimate(squares, settings).density, 120.0 / 21.0, 1e-12);

    settings.backgroundMethod = Squares::BackgroundMethod::IterativeClipping;
    EXPECT_DOUBLE_EQ(BackgroundEstimator::estimate(squares, settings).density, 1.0);
}
