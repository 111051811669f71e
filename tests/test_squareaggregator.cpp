#include <gtest/gtest.h>
#include <cmath>
#include "squareaggregator.h"
#include "testhelpers.h"

using TestHelpers::makeTrackAt;
using TestHelpers::makeFinalizedSquare;
using TestHelpers::passingStatistics;

namespace {

void expectOnlyCountDefined(const Squares::SquareStatistics& s) {
    EXPECT_TRUE(std::isnan(s.variability));
    EXPECT_TRUE(std::isnan(s.density));
    EXPECT_TRUE(std::isnan(s.densityRatio));
    EXPECT_TRUE(std::isnan(s.tau));
    EXPECT_TRUE(std::isnan(s.rSquared));
    EXPECT_TRUE(std::isnan(s.medianDiffusionCoefficient));
    EXPECT_TRUE(std::isnan(s.medianDiffusionCoefficientExt));
    EXPECT_TRUE(std::isnan(s.medianLongTrackDuration));
    EXPECT_TRUE(std::isnan(s.medianShortTrackDuration));
    EXPECT_TRUE(std::isnan(s.medianDisplacement));
    EXPECT_TRUE(std::isnan(s.maxDisplacement));
    EXPECT_TRUE(std::isnan(s.totalDisplacement));
    EXPECT_TRUE(std::isnan(s.medianMaxSpeed));
    EXPECT_TRUE(std::isnan(s.maxMaxSpeed));
    EXPECT_TRUE(std::isnan(s.medianMedianSpeed));
    EXPECT_TRUE(std::isnan(s.maxMedianSpeed));
    EXPECT_TRUE(std::isnan(s.maxTrackDuration));
    EXPECT_TRUE(std::isnan(s.totalTrackDuration));
    EXPECT_TRUE(std::isnan(s.medianTrackDuration));
}

// Square [0,10) x [0,10) holding `count` tracks spread over its left half
Square squareWithTracks(std::vector<Squares::Track>& tracks, int count) {
    Square square(0, 0, 0, 0.0, 0.0, 10.0, 10.0);
    std::vector<int> indices;
    for (int i = 0; i < count; ++i) {
        // Durations 0.1 .. 0.5 s, more short than long tracks
        const double duration = 0.1 * (1 + (i * i) % 5);
        tracks.push_back(makeTrackAt(i, 1.0 + (i % 5), 1.0 + (i % 9), duration));
        tracks.back().attributes.displacement = 0.5 * (i % 4);
        indices.push_back(static_cast<int>(tracks.size()) - 1);
    }
    square.setTrackIndices(indices);
    return square;
}

} // namespace

TEST(SquareAggregatorTest, DensityNormalisesByAreaDurationAndConcentration) {
    EXPECT_DOUBLE_EQ(SquareAggregator::calculateDensity(30, 4.0, 100.0, 1.0), 0.075);
    EXPECT_DOUBLE_EQ(SquareAggregator::calculateDensity(30, 4.0, 100.0, 2.0), 0.0375);
    EXPECT_TRUE(std::isnan(SquareAggregator::calculateDensity(30, 0.0, 100.0, 1.0)));
    EXPECT_TRUE(std::isnan(SquareAggregator::calculateDensity(30, 4.0, 100.0, 0.0)));
}

TEST(SquareAggregatorTest, DensityRatioNeedsABackground) {
    EXPECT_DOUBLE_EQ(SquareAggregator::calculateDensityRatio(0.3, 0.1), 3.0);
    EXPECT_TRUE(std::isnan(SquareAggregator::calculateDensityRatio(0.3, 0.0)));
    EXPECT_TRUE(std::isnan(SquareAggregator::calculateDensityRatio(0.3, std::nan(""))));
}

TEST(SquareAggregatorTest, VariabilityIsCoefficientOfVariationOfSubCellCounts) {
    Square square(0, 0, 0, 0.0, 0.0, 10.0, 10.0);
    std::vector<Squares::Track> tracks;
    for (int i = 0; i < 4; ++i) {
        tracks.push_back(makeTrackAt(i, 1.0, 1.0));
    }
    square.setTrackIndices({0, 1, 2, 3});

    // Counts [4, 0, 0, 0]: mean 1, population sigma sqrt(3)
    EXPECT_NEAR(SquareAggregator::calculateVariability(square, tracks, 2), std::sqrt(3.0), 1e-12);

    tracks[1].attributes.xLocation = 6.0;
    tracks[2].attributes.yLocation = 6.0;
    tracks[3].attributes.xLocation = 10.0;     // Far edge falls in the last sub-cell
    tracks[3].attributes.yLocation = 10.0;
    EXPECT_NEAR(SquareAggregator::calculateVariability(square, tracks, 2), 0.0, 1e-12);
}

TEST(SquareAggregatorTest, VariabilityOfEmptySquareIsUndefined) {
    Square square(0, 0, 0, 0.0, 0.0, 10.0, 10.0);
    EXPECT_TRUE(std::isnan(SquareAggregator::calculateVariability(square, {}, 10)));
}

TEST(SquareAggregatorTest, EmptySquareHasOnlyACount) {
    Square square(3, 0, 3, 0.0, 0.0, 10.0, 10.0);
    AggregationContext context;
    context.minTracks = 0;
    context.backgroundDensity = 0.01;
    const TestHelpers::FixedDecaySolver solver(800.0, 0.9);
    context.solver = &solver;

    const Squares::SquareStatistics stats = SquareAggregator::aggregate(square, {}, context);
    EXPECT_EQ(stats.numberOfTracks, 0);
    expectOnlyCountDefined(stats);
}

TEST(SquareAggregatorTest, SquareBelowTrackThresholdHasOnlyACount) {
    std::vector<Squares::Track> tracks;
    const Square square = squareWithTracks(tracks, 5);

    AggregationContext context;
    context.minTracks = 20;
    context.backgroundDensity = 0.01;
    DecayFitting::FitStatus status = DecayFitting::FitStatus::Success;

    const Squares::SquareStatistics stats = SquareAggregator::aggregate(square, tracks, context, &status);
    EXPECT_EQ(stats.numberOfTracks, 5);
    expectOnlyCountDefined(stats);
    EXPECT_EQ(status, DecayFitting::FitStatus::InsufficientPoints);
}

TEST(SquareAggregatorTest, AggregatesTrackValues) {
    std::vector<Squares::Track> tracks;
    const Square square = squareWithTracks(tracks, 30);
    const TestHelpers::FixedDecaySolver solver(812.6, 0.98765);

    AggregationContext context;
    context.minTracks = 20;
    context.recordingDurationSeconds = 100.0;
    context.concentration = 1.0;
    context.backgroundDensity = 0.0006;
    context.variabilityGranularity = 10;
    context.minRSquared = 0.1;
    context.solver = &solver;
    DecayFitting::FitStatus status = DecayFitting::FitStatus::NoFit;

    const Squares::SquareStatistics stats = SquareAggregator::aggregate(square, tracks, context, &status);

    EXPECT_EQ(status, DecayFitting::FitStatus::Success);
    EXPECT_EQ(stats.numberOfTracks, 30);
    EXPECT_DOUBLE_EQ(stats.density, 0.003);            // 30 / (100 um^2 * 100 s)
    EXPECT_DOUBLE_EQ(stats.densityRatio, 5.0);
    EXPECT_FALSE(std::isnan(stats.variability));
    EXPECT_DOUBLE_EQ(stats.tau, 813.0);
    EXPECT_DOUBLE_EQ(stats.rSquared, 0.988);
    EXPECT_DOUBLE_EQ(stats.medianDiffusionCoefficient, 0.25);
    EXPECT_DOUBLE_EQ(stats.medianDiffusionCoefficientExt, 0.5);
    EXPECT_DOUBLE_EQ(stats.maxDisplacement, 1.5);
    EXPECT_DOUBLE_EQ(stats.maxMaxSpeed, 4.0);
    EXPECT_DOUBLE_EQ(stats.medianMedianSpeed, 2.0);
    EXPECT_DOUBLE_EQ(stats.maxTrackDuration, 0.5);
    EXPECT_EQ(solver.calls(), 1);
}

TEST(SquareAggregatorTest, FailedFitLeavesTauUndefinedOnly) {
    std::vector<Squares::Track> tracks;
    const Square square = squareWithTracks(tracks, 25);
    const TestHelpers::FixedDecaySolver solver(0.0, 0.0, false);

    AggregationContext context;
    context.minTracks = 20;
    context.backgroundDensity = 0.001;
    context.solver = &solver;
    DecayFitting::FitStatus status = DecayFitting::FitStatus::Success;

    const Squares::SquareStatistics stats = SquareAggregator::aggregate(square, tracks, context, &status);
    EXPECT_EQ(status, DecayFitting::FitStatus::NoFit);
    EXPECT_TRUE(std::isnan(stats.tau));
    EXPECT_TRUE(std::isnan(stats.rSquared));
    EXPECT_FALSE(std::isnan(stats.density));
    EXPECT_FALSE(std::isnan(stats.medianTrackDuration));
}

TEST(SquareAggregatorTest, VisibilityFilterAppliesNumericLimits) {
    std::vector<Square> squares;
    Squares::SquareStatistics lowRatio = passingStatistics();
    lowRatio.densityRatio = 0.05;
    Squares::SquareStatistics noFit = passingStatistics();
    noFit.rSquared = std::nan("");
    Squares::SquareStatistics variable = passingStatistics();
    variable.variability = 12.0;

    squares.push_back(makeFinalizedSquare(0, 0, 2, passingStatistics()));
    squares.push_back(makeFinalizedSquare(0, 1, 2, lowRatio));
    squares.push_back(makeFinalizedSquare(1, 0, 2, noFit));
    squares.push_back(makeFinalizedSquare(1, 1, 2, variable));

    const int selected = SquareAggregator::applyVisibilityFilter(squares, 0.1, 10.0, 0.1, Squares::NeighbourMode::Free);
    EXPECT_EQ(selected, 1);
    EXPECT_TRUE(squares[0].isSelected());
    EXPECT_FALSE(squares[1].isSelected());
    EXPECT_FALSE(squares[2].isSelected());
    EXPECT_FALSE(squares[3].isSelected());
}

TEST(SquareAggregatorTest, NeighbourModesRequireSelectedNeighbours) {
    // 3 x 3 grid with passing squares at (0,0), (1,1) and (2,1)
    auto build = []() {
        std::vector<Square> squares;
        for (int row = 0; row < 3; ++row) {
            for (int col = 0; col < 3; ++col) {
                const bool passes = (row == 0 && col == 0) || (row == 1 && col == 1) || (row == 2 && col == 1);
                squares.push_back(makeFinalizedSquare(row, col, 3, passes ? passingStatistics() : Squares::SquareStatistics()));
            }
        }
        return squares;
    };

    std::vector<Square> free = build();
    EXPECT_EQ(SquareAggregator::applyVisibilityFilter(free, 0.1, 10.0, 0.1, Squares::NeighbourMode::Free), 3);

    // Corner contact counts for relaxed
    std::vector<Square> relaxed = build();
    EXPECT_EQ(SquareAggregator::applyVisibilityFilter(relaxed, 0.1, 10.0, 0.1, Squares::NeighbourMode::Relaxed), 3);

    // (0,0) only touches (1,1) at a corner
    std::vector<Square> strict = build();
    EXPECT_EQ(SquareAggregator::applyVisibilityFilter(strict, 0.1, 10.0, 0.1, Squares::NeighbourMode::Strict), 2);
    EXPECT_FALSE(strict[0].isSelected());
    EXPECT_TRUE(strict[4].isSelected());
    EXPECT_TRUE(strict[7].isSelected());
}

TEST(SquareAggregatorTest, IsolatedSquareIsDroppedOutsideFreeMode) {
    std::vector<Square> squares;
    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < 3; ++col) {
            const bool passes = row == 1 && col == 1;
            squares.push_back(makeFinalizedSquare(row, col, 3, passes ? passingStatistics() : Squares::SquareStatistics()));
        }
    }
    EXPECT_EQ(SquareAggregator::applyVisibilityFilter(squares, 0.1, 10.0, 0.1, Squares::NeighbourMode::Relaxed), 0);
    EXPECT_FALSE(squares[4].isSelected());
}

TEST(SquareAggregatorTest, LabelsNumberSelectedSquaresInOrder) {
    std::vector<Square> squares;
    for (int i = 0; i < 4; ++i) {
        squares.emplace_back(i, 0, i, i, 0.0, i + 1.0, 1.0);
    }
    squares[1].setSelected(true);
    squares[3].setSelected(true);

    EXPECT_EQ(SquareAggregator::assignLabelNumbers(squares), 2);
    EXPECT_EQ(squares[0].getLabelNumber(), -1);
    EXPECT_EQ(squares[1].getLabelNumber(), 0);
    EXPECT_EQ(squares[2].getLabelNumber(), -1);
    EXPECT_EQ(squares[3].getLabelNumber(), 1);
}

TEST(SquareAggregatorTest, StatisticsAreFrozenOnceFinal) {
    Square square(0, 0, 0, 0.0, 0.0, 1.0, 1.0);
    Squares::SquareStatistics first;
    first.numberOfTracks = 3;
    Squares::SquareStatistics second;
    second.numberOfTracks = 7;

    EXPECT_TRUE(square.finalizeStatistics(first));
    EXPECT_FALSE(square.finalizeStatistics(second));
    EXPECT_EQ(square.getStatistics().numberOfTracks, 3);

    square.setCellId(4);
    EXPECT_EQ(square.getCellId(), 4);
    EXPECT_EQ(square.getStatistics().numberOfTracks, 3);
}

TEST(SquareAggregatorTest, LongAndShortTrackMediansUseTheOuterTenth) {
    std::vector<double> durations;
    for (int i = 20; i >= 1; --i) {
        durations.push_back(i);
    }
    // 10% of 20 tracks: the two longest and the two shortest
    EXPECT_DOUBLE_EQ(SquareAggregator::medianLongTrackDuration(durations), 19.5);
    EXPECT_DOUBLE_EQ(SquareAggregator::medianShortTrackDuration(durations), 1.5);

    durations.insert(durations.begin() + 3, 5, std::nan(""));
    EXPECT_DOUBLE_EQ(SquareAggregator::medianLongTrackDuration(durations), 19.5);
    EXPECT_DOUBLE_EQ(SquareAggregator::medianShortTrackDuration(durations), 1.5);

    // Fewer than 5 tracks still use one track
    EXPECT_DOUBLE_EQ(SquareAggregator::medianLongTrackDuration({ 0.3, 0.9, 0.1, 0.5 }), 0.9);
    EXPECT_DOUBLE_EQ(SquareAggregator::medianShortTrackDuration({ 0.3, 0.9, 0.1, 0.5 }), 0.1);

    // 15 tracks round 1.5 up to two
    std::vector<double> fifteen;
    for (int i = 1; i <= 15; ++i) {
        fifteen.push_back(i);
    }
    EXPECT_DOUBLE_EQ(SquareAggregator::medianLongTrackDuration(fifteen), 14.5);
    EXPECT_DOUBLE_EQ(SquareAggregator::medianShortTrackDuration(fifteen), 1.5);

    EXPECT_TRUE(std::isnan(SquareAggregator::medianLongTrackDuration({})));
    EXPECT_TRUE(std::isnan(SquareAggregator::medianShortTrackDuration({ std::nan("") })));
}

TEST(SquareAggregatorTest, AggregatesLongAndShortTrackMedians) {
    Square square(0, 0, 0, 0.0, 0.0, 10.0, 10.0);
    std::vector<Squares::Track> tracks;
    std::vector<int> indices;
    for (int i = 0; i < 20; ++i) {
        tracks.push_back(makeTrackAt(i, 0.5 + (i % 10), 0.5 + (i / 10), 1.0 + i));
        indices.push_back(i);
    }
    square.setTrackIndices(indices);
    const TestHelpers::FixedDecaySolver solver(900.0, 0.9);

    AggregationContext context;
    context.minTracks = 20;
    context.backgroundDensity = 0.001;
    context.solver = &solver;

    const Squares::SquareStatistics stats = SquareAggregator::aggregate(square, tracks, context);
    EXPECT_DOUBLE_EQ(stats.medianLongTrackDuration, 19.5);
    EXPECT_DOUBLE_EQ(stats.medianShortTrackDuration, 1.5);
    EXPECT_DOUBLE_EQ(stats.medianTrackDuration, 10.5);
    EXPECT_DOUBLE_EQ(stats.maxTrackDuration, 20.0);
}
