#include "backgroundestimator.h"
#include "debugutils.h"
#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numeric>

namespace {

BackgroundEstimate summarize(const std::vector<Square>& squares, const std::vector<int>& selection) {
    BackgroundEstimate estimate;
    double densitySum = 0.0;
    int densityCount = 0;

    for (int index : selection) {
        const Square& square = squares[index];
        estimate.squareNumbers.push_back(square.getSquareNumber());
        estimate.numberOfTracks += square.getNumberOfTracks();
        if (!std::isnan(square.getRawDensity())) {
            densitySum += square.getRawDensity();
            densityCount++;
        }
    }
    std::sort(estimate.squareNumbers.begin(), estimate.squareNumbers.end());

    if (densityCount > 0) {
        estimate.density = densitySum / densityCount;
    }
    if (!selection.empty()) {
        estimate.averageTracks = static_cast<double>(estimate.numberOfTracks) / selection.size();
    }
    return estimate;
}

} // namespace

namespace BackgroundEstimator {

std::vector<int> sampleIndices(int population, int sampleCount, quint64 seed) {
    std::vector<int> indices(std::max(0, population));
    std::iota(indices.begin(), indices.end(), 0);
    if (sampleCount >= population) {
        return indices;
    }
    if (sampleCount <= 0) {
        return {};
    }

    cv::RNG rng(static_cast<uint64_t>(seed));
    for (int i = 0; i < sampleCount; ++i) {
        const int j = i + rng.uniform(0, population - i);
        std::swap(indices[i], indices[j]);
    }
    indices.resize(sampleCount);
    std::sort(indices.begin(), indices.end());
    return indices;
}

BackgroundEstimate estimateRandomSample(const std::vector<Square>& squares, int sampleCount, quint64 seed) {
    if (squares.empty()) {
        return BackgroundEstimate();
    }
    const std::vector<int> selection = sampleIndices(static_cast<int>(squares.size()), sampleCount, seed);
    BackgroundEstimate estimate = summarize(squares, selection);
    SQUARES_DEBUG() << "BackgroundEstimator: random sample of" << selection.size() << "squares, density"
                    << estimate.density;
    return estimate;
}

BackgroundEstimate estimateIterativeClipping(const std::vector<Square>& squares) {
    if (squares.empty()) {
        return BackgroundEstimate();
    }

    std::vector<int> current(squares.size());
    std::iota(current.begin(), current.end(), 0);

    auto meanOf = [&squares](const std::vector<int>& selection) {
        double sum = 0.0;
        for (int index : selection) sum += squares[index].getRawDensity();
        return sum / selection.size();
    };

    double mean = meanOf(current);
    if (std::isnan(mean) || mean == 0.0) {
        return summarize(squares, current);
    }

    for (int iteration = 0; iteration < SquareConstants::BACKGROUND_CLIPPING_MAX_ITERATIONS; ++iteration) {
        const double previousMean = mean;

        double variance = 0.0;
        for (int index : current) {
            const double d = squares[index].getRawDensity() - previousMean;
            variance += d * d;
        }
        variance /= current.size();
        const double threshold = previousMean + SquareConstants::BACKGROUND_CLIPPING_SIGMA * std::sqrt(variance);

        std::vector<int> filtered;
        for (int index : current) {
            if (squares[index].getRawDensity() <= threshold) {
                filtered.push_back(index);
            }
        }
        if (filtered.empty()) {
            break;
        }

        mean = meanOf(filtered);
        current.swap(filtered);

        if (std::abs(mean - previousMean) / previousMean < SquareConstants::BACKGROUND_CLIPPING_EPSILON) {
            break;
        }
    }

    BackgroundEstimate estimate = summarize(squares, current);
    SQUARES_DEBUG() << "BackgroundEstimator: iterative clipping kept" << current.size() << "of" << squares.size()
                    << "squares, density" << estimate.density;
    return estimate;
}

BackgroundEstimate estimate(const std::vector<Square>& squares, const Squares::GenerateSquaresSettings& settings) {
    switch (settings.backgroundMethod) {
    case Squares::BackgroundMethod::IterativeClipping:
        return estimateIterativeClipping(squares);
    case Squares::BackgroundMethod::RandomSample:
    default:
        return estimateRandomSample(squares, settings.backgroundSampleCount, settings.backgroundSeed);
    }
}

} // namespace BackgroundEstimator
