#include "squareaggregator.h"
#include "debugutils.h"
#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>

namespace SquareAggregator {

double calculateDensity(int numberOfTracks, double area, double durationSeconds, double concentration) {
    if (!(area > 0.0) || !(durationSeconds > 0.0) || !(concentration > 0.0)) {
        return SquareConstants::UNDEFINED;
    }
    return numberOfTracks / (area * durationSeconds * concentration);
}

double calculateDensityRatio(double density, double backgroundDensity) {
    if (std::isnan(density) || std::isnan(backgroundDensity) || backgroundDensity == 0.0) {
        return SquareConstants::UNDEFINED;
    }
    return density / backgroundDensity;
}

namespace {

// Sorted durations without NaN and the number of tracks a long / short median covers
int prepareDurations(std::vector<double>& durations, double fraction) {
    durations.erase(std::remove_if(durations.begin(), durations.end(),
                                   [](double d) { return std::isnan(d); }),
                    durations.end());
    std::sort(durations.begin(), durations.end());
    const int n = static_cast<int>(durations.size());
    return std::min(n, std::max(static_cast<int>(std::lround(fraction * n)), 1));
}

} // namespace

double medianLongTrackDuration(std::vector<double> durations, double fraction) {
    const int count = prepareDurations(durations, fraction);
    if (durations.empty()) {
        return SquareConstants::UNDEFINED;
    }
    return SquareUtils::median(std::vector<double>(durations.end() - count, durations.end()));
}

double medianShortTrackDuration(std::vector<double> durations, double fraction) {
    const int count = prepareDurations(durations, fraction);
    if (durations.empty()) {
        return SquareConstants::UNDEFINED;
    }
    return SquareUtils::median(std::vector<double>(durations.begin(), durations.begin() + count));
}

double calculateVariability(const Square& square, const std::vector<Squares::Track>& tracks, int granularity) {
    if (granularity < 1) {
        return SquareConstants::UNDEFINED;
    }

    const double cellWidth = (square.getX1() - square.getX0()) / granularity;
    const double cellHeight = (square.getY1() - square.getY0()) / granularity;
    if (!(cellWidth > 0.0) || !(cellHeight > 0.0)) {
        return SquareConstants::UNDEFINED;
    }

    cv::Mat1d counts = cv::Mat1d::zeros(granularity, granularity);
    for (int index : square.getTrackIndices()) {
        if (index < 0 || index >= static_cast<int>(tracks.size())) continue;
        const Squares::TrackAttributes& a = tracks[index].attributes;
        if (std::isnan(a.xLocation) || std::isnan(a.yLocation)) continue;

        const int col = std::clamp(static_cast<int>(std::floor((a.xLocation - square.getX0()) / cellWidth)), 0, granularity - 1);
        const int row = std::clamp(static_cast<int>(std::floor((a.yLocation - square.getY0()) / cellHeight)), 0, granularity - 1);
        counts(row, col) += 1.0;
    }

    cv::Scalar mean, stddev;
    cv::meanStdDev(counts, mean, stddev);
    if (mean[0] == 0.0) {
        return SquareConstants::UNDEFINED;
    }
    return stddev[0] / mean[0];
}

Squares::SquareStatistics aggregate(const Square& square,
                                    const std::vector<Squares::Track>& tracks,
                                    const AggregationContext& context,
                                    DecayFitting::FitStatus* fitStatus) {
    Squares::SquareStatistics stats;
    stats.numberOfTracks = square.getNumberOfTracks();
    if (fitStatus) {
        *fitStatus = DecayFitting::FitStatus::InsufficientPoints;
    }

    if (stats.numberOfTracks == 0 || stats.numberOfTracks < context.minTracks) {
        return stats;
    }

    std::vector<double> diffusion, diffusionExt, displacement, maxSpeed, medianSpeed, duration;
    const size_t n = square.getTrackIndices().size();
    diffusion.reserve(n);
    diffusionExt.reserve(n);
    displacement.reserve(n);
    maxSpeed.reserve(n);
    medianSpeed.reserve(n);
    duration.reserve(n);

    for (int index : square.getTrackIndices()) {
        if (index < 0 || index >= static_cast<int>(tracks.size())) {
            qWarning() << "SquareAggregator: square" << square.getSquareNumber() << "refers to unknown track index" << index;
            continue;
        }
        const Squares::TrackAttributes& a = tracks[index].attributes;
        diffusion.push_back(a.diffusionCoefficient);
        diffusionExt.push_back(a.diffusionCoefficientExt);
        displacement.push_back(a.displacement);
        maxSpeed.push_back(a.maxSpeed);
        medianSpeed.push_back(a.medianSpeed);
        duration.push_back(a.duration);
    }

    const double density = calculateDensity(stats.numberOfTracks, square.getArea(),
                                            context.recordingDurationSeconds, context.concentration);
    stats.density = SquareUtils::roundTo(density, 3);
    stats.densityRatio = SquareUtils::roundTo(calculateDensityRatio(density, context.backgroundDensity), 2);
    stats.variability = SquareUtils::roundTo(calculateVariability(square, tracks, context.variabilityGranularity), 2);

    if (context.solver) {
        const DecayFitting::TauResult tau =
            DecayFitting::calculateTau(duration, context.minTracks, context.minRSquared, *context.solver);
        if (fitStatus) {
            *fitStatus = tau.status;
        }
        if (tau.status == DecayFitting::FitStatus::Success) {
            stats.tau = SquareUtils::roundTo(tau.tau, 0);
            stats.rSquared = SquareUtils::roundTo(tau.rSquared, 3);
        }
    } else if (fitStatus) {
        *fitStatus = DecayFitting::FitStatus::NoFit;
    }

    stats.medianDiffusionCoefficient = SquareUtils::roundTo(SquareUtils::median(diffusion), 2);
    stats.medianDiffusionCoefficientExt = SquareUtils::roundTo(SquareUtils::median(diffusionExt), 2);
    stats.medianLongTrackDuration = SquareUtils::roundTo(medianLongTrackDuration(duration), 1);
    stats.medianShortTrackDuration = SquareUtils::roundTo(medianShortTrackDuration(duration), 1);

    stats.medianDisplacement = SquareUtils::roundTo(SquareUtils::median(displacement), 1);
    stats.maxDisplacement = SquareUtils::roundTo(SquareUtils::maximum(displacement), 1);
    stats.totalDisplacement = SquareUtils::roundTo(SquareUtils::total(displacement), 1);

    stats.medianMaxSpeed = SquareUtils::roundTo(SquareUtils::median(maxSpeed), 1);
    stats.maxMaxSpeed = SquareUtils::roundTo(SquareUtils::maximum(maxSpeed), 1);
    stats.medianMedianSpeed = SquareUtils::roundTo(SquareUtils::median(medianSpeed), 1);
    stats.maxMedianSpeed = SquareUtils::roundTo(SquareUtils::maximum(medianSpeed), 1);

    stats.maxTrackDuration = SquareUtils::roundTo(SquareUtils::maximum(duration), 1);
    stats.totalTrackDuration = SquareUtils::roundTo(SquareUtils::total(duration), 1);
    stats.medianTrackDuration = SquareUtils::roundTo(SquareUtils::median(duration), 1);

    return stats;
}

int applyVisibilityFilter(std::vector<Square>& squares,
                          double minDensityRatio,
                          double maxVariability,
                          double minRSquared,
                          Squares::NeighbourMode neighbourMode) {
    if (squares.empty()) {
        return 0;
    }

    int rows = 0;
    int cols = 0;
    for (const Square& square : squares) {
        rows = std::max(rows, square.getRow() + 1);
        cols = std::max(cols, square.getColumn() + 1);
    }

    // First pass: numeric limits. NaN fails every comparison.
    cv::Mat1b passes = cv::Mat1b::zeros(rows, cols);
    int visibleBasic = 0;
    for (Square& square : squares) {
        const Squares::SquareStatistics& s = square.getStatistics();
        const bool ok = s.densityRatio >= minDensityRatio
                        && s.variability <= maxVariability
                        && s.rSquared >= minRSquared
                        && !std::isnan(s.rSquared);
        square.setSelected(ok);
        if (ok) {
            passes(square.getRow(), square.getColumn()) = 1;
            visibleBasic++;
        }
    }

    if (neighbourMode == Squares::NeighbourMode::Free) {
        return visibleBasic;
    }

    // Second pass: neighbour requirement, judged on the first pass result
    int kept = 0;
    for (Square& square : squares) {
        if (!square.isSelected()) continue;

        const int r = square.getRow();
        const int c = square.getColumn();
        bool hasNeighbour = false;
        for (int dr = -1; dr <= 1 && !hasNeighbour; ++dr) {
            for (int dc = -1; dc <= 1 && !hasNeighbour; ++dc) {
                if (dr == 0 && dc == 0) continue;
                if (neighbourMode == Squares::NeighbourMode::Strict && dr != 0 && dc != 0) continue;
                const int nr = r + dr;
                const int nc = c + dc;
                if (nr < 0 || nc < 0 || nr >= rows || nc >= cols) continue;
                hasNeighbour = passes(nr, nc) != 0;
            }
        }

        square.setSelected(hasNeighbour);
        if (hasNeighbour) kept++;
    }

    SQUARES_DEBUG() << "SquareAggregator: neighbour mode" << Squares::neighbourModeToString(neighbourMode)
                    << "kept" << kept << "of" << visibleBasic << "squares";
    return kept;
}

int assignLabelNumbers(std::vector<Square>& squares) {
    int labelNumber = 0;
    for (Square& square : squares) {
        square.setLabelNumber(square.isSelected() ? labelNumber++ : -1);
    }
    return labelNumber;
}

} // namespace SquareAggregator
