#include "squaregenerator.h"
#include "debugutils.h"
#include "gridpartitioner.h"
#include "spatialassigner.h"
#include "squareaggregator.h"
#include "squaresettings.h"
#include "trackattributes.h"
#include <opencv2/core.hpp>
#include <QDebug>
#include <cmath>
#include <utility>

SquareGenerator::SquareGenerator(const Squares::GenerateSquaresSettings& settings,
                                 std::shared_ptr<const DecaySolver> solver)
    : m_settings(settings),
    m_solver(solver ? std::move(solver) : std::make_shared<LevenbergMarquardtDecaySolver>())
{
}

const Squares::GenerateSquaresSettings& SquareGenerator::getSettings() const {
    return m_settings;
}

GenerationReport SquareGenerator::generate(Recording& recording) const {
    SquareSettings::validate(m_settings);
    if (!(recording.getConcentration() > 0.0)) {
        throw Squares::InvalidConfiguration(
            QString("Concentration of recording %1 must be positive, got %2")
                .arg(recording.getName()).arg(recording.getConcentration()).toStdString());
    }

    GenerationReport report;
    report.recordingName = recording.getName();
    report.numberOfTracks = recording.getNumberOfTracks();

    const Squares::FieldOfView fieldOfView = m_settings.fieldOfView();
    const int resolution = m_settings.gridResolution;

    // --- Phase 1: tracks, grid, assignment, raw densities ---
    calculateTrackAttributes(recording, report);

    recording.setSquares(GridPartitioner::createSquares(fieldOfView, resolution), resolution);
    report.numberOfSquares = static_cast<int>(recording.getSquares().size());

    const SpatialAssignment assignment =
        SpatialAssigner::assignTracks(recording.getTracks(), recording.getSquares(), fieldOfView, resolution);
    report.undefinedLocations = assignment.undefinedLocations;
    report.outOfBoundsTracks = assignment.outOfBoundsTracks;

    std::vector<Squares::Track>& tracks = recording.getTracks();
    for (size_t i = 0; i < tracks.size(); ++i) {
        tracks[i].squareNumber = assignment.squareOfTrack[i];
    }

    if (assignment.excludedTracks() > 0) {
        qWarning() << "SquareGenerator: recording" << recording.getName() << "-" << assignment.excludedTracks()
                   << "of" << tracks.size() << "tracks not assigned (" << assignment.undefinedLocations
                   << "without location," << assignment.outOfBoundsTracks << "outside the field of view)";
    }

    calculateRawDensities(recording);

    // --- Barrier: background needs every raw density ---
    const BackgroundEstimate background = BackgroundEstimator::estimate(recording.getSquares(), m_settings);
    report.backgroundDensity = background.density;
    if (std::isnan(background.density) || background.density == 0.0) {
        qWarning() << "SquareGenerator: recording" << recording.getName()
                   << "has no background density, density ratios are undefined";
    }

    // --- Phase 2: statistics, selection, recording attributes ---
    finalizeSquares(recording, background, report);

    std::vector<Square>& squares = recording.getSquares();
    report.selectedSquares = SquareAggregator::applyVisibilityFilter(squares,
                                                                     m_settings.minRequiredDensityRatio,
                                                                     m_settings.maxAllowableVariability,
                                                                     m_settings.minRequiredRSquared,
                                                                     m_settings.neighbourMode);
    SquareAggregator::assignLabelNumbers(squares);
    for (const Square& square : squares) {
        for (int index : square.getTrackIndices()) {
            tracks[index].labelNumber = square.getLabelNumber();
        }
    }

    calculateRecordingAttributes(recording, background, report);

    qInfo() << "SquareGenerator: recording" << recording.getName() << "-" << report.numberOfSquares << "squares,"
            << report.numberOfTracks << "tracks," << report.selectedSquares << "selected squares";
    return report;
}

void SquareGenerator::calculateTrackAttributes(Recording& recording, GenerationReport& report) const {
    std::vector<Squares::Track>& tracks = recording.getTracks();

    for (Squares::Track& track : tracks) {
        if (track.recordingName.isEmpty()) {
            track.recordingName = recording.getName();
        }
        if (!track.samples.empty()) {
            report.recalculatedTracks++;
        }
    }

    const double timeInterval = m_settings.timeInterval;
    cv::parallel_for_(cv::Range(0, static_cast<int>(tracks.size())), [&](const cv::Range& range) {
        for (int i = range.start; i < range.end; ++i) {
            TrackAttributeCalculator::updateTrack(tracks[i], timeInterval);
        }
    });

    SQUARES_DEBUG() << "SquareGenerator: recalculated attributes of" << report.recalculatedTracks << "of"
                    << tracks.size() << "tracks in" << recording.getName();
}

void SquareGenerator::calculateRawDensities(Recording& recording) const {
    const double duration = m_settings.recordingDurationSeconds();
    const double concentration = recording.getConcentration();
    for (Square& square : recording.getSquares()) {
        square.setRawDensity(SquareAggregator::calculateDensity(square.getNumberOfTracks(), square.getArea(),
                                                                duration, concentration));
    }
}

void SquareGenerator::finalizeSquares(Recording& recording, const BackgroundEstimate& background,
                                      GenerationReport& report) const {
    AggregationContext context;
    context.minTracks = m_settings.minTracksToCalculateTau;
    context.recordingDurationSeconds = m_settings.recordingDurationSeconds();
    context.concentration = recording.getConcentration();
    context.backgroundDensity = background.density;
    context.variabilityGranularity = m_settings.variabilityGranularity;
    context.minRSquared = m_settings.minRequiredRSquared;
    context.solver = m_solver.get();

    std::vector<Square>& squares = recording.getSquares();
    const std::vector<Squares::Track>& tracks = recording.getTracks();
    std::vector<DecayFitting::FitStatus> fitStatus(squares.size(), DecayFitting::FitStatus::InsufficientPoints);

    cv::parallel_for_(cv::Range(0, static_cast<int>(squares.size())), [&](const cv::Range& range) {
        for (int i = range.start; i < range.end; ++i) {
            squares[i].finalizeStatistics(SquareAggregator::aggregate(squares[i], tracks, context, &fitStatus[i]));
        }
    });

    // Reported in square order so the log is the same for every run
    for (size_t i = 0; i < squares.size(); ++i) {
        const int count = squares[i].getNumberOfTracks();
        if (count == 0 || count < context.minTracks) {
            continue;
        }
        report.aggregatedSquares++;
        if (fitStatus[i] == DecayFitting::FitStatus::NoFit) {
            report.failedFits++;
            qWarning() << "SquareGenerator: recording" << recording.getName() << "square"
                       << squares[i].getSquareNumber() << "- no tau fit for" << count << "tracks";
        } else if (fitStatus[i] == DecayFitting::FitStatus::RSquaredTooLow) {
            SQUARES_DEBUG() << "SquareGenerator: recording" << recording.getName() << "square"
                            << squares[i].getSquareNumber() << "- tau fit below the R squared limit";
        }
    }
}

void SquareGenerator::calculateRecordingAttributes(Recording& recording, const BackgroundEstimate& background,
                                                   const GenerationReport& report) const {
    Squares::RecordingAttributes attributes;
    attributes.backgroundDensity = background.density;
    attributes.numberOfSquaresInBackground = static_cast<int>(background.squareNumbers.size());
    attributes.numberOfTracksInBackground = background.numberOfTracks;
    attributes.averageTracksInBackground = SquareUtils::roundTo(background.averageTracks, 2);
    attributes.numberOfSelectedSquares = report.selectedSquares;
    attributes.numberOfExcludedTracks = report.undefinedLocations + report.outOfBoundsTracks;

    const std::vector<int> selectedTracks = recording.getTracksInSelectedSquares();
    if (!selectedTracks.empty()) {
        std::vector<double> durations;
        durations.reserve(selectedTracks.size());
        for (int index : selectedTracks) {
            durations.push_back(recording.getTracks()[index].attributes.duration);
        }

        const DecayFitting::TauResult tau = DecayFitting::calculateTau(durations,
                                                                        m_settings.minTracksToCalculateTau,
                                                                        m_settings.minRequiredRSquared,
                                                                        *m_solver);
        if (tau.status == DecayFitting::FitStatus::Success) {
            attributes.tau = SquareUtils::roundTo(tau.tau, 0);
            attributes.rSquared = SquareUtils::roundTo(tau.rSquared, 3);
        } else {
            SQUARES_DEBUG() << "SquareGenerator: recording" << recording.getName() << "tau not determined:"
                            << DecayFitting::fitStatusToString(tau.status);
        }

        double selectedArea = 0.0;
        for (const Square& square : recording.getSquares()) {
            if (square.isSelected()) selectedArea += square.getArea();
        }
        attributes.density = SquareUtils::roundTo(
            SquareAggregator::calculateDensity(static_cast<int>(selectedTracks.size()), selectedArea,
                                               m_settings.recordingDurationSeconds(), recording.getConcentration()), 3);
    }

    recording.setAttributes(attributes);
}
