#include "trackattributes.h"
#include <algorithm>
#include <cmath>

namespace TrackAttributeCalculator {

Squares::TrackAttributes calculate(std::vector<Squares::TrackSample> samples, double timeInterval) {
    Squares::TrackAttributes attributes;
    attributes.numberOfSpots = static_cast<int>(samples.size());

    if (samples.size() < 2) {
        return attributes;
    }

    std::stable_sort(samples.begin(), samples.end(),
                     [](const Squares::TrackSample& a, const Squares::TrackSample& b) {
                         return a.frame < b.frame;
                     });

    const Squares::TrackSample& first = samples.front();
    const Squares::TrackSample& last = samples.back();
    const bool timeValid = timeInterval > 0.0;

    double cumFirstPointMsd = 0.0;  // Squared displacement relative to the first sample
    double cumStepMsd = 0.0;        // Squared displacement per step
    double totalDistance = 0.0;
    double sumX = first.x;
    double sumY = first.y;
    int numberOfSteps = 0;
    std::vector<double> speeds;
    speeds.reserve(samples.size() - 1);

    for (size_t i = 1; i < samples.size(); ++i) {
        const Squares::TrackSample& prev = samples[i - 1];
        const Squares::TrackSample& cur = samples[i];

        const double dx = cur.x - prev.x;
        const double dy = cur.y - prev.y;
        const double stepSq = dx * dx + dy * dy;
        const double step = std::sqrt(stepSq);

        const double fx = cur.x - first.x;
        const double fy = cur.y - first.y;

        cumFirstPointMsd += fx * fx + fy * fy;
        cumStepMsd += stepSq;
        totalDistance += step;
        sumX += cur.x;
        sumY += cur.y;
        numberOfSteps++;

        const int frameDelta = cur.frame - prev.frame;
        if (frameDelta > 1) {
            attributes.numberOfGaps++;
            attributes.longestGap = std::max(attributes.longestGap, frameDelta - 1);
        }
        if (timeValid && frameDelta > 0) {
            speeds.push_back(step / (frameDelta * timeInterval));
        }
    }

    const double n = static_cast<double>(samples.size());
    attributes.xLocation = sumX / n;
    attributes.yLocation = sumY / n;
    attributes.displacement = std::hypot(last.x - first.x, last.y - first.y);

    // A track that never moved has no meaningful path length
    attributes.totalDistance = totalDistance > 0.0 ? totalDistance : SquareConstants::UNDEFINED;
    attributes.confinementRatio = totalDistance > 0.0 ? attributes.displacement / totalDistance
                                                      : SquareConstants::UNDEFINED;

    if (timeValid) {
        attributes.duration = (last.frame - first.frame) * timeInterval;
        if (numberOfSteps > 0) {
            const double denominator = 4.0 * timeInterval;
            attributes.diffusionCoefficient =
                SquareUtils::roundTo(cumFirstPointMsd / numberOfSteps / denominator, 2);
            attributes.diffusionCoefficientExt =
                SquareUtils::roundTo(cumStepMsd / numberOfSteps / denominator, 2);
        }
        attributes.maxSpeed = SquareUtils::maximum(speeds);
        attributes.medianSpeed = SquareUtils::median(speeds);
    }

    return attributes;
}

bool updateTrack(Squares::Track& track, double timeInterval) {
    if (track.samples.empty()) {
        return false;
    }
    track.attributes = calculate(track.samples, timeInterval);
    return true;
}

} // namespace TrackAttributeCalculator
