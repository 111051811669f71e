#ifndef SQUARECOMMON_H
#define SQUARECOMMON_H

#include <QString>
#include <QStringList>
#include <vector>
#include <limits>    // For std::numeric_limits
#include <stdexcept> // For std::runtime_error


// This header defines the types shared by the grid, aggregation and output
// components so they do not depend on each other's headers.


namespace SquareConstants {
constexpr double UNDEFINED = std::numeric_limits<double>::quiet_NaN();

// Acquisition geometry and timing of a standard recording
constexpr double DEFAULT_PIXEL_SIZE_MICROMETER = 0.1603251;
constexpr int DEFAULT_IMAGE_WIDTH_PIXELS = 512;
constexpr int DEFAULT_IMAGE_HEIGHT_PIXELS = 512;
constexpr double DEFAULT_TIME_INTERVAL_SECONDS = 0.05;
constexpr int DEFAULT_NUMBER_OF_FRAMES = 2000;

constexpr int DEFAULT_GRID_RESOLUTION = 20;           // 20 x 20 = 400 squares
constexpr int DEFAULT_MIN_TRACKS_FOR_TAU = 20;
constexpr double DEFAULT_MIN_R_SQUARED = 0.1;
constexpr double DEFAULT_MIN_DENSITY_RATIO = 0.1;
constexpr double DEFAULT_MAX_VARIABILITY = 10.0;
constexpr int DEFAULT_VARIABILITY_GRANULARITY = 10;   // K x K sub-grid per square
constexpr int DEFAULT_BACKGROUND_SAMPLE_COUNT = 60;
constexpr double LONG_SHORT_TRACK_FRACTION = 0.1;     // Share of tracks in the long / short duration medians
constexpr quint64 DEFAULT_BACKGROUND_SEED = 42;

// Iterative clipping background method
constexpr int BACKGROUND_CLIPPING_MAX_ITERATIONS = 10;
constexpr double BACKGROUND_CLIPPING_EPSILON = 0.01;
constexpr double BACKGROUND_CLIPPING_SIGMA = 2.0;

// Points further than this fraction of the field size outside it are rejected
constexpr double BOUNDARY_TOLERANCE_FRACTION = 1e-9;
}


namespace Squares {

/**
 * @brief Thrown for settings that make a whole recording unprocessable
 * (grid resolution below 1, non-positive time interval, ...).
 */
class InvalidConfiguration : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Which neighbours a square needs before it may stay selected
enum class NeighbourMode {
    Free,       // No neighbour requirement
    Relaxed,    // At least one selected square among the 8 surrounding squares
    Strict      // At least one selected square among the 4 edge-sharing squares
};

inline QString neighbourModeToString(NeighbourMode mode) {
    switch (mode) {
    case NeighbourMode::Free: return "Free";
    case NeighbourMode::Relaxed: return "Relaxed";
    case NeighbourMode::Strict: return "Strict";
    default: return "Unknown";
    }
}

// Returns false for names that are not a neighbour mode
inline bool stringToNeighbourMode(const QString& modeStr, NeighbourMode& mode) {
    if (modeStr.compare("Free", Qt::CaseInsensitive) == 0) { mode = NeighbourMode::Free; return true; }
    if (modeStr.compare("Relaxed", Qt::CaseInsensitive) == 0) { mode = NeighbourMode::Relaxed; return true; }
    if (modeStr.compare("Strict", Qt::CaseInsensitive) == 0) { mode = NeighbourMode::Strict; return true; }
    return false;
}

enum class BackgroundMethod {
    RandomSample,       // Mean density of a seed-fixed random subset of squares
    IterativeClipping   // Mean density after repeatedly dropping squares above mean + 2 sigma
};

inline QString backgroundMethodToString(BackgroundMethod method) {
    switch (method) {
    case BackgroundMethod::RandomSample: return "Random Sample";
    case BackgroundMethod::IterativeClipping: return "Iterative Clipping";
    default: return "Unknown";
    }
}

inline bool stringToBackgroundMethod(const QString& methodStr, BackgroundMethod& method) {
    if (methodStr.compare("Random Sample", Qt::CaseInsensitive) == 0) { method = BackgroundMethod::RandomSample; return true; }
    if (methodStr.compare("Iterative Clipping", Qt::CaseInsensitive) == 0) { method = BackgroundMethod::IterativeClipping; return true; }
    return false;
}

/**
 * @brief Physical extent of a recording in micrometer.
 */
struct FieldOfView {
    double width = 0.0;
    double height = 0.0;

    double area() const { return width * height; }
};

/**
 * @brief One detected position of a particle on one frame.
 */
struct TrackSample {
    int frame = 0;      // Frame index in the recording
    double x = 0.0;     // Position in micrometer
    double y = 0.0;
};

/**
 * @brief Derived per-track values. Every double is NaN when undefined, never 0.
 */
struct TrackAttributes {
    int numberOfSpots = 0;
    int numberOfGaps = 0;                                       // Frame jumps larger than one
    int longestGap = 0;                                         // Frames missing in the largest jump
    double duration = SquareConstants::UNDEFINED;               // Seconds between first and last frame
    double xLocation = SquareConstants::UNDEFINED;              // Representative location (centroid)
    double yLocation = SquareConstants::UNDEFINED;
    double displacement = SquareConstants::UNDEFINED;           // First to last sample
    double totalDistance = SquareConstants::UNDEFINED;          // Sum of step lengths
    double confinementRatio = SquareConstants::UNDEFINED;
    double diffusionCoefficient = SquareConstants::UNDEFINED;   // From first-point MSD
    double diffusionCoefficientExt = SquareConstants::UNDEFINED;// From step MSD
    double maxSpeed = SquareConstants::UNDEFINED;
    double medianSpeed = SquareConstants::UNDEFINED;
};

/**
 * @brief A single particle trajectory together with its computed attributes.
 *
 * The samples are never modified after loading. A track read back from an
 * earlier run may carry attributes without samples.
 */
struct Track {
    QString recordingName;
    int trackId = -1;
    QString trackLabel;
    std::vector<TrackSample> samples;
    TrackAttributes attributes;
    int squareNumber = -1;  // Square the track is assigned to, -1 if excluded
    int labelNumber = -1;   // Label of that square when it is selected
};

/**
 * @brief Aggregate values of one square. Everything but the count is NaN
 * when the square holds too few tracks.
 */
struct SquareStatistics {
    int numberOfTracks = 0;
    double variability = SquareConstants::UNDEFINED;
    double density = SquareConstants::UNDEFINED;
    double densityRatio = SquareConstants::UNDEFINED;
    double tau = SquareConstants::UNDEFINED;              // Milliseconds
    double rSquared = SquareConstants::UNDEFINED;
    double medianDiffusionCoefficient = SquareConstants::UNDEFINED;
    double medianDiffusionCoefficientExt = SquareConstants::UNDEFINED;
    double medianLongTrackDuration = SquareConstants::UNDEFINED;    // Median of the longest tenth of the tracks
    double medianShortTrackDuration = SquareConstants::UNDEFINED;   // Median of the shortest tenth
    double medianDisplacement = SquareConstants::UNDEFINED;
    double maxDisplacement = SquareConstants::UNDEFINED;
    double totalDisplacement = SquareConstants::UNDEFINED;
    double medianMaxSpeed = SquareConstants::UNDEFINED;
    double maxMaxSpeed = SquareConstants::UNDEFINED;
    double medianMedianSpeed = SquareConstants::UNDEFINED;
    double maxMedianSpeed = SquareConstants::UNDEFINED;
    double maxTrackDuration = SquareConstants::UNDEFINED;
    double totalTrackDuration = SquareConstants::UNDEFINED;
    double medianTrackDuration = SquareConstants::UNDEFINED;
};

/**
 * @brief Values computed for the recording as a whole.
 */
struct RecordingAttributes {
    double tau = SquareConstants::UNDEFINED;
    double rSquared = SquareConstants::UNDEFINED;
    double density = SquareConstants::UNDEFINED;
    double backgroundDensity = SquareConstants::UNDEFINED;
    int numberOfSquaresInBackground = 0;
    int numberOfTracksInBackground = 0;
    double averageTracksInBackground = SquareConstants::UNDEFINED;
    int numberOfSelectedSquares = 0;
    int numberOfExcludedTracks = 0;     // Tracks whose location fell outside the field of view
};

/**
 * @brief Parameters of a square generation run.
 */
struct GenerateSquaresSettings {
    // Grid
    int gridResolution = SquareConstants::DEFAULT_GRID_RESOLUTION;

    // Acquisition
    double pixelSize = SquareConstants::DEFAULT_PIXEL_SIZE_MICROMETER;
    int imageWidthPixels = SquareConstants::DEFAULT_IMAGE_WIDTH_PIXELS;
    int imageHeightPixels = SquareConstants::DEFAULT_IMAGE_HEIGHT_PIXELS;
    double timeInterval = SquareConstants::DEFAULT_TIME_INTERVAL_SECONDS;
    int numberOfFrames = SquareConstants::DEFAULT_NUMBER_OF_FRAMES;

    // Aggregation
    int minTracksToCalculateTau = SquareConstants::DEFAULT_MIN_TRACKS_FOR_TAU;
    int variabilityGranularity = SquareConstants::DEFAULT_VARIABILITY_GRANULARITY;

    // Background
    BackgroundMethod backgroundMethod = BackgroundMethod::RandomSample;
    int backgroundSampleCount = SquareConstants::DEFAULT_BACKGROUND_SAMPLE_COUNT;
    quint64 backgroundSeed = SquareConstants::DEFAULT_BACKGROUND_SEED;

    // Visibility filter
    double minRequiredRSquared = SquareConstants::DEFAULT_MIN_R_SQUARED;
    double minRequiredDensityRatio = SquareConstants::DEFAULT_MIN_DENSITY_RATIO;
    double maxAllowableVariability = SquareConstants::DEFAULT_MAX_VARIABILITY;
    NeighbourMode neighbourMode = NeighbourMode::Free;

    FieldOfView fieldOfView() const {
        return FieldOfView{ pixelSize * imageWidthPixels, pixelSize * imageHeightPixels };
    }

    double recordingDurationSeconds() const { return numberOfFrames * timeInterval; }
};

} // namespace Squares


namespace SquareUtils {

bool isDefined(double value);

// Rounds half away from zero to the given number of decimals; NaN stays NaN
double roundTo(double value, int decimals);

// The helpers below ignore NaN entries and return NaN when nothing is left
double median(std::vector<double> values);
double maximum(const std::vector<double>& values);
double total(const std::vector<double>& values);

} // namespace SquareUtils


#endif // SQUARECOMMON_H
