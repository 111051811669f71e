#ifndef DECAYFITTER_H
#define DECAYFITTER_H

#include <QString>
#include <vector>
#include "squarecommon.h"

/**
 * @brief Outcome of fitting y = m * exp(-t * x) + b to a histogram.
 *
 * tau is 1000 / t in milliseconds. Both tau and rSquared are NaN whenever
 * converged is false.
 */
struct DecayFitResult {
    double tau = SquareConstants::UNDEFINED;
    double rSquared = SquareConstants::UNDEFINED;
    bool converged = false;
};

/**
 * @brief Numerical method used to fit the exponential decay.
 *
 * Implementations must be deterministic and must never throw: any failure is
 * reported as a result with converged == false.
 */
class DecaySolver {
public:
    virtual ~DecaySolver() = default;

    /**
     * @brief Fit the decay model to paired samples.
     * @param x Track durations in seconds (histogram bins).
     * @param y Number of tracks per bin.
     * @return The fitted tau and the coefficient of determination.
     */
    virtual DecayFitResult fit(const std::vector<double>& x, const std::vector<double>& y) const = 0;
};

/**
 * @brief Levenberg-Marquardt fit of the three-parameter decay using cv::LMSolver.
 */
class LevenbergMarquardtDecaySolver : public DecaySolver {
public:
    explicit LevenbergMarquardtDecaySolver(int maxIterations = 1000);

    DecayFitResult fit(const std::vector<double>& x, const std::vector<double>& y) const override;

    // Starting point [m, t, b] derived from the data; exposed for diagnostics
    static void initialGuess(const std::vector<double>& x, const std::vector<double>& y,
                             double& m, double& t, double& b);

private:
    int m_maxIterations;
};


namespace DecayFitting {

enum class FitStatus {
    Success,
    InsufficientPoints, // Fewer tracks than required
    RSquaredTooLow,     // Fit converged but explains too little of the histogram
    NoFit               // Too few distinct durations or the solver failed
};

QString fitStatusToString(FitStatus status);

struct TauResult {
    FitStatus status = FitStatus::NoFit;
    double tau = SquareConstants::UNDEFINED;
    double rSquared = SquareConstants::UNDEFINED;
};

// Frequency of each distinct duration, ordered by duration. NaN durations are skipped.
void buildDurationHistogram(const std::vector<double>& durations,
                            std::vector<double>& x, std::vector<double>& y);

/**
 * @brief Fit tau to the duration distribution of a set of tracks.
 * @param durations Track durations in seconds.
 * @param minTracks Minimum number of tracks before a fit is attempted.
 * @param minRSquared Fits with a lower R squared report RSquaredTooLow.
 * @param solver The numerical method to use.
 */
TauResult calculateTau(const std::vector<double>& durations, int minTracks, double minRSquared,
                       const DecaySolver& solver);

} // namespace DecayFitting

#endif // DECAYFITTER_H
