#include "decayfitter.h"
#include "debugutils.h"
#include <opencv2/core.hpp>
#include <opencv2/calib3d.hpp> // For cv::LMSolver
#include <QDebug>
#include <algorithm>
#include <cmath>
#include <map>

namespace {

// Residuals and Jacobian of y = m * exp(-t * x) + b for parameters [m, t, b]
class ExponentialDecayCallback : public cv::LMSolver::Callback {
public:
    ExponentialDecayCallback(const std::vector<double>& x, const std::vector<double>& y)
        : m_x(x), m_y(y) {}

    bool compute(cv::InputArray param, cv::OutputArray err, cv::OutputArray J) const override {
        cv::Mat p = param.getMat();
        if (p.total() != 3) {
            return false;
        }
        const double m = p.at<double>(0);
        const double t = p.at<double>(1);
        const double b = p.at<double>(2);
        const int n = static_cast<int>(m_x.size());

        cv::Mat residuals;
        if (err.needed()) {
            err.create(n, 1, CV_64F);
            residuals = err.getMat();
        }

        cv::Mat jacobian;
        if (J.needed()) {
            J.create(n, 3, CV_64F);
            jacobian = J.getMat();
        }

        for (int i = 0; i < n; ++i) {
            const double e = std::exp(-t * m_x[i]);
            if (!residuals.empty()) {
                residuals.at<double>(i) = m * e + b - m_y[i];
            }
            if (!jacobian.empty()) {
                jacobian.at<double>(i, 0) = e;
                jacobian.at<double>(i, 1) = -m * m_x[i] * e;
                jacobian.at<double>(i, 2) = 1.0;
            }
        }
        return true;
    }

private:
    const std::vector<double>& m_x;
    const std::vector<double>& m_y;
};

int countDistinct(std::vector<double> values) {
    std::sort(values.begin(), values.end());
    return static_cast<int>(std::unique(values.begin(), values.end()) - values.begin());
}

bool allFinite(const std::vector<double>& values) {
    return std::all_of(values.begin(), values.end(), [](double v) { return std::isfinite(v); });
}

} // namespace


LevenbergMarquardtDecaySolver::LevenbergMarquardtDecaySolver(int maxIterations)
    : m_maxIterations(maxIterations > 0 ? maxIterations : 1000)
{
}

void LevenbergMarquardtDecaySolver::initialGuess(const std::vector<double>& x, const std::vector<double>& y,
                                                 double& m, double& t, double& b) {
    if (x.empty() || x.size() != y.size()) {
        m = 1.0;
        t = 1.0;
        b = 0.0;
        return;
    }

    const auto [minY, maxY] = std::minmax_element(y.begin(), y.end());
    const auto [minX, maxX] = std::minmax_element(x.begin(), x.end());

    m = std::max(1e-9, *maxY);
    b = std::max(0.0, *minY);

    // Slope of ln(y - b) over the points that clearly lie above the offset
    const double eps = std::max(1e-6, 0.01 * (*maxY - *minY));
    double sx = 0.0, sy = 0.0, sxx = 0.0, sxy = 0.0;
    int n = 0;
    for (size_t i = 0; i < x.size(); ++i) {
        const double adjusted = y[i] - b;
        if (adjusted > eps) {
            const double ly = std::log(adjusted);
            sx += x[i];
            sy += ly;
            sxx += x[i] * x[i];
            sxy += x[i] * ly;
            n++;
        }
    }

    t = 0.0;
    if (n >= 2) {
        const double denominator = n * sxx - sx * sx;
        if (std::abs(denominator) > 1e-12) {
            const double slope = (n * sxy - sx * sy) / denominator;
            if (slope < 0.0) {
                t = -slope;
            }
        }
    }
    if (t <= 0.0) {
        t = 1.0 / std::max(1e-3, *maxX - *minX);
    }
    t = std::clamp(t, 1e-9, 1e3);
}

DecayFitResult LevenbergMarquardtDecaySolver::fit(const std::vector<double>& x, const std::vector<double>& y) const {
    DecayFitResult result;

    if (x.size() != y.size() || x.empty()) {
        SQUARES_DEBUG() << "LevenbergMarquardtDecaySolver: x and y differ in length or are empty";
        return result;
    }
    if (!allFinite(x) || !allFinite(y)) {
        SQUARES_DEBUG() << "LevenbergMarquardtDecaySolver: non-finite input";
        return result;
    }
    if (countDistinct(x) < 3) {
        return result;
    }

    double meanY = 0.0;
    for (double v : y) meanY += v;
    meanY /= static_cast<double>(y.size());
    double ssTot = 0.0;
    for (double v : y) ssTot += (v - meanY) * (v - meanY);
    if (ssTot <= 0.0) {
        // A flat histogram leaves R squared undefined
        return result;
    }

    double m0 = 0.0, t0 = 0.0, b0 = 0.0;
    initialGuess(x, y, m0, t0, b0);
    cv::Mat param = (cv::Mat_<double>(3, 1) << m0, t0, b0);

    int iterations = -1;
    try {
        cv::Ptr<cv::LMSolver> solver =
            cv::LMSolver::create(cv::makePtr<ExponentialDecayCallback>(x, y), m_maxIterations);
        iterations = solver->run(param);
    } catch (const cv::Exception& e) {
        qWarning() << "LevenbergMarquardtDecaySolver: solver raised an exception:" << e.what();
        return result;
    }

    if (iterations < 0) {
        SQUARES_DEBUG() << "LevenbergMarquardtDecaySolver: no convergence within" << m_maxIterations << "iterations";
        return result;
    }

    const double m = param.at<double>(0);
    const double t = param.at<double>(1);
    const double b = param.at<double>(2);
    if (!std::isfinite(m) || !std::isfinite(t) || !std::isfinite(b) || t <= 0.0) {
        SQUARES_DEBUG() << "LevenbergMarquardtDecaySolver: rejected parameters m =" << m << "t =" << t << "b =" << b;
        return result;
    }

    double ssRes = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        const double r = y[i] - (m * std::exp(-t * x[i]) + b);
        ssRes += r * r;
    }
    const double rSquared = 1.0 - ssRes / ssTot;
    if (!std::isfinite(rSquared)) {
        return result;
    }

    result.tau = 1000.0 / t;
    result.rSquared = rSquared;
    result.converged = true;
    return result;
}


namespace DecayFitting {

QString fitStatusToString(FitStatus status) {
    switch (status) {
    case FitStatus::Success: return "Success";
    case FitStatus::InsufficientPoints: return "Insufficient points";
    case FitStatus::RSquaredTooLow: return "R squared too low";
    case FitStatus::NoFit: return "No fit";
    default: return "Unknown";
    }
}

void buildDurationHistogram(const std::vector<double>& durations,
                            std::vector<double>& x, std::vector<double>& y) {
    std::map<double, int> frequencies;
    for (double d : durations) {
        if (std::isnan(d)) continue;
        frequencies[d]++;
    }

    x.clear();
    y.clear();
    x.reserve(frequencies.size());
    y.reserve(frequencies.size());
    for (const auto& [duration, count] : frequencies) {
        x.push_back(duration);
        y.push_back(static_cast<double>(count));
    }
}

TauResult calculateTau(const std::vector<double>& durations, int minTracks, double minRSquared,
                       const DecaySolver& solver) {
    TauResult result;
    if (static_cast<int>(durations.size()) < minTracks || durations.empty()) {
        result.status = FitStatus::InsufficientPoints;
        return result;
    }

    std::vector<double> x;
    std::vector<double> y;
    buildDurationHistogram(durations, x, y);
    if (x.size() < 3) {
        result.status = FitStatus::NoFit;
        return result;
    }

    const DecayFitResult fit = solver.fit(x, y);
    if (!fit.converged) {
        result.status = FitStatus::NoFit;
        return result;
    }

    result.tau = fit.tau;
    result.rSquared = fit.rSquared;
    result.status = fit.rSquared < minRSquared ? FitStatus::RSquaredTooLow : FitStatus::Success;
    return result;
}

} // namespace DecayFitting
