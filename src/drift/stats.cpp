/// @file stats.cpp
/// @brief Distribution functions and descriptive statistics

#include "drift/stats.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace driftwatch::drift::stats {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Iteration limits and tolerances for the incomplete gamma evaluation
constexpr int kMaxGammaIterations = 1000;
constexpr double kGammaEpsilon = 1e-15;
constexpr double kTinyDouble = 1e-300;

// P(a, x) by its power series; converges fast for x < a + 1
double GammaPSeries(double a, double x) {
    double ap = a;
    double term = 1.0 / a;
    double sum = term;
    for (int n = 0; n < kMaxGammaIterations; ++n) {
        ap += 1.0;
        term *= x / ap;
        sum += term;
        if (std::abs(term) < std::abs(sum) * kGammaEpsilon) {
            break;
        }
    }
    return sum * std::exp(-x + a * std::log(x) - std::lgamma(a));
}

// Q(a, x) by its continued fraction (modified Lentz); for x >= a + 1
double GammaQContinuedFraction(double a, double x) {
    double b = x + 1.0 - a;
    double c = 1.0 / kTinyDouble;
    double d = 1.0 / b;
    double h = d;
    for (int i = 1; i < kMaxGammaIterations; ++i) {
        double an = -static_cast<double>(i) * (static_cast<double>(i) - a);
        b += 2.0;
        d = an * d + b;
        if (std::abs(d) < kTinyDouble) {
            d = kTinyDouble;
        }
        c = b + an / c;
        if (std::abs(c) < kTinyDouble) {
            c = kTinyDouble;
        }
        d = 1.0 / d;
        double delta = d * c;
        h *= delta;
        if (std::abs(delta - 1.0) < kGammaEpsilon) {
            break;
        }
    }
    return std::exp(-x + a * std::log(x) - std::lgamma(a)) * h;
}

}  // namespace

double KolmogorovSurvival(double x) {
    if (!(x > 0.0)) {
        return 1.0;
    }
    if (std::isinf(x)) {
        return 0.0;
    }

    double q;
    if (x < 1.18) {
        // CDF = sqrt(2 pi) / x * sum_k exp(-(2k - 1)^2 pi^2 / (8 x^2))
        double y = std::exp(-kPi * kPi / (8.0 * x * x));
        double cdf = std::sqrt(2.0 * kPi) / x *
                     (y + std::pow(y, 9.0) + std::pow(y, 25.0) + std::pow(y, 49.0));
        q = 1.0 - cdf;
    } else {
        // Q = 2 sum_k (-1)^(k-1) exp(-2 k^2 x^2)
        double y = std::exp(-2.0 * x * x);
        q = 2.0 * (y - std::pow(y, 4.0) + std::pow(y, 9.0) - std::pow(y, 16.0));
    }
    return std::clamp(q, 0.0, 1.0);
}

double KolmogorovSmirnovStatistic(std::vector<double> sample1,
                                  std::vector<double> sample2) {
    if (sample1.empty() || sample2.empty()) {
        return 0.0;
    }

    std::sort(sample1.begin(), sample1.end());
    std::sort(sample2.begin(), sample2.end());

    const double n1 = static_cast<double>(sample1.size());
    const double n2 = static_cast<double>(sample2.size());

    size_t i = 0;
    size_t j = 0;
    double d = 0.0;

    while (i < sample1.size() && j < sample2.size()) {
        const double x = std::min(sample1[i], sample2[j]);
        while (i < sample1.size() && sample1[i] <= x) {
            ++i;
        }
        while (j < sample2.size() && sample2[j] <= x) {
            ++j;
        }
        const double cdf1 = static_cast<double>(i) / n1;
        const double cdf2 = static_cast<double>(j) / n2;
        d = std::max(d, std::abs(cdf1 - cdf2));
    }

    return d;
}

double KolmogorovSmirnovPValue(double d, size_t n1, size_t n2) {
    if (n1 == 0 || n2 == 0) {
        return 1.0;
    }
    const double m = static_cast<double>(n1);
    const double n = static_cast<double>(n2);
    const double en = std::sqrt(m * n / (m + n));
    return KolmogorovSurvival((en + 0.12 + 0.11 / en) * d);
}

double RegularizedGammaQ(double a, double x) {
    if (x <= 0.0) {
        return 1.0;
    }
    if (std::isinf(x)) {
        return 0.0;
    }
    if (x < a + 1.0) {
        return std::clamp(1.0 - GammaPSeries(a, x), 0.0, 1.0);
    }
    return std::clamp(GammaQContinuedFraction(a, x), 0.0, 1.0);
}

double ChiSquaredSurvival(double x, double dof) {
    if (dof <= 0.0 || std::isnan(x)) {
        return kNaN;
    }
    return RegularizedGammaQ(dof / 2.0, x / 2.0);
}

double QuantileSorted(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) {
        return kNaN;
    }
    const double position = q * static_cast<double>(sorted.size() - 1);
    const size_t lower = static_cast<size_t>(std::floor(position));
    const size_t upper = std::min(lower + 1, sorted.size() - 1);
    const double fraction = position - static_cast<double>(lower);
    return sorted[lower] + (sorted[upper] - sorted[lower]) * fraction;
}

DescriptiveStats Describe(std::vector<double> values) {
    DescriptiveStats result;
    result.count = static_cast<double>(values.size());

    if (values.empty()) {
        result.mean = result.std = result.min = kNaN;
        result.q25 = result.q50 = result.q75 = result.max = kNaN;
        return result;
    }

    std::sort(values.begin(), values.end());

    const double n = static_cast<double>(values.size());
    result.mean = std::accumulate(values.begin(), values.end(), 0.0) / n;

    if (values.size() < 2) {
        result.std = kNaN;
    } else {
        double sum_sq = 0.0;
        for (double v : values) {
            const double diff = v - result.mean;
            sum_sq += diff * diff;
        }
        result.std = std::sqrt(sum_sq / (n - 1.0));
    }

    result.min = values.front();
    result.q25 = QuantileSorted(values, 0.25);
    result.q50 = QuantileSorted(values, 0.50);
    result.q75 = QuantileSorted(values, 0.75);
    result.max = values.back();
    return result;
}

std::vector<double> NormalizedHistogram(const std::vector<double>& values,
                                        double lo, double hi, size_t bins) {
    std::vector<double> histogram(bins, 0.0);
    if (values.empty() || bins == 0) {
        return histogram;
    }

    // Halved operands keep the span finite for ranges near the double limits
    const double half_span = 0.5 * hi - 0.5 * lo;
    const double bin_count = static_cast<double>(bins);
    for (double v : values) {
        size_t bin = 0;
        if (half_span > 0.0) {
            const double offset = (0.5 * v - 0.5 * lo) / half_span * bin_count;
            if (offset >= bin_count) {
                bin = bins - 1;
            } else if (offset > 0.0) {
                bin = static_cast<size_t>(offset);
            }
        }
        histogram[bin] += 1.0;
    }

    const double total = static_cast<double>(values.size());
    for (auto& count : histogram) {
        count /= total;
    }
    return histogram;
}

double JensenShannonDistance(const std::vector<double>& p,
                             const std::vector<double>& q) {
    if (p.size() != q.size() || p.empty()) {
        return kNaN;
    }

    double divergence = 0.0;
    for (size_t i = 0; i < p.size(); ++i) {
        const double m = 0.5 * (p[i] + q[i]);
        if (p[i] > 0.0) {
            divergence += 0.5 * p[i] * std::log2(p[i] / m);
        }
        if (q[i] > 0.0) {
            divergence += 0.5 * q[i] * std::log2(q[i] / m);
        }
    }
    return std::sqrt(std::clamp(divergence, 0.0, 1.0));
}

}  // namespace driftwatch::drift::stats
