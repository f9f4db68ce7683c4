#pragma once

/// @file stats.h
/// @brief Distribution functions and descriptive statistics for drift tests

#include <cstddef>
#include <vector>

namespace driftwatch::drift::stats {

/// @brief Survival function of the Kolmogorov distribution, P(K > x)
///
/// Uses the theta-function form below x = 1.18 and the alternating
/// series above it; both converge to double precision in four terms.
double KolmogorovSurvival(double x);

/// @brief Two-sample KS statistic: max |F1(x) - F2(x)| over all x
///
/// Inputs need not be sorted. Tied values advance both empirical CDFs
/// before the gap is measured. Returns 0 when either sample is empty.
double KolmogorovSmirnovStatistic(std::vector<double> sample1,
                                  std::vector<double> sample2);

/// @brief Asymptotic two-sided p-value of a two-sample KS statistic
///
/// p = Q_KS((sqrt(en) + 0.12 + 0.11 / sqrt(en)) * d) with
/// en = n1 * n2 / (n1 + n2) (Stephens' correction).
double KolmogorovSmirnovPValue(double d, size_t n1, size_t n2);

/// @brief Regularized upper incomplete gamma function Q(a, x)
double RegularizedGammaQ(double a, double x);

/// @brief Survival function of the chi-squared distribution
/// @param x Statistic (infinity yields 0)
/// @param dof Degrees of freedom, must be positive
double ChiSquaredSurvival(double x, double dof);

/// @brief Linear-interpolation quantile of a sorted, non-empty sample
double QuantileSorted(const std::vector<double>& sorted, double q);

/// @brief Descriptive statistics of one sample
///
/// Undefined statistics are NaN: everything but count for an empty
/// sample, std for a single value.
struct DescriptiveStats {
    double count = 0.0;
    double mean = 0.0;
    double std = 0.0;   ///< Sample standard deviation (N - 1)
    double min = 0.0;
    double q25 = 0.0;
    double q50 = 0.0;
    double q75 = 0.0;
    double max = 0.0;
};

/// @brief Compute count, mean, std, min, quartiles and max
DescriptiveStats Describe(std::vector<double> values);

/// @brief Equal-width histogram over [lo, hi], normalized to sum to 1
///
/// Values equal to hi fall in the last bin. When lo == hi every value
/// falls in the first bin.
std::vector<double> NormalizedHistogram(const std::vector<double>& values,
                                        double lo, double hi, size_t bins);

/// @brief Jensen-Shannon distance (base 2) of two probability vectors
///
/// Square root of the JS divergence; 0 for identical vectors, 1 for
/// disjoint support. Vectors must have equal length.
double JensenShannonDistance(const std::vector<double>& p,
                             const std::vector<double>& q);

}  // namespace driftwatch::drift::stats
