#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace libresidiag {
namespace utils {

/**
 * Central moments of a sample (population normalisation, divide by n)
 */
struct CentralMoments {
	double mean = std::numeric_limits<double>::quiet_NaN();
	double m2 = std::numeric_limits<double>::quiet_NaN();
	double m3 = std::numeric_limits<double>::quiet_NaN();
	double m4 = std::numeric_limits<double>::quiet_NaN();

	/// Biased sample skewness sqrt(b1) = m3 / m2^1.5
	double skewness() const {
		return m3 / std::pow(m2, 1.5);
	}

	/// Pearson kurtosis b2 = m4 / m2^2 (3 for a normal distribution)
	double kurtosis() const {
		return m4 / (m2 * m2);
	}
};

inline double Mean(const Eigen::VectorXd &x) {
	if (x.size() == 0) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return x.mean();
}

/// Variance with divisor n
inline double PopulationVariance(const Eigen::VectorXd &x) {
	if (x.size() == 0) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const double mean = x.mean();
	return (x.array() - mean).square().sum() / static_cast<double>(x.size());
}

inline CentralMoments ComputeCentralMoments(const Eigen::VectorXd &x) {
	CentralMoments moments;
	const Eigen::Index n = x.size();
	if (n == 0) {
		return moments;
	}

	moments.mean = x.mean();
	double m2 = 0.0;
	double m3 = 0.0;
	double m4 = 0.0;
	for (Eigen::Index i = 0; i < n; i++) {
		const double dev = x(i) - moments.mean;
		const double dev2 = dev * dev;
		m2 += dev2;
		m3 += dev2 * dev;
		m4 += dev2 * dev2;
	}
	const double nd = static_cast<double>(n);
	moments.m2 = m2 / nd;
	moments.m3 = m3 / nd;
	moments.m4 = m4 / nd;
	return moments;
}

inline double Median(const Eigen::VectorXd &x) {
	const size_t n = static_cast<size_t>(x.size());
	if (n == 0) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	std::vector<double> sorted(x.data(), x.data() + n);
	std::sort(sorted.begin(), sorted.end());
	if (n % 2 == 1) {
		return sorted[n / 2];
	}
	return 0.5 * (sorted[n / 2 - 1] + sorted[n / 2]);
}

/// True when the sample range is zero relative to its magnitude
inline bool IsConstant(const Eigen::VectorXd &x, double tol = 1e-12) {
	if (x.size() < 2) {
		return true;
	}
	const double range = x.maxCoeff() - x.minCoeff();
	const double scale = x.cwiseAbs().maxCoeff();
	return range <= tol * scale;
}

} // namespace utils
} // namespace libresidiag
