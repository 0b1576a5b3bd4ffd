#pragma once

#include "libresidiag/core/test_result.hpp"
#include "libresidiag/core/time_series.hpp"
#include "libresidiag/utils/descriptive.hpp"
#include "libresidiag/utils/distributions.hpp"
#include "libresidiag/utils/tracing.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace libresidiag {
namespace normality {

struct ShapiroWilkDetail {
	double w = 0.0;
	double p_value = 1.0;
	size_t n = 0;
	std::string warning;
};

struct DAgostinoPearsonDetail {
	double k2 = 0.0;
	double p_value = 1.0;
	size_t n = 0;

	/// Sample skewness sqrt(b1) and kurtosis b2
	double skewness = 0.0;
	double kurtosis = 0.0;

	/// Normalised skewness Z(sqrt(b1)) and kurtosis Z(b2)
	double z_skewness = 0.0;
	double z_kurtosis = 0.0;

	std::string warning;
};

/**
 * Shapiro-Wilk W test (Royston 1995, algorithm AS R94)
 *
 * W is the squared correlation between the ordered sample and approximate
 * expected normal order statistics. The p-value uses Royston's normalising
 * transformation of log(1 - W) (n = 3 is exact).
 *
 * Valid for 3 <= n <= 5000; larger samples are still computed but the
 * result carries a warning (W rejects trivial deviations at that size).
 */
class ShapiroWilk {
public:
	static constexpr size_t kMinSamples = 3;
	static constexpr size_t kMaxReliableSamples = 5000;

	/**
	 * @throws core::InvalidInputError for n < 3, non-finite values or a constant sample
	 */
	static ShapiroWilkDetail Compute(const Eigen::VectorXd &values) {
		core::RequireFinite(values, "Shapiro-Wilk");
		const size_t n = static_cast<size_t>(values.size());
		if (n < kMinSamples) {
			throw core::InvalidInputError("Shapiro-Wilk needs at least 3 observations (got " + std::to_string(n) +
			                              ")");
		}
		if (utils::IsConstant(values)) {
			throw core::InvalidInputError("Shapiro-Wilk is undefined for a constant series");
		}

		std::vector<double> x(values.data(), values.data() + n);
		std::sort(x.begin(), x.end());

		const std::vector<double> a = Coefficients(n);
		const size_t nn2 = n / 2;

		// Correlation between coefficients and the range-scaled sample
		std::vector<double> coef(n, 0.0);
		for (size_t i = 0; i < nn2; i++) {
			coef[i] = -a[i + 1];
			coef[n - 1 - i] = a[i + 1];
		}

		const double range = x[n - 1] - x[0];
		const double nd = static_cast<double>(n);
		double sa = 0.0;
		double sx = 0.0;
		for (size_t i = 0; i < n; i++) {
			sa += coef[i];
			sx += x[i] / range;
		}
		sa /= nd;
		sx /= nd;

		double ssa = 0.0;
		double ssx = 0.0;
		double sax = 0.0;
		for (size_t i = 0; i < n; i++) {
			const double asa = coef[i] - sa;
			const double xsx = x[i] / range - sx;
			ssa += asa * asa;
			ssx += xsx * xsx;
			sax += asa * xsx;
		}

		// 1 - W computed directly to keep precision when W is close to 1
		const double ssassx = std::sqrt(ssa * ssx);
		const double w1 = (ssassx - sax) * (ssassx + sax) / (ssa * ssx);

		ShapiroWilkDetail detail;
		detail.n = n;
		detail.w = 1.0 - w1;
		detail.p_value = PValue(detail.w, w1, n);

		if (n > kMaxReliableSamples) {
			detail.warning = "n=" + std::to_string(n) + " exceeds 5000, Shapiro-Wilk p-value may be inaccurate";
			RESIDIAG_WARN("Shapiro-Wilk " << detail.warning);
		}
		return detail;
	}

	static core::TestResult Test(const Eigen::VectorXd &values, double alpha = 0.05) {
		core::ValidateSignificanceLevel(alpha);
		auto detail = Compute(values);
		return core::TestResult::Valid(core::TestKind::SHAPIRO_WILK, detail.w, detail.p_value, alpha,
		                               detail.warning);
	}

	static core::TestResult Test(const core::TimeSeries &series, double alpha = 0.05) {
		series.Validate();
		return Test(series.values, alpha);
	}

private:
	static double Poly(const double *c, int nord, double x) {
		double result = c[0];
		if (nord > 1) {
			double p = x * c[nord - 1];
			for (int j = nord - 2; j > 0; j--) {
				p = (p + c[j]) * x;
			}
			result += p;
		}
		return result;
	}

	/// Royston's approximation of a_1..a_{n/2} (index 0 unused)
	static std::vector<double> Coefficients(size_t n) {
		static const double c1[6] = {0.0, 0.221157, -0.147981, -2.07119, 4.434685, -2.706056};
		static const double c2[6] = {0.0, 0.042981, -0.293762, -1.752461, 5.682633, -3.582633};

		const size_t nn2 = n / 2;
		std::vector<double> a(nn2 + 1, 0.0);

		if (n == 3) {
			a[1] = std::sqrt(0.5);
			return a;
		}

		const double an25 = static_cast<double>(n) + 0.25;
		double summ2 = 0.0;
		for (size_t i = 1; i <= nn2; i++) {
			a[i] = utils::normal_quantile((static_cast<double>(i) - 0.375) / an25);
			summ2 += a[i] * a[i];
		}
		summ2 *= 2.0;
		const double ssumm2 = std::sqrt(summ2);
		const double rsn = 1.0 / std::sqrt(static_cast<double>(n));
		const double a1 = Poly(c1, 6, rsn) - a[1] / ssumm2;

		size_t i1;
		double fac;
		if (n > 5) {
			i1 = 3;
			const double a2 = -a[2] / ssumm2 + Poly(c2, 6, rsn);
			fac = std::sqrt((summ2 - 2.0 * a[1] * a[1] - 2.0 * a[2] * a[2]) / (1.0 - 2.0 * a1 * a1 - 2.0 * a2 * a2));
			a[2] = a2;
		} else {
			i1 = 2;
			fac = std::sqrt((summ2 - 2.0 * a[1] * a[1]) / (1.0 - 2.0 * a1 * a1));
		}
		a[1] = a1;
		for (size_t i = i1; i <= nn2; i++) {
			a[i] /= -fac;
		}
		return a;
	}

	static double PValue(double w, double w1, size_t n) {
		static const double g[2] = {-2.273, 0.459};
		static const double c3[4] = {0.544, -0.39978, 0.025054, -6.714e-4};
		static const double c4[4] = {1.3822, -0.77857, 0.062767, -0.0020322};
		static const double c5[4] = {-1.5861, -0.31082, -0.083751, 0.0038915};
		static const double c6[3] = {-0.4803, -0.082676, 0.0030302};
		// 6/pi and pi/3
		static const double pi6 = 1.90985931710274;
		static const double stqr = 1.04719755119660;
		// smallest p reported when W is beyond the n <= 11 approximation
		static const double small = 1e-99;

		if (n == 3) {
			return std::max(0.0, pi6 * (std::asin(std::sqrt(w)) - stqr));
		}

		const double an = static_cast<double>(n);
		double y = std::log(w1);
		const double xx = std::log(an);
		double m;
		double s;
		if (n <= 11) {
			const double gamma = Poly(g, 2, an);
			if (y >= gamma) {
				return small;
			}
			y = -std::log(gamma - y);
			m = Poly(c3, 4, an);
			s = std::exp(Poly(c4, 4, an));
		} else {
			m = Poly(c5, 4, xx);
			s = std::exp(Poly(c6, 3, xx));
		}
		return utils::normal_sf((y - m) / s);
	}
};

/**
 * D'Agostino-Pearson omnibus K² test
 *
 * K² = Z(√b1)² + Z(b2)² ~ χ²(2), with D'Agostino's transformation of the
 * sample skewness and the Anscombe-Glynn transformation of the kurtosis.
 * Requires n >= 8; below 20 the kurtosis approximation is rough and the
 * result carries a warning.
 */
class DAgostinoPearson {
public:
	static constexpr size_t kMinSamples = 8;
	static constexpr size_t kMinReliableSamples = 20;

	/**
	 * @throws core::InvalidInputError for n < 8, non-finite values or a constant sample
	 */
	static DAgostinoPearsonDetail Compute(const Eigen::VectorXd &values) {
		core::RequireFinite(values, "D'Agostino-Pearson");
		const size_t n = static_cast<size_t>(values.size());
		if (n < kMinSamples) {
			throw core::InvalidInputError("D'Agostino-Pearson needs at least 8 observations (got " +
			                              std::to_string(n) + ")");
		}
		if (utils::IsConstant(values)) {
			throw core::InvalidInputError("D'Agostino-Pearson is undefined for a constant series");
		}

		const auto moments = utils::ComputeCentralMoments(values);

		DAgostinoPearsonDetail detail;
		detail.n = n;
		detail.skewness = moments.skewness();
		detail.kurtosis = moments.kurtosis();
		detail.z_skewness = SkewnessZ(detail.skewness, n);
		detail.z_kurtosis = KurtosisZ(detail.kurtosis, n);
		detail.k2 = detail.z_skewness * detail.z_skewness + detail.z_kurtosis * detail.z_kurtosis;
		detail.p_value = utils::chi_squared_sf(detail.k2, 2.0);

		if (n < kMinReliableSamples) {
			detail.warning = "n=" + std::to_string(n) + " is below 20, kurtosis z-score is approximate";
			RESIDIAG_WARN("D'Agostino-Pearson " << detail.warning);
		}
		return detail;
	}

	static core::TestResult Test(const Eigen::VectorXd &values, double alpha = 0.05) {
		core::ValidateSignificanceLevel(alpha);
		auto detail = Compute(values);
		return core::TestResult::Valid(core::TestKind::DAGOSTINO_PEARSON, detail.k2, detail.p_value, alpha,
		                               detail.warning);
	}

	static core::TestResult Test(const core::TimeSeries &series, double alpha = 0.05) {
		series.Validate();
		return Test(series.values, alpha);
	}

	/// D'Agostino (1970) normalisation of sqrt(b1)
	static double SkewnessZ(double sqrt_b1, size_t n) {
		const double nd = static_cast<double>(n);
		const double y = sqrt_b1 * std::sqrt((nd + 1.0) * (nd + 3.0) / (6.0 * (nd - 2.0)));
		const double beta2 = 3.0 * (nd * nd + 27.0 * nd - 70.0) * (nd + 1.0) * (nd + 3.0) /
		                     ((nd - 2.0) * (nd + 5.0) * (nd + 7.0) * (nd + 9.0));
		const double w2 = -1.0 + std::sqrt(2.0 * (beta2 - 1.0));
		const double delta = 1.0 / std::sqrt(0.5 * std::log(w2));
		const double alpha = std::sqrt(2.0 / (w2 - 1.0));
		return delta * std::asinh(y / alpha);
	}

	/// Anscombe-Glynn (1983) normalisation of b2
	static double KurtosisZ(double b2, size_t n) {
		const double nd = static_cast<double>(n);
		const double expected = 3.0 * (nd - 1.0) / (nd + 1.0);
		const double variance =
		    24.0 * nd * (nd - 2.0) * (nd - 3.0) / ((nd + 1.0) * (nd + 1.0) * (nd + 3.0) * (nd + 5.0));
		const double x = (b2 - expected) / std::sqrt(variance);

		const double sqrt_beta1 = 6.0 * (nd * nd - 5.0 * nd + 2.0) / ((nd + 7.0) * (nd + 9.0)) *
		                          std::sqrt(6.0 * (nd + 3.0) * (nd + 5.0) / (nd * (nd - 2.0) * (nd - 3.0)));
		const double a = 6.0 + 8.0 / sqrt_beta1 * (2.0 / sqrt_beta1 + std::sqrt(1.0 + 4.0 / (sqrt_beta1 * sqrt_beta1)));

		const double term1 = 1.0 - 2.0 / (9.0 * a);
		const double denom = 1.0 + x * std::sqrt(2.0 / (a - 4.0));
		const double term2 = std::copysign(std::cbrt((1.0 - 2.0 / a) / std::abs(denom)), denom);
		return (term1 - term2) / std::sqrt(2.0 / (9.0 * a));
	}
};

} // namespace normality
} // namespace libresidiag
