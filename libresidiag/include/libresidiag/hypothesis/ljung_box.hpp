#pragma once

#include "libresidiag/acf/autocorrelation_impl.hpp"
#include "libresidiag/core/test_result.hpp"
#include "libresidiag/core/time_series.hpp"
#include "libresidiag/utils/distributions.hpp"
#include "libresidiag/utils/tracing.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <string>

namespace libresidiag {
namespace hypothesis {

/**
 * Full Ljung-Box output
 *
 * cumulative_q(j - 1) / cumulative_p(j - 1) are the statistic and p-value
 * using lags 1..j; p-values with j - nparam < 1 are NaN.
 */
struct LjungBoxDetail {
	double q = 0.0;
	double p_value = 1.0;
	size_t n = 0;
	size_t lags = 0;
	size_t df = 0;

	/// r_1..r_lags
	Eigen::VectorXd acf;

	Eigen::VectorXd cumulative_q;
	Eigen::VectorXd cumulative_p;

	/// Non-empty when n is small relative to lags
	std::string warning;
};

/**
 * Ljung-Box portmanteau test for serial correlation
 *
 * Q = n(n+2) Σ_{j=1}^{k} r_j² / (n - j),  Q ~ χ²(k - nparam) under H0
 *
 * Equidistant series only. The chi-squared approximation is poor when n is
 * small relative to k (n < 5k); such results carry a warning note.
 */
class LjungBox {
public:
	/// Below this many observations per lag the result carries a warning
	static constexpr size_t kMinObservationsPerLag = 5;

	/**
	 * Run the test on the values of an equidistant sample
	 *
	 * @param values Residuals in time order
	 * @param lags Number of autocorrelation lags k
	 * @param nparam Parameters of a fitted noise model (df = k - nparam)
	 * @param alpha Significance level
	 * @throws core::InvalidConfigurationError for alpha outside (0, 1), k = 0
	 *         or k - nparam < 1
	 * @throws core::InvalidInputError for n <= k, non-finite values or a constant sample
	 */
	static core::TestResult Test(const Eigen::VectorXd &values, size_t lags, size_t nparam = 0,
	                             double alpha = 0.05) {
		core::ValidateSignificanceLevel(alpha);
		auto detail = Compute(values, lags, nparam);
		return core::TestResult::Valid(core::TestKind::LJUNG_BOX, detail.q, detail.p_value, alpha, detail.warning);
	}

	/**
	 * Run the test on a time series
	 *
	 * @throws core::SamplingMismatchError if the series is not equidistant
	 */
	static core::TestResult Test(const core::TimeSeries &series, size_t lags, size_t nparam = 0,
	                             double alpha = 0.05, double regularity_tolerance = 1e-6) {
		series.Validate();
		RequireEquidistant(series, regularity_tolerance);
		return Test(series.values, lags, nparam, alpha);
	}

	static LjungBoxDetail Compute(const Eigen::VectorXd &values, size_t lags, size_t nparam = 0) {
		if (lags == 0) {
			throw core::InvalidConfigurationError("Ljung-Box needs at least one lag");
		}
		if (nparam >= lags) {
			throw core::InvalidConfigurationError("Ljung-Box degrees of freedom lags - nparam must be at least 1 (lags=" +
			                                      std::to_string(lags) + ", nparam=" + std::to_string(nparam) + ")");
		}

		core::RequireFinite(values, "Ljung-Box");
		const size_t n = static_cast<size_t>(values.size());
		if (n <= lags) {
			throw core::InvalidInputError("Ljung-Box needs more observations than lags (n=" + std::to_string(n) +
			                              ", lags=" + std::to_string(lags) + ")");
		}

		Eigen::VectorXd r = acf::Autocorrelation::SampleAutocorrelation(values, lags);

		LjungBoxDetail detail;
		detail.n = n;
		detail.lags = lags;
		detail.df = lags - nparam;
		detail.acf = r.tail(lags);
		detail.cumulative_q.resize(lags);
		detail.cumulative_p.resize(lags);

		const double nd = static_cast<double>(n);
		double sum = 0.0;
		for (size_t j = 1; j <= lags; j++) {
			sum += r(j) * r(j) / (nd - static_cast<double>(j));
			const double q = nd * (nd + 2.0) * sum;
			detail.cumulative_q(j - 1) = q;
			detail.cumulative_p(j - 1) = j > nparam ? utils::chi_squared_sf(q, static_cast<double>(j - nparam))
			                                        : std::numeric_limits<double>::quiet_NaN();
		}

		detail.q = detail.cumulative_q(lags - 1);
		detail.p_value = detail.cumulative_p(lags - 1);

		if (n < kMinObservationsPerLag * lags) {
			detail.warning = "small sample: n=" + std::to_string(n) + " for " + std::to_string(lags) +
			                 " lags, chi-squared approximation may be unreliable";
			RESIDIAG_WARN("Ljung-Box " << detail.warning);
		}

		return detail;
	}

private:
	static void RequireEquidistant(const core::TimeSeries &series, double regularity_tolerance) {
		const auto desc = core::SamplingDescriptor::FromSeries(series, regularity_tolerance);
		if (desc.is_irregular()) {
			throw core::SamplingMismatchError("Ljung-Box requires equidistant sampling (deltas range from " +
			                                  std::to_string(desc.min_delta) + " to " +
			                                  std::to_string(desc.max_delta) + " days); use Stoffer-Toloi");
		}
	}
};

} // namespace hypothesis
} // namespace libresidiag
