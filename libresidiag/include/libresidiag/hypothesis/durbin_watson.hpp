#pragma once

#include "libresidiag/core/test_result.hpp"
#include "libresidiag/core/time_series.hpp"
#include "libresidiag/utils/descriptive.hpp"
#include <Eigen/Dense>

namespace libresidiag {
namespace hypothesis {

/**
 * Durbin-Watson statistic for lag-1 autocorrelation
 *
 * d = Σ_{t=2}^{n} (e_t - e_{t-1})² / Σ_{t=1}^{n} e_t²
 *
 * d ≈ 2: no autocorrelation; d → 0: positive; d → 4: negative.
 * The residuals are used as given (not demeaned). There is no p-value: the
 * result has status STATISTIC_ONLY, a NaN p-value and never rejects.
 */
class DurbinWatson {
public:
	/**
	 * @throws core::InvalidInputError for fewer than 2 values, non-finite
	 *         values or a constant sample
	 */
	static double Statistic(const Eigen::VectorXd &residuals) {
		core::RequireFinite(residuals, "Durbin-Watson");
		const Eigen::Index n = residuals.size();
		if (n < 2) {
			throw core::InvalidInputError("Durbin-Watson needs at least 2 observations (got " + std::to_string(n) +
			                              ")");
		}
		if (utils::IsConstant(residuals)) {
			throw core::InvalidInputError("Durbin-Watson is undefined for a constant series");
		}

		const Eigen::VectorXd diff = residuals.tail(n - 1) - residuals.head(n - 1);
		return diff.squaredNorm() / residuals.squaredNorm();
	}

	static core::TestResult Test(const Eigen::VectorXd &residuals, double alpha = 0.05) {
		core::ValidateSignificanceLevel(alpha);
		return core::TestResult::StatisticOnly(core::TestKind::DURBIN_WATSON, Statistic(residuals), alpha);
	}

	/**
	 * @throws core::SamplingMismatchError if the series is not equidistant
	 */
	static core::TestResult Test(const core::TimeSeries &series, double alpha = 0.05,
	                             double regularity_tolerance = 1e-6) {
		series.Validate();
		const auto desc = core::SamplingDescriptor::FromSeries(series, regularity_tolerance);
		if (desc.is_irregular()) {
			throw core::SamplingMismatchError("Durbin-Watson requires equidistant sampling");
		}
		return Test(series.values, alpha);
	}
};

} // namespace hypothesis
} // namespace libresidiag
