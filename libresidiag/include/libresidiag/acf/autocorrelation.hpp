#pragma once

#include "libresidiag/core/diagnostics_options.hpp"
#include "libresidiag/core/time_series.hpp"
#include <Eigen/Dense>
#include <limits>
#include <utility>
#include <vector>

namespace libresidiag {
namespace acf {

/**
 * Extent of an autocorrelation estimate
 *
 * Either an integer number of lags (bins for the binned methods) or a maximum
 * lag time in days. A finite max_lag_time takes precedence over n_lags.
 */
struct LagSpecification {
	size_t n_lags = 15;

	/// Maximum lag time in days (NaN: use n_lags)
	double max_lag_time = std::numeric_limits<double>::quiet_NaN();

	/// Significance level of the confidence bounds
	double alpha = 0.05;

	static LagSpecification Count(size_t k, double alpha_ = 0.05) {
		LagSpecification spec;
		spec.n_lags = k;
		spec.alpha = alpha_;
		return spec;
	}

	static LagSpecification Span(double days, double alpha_ = 0.05) {
		LagSpecification spec;
		spec.max_lag_time = days;
		spec.alpha = alpha_;
		return spec;
	}

	bool has_span() const {
		return std::isfinite(max_lag_time);
	}

	/**
	 * @throws core::InvalidConfigurationError for alpha outside (0, 1), zero
	 *         lags or a non-positive span
	 */
	void Validate() const {
		if (!(alpha > 0.0 && alpha < 1.0)) {
			throw core::InvalidConfigurationError("alpha must be in (0, 1) (got " + std::to_string(alpha) + ")");
		}
		if (!std::isnan(max_lag_time)) {
			if (!(max_lag_time > 0.0 && std::isfinite(max_lag_time))) {
				throw core::InvalidConfigurationError("maximum lag time must be positive (got " +
				                                      std::to_string(max_lag_time) + ")");
			}
		} else if (n_lags == 0) {
			throw core::InvalidConfigurationError("number of lags must be positive");
		}
	}
};

/// Estimator settings (method, lag grid, bin width, minimum bin population)
struct AcfOptions {
	core::AcfMethod method = core::AcfMethod::AUTO;

	/// Distance between binned lag centres in days (default the median interval)
	double lag_spacing = std::numeric_limits<double>::quiet_NaN();

	/// Rectangle: acceptance window around each centre in days (default half the lag spacing).
	/// Gaussian: kernel standard deviation in days (default a quarter of the lag spacing).
	double bin_width = std::numeric_limits<double>::quiet_NaN();

	/// Bins with fewer pairs (kernel weight for GAUSSIAN) are undefined
	size_t min_pairs = 1;

	double regularity_tolerance = 1e-6;

	static AcfOptions FromDiagnostics(const core::DiagnosticsOptions &opts) {
		AcfOptions acf_opts;
		acf_opts.method = opts.acf_method;
		if (!opts.freq.empty()) {
			acf_opts.lag_spacing = core::ParseFrequency(opts.freq);
		}
		acf_opts.bin_width = opts.bin_width;
		acf_opts.min_pairs = opts.min_pairs;
		acf_opts.regularity_tolerance = opts.regularity_tolerance;
		return acf_opts;
	}
};

/// One lag of an autocorrelation estimate
struct AcfPoint {
	size_t lag = 0;

	/// Lag (bin centre) in days
	double lag_time = 0.0;

	/// NaN when !defined
	double value = std::numeric_limits<double>::quiet_NaN();

	/// Half-width of the (1 - alpha) band around zero: z(1 - alpha/2) / sqrt(n_pairs)
	double conf_bound = std::numeric_limits<double>::quiet_NaN();

	/// Pairs contributing to the lag (sum of kernel weights for GAUSSIAN)
	double n_pairs = 0.0;

	bool defined = false;
};

/**
 * Autocorrelation (or cross-correlation) estimate
 *
 * points[0] is lag 0; points[k] is lag k (bin k) for k >= 1.
 */
struct AcfResult {
	std::vector<AcfPoint> points;

	/// Method actually used (AUTO is resolved)
	core::AcfMethod method = core::AcfMethod::REGULAR;

	/// Lag spacing in days (the sampling step for REGULAR)
	double lag_spacing = std::numeric_limits<double>::quiet_NaN();

	/// Acceptance window (RECTANGLE) or kernel standard deviation (GAUSSIAN); NaN for REGULAR
	double bin_width = std::numeric_limits<double>::quiet_NaN();

	size_t n_obs = 0;

	size_t size() const {
		return points.size();
	}

	const AcfPoint &operator[](size_t lag) const {
		return points[lag];
	}

	Eigen::VectorXd Values() const;

	Eigen::VectorXd LagTimes() const;

	Eigen::VectorXd ConfidenceBounds() const;

	size_t NumDefined() const;

	/// Defined lags >= 1 whose |value| exceeds the confidence bound
	size_t NumSignificant() const;
};

/**
 * Autocorrelation estimator for equidistant and irregularly sampled series
 *
 * Methods:
 * - REGULAR: r_k = Σ_{t=k}^{n-1}(x_t - x̄)(x_{t-k} - x̄) / Σ(x_t - x̄)²,
 *   n - k contributing pairs. Equidistant input only.
 * Binned lags sit on the grid τ_m = m·Δ (m = 1..M), Δ the lag spacing, so
 * lag k of an irregular series covers the same time as lag k of an
 * equidistant one with step Δ.
 * - RECTANGLE: every pair (i < j) goes to the centre closest to
 *   d = t_j - t_i, provided |d - τ_m| <= w/2; the bin value is the mean
 *   product of the standardised series. Pairs outside every window, nearest
 *   to centre 0 or beyond bin M are ignored.
 * - GAUSSIAN: every pair weighted by exp(-(d - τ_m)² / 2σ²) up to 5σ; the
 *   value is the weighted mean product and n_pairs the weight sum.
 *
 * Lag 0 is exactly 1.0. Bins below min_pairs are undefined (NaN), never 0.
 */
class Autocorrelation {
public:
	/**
	 * Estimate the autocorrelation function of a series
	 *
	 * @param series Input series (validated)
	 * @param lags Number of lags or maximum lag time, and alpha
	 * @param options Method, bin width, minimum bin population
	 * @return Points for lags 0..M
	 * @throws core::InvalidInputError for fewer than 2 observations or a
	 *         constant series
	 * @throws core::SamplingMismatchError when REGULAR is requested for an
	 *         irregular series
	 * @throws core::InvalidConfigurationError for invalid lags, lag spacing
	 *         or bin width
	 */
	static AcfResult Compute(const core::TimeSeries &series, const LagSpecification &lags,
	                         const AcfOptions &options = AcfOptions());

	/**
	 * Estimate the cross-correlation between x and y_{t+lag}
	 *
	 * Same methods and binning as Compute(); Compute(x) is the special case
	 * y = x with lag 0 pinned to 1. For REGULAR both series must share their
	 * timestamps. Lag 0 of a binned estimate pools pairs within half a
	 * window of each other; the default lag spacing follows x.
	 *
	 * @throws core::SamplingMismatchError when REGULAR is requested and the
	 *         series do not share one equidistant grid
	 */
	static AcfResult CrossCorrelation(const core::TimeSeries &x, const core::TimeSeries &y,
	                                  const LagSpecification &lags, const AcfOptions &options = AcfOptions());

	/**
	 * Sample autocorrelations r_0..r_max_lag of an equidistant sample
	 *
	 * Entries with lag >= n are NaN.
	 *
	 * @throws core::InvalidInputError for a constant sample
	 */
	static Eigen::VectorXd SampleAutocorrelation(const Eigen::VectorXd &x, size_t max_lag);

private:
	/// Resolve AUTO against the sampling of the inputs
	static core::AcfMethod ResolveMethod(core::AcfMethod requested, bool equidistant);

	static double DefaultBinWidth(core::AcfMethod method, double spacing);

	/// Lag spacing and window of a binned estimate, defaults filled from the sampling of x
	static std::pair<double, double> ResolveBinning(const AcfOptions &options, core::AcfMethod method,
	                                                const core::SamplingDescriptor &sampling);

	static size_t NumBins(const LagSpecification &lags, double spacing);

	static Eigen::VectorXd Standardize(const Eigen::VectorXd &x);

	static AcfResult ComputeRegular(const Eigen::VectorXd &x, const Eigen::VectorXd &y, double step,
	                                const LagSpecification &lags, size_t min_pairs, bool auto_correlation);

	static AcfResult ComputeBinned(const core::TimeSeries &x, const core::TimeSeries &y, core::AcfMethod method,
	                               double spacing, double width, const LagSpecification &lags,
	                               size_t min_pairs, bool auto_correlation);

	static void FinalizePoint(AcfPoint &point, double sum, double weight, size_t min_pairs, double z);
};

} // namespace acf
} // namespace libresidiag
