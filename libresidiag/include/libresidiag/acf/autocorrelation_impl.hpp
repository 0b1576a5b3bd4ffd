#pragma once

#include "autocorrelation.hpp"
#include "libresidiag/utils/descriptive.hpp"
#include "libresidiag/utils/distributions.hpp"
#include "libresidiag/utils/tracing.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace libresidiag {
namespace acf {

// Implementation of AcfResult accessors

inline Eigen::VectorXd AcfResult::Values() const {
	Eigen::VectorXd values(points.size());
	for (size_t k = 0; k < points.size(); k++) {
		values(k) = points[k].value;
	}
	return values;
}

inline Eigen::VectorXd AcfResult::LagTimes() const {
	Eigen::VectorXd times(points.size());
	for (size_t k = 0; k < points.size(); k++) {
		times(k) = points[k].lag_time;
	}
	return times;
}

inline Eigen::VectorXd AcfResult::ConfidenceBounds() const {
	Eigen::VectorXd bounds(points.size());
	for (size_t k = 0; k < points.size(); k++) {
		bounds(k) = points[k].conf_bound;
	}
	return bounds;
}

inline size_t AcfResult::NumDefined() const {
	size_t count = 0;
	for (const auto &point : points) {
		if (point.defined) {
			count++;
		}
	}
	return count;
}

inline size_t AcfResult::NumSignificant() const {
	size_t count = 0;
	for (size_t k = 1; k < points.size(); k++) {
		if (points[k].defined && std::abs(points[k].value) > points[k].conf_bound) {
			count++;
		}
	}
	return count;
}

// Implementation of Autocorrelation methods

namespace detail {

/// Gaussian weights beyond this many standard deviations are dropped
constexpr double kKernelCutoff = 5.0;

inline void CheckUsable(const core::TimeSeries &series, const char *name) {
	series.Validate();
	if (series.size() < 2) {
		throw core::InvalidInputError(std::string(name) + " needs at least 2 observations (got " +
		                              std::to_string(series.size()) + ")");
	}
	if (utils::IsConstant(series.values)) {
		throw core::InvalidInputError(std::string(name) + " is undefined for a constant series (zero variance)");
	}
}

/// True when both series sit on one equidistant grid
inline bool ShareGrid(const core::TimeSeries &x, const core::SamplingDescriptor &dx, const core::TimeSeries &y,
                      const core::SamplingDescriptor &dy) {
	if (!dx.equidistant || !dy.equidistant || x.size() != y.size()) {
		return false;
	}
	const double allowed = dx.tolerance * std::abs(dx.Step());
	for (Eigen::Index i = 0; i < x.timestamps.size(); i++) {
		if (std::abs(x.timestamps(i) - y.timestamps(i)) > allowed) {
			return false;
		}
	}
	return true;
}

} // namespace detail

inline core::AcfMethod Autocorrelation::ResolveMethod(core::AcfMethod requested, bool equidistant) {
	if (requested == core::AcfMethod::AUTO) {
		return equidistant ? core::AcfMethod::REGULAR : core::AcfMethod::RECTANGLE;
	}
	if (requested == core::AcfMethod::REGULAR && !equidistant) {
		throw core::SamplingMismatchError(
		    "regular autocorrelation requires equidistant sampling; use the rectangle or gaussian method");
	}
	return requested;
}

inline double Autocorrelation::DefaultBinWidth(core::AcfMethod method, double spacing) {
	if (method == core::AcfMethod::GAUSSIAN) {
		return 0.25 * spacing;
	}
	return 0.5 * spacing;
}

inline std::pair<double, double> Autocorrelation::ResolveBinning(const AcfOptions &options, core::AcfMethod method,
                                                                 const core::SamplingDescriptor &sampling) {
	double spacing = options.lag_spacing;
	if (std::isnan(spacing)) {
		spacing = sampling.median_delta;
	} else if (!(spacing > 0.0 && std::isfinite(spacing))) {
		throw core::InvalidConfigurationError("lag spacing must be positive (got " + std::to_string(spacing) + ")");
	}

	double width = options.bin_width;
	if (std::isnan(width)) {
		width = DefaultBinWidth(method, spacing);
	} else if (!(width > 0.0 && std::isfinite(width))) {
		throw core::InvalidConfigurationError("bin width must be positive (got " + std::to_string(width) + ")");
	}
	return std::make_pair(spacing, width);
}

inline size_t Autocorrelation::NumBins(const LagSpecification &lags, double spacing) {
	if (!lags.has_span()) {
		return lags.n_lags;
	}
	// Relative slack so that a span of exactly k spacings yields k bins
	const size_t bins = static_cast<size_t>(std::floor(lags.max_lag_time / spacing + 1e-9));
	if (bins == 0) {
		throw core::InvalidConfigurationError("maximum lag time " + std::to_string(lags.max_lag_time) +
		                                      " is shorter than one lag spacing (" + std::to_string(spacing) + ")");
	}
	return bins;
}

inline Eigen::VectorXd Autocorrelation::Standardize(const Eigen::VectorXd &x) {
	const double mean = x.mean();
	const double sd = std::sqrt(utils::PopulationVariance(x));
	return ((x.array() - mean) / sd).matrix();
}

inline void Autocorrelation::FinalizePoint(AcfPoint &point, double sum, double weight, size_t min_pairs,
                                           double z) {
	point.n_pairs = weight;
	point.defined = weight > 0.0 && weight >= static_cast<double>(min_pairs);
	if (point.defined) {
		point.value = sum / weight;
		point.conf_bound = z / std::sqrt(weight);
	}
}

inline Eigen::VectorXd Autocorrelation::SampleAutocorrelation(const Eigen::VectorXd &x, size_t max_lag) {
	core::RequireFinite(x, "autocorrelation");
	const Eigen::Index n = x.size();
	if (n < 2) {
		throw core::InvalidInputError("autocorrelation needs at least 2 observations (got " + std::to_string(n) +
		                              ")");
	}
	if (utils::IsConstant(x)) {
		throw core::InvalidInputError("autocorrelation is undefined for a constant series (zero variance)");
	}

	Eigen::VectorXd centered = (x.array() - x.mean()).matrix();
	const double denom = centered.squaredNorm();

	Eigen::VectorXd r = Eigen::VectorXd::Constant(max_lag + 1, std::numeric_limits<double>::quiet_NaN());
	r(0) = 1.0;
	for (size_t k = 1; k <= max_lag; k++) {
		const Eigen::Index lag = static_cast<Eigen::Index>(k);
		if (lag >= n) {
			break;
		}
		// Σ_{t=k}^{n-1} e_t e_{t-k}
		const double sum = centered.tail(n - lag).dot(centered.head(n - lag));
		r(k) = sum / denom;
	}
	return r;
}

inline AcfResult Autocorrelation::ComputeRegular(const Eigen::VectorXd &x, const Eigen::VectorXd &y, double step,
                                                 const LagSpecification &lags, size_t min_pairs,
                                                 bool auto_correlation) {
	const size_t n = static_cast<size_t>(x.size());
	const size_t n_lags = NumBins(lags, step);
	const double z = utils::normal_quantile(1.0 - lags.alpha / 2.0);

	AcfResult result;
	result.method = core::AcfMethod::REGULAR;
	result.lag_spacing = step;
	result.n_obs = n;
	result.points.resize(n_lags + 1);

	Eigen::VectorXd r;
	if (auto_correlation) {
		r = SampleAutocorrelation(x, n_lags);
	} else {
		Eigen::VectorXd xc = (x.array() - x.mean()).matrix();
		Eigen::VectorXd yc = (y.array() - y.mean()).matrix();
		const double denom = std::sqrt(xc.squaredNorm() * yc.squaredNorm());
		r = Eigen::VectorXd::Constant(n_lags + 1, std::numeric_limits<double>::quiet_NaN());
		for (size_t k = 0; k <= n_lags && k < n; k++) {
			const Eigen::Index len = static_cast<Eigen::Index>(n - k);
			// Σ_{t=0}^{n-1-k} x_t y_{t+k}
			r(k) = xc.head(len).dot(yc.tail(len)) / denom;
		}
	}

	for (size_t k = 0; k <= n_lags; k++) {
		AcfPoint &point = result.points[k];
		point.lag = k;
		point.lag_time = static_cast<double>(k) * step;
		const size_t pairs = k < n ? n - k : 0;
		point.n_pairs = static_cast<double>(pairs);
		point.defined = pairs > 0 && (k == 0 || pairs >= min_pairs);
		if (point.defined) {
			point.value = r(k);
			point.conf_bound = z / std::sqrt(static_cast<double>(pairs));
		}
	}

	return result;
}

inline AcfResult Autocorrelation::ComputeBinned(const core::TimeSeries &x, const core::TimeSeries &y,
                                                core::AcfMethod method, double spacing, double width,
                                                const LagSpecification &lags, size_t min_pairs,
                                                bool auto_correlation) {
	const bool gaussian = method == core::AcfMethod::GAUSSIAN;
	const size_t n_bins = NumBins(lags, spacing);
	const double z = utils::normal_quantile(1.0 - lags.alpha / 2.0);

	const Eigen::VectorXd zx = Standardize(x.values);
	const Eigen::VectorXd zy = auto_correlation ? zx : Standardize(y.values);

	const size_t first_bin = auto_correlation ? 1 : 0;
	const double reach = gaussian ? detail::kKernelCutoff * width : 0.5 * spacing;
	const double half_window = 0.5 * width;
	const double max_sep = static_cast<double>(n_bins) * spacing + reach;
	const double min_sep = auto_correlation ? 0.0 : -reach;
	const double two_var = 2.0 * width * width;

	std::vector<double> sums(n_bins + 1, 0.0);
	std::vector<double> weights(n_bins + 1, 0.0);

	const Eigen::Index nx = x.timestamps.size();
	const Eigen::Index ny = y.timestamps.size();
	const double *ty_begin = y.timestamps.data();
	const double *ty_end = ty_begin + ny;

	for (Eigen::Index i = 0; i < nx; i++) {
		const double ti = x.timestamps(i);
		Eigen::Index j;
		if (auto_correlation) {
			j = i + 1;
		} else {
			j = static_cast<Eigen::Index>(std::lower_bound(ty_begin, ty_end, ti + min_sep) - ty_begin);
		}

		for (; j < ny; j++) {
			const double d = y.timestamps(j) - ti;
			if (d > max_sep) {
				break;
			}
			const double prod = zx(i) * zy(j);

			if (gaussian) {
				for (size_t m = first_bin; m <= n_bins; m++) {
					if (m > 0 && d <= 0.0) {
						continue;
					}
					const double dev = d - static_cast<double>(m) * spacing;
					if (std::abs(dev) > detail::kKernelCutoff * width) {
						continue;
					}
					const double w = std::exp(-dev * dev / two_var);
					sums[m] += w * prod;
					weights[m] += w;
				}
			} else {
				const size_t m = static_cast<size_t>(std::floor(std::abs(d) / spacing + 0.5));
				if (m < first_bin || m > n_bins) {
					continue;
				}
				// negative separations only feed the pooled lag 0
				if (m > 0 && d < 0.0) {
					continue;
				}
				if (std::abs(std::abs(d) - static_cast<double>(m) * spacing) > half_window) {
					continue;
				}
				sums[m] += prod;
				weights[m] += 1.0;
			}
		}
	}

	AcfResult result;
	result.method = method;
	result.lag_spacing = spacing;
	result.bin_width = width;
	result.n_obs = x.size();
	result.points.resize(n_bins + 1);

	for (size_t m = 0; m <= n_bins; m++) {
		AcfPoint &point = result.points[m];
		point.lag = m;
		point.lag_time = static_cast<double>(m) * spacing;
		if (m == 0 && auto_correlation) {
			point.value = 1.0;
			point.n_pairs = static_cast<double>(x.size());
			point.conf_bound = z / std::sqrt(point.n_pairs);
			point.defined = true;
			continue;
		}
		FinalizePoint(point, sums[m], weights[m], min_pairs, z);
	}

	return result;
}

inline AcfResult Autocorrelation::Compute(const core::TimeSeries &series, const LagSpecification &lags,
                                          const AcfOptions &options) {
	lags.Validate();
	if (options.min_pairs == 0) {
		throw core::InvalidConfigurationError("min_pairs must be at least 1");
	}
	detail::CheckUsable(series, "autocorrelation");

	const auto desc = core::SamplingDescriptor::FromSeries(series, options.regularity_tolerance);
	const core::AcfMethod method = ResolveMethod(options.method, desc.equidistant);

	if (method == core::AcfMethod::REGULAR) {
		RESIDIAG_DEBUG("ACF (regular) n=" << series.size() << " step=" << desc.Step());
		return ComputeRegular(series.values, series.values, desc.Step(), lags, options.min_pairs, true);
	}

	const auto binning = ResolveBinning(options, method, desc);

	RESIDIAG_DEBUG("ACF (" << core::AcfMethodName(method) << ") n=" << series.size() << " spacing="
	                       << binning.first << " width=" << binning.second << " median_delta=" << desc.median_delta);
	return ComputeBinned(series, series, method, binning.first, binning.second, lags, options.min_pairs, true);
}

inline AcfResult Autocorrelation::CrossCorrelation(const core::TimeSeries &x, const core::TimeSeries &y,
                                                   const LagSpecification &lags, const AcfOptions &options) {
	lags.Validate();
	if (options.min_pairs == 0) {
		throw core::InvalidConfigurationError("min_pairs must be at least 1");
	}
	detail::CheckUsable(x, "cross-correlation (x)");
	detail::CheckUsable(y, "cross-correlation (y)");

	const auto dx = core::SamplingDescriptor::FromSeries(x, options.regularity_tolerance);
	const auto dy = core::SamplingDescriptor::FromSeries(y, options.regularity_tolerance);
	const bool shared = detail::ShareGrid(x, dx, y, dy);

	core::AcfMethod method;
	try {
		method = ResolveMethod(options.method, shared);
	} catch (const core::SamplingMismatchError &) {
		throw core::SamplingMismatchError(
		    "regular cross-correlation requires both series on one equidistant grid");
	}

	if (method == core::AcfMethod::REGULAR) {
		return ComputeRegular(x.values, y.values, dx.Step(), lags, options.min_pairs, false);
	}

	// Lag grid follows the sampling of x
	const auto binning = ResolveBinning(options, method, dx);

	RESIDIAG_DEBUG("CCF (" << core::AcfMethodName(method) << ") nx=" << x.size() << " ny=" << y.size()
	                       << " spacing=" << binning.first << " width=" << binning.second);
	return ComputeBinned(x, y, method, binning.first, binning.second, lags, options.min_pairs, false);
}

} // namespace acf
} // namespace libresidiag
