#pragma once

#include "libresidiag/core/errors.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace libresidiag {
namespace core {

/**
 * Reject samples containing NaN or infinite values
 *
 * @param what Name of the computation, used in the message
 * @throws InvalidInputError at the first non-finite entry
 */
inline void RequireFinite(const Eigen::VectorXd &values, const std::string &what) {
	for (Eigen::Index i = 0; i < values.size(); i++) {
		if (!std::isfinite(values(i))) {
			throw InvalidInputError(what + ": non-finite value at position " + std::to_string(i));
		}
	}
}

/**
 * Residual or noise series: ordered (timestamp, value) pairs
 *
 * Timestamps are expressed in days (a daily series has step 1.0, an hourly
 * one 1/24). The caller owns the series; every routine in libresidiag only
 * reads it.
 *
 * Invariants (checked by Validate()):
 * - timestamps.size() == values.size()
 * - timestamps strictly increasing and finite
 * - values finite
 */
struct TimeSeries {
	/// Observation times in days (length n)
	Eigen::VectorXd timestamps;

	/// Observed residuals (length n)
	Eigen::VectorXd values;

	TimeSeries() = default;

	TimeSeries(Eigen::VectorXd timestamps_, Eigen::VectorXd values_)
	    : timestamps(std::move(timestamps_)), values(std::move(values_)) {
	}

	/// Series sampled every `step` days starting at `start`
	static TimeSeries Equidistant(const Eigen::VectorXd &values_, double step = 1.0, double start = 0.0) {
		Eigen::VectorXd t(values_.size());
		for (Eigen::Index i = 0; i < values_.size(); i++) {
			t(i) = start + step * static_cast<double>(i);
		}
		return TimeSeries(std::move(t), values_);
	}

	static TimeSeries FromVectors(const std::vector<double> &timestamps_, const std::vector<double> &values_) {
		Eigen::VectorXd t = Eigen::Map<const Eigen::VectorXd>(timestamps_.data(),
		                                                      static_cast<Eigen::Index>(timestamps_.size()));
		Eigen::VectorXd v =
		    Eigen::Map<const Eigen::VectorXd>(values_.data(), static_cast<Eigen::Index>(values_.size()));
		return TimeSeries(std::move(t), std::move(v));
	}

	size_t size() const {
		return static_cast<size_t>(values.size());
	}

	bool empty() const {
		return values.size() == 0;
	}

	/**
	 * Check the structural invariants
	 *
	 * @throws InvalidInputError on length mismatch, non-finite entries or
	 *         non-increasing timestamps
	 */
	void Validate() const {
		if (timestamps.size() != values.size()) {
			throw InvalidInputError("timestamps and values must have the same length (got " +
			                        std::to_string(timestamps.size()) + " and " + std::to_string(values.size()) +
			                        ")");
		}
		for (Eigen::Index i = 0; i < values.size(); i++) {
			if (!std::isfinite(values(i))) {
				throw InvalidInputError("non-finite value at position " + std::to_string(i));
			}
			if (!std::isfinite(timestamps(i))) {
				throw InvalidInputError("non-finite timestamp at position " + std::to_string(i));
			}
			if (i > 0 && timestamps(i) <= timestamps(i - 1)) {
				throw InvalidInputError("timestamps must be strictly increasing (position " + std::to_string(i) +
				                        ")");
			}
		}
	}
};

/**
 * Sampling regularity of a TimeSeries
 *
 * A series is equidistant iff every inter-observation delta equals the first
 * one within `tolerance` relative to that first delta. Series with fewer than
 * two observations are trivially equidistant.
 */
struct SamplingDescriptor {
	/// Inter-observation deltas in days (length n - 1)
	Eigen::VectorXd deltas;

	double min_delta = std::numeric_limits<double>::quiet_NaN();
	double median_delta = std::numeric_limits<double>::quiet_NaN();
	double max_delta = std::numeric_limits<double>::quiet_NaN();

	size_t n_obs = 0;

	bool equidistant = true;

	/// Relative tolerance used for the classification
	double tolerance = 1e-6;

	bool is_irregular() const {
		return !equidistant;
	}

	/// Sampling step of an equidistant series (NaN when irregular)
	double Step() const {
		if (!equidistant || deltas.size() == 0) {
			return std::numeric_limits<double>::quiet_NaN();
		}
		return deltas(0);
	}

	static SamplingDescriptor FromSeries(const TimeSeries &series, double tolerance = 1e-6) {
		if (!(tolerance >= 0.0)) {
			throw InvalidConfigurationError("regularity tolerance must be non-negative (got " +
			                                std::to_string(tolerance) + ")");
		}

		SamplingDescriptor desc;
		desc.n_obs = series.size();
		desc.tolerance = tolerance;

		const Eigen::Index n = series.timestamps.size();
		if (n < 2) {
			return desc;
		}

		desc.deltas.resize(n - 1);
		for (Eigen::Index i = 1; i < n; i++) {
			desc.deltas(i - 1) = series.timestamps(i) - series.timestamps(i - 1);
		}

		desc.min_delta = desc.deltas.minCoeff();
		desc.max_delta = desc.deltas.maxCoeff();

		std::vector<double> sorted(desc.deltas.data(), desc.deltas.data() + desc.deltas.size());
		std::sort(sorted.begin(), sorted.end());
		const size_t m = sorted.size();
		desc.median_delta = (m % 2 == 1) ? sorted[m / 2] : 0.5 * (sorted[m / 2 - 1] + sorted[m / 2]);

		const double first = desc.deltas(0);
		const double allowed = tolerance * std::abs(first);
		desc.equidistant = true;
		for (Eigen::Index i = 1; i < desc.deltas.size(); i++) {
			if (std::abs(desc.deltas(i) - first) > allowed) {
				desc.equidistant = false;
				break;
			}
		}
		return desc;
	}
};

/**
 * Convert a frequency string to a step in days
 *
 * Accepted: optional positive integer multiplier followed by a unit
 * "S"/"s" (second), "min"/"T" (minute), "H"/"h" (hour), "D"/"d" (day),
 * "W"/"w" (week). Examples: "D", "6H", "15min", "2W".
 *
 * @throws InvalidConfigurationError for an empty, zero or unknown frequency
 */
inline double ParseFrequency(const std::string &freq) {
	size_t pos = 0;
	while (pos < freq.size() && std::isspace(static_cast<unsigned char>(freq[pos]))) {
		pos++;
	}

	uint64_t multiplier = 1;
	size_t digits_start = pos;
	while (pos < freq.size() && std::isdigit(static_cast<unsigned char>(freq[pos]))) {
		pos++;
	}
	if (pos > digits_start) {
		try {
			multiplier = std::stoull(freq.substr(digits_start, pos - digits_start));
		} catch (const std::out_of_range &) {
			throw InvalidConfigurationError("frequency multiplier out of range (got '" + freq + "')");
		}
		if (multiplier == 0) {
			throw InvalidConfigurationError("frequency multiplier must be positive (got '" + freq + "')");
		}
	}

	std::string unit = freq.substr(pos);
	while (!unit.empty() && std::isspace(static_cast<unsigned char>(unit.back()))) {
		unit.pop_back();
	}

	double unit_days;
	if (unit == "D" || unit == "d") {
		unit_days = 1.0;
	} else if (unit == "H" || unit == "h") {
		unit_days = 1.0 / 24.0;
	} else if (unit == "min" || unit == "T") {
		unit_days = 1.0 / 1440.0;
	} else if (unit == "S" || unit == "s") {
		unit_days = 1.0 / 86400.0;
	} else if (unit == "W" || unit == "w") {
		unit_days = 7.0;
	} else {
		throw InvalidConfigurationError("unknown frequency '" + freq +
		                                "' (expected [n]S, [n]min, [n]T, [n]H, [n]D or [n]W)");
	}
	return static_cast<double>(multiplier) * unit_days;
}

} // namespace core
} // namespace libresidiag
