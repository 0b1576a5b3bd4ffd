#pragma once

#include "libresidiag/core/errors.hpp"
#include "libresidiag/core/time_series.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace libresidiag {
namespace core {

/// Lag binning used by the autocorrelation estimator
enum class AcfMethod {
	AUTO,      // REGULAR for equidistant series, RECTANGLE otherwise
	REGULAR,   // integer-offset sample autocorrelation (equidistant only)
	RECTANGLE, // nearest-bin-centre assignment of pair separations
	GAUSSIAN   // Gaussian kernel weights around each lag
};

/// Reference level of the runs test sign sequence
enum class RunsCutoff { MEDIAN, MEAN };

inline std::string AcfMethodName(AcfMethod method) {
	switch (method) {
	case AcfMethod::AUTO:
		return "auto";
	case AcfMethod::REGULAR:
		return "regular";
	case AcfMethod::RECTANGLE:
		return "rectangle";
	case AcfMethod::GAUSSIAN:
		return "gaussian";
	}
	return "unknown";
}

inline std::string RunsCutoffName(RunsCutoff cutoff) {
	switch (cutoff) {
	case RunsCutoff::MEDIAN:
		return "median";
	case RunsCutoff::MEAN:
		return "mean";
	}
	return "unknown";
}

/**
 * Configuration of a diagnostics run
 *
 * All options have defaults; ParseFromJson() overrides the ones present in a
 * JSON object and Validate() rejects inconsistent combinations.
 *
 * Design notes:
 * - alpha, lags and nparam feed every test; the remaining options only
 *   concern the irregular-sampling variants
 * - an empty freq lets the orchestrator use the smallest sampling interval
 *   as the Stoffer-Toloi grid step
 * - a NaN bin_width selects the method default (half the lag spacing for
 *   RECTANGLE, a quarter for GAUSSIAN); lags are spaced by freq when set,
 *   else by the median interval
 */
struct DiagnosticsOptions {
	// ========================================================================
	// Test parameters
	// ========================================================================

	/// Significance level, in (0, 1)
	/// Default: 0.05
	double alpha = 0.05;

	/// Number of lags for Ljung-Box, Stoffer-Toloi and the ACF
	/// Default: 15
	size_t lags = 15;

	/// Parameters of an already fitted noise model; reduces df to lags - nparam
	/// Default: 0
	size_t nparam = 0;

	/// Reference level of the runs test
	/// Default: median
	RunsCutoff runs_cutoff = RunsCutoff::MEDIAN;

	// ========================================================================
	// Irregular sampling
	// ========================================================================

	/// Expected regular frequency of the series ("D", "6H", "15min", ...)
	/// Default: "" (infer the grid step from the smallest sampling interval)
	std::string freq;

	/// Move off-grid observations to the nearest Stoffer-Toloi grid slot
	/// Default: false (off-grid observations are an input error)
	bool snap_to_grid = false;

	/// ACF bin width in days
	/// Default: NaN (method default)
	double bin_width = std::numeric_limits<double>::quiet_NaN();

	/// ACF lag binning
	/// Default: auto
	AcfMethod acf_method = AcfMethod::AUTO;

	/// Minimum number of pairs for an ACF bin to be defined
	/// Default: 1
	size_t min_pairs = 1;

	/// Relative tolerance for classifying the sampling as equidistant
	/// Default: 1e-6
	double regularity_tolerance = 1e-6;

	// ========================================================================
	// Execution
	// ========================================================================

	/// Evaluate the tests concurrently (results keep the fixed row order)
	/// Default: false
	bool parallel = false;

	// ========================================================================
	// Constructors
	// ========================================================================

	DiagnosticsOptions() = default;

	static DiagnosticsOptions Defaults() {
		return DiagnosticsOptions();
	}

	/// Options for residuals of a model with an nparam-parameter noise model
	static DiagnosticsOptions WithNoiseModel(size_t nparam_, size_t lags_ = 15, double alpha_ = 0.05) {
		DiagnosticsOptions opts;
		opts.nparam = nparam_;
		opts.lags = lags_;
		opts.alpha = alpha_;
		return opts;
	}

	/// Options for a series with missing observations on a known grid
	static DiagnosticsOptions WithFrequency(const std::string &freq_, bool snap = false) {
		DiagnosticsOptions opts;
		opts.freq = freq_;
		opts.snap_to_grid = snap;
		return opts;
	}

	/// Effective degrees of freedom of the portmanteau tests
	size_t DegreesOfFreedom() const {
		return lags > nparam ? lags - nparam : 0;
	}

	// ========================================================================
	// Validation
	// ========================================================================

	/**
	 * Validate option values and combinations
	 *
	 * @throws InvalidConfigurationError if validation fails
	 */
	void Validate() const {
		if (!(alpha > 0.0 && alpha < 1.0)) {
			throw InvalidConfigurationError("alpha must be in (0, 1) (got " + std::to_string(alpha) + ")");
		}

		if (lags == 0) {
			throw InvalidConfigurationError("lags must be positive");
		}

		if (nparam >= lags) {
			throw InvalidConfigurationError("degrees of freedom lags - nparam must be at least 1 (lags=" +
			                                std::to_string(lags) + ", nparam=" + std::to_string(nparam) + ")");
		}

		if (!freq.empty()) {
			ParseFrequency(freq);
		}

		if (!std::isnan(bin_width) && !(bin_width > 0.0 && std::isfinite(bin_width))) {
			throw InvalidConfigurationError("bin_width must be positive (got " + std::to_string(bin_width) + ")");
		}

		if (min_pairs == 0) {
			throw InvalidConfigurationError("min_pairs must be at least 1");
		}

		if (!(regularity_tolerance >= 0.0)) {
			throw InvalidConfigurationError("regularity_tolerance must be non-negative (got " +
			                                std::to_string(regularity_tolerance) + ")");
		}
	}

	// ========================================================================
	// JSON configuration
	// ========================================================================

	/**
	 * Parse options from a JSON object
	 *
	 * Keys are case-insensitive. Booleans also accept 0/1. A null value keeps
	 * the default. The result is validated before it is returned.
	 *
	 * @param config e.g. {"alpha": 0.01, "lags": 20, "nparam": 3, "freq": "D"}
	 * @throws InvalidConfigurationError on unknown keys, wrong types or
	 *         invalid values
	 */
	static DiagnosticsOptions ParseFromJson(const nlohmann::json &config);

	nlohmann::json ToJson() const;
};

// ============================================================================
// Implementation
// ============================================================================

namespace detail {

inline std::string ToLower(const std::string &str) {
	std::string result = str;
	for (auto &c : result) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	return result;
}

inline double ExtractDouble(const nlohmann::json &val, const std::string &key) {
	if (!val.is_number()) {
		throw InvalidConfigurationError("option '" + key + "' must be a number");
	}
	return val.get<double>();
}

inline size_t ExtractCount(const nlohmann::json &val, const std::string &key) {
	if (val.is_number_unsigned()) {
		return static_cast<size_t>(val.get<uint64_t>());
	}
	if (val.is_number_integer()) {
		auto v = val.get<int64_t>();
		if (v < 0) {
			throw InvalidConfigurationError("option '" + key + "' must be non-negative (got " + std::to_string(v) +
			                                ")");
		}
		return static_cast<size_t>(v);
	}
	throw InvalidConfigurationError("option '" + key + "' must be an integer");
}

inline bool ExtractBool(const nlohmann::json &val, const std::string &key) {
	if (val.is_boolean()) {
		return val.get<bool>();
	}
	if (val.is_number_integer()) {
		return val.get<int64_t>() != 0;
	}
	throw InvalidConfigurationError("option '" + key + "' must be a boolean");
}

inline std::string ExtractString(const nlohmann::json &val, const std::string &key) {
	if (!val.is_string()) {
		throw InvalidConfigurationError("option '" + key + "' must be a string");
	}
	return val.get<std::string>();
}

inline AcfMethod ExtractAcfMethod(const nlohmann::json &val) {
	std::string str = ToLower(ExtractString(val, "acf_method"));
	if (str == "auto") {
		return AcfMethod::AUTO;
	} else if (str == "regular") {
		return AcfMethod::REGULAR;
	} else if (str == "rectangle") {
		return AcfMethod::RECTANGLE;
	} else if (str == "gaussian") {
		return AcfMethod::GAUSSIAN;
	}
	throw InvalidConfigurationError("invalid acf_method '" + str +
	                                "'. Valid values are 'auto', 'regular', 'rectangle', 'gaussian'");
}

inline RunsCutoff ExtractRunsCutoff(const nlohmann::json &val) {
	std::string str = ToLower(ExtractString(val, "runs_cutoff"));
	if (str == "median") {
		return RunsCutoff::MEDIAN;
	} else if (str == "mean") {
		return RunsCutoff::MEAN;
	}
	throw InvalidConfigurationError("invalid runs_cutoff '" + str + "'. Valid values are 'median', 'mean'");
}

} // namespace detail

inline DiagnosticsOptions DiagnosticsOptions::ParseFromJson(const nlohmann::json &config) {
	DiagnosticsOptions opts;

	if (config.is_null()) {
		return opts;
	}
	if (!config.is_object()) {
		throw InvalidConfigurationError("diagnostics options must be a JSON object");
	}

	for (auto it = config.begin(); it != config.end(); ++it) {
		const std::string key = detail::ToLower(it.key());
		const nlohmann::json &val = it.value();
		if (val.is_null()) {
			continue;
		}

		if (key == "alpha") {
			opts.alpha = detail::ExtractDouble(val, key);
		} else if (key == "lags") {
			opts.lags = detail::ExtractCount(val, key);
		} else if (key == "nparam") {
			opts.nparam = detail::ExtractCount(val, key);
		} else if (key == "freq") {
			opts.freq = detail::ExtractString(val, key);
		} else if (key == "bin_width") {
			opts.bin_width = detail::ExtractDouble(val, key);
		} else if (key == "acf_method") {
			opts.acf_method = detail::ExtractAcfMethod(val);
		} else if (key == "min_pairs") {
			opts.min_pairs = detail::ExtractCount(val, key);
		} else if (key == "runs_cutoff") {
			opts.runs_cutoff = detail::ExtractRunsCutoff(val);
		} else if (key == "snap_to_grid") {
			opts.snap_to_grid = detail::ExtractBool(val, key);
		} else if (key == "parallel") {
			opts.parallel = detail::ExtractBool(val, key);
		} else if (key == "regularity_tolerance") {
			opts.regularity_tolerance = detail::ExtractDouble(val, key);
		} else {
			throw InvalidConfigurationError("Unknown option: '" + it.key() +
			                                "'. Valid options are: alpha, lags, nparam, freq, bin_width, "
			                                "acf_method, min_pairs, runs_cutoff, snap_to_grid, parallel, "
			                                "regularity_tolerance");
		}
	}

	opts.Validate();
	return opts;
}

inline nlohmann::json DiagnosticsOptions::ToJson() const {
	nlohmann::json j;
	j["alpha"] = alpha;
	j["lags"] = lags;
	j["nparam"] = nparam;
	j["freq"] = freq;
	if (std::isnan(bin_width)) {
		j["bin_width"] = nullptr;
	} else {
		j["bin_width"] = bin_width;
	}
	j["acf_method"] = AcfMethodName(acf_method);
	j["min_pairs"] = min_pairs;
	j["runs_cutoff"] = RunsCutoffName(runs_cutoff);
	j["snap_to_grid"] = snap_to_grid;
	j["parallel"] = parallel;
	j["regularity_tolerance"] = regularity_tolerance;
	return j;
}

} // namespace core
} // namespace libresidiag
