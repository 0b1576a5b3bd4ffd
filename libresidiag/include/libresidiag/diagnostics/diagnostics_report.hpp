#pragma once

#include "libresidiag/acf/autocorrelation.hpp"
#include "libresidiag/core/test_result.hpp"
#include "libresidiag/core/time_series.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace libresidiag {
namespace diagnostics {

/// Run-level information attached to a DiagnosticsReport
struct ReportMetadata {
	size_t n = 0;
	size_t lags = 0;
	size_t nparam = 0;

	/// lags - nparam
	size_t df = 0;

	double alpha = 0.05;

	/// Irregular-sampling variants (Stoffer-Toloi) were used
	bool irregular = false;

	core::SamplingDescriptor sampling;

	/// Stoffer-Toloi grid step in days (NaN when not run)
	double grid_step = std::numeric_limits<double>::quiet_NaN();

	/// Residual autocorrelation, when it could be estimated
	bool has_acf = false;
	acf::AcfResult acf;

	std::vector<std::string> warnings;
};

/**
 * Outcome of a diagnostics run
 *
 * One row per TestKind in enumerator order (Shapiro-Wilk, D'Agostino, Runs
 * test, Ljung-Box, Durbin-Watson, Stoffer-Toloi), including rows for tests
 * that were not applicable or failed. Immutable once built.
 */
class DiagnosticsReport {
public:
	DiagnosticsReport(std::vector<core::TestResult> results, ReportMetadata metadata)
	    : results_(std::move(results)), metadata_(std::move(metadata)) {
	}

	const std::vector<core::TestResult> &results() const {
		return results_;
	}

	const ReportMetadata &metadata() const {
		return metadata_;
	}

	size_t size() const {
		return results_.size();
	}

	/// Row of the given test, or nullptr
	const core::TestResult *Find(core::TestKind kind) const {
		for (const auto &result : results_) {
			if (result.kind() == kind) {
				return &result;
			}
		}
		return nullptr;
	}

	size_t CountRejections() const {
		size_t count = 0;
		for (const auto &result : results_) {
			if (result.reject_null()) {
				count++;
			}
		}
		return count;
	}

	size_t CountUndefined() const {
		size_t count = 0;
		for (const auto &result : results_) {
			if (result.is_undefined()) {
				count++;
			}
		}
		return count;
	}

	/**
	 * Text table with the columns Checks, Statistic, P-value, Reject H0
	 *
	 * Missing numbers print as "-"; rows without a decision print their status
	 * in the Reject H0 column and the reason underneath the table.
	 */
	std::string ToString() const {
		std::ostringstream oss;
		oss << std::left << std::setw(16) << "" << std::setw(12) << "Checks" << std::right << std::setw(12)
		    << "Statistic" << std::setw(10) << "P-value" << "  " << std::left << "Reject H0" << "\n";

		for (const auto &result : results_) {
			oss << std::left << std::setw(16) << result.name() << std::setw(12) << core::TestKindCheck(result.kind())
			    << std::right << std::setw(12) << FormatNumber(result.statistic()) << std::setw(10)
			    << FormatNumber(result.p_value()) << "  " << std::left;
			switch (result.status()) {
			case core::ResultStatus::VALID:
				oss << (result.reject_null() ? "True" : "False");
				break;
			case core::ResultStatus::STATISTIC_ONLY:
				oss << "-";
				break;
			case core::ResultStatus::UNDEFINED:
				oss << "undefined";
				break;
			case core::ResultStatus::NOT_APPLICABLE:
				oss << "n/a";
				break;
			}
			oss << "\n";
		}

		oss << "\nn=" << metadata_.n << " lags=" << metadata_.lags << " nparam=" << metadata_.nparam
		    << " df=" << metadata_.df << " alpha=" << metadata_.alpha
		    << " sampling=" << (metadata_.irregular ? "irregular" : "equidistant") << "\n";

		for (const auto &result : results_) {
			if (!result.note().empty()) {
				oss << "  " << result.name() << ": " << result.note() << "\n";
			}
		}
		return oss.str();
	}

	/// NaN statistics and p-values serialise as null
	nlohmann::json ToJson() const {
		nlohmann::json j;
		j["n"] = metadata_.n;
		j["lags"] = metadata_.lags;
		j["nparam"] = metadata_.nparam;
		j["df"] = metadata_.df;
		j["alpha"] = metadata_.alpha;
		j["irregular"] = metadata_.irregular;
		j["grid_step"] = NumberOrNull(metadata_.grid_step);

		nlohmann::json sampling;
		sampling["equidistant"] = metadata_.sampling.equidistant;
		sampling["min_delta"] = NumberOrNull(metadata_.sampling.min_delta);
		sampling["median_delta"] = NumberOrNull(metadata_.sampling.median_delta);
		sampling["max_delta"] = NumberOrNull(metadata_.sampling.max_delta);
		j["sampling"] = sampling;

		j["warnings"] = metadata_.warnings;

		nlohmann::json rows = nlohmann::json::array();
		for (const auto &result : results_) {
			nlohmann::json row;
			row["test"] = result.name();
			row["check"] = core::TestKindCheck(result.kind());
			row["statistic"] = NumberOrNull(result.statistic());
			row["p_value"] = NumberOrNull(result.p_value());
			row["reject_null"] = result.reject_null();
			row["status"] = core::ResultStatusName(result.status());
			if (result.has_error_kind()) {
				row["error_kind"] = core::ErrorKindName(result.error_kind());
			}
			if (!result.note().empty()) {
				row["note"] = result.note();
			}
			rows.push_back(row);
		}
		j["results"] = rows;

		if (metadata_.has_acf) {
			nlohmann::json points = nlohmann::json::array();
			for (const auto &point : metadata_.acf.points) {
				points.push_back({{"lag", point.lag},
				                  {"lag_time", point.lag_time},
				                  {"value", NumberOrNull(point.value)},
				                  {"conf_bound", NumberOrNull(point.conf_bound)},
				                  {"n_pairs", point.n_pairs},
				                  {"defined", point.defined}});
			}
			j["acf"] = {{"method", core::AcfMethodName(metadata_.acf.method)}, {"points", points}};
		}
		return j;
	}

private:
	static nlohmann::json NumberOrNull(double value) {
		if (std::isnan(value)) {
			return nullptr;
		}
		return value;
	}

	static std::string FormatNumber(double value) {
		if (std::isnan(value)) {
			return "-";
		}
		std::ostringstream oss;
		oss << std::fixed << std::setprecision(4) << value;
		return oss.str();
	}

	std::vector<core::TestResult> results_;
	ReportMetadata metadata_;
};

} // namespace diagnostics
} // namespace libresidiag
