#pragma once

#include "libresidiag/core/diagnostics_options.hpp"
#include "libresidiag/core/test_result.hpp"
#include "libresidiag/core/time_series.hpp"
#include "libresidiag/diagnostics/diagnostics_report.hpp"
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace libresidiag {
namespace diagnostics {

enum class DiagnosticsState { IDLE, CLASSIFIED, DISPATCHED, REPORTED };

inline std::string DiagnosticsStateName(DiagnosticsState state) {
	switch (state) {
	case DiagnosticsState::IDLE:
		return "idle";
	case DiagnosticsState::CLASSIFIED:
		return "classified";
	case DiagnosticsState::DISPATCHED:
		return "dispatched";
	case DiagnosticsState::REPORTED:
		return "reported";
	}
	return "unknown";
}

/// One row of the dispatch plan
struct PlannedTest {
	core::TestKind kind;

	/// False: the row is filled without running the test
	bool run = true;

	/// Status and reason for rows that are not run
	core::ResultStatus status = core::ResultStatus::VALID;
	core::ErrorKind error_kind = core::ErrorKind::SAMPLING_MISMATCH;
	std::string reason;
};

/**
 * ResidualDiagnostics: runs the applicable residual checks on one series
 *
 * State machine IDLE → CLASSIFIED → DISPATCHED → REPORTED:
 * - Classify(): validates the series and computes its SamplingDescriptor
 * - Dispatch(): fixes the plan, one row per TestKind
 *     equidistant: Shapiro-Wilk, D'Agostino, Runs, Ljung-Box, Durbin-Watson
 *                  (Stoffer-Toloi not applicable)
 *     irregular:   Shapiro-Wilk, D'Agostino, Runs, Stoffer-Toloi
 *                  (Ljung-Box and Durbin-Watson not applicable)
 * - Report(): evaluates the plan (concurrently if options.parallel) and
 *   builds the report; terminal
 * Calling a step out of order throws std::logic_error.
 *
 * A test that throws a core::DiagnosticsError yields an UNDEFINED row with
 * the error kind; it never aborts the run. A series that fails validation
 * makes every row UNDEFINED.
 *
 * The series is borrowed: it must outlive the call to Report().
 *
 * Usage:
 *   auto report = ResidualDiagnostics::Run(series, options);
 *   std::cout << report.ToString();
 */
class ResidualDiagnostics {
public:
	/**
	 * @throws core::InvalidConfigurationError if the options are invalid
	 */
	explicit ResidualDiagnostics(core::DiagnosticsOptions options = core::DiagnosticsOptions());

	/// Classify, dispatch and report in one call
	static DiagnosticsReport Run(const core::TimeSeries &series,
	                             const core::DiagnosticsOptions &options = core::DiagnosticsOptions());

	void Classify(const core::TimeSeries &series);

	const std::vector<PlannedTest> &Dispatch();

	const DiagnosticsReport &Report();

	DiagnosticsState state() const {
		return state_;
	}

	const core::DiagnosticsOptions &options() const {
		return options_;
	}

	/// Valid from CLASSIFIED on
	const core::SamplingDescriptor &sampling() const;

	/// Valid from DISPATCHED on
	const std::vector<PlannedTest> &plan() const;

	/// Valid in REPORTED
	const DiagnosticsReport &report() const;

	/**
	 * Run a single test with the orchestrator's parameters
	 *
	 * Errors propagate to the caller (SamplingMismatchError for Ljung-Box or
	 * Durbin-Watson on an irregular series).
	 *
	 * @param grid_step Stoffer-Toloi grid step in days
	 */
	static core::TestResult RunTest(core::TestKind kind, const core::TimeSeries &series,
	                                const core::DiagnosticsOptions &options, double grid_step);

	/// Stoffer-Toloi grid step: options.freq if set, else the smallest interval
	static double GridStep(const core::DiagnosticsOptions &options, const core::SamplingDescriptor &sampling);

private:
	void RequireState(DiagnosticsState expected, const char *operation) const;

	/// RunTest() with DiagnosticsError mapped to an UNDEFINED row
	core::TestResult Evaluate(const PlannedTest &planned) const;

	std::vector<core::TestResult> EvaluateSequential() const;

	std::vector<core::TestResult> EvaluateParallel() const;

	ReportMetadata BuildMetadata(const std::vector<core::TestResult> &results) const;

	core::DiagnosticsOptions options_;
	DiagnosticsState state_ = DiagnosticsState::IDLE;

	const core::TimeSeries *series_ = nullptr;
	core::SamplingDescriptor sampling_;

	/// Set when the series failed validation in Classify()
	bool series_invalid_ = false;
	std::string series_error_;

	double grid_step_ = std::numeric_limits<double>::quiet_NaN();
	std::vector<PlannedTest> plan_;
	std::unique_ptr<DiagnosticsReport> report_;
};

} // namespace diagnostics
} // namespace libresidiag
