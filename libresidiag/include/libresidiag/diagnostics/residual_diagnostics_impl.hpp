#pragma once

#include "residual_diagnostics.hpp"
#include "libresidiag/acf/autocorrelation_impl.hpp"
#include "libresidiag/hypothesis/durbin_watson.hpp"
#include "libresidiag/hypothesis/ljung_box.hpp"
#include "libresidiag/hypothesis/runs_test.hpp"
#include "libresidiag/hypothesis/stoffer_toloi.hpp"
#include "libresidiag/normality/normality_tests.hpp"
#include "libresidiag/utils/tracing.hpp"
#include <future>
#include <memory>
#include <stdexcept>

namespace libresidiag {
namespace diagnostics {

// Implementation of ResidualDiagnostics methods

inline ResidualDiagnostics::ResidualDiagnostics(core::DiagnosticsOptions options) : options_(std::move(options)) {
	// Read RESIDIAG_LOG_LEVEL before any worker thread can log
	utils::Tracer::Initialize();
	options_.Validate();
}

inline DiagnosticsReport ResidualDiagnostics::Run(const core::TimeSeries &series,
                                                  const core::DiagnosticsOptions &options) {
	ResidualDiagnostics diagnostics(options);
	diagnostics.Classify(series);
	diagnostics.Dispatch();
	return diagnostics.Report();
}

inline void ResidualDiagnostics::RequireState(DiagnosticsState expected, const char *operation) const {
	if (state_ != expected) {
		throw std::logic_error(std::string(operation) + " requires state '" + DiagnosticsStateName(expected) +
		                       "' but diagnostics are in state '" + DiagnosticsStateName(state_) + "'");
	}
}

inline const core::SamplingDescriptor &ResidualDiagnostics::sampling() const {
	if (state_ == DiagnosticsState::IDLE) {
		throw std::logic_error("sampling() is available after Classify()");
	}
	return sampling_;
}

inline const std::vector<PlannedTest> &ResidualDiagnostics::plan() const {
	if (state_ == DiagnosticsState::IDLE || state_ == DiagnosticsState::CLASSIFIED) {
		throw std::logic_error("plan() is available after Dispatch()");
	}
	return plan_;
}

inline const DiagnosticsReport &ResidualDiagnostics::report() const {
	if (state_ != DiagnosticsState::REPORTED) {
		throw std::logic_error("report() is available after Report()");
	}
	return *report_;
}

inline double ResidualDiagnostics::GridStep(const core::DiagnosticsOptions &options,
                                            const core::SamplingDescriptor &sampling) {
	if (!options.freq.empty()) {
		return core::ParseFrequency(options.freq);
	}
	return sampling.min_delta;
}

inline void ResidualDiagnostics::Classify(const core::TimeSeries &series) {
	RequireState(DiagnosticsState::IDLE, "Classify()");
	series_ = &series;

	try {
		series.Validate();
		sampling_ = core::SamplingDescriptor::FromSeries(series, options_.regularity_tolerance);
	} catch (const core::DiagnosticsError &e) {
		series_invalid_ = true;
		series_error_ = e.what();
		sampling_ = core::SamplingDescriptor();
		sampling_.n_obs = series.size();
		RESIDIAG_WARN("residual series rejected: " << series_error_);
	}

	state_ = DiagnosticsState::CLASSIFIED;
	RESIDIAG_DEBUG("classified n=" << sampling_.n_obs << " as "
	                               << (sampling_.equidistant ? "equidistant" : "irregular")
	                               << " (min_delta=" << sampling_.min_delta << ", max_delta=" << sampling_.max_delta
	                               << ")");
}

inline const std::vector<PlannedTest> &ResidualDiagnostics::Dispatch() {
	RequireState(DiagnosticsState::CLASSIFIED, "Dispatch()");

	const bool irregular = sampling_.is_irregular();
	plan_.clear();
	plan_.reserve(core::kNumTestKinds);

	for (size_t i = 0; i < core::kNumTestKinds; i++) {
		PlannedTest planned;
		planned.kind = static_cast<core::TestKind>(i);

		if (series_invalid_) {
			planned.run = false;
			planned.status = core::ResultStatus::UNDEFINED;
			planned.error_kind = core::ErrorKind::INVALID_INPUT;
			planned.reason = series_error_;
			plan_.push_back(planned);
			continue;
		}

		switch (planned.kind) {
		case core::TestKind::SHAPIRO_WILK:
		case core::TestKind::DAGOSTINO_PEARSON:
		case core::TestKind::RUNS:
			break;
		case core::TestKind::LJUNG_BOX:
		case core::TestKind::DURBIN_WATSON:
			if (irregular) {
				planned.run = false;
				planned.status = core::ResultStatus::NOT_APPLICABLE;
				planned.reason = "irregular sampling, requires equidistant series (Stoffer-Toloi applies)";
			}
			break;
		case core::TestKind::STOFFER_TOLOI:
			if (!irregular) {
				planned.run = false;
				planned.status = core::ResultStatus::NOT_APPLICABLE;
				planned.reason = "equidistant series, Ljung-Box applies";
			}
			break;
		}
		plan_.push_back(planned);
	}

	if (irregular && !series_invalid_) {
		grid_step_ = GridStep(options_, sampling_);
	}

	state_ = DiagnosticsState::DISPATCHED;
	RESIDIAG_DEBUG("dispatched " << (irregular ? "irregular" : "equidistant") << " plan, lags=" << options_.lags
	                             << " nparam=" << options_.nparam << " parallel=" << options_.parallel);
	return plan_;
}

inline core::TestResult ResidualDiagnostics::RunTest(core::TestKind kind, const core::TimeSeries &series,
                                                     const core::DiagnosticsOptions &options, double grid_step) {
	switch (kind) {
	case core::TestKind::SHAPIRO_WILK:
		return normality::ShapiroWilk::Test(series, options.alpha);
	case core::TestKind::DAGOSTINO_PEARSON:
		return normality::DAgostinoPearson::Test(series, options.alpha);
	case core::TestKind::RUNS:
		return hypothesis::RunsTest::Test(series, options.runs_cutoff, options.alpha);
	case core::TestKind::LJUNG_BOX:
		return hypothesis::LjungBox::Test(series, options.lags, options.nparam, options.alpha,
		                                  options.regularity_tolerance);
	case core::TestKind::DURBIN_WATSON:
		return hypothesis::DurbinWatson::Test(series, options.alpha, options.regularity_tolerance);
	case core::TestKind::STOFFER_TOLOI:
		return hypothesis::StofferToloi::Test(series, options.lags, options.nparam, grid_step, options.alpha,
		                                      options.snap_to_grid);
	}
	throw std::logic_error("unhandled test kind");
}

inline core::TestResult ResidualDiagnostics::Evaluate(const PlannedTest &planned) const {
	if (!planned.run) {
		if (planned.status == core::ResultStatus::NOT_APPLICABLE) {
			return core::TestResult::NotApplicable(planned.kind, planned.reason, options_.alpha);
		}
		return core::TestResult::Undefined(planned.kind, planned.error_kind, planned.reason, options_.alpha);
	}

	try {
		return RunTest(planned.kind, *series_, options_, grid_step_);
	} catch (const core::DiagnosticsError &e) {
		RESIDIAG_WARN(core::TestKindName(planned.kind) << " undefined (" << core::ErrorKindName(e.Kind())
		                                               << "): " << e.what());
		return core::TestResult::Undefined(planned.kind, e.Kind(), e.what(), options_.alpha);
	}
}

inline std::vector<core::TestResult> ResidualDiagnostics::EvaluateSequential() const {
	std::vector<core::TestResult> results;
	results.reserve(plan_.size());
	for (const auto &planned : plan_) {
		results.push_back(Evaluate(planned));
	}
	return results;
}

inline std::vector<core::TestResult> ResidualDiagnostics::EvaluateParallel() const {
	std::vector<std::future<core::TestResult>> futures;
	futures.reserve(plan_.size());
	for (const auto &planned : plan_) {
		if (planned.run) {
			futures.push_back(std::async(std::launch::async, [this, &planned]() { return Evaluate(planned); }));
		} else {
			std::promise<core::TestResult> ready;
			ready.set_value(Evaluate(planned));
			futures.push_back(ready.get_future());
		}
	}

	// Collected in plan order, not completion order
	std::vector<core::TestResult> results;
	results.reserve(futures.size());
	for (auto &future : futures) {
		results.push_back(future.get());
	}
	return results;
}

inline ReportMetadata ResidualDiagnostics::BuildMetadata(const std::vector<core::TestResult> &results) const {
	ReportMetadata metadata;
	metadata.n = series_->size();
	metadata.lags = options_.lags;
	metadata.nparam = options_.nparam;
	metadata.df = options_.DegreesOfFreedom();
	metadata.alpha = options_.alpha;
	metadata.irregular = sampling_.is_irregular();
	metadata.sampling = sampling_;
	metadata.grid_step = grid_step_;

	if (series_invalid_) {
		metadata.warnings.push_back("invalid series: " + series_error_);
		return metadata;
	}

	for (const auto &result : results) {
		switch (result.status()) {
		case core::ResultStatus::VALID:
		case core::ResultStatus::STATISTIC_ONLY:
			if (!result.note().empty()) {
				metadata.warnings.push_back(result.name() + ": " + result.note());
			}
			break;
		case core::ResultStatus::UNDEFINED:
			metadata.warnings.push_back(result.name() + " undefined (" + core::ErrorKindName(result.error_kind()) +
			                            "): " + result.note());
			break;
		case core::ResultStatus::NOT_APPLICABLE:
			metadata.warnings.push_back(result.name() + " not applicable: " + result.note());
			break;
		}
	}

	try {
		metadata.acf = acf::Autocorrelation::Compute(*series_, acf::LagSpecification::Count(options_.lags, options_.alpha),
		                                             acf::AcfOptions::FromDiagnostics(options_));
		metadata.has_acf = true;
	} catch (const core::DiagnosticsError &e) {
		metadata.warnings.push_back(std::string("autocorrelation: ") + e.what());
	}

	return metadata;
}

inline const DiagnosticsReport &ResidualDiagnostics::Report() {
	RequireState(DiagnosticsState::DISPATCHED, "Report()");

	RESIDIAG_TIMING_START();
	std::vector<core::TestResult> results = options_.parallel ? EvaluateParallel() : EvaluateSequential();
	ReportMetadata metadata = BuildMetadata(results);
	RESIDIAG_TIMING_END("residual diagnostics");

	report_ = std::make_unique<DiagnosticsReport>(std::move(results), std::move(metadata));
	state_ = DiagnosticsState::REPORTED;

	RESIDIAG_DEBUG("reported " << report_->size() << " rows, " << report_->CountRejections() << " rejections, "
	                           << report_->CountUndefined() << " undefined");
	return *report_;
}

} // namespace diagnostics
} // namespace libresidiag
