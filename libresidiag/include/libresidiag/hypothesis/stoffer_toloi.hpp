#pragma once

#include "libresidiag/core/test_result.hpp"
#include "libresidiag/core/time_series.hpp"
#include "libresidiag/utils/descriptive.hpp"
#include "libresidiag/utils/distributions.hpp"
#include "libresidiag/utils/tracing.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <string>
#include <vector>

namespace libresidiag {
namespace hypothesis {

/**
 * Observations placed on the regular grid t_0 + m·step
 *
 * slot(i) is the grid index of observation i; centered has one entry per
 * grid slot (observed value minus the observed mean, 0 where missing).
 */
struct GridAssignment {
	double step = 0.0;
	size_t n_slots = 0;
	size_t n_snapped = 0;
	std::vector<size_t> slot;
	std::vector<bool> observed;
	Eigen::VectorXd centered;
};

struct StofferToloiDetail {
	double q = 0.0;
	double p_value = 1.0;
	size_t df = 0;

	/// Observed values n
	size_t n_obs = 0;

	/// Length of the reconstructed grid (observed + missing)
	size_t n_slots = 0;

	/// Observations moved onto the grid by snapping
	size_t n_snapped = 0;

	double step = 0.0;

	/// r̃_1..r̃_lags
	Eigen::VectorXd acf;

	/// m_1..m_lags: lag-k pairs with both ends observed
	Eigen::VectorXd pair_counts;
};

/**
 * Stoffer-Toloi test: Ljung-Box for a regular grid with missing observations
 *
 * With z the demeaned observed values (0 at missing slots) and m_k the
 * number of lag-k pairs whose both ends are observed:
 *   r̃_k = (Σ_t z_t z_{t+k} / m_k) / (Σ z² / n)
 *   Q   = ((n + 2) / n) Σ_{k=1}^{lags} m_k r̃_k²,  Q ~ χ²(lags - nparam)
 * where n is the number of observed values. On a complete grid Q equals the
 * Ljung-Box statistic.
 */
class StofferToloi {
public:
	/// Maximum distance from a grid slot, as a fraction of the step
	static constexpr double kGridTolerance = 1e-6;

	/**
	 * Run the test with the grid frequency given as a string ("D", "6H", ...)
	 *
	 * @throws core::InvalidConfigurationError for an unknown frequency, alpha
	 *         outside (0, 1), lags = 0 or lags - nparam < 1
	 * @throws core::InvalidInputError for off-grid observations (unless
	 *         snap_to_grid), slot collisions, a constant series, or a lag
	 *         without observed pairs
	 */
	static core::TestResult Test(const core::TimeSeries &series, size_t lags, size_t nparam,
	                             const std::string &freq, double alpha = 0.05, bool snap_to_grid = false) {
		return Test(series, lags, nparam, core::ParseFrequency(freq), alpha, snap_to_grid);
	}

	/// Same with the grid step in days
	static core::TestResult Test(const core::TimeSeries &series, size_t lags, size_t nparam, double step,
	                             double alpha = 0.05, bool snap_to_grid = false) {
		core::ValidateSignificanceLevel(alpha);
		auto detail = Compute(series, lags, nparam, step, snap_to_grid);

		std::string note;
		if (detail.n_snapped > 0) {
			note = std::to_string(detail.n_snapped) + " observations snapped to the grid";
		}
		return core::TestResult::Valid(core::TestKind::STOFFER_TOLOI, detail.q, detail.p_value, alpha, note);
	}

	static StofferToloiDetail Compute(const core::TimeSeries &series, size_t lags, size_t nparam, double step,
	                                  bool snap_to_grid = false) {
		if (lags == 0) {
			throw core::InvalidConfigurationError("Stoffer-Toloi needs at least one lag");
		}
		if (nparam >= lags) {
			throw core::InvalidConfigurationError(
			    "Stoffer-Toloi degrees of freedom lags - nparam must be at least 1 (lags=" + std::to_string(lags) +
			    ", nparam=" + std::to_string(nparam) + ")");
		}

		series.Validate();
		if (series.size() < 2) {
			throw core::InvalidInputError("Stoffer-Toloi needs at least 2 observations");
		}
		if (utils::IsConstant(series.values)) {
			throw core::InvalidInputError("Stoffer-Toloi is undefined for a constant series (zero variance)");
		}

		GridAssignment grid = MapToGrid(series, step, snap_to_grid);

		const size_t n_obs = series.size();
		const double nd = static_cast<double>(n_obs);
		const double gamma0 = grid.centered.squaredNorm() / nd;

		StofferToloiDetail detail;
		detail.df = lags - nparam;
		detail.n_obs = n_obs;
		detail.n_slots = grid.n_slots;
		detail.n_snapped = grid.n_snapped;
		detail.step = step;
		detail.acf.resize(lags);
		detail.pair_counts.resize(lags);

		double sum = 0.0;
		for (size_t k = 1; k <= lags; k++) {
			size_t pairs = 0;
			double cross = 0.0;
			for (size_t t = 0; t + k < grid.n_slots; t++) {
				if (grid.observed[t] && grid.observed[t + k]) {
					pairs++;
					cross += grid.centered(t) * grid.centered(t + k);
				}
			}
			if (pairs == 0) {
				throw core::InvalidInputError("Stoffer-Toloi: no observed pairs at lag " + std::to_string(k) +
				                              " (grid of " + std::to_string(grid.n_slots) + " slots, " +
				                              std::to_string(n_obs) + " observed)");
			}

			const double md = static_cast<double>(pairs);
			const double r = (cross / md) / gamma0;
			detail.acf(k - 1) = r;
			detail.pair_counts(k - 1) = md;
			sum += md * r * r;
		}

		detail.q = (nd + 2.0) / nd * sum;
		detail.p_value = utils::chi_squared_sf(detail.q, static_cast<double>(detail.df));

		RESIDIAG_DEBUG("Stoffer-Toloi n_obs=" << n_obs << " slots=" << grid.n_slots << " Q=" << detail.q);
		return detail;
	}

	/**
	 * Place the observations on the grid starting at the first timestamp
	 *
	 * @throws core::InvalidConfigurationError for a non-positive step
	 * @throws core::InvalidInputError for off-grid observations without
	 *         snapping, or two observations on one slot
	 */
	static GridAssignment MapToGrid(const core::TimeSeries &series, double step, bool snap_to_grid) {
		if (!(step > 0.0 && std::isfinite(step))) {
			throw core::InvalidConfigurationError("grid step must be positive (got " + std::to_string(step) + ")");
		}

		GridAssignment grid;
		grid.step = step;
		const Eigen::Index n = series.timestamps.size();
		grid.slot.resize(static_cast<size_t>(n));
		if (n == 0) {
			return grid;
		}

		const double t0 = series.timestamps(0);
		for (Eigen::Index i = 0; i < n; i++) {
			const double position = (series.timestamps(i) - t0) / step;
			const double nearest = std::round(position);
			if (std::abs(position - nearest) > kGridTolerance) {
				if (!snap_to_grid) {
					throw core::InvalidInputError("observation at t=" + std::to_string(series.timestamps(i)) +
					                              " is not on the grid (step " + std::to_string(step) +
					                              " days); enable snap_to_grid or check the frequency");
				}
				grid.n_snapped++;
			}
			const size_t slot = static_cast<size_t>(nearest);
			if (i > 0 && slot <= grid.slot[i - 1]) {
				throw core::InvalidInputError("observations at t=" + std::to_string(series.timestamps(i - 1)) +
				                              " and t=" + std::to_string(series.timestamps(i)) +
				                              " fall on the same grid slot");
			}
			grid.slot[i] = slot;
		}

		grid.n_slots = grid.slot.back() + 1;
		grid.observed.assign(grid.n_slots, false);
		grid.centered = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(grid.n_slots));

		const double mean = series.values.mean();
		for (Eigen::Index i = 0; i < n; i++) {
			grid.observed[grid.slot[i]] = true;
			grid.centered(static_cast<Eigen::Index>(grid.slot[i])) = series.values(i) - mean;
		}
		return grid;
	}
};

} // namespace hypothesis
} // namespace libresidiag
