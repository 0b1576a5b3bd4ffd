#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "libresidiag/hypothesis/ljung_box.hpp"
#include "libresidiag/hypothesis/stoffer_toloi.hpp"
#include "../test_helpers.hpp"
#include <cmath>

using namespace libresidiag;
using namespace libresidiag::hypothesis;
using namespace residiag_test;

TEST_CASE("Stoffer-Toloi: Matches reference on a gappy daily series", "[stoffer_toloi][validation]") {
	auto series = LoadCsvSeries("irregular_tests/input/gappy_daily.csv");
	json expected = LoadExpectedJson("irregular_tests/expected/gappy_daily.json");
	json st = expected["stoffer_toloi"];
	const size_t lags = st["lags"].get<size_t>();

	auto detail = StofferToloi::Compute(series, lags, 0, 1.0);

	REQUIRE(detail.n_obs == expected["n_obs"].get<size_t>());
	REQUIRE(detail.n_slots == expected["n_slots"].get<size_t>());
	REQUIRE(detail.n_snapped == 0);
	REQUIRE(detail.df == lags);
	REQUIRE_THAT(detail.q, Catch::Matchers::WithinAbs(st["q"].get<double>(), TOLERANCE));
	REQUIRE_THAT(detail.p_value, Catch::Matchers::WithinAbs(st["p_value"].get<double>(), TOLERANCE));

	auto acf = st["acf"].get<std::vector<double>>();
	auto pairs = st["pair_counts"].get<std::vector<double>>();
	for (size_t k = 0; k < lags; k++) {
		REQUIRE_THAT(detail.acf(k), Catch::Matchers::WithinAbs(acf[k], TOLERANCE));
		REQUIRE(detail.pair_counts(k) == pairs[k]);
	}
}

TEST_CASE("Stoffer-Toloi: Frequency string and step agree", "[stoffer_toloi]") {
	auto series = LoadCsvSeries("irregular_tests/input/gappy_daily.csv");

	auto by_freq = StofferToloi::Test(series, 10, 0, "D");
	auto by_step = StofferToloi::Test(series, 10, 0, 1.0);

	REQUIRE(by_freq.kind() == core::TestKind::STOFFER_TOLOI);
	REQUIRE(by_freq.statistic() == by_step.statistic());
	REQUIRE(by_freq.p_value() == by_step.p_value());
	REQUIRE(by_freq.note().empty());
	REQUIRE_FALSE(by_freq.reject_null());

	// Same pattern on a six-hour grid
	core::TimeSeries quarter_days(series.timestamps * 0.25, series.values);
	auto six_hourly = StofferToloi::Test(quarter_days, 10, 0, "6H");
	REQUIRE_THAT(six_hourly.statistic(), Catch::Matchers::WithinAbs(by_step.statistic(), 1e-10));
}

TEST_CASE("Stoffer-Toloi: Complete grid reduces to Ljung-Box", "[stoffer_toloi]") {
	auto series = DailyNoise(77, 250);

	auto st = StofferToloi::Compute(series, 12, 2, 1.0);
	auto lb = LjungBox::Compute(series.values, 12, 2);

	REQUIRE(st.n_slots == 250);
	REQUIRE_THAT(st.q, Catch::Matchers::WithinRel(lb.q, 1e-10));
	REQUIRE_THAT(st.p_value, Catch::Matchers::WithinAbs(lb.p_value, 1e-10));
	for (size_t k = 0; k < 12; k++) {
		REQUIRE(st.pair_counts(k) == static_cast<double>(250 - k - 1));
	}
}

TEST_CASE("Stoffer-Toloi: Off-grid observations", "[stoffer_toloi][grid]") {
	auto series = LoadCsvSeries("irregular_tests/input/gappy_daily.csv");
	core::TimeSeries jittered = series;
	for (Eigen::Index i = 1; i < jittered.timestamps.size(); i++) {
		jittered.timestamps(i) += 0.2;
	}

	SECTION("Rejected without snapping") {
		REQUIRE_THROWS_AS(StofferToloi::Test(jittered, 10, 0, 1.0), core::InvalidInputError);
	}

	SECTION("Snapped to the nearest slot") {
		auto detail = StofferToloi::Compute(jittered, 10, 0, 1.0, true);
		auto reference = StofferToloi::Compute(series, 10, 0, 1.0);

		REQUIRE(detail.n_snapped == static_cast<size_t>(series.size() - 1));
		REQUIRE(detail.n_slots == reference.n_slots);
		REQUIRE_THAT(detail.q, Catch::Matchers::WithinAbs(reference.q, 1e-12));

		auto result = StofferToloi::Test(jittered, 10, 0, 1.0, 0.05, true);
		REQUIRE(result.note() == "81 observations snapped to the grid");
	}

	SECTION("Two observations on one slot") {
		auto crowded = core::TimeSeries::FromVectors({0.0, 1.0, 1.4, 3.0, 4.0}, {0.5, -1.0, 0.2, 1.1, -0.3});
		REQUIRE_THROWS_AS(StofferToloi::Compute(crowded, 1, 0, 1.0, true), core::InvalidInputError);
	}
}

TEST_CASE("Stoffer-Toloi: Grid reconstruction", "[stoffer_toloi][grid]") {
	auto series = core::TimeSeries::FromVectors({10.0, 11.0, 13.0, 14.0, 17.0}, {1.0, 2.0, 3.0, 4.0, 5.0});
	auto grid = StofferToloi::MapToGrid(series, 1.0, false);

	REQUIRE(grid.n_slots == 8);
	REQUIRE(grid.slot == std::vector<size_t>({0, 1, 3, 4, 7}));
	REQUIRE(grid.observed == std::vector<bool>({true, true, false, true, true, false, false, true}));
	// mean 3; missing slots hold 0
	REQUIRE_THAT(grid.centered(0), Catch::Matchers::WithinAbs(-2.0, TOLERANCE));
	REQUIRE(grid.centered(2) == 0.0);
	REQUIRE_THAT(grid.centered(7), Catch::Matchers::WithinAbs(2.0, TOLERANCE));

	REQUIRE_THROWS_AS(StofferToloi::MapToGrid(series, 0.0, false), core::InvalidConfigurationError);
}

TEST_CASE("Stoffer-Toloi: Errors", "[stoffer_toloi][validation]") {
	auto series = GappyDailyNoise(3, 100, 0.3);

	SECTION("Configuration") {
		REQUIRE_THROWS_AS(StofferToloi::Test(series, 0, 0, 1.0), core::InvalidConfigurationError);
		REQUIRE_THROWS_AS(StofferToloi::Test(series, 5, 5, 1.0), core::InvalidConfigurationError);
		REQUIRE_THROWS_AS(StofferToloi::Test(series, 5, 0, "fortnight"), core::InvalidConfigurationError);
		REQUIRE_THROWS_AS(StofferToloi::Test(series, 5, 0, 1.0, 1.5), core::InvalidConfigurationError);
	}

	SECTION("Constant series") {
		auto constant = core::TimeSeries::FromVectors({0.0, 1.0, 3.0, 4.0}, {2.0, 2.0, 2.0, 2.0});
		REQUIRE_THROWS_AS(StofferToloi::Test(constant, 1, 0, 1.0), core::InvalidInputError);
	}

	SECTION("Lag without observed pairs") {
		auto sparse = core::TimeSeries::FromVectors({0.0, 3.0, 6.0, 9.0}, {1.0, -1.0, 0.5, 2.0});
		REQUIRE_THROWS_AS(StofferToloi::Test(sparse, 2, 0, 1.0), core::InvalidInputError);
		// On a three-day grid the same series is complete
		REQUIRE_NOTHROW(StofferToloi::Test(sparse, 2, 0, 3.0));
	}
}
