#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "libresidiag/core/diagnostics_options.hpp"
#include <nlohmann/json.hpp>
#include <cmath>

using namespace libresidiag::core;
using json = nlohmann::json;

const double TOLERANCE = 1e-12;

TEST_CASE("DiagnosticsOptions: Defaults", "[core][options]") {
	auto opts = DiagnosticsOptions::Defaults();

	REQUIRE_THAT(opts.alpha, Catch::Matchers::WithinAbs(0.05, TOLERANCE));
	REQUIRE(opts.lags == 15);
	REQUIRE(opts.nparam == 0);
	REQUIRE(opts.freq.empty());
	REQUIRE(std::isnan(opts.bin_width));
	REQUIRE(opts.acf_method == AcfMethod::AUTO);
	REQUIRE(opts.min_pairs == 1);
	REQUIRE(opts.runs_cutoff == RunsCutoff::MEDIAN);
	REQUIRE_FALSE(opts.snap_to_grid);
	REQUIRE_FALSE(opts.parallel);
	REQUIRE_NOTHROW(opts.Validate());
}

TEST_CASE("DiagnosticsOptions: Degrees of freedom with a noise model", "[core][options]") {
	auto opts = DiagnosticsOptions::WithNoiseModel(3, 15);
	REQUIRE(opts.DegreesOfFreedom() == 12);
	REQUIRE_NOTHROW(opts.Validate());

	auto saturated = DiagnosticsOptions::WithNoiseModel(15, 15);
	REQUIRE(saturated.DegreesOfFreedom() == 0);
	REQUIRE_THROWS_AS(saturated.Validate(), InvalidConfigurationError);

	auto oversaturated = DiagnosticsOptions::WithNoiseModel(20, 15);
	REQUIRE_THROWS_AS(oversaturated.Validate(), InvalidConfigurationError);
}

TEST_CASE("DiagnosticsOptions: Validation", "[core][options][validation]") {
	DiagnosticsOptions opts;

	SECTION("alpha outside (0, 1)") {
		opts.alpha = 0.0;
		REQUIRE_THROWS_AS(opts.Validate(), InvalidConfigurationError);
		opts.alpha = 1.5;
		REQUIRE_THROWS_AS(opts.Validate(), InvalidConfigurationError);
	}

	SECTION("Zero lags") {
		opts.lags = 0;
		REQUIRE_THROWS_AS(opts.Validate(), InvalidConfigurationError);
	}

	SECTION("Unknown frequency") {
		opts.freq = "fortnight";
		REQUIRE_THROWS_AS(opts.Validate(), InvalidConfigurationError);
	}

	SECTION("Frequency multiplier out of range") {
		opts.freq = "123456789012345678901234567890H";
		REQUIRE_THROWS_AS(opts.Validate(), InvalidConfigurationError);
		REQUIRE_THROWS_AS(DiagnosticsOptions::ParseFromJson({{"freq", opts.freq}}), InvalidConfigurationError);
	}

	SECTION("Non-positive bin width") {
		opts.bin_width = -0.5;
		REQUIRE_THROWS_AS(opts.Validate(), InvalidConfigurationError);
	}

	SECTION("Zero min_pairs") {
		opts.min_pairs = 0;
		REQUIRE_THROWS_AS(opts.Validate(), InvalidConfigurationError);
	}

	SECTION("Negative regularity tolerance") {
		opts.regularity_tolerance = -1e-3;
		REQUIRE_THROWS_AS(opts.Validate(), InvalidConfigurationError);
	}
}

TEST_CASE("DiagnosticsOptions: Parse from JSON", "[core][options][json]") {
	json config = {{"alpha", 0.01},          {"lags", 20},        {"nparam", 3},
	               {"freq", "6H"},           {"bin_width", 0.1},  {"acf_method", "Gaussian"},
	               {"min_pairs", 5},         {"runs_cutoff", "mean"}, {"snap_to_grid", true},
	               {"parallel", 1},          {"regularity_tolerance", 1e-4}};

	auto opts = DiagnosticsOptions::ParseFromJson(config);

	REQUIRE_THAT(opts.alpha, Catch::Matchers::WithinAbs(0.01, TOLERANCE));
	REQUIRE(opts.lags == 20);
	REQUIRE(opts.nparam == 3);
	REQUIRE(opts.freq == "6H");
	REQUIRE_THAT(opts.bin_width, Catch::Matchers::WithinAbs(0.1, TOLERANCE));
	REQUIRE(opts.acf_method == AcfMethod::GAUSSIAN);
	REQUIRE(opts.min_pairs == 5);
	REQUIRE(opts.runs_cutoff == RunsCutoff::MEAN);
	REQUIRE(opts.snap_to_grid);
	REQUIRE(opts.parallel);
	REQUIRE_THAT(opts.regularity_tolerance, Catch::Matchers::WithinAbs(1e-4, TOLERANCE));
}

TEST_CASE("DiagnosticsOptions: JSON keys are case-insensitive and null keeps defaults", "[core][options][json]") {
	auto opts = DiagnosticsOptions::ParseFromJson(json::parse(R"({"LAGS": 10, "Alpha": null})"));
	REQUIRE(opts.lags == 10);
	REQUIRE_THAT(opts.alpha, Catch::Matchers::WithinAbs(0.05, TOLERANCE));

	auto defaults = DiagnosticsOptions::ParseFromJson(json());
	REQUIRE(defaults.lags == 15);
}

TEST_CASE("DiagnosticsOptions: JSON errors", "[core][options][json][validation]") {
	SECTION("Unknown key lists the valid ones") {
		try {
			DiagnosticsOptions::ParseFromJson(json{{"lag", 10}});
			FAIL("Expected InvalidConfigurationError");
		} catch (const InvalidConfigurationError &e) {
			std::string msg = e.what();
			REQUIRE(msg.find("lag") != std::string::npos);
			REQUIRE(msg.find("Valid options are") != std::string::npos);
			REQUIRE(msg.find("nparam") != std::string::npos);
		}
	}

	SECTION("Wrong types") {
		REQUIRE_THROWS_AS(DiagnosticsOptions::ParseFromJson(json{{"alpha", "0.05"}}), InvalidConfigurationError);
		REQUIRE_THROWS_AS(DiagnosticsOptions::ParseFromJson(json{{"lags", 1.5}}), InvalidConfigurationError);
		REQUIRE_THROWS_AS(DiagnosticsOptions::ParseFromJson(json{{"lags", -3}}), InvalidConfigurationError);
		REQUIRE_THROWS_AS(DiagnosticsOptions::ParseFromJson(json{{"parallel", "yes"}}), InvalidConfigurationError);
		REQUIRE_THROWS_AS(DiagnosticsOptions::ParseFromJson(json{{"freq", 1}}), InvalidConfigurationError);
	}

	SECTION("Invalid enum values") {
		REQUIRE_THROWS_AS(DiagnosticsOptions::ParseFromJson(json{{"acf_method", "triangle"}}),
		                  InvalidConfigurationError);
		REQUIRE_THROWS_AS(DiagnosticsOptions::ParseFromJson(json{{"runs_cutoff", "mode"}}),
		                  InvalidConfigurationError);
	}

	SECTION("Parsed values are validated") {
		REQUIRE_THROWS_AS(DiagnosticsOptions::ParseFromJson(json{{"lags", 5}, {"nparam", 5}}),
		                  InvalidConfigurationError);
	}

	SECTION("Not an object") {
		REQUIRE_THROWS_AS(DiagnosticsOptions::ParseFromJson(json::array({1, 2})), InvalidConfigurationError);
	}
}

TEST_CASE("DiagnosticsOptions: ToJson feeds back into ParseFromJson", "[core][options][json]") {
	DiagnosticsOptions opts;
	opts.lags = 24;
	opts.nparam = 2;
	opts.freq = "H";
	opts.acf_method = AcfMethod::RECTANGLE;

	auto j = opts.ToJson();
	REQUIRE(j["bin_width"].is_null());
	REQUIRE(j["acf_method"] == "rectangle");

	auto parsed = DiagnosticsOptions::ParseFromJson(j);
	REQUIRE(parsed.lags == 24);
	REQUIRE(parsed.nparam == 2);
	REQUIRE(parsed.freq == "H");
	REQUIRE(parsed.acf_method == AcfMethod::RECTANGLE);
	REQUIRE(std::isnan(parsed.bin_width));
}
