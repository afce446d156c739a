#include "common/catch.hpp"

#include "salescast/core/errors.hpp"
#include "salescast/features/feature_manifest.hpp"
#include "common/sales_helpers.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using salescast::features::FeatureKind;
using salescast::features::FeatureManifest;
using salescast::features::parseFeatureName;
using tests::helpers::TempFile;

TEST_CASE("Feature names parse into specs", "[features][manifest]") {
	SECTION("calendar columns") {
		REQUIRE(parseFeatureName("day_of_week").kind == FeatureKind::DayOfWeek);
		REQUIRE(parseFeatureName("week_of_year").kind == FeatureKind::WeekOfYear);
		REQUIRE(parseFeatureName("is_november").kind == FeatureKind::IsSpecialMonth);
		REQUIRE(parseFeatureName("is_special_month").isCalendar());
	}
	SECTION("lags") {
		const auto spec = parseFeatureName("Electronics_lag_7");
		REQUIRE(spec.kind == FeatureKind::Lag);
		REQUIRE(spec.category == "Electronics");
		REQUIRE(spec.days == 7);
		REQUIRE(parseFeatureName("Home_Garden_lag_14d").category == "Home_Garden");
		REQUIRE(parseFeatureName("Home_Garden_lag_14d").days == 14);
	}
	SECTION("rolling windows") {
		const auto mean = parseFeatureName("Books_rolling_avg_28d");
		REQUIRE(mean.kind == FeatureKind::RollingMean);
		REQUIRE(mean.category == "Books");
		REQUIRE(mean.days == 28);
		REQUIRE(parseFeatureName("Books_rolling_mean_7").kind == FeatureKind::RollingMean);

		const auto std_dev = parseFeatureName("Books_rolling_std_14");
		REQUIRE(std_dev.kind == FeatureKind::RollingStd);
		REQUIRE(std_dev.days == 14);
	}
	SECTION("unknown columns") {
		REQUIRE(parseFeatureName("promo_flag").kind == FeatureKind::Unknown);
		REQUIRE(parseFeatureName("Books_lag_").kind == FeatureKind::Unknown);
		REQUIRE(parseFeatureName("Books_lag_0").kind == FeatureKind::Unknown);
		REQUIRE(parseFeatureName("_lag_3").kind == FeatureKind::Unknown);
	}
}

TEST_CASE("FeatureManifest rejects duplicate and empty names", "[features][manifest]") {
	REQUIRE_THROWS_AS(FeatureManifest({"year", "year"}), std::invalid_argument);
	REQUIRE_THROWS_AS(FeatureManifest({"year", ""}), std::invalid_argument);
}

TEST_CASE("FeatureManifest generates the default layout", "[features][manifest]") {
	const auto manifest = FeatureManifest::generate({"Books", "Toys"}, {1, 7}, {7});

	// 9 calendar columns, 2 lags x 2 categories, 1 window x 2 stats x 2 categories.
	REQUIRE(manifest.size() == 9 + 4 + 4);
	REQUIRE(manifest.names().front() == "year");
	REQUIRE(manifest.names()[9] == "Books_lag_1");
	REQUIRE(manifest.names()[10] == "Toys_lag_1");
	REQUIRE(manifest.names().back() == "Toys_rolling_std_7");
	REQUIRE(manifest.categories() == std::vector<std::string>{"Books", "Toys"});
	REQUIRE(manifest.maxLookback() == 7);
}

TEST_CASE("FeatureManifest loads from JSON", "[features][manifest]") {
	SECTION("plain array") {
		TempFile file("manifest_array.json", R"(["month", "Books_lag_1", "Books_rolling_avg_7d"])");
		const auto manifest = FeatureManifest::loadFromFile(file.path());
		REQUIRE(manifest.size() == 3);
		REQUIRE(manifest.specs()[2].kind == FeatureKind::RollingMean);
	}
	SECTION("object with feature_columns") {
		TempFile file("manifest_object.json", R"({"feature_columns": ["year", "Toys_lag_28"]})");
		const auto manifest = FeatureManifest::loadFromFile(file.path());
		REQUIRE(manifest.names() == std::vector<std::string>{"year", "Toys_lag_28"});
		REQUIRE(manifest.maxLookback() == 28);
	}
	SECTION("broken files") {
		REQUIRE_THROWS_AS(FeatureManifest::loadFromFile("/nonexistent/manifest.json"),
		                  salescast::core::ConfigurationError);
		TempFile empty("manifest_empty.json", "[]");
		REQUIRE_THROWS_AS(FeatureManifest::loadFromFile(empty.path()), salescast::core::ConfigurationError);
		TempFile duplicate("manifest_duplicate.json", R"(["year", "year"])");
		REQUIRE_THROWS_AS(FeatureManifest::loadFromFile(duplicate.path()), salescast::core::ConfigurationError);
	}
}
