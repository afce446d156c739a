#include "salescast/features/feature_manifest.hpp"
#include "salescast/core/errors.hpp"
#include "salescast/utils/logging.hpp"

#include <json/json.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace salescast::features {

namespace {

const std::unordered_map<std::string, FeatureKind> &calendarColumns() {
	static const std::unordered_map<std::string, FeatureKind> columns = {
	    {"year", FeatureKind::Year},
	    {"month", FeatureKind::Month},
	    {"day", FeatureKind::Day},
	    {"day_of_week", FeatureKind::DayOfWeek},
	    {"is_weekend", FeatureKind::IsWeekend},
	    {"week_of_year", FeatureKind::WeekOfYear},
	    {"quarter", FeatureKind::Quarter},
	    {"is_month_start", FeatureKind::IsMonthStart},
	    {"is_month_end", FeatureKind::IsMonthEnd},
	    {"is_special_month", FeatureKind::IsSpecialMonth},
	    {"is_november", FeatureKind::IsSpecialMonth},
	};
	return columns;
}

// Parses "<digits>" or "<digits>d" into a positive day count.
std::optional<int> parseDaySuffix(const std::string &suffix) {
	std::string digits = suffix;
	if (!digits.empty() && digits.back() == 'd') {
		digits.pop_back();
	}
	if (digits.empty() || digits.size() > 6) {
		return std::nullopt;
	}
	if (!std::all_of(digits.begin(), digits.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
		return std::nullopt;
	}
	const int value = std::stoi(digits);
	if (value <= 0) {
		return std::nullopt;
	}
	return value;
}

bool splitOnMarker(const std::string &name, const std::string &marker, FeatureKind kind, FeatureSpec &spec) {
	const auto pos = name.rfind(marker);
	if (pos == std::string::npos || pos == 0) {
		return false;
	}
	const auto days = parseDaySuffix(name.substr(pos + marker.size()));
	if (!days) {
		return false;
	}
	spec.kind = kind;
	spec.category = name.substr(0, pos);
	spec.days = *days;
	return true;
}

} // namespace

FeatureSpec parseFeatureName(const std::string &name) {
	FeatureSpec spec;
	spec.name = name;

	const auto &calendar = calendarColumns();
	auto it = calendar.find(name);
	if (it != calendar.end()) {
		spec.kind = it->second;
		return spec;
	}

	if (splitOnMarker(name, "_rolling_mean_", FeatureKind::RollingMean, spec) ||
	    splitOnMarker(name, "_rolling_avg_", FeatureKind::RollingMean, spec) ||
	    splitOnMarker(name, "_rolling_std_", FeatureKind::RollingStd, spec) ||
	    splitOnMarker(name, "_lag_", FeatureKind::Lag, spec)) {
		return spec;
	}

	spec.kind = FeatureKind::Unknown;
	return spec;
}

FeatureManifest::FeatureManifest(std::vector<std::string> names) : names_(std::move(names)) {
	std::unordered_set<std::string> seen;
	specs_.reserve(names_.size());
	for (const auto &name : names_) {
		if (name.empty()) {
			throw std::invalid_argument("Feature manifest contains an empty column name.");
		}
		if (!seen.insert(name).second) {
			throw std::invalid_argument("Feature manifest contains duplicate column '" + name + "'.");
		}
		specs_.push_back(parseFeatureName(name));
	}
}

FeatureManifest FeatureManifest::generate(const std::vector<std::string> &categories,
                                          const std::vector<int> &lag_days,
                                          const std::vector<int> &rolling_windows) {
	std::vector<std::string> names = {"year",         "month",        "day_of_week",    "is_weekend",
	                                  "week_of_year", "quarter",      "is_month_start", "is_month_end",
	                                  "is_special_month"};
	for (int lag : lag_days) {
		for (const auto &category : categories) {
			names.push_back(category + "_lag_" + std::to_string(lag));
		}
	}
	for (int window : rolling_windows) {
		for (const auto &category : categories) {
			names.push_back(category + "_rolling_mean_" + std::to_string(window));
			names.push_back(category + "_rolling_std_" + std::to_string(window));
		}
	}
	return FeatureManifest(std::move(names));
}

FeatureManifest FeatureManifest::loadFromFile(const std::string &path) {
	std::ifstream input(path);
	if (!input) {
		throw core::ConfigurationError("Feature manifest '" + path + "' not found.");
	}

	Json::CharReaderBuilder builder;
	Json::Value root;
	std::string errors;
	if (!Json::parseFromStream(builder, input, &root, &errors)) {
		throw core::ConfigurationError("Cannot parse feature manifest '" + path + "': " + errors);
	}

	const Json::Value &columns = root.isObject() ? root["feature_columns"] : root;
	if (!columns.isArray() || columns.empty()) {
		throw core::ConfigurationError("Feature manifest '" + path + "' must list at least one feature column.");
	}

	std::vector<std::string> names;
	names.reserve(columns.size());
	for (const auto &column : columns) {
		if (!column.isString()) {
			throw core::ConfigurationError("Feature manifest '" + path + "' contains a non-string column.");
		}
		names.push_back(column.asString());
	}

	try {
		FeatureManifest manifest(std::move(names));
		SALESCAST_INFO("Loaded feature manifest with {} columns from {}.", manifest.size(), path);
		return manifest;
	} catch (const std::invalid_argument &e) {
		throw core::ConfigurationError("Feature manifest '" + path + "' is invalid: " + e.what());
	}
}

std::vector<std::string> FeatureManifest::categories() const {
	std::vector<std::string> result;
	std::unordered_set<std::string> seen;
	for (const auto &spec : specs_) {
		if (spec.category.empty()) {
			continue;
		}
		if (seen.insert(spec.category).second) {
			result.push_back(spec.category);
		}
	}
	return result;
}

int FeatureManifest::maxLookback() const {
	int lookback = 0;
	for (const auto &spec : specs_) {
		lookback = std::max(lookback, spec.days);
	}
	return lookback;
}

} // namespace salescast::features
