#include "salescast/core/config.hpp"
#include "salescast/core/errors.hpp"
#include "salescast/core/period.hpp"
#include "salescast/forecast/prediction_orchestrator.hpp"
#include "salescast/models/model_artifact.hpp"
#include "salescast/service/response_json.hpp"
#include "salescast/storage/duckdb_store.hpp"
#include "salescast/utils/logging.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace salescast;

namespace {

const std::string kDescription = "Usage: salescast_cli [options]\n"
                                 "Options";

struct CliOptions {
	std::string db_path;
	std::string model_path;
	std::string manifest_path;
	std::string config_path;
	std::string command = "predict";
	std::optional<std::string> start_date;
	std::optional<std::string> end_date;
	std::optional<std::string> today;
	std::optional<int> days;
	std::optional<int> top_n;
	std::string range = "month";
	bool include_historical = false;
	int historical_days = 180;
	std::string log_level = "info";
};

// Returns false when the program should exit without running a command.
bool parseCommandLine(int argc, const char *const *argv, CliOptions &options) {
	namespace po = boost::program_options;

	po::options_description desc(kDescription);
	desc.add_options()("help", "Display this information and exit")(
	    "db", po::value<std::string>(), "DuckDB database holding the sales_points table")(
	    "model", po::value<std::string>(), "JSON model artifact")(
	    "manifest", po::value<std::string>(), "Optional JSON feature manifest overriding the model's columns")(
	    "config", po::value<std::string>(), "Optional JSON engine config")(
	    "command", po::value<std::string>(),
	    "predict | historical | categories | time-series | model-info | list-categories (default: predict)")(
	    "start", po::value<std::string>(), "Period start date (YYYY-MM-DD)")(
	    "end", po::value<std::string>(), "Period end date (YYYY-MM-DD), default today")(
	    "today", po::value<std::string>(), "Date treated as today (YYYY-MM-DD), default the system date")(
	    "days", po::value<int>(), "Period length when --start is absent")(
	    "top-n", po::value<int>(), "Number of categories to return")(
	    "range", po::value<std::string>(), "week | month | quarter | year | custom (categories command)")(
	    "include-historical", "Attach the preceding period and the growth rate (predict command)")(
	    "historical-days", po::value<int>(), "Days of history charted before the period (time-series command)")(
	    "log-level", po::value<std::string>(), "trace | debug | info | warn | error | critical | off");

	po::variables_map vm;
	po::store(po::parse_command_line(argc, argv, desc), vm);
	po::notify(vm);

	if (vm.count("help") > 0) {
		std::cerr << desc << std::endl;
		return false;
	}
	if (vm.count("db") > 0) {
		options.db_path = vm["db"].as<std::string>();
	}
	if (vm.count("model") > 0) {
		options.model_path = vm["model"].as<std::string>();
	}
	if (vm.count("manifest") > 0) {
		options.manifest_path = vm["manifest"].as<std::string>();
	}
	if (vm.count("config") > 0) {
		options.config_path = vm["config"].as<std::string>();
	}
	if (vm.count("command") > 0) {
		options.command = vm["command"].as<std::string>();
	}
	if (vm.count("start") > 0) {
		options.start_date = vm["start"].as<std::string>();
	}
	if (vm.count("end") > 0) {
		options.end_date = vm["end"].as<std::string>();
	}
	if (vm.count("today") > 0) {
		options.today = vm["today"].as<std::string>();
	}
	if (vm.count("days") > 0) {
		options.days = vm["days"].as<int>();
	}
	if (vm.count("top-n") > 0) {
		options.top_n = vm["top-n"].as<int>();
	}
	if (vm.count("range") > 0) {
		options.range = vm["range"].as<std::string>();
	}
	if (vm.count("include-historical") > 0) {
		options.include_historical = true;
	}
	if (vm.count("historical-days") > 0) {
		options.historical_days = vm["historical-days"].as<int>();
	}
	if (vm.count("log-level") > 0) {
		options.log_level = vm["log-level"].as<std::string>();
	}
	return true;
}

core::EngineConfig resolveConfig(const CliOptions &options) {
	core::EngineConfig config =
	    options.config_path.empty() ? core::EngineConfig() : core::loadEngineConfig(options.config_path);
	if (!options.db_path.empty()) {
		config.database_path = options.db_path;
	}
	if (!options.model_path.empty()) {
		config.model_path = options.model_path;
	}
	if (!options.manifest_path.empty()) {
		config.manifest_path = options.manifest_path;
	}
	return config;
}

// A broken artifact is not fatal: the engine answers from history instead.
std::shared_ptr<const models::ModelArtifact> loadArtifact(const core::EngineConfig &config) {
	if (config.model_path.empty()) {
		SALESCAST_WARN("No model artifact given; running in historical-only mode.");
		return nullptr;
	}
	try {
		return models::ModelArtifact::load(config.model_path, config.manifest_path, config);
	} catch (const core::ConfigurationError &e) {
		SALESCAST_ERROR("Model files not loaded: {}", e.what());
		return nullptr;
	}
}

Json::Value runCommand(const CliOptions &options, const storage::IHistoricalStore &store,
                       const forecast::PredictionOrchestrator &orchestrator) {
	const auto &config = orchestrator.config();
	const core::Date today = options.today ? core::Date::parse(*options.today) : core::Date::today();
	const int top_n = options.top_n.value_or(config.default_top_n);
	const int days = options.days.value_or(config.default_forecast_days);

	if (options.command == "model-info") {
		return service::toJson(orchestrator.modelInfo());
	}
	if (options.command == "list-categories") {
		return service::toJson(store);
	}
	if (options.command == "categories") {
		return service::toJson(
		    orchestrator.topCategoriesForRange(options.range, today, top_n, options.start_date, options.end_date));
	}

	const auto period = core::resolvePeriod(options.start_date, options.end_date, days, today);
	if (options.command == "predict") {
		forecast::ForecastRequest request;
		request.period = period;
		request.top_n = top_n;
		request.include_historical = options.include_historical;
		return service::toJson(orchestrator.predictTopCategories(request));
	}
	if (options.command == "historical") {
		forecast::HistoricalRequest request;
		request.period = period;
		request.top_n = top_n;
		return service::toJson(orchestrator.historicalTopCategories(request));
	}
	if (options.command == "time-series") {
		forecast::ForecastRequest request;
		request.period = period;
		request.top_n = top_n;
		return service::toJson(orchestrator.timeSeries(request, options.historical_days));
	}
	throw core::ValidationError("unknown command '" + options.command + "'.");
}

} // namespace

int main(int argc, char **argv) {
	CliOptions options;
	try {
		if (!parseCommandLine(argc, argv, options)) {
			return 0;
		}
	} catch (const boost::program_options::error &e) {
		std::cerr << "Error processing command line: " << e.what() << std::endl;
		return 2;
	}

	try {
		utils::Logging::init(utils::Logging::parseLevel(options.log_level));
	} catch (const std::invalid_argument &e) {
		std::cerr << e.what() << std::endl;
		return 2;
	}

	try {
		const auto config = resolveConfig(options);
		storage::DuckDBHistoricalStore store(config.database_path);
		forecast::PredictionOrchestrator orchestrator(store, loadArtifact(config), config);
		std::cout << service::render(runCommand(options, store, orchestrator)) << std::endl;
	} catch (const core::ValidationError &e) {
		std::cout << service::render(service::errorJson("validation", e.what())) << std::endl;
		return 2;
	} catch (const core::NoContextError &e) {
		std::cout << service::render(service::errorJson("no_context", e.what())) << std::endl;
		return 1;
	} catch (const core::SalescastError &e) {
		SALESCAST_CRITICAL("{}", e.what());
		std::cout << service::render(service::errorJson("internal", e.what())) << std::endl;
		return 1;
	}
	return 0;
}
