#include "common/catch.hpp"

#include "salescast/core/config.hpp"
#include "salescast/forecast/prediction_orchestrator.hpp"
#include "salescast/storage/in_memory_store.hpp"
#include "salescast/utils/logging.hpp"
#include "common/sales_helpers.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <sstream>
#include <stdexcept>

using salescast::utils::Logging;

namespace {

/// Routes the engine logger into a string for the lifetime of the object.
class CapturedLog {
public:
	explicit CapturedLog(spdlog::level::level_enum level)
	    : sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_)) {
		auto &logger = Logging::getLogger();
		previous_level_ = logger->level();
		logger->sinks().push_back(sink_);
		logger->set_level(level);
	}

	~CapturedLog() {
		auto &logger = Logging::getLogger();
		auto &sinks = logger->sinks();
		sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
		logger->set_level(previous_level_);
	}

	CapturedLog(const CapturedLog &) = delete;
	CapturedLog &operator=(const CapturedLog &) = delete;

	std::string text() const {
		return stream_.str();
	}

private:
	std::ostringstream stream_;
	std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
	spdlog::level::level_enum previous_level_ = spdlog::level::info;
};

} // namespace

TEST_CASE("Logging shares the registered salescast logger", "[utils][logging]") {
	auto &logger = Logging::getLogger();
	REQUIRE(logger->name() == "salescast");
	REQUIRE(spdlog::get("salescast").get() == logger.get());

	const auto first_level = logger->level();
	Logging::init(Logging::parseLevel("debug"));
	REQUIRE(Logging::getLogger().get() == logger.get());
	REQUIRE(logger->level() == spdlog::level::debug);
	REQUIRE(logger->flush_level() == spdlog::level::debug);

	logger->set_level(first_level);
	logger->flush_on(first_level);
}

TEST_CASE("Engine fallbacks are logged as warnings", "[utils][logging]") {
	salescast::storage::InMemoryHistoricalStore store(tests::helpers::dailyPoints("Books", "2024-01-01", {10.0}));

	SECTION("visible at warn") {
		CapturedLog log(spdlog::level::warn);
		salescast::forecast::PredictionOrchestrator orchestrator(store, nullptr, salescast::core::EngineConfig());
		REQUIRE(log.text().find("No model loaded") != std::string::npos);
	}
	SECTION("suppressed at error") {
		CapturedLog log(spdlog::level::err);
		salescast::forecast::PredictionOrchestrator orchestrator(store, nullptr, salescast::core::EngineConfig());
		REQUIRE(log.text().empty());
	}
}

TEST_CASE("Logging parses level names", "[utils][logging]") {
	REQUIRE(Logging::parseLevel("trace") == spdlog::level::trace);
	REQUIRE(Logging::parseLevel("DEBUG") == spdlog::level::debug);
	REQUIRE(Logging::parseLevel("warning") == spdlog::level::warn);
	REQUIRE(Logging::parseLevel("error") == spdlog::level::err);
	REQUIRE(Logging::parseLevel("off") == spdlog::level::off);
	REQUIRE_THROWS_AS(Logging::parseLevel("verbose"), std::invalid_argument);
}
