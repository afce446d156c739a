#include "salescast/storage/duckdb_store.hpp"
#include "salescast/core/errors.hpp"
#include "salescast/utils/logging.hpp"

#include "duckdb.hpp"

#include <cstdint>
#include <limits>

namespace salescast::storage {

namespace {

constexpr const char *kCreateTable = "CREATE TABLE IF NOT EXISTS sales_points ("
                                     "date DATE NOT NULL, "
                                     "category VARCHAR NOT NULL, "
                                     "amount DOUBLE NOT NULL, "
                                     "PRIMARY KEY (date, category))";

// DATE minus the epoch is a day count, which is exactly core::Date's key.
constexpr const char *kSelectRange = "SELECT CAST(date - DATE '1970-01-01' AS BIGINT) AS day_key, category, amount "
                                     "FROM sales_points "
                                     "WHERE date BETWEEN ? AND ? "
                                     "ORDER BY date, category";

duckdb::Value toDuckDate(const core::Date &date) {
	const auto key = date.dayKey();
	if (key < std::numeric_limits<int32_t>::min() || key > std::numeric_limits<int32_t>::max()) {
		throw core::StorageError("Date " + date.toString() + " is outside the DuckDB DATE range.");
	}
	return duckdb::Value::DATE(duckdb::date_t(static_cast<int32_t>(key)));
}

void execute(duckdb::Connection &connection, const std::string &sql) {
	auto result = connection.Query(sql);
	if (result->HasError()) {
		throw core::StorageError(result->GetError());
	}
}

} // namespace

DuckDBHistoricalStore::DuckDBHistoricalStore(const std::string &path) : path_(path.empty() ? ":memory:" : path) {
	try {
		database_ = std::make_unique<duckdb::DuckDB>(path_);
		duckdb::Connection connection(*database_);
		execute(connection, kCreateTable);
	} catch (const core::StorageError &) {
		throw;
	} catch (const std::exception &e) {
		throw core::StorageError("Cannot open DuckDB database '" + path_ + "': " + e.what());
	}
	SALESCAST_DEBUG("Opened DuckDB historical store at {}.", path_);
}

DuckDBHistoricalStore::~DuckDBHistoricalStore() = default;

void DuckDBHistoricalStore::insert(const std::vector<core::SalesPoint> &points) {
	if (points.empty()) {
		return;
	}
	duckdb::Connection connection(*database_);
	connection.BeginTransaction();
	try {
		duckdb::Appender appender(connection, "sales_points");
		for (const auto &point : points) {
			appender.BeginRow();
			appender.Append<duckdb::Value>(toDuckDate(point.date));
			appender.Append<duckdb::Value>(duckdb::Value(point.category));
			appender.Append<duckdb::Value>(duckdb::Value::DOUBLE(point.amount));
			appender.EndRow();
		}
		appender.Close();
		connection.Commit();
	} catch (const std::exception &e) {
		if (connection.HasActiveTransaction()) {
			connection.Rollback();
		}
		throw core::StorageError(std::string("Cannot insert sales points: ") + e.what());
	}
	SALESCAST_DEBUG("Inserted {} sales points into {}.", points.size(), path_);
}

std::vector<core::DailyRecord> DuckDBHistoricalStore::getRange(const core::Period &period) const {
	if (period.end < period.start) {
		return {};
	}
	std::vector<core::SalesPoint> points;
	try {
		duckdb::Connection connection(*database_);
		auto statement = connection.Prepare(kSelectRange);
		if (statement->HasError()) {
			throw core::StorageError(statement->GetError());
		}
		duckdb::vector<duckdb::Value> parameters{toDuckDate(period.start), toDuckDate(period.end)};
		auto result = statement->Execute(parameters, false);
		if (result->HasError()) {
			throw core::StorageError(result->GetError());
		}
		auto &rows = static_cast<duckdb::MaterializedQueryResult &>(*result);
		points.reserve(rows.RowCount());
		for (duckdb::idx_t row = 0; row < rows.RowCount(); ++row) {
			points.push_back(core::SalesPoint{core::Date(rows.GetValue(0, row).GetValue<int64_t>()),
			                                  rows.GetValue(1, row).GetValue<std::string>(),
			                                  rows.GetValue(2, row).GetValue<double>()});
		}
	} catch (const core::StorageError &) {
		throw;
	} catch (const std::exception &e) {
		throw core::StorageError("Cannot read " + period.toString() + ": " + e.what());
	}

	auto records = core::groupByDate(points);
	SALESCAST_TRACE("Read {} recorded days for {}.", records.size(), period.toString());
	return records;
}

std::vector<std::string> DuckDBHistoricalStore::categories() const {
	std::vector<std::string> names;
	try {
		duckdb::Connection connection(*database_);
		auto result = connection.Query("SELECT DISTINCT category FROM sales_points ORDER BY category");
		if (result->HasError()) {
			throw core::StorageError(result->GetError());
		}
		for (duckdb::idx_t row = 0; row < result->RowCount(); ++row) {
			names.push_back(result->GetValue(0, row).GetValue<std::string>());
		}
	} catch (const core::StorageError &) {
		throw;
	} catch (const std::exception &e) {
		throw core::StorageError(std::string("Cannot list categories: ") + e.what());
	}
	return names;
}

std::optional<core::Period> DuckDBHistoricalStore::coverage() const {
	try {
		duckdb::Connection connection(*database_);
		auto result = connection.Query("SELECT CAST(MIN(date) - DATE '1970-01-01' AS BIGINT), "
		                               "CAST(MAX(date) - DATE '1970-01-01' AS BIGINT) FROM sales_points");
		if (result->HasError()) {
			throw core::StorageError(result->GetError());
		}
		const auto first = result->GetValue(0, 0);
		const auto last = result->GetValue(1, 0);
		if (first.IsNull() || last.IsNull()) {
			return std::nullopt;
		}
		return core::Period{core::Date(first.GetValue<int64_t>()), core::Date(last.GetValue<int64_t>())};
	} catch (const core::StorageError &) {
		throw;
	} catch (const std::exception &e) {
		throw core::StorageError(std::string("Cannot read store coverage: ") + e.what());
	}
}

} // namespace salescast::storage
