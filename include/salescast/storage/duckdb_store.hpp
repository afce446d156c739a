#pragma once

#include "salescast/storage/historical_store.hpp"

#include <memory>
#include <string>

namespace duckdb {
class DuckDB;
} // namespace duckdb

namespace salescast::storage {

/**
 * @class DuckDBHistoricalStore
 * @brief A historical store backed by a DuckDB database.
 *
 * Sales live in a single long table:
 * `sales_points(date DATE, category VARCHAR, amount DOUBLE, PRIMARY KEY (date, category))`.
 * The table is created on open if it does not exist. Every call opens its own
 * connection, so one store may be read from several threads.
 */
class DuckDBHistoricalStore final : public IHistoricalStore {
public:
	/**
	 * @brief Opens (or creates) the database at @p path; ":memory:" or an empty path keeps it in memory.
	 * @throws core::StorageError If the database cannot be opened or the schema created.
	 */
	explicit DuckDBHistoricalStore(const std::string &path);
	~DuckDBHistoricalStore() override;

	DuckDBHistoricalStore(const DuckDBHistoricalStore &) = delete;
	DuckDBHistoricalStore &operator=(const DuckDBHistoricalStore &) = delete;

	/**
	 * @brief Appends points in a single transaction.
	 * @throws core::StorageError If any row violates the key or the write fails; nothing is kept then.
	 */
	void insert(const std::vector<core::SalesPoint> &points);

	std::vector<core::DailyRecord> getRange(const core::Period &period) const override;
	std::vector<std::string> categories() const override;
	std::optional<core::Period> coverage() const override;

	const std::string &path() const {
		return path_;
	}

private:
	std::string path_;
	std::unique_ptr<duckdb::DuckDB> database_;
};

} // namespace salescast::storage
