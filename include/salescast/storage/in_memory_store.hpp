#pragma once

#include "salescast/storage/historical_store.hpp"

#include <map>

namespace salescast::storage {

/**
 * @class InMemoryHistoricalStore
 * @brief A historical store held entirely in memory.
 */
class InMemoryHistoricalStore final : public IHistoricalStore {
public:
	InMemoryHistoricalStore() = default;

	/**
	 * @throws std::invalid_argument If a (date, category) pair appears twice.
	 */
	explicit InMemoryHistoricalStore(const std::vector<core::SalesPoint> &points);

	/**
	 * @brief Adds points to the store, all or none.
	 * @throws std::invalid_argument If a (date, category) pair is already held or repeated in @p points.
	 */
	void insert(const std::vector<core::SalesPoint> &points);

	std::vector<core::DailyRecord> getRange(const core::Period &period) const override;
	std::vector<std::string> categories() const override;
	std::optional<core::Period> coverage() const override;

private:
	std::map<core::Date, core::CategoryAmounts> rows_;
};

} // namespace salescast::storage
