#pragma once

#include "salescast/core/period.hpp"
#include "salescast/core/sales_record.hpp"

#include <optional>
#include <string>
#include <vector>

namespace salescast::storage {

/**
 * @class IHistoricalStore
 * @brief Read access to recorded daily sales.
 */
class IHistoricalStore {
public:
	virtual ~IHistoricalStore() = default;

	/**
	 * @brief Recorded rows dated within @p period.
	 * @return Rows in ascending date order with no repeated date. Dates without
	 *         recorded sales are simply absent.
	 */
	virtual std::vector<core::DailyRecord> getRange(const core::Period &period) const = 0;

	/// Every category with at least one recorded amount, sorted by name.
	virtual std::vector<std::string> categories() const = 0;

	/// First and last recorded dates, if anything is recorded.
	virtual std::optional<core::Period> coverage() const = 0;
};

} // namespace salescast::storage
