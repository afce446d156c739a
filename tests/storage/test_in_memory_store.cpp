#include "common/catch.hpp"

#include "salescast/storage/in_memory_store.hpp"
#include "common/sales_helpers.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using salescast::core::SalesPoint;
using salescast::storage::InMemoryHistoricalStore;
using tests::helpers::dailyPoints;
using tests::helpers::day;
using tests::helpers::period;

TEST_CASE("InMemoryHistoricalStore returns ordered rows within a range", "[storage][memory]") {
	auto points = dailyPoints("Toys", "2024-01-03", {3.0, 4.0});
	tests::helpers::append(points, dailyPoints("Books", "2024-01-01", {1.0, 2.0, 3.0, 4.0, 5.0}));
	InMemoryHistoricalStore store(points);

	const auto rows = store.getRange(period("2024-01-02", "2024-01-04"));
	REQUIRE(rows.size() == 3);
	REQUIRE(rows[0].date == day(2024, 1, 2));
	REQUIRE(rows[2].date == day(2024, 1, 4));
	REQUIRE(rows[1].amountOr("Toys") == 3.0);
	REQUIRE(rows[1].amountOr("Books") == 3.0);

	REQUIRE(store.categories() == std::vector<std::string>{"Books", "Toys"});
	REQUIRE(*store.coverage() == period("2024-01-01", "2024-01-05"));
	REQUIRE(store.getRange(period("2023-01-01", "2023-12-31")).empty());
	REQUIRE(store.getRange(period("2024-01-04", "2024-01-02")).empty());
}

TEST_CASE("InMemoryHistoricalStore rejects duplicate keys", "[storage][memory]") {
	InMemoryHistoricalStore store(dailyPoints("Books", "2024-01-01", {1.0}));
	REQUIRE_THROWS_AS(store.insert({SalesPoint{day(2024, 1, 1), "Books", 2.0}}), std::invalid_argument);
	REQUIRE_NOTHROW(store.insert({SalesPoint{day(2024, 1, 1), "Toys", 2.0}}));
}

TEST_CASE("InMemoryHistoricalStore rejects a batch as a whole", "[storage][memory]") {
	InMemoryHistoricalStore store(dailyPoints("Books", "2024-01-01", {1.0}));

	std::vector<SalesPoint> clashing{SalesPoint{day(2024, 1, 2), "Books", 2.0},
	                                 SalesPoint{day(2024, 1, 1), "Books", 3.0}};
	REQUIRE_THROWS_AS(store.insert(clashing), std::invalid_argument);

	std::vector<SalesPoint> repeated{SalesPoint{day(2024, 1, 3), "Toys", 1.0},
	                                 SalesPoint{day(2024, 1, 3), "Toys", 4.0}};
	REQUIRE_THROWS_AS(store.insert(repeated), std::invalid_argument);

	const auto rows = store.getRange(period("2024-01-01", "2024-01-31"));
	REQUIRE(rows.size() == 1);
	REQUIRE(rows[0].amountOr("Books") == 1.0);
	REQUIRE(store.categories() == std::vector<std::string>{"Books"});
}

TEST_CASE("An empty store has no coverage", "[storage][memory]") {
	InMemoryHistoricalStore store;
	REQUIRE_FALSE(store.coverage().has_value());
	REQUIRE(store.categories().empty());
}
