#include "common/catch.hpp"

#include "salescast/gapfill/date_range_chunker.hpp"
#include "common/sales_helpers.hpp"

#include <random>
#include <set>
#include <stdexcept>
#include <vector>

using salescast::core::Date;
using salescast::core::Period;
using salescast::gapfill::chunkContiguous;
using tests::helpers::day;
using tests::helpers::period;

TEST_CASE("chunkContiguous groups consecutive dates", "[gapfill][chunker]") {
	const auto chunks = chunkContiguous({day(2024, 1, 5), day(2024, 1, 2), day(2024, 1, 3)});
	REQUIRE(chunks.size() == 2);
	REQUIRE(chunks[0] == period("2024-01-02", "2024-01-03"));
	REQUIRE(chunks[1] == period("2024-01-05", "2024-01-05"));
}

TEST_CASE("chunkContiguous edge cases", "[gapfill][chunker]") {
	REQUIRE(chunkContiguous({}).empty());

	const auto single = chunkContiguous({day(2024, 2, 29)});
	REQUIRE(single.size() == 1);
	REQUIRE(single[0].days() == 1);

	const auto duplicated = chunkContiguous({day(2024, 1, 1), day(2024, 1, 1), day(2024, 1, 2)});
	REQUIRE(duplicated.size() == 1);
	REQUIRE(duplicated[0] == period("2024-01-01", "2024-01-02"));

	REQUIRE_THROWS_AS(chunkContiguous({day(2024, 1, 1)}, -1), std::invalid_argument);
}

TEST_CASE("chunkContiguous splits long runs", "[gapfill][chunker]") {
	const auto chunks = chunkContiguous(period("2024-01-01", "2024-01-10").dates(), 4);
	REQUIRE(chunks.size() == 3);
	REQUIRE(chunks[0] == period("2024-01-01", "2024-01-04"));
	REQUIRE(chunks[1] == period("2024-01-05", "2024-01-08"));
	REQUIRE(chunks[2] == period("2024-01-09", "2024-01-10"));
}

TEST_CASE("chunkContiguous partitions its input", "[gapfill][chunker][property]") {
	std::mt19937 rng(42);
	std::uniform_int_distribution<int> offset(0, 90);
	std::uniform_int_distribution<int> cap(0, 6);
	const Date origin = day(2024, 1, 1);

	for (int trial = 0; trial < 50; ++trial) {
		std::vector<Date> input;
		std::set<Date> expected;
		for (int i = 0; i < 40; ++i) {
			const auto date = origin.addDays(offset(rng));
			input.push_back(date);
			expected.insert(date);
		}
		const int max_days = cap(rng);
		const auto chunks = chunkContiguous(input, max_days);

		std::set<Date> covered;
		for (std::size_t i = 0; i < chunks.size(); ++i) {
			const auto &chunk = chunks[i];
			REQUIRE(chunk.start <= chunk.end);
			if (max_days > 0) {
				REQUIRE(chunk.days() <= max_days);
			}
			if (i > 0) {
				REQUIRE(chunks[i - 1].end < chunk.start);
			}
			for (const auto &date : chunk.dates()) {
				// Every date of a chunk came from the input, and no date is covered twice.
				REQUIRE(expected.count(date) == 1);
				REQUIRE(covered.insert(date).second);
			}
		}
		REQUIRE(covered == expected);
	}
}

TEST_CASE("missingDates lists the uncovered days", "[gapfill][chunker]") {
	const auto missing = salescast::gapfill::missingDates(period("2024-01-01", "2024-01-05"),
	                                                      {day(2024, 1, 2), day(2024, 1, 4), day(2024, 2, 1)});
	REQUIRE(missing == std::vector<Date>{day(2024, 1, 1), day(2024, 1, 3), day(2024, 1, 5)});
}
