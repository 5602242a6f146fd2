#pragma once

#include "stockcast/core/calendar.hpp"
#include "stockcast/data/table.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace stockcast::data {

enum class DateStrategy { Default, DayFirst, ExplicitFormat, SpreadsheetSerial };

std::string dateStrategyName(DateStrategy strategy);

struct DateParseResult {
	std::vector<std::optional<core::TimePoint>> dates;
	DateStrategy strategy = DateStrategy::Default;
	/// Format string when strategy is ExplicitFormat.
	std::string format;
	double success_rate = 0.0;

	std::size_t parsedCount() const;
};

/**
 * @class DateParser
 * @brief Parses a column of mixed date representations with the best-performing strategy.
 *
 * Candidate strategies are, in order: month-first free parsing, day-first
 * free parsing, each explicit format on its own, and spreadsheet serial day
 * numbers. The first candidate with the highest success rate wins.
 */
class DateParser {
public:
	/// Explicit formats tried one by one. Directives: %Y %m %d %b.
	static const std::vector<std::string> &explicitFormats();

	/// Parses @p text with @p format. Trailing time of day is accepted only when @p allow_time is set.
	static std::optional<core::TimePoint> parseWithFormat(const std::string &text, const std::string &format,
	                                                      bool allow_time = false);

	static std::optional<core::TimePoint> parseDefault(const std::string &text);
	static std::optional<core::TimePoint> parseDayFirst(const std::string &text);

	/// Day count from 1899-12-30, as spreadsheets store dates; empty outside [20000, 60000].
	static std::optional<core::TimePoint> fromSerial(double serial);

	/// True when more than half of the cells are numbers in [20000, 60000].
	static bool looksLikeSerialColumn(const std::vector<Cell> &cells);

	static DateParseResult parseColumn(const std::vector<Cell> &cells);

	/// 0.8 for columns of 30 rows or more, 0.5 below.
	static double requiredSuccessRate(std::size_t rows);

	/// parseColumn() that throws ValidationError naming @p column when success is too low.
	static DateParseResult parseColumnOrThrow(const Column &column);
};

} // namespace stockcast::data
