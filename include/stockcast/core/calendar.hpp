#pragma once

#include <chrono>
#include <string>

namespace stockcast::core {

using TimePoint = std::chrono::system_clock::time_point;

/// Proleptic Gregorian calendar date.
struct CivilDate {
	int year = 1970;
	int month = 1;
	int day = 1;
};

/**
 * @brief Calendar arithmetic on UTC day boundaries.
 *
 * All dates handled by the library are midnight UTC time points; these
 * helpers convert between them and civil dates without going through the
 * C locale functions.
 */
class Calendar final {
public:
	static long long daysFromCivil(int year, int month, int day);
	static CivilDate civilFromDays(long long days);

	static TimePoint makeDate(int year, int month, int day);
	static TimePoint fromDayNumber(long long days);
	static long long dayNumber(TimePoint tp);
	static CivilDate toCivil(TimePoint tp);
	static TimePoint floorToDay(TimePoint tp);

	static bool isValidDate(int year, int month, int day);
	static int daysInMonth(int year, int month);

	/// Day of week with Monday = 0 ... Sunday = 6.
	static int dayOfWeek(TimePoint tp);
	/// ISO-8601 week number (1..53).
	static int isoWeek(TimePoint tp);
	static int quarter(TimePoint tp);
	static bool isWeekend(TimePoint tp);

	static TimePoint addDays(TimePoint tp, long long days);
	/// Adds calendar months, clamping the day to the target month's length.
	static TimePoint addMonths(TimePoint tp, int months);

	/// Formats as YYYY-MM-DD.
	static std::string format(TimePoint tp);
};

} // namespace stockcast::core
