#include "stockcast/core/calendar.hpp"

#include <algorithm>
#include <cstdio>

namespace stockcast::core {

namespace {

constexpr long long kSecondsPerDay = 86400;

long long floorDiv(long long a, long long b) {
	long long q = a / b;
	if ((a % b != 0) && ((a < 0) != (b < 0))) {
		--q;
	}
	return q;
}

} // namespace

// Howard Hinnant's days_from_civil / civil_from_days.
long long Calendar::daysFromCivil(int year, int month, int day) {
	const long long y = static_cast<long long>(year) - (month <= 2 ? 1 : 0);
	const long long era = floorDiv(y, 400);
	const long long yoe = y - era * 400;
	const long long mp = (month + 9) % 12;
	const long long doy = (153 * mp + 2) / 5 + day - 1;
	const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + doe - 719468;
}

CivilDate Calendar::civilFromDays(long long days) {
	const long long z = days + 719468;
	const long long era = floorDiv(z, 146097);
	const long long doe = z - era * 146097;
	const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const long long mp = (5 * doy + 2) / 153;
	const long long d = doy - (153 * mp + 2) / 5 + 1;
	const long long m = mp < 10 ? mp + 3 : mp - 9;
	const long long y = yoe + era * 400 + (m <= 2 ? 1 : 0);
	return CivilDate{static_cast<int>(y), static_cast<int>(m), static_cast<int>(d)};
}

TimePoint Calendar::makeDate(int year, int month, int day) {
	return fromDayNumber(daysFromCivil(year, month, day));
}

TimePoint Calendar::fromDayNumber(long long days) {
	return TimePoint{} + std::chrono::seconds(days * kSecondsPerDay);
}

long long Calendar::dayNumber(TimePoint tp) {
	const auto secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
	return floorDiv(static_cast<long long>(secs), kSecondsPerDay);
}

CivilDate Calendar::toCivil(TimePoint tp) {
	return civilFromDays(dayNumber(tp));
}

TimePoint Calendar::floorToDay(TimePoint tp) {
	return fromDayNumber(dayNumber(tp));
}

bool Calendar::isValidDate(int year, int month, int day) {
	if (month < 1 || month > 12 || day < 1) {
		return false;
	}
	return day <= daysInMonth(year, month);
}

int Calendar::daysInMonth(int year, int month) {
	static const int lengths[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month == 2) {
		const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
		return leap ? 29 : 28;
	}
	return lengths[month - 1];
}

int Calendar::dayOfWeek(TimePoint tp) {
	// 1970-01-01 was a Thursday.
	const long long days = dayNumber(tp);
	return static_cast<int>(((days + 3) % 7 + 7) % 7);
}

int Calendar::isoWeek(TimePoint tp) {
	const long long days = dayNumber(tp);
	const long long thursday = days - dayOfWeek(tp) + 3;
	const int iso_year = civilFromDays(thursday).year;
	return static_cast<int>((thursday - daysFromCivil(iso_year, 1, 1)) / 7 + 1);
}

int Calendar::quarter(TimePoint tp) {
	return (toCivil(tp).month - 1) / 3 + 1;
}

bool Calendar::isWeekend(TimePoint tp) {
	return dayOfWeek(tp) >= 5;
}

TimePoint Calendar::addDays(TimePoint tp, long long days) {
	return tp + std::chrono::seconds(days * kSecondsPerDay);
}

TimePoint Calendar::addMonths(TimePoint tp, int months) {
	const CivilDate date = toCivil(tp);
	const long long total = static_cast<long long>(date.year) * 12 + (date.month - 1) + months;
	const int year = static_cast<int>(floorDiv(total, 12));
	const int month = static_cast<int>(total - static_cast<long long>(year) * 12) + 1;
	const int day = std::min(date.day, daysInMonth(year, month));
	return makeDate(year, month, day);
}

std::string Calendar::format(TimePoint tp) {
	const CivilDate date = toCivil(tp);
	char buffer[16];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", date.year, date.month, date.day);
	return buffer;
}

} // namespace stockcast::core
