#include "stockcast/data/date_parser.hpp"

#include "stockcast/core/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <functional>
#include <sstream>

namespace stockcast::data {

namespace {

const std::vector<std::string> kDefaultFormats = {"%Y-%m-%d", "%Y/%m/%d", "%Y.%m.%d", "%m/%d/%Y", "%m-%d-%Y",
                                                  "%m.%d.%Y", "%d/%m/%Y", "%d-%m-%Y", "%d.%m.%Y", "%d %b %Y",
                                                  "%b %d %Y", "%b %d, %Y", "%Y-%m",    "%b %Y"};

const std::vector<std::string> kDayFirstFormats = {"%Y-%m-%d", "%Y/%m/%d", "%Y.%m.%d", "%d/%m/%Y", "%d-%m-%Y",
                                                   "%d.%m.%Y", "%m/%d/%Y", "%m-%d-%Y", "%m.%d.%Y", "%d %b %Y",
                                                   "%b %d %Y", "%b %d, %Y", "%Y-%m",    "%b %Y"};

constexpr double kSerialMin = 20000.0;
constexpr double kSerialMax = 60000.0;

int monthFromName(const std::string &name) {
	static const std::array<const char *, 12> names = {"jan", "feb", "mar", "apr", "may", "jun",
	                                                   "jul", "aug", "sep", "oct", "nov", "dec"};
	if (name.size() < 3) {
		return 0;
	}
	std::string lower;
	for (char c : name) {
		lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
	}
	for (std::size_t i = 0; i < names.size(); ++i) {
		if (lower.compare(0, 3, names[i]) == 0) {
			return static_cast<int>(i) + 1;
		}
	}
	return 0;
}

bool readDigits(const std::string &text, std::size_t &pos, std::size_t min_len, std::size_t max_len, int &out) {
	std::size_t len = 0;
	int value = 0;
	while (pos + len < text.size() && len < max_len && std::isdigit(static_cast<unsigned char>(text[pos + len]))) {
		value = value * 10 + (text[pos + len] - '0');
		++len;
	}
	if (len < min_len) {
		return false;
	}
	pos += len;
	out = value;
	return true;
}

// Accepts " HH:MM[:SS[.fff]][Z]" or "THH:MM..." after the date part.
bool isTimeSuffix(const std::string &rest) {
	if (rest.empty()) {
		return true;
	}
	if (rest[0] != ' ' && rest[0] != 'T') {
		return false;
	}
	std::size_t pos = 1;
	int hour = 0;
	int minute = 0;
	if (!readDigits(rest, pos, 1, 2, hour) || pos >= rest.size() || rest[pos] != ':') {
		return false;
	}
	++pos;
	if (!readDigits(rest, pos, 2, 2, minute) || hour > 23 || minute > 59) {
		return false;
	}
	for (; pos < rest.size(); ++pos) {
		const char c = rest[pos];
		if (!std::isdigit(static_cast<unsigned char>(c)) && c != ':' && c != '.' && c != 'Z' && c != '+' &&
		    c != '-') {
			return false;
		}
	}
	return true;
}

std::string trimCopy(const std::string &text) {
	std::size_t begin = 0;
	std::size_t end = text.size();
	while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
		++begin;
	}
	while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
		--end;
	}
	return text.substr(begin, end - begin);
}

std::optional<core::TimePoint> parseAny(const std::string &text, const std::vector<std::string> &formats) {
	for (const auto &format : formats) {
		if (auto parsed = DateParser::parseWithFormat(text, format, true)) {
			return parsed;
		}
	}
	return std::nullopt;
}

using TextParser = std::function<std::optional<core::TimePoint>(const std::string &)>;

DateParseResult runTextStrategy(const std::vector<Cell> &cells, DateStrategy strategy, const std::string &format,
                                const TextParser &parser) {
	DateParseResult result;
	result.strategy = strategy;
	result.format = format;
	result.dates.reserve(cells.size());
	for (const auto &cell : cells) {
		if (const auto *tp = std::get_if<core::TimePoint>(&cell)) {
			result.dates.emplace_back(core::Calendar::floorToDay(*tp));
		} else if (std::holds_alternative<std::string>(cell)) {
			result.dates.push_back(parser(cellText(cell)));
		} else {
			result.dates.emplace_back(std::nullopt);
		}
	}
	return result;
}

DateParseResult runSerialStrategy(const std::vector<Cell> &cells) {
	DateParseResult result;
	result.strategy = DateStrategy::SpreadsheetSerial;
	result.dates.reserve(cells.size());
	for (const auto &cell : cells) {
		const auto number = cellToNumber(cell);
		result.dates.emplace_back(number ? DateParser::fromSerial(*number) : std::nullopt);
	}
	return result;
}

} // namespace

std::string dateStrategyName(DateStrategy strategy) {
	switch (strategy) {
	case DateStrategy::Default:
		return "default";
	case DateStrategy::DayFirst:
		return "dayfirst";
	case DateStrategy::ExplicitFormat:
		return "format";
	case DateStrategy::SpreadsheetSerial:
		return "spreadsheet-serial";
	}
	return "default";
}

std::size_t DateParseResult::parsedCount() const {
	std::size_t count = 0;
	for (const auto &date : dates) {
		if (date) {
			++count;
		}
	}
	return count;
}

const std::vector<std::string> &DateParser::explicitFormats() {
	static const std::vector<std::string> formats = {"%Y-%m-%d", "%d-%m-%Y", "%m-%d-%Y",
	                                                 "%d/%m/%Y", "%m/%d/%Y", "%Y/%m/%d"};
	return formats;
}

std::optional<core::TimePoint> DateParser::parseWithFormat(const std::string &text, const std::string &format,
                                                           bool allow_time) {
	int year = -1;
	int month = -1;
	int day = 1;
	std::size_t pos = 0;

	for (std::size_t f = 0; f < format.size(); ++f) {
		if (format[f] == '%' && f + 1 < format.size()) {
			const char directive = format[++f];
			switch (directive) {
			case 'Y':
				if (!readDigits(text, pos, 4, 4, year)) {
					return std::nullopt;
				}
				break;
			case 'm':
				if (!readDigits(text, pos, 1, 2, month)) {
					return std::nullopt;
				}
				break;
			case 'd':
				if (!readDigits(text, pos, 1, 2, day)) {
					return std::nullopt;
				}
				break;
			case 'b': {
				std::size_t len = 0;
				while (pos + len < text.size() && std::isalpha(static_cast<unsigned char>(text[pos + len]))) {
					++len;
				}
				month = monthFromName(text.substr(pos, len));
				if (month == 0) {
					return std::nullopt;
				}
				pos += len;
				break;
			}
			default:
				return std::nullopt;
			}
		} else {
			if (pos >= text.size() || text[pos] != format[f]) {
				return std::nullopt;
			}
			++pos;
		}
	}

	const std::string rest = text.substr(pos);
	if (!rest.empty() && !(allow_time && isTimeSuffix(rest))) {
		return std::nullopt;
	}
	if (year < 0 || month < 0 || !core::Calendar::isValidDate(year, month, day)) {
		return std::nullopt;
	}
	return core::Calendar::makeDate(year, month, day);
}

std::optional<core::TimePoint> DateParser::parseDefault(const std::string &text) {
	return parseAny(text, kDefaultFormats);
}

std::optional<core::TimePoint> DateParser::parseDayFirst(const std::string &text) {
	return parseAny(text, kDayFirstFormats);
}

std::optional<core::TimePoint> DateParser::fromSerial(double serial) {
	if (!std::isfinite(serial) || serial < kSerialMin || serial > kSerialMax) {
		return std::nullopt;
	}
	static const long long base = core::Calendar::daysFromCivil(1899, 12, 30);
	return core::Calendar::fromDayNumber(base + static_cast<long long>(std::floor(serial)));
}

bool DateParser::looksLikeSerialColumn(const std::vector<Cell> &cells) {
	if (cells.empty()) {
		return false;
	}
	std::size_t in_range = 0;
	for (const auto &cell : cells) {
		const auto number = cellToNumber(cell);
		if (number && *number >= kSerialMin && *number <= kSerialMax) {
			++in_range;
		}
	}
	return static_cast<double>(in_range) / static_cast<double>(cells.size()) > 0.5;
}

DateParseResult DateParser::parseColumn(const std::vector<Cell> &cells) {
	std::vector<DateParseResult> candidates;
	candidates.push_back(runTextStrategy(cells, DateStrategy::Default, "", parseDefault));
	candidates.push_back(runTextStrategy(cells, DateStrategy::DayFirst, "", parseDayFirst));
	for (const auto &format : explicitFormats()) {
		candidates.push_back(runTextStrategy(cells, DateStrategy::ExplicitFormat, format,
		                                     [&format](const std::string &text) {
			                                     return parseWithFormat(text, format, false);
		                                     }));
	}
	if (looksLikeSerialColumn(cells)) {
		candidates.push_back(runSerialStrategy(cells));
	}

	const double rows = static_cast<double>(std::max<std::size_t>(cells.size(), 1));
	std::size_t best = 0;
	for (std::size_t i = 0; i < candidates.size(); ++i) {
		candidates[i].success_rate = static_cast<double>(candidates[i].parsedCount()) / rows;
		if (candidates[i].success_rate > candidates[best].success_rate) {
			best = i;
		}
	}
	return std::move(candidates[best]);
}

double DateParser::requiredSuccessRate(std::size_t rows) {
	return rows >= 30 ? 0.8 : 0.5;
}

DateParseResult DateParser::parseColumnOrThrow(const Column &column) {
	DateParseResult result = parseColumn(column.cells);
	const double required = requiredSuccessRate(column.cells.size());
	if (column.cells.empty() || result.success_rate < required) {
		std::ostringstream message;
		message << "Too many rows failed date conversion in column '" << column.name << "' ("
		        << static_cast<int>(std::round(result.success_rate * 100.0)) << "% parsed, "
		        << static_cast<int>(required * 100.0)
		        << "% required). Reformat the dates (e.g. YYYY-MM-DD) or choose another column.";
		throw core::ValidationError(column.name, message.str());
	}
	return result;
}

} // namespace stockcast::data
