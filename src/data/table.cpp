#include "stockcast/data/table.hpp"

#include "stockcast/core/errors.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace stockcast::data {

namespace {

std::string trim(const std::string &text) {
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

} // namespace

bool isEmptyCell(const Cell &cell) {
	if (std::holds_alternative<std::monostate>(cell)) {
		return true;
	}
	if (const auto *number = std::get_if<double>(&cell)) {
		return std::isnan(*number);
	}
	if (const auto *text = std::get_if<std::string>(&cell)) {
		return trim(*text).empty();
	}
	return false;
}

std::optional<double> cellToNumber(const Cell &cell) {
	if (const auto *number = std::get_if<double>(&cell)) {
		if (std::isfinite(*number)) {
			return *number;
		}
		return std::nullopt;
	}
	if (const auto *text = std::get_if<std::string>(&cell)) {
		const std::string trimmed = trim(*text);
		if (trimmed.empty()) {
			return std::nullopt;
		}
		errno = 0;
		char *end = nullptr;
		const double value = std::strtod(trimmed.c_str(), &end);
		if (errno != 0 || end != trimmed.c_str() + trimmed.size() || !std::isfinite(value)) {
			return std::nullopt;
		}
		return value;
	}
	return std::nullopt;
}

std::string cellText(const Cell &cell) {
	if (const auto *text = std::get_if<std::string>(&cell)) {
		return trim(*text);
	}
	return {};
}

void Table::addColumn(std::string name, std::vector<Cell> cells) {
	if (findColumn(name) != nullptr) {
		throw core::ValidationError(name, "Duplicate column name '" + name + "'.");
	}
	if (!columns_.empty() && cells.size() != rowCount()) {
		throw core::ValidationError(name, "Column '" + name + "' has " + std::to_string(cells.size()) +
		                                      " rows, expected " + std::to_string(rowCount()) + ".");
	}
	columns_.push_back(Column{std::move(name), std::move(cells)});
}

const Column *Table::findColumn(const std::string &name) const {
	for (const auto &column : columns_) {
		if (column.name == name) {
			return &column;
		}
	}
	return nullptr;
}

} // namespace stockcast::data
