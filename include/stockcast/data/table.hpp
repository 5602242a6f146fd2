#pragma once

#include "stockcast/core/calendar.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace stockcast::data {

/// One cell of raw tabular input: empty, numeric, text or an already typed date.
using Cell = std::variant<std::monostate, double, std::string, core::TimePoint>;

struct Column {
	std::string name;
	std::vector<Cell> cells;
};

bool isEmptyCell(const Cell &cell);

/// Numeric value of a cell; text is parsed when it is entirely a number.
std::optional<double> cellToNumber(const Cell &cell);

/// Trimmed text of a string cell; empty for other kinds.
std::string cellText(const Cell &cell);

/**
 * @class Table
 * @brief Column-oriented raw input as handed over by an upload decoder.
 */
class Table {
public:
	Table() = default;

	/// Appends a column. Names must be unique and every column the same length.
	void addColumn(std::string name, std::vector<Cell> cells);

	const std::vector<Column> &columns() const {
		return columns_;
	}

	std::size_t rowCount() const {
		return columns_.empty() ? 0 : columns_.front().cells.size();
	}

	std::size_t columnCount() const {
		return columns_.size();
	}

	bool isEmpty() const {
		return rowCount() == 0;
	}

	/// Column by exact name, or nullptr.
	const Column *findColumn(const std::string &name) const;

private:
	std::vector<Column> columns_;
};

} // namespace stockcast::data
