#pragma once

#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace stockcast::core {

enum class ErrorKind { Validation, UnsupportedModel, InsufficientHistory, ModelFit, SessionNotFound, Other };

std::string errorKindName(ErrorKind kind);

/// Maps an exception onto the library's error taxonomy.
ErrorKind classifyError(const std::exception &error);

struct ItemError {
	ErrorKind kind = ErrorKind::Other;
	std::string message;
};

/**
 * @brief Result slot of one unit of work in a fan-out: a value or the error that replaced it.
 */
template <typename T>
struct Outcome {
	std::optional<T> value;
	std::optional<ItemError> error;

	bool ok() const {
		return value.has_value();
	}

	static Outcome success(T result) {
		Outcome outcome;
		outcome.value = std::move(result);
		return outcome;
	}

	static Outcome failure(ErrorKind kind, std::string message) {
		Outcome outcome;
		outcome.error = ItemError{kind, std::move(message)};
		return outcome;
	}
};

} // namespace stockcast::core
