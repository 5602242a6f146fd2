#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace stockcast::core {

/// Raised for malformed input: missing or unparseable columns, bad parameters.
class ValidationError : public std::invalid_argument {
public:
	ValidationError(std::string field, const std::string &message)
	    : std::invalid_argument(message), field_(std::move(field)) {
	}

	/// Column or parameter that failed validation.
	const std::string &field() const noexcept {
		return field_;
	}

private:
	std::string field_;
};

/// Raised when a model identifier is not one of the registered strategies.
class UnsupportedModel : public std::invalid_argument {
public:
	explicit UnsupportedModel(std::string model_id)
	    : std::invalid_argument("Unsupported model '" + model_id + "'."), model_id_(std::move(model_id)) {
	}

	const std::string &modelId() const noexcept {
		return model_id_;
	}

private:
	std::string model_id_;
};

/// Raised when a series is too short for the requested strategy.
class InsufficientHistory : public std::invalid_argument {
public:
	InsufficientHistory(std::string model_id, std::size_t required, std::size_t available)
	    : std::invalid_argument(model_id + " needs at least " + std::to_string(required) +
	                            " observations, got " + std::to_string(available) + "."),
	      model_id_(std::move(model_id)), required_(required), available_(available) {
	}

	const std::string &modelId() const noexcept {
		return model_id_;
	}
	std::size_t required() const noexcept {
		return required_;
	}
	std::size_t available() const noexcept {
		return available_;
	}

private:
	std::string model_id_;
	std::size_t required_;
	std::size_t available_;
};

/// Raised when a strategy fails numerically while fitting or predicting.
class ModelFitError : public std::runtime_error {
public:
	ModelFitError(std::string model_id, const std::string &cause)
	    : std::runtime_error(model_id + " failed: " + cause), model_id_(std::move(model_id)) {
	}

	const std::string &modelId() const noexcept {
		return model_id_;
	}

private:
	std::string model_id_;
};

/// Raised when a session key is not (or no longer) present in a session store.
class SessionNotFound : public std::out_of_range {
public:
	explicit SessionNotFound(std::string key)
	    : std::out_of_range("No session with key '" + key + "'."), key_(std::move(key)) {
	}

	const std::string &key() const noexcept {
		return key_;
	}

private:
	std::string key_;
};

} // namespace stockcast::core
