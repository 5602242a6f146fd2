#include "stockcast/core/outcome.hpp"

#include "stockcast/core/errors.hpp"

namespace stockcast::core {

std::string errorKindName(ErrorKind kind) {
	switch (kind) {
	case ErrorKind::Validation:
		return "ValidationError";
	case ErrorKind::UnsupportedModel:
		return "UnsupportedModel";
	case ErrorKind::InsufficientHistory:
		return "InsufficientHistory";
	case ErrorKind::ModelFit:
		return "ModelFitError";
	case ErrorKind::SessionNotFound:
		return "SessionNotFound";
	case ErrorKind::Other:
		return "Error";
	}
	return "Error";
}

ErrorKind classifyError(const std::exception &error) {
	if (dynamic_cast<const UnsupportedModel *>(&error)) {
		return ErrorKind::UnsupportedModel;
	}
	if (dynamic_cast<const InsufficientHistory *>(&error)) {
		return ErrorKind::InsufficientHistory;
	}
	if (dynamic_cast<const ValidationError *>(&error)) {
		return ErrorKind::Validation;
	}
	if (dynamic_cast<const ModelFitError *>(&error)) {
		return ErrorKind::ModelFit;
	}
	if (dynamic_cast<const SessionNotFound *>(&error)) {
		return ErrorKind::SessionNotFound;
	}
	return ErrorKind::Other;
}

} // namespace stockcast::core
