#include "stockcast/models/ensemble.hpp"

#include "stockcast/core/errors.hpp"
#include "stockcast/utils/logging.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace stockcast::models {

Ensemble::Ensemble(std::vector<MemberFactory> members) : factories_(std::move(members)) {
	if (factories_.empty()) {
		throw std::invalid_argument("Ensemble requires at least one member.");
	}
}

void Ensemble::fit(const core::TimeSeries &ts) {
	fitted_.clear();
	std::string last_error;
	for (const auto &factory : factories_) {
		auto member = factory();
		try {
			member->fit(ts);
			fitted_.push_back(std::move(member));
		} catch (const std::exception &e) {
			last_error = e.what();
			STOCKCAST_WARN("Ensemble member {} skipped: {}", member->getName(), e.what());
		}
	}
	if (fitted_.empty()) {
		throw core::ModelFitError("ensemble", "every member failed; last error: " + last_error);
	}
	STOCKCAST_INFO("Ensemble fitted with {} of {} members", fitted_.size(), factories_.size());
}

std::size_t Ensemble::minimumHistory() const {
	std::size_t required = factories_.front()()->minimumHistory();
	for (std::size_t i = 1; i < factories_.size(); ++i) {
		required = std::min(required, factories_[i]()->minimumHistory());
	}
	return required;
}

core::ForecastResult Ensemble::predict(int horizon, double confidence) {
	if (fitted_.empty()) {
		throw std::runtime_error("Predict called before fit.");
	}
	const auto steps = static_cast<std::size_t>(horizon);

	std::vector<core::ForecastResult> outputs;
	std::string last_error;
	for (const auto &member : fitted_) {
		try {
			auto output = member->predict(horizon, confidence);
			if (output.forecast.size() != steps) {
				throw std::runtime_error("returned " + std::to_string(output.forecast.size()) + " steps");
			}
			if (!output.hasInterval()) {
				output.lower = output.forecast;
				output.upper = output.forecast;
			}
			output.model = member->getName();
			outputs.push_back(std::move(output));
		} catch (const std::exception &e) {
			last_error = e.what();
			STOCKCAST_WARN("Ensemble member {} skipped at prediction: {}", member->getName(), e.what());
		}
	}
	if (outputs.empty()) {
		throw core::ModelFitError("ensemble", "every member failed to predict; last error: " + last_error);
	}

	core::ForecastResult result;
	result.model = getName();
	result.confidence_level = confidence;
	result.forecast.assign(steps, 0.0);
	result.lower = outputs.front().lower;
	result.upper = outputs.front().upper;
	for (const auto &output : outputs) {
		result.components.push_back(output.model);
		for (std::size_t h = 0; h < steps; ++h) {
			result.forecast[h] += output.forecast[h];
			result.lower[h] = std::min(result.lower[h], output.lower[h]);
			result.upper[h] = std::max(result.upper[h], output.upper[h]);
		}
	}
	for (auto &value : result.forecast) {
		value /= static_cast<double>(outputs.size());
	}
	return result;
}

std::vector<std::string> Ensemble::activeMembers() const {
	std::vector<std::string> names;
	names.reserve(fitted_.size());
	for (const auto &member : fitted_) {
		names.push_back(member->getName());
	}
	return names;
}

} // namespace stockcast::models
