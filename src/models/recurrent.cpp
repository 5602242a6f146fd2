#include "stockcast/models/recurrent.hpp"

#include "stockcast/core/errors.hpp"
#include "stockcast/utils/logging.hpp"
#include "stockcast/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace stockcast::models {

LstmForecaster::LstmForecaster(LstmConfig config) : config_(config) {
	if (config_.lookback == 0) {
		throw std::invalid_argument("LSTM lookback must be positive.");
	}
}

std::size_t LstmForecaster::minimumHistory() const {
	return config_.lookback + 10;
}

void LstmForecaster::fit(const core::TimeSeries &ts) {
	if (ts.size() < minimumHistory()) {
		throw core::InsufficientHistory(getName(), minimumHistory(), ts.size());
	}

	const auto &values = ts.getValues();
	mean_ = utils::Statistics::mean(values);
	scale_ = utils::Statistics::stddev(values);
	if (!(scale_ > 0.0)) {
		scale_ = 1.0;
	}
	scaled_.resize(values.size());
	std::transform(values.begin(), values.end(), scaled_.begin(),
	               [this](double v) { return (v - mean_) / scale_; });

	const std::size_t lookback = config_.lookback;
	std::vector<std::vector<double>> windows;
	std::vector<double> targets;
	windows.reserve(scaled_.size() - lookback);
	targets.reserve(scaled_.size() - lookback);
	for (std::size_t end = lookback; end < scaled_.size(); ++end) {
		windows.emplace_back(scaled_.begin() + static_cast<std::ptrdiff_t>(end - lookback),
		                     scaled_.begin() + static_cast<std::ptrdiff_t>(end));
		targets.push_back(scaled_[end]);
	}

	ml::LstmTrainingConfig training;
	training.epochs = config_.epochs;
	training.batch_size = config_.batch_size;
	training.learning_rate = config_.learning_rate;

	network_ = std::make_unique<ml::LstmNetwork>(config_.hidden_units, config_.seed);
	STOCKCAST_DEBUG("Training LSTM on {} windows of {} steps", windows.size(), lookback);
	training_loss_ = network_->train(windows, targets, training);
	STOCKCAST_INFO("{} fitted on {} observations, final loss {:.6f}", getName(), ts.size(), training_loss_);
}

core::ForecastResult LstmForecaster::predict(int horizon, double confidence) {
	if (!network_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (horizon <= 0) {
		throw std::invalid_argument("Forecast horizon must be positive.");
	}

	std::vector<double> window(scaled_.end() - static_cast<std::ptrdiff_t>(config_.lookback), scaled_.end());
	core::ForecastResult result;
	result.model = getName();
	result.confidence_level = confidence;
	result.forecast.reserve(static_cast<std::size_t>(horizon));
	for (int h = 0; h < horizon; ++h) {
		const double next = network_->forward(window);
		if (!std::isfinite(next)) {
			throw std::runtime_error("LSTM produced a non-finite prediction.");
		}
		result.forecast.push_back(next * scale_ + mean_);
		window.erase(window.begin());
		window.push_back(next);
	}
	return result;
}

} // namespace stockcast::models
