#pragma once

#include "stockcast/ml/lstm_network.hpp"
#include "stockcast/models/iforecaster.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace stockcast::models {

struct LstmConfig {
	int hidden_units = 16;
	std::size_t lookback = 30;
	int epochs = 20;
	std::size_t batch_size = 32;
	double learning_rate = 0.01;
	std::uint32_t seed = 42;
};

/**
 * @class LstmForecaster
 * @brief Sequence model over standardized demand windows.
 *
 * Trains on every (lookback window, next value) pair of the history and
 * forecasts autoregressively by feeding each prediction back into the window.
 * Produces no interval of its own.
 */
class LstmForecaster final : public IForecaster {
public:
	explicit LstmForecaster(LstmConfig config = LstmConfig{});

	void fit(const core::TimeSeries &ts) override;
	core::ForecastResult predict(int horizon, double confidence) override;
	std::size_t minimumHistory() const override;

	bool hasNativeInterval() const override {
		return false;
	}

	std::string getName() const override {
		return "LSTM";
	}

	double trainingLoss() const {
		return training_loss_;
	}

private:
	LstmConfig config_;
	std::unique_ptr<ml::LstmNetwork> network_;
	std::vector<double> scaled_;
	double mean_ = 0.0;
	double scale_ = 1.0;
	double training_loss_ = 0.0;
};

} // namespace stockcast::models
