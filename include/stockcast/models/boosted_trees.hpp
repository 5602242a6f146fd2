#pragma once

#include "stockcast/data/features.hpp"
#include "stockcast/ml/gradient_boosting.hpp"
#include "stockcast/models/iforecaster.hpp"

#include <vector>

namespace stockcast::models {

/**
 * @class BoostedTreesForecaster
 * @brief Gradient-boosted trees on calendar, lag and rolling features.
 *
 * Only fully populated feature rows are used for training. Forecasts are
 * recursive: each step's lags come from the history extended with the
 * previous predictions.
 */
class BoostedTreesForecaster final : public IForecaster {
public:
	/// Complete feature rows required for training.
	static constexpr std::size_t kMinTrainingRows = 30;

	explicit BoostedTreesForecaster(ml::BoostingConfig config = ml::BoostingConfig{},
	                                data::FeatureConfig features = data::FeatureConfig{});

	void fit(const core::TimeSeries &ts) override;
	core::ForecastResult predict(int horizon, double confidence) override;
	std::optional<core::HistoricalFit> historicalFit() const override;
	std::size_t minimumHistory() const override;

	std::string getName() const override {
		return "GradientBoostedTrees";
	}

	double residualStd() const {
		return residual_std_;
	}

private:
	ml::GradientBoostingRegressor regressor_;
	data::FeatureBuilder features_;
	core::TimeSeries history_;
	core::HistoricalFit fit_;
	double residual_std_ = 0.0;
	bool is_fitted_ = false;
};

} // namespace stockcast::models
