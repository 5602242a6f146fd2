#include "stockcast/models/boosted_trees.hpp"

#include "stockcast/core/errors.hpp"
#include "stockcast/utils/logging.hpp"
#include "stockcast/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace stockcast::models {

BoostedTreesForecaster::BoostedTreesForecaster(ml::BoostingConfig config, data::FeatureConfig features)
    : regressor_(config), features_(std::move(features)) {
}

std::size_t BoostedTreesForecaster::minimumHistory() const {
	return features_.lookback() + kMinTrainingRows;
}

void BoostedTreesForecaster::fit(const core::TimeSeries &ts) {
	const data::FeatureMatrix matrix = features_.build(ts);
	const auto complete = matrix.completeRows();
	if (complete.size() < kMinTrainingRows) {
		throw core::InsufficientHistory(getName(), minimumHistory(), ts.size());
	}

	const auto &values = ts.getValues();
	const auto &dates = ts.getTimestamps();
	std::vector<std::vector<double>> X;
	std::vector<double> y;
	X.reserve(complete.size());
	y.reserve(complete.size());
	for (std::size_t idx : complete) {
		X.push_back(matrix.rows[idx]);
		y.push_back(values[idx]);
	}
	regressor_.fit(X, y);

	fit_ = core::HistoricalFit{};
	std::vector<double> residuals;
	residuals.reserve(complete.size());
	for (std::size_t i = 0; i < complete.size(); ++i) {
		const double predicted = regressor_.predict(X[i]);
		fit_.dates.push_back(dates[complete[i]]);
		fit_.values.push_back(predicted);
		residuals.push_back(y[i] - predicted);
	}

	residual_std_ = utils::Statistics::stddev(residuals, 1);
	if (!(residual_std_ > 0.0)) {
		residual_std_ = utils::Statistics::stddev(y, 1) * 0.1;
		STOCKCAST_WARN("{}: training residuals vanished; using 10% of demand spread ({}) for the interval.",
		               getName(), residual_std_);
	}

	history_ = ts;
	is_fitted_ = true;
	STOCKCAST_INFO("{} fitted on {} complete rows, residual std {:.4f}", getName(), complete.size(),
	               residual_std_);
}

core::ForecastResult BoostedTreesForecaster::predict(int horizon, double confidence) {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (horizon <= 0) {
		throw std::invalid_argument("Forecast horizon must be positive.");
	}

	const double buffer = residual_std_ * utils::Statistics::twoSidedZ(confidence);
	std::vector<double> extended = history_.getValues();
	const auto future = history_.futureDates(horizon);

	core::ForecastResult result;
	result.model = getName();
	result.confidence_level = confidence;
	for (const auto &date : future) {
		const auto row = features_.featuresAt(date, extended, extended.size());
		const double value = regressor_.predict(row);
		if (!std::isfinite(value)) {
			throw std::runtime_error("Boosted trees produced a non-finite prediction.");
		}
		extended.push_back(value);
		result.forecast.push_back(value);
		result.lower.push_back(std::min(value, std::max(value - buffer, 0.0)));
		result.upper.push_back(value + buffer);
	}
	return result;
}

std::optional<core::HistoricalFit> BoostedTreesForecaster::historicalFit() const {
	if (!is_fitted_) {
		return std::nullopt;
	}
	return fit_;
}

} // namespace stockcast::models
