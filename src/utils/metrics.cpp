#include "stockcast/utils/metrics.hpp"

namespace stockcast::utils {

namespace {

void validate_lengths(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.size() != predicted.size() || actual.empty()) {
		throw std::invalid_argument("Actual and predicted vectors must be non-empty and equal length.");
	}
}

} // namespace

double Metrics::mae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		sum += std::abs(actual[i] - predicted[i]);
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::mse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		const double diff = actual[i] - predicted[i];
		sum += diff * diff;
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::rmse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return std::sqrt(mse(actual, predicted));
}

std::optional<double> Metrics::mape(const std::vector<double> &actual, const std::vector<double> &predicted,
                                    const MetricsConfig &config) {
	validate_lengths(actual, predicted);
	if (config.mape_zero_threshold < 0.0) {
		throw std::invalid_argument("MAPE zero threshold must be non-negative.");
	}
	double sum = 0.0;
	std::size_t count = 0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		const double denom = std::abs(actual[i]);
		if (denom > config.mape_zero_threshold) {
			sum += std::abs(actual[i] - predicted[i]) / denom;
			++count;
		}
	}
	if (count == 0)
		return std::nullopt;
	return (sum / static_cast<double>(count)) * 100.0;
}

std::optional<double> Metrics::wape(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double error = 0.0;
	double volume = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		error += std::abs(actual[i] - predicted[i]);
		volume += std::abs(actual[i]);
	}
	if (volume == 0.0)
		return std::nullopt;
	return error / volume * 100.0;
}

double Metrics::bias(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (std::size_t i = 0; i < actual.size(); ++i) {
		sum += predicted[i] - actual[i];
	}
	return sum / static_cast<double>(actual.size());
}

std::optional<double> Metrics::improvement(const std::optional<double> &baseline,
                                           const std::optional<double> &model) {
	if (!baseline || !model)
		return std::nullopt;
	return *baseline - *model;
}

AccuracyMetrics Metrics::evaluate(const std::vector<double> &actual, const std::vector<double> &predicted,
                                  const MetricsConfig &config) {
	AccuracyMetrics metrics;
	metrics.n = actual.size();
	metrics.mae = mae(actual, predicted);
	metrics.rmse = rmse(actual, predicted);
	metrics.mape = mape(actual, predicted, config);
	metrics.wape = wape(actual, predicted);
	return metrics;
}

} // namespace stockcast::utils
