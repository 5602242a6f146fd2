#pragma once

#include "stockcast/models/iforecaster.hpp"

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace stockcast::models {

struct AdditiveConfig {
	int n_changepoints = 25;
	/// Share of the history in which changepoints may occur.
	double changepoint_range = 0.8;
	/// Laplace scale of the trend rate changes.
	double changepoint_prior_scale = 0.05;
	/// Normal scale of the Fourier coefficients.
	double seasonality_prior_scale = 10.0;

	bool weekly = true;
	bool monthly = true;
	bool yearly = true;
	int weekly_order = 3;
	int monthly_order = 5;
	int yearly_order = 10;

	int max_iterations = 500;
};

/**
 * @class AdditiveTrendSeasonality
 * @brief Piecewise-linear trend plus Fourier seasonalities, fitted by MAP.
 *
 *   y(t) = k t + m + sum_j delta_j (t - s_j)+ + sum_p seasonality_p(t) + noise
 *
 * Time is scaled to [0, 1] over the history and demand by its maximum.
 * Changepoints s_j are spread over the first changepoint_range of the
 * history; a Laplace prior on delta keeps most of them at zero. The
 * posterior mode, including the noise scale, is found with L-BFGS-B.
 */
class AdditiveTrendSeasonality final : public IForecaster {
public:
	explicit AdditiveTrendSeasonality(AdditiveConfig config = AdditiveConfig{});

	void fit(const core::TimeSeries &ts) override;
	core::ForecastResult predict(int horizon, double confidence) override;
	std::optional<core::HistoricalFit> historicalFit() const override;

	std::string getName() const override {
		return "Additive";
	}

	/// Names of the seasonal components active after fit().
	const std::vector<std::string> &seasonalities() const {
		return seasonality_names_;
	}
	const std::vector<double> &changepoints() const {
		return changepoints_;
	}
	/// Fitted rate changes, in scaled units.
	std::vector<double> changepointDeltas() const;
	double residualStd() const {
		return residual_std_;
	}

private:
	struct Seasonality {
		std::string name;
		double period;
		int order;
	};

	Eigen::MatrixXd design(const std::vector<double> &t, const std::vector<long long> &days) const;

	AdditiveConfig config_;
	core::Frequency frequency_ = core::Frequency::Daily;
	std::vector<Seasonality> seasonalities_;
	std::vector<std::string> seasonality_names_;
	std::vector<double> changepoints_;

	long long start_day_ = 0;
	double t_span_days_ = 1.0;
	double y_scale_ = 1.0;
	Eigen::VectorXd theta_;

	std::vector<core::TimePoint> dates_;
	std::vector<double> fitted_;
	double residual_std_ = 0.0;
	double mean_abs_delta_ = 0.0;
	bool is_fitted_ = false;
};

} // namespace stockcast::models
