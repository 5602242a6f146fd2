#pragma once

#include "stockcast/models/iforecaster.hpp"

#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <vector>

namespace stockcast::models {

class ARIMABuilder;

/**
 * @class ARIMA
 * @brief Seasonal ARIMA(p,d,q)(P,D,Q)[s] with moment-based estimation.
 *
 * AR terms come from Yule-Walker equations on the differenced series, MA
 * terms from residual autocorrelation, refined over a few passes. The
 * interval widens with the horizon around the residual standard deviation.
 */
class ARIMA final : public IForecaster {
public:
	friend class ARIMABuilder;

	void fit(const core::TimeSeries &ts) override;
	core::ForecastResult predict(int horizon, double confidence) override;
	std::optional<core::HistoricalFit> historicalFit() const override;
	std::size_t minimumHistory() const override;

	std::string getName() const override;

	bool isSeasonal() const {
		return seasonal_period_ > 1 && (P_ > 0 || D_ > 0 || Q_ > 0);
	}

	const Eigen::VectorXd &arCoefficients() const {
		return ar_coeffs_;
	}
	const Eigen::VectorXd &maCoefficients() const {
		return ma_coeffs_;
	}
	const Eigen::VectorXd &seasonalARCoefficients() const {
		return seasonal_ar_coeffs_;
	}
	const Eigen::VectorXd &seasonalMACoefficients() const {
		return seasonal_ma_coeffs_;
	}
	double residualStd() const {
		return residual_std_;
	}
	std::optional<double> aic() const {
		return aic_;
	}

	static std::vector<double> difference(const std::vector<double> &data, int d);
	static std::vector<double> integrate(const std::vector<double> &forecast_diff,
	                                     const std::vector<double> &last_values, int d);
	static std::vector<double> seasonalDifference(const std::vector<double> &data, int D, int s);
	static std::vector<double> seasonalIntegrate(const std::vector<double> &forecast_diff,
	                                             const std::vector<double> &last_values, int D, int s);

private:
	ARIMA(int p, int d, int q, int P, int D, int Q, int s, bool include_intercept);

	double predictDifferenced(const std::vector<double> &w, const std::vector<double> &e, std::size_t t) const;
	void estimateCoefficients();

	int p_, d_, q_;
	int P_, D_, Q_;
	int seasonal_period_;
	bool include_intercept_;

	Eigen::VectorXd ar_coeffs_;
	Eigen::VectorXd ma_coeffs_;
	Eigen::VectorXd seasonal_ar_coeffs_;
	Eigen::VectorXd seasonal_ma_coeffs_;
	double intercept_ = 0.0;

	std::vector<core::TimePoint> dates_;
	std::vector<double> history_;
	std::vector<double> nonseasonal_diff_;
	std::vector<double> differenced_;
	std::vector<double> residuals_;
	std::vector<double> fitted_;
	std::size_t max_lag_ = 0;
	double residual_std_ = 0.0;
	std::optional<double> aic_;
	bool is_fitted_ = false;
};

class ARIMABuilder {
public:
	ARIMABuilder &withAR(int p);
	ARIMABuilder &withDifferencing(int d);
	ARIMABuilder &withMA(int q);
	ARIMABuilder &withSeasonalAR(int P);
	ARIMABuilder &withSeasonalDifferencing(int D);
	ARIMABuilder &withSeasonalMA(int Q);
	ARIMABuilder &withSeasonalPeriod(int s);
	ARIMABuilder &withIntercept(bool include_intercept);
	std::unique_ptr<ARIMA> build();

private:
	int p_ = 0;
	int d_ = 0;
	int q_ = 0;
	int P_ = 0;
	int D_ = 0;
	int Q_ = 0;
	int s_ = 0;
	bool include_intercept_ = true;
};

struct ArimaConfig {
	int p = 1;
	int d = 1;
	int q = 1;
	int seasonal_p = 1;
	int seasonal_d = 0;
	int seasonal_q = 1;
	bool include_intercept = true;
};

/**
 * @class AdaptiveARIMA
 * @brief ARIMA(1,1,1) that adds a (1,0,1)[s] seasonal part once the history
 * spans more than two seasonal cycles, and falls back to the plain model when
 * the seasonal fit fails.
 */
class AdaptiveARIMA final : public IForecaster {
public:
	AdaptiveARIMA(ArimaConfig config, bool include_seasonality, int seasonal_period);

	void fit(const core::TimeSeries &ts) override;
	core::ForecastResult predict(int horizon, double confidence) override;
	std::optional<core::HistoricalFit> historicalFit() const override;

	/// History needed by the non-seasonal fallback.
	std::size_t minimumHistory() const override;

	std::string getName() const override;

	/// The model chosen by the last fit(), or nullptr.
	const ARIMA *selected() const {
		return model_.get();
	}

private:
	std::unique_ptr<ARIMA> buildPlain() const;
	std::unique_ptr<ARIMA> buildSeasonal(int period) const;

	ArimaConfig config_;
	bool include_seasonality_;
	int seasonal_period_;
	std::unique_ptr<ARIMA> model_;
};

} // namespace stockcast::models
