#include "stockcast/models/arima.hpp"

#include "stockcast/core/errors.hpp"
#include "stockcast/utils/logging.hpp"
#include "stockcast/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace stockcast::models {

namespace {

constexpr int kRefinementPasses = 5;
constexpr double kCoefficientBound = 0.99;

Eigen::VectorXd autocorr(const std::vector<double> &data, int max_lag) {
	const int n = static_cast<int>(data.size());
	Eigen::VectorXd acf = Eigen::VectorXd::Zero(max_lag + 1);
	if (n == 0) {
		return acf;
	}

	const double mean = std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(n);
	double variance = 0.0;
	for (double val : data) {
		variance += (val - mean) * (val - mean);
	}
	if (variance == 0.0) {
		return acf;
	}

	acf[0] = 1.0;
	for (int lag = 1; lag <= max_lag && lag < n; ++lag) {
		double covariance = 0.0;
		for (int i = lag; i < n; ++i) {
			covariance += (data[i] - mean) * (data[i - lag] - mean);
		}
		acf[lag] = covariance / variance;
	}
	return acf;
}

// Yule-Walker: R phi = r with R the Toeplitz autocorrelation matrix.
Eigen::VectorXd yuleWalker(const std::vector<double> &data, int p) {
	if (p == 0) {
		return Eigen::VectorXd();
	}
	const Eigen::VectorXd acf = autocorr(data, p);
	Eigen::MatrixXd R(p, p);
	for (int i = 0; i < p; ++i) {
		for (int j = 0; j < p; ++j) {
			R(i, j) = (i == j) ? 1.0 : acf[std::abs(i - j)];
		}
	}
	Eigen::VectorXd phi = R.colPivHouseholderQr().solve(acf.segment(1, p));
	for (int i = 0; i < p; ++i) {
		phi[i] = std::clamp(phi[i], -kCoefficientBound, kCoefficientBound);
	}
	return phi;
}

// Residual autocorrelation at multiples of @p step, clamped to keep the MA part invertible.
void fitMovingAverage(const std::vector<double> &residuals, std::size_t start, int step, Eigen::VectorXd &coeffs) {
	for (int idx = 0; idx < coeffs.size(); ++idx) {
		const std::size_t lag = static_cast<std::size_t>((idx + 1) * step);
		double numerator = 0.0;
		double denominator = 0.0;
		for (std::size_t t = start; t < residuals.size(); ++t) {
			denominator += residuals[t] * residuals[t];
			if (t >= start + lag) {
				numerator += residuals[t] * residuals[t - lag];
			}
		}
		if (denominator == 0.0) {
			coeffs[idx] = 0.0;
			continue;
		}
		const double value = numerator / denominator;
		if (!std::isfinite(value)) {
			throw std::runtime_error("Invalid MA coefficient detected during estimation.");
		}
		coeffs[idx] = std::clamp(value, -kCoefficientBound, kCoefficientBound);
	}
}

double sampleStd(const std::vector<double> &values, std::size_t skip) {
	if (values.size() <= skip + 1) {
		return 0.0;
	}
	const std::vector<double> tail(values.begin() + static_cast<std::ptrdiff_t>(skip), values.end());
	return utils::Statistics::stddev(tail, 1);
}

} // namespace

ARIMA::ARIMA(int p, int d, int q, int P, int D, int Q, int s, bool include_intercept)
    : p_(p), d_(d), q_(q), P_(P), D_(D), Q_(Q), seasonal_period_(s), include_intercept_(include_intercept) {
	if (p < 0 || d < 0 || q < 0) {
		throw std::invalid_argument("ARIMA orders (p, d, q) must be non-negative.");
	}
	if (P < 0 || D < 0 || Q < 0) {
		throw std::invalid_argument("Seasonal ARIMA orders (P, D, Q) must be non-negative.");
	}
	if (d > 1 || D > 1) {
		throw std::invalid_argument("Differencing orders above one are not supported.");
	}
	if ((P > 0 || Q > 0 || D > 0) && seasonal_period_ < 2) {
		throw std::invalid_argument("Seasonal period must be >= 2 for seasonal ARIMA components.");
	}
	if (p == 0 && q == 0 && P == 0 && Q == 0) {
		throw std::invalid_argument("At least one of p, q, P, or Q must be greater than zero for ARIMA.");
	}
}

std::string ARIMA::getName() const {
	std::ostringstream name;
	if (isSeasonal()) {
		name << "SARIMA(" << p_ << "," << d_ << "," << q_ << ")(" << P_ << "," << D_ << "," << Q_ << ")["
		     << seasonal_period_ << "]";
	} else {
		name << "ARIMA(" << p_ << "," << d_ << "," << q_ << ")";
	}
	return name.str();
}

std::size_t ARIMA::minimumHistory() const {
	const int s = isSeasonal() ? seasonal_period_ : 0;
	const int max_lag = std::max({p_, q_, P_ * s, Q_ * s});
	const int needed = max_lag + d_ + D_ * s + 3;
	if (isSeasonal()) {
		return static_cast<std::size_t>(std::max(needed, 2 * seasonal_period_));
	}
	return static_cast<std::size_t>(needed);
}

std::vector<double> ARIMA::difference(const std::vector<double> &data, int d) {
	if (d == 0)
		return data;
	if (data.size() <= static_cast<std::size_t>(d)) {
		throw std::invalid_argument("Insufficient data length for requested differencing order.");
	}
	std::vector<double> result = data;
	for (int order = 0; order < d; ++order) {
		std::vector<double> temp;
		temp.reserve(result.size() - 1);
		for (std::size_t i = 1; i < result.size(); ++i) {
			temp.push_back(result[i] - result[i - 1]);
		}
		result = std::move(temp);
	}
	return result;
}

std::vector<double> ARIMA::integrate(const std::vector<double> &forecast_diff, const std::vector<double> &last_values,
                                     int d) {
	if (d == 0)
		return forecast_diff;
	if (last_values.empty()) {
		throw std::invalid_argument("Insufficient history retained to integrate differenced forecast.");
	}
	std::vector<double> integrated;
	integrated.reserve(forecast_diff.size());
	double previous = last_values.back();
	for (double val : forecast_diff) {
		previous += val;
		integrated.push_back(previous);
	}
	return integrated;
}

std::vector<double> ARIMA::seasonalDifference(const std::vector<double> &data, int D, int s) {
	if (D == 0 || s <= 1)
		return data;
	const std::size_t lag = static_cast<std::size_t>(s);
	if (data.size() <= lag) {
		throw std::invalid_argument("Insufficient data length for requested seasonal differencing order.");
	}
	std::vector<double> result;
	result.reserve(data.size() - lag);
	for (std::size_t i = lag; i < data.size(); ++i) {
		result.push_back(data[i] - data[i - lag]);
	}
	return result;
}

std::vector<double> ARIMA::seasonalIntegrate(const std::vector<double> &forecast_diff,
                                             const std::vector<double> &last_values, int D, int s) {
	if (D == 0 || s <= 1)
		return forecast_diff;
	const std::size_t lag = static_cast<std::size_t>(s);
	if (last_values.size() < lag) {
		throw std::invalid_argument("Insufficient history retained to integrate seasonal differenced forecast.");
	}
	// y_t = diff_t + y_{t-s}, reading y_{t-s} from history for the first cycle.
	std::vector<double> integrated;
	integrated.reserve(forecast_diff.size());
	for (std::size_t h = 0; h < forecast_diff.size(); ++h) {
		const double base = h < lag ? last_values[last_values.size() - lag + h] : integrated[h - lag];
		integrated.push_back(forecast_diff[h] + base);
	}
	return integrated;
}

double ARIMA::predictDifferenced(const std::vector<double> &w, const std::vector<double> &e, std::size_t t) const {
	double prediction = intercept_;
	for (int i = 0; i < p_; ++i) {
		const std::size_t lag = static_cast<std::size_t>(i + 1);
		if (t >= lag) {
			prediction += ar_coeffs_[i] * w[t - lag];
		}
	}
	for (int i = 0; i < seasonal_ar_coeffs_.size(); ++i) {
		const std::size_t lag = static_cast<std::size_t>((i + 1) * seasonal_period_);
		if (t >= lag) {
			prediction += seasonal_ar_coeffs_[i] * w[t - lag];
		}
	}
	for (int i = 0; i < q_; ++i) {
		const std::size_t lag = static_cast<std::size_t>(i + 1);
		if (t >= lag) {
			prediction += ma_coeffs_[i] * e[t - lag];
		}
	}
	for (int i = 0; i < seasonal_ma_coeffs_.size(); ++i) {
		const std::size_t lag = static_cast<std::size_t>((i + 1) * seasonal_period_);
		if (t >= lag) {
			prediction += seasonal_ma_coeffs_[i] * e[t - lag];
		}
	}
	return prediction;
}

void ARIMA::estimateCoefficients() {
	const std::size_t n = differenced_.size();
	const bool seasonal = isSeasonal();

	ar_coeffs_ = yuleWalker(differenced_, p_);
	seasonal_ar_coeffs_ = Eigen::VectorXd::Zero(seasonal ? P_ : 0);
	if (seasonal && P_ > 0) {
		const Eigen::VectorXd acf = autocorr(differenced_, P_ * seasonal_period_);
		for (int i = 0; i < P_; ++i) {
			seasonal_ar_coeffs_[i] = std::clamp(acf[(i + 1) * seasonal_period_], -kCoefficientBound,
			                                    kCoefficientBound);
		}
	}
	ma_coeffs_ = Eigen::VectorXd::Zero(q_);
	seasonal_ma_coeffs_ = Eigen::VectorXd::Zero(seasonal ? Q_ : 0);

	const double mean = std::accumulate(differenced_.begin(), differenced_.end(), 0.0) / static_cast<double>(n);
	intercept_ = include_intercept_ ? mean * (1.0 - ar_coeffs_.sum() - seasonal_ar_coeffs_.sum()) : 0.0;

	residuals_.assign(n, 0.0);
	for (int pass = 0; pass < kRefinementPasses; ++pass) {
		for (std::size_t t = max_lag_; t < n; ++t) {
			residuals_[t] = differenced_[t] - predictDifferenced(differenced_, residuals_, t);
		}
		if (q_ > 0) {
			fitMovingAverage(residuals_, max_lag_, 1, ma_coeffs_);
		}
		if (seasonal && Q_ > 0) {
			fitMovingAverage(residuals_, max_lag_, seasonal_period_, seasonal_ma_coeffs_);
		}
	}

	fitted_.assign(n, std::numeric_limits<double>::quiet_NaN());
	for (std::size_t t = max_lag_; t < n; ++t) {
		fitted_[t] = predictDifferenced(differenced_, residuals_, t);
		residuals_[t] = differenced_[t] - fitted_[t];
	}
}

void ARIMA::fit(const core::TimeSeries &ts) {
	const std::size_t required = minimumHistory();
	if (ts.size() < required) {
		throw core::InsufficientHistory(getName(), required, ts.size());
	}

	dates_ = ts.getTimestamps();
	history_ = ts.getValues();
	nonseasonal_diff_ = difference(history_, d_);
	differenced_ = seasonalDifference(nonseasonal_diff_, D_, isSeasonal() ? seasonal_period_ : 0);

	const int s = isSeasonal() ? seasonal_period_ : 0;
	max_lag_ = static_cast<std::size_t>(std::max({p_, q_, P_ * s, Q_ * s}));
	if (differenced_.size() <= max_lag_ + 1) {
		throw std::runtime_error("Differenced series is too short for the requested lags.");
	}

	estimateCoefficients();

	const auto finite = [](const Eigen::VectorXd &v) { return v.allFinite(); };
	if (!finite(ar_coeffs_) || !finite(ma_coeffs_) || !finite(seasonal_ar_coeffs_) ||
	    !finite(seasonal_ma_coeffs_) || !std::isfinite(intercept_)) {
		throw std::runtime_error("ARIMA estimation produced non-finite coefficients.");
	}

	residual_std_ = sampleStd(residuals_, max_lag_);

	const std::size_t effective = differenced_.size() - max_lag_;
	double sum_sq = 0.0;
	for (std::size_t t = max_lag_; t < residuals_.size(); ++t) {
		sum_sq += residuals_[t] * residuals_[t];
	}
	const double sigma2 = sum_sq / static_cast<double>(effective);
	if (sigma2 > 0.0) {
		const double loglik = -0.5 * static_cast<double>(effective) * (std::log(2.0 * M_PI * sigma2) + 1.0);
		const int k = p_ + q_ + P_ + Q_ + (include_intercept_ ? 1 : 0);
		aic_ = -2.0 * loglik + 2.0 * static_cast<double>(k);
	} else {
		aic_.reset();
	}

	is_fitted_ = true;

	STOCKCAST_INFO("{} model fitted on {} observations.", getName(), history_.size());
	if (p_ > 0) {
		std::stringstream ss;
		ss << ar_coeffs_.transpose();
		STOCKCAST_DEBUG("AR coeffs: [{}]", ss.str());
	}
	if (q_ > 0) {
		std::stringstream ss;
		ss << ma_coeffs_.transpose();
		STOCKCAST_DEBUG("MA coeffs: [{}]", ss.str());
	}
	STOCKCAST_DEBUG("Intercept: {}, residual std: {}", intercept_, residual_std_);
}

core::ForecastResult ARIMA::predict(int horizon, double confidence) {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (horizon <= 0) {
		throw std::invalid_argument("Forecast horizon must be positive.");
	}

	std::vector<double> w = differenced_;
	std::vector<double> e = residuals_;
	std::vector<double> diff_forecast;
	diff_forecast.reserve(static_cast<std::size_t>(horizon));
	for (int h = 0; h < horizon; ++h) {
		const double next = predictDifferenced(w, e, w.size());
		diff_forecast.push_back(next);
		w.push_back(next);
		e.push_back(0.0);
	}

	std::vector<double> levels = diff_forecast;
	if (isSeasonal() && D_ > 0) {
		levels = seasonalIntegrate(levels, nonseasonal_diff_, D_, seasonal_period_);
	}
	levels = integrate(levels, history_, d_);

	core::ForecastResult result;
	result.model = getName();
	result.confidence_level = confidence;
	result.forecast = std::move(levels);
	for (double value : result.forecast) {
		if (!std::isfinite(value)) {
			throw std::runtime_error("ARIMA forecast diverged.");
		}
	}

	if (residual_std_ <= 0.0) {
		STOCKCAST_WARN("{}: residual standard deviation is zero; interval collapses to the point forecast.",
		               getName());
		result.lower = result.forecast;
		result.upper = result.forecast;
		return result;
	}

	const double z = utils::Statistics::twoSidedZ(confidence);
	result.lower.reserve(result.forecast.size());
	result.upper.reserve(result.forecast.size());
	for (std::size_t idx = 0; idx < result.forecast.size(); ++idx) {
		const double scale = residual_std_ * std::sqrt(1.0 + static_cast<double>(idx) * 0.1);
		result.lower.push_back(result.forecast[idx] - z * scale);
		result.upper.push_back(result.forecast[idx] + z * scale);
	}
	return result;
}

std::optional<core::HistoricalFit> ARIMA::historicalFit() const {
	if (!is_fitted_) {
		return std::nullopt;
	}
	// A one-step error on the differenced scale equals the error on the level scale.
	const std::size_t offset = history_.size() - differenced_.size();
	core::HistoricalFit fit;
	for (std::size_t k = max_lag_; k < differenced_.size(); ++k) {
		const std::size_t idx = k + offset;
		fit.dates.push_back(dates_[idx]);
		fit.values.push_back(history_[idx] - differenced_[k] + fitted_[k]);
	}
	return fit;
}

ARIMABuilder &ARIMABuilder::withAR(int p) {
	p_ = p;
	return *this;
}

ARIMABuilder &ARIMABuilder::withDifferencing(int d) {
	d_ = d;
	return *this;
}

ARIMABuilder &ARIMABuilder::withMA(int q) {
	q_ = q;
	return *this;
}

ARIMABuilder &ARIMABuilder::withSeasonalAR(int P) {
	P_ = P;
	return *this;
}

ARIMABuilder &ARIMABuilder::withSeasonalDifferencing(int D) {
	D_ = D;
	return *this;
}

ARIMABuilder &ARIMABuilder::withSeasonalMA(int Q) {
	Q_ = Q;
	return *this;
}

ARIMABuilder &ARIMABuilder::withSeasonalPeriod(int s) {
	s_ = s;
	return *this;
}

ARIMABuilder &ARIMABuilder::withIntercept(bool include_intercept) {
	include_intercept_ = include_intercept;
	return *this;
}

std::unique_ptr<ARIMA> ARIMABuilder::build() {
	return std::unique_ptr<ARIMA>(new ARIMA(p_, d_, q_, P_, D_, Q_, s_, include_intercept_));
}

AdaptiveARIMA::AdaptiveARIMA(ArimaConfig config, bool include_seasonality, int seasonal_period)
    : config_(config), include_seasonality_(include_seasonality), seasonal_period_(seasonal_period) {
}

std::unique_ptr<ARIMA> AdaptiveARIMA::buildPlain() const {
	return ARIMABuilder()
	    .withAR(config_.p)
	    .withDifferencing(config_.d)
	    .withMA(config_.q)
	    .withIntercept(config_.include_intercept)
	    .build();
}

std::unique_ptr<ARIMA> AdaptiveARIMA::buildSeasonal(int period) const {
	return ARIMABuilder()
	    .withAR(config_.p)
	    .withDifferencing(config_.d)
	    .withMA(config_.q)
	    .withSeasonalAR(config_.seasonal_p)
	    .withSeasonalDifferencing(config_.seasonal_d)
	    .withSeasonalMA(config_.seasonal_q)
	    .withSeasonalPeriod(period)
	    .withIntercept(config_.include_intercept)
	    .build();
}

void AdaptiveARIMA::fit(const core::TimeSeries &ts) {
	model_.reset();
	const int period = seasonal_period_ > 0 ? seasonal_period_ : ts.defaultSeasonalPeriod();
	if (include_seasonality_ && period > 1 && ts.size() > static_cast<std::size_t>(2 * period)) {
		try {
			auto seasonal = buildSeasonal(period);
			seasonal->fit(ts);
			model_ = std::move(seasonal);
			return;
		} catch (const std::exception &e) {
			STOCKCAST_WARN("Seasonal ARIMA with period {} failed ({}); falling back to non-seasonal ARIMA.", period,
			               e.what());
		}
	}
	auto plain = buildPlain();
	plain->fit(ts);
	model_ = std::move(plain);
}

core::ForecastResult AdaptiveARIMA::predict(int horizon, double confidence) {
	if (!model_) {
		throw std::runtime_error("Predict called before fit.");
	}
	return model_->predict(horizon, confidence);
}

std::optional<core::HistoricalFit> AdaptiveARIMA::historicalFit() const {
	if (!model_) {
		return std::nullopt;
	}
	return model_->historicalFit();
}

std::size_t AdaptiveARIMA::minimumHistory() const {
	return buildPlain()->minimumHistory();
}

std::string AdaptiveARIMA::getName() const {
	return model_ ? model_->getName() : "ARIMA";
}

} // namespace stockcast::models
