#include "stockcast/models/additive.hpp"

#include "stockcast/core/errors.hpp"
#include "stockcast/optimization/lbfgs_optimizer.hpp"
#include "stockcast/utils/logging.hpp"
#include "stockcast/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace stockcast::models {

namespace {

constexpr double kTwoPi = 6.283185307179586;
constexpr double kAbsSmoothing = 1e-8;
constexpr double kTrendPriorScale = 5.0;
constexpr double kNoisePriorScale = 0.5;
constexpr double kBound = 1e6;

double smoothAbs(double x) {
	return std::sqrt(x * x + kAbsSmoothing);
}

} // namespace

AdditiveTrendSeasonality::AdditiveTrendSeasonality(AdditiveConfig config) : config_(config) {
	if (config_.n_changepoints < 0) {
		throw std::invalid_argument("Number of changepoints must be non-negative.");
	}
	if (config_.changepoint_range <= 0.0 || config_.changepoint_range > 1.0) {
		throw std::invalid_argument("Changepoint range must be in (0, 1].");
	}
	if (config_.changepoint_prior_scale <= 0.0 || config_.seasonality_prior_scale <= 0.0) {
		throw std::invalid_argument("Prior scales must be positive.");
	}
}

Eigen::MatrixXd AdditiveTrendSeasonality::design(const std::vector<double> &t,
                                                 const std::vector<long long> &days) const {
	int fourier_columns = 0;
	for (const auto &season : seasonalities_) {
		fourier_columns += 2 * season.order;
	}
	const auto rows = static_cast<Eigen::Index>(t.size());
	const auto cps = static_cast<Eigen::Index>(changepoints_.size());
	Eigen::MatrixXd X(rows, 2 + cps + fourier_columns);

	for (Eigen::Index i = 0; i < rows; ++i) {
		const double ti = t[static_cast<std::size_t>(i)];
		X(i, 0) = ti;
		X(i, 1) = 1.0;
		for (Eigen::Index j = 0; j < cps; ++j) {
			X(i, 2 + j) = std::max(0.0, ti - changepoints_[static_cast<std::size_t>(j)]);
		}
		Eigen::Index col = 2 + cps;
		const double day = static_cast<double>(days[static_cast<std::size_t>(i)]);
		for (const auto &season : seasonalities_) {
			for (int k = 1; k <= season.order; ++k) {
				const double angle = kTwoPi * k * day / season.period;
				X(i, col++) = std::sin(angle);
				X(i, col++) = std::cos(angle);
			}
		}
	}
	return X;
}

void AdditiveTrendSeasonality::fit(const core::TimeSeries &ts) {
	const std::size_t n = ts.size();
	if (n < minimumHistory()) {
		throw core::InsufficientHistory(getName(), minimumHistory(), n);
	}

	dates_ = ts.getTimestamps();
	frequency_ = ts.frequency();
	const auto &values = ts.getValues();

	std::vector<long long> days(n);
	for (std::size_t i = 0; i < n; ++i) {
		days[i] = core::Calendar::dayNumber(dates_[i]);
	}
	start_day_ = days.front();
	t_span_days_ = static_cast<double>(days.back() - days.front());
	if (t_span_days_ <= 0.0) {
		throw std::runtime_error("History must span more than one day.");
	}
	std::vector<double> t(n);
	for (std::size_t i = 0; i < n; ++i) {
		t[i] = static_cast<double>(days[i] - start_day_) / t_span_days_;
	}

	seasonalities_.clear();
	seasonality_names_.clear();
	const bool sub_weekly = frequency_ == core::Frequency::Daily;
	if (config_.weekly && sub_weekly && t_span_days_ >= 14.0) {
		seasonalities_.push_back({"weekly", 7.0, config_.weekly_order});
	}
	if (config_.monthly && frequency_ != core::Frequency::Monthly && t_span_days_ >= 61.0) {
		seasonalities_.push_back({"monthly", 30.5, config_.monthly_order});
	}
	if (config_.yearly && t_span_days_ >= 730.0) {
		const int order = frequency_ == core::Frequency::Monthly ? std::min(config_.yearly_order, 5)
		                                                          : config_.yearly_order;
		seasonalities_.push_back({"yearly", 365.25, order});
	}
	for (const auto &season : seasonalities_) {
		seasonality_names_.push_back(season.name);
	}

	changepoints_.clear();
	const auto hist_size = static_cast<std::size_t>(std::floor(static_cast<double>(n) * config_.changepoint_range));
	const std::size_t n_cp =
	    hist_size > 1 ? std::min<std::size_t>(static_cast<std::size_t>(config_.n_changepoints), hist_size - 1) : 0;
	for (std::size_t j = 1; j <= n_cp; ++j) {
		const auto idx = static_cast<std::size_t>(
		    std::lround(static_cast<double>(j) * static_cast<double>(hist_size - 1) / static_cast<double>(n_cp)));
		changepoints_.push_back(t[idx]);
	}

	y_scale_ = 0.0;
	for (double v : values) {
		y_scale_ = std::max(y_scale_, std::abs(v));
	}
	if (y_scale_ == 0.0) {
		y_scale_ = 1.0;
	}
	Eigen::VectorXd y(static_cast<Eigen::Index>(n));
	for (std::size_t i = 0; i < n; ++i) {
		y[static_cast<Eigen::Index>(i)] = values[i] / y_scale_;
	}

	const Eigen::MatrixXd X = design(t, days);
	const Eigen::Index p = X.cols();
	const Eigen::Index cps = static_cast<Eigen::Index>(changepoints_.size());
	const double tau = config_.changepoint_prior_scale;
	const double sp2 = config_.seasonality_prior_scale * config_.seasonality_prior_scale;
	const double tp2 = kTrendPriorScale * kTrendPriorScale;
	const double np2 = kNoisePriorScale * kNoisePriorScale;
	const double count = static_cast<double>(n);

	// x = [theta (p), log sigma]
	auto objective = [&](const std::vector<double> &x, std::vector<double> &grad) {
		const Eigen::Map<const Eigen::VectorXd> theta(x.data(), p);
		const double log_sigma = x[static_cast<std::size_t>(p)];
		const double inv_var = std::exp(-2.0 * log_sigma);
		const double var = std::exp(2.0 * log_sigma);

		const Eigen::VectorXd r = y - X * theta;
		const double ss = r.squaredNorm();
		const Eigen::VectorXd g_theta = -inv_var * (X.transpose() * r);

		double f = count * log_sigma + 0.5 * ss * inv_var + var / (2.0 * np2);
		f += (theta[0] * theta[0] + theta[1] * theta[1]) / (2.0 * tp2);
		for (Eigen::Index j = 0; j < p; ++j) {
			grad[static_cast<std::size_t>(j)] = g_theta[j];
		}
		grad[0] += theta[0] / tp2;
		grad[1] += theta[1] / tp2;
		for (Eigen::Index j = 2; j < 2 + cps; ++j) {
			f += smoothAbs(theta[j]) / tau;
			grad[static_cast<std::size_t>(j)] += theta[j] / (smoothAbs(theta[j]) * tau);
		}
		for (Eigen::Index j = 2 + cps; j < p; ++j) {
			f += theta[j] * theta[j] / (2.0 * sp2);
			grad[static_cast<std::size_t>(j)] += theta[j] / sp2;
		}
		grad[static_cast<std::size_t>(p)] = count - ss * inv_var + var / np2;
		return f;
	};

	std::vector<double> x0(static_cast<std::size_t>(p + 1), 0.0);
	x0[0] = (y[y.size() - 1] - y[0]);
	x0[1] = y[0];
	std::vector<double> y_std(values.size());
	for (std::size_t i = 0; i < n; ++i) {
		y_std[i] = y[static_cast<Eigen::Index>(i)];
	}
	x0[static_cast<std::size_t>(p)] = std::log(std::max(utils::Statistics::stddev(y_std), 0.01));

	std::vector<double> lower(x0.size(), -kBound);
	std::vector<double> upper(x0.size(), kBound);
	lower.back() = std::log(1e-4);
	upper.back() = std::log(10.0);

	optimization::LBFGSOptimizer::Options options;
	options.max_iterations = config_.max_iterations;
	const auto result = optimization::LBFGSOptimizer::minimize(objective, x0, lower, upper, options);
	if (!result.converged) {
		STOCKCAST_DEBUG("Additive model optimizer: {} after {} iterations", result.message, result.iterations);
	}

	theta_ = Eigen::VectorXd::Map(result.x.data(), p);
	if (!theta_.allFinite()) {
		throw std::runtime_error("Additive model optimization produced non-finite parameters.");
	}

	const Eigen::VectorXd fitted_scaled = X * theta_;
	fitted_.resize(n);
	std::vector<double> residuals(n);
	for (std::size_t i = 0; i < n; ++i) {
		fitted_[i] = fitted_scaled[static_cast<Eigen::Index>(i)] * y_scale_;
		residuals[i] = values[i] - fitted_[i];
	}
	residual_std_ = utils::Statistics::stddev(residuals, 1);

	mean_abs_delta_ = 0.0;
	for (Eigen::Index j = 2; j < 2 + cps; ++j) {
		mean_abs_delta_ += std::abs(theta_[j]);
	}
	if (cps > 0) {
		mean_abs_delta_ /= static_cast<double>(cps);
	}

	is_fitted_ = true;
	STOCKCAST_INFO("Additive model fitted on {} observations with {} changepoints and {} seasonalities.", n, cps,
	               seasonalities_.size());
	STOCKCAST_DEBUG("Additive model base rate {}, offset {}, residual std {}", theta_[0] * y_scale_,
	                theta_[1] * y_scale_, residual_std_);
}

core::ForecastResult AdditiveTrendSeasonality::predict(int horizon, double confidence) {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (horizon <= 0) {
		throw std::invalid_argument("Forecast horizon must be positive.");
	}

	const core::TimeSeries history(dates_, std::vector<double>(dates_.size(), 0.0), frequency_);
	const auto future = history.futureDates(horizon);
	std::vector<double> t(future.size());
	std::vector<long long> days(future.size());
	for (std::size_t h = 0; h < future.size(); ++h) {
		days[h] = core::Calendar::dayNumber(future[h]);
		t[h] = static_cast<double>(days[h] - start_day_) / t_span_days_;
	}
	const Eigen::VectorXd forecast_scaled = design(t, days) * theta_;

	// Future changepoints arrive at the historical rate with Laplace-sized rate changes.
	const double cp_rate = changepoints_.empty() ? 0.0 : static_cast<double>(changepoints_.size()) /
	                                                         config_.changepoint_range;
	const double lambda = mean_abs_delta_ * y_scale_;
	const double z = utils::Statistics::twoSidedZ(confidence);

	core::ForecastResult result;
	result.model = getName();
	result.confidence_level = confidence;
	result.forecast.reserve(future.size());
	result.lower.reserve(future.size());
	result.upper.reserve(future.size());
	for (std::size_t h = 0; h < future.size(); ++h) {
		const double value = forecast_scaled[static_cast<Eigen::Index>(h)] * y_scale_;
		if (!std::isfinite(value)) {
			throw std::runtime_error("Additive model forecast is not finite.");
		}
		const double dt = std::max(0.0, t[h] - 1.0);
		const double trend_var = 2.0 * cp_rate * lambda * lambda * dt * dt * dt / 3.0;
		const double sigma = std::sqrt(residual_std_ * residual_std_ + trend_var);
		result.forecast.push_back(value);
		result.lower.push_back(value - z * sigma);
		result.upper.push_back(value + z * sigma);
	}
	return result;
}

std::optional<core::HistoricalFit> AdditiveTrendSeasonality::historicalFit() const {
	if (!is_fitted_) {
		return std::nullopt;
	}
	return core::HistoricalFit{dates_, fitted_};
}

std::vector<double> AdditiveTrendSeasonality::changepointDeltas() const {
	std::vector<double> deltas;
	for (std::size_t j = 0; j < changepoints_.size(); ++j) {
		deltas.push_back(theta_[static_cast<Eigen::Index>(2 + j)]);
	}
	return deltas;
}

} // namespace stockcast::models
