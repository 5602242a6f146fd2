#pragma once

#include "stockcast/models/iforecaster.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace stockcast::models {

/**
 * @class Ensemble
 * @brief Combines member strategies fitted on the same history.
 *
 * Members that fail to fit or predict are skipped with a warning. The point
 * forecast is the per-step mean of the survivors, the interval spans the
 * lowest lower and the highest upper bound.
 */
class Ensemble final : public IForecaster {
public:
	using MemberFactory = std::function<std::unique_ptr<IForecaster>()>;

	explicit Ensemble(std::vector<MemberFactory> members);

	void fit(const core::TimeSeries &ts) override;
	core::ForecastResult predict(int horizon, double confidence) override;

	/// The smallest member requirement; longer-history members are skipped until they fit.
	std::size_t minimumHistory() const override;

	std::string getName() const override {
		return "Ensemble";
	}

	/// Names of the members that survived the last fit().
	std::vector<std::string> activeMembers() const;

private:
	std::vector<MemberFactory> factories_;
	std::vector<std::unique_ptr<IForecaster>> fitted_;
};

} // namespace stockcast::models
