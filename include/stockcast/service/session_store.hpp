#pragma once

#include "stockcast/data/series_preparer.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace stockcast::service {

/**
 * @class SessionStore
 * @brief Keyed storage of prepared series shared between requests.
 *
 * Readers get shared ownership, so expiring a key never invalidates a series
 * that is still being used.
 */
class SessionStore {
public:
	virtual ~SessionStore() = default;

	/// Stores @p prepared and returns its new key.
	virtual std::string create(data::PreparedSeries prepared) = 0;

	/// @throws core::SessionNotFound when the key is unknown or expired.
	virtual std::shared_ptr<const data::PreparedSeries> get(const std::string &key) const = 0;

	/// Removes a session; false when the key was not present.
	virtual bool expire(const std::string &key) = 0;

	virtual std::size_t size() const = 0;
};

class InMemorySessionStore final : public SessionStore {
public:
	std::string create(data::PreparedSeries prepared) override;
	std::shared_ptr<const data::PreparedSeries> get(const std::string &key) const override;
	bool expire(const std::string &key) override;
	std::size_t size() const override;

private:
	mutable std::mutex mutex_;
	std::map<std::string, std::shared_ptr<const data::PreparedSeries>> sessions_;
	std::size_t next_id_ = 1;
};

} // namespace stockcast::service
