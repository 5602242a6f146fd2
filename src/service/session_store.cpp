#include "stockcast/service/session_store.hpp"

#include "stockcast/core/errors.hpp"
#include "stockcast/utils/logging.hpp"

namespace stockcast::service {

std::string InMemorySessionStore::create(data::PreparedSeries prepared) {
	auto entry = std::make_shared<const data::PreparedSeries>(std::move(prepared));
	std::lock_guard<std::mutex> lock(mutex_);
	std::string key = "session-" + std::to_string(next_id_++);
	sessions_.emplace(key, std::move(entry));
	STOCKCAST_CLOG(Service, debug, "Created {} ({} active)", key, sessions_.size());
	return key;
}

std::shared_ptr<const data::PreparedSeries> InMemorySessionStore::get(const std::string &key) const {
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = sessions_.find(key);
	if (it == sessions_.end()) {
		throw core::SessionNotFound(key);
	}
	return it->second;
}

bool InMemorySessionStore::expire(const std::string &key) {
	std::lock_guard<std::mutex> lock(mutex_);
	const bool removed = sessions_.erase(key) > 0;
	if (removed) {
		STOCKCAST_CLOG(Service, debug, "Expired {} ({} active)", key, sessions_.size());
	}
	return removed;
}

std::size_t InMemorySessionStore::size() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return sessions_.size();
}

} // namespace stockcast::service
