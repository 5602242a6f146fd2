#include "stockcast/utils/logging.hpp"

#ifndef STOCKCAST_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <map>
#include <mutex>

namespace stockcast::utils {

namespace {

struct Registry {
	std::mutex mutex;
	std::map<LogChannel, std::shared_ptr<spdlog::logger>> channels;
	spdlog::level::level_enum level = spdlog::level::info;
};

Registry &registry() {
	static Registry instance;
	return instance;
}

void applyLevel(spdlog::logger &logger, spdlog::level::level_enum level) {
	logger.set_level(level);
	logger.flush_on(level);
}

} // namespace

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::ensureRootLocked() {
	if (logger_) {
		return;
	}
	// Another component may already have registered the name.
	logger_ = spdlog::get("stockcast");
	if (!logger_) {
		logger_ = spdlog::stdout_color_mt("stockcast");
	}
	applyLevel(*logger_, registry().level);
}

void Logging::init(spdlog::level::level_enum level) {
	auto &reg = registry();
	std::lock_guard<std::mutex> lock(reg.mutex);
	reg.level = level;
	ensureRootLocked();
	applyLevel(*logger_, level);
	for (auto &entry : reg.channels) {
		applyLevel(*entry.second, level);
	}
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	std::lock_guard<std::mutex> lock(registry().mutex);
	ensureRootLocked();
	return logger_;
}

std::shared_ptr<spdlog::logger> Logging::channel(LogChannel channel) {
	auto &reg = registry();
	std::lock_guard<std::mutex> lock(reg.mutex);
	auto it = reg.channels.find(channel);
	if (it != reg.channels.end()) {
		return it->second;
	}

	ensureRootLocked();
	const std::string name = "stockcast." + channelName(channel);
	auto logger = spdlog::get(name);
	if (!logger) {
		logger = std::make_shared<spdlog::logger>(name, logger_->sinks().begin(), logger_->sinks().end());
		spdlog::register_logger(logger);
	}
	applyLevel(*logger, reg.level);
	reg.channels.emplace(channel, logger);
	return logger;
}

void Logging::addSink(spdlog::sink_ptr sink) {
	auto &reg = registry();
	std::lock_guard<std::mutex> lock(reg.mutex);
	ensureRootLocked();
	logger_->sinks().push_back(sink);
	for (auto &entry : reg.channels) {
		entry.second->sinks().push_back(sink);
	}
}

void Logging::removeSink(const spdlog::sink_ptr &sink) {
	auto &reg = registry();
	std::lock_guard<std::mutex> lock(reg.mutex);
	const auto drop = [&sink](spdlog::logger &logger) {
		auto &sinks = logger.sinks();
		sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
	};
	if (logger_) {
		drop(*logger_);
	}
	for (auto &entry : reg.channels) {
		drop(*entry.second);
	}
}

std::string Logging::channelName(LogChannel channel) {
	switch (channel) {
	case LogChannel::Engine:
		return "engine";
	case LogChannel::Inventory:
		return "inventory";
	case LogChannel::Service:
		return "service";
	}
	return "unknown";
}

} // namespace stockcast::utils

#endif // STOCKCAST_NO_LOGGING
