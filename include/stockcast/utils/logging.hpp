#pragma once

#ifndef STOCKCAST_NO_LOGGING
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace stockcast::utils {

/// Planning subsystems that log under their own name, "stockcast.<channel>".
enum class LogChannel { Engine, Inventory, Service };

/**
 * @class Logging
 * @brief The "stockcast" root logger plus one child logger per LogChannel.
 *
 * All loggers are created lazily and write to the same sink set, so a sink
 * added once (a file for session audit trails, a test capture) sees every
 * subsystem. Levels are kept in step by init().
 */
class Logging {
public:
	/// Root logger used by the unqualified STOCKCAST_* macros.
	static std::shared_ptr<spdlog::logger> &getLogger();

	/// Logger of @p channel, sharing the root sinks and level.
	static std::shared_ptr<spdlog::logger> channel(LogChannel channel);

	/**
	 * @brief Sets the level of the root logger and every channel.
	 * @param level The minimum level of messages to log; also the flush level.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

	/// Attaches @p sink to every current and future logger. Call before logging starts.
	static void addSink(spdlog::sink_ptr sink);
	static void removeSink(const spdlog::sink_ptr &sink);

	static std::string channelName(LogChannel channel);

private:
	Logging() = default;

	// Callers hold the registry mutex.
	static void ensureRootLocked();

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace stockcast::utils

#define STOCKCAST_TRACE(...)    stockcast::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define STOCKCAST_DEBUG(...)    stockcast::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define STOCKCAST_INFO(...)     stockcast::utils::Logging::getLogger()->info(__VA_ARGS__)
#define STOCKCAST_WARN(...)     stockcast::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define STOCKCAST_ERROR(...)    stockcast::utils::Logging::getLogger()->error(__VA_ARGS__)
#define STOCKCAST_CRITICAL(...) stockcast::utils::Logging::getLogger()->critical(__VA_ARGS__)

// STOCKCAST_CLOG(Service, info, "...", args)
#define STOCKCAST_CLOG(CHANNEL, LEVEL, ...)                                                                       \
	stockcast::utils::Logging::channel(stockcast::utils::LogChannel::CHANNEL)->LEVEL(__VA_ARGS__)

#else

namespace stockcast::utils {

class Logging {
public:
	static void init() {}
};

} // namespace stockcast::utils

#define STOCKCAST_TRACE(...)    do {} while(0)
#define STOCKCAST_DEBUG(...)    do {} while(0)
#define STOCKCAST_INFO(...)     do {} while(0)
#define STOCKCAST_WARN(...)     do {} while(0)
#define STOCKCAST_ERROR(...)    do {} while(0)
#define STOCKCAST_CRITICAL(...) do {} while(0)
#define STOCKCAST_CLOG(CHANNEL, LEVEL, ...) do {} while(0)

#endif // STOCKCAST_NO_LOGGING
