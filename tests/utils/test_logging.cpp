#include <catch2/catch_test_macros.hpp>

#include "stockcast/utils/logging.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <sstream>

using stockcast::utils::LogChannel;
using stockcast::utils::Logging;

TEST_CASE("Logging initializes singleton logger", "[utils][logging]") {
	auto &logger_ref = Logging::getLogger();
	REQUIRE(logger_ref);
	REQUIRE(logger_ref->name() == "stockcast");

	Logging::init(spdlog::level::debug);
	auto &logger_after_init = Logging::getLogger();

	REQUIRE(logger_ref.get() == logger_after_init.get());
	REQUIRE(logger_after_init->level() == spdlog::level::debug);
	REQUIRE(logger_after_init->flush_level() == spdlog::level::debug);

	SECTION("channels follow the level") {
		auto service = Logging::channel(LogChannel::Service);
		REQUIRE(service->level() == spdlog::level::debug);
		Logging::init(spdlog::level::warn);
		REQUIRE(service->level() == spdlog::level::warn);
		REQUIRE(Logging::channel(LogChannel::Service).get() == service.get());
	}

	Logging::init(spdlog::level::info);
}

TEST_CASE("Channel loggers are named per subsystem and share sinks", "[utils][logging]") {
	REQUIRE(Logging::channelName(LogChannel::Engine) == "engine");
	REQUIRE(Logging::channelName(LogChannel::Inventory) == "inventory");

	auto engine = Logging::channel(LogChannel::Engine);
	REQUIRE(engine->name() == "stockcast.engine");
	REQUIRE(spdlog::get("stockcast.engine").get() == engine.get());
	REQUIRE(engine->sinks() == Logging::getLogger()->sinks());
}

TEST_CASE("Added sinks capture root and channel messages", "[utils][logging]") {
	Logging::init(spdlog::level::info);
	std::ostringstream captured;
	auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
	Logging::addSink(sink);

	STOCKCAST_CLOG(Service, info, "session {} ready", "session-9");
	STOCKCAST_INFO("root message {}", 3);
	STOCKCAST_CLOG(Inventory, debug, "hidden below the level");

	Logging::removeSink(sink);
	STOCKCAST_CLOG(Service, info, "after removal");

	const std::string text = captured.str();
	REQUIRE(text.find("[stockcast.service]") != std::string::npos);
	REQUIRE(text.find("session session-9 ready") != std::string::npos);
	REQUIRE(text.find("root message 3") != std::string::npos);
	REQUIRE(text.find("hidden below the level") == std::string::npos);
	REQUIRE(text.find("after removal") == std::string::npos);
}
