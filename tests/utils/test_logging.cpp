#include <catch2/catch.hpp>

#include "tsregress/utils/logging.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <sstream>
#include <string>

using tsregress::utils::Logging;

TEST_CASE("Logging initializes singleton logger", "[utils][logging]") {
	auto &logger_ref = Logging::getLogger();
	REQUIRE(logger_ref);
	REQUIRE(logger_ref->name() == "tsregress");
	REQUIRE(spdlog::get("tsregress").get() == logger_ref.get());

	const auto first_level = logger_ref->level();

	Logging::init(spdlog::level::debug);
	auto &logger_after_init = Logging::getLogger();

	REQUIRE(logger_ref.get() == logger_after_init.get());
	REQUIRE(logger_after_init->level() == spdlog::level::debug);
	REQUIRE(logger_after_init->flush_level() == spdlog::level::debug);

	// Restore to original level for downstream tests
	logger_after_init->set_level(first_level);
	logger_after_init->flush_on(first_level);
}

TEST_CASE("Logging macros write through the shared logger", "[utils][logging]") {
	auto &logger = Logging::getLogger();
	const auto first_level = logger->level();

	std::ostringstream captured;
	auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
	sink->set_pattern("%l %v");
	logger->sinks().push_back(sink);
	logger->set_level(spdlog::level::warn);

	TSREGRESS_DEBUG("member {} fitted on {} columns", 0, 4);
	TSREGRESS_WARN("Member {} fit failed ({}); retrying with resampled geometry.", 3, "singular");

	logger->sinks().pop_back();
	logger->set_level(first_level);

	const auto output = captured.str();
	REQUIRE(output.find("fitted on") == std::string::npos);
	REQUIRE(output.find("warning Member 3 fit failed (singular)") != std::string::npos);
}
