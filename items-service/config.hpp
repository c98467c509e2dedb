#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace items_service
{

struct config_t
{
	std::string m_address{"localhost"};
	std::uint16_t m_port{8080u};
	std::size_t m_worker_threads{3u};
	spdlog::level::level_enum m_log_level{spdlog::level::info};
};

// Builds the configuration from ITEMS_SERVICE_ADDRESS,
// ITEMS_SERVICE_PORT, ITEMS_SERVICE_WORKERS and ITEMS_SERVICE_LOG_LEVEL.
// Absent variables keep the default values.
//
// Throws std::runtime_error if a value is invalid.
config_t
load_config_from_environment();

// Parsers for individual values. `name` is used in error messages.
std::uint16_t
parse_port(const std::string & name, const std::string & value);

std::size_t
parse_worker_threads(const std::string & name, const std::string & value);

spdlog::level::level_enum
parse_log_level(const std::string & name, const std::string & value);

} /* namespace items_service */
