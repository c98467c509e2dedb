#include "config.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <stdexcept>

namespace items_service
{

namespace
{

[[noreturn]] void
throw_invalid_value(const std::string & name, const std::string & value)
{
	throw std::runtime_error(
			fmt::format("invalid value for {}: '{}'", name, value));
}

unsigned long
parse_unsigned(const std::string & name, const std::string & value)
{
	if(value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
		throw_invalid_value(name, value);

	try
	{
		return std::stoul(value);
	}
	catch(const std::out_of_range &)
	{
		throw_invalid_value(name, value);
	}
}

template<typename Handler>
void
with_env_value(const char * name, Handler && handler)
{
	const char * raw = std::getenv(name);
	if(raw)
		handler(std::string{name}, std::string{raw});
}

} /* namespace anonymous */

std::uint16_t
parse_port(const std::string & name, const std::string & value)
{
	const auto port = parse_unsigned(name, value);
	if(0u == port || port > 65535u)
		throw_invalid_value(name, value);

	return static_cast<std::uint16_t>(port);
}

std::size_t
parse_worker_threads(const std::string & name, const std::string & value)
{
	const auto threads = parse_unsigned(name, value);
	if(0u == threads || threads > 256u)
		throw_invalid_value(name, value);

	return static_cast<std::size_t>(threads);
}

spdlog::level::level_enum
parse_log_level(const std::string & name, const std::string & value)
{
	static const struct
	{
		const char * m_name;
		spdlog::level::level_enum m_level;
	} levels[] = {
		{ "trace", spdlog::level::trace },
		{ "debug", spdlog::level::debug },
		{ "info", spdlog::level::info },
		{ "warn", spdlog::level::warn },
		{ "error", spdlog::level::err },
		{ "critical", spdlog::level::critical },
		{ "off", spdlog::level::off }
	};

	for(const auto & l : levels)
		if(value == l.m_name)
			return l.m_level;

	throw_invalid_value(name, value);
}

config_t
load_config_from_environment()
{
	config_t config;

	with_env_value("ITEMS_SERVICE_ADDRESS",
			[&](const std::string & name, const std::string & value) {
				if(value.empty())
					throw_invalid_value(name, value);
				config.m_address = value;
			});

	with_env_value("ITEMS_SERVICE_PORT",
			[&](const std::string & name, const std::string & value) {
				config.m_port = parse_port(name, value);
			});

	with_env_value("ITEMS_SERVICE_WORKERS",
			[&](const std::string & name, const std::string & value) {
				config.m_worker_threads = parse_worker_threads(name, value);
			});

	with_env_value("ITEMS_SERVICE_LOG_LEVEL",
			[&](const std::string & name, const std::string & value) {
				config.m_log_level = parse_log_level(name, value);
			});

	return config;
}

} /* namespace items_service */
