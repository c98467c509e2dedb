#include "config.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace items_service;

namespace
{

int failures = 0;

void
check(bool condition, const std::string & what)
{
	if(!condition)
	{
		std::cerr << "FAILED: " << what << std::endl;
		++failures;
	}
}

template<typename F>
bool
throws_runtime_error(F && f)
{
	try
	{
		f();
	}
	catch(const std::runtime_error &)
	{
		return true;
	}
	return false;
}

const char * const variables[] = {
	"ITEMS_SERVICE_ADDRESS",
	"ITEMS_SERVICE_PORT",
	"ITEMS_SERVICE_WORKERS",
	"ITEMS_SERVICE_LOG_LEVEL"
};

void
clear_environment()
{
	for(const auto * name : variables)
		::unsetenv(name);
}

void
defaults_without_environment()
{
	clear_environment();

	const auto config = load_config_from_environment();
	check("localhost" == config.m_address, "default address");
	check(8080u == config.m_port, "default port");
	check(3u == config.m_worker_threads, "default worker count");
	check(spdlog::level::info == config.m_log_level, "default log level");
}

void
environment_overrides_defaults()
{
	clear_environment();
	::setenv("ITEMS_SERVICE_ADDRESS", "0.0.0.0", 1);
	::setenv("ITEMS_SERVICE_PORT", "9090", 1);
	::setenv("ITEMS_SERVICE_WORKERS", "8", 1);
	::setenv("ITEMS_SERVICE_LOG_LEVEL", "debug", 1);

	const auto config = load_config_from_environment();
	check("0.0.0.0" == config.m_address, "address from environment");
	check(9090u == config.m_port, "port from environment");
	check(8u == config.m_worker_threads, "worker count from environment");
	check(spdlog::level::debug == config.m_log_level,
			"log level from environment");

	clear_environment();
}

void
invalid_values_are_reported()
{
	check(throws_runtime_error([] { parse_port("PORT", "0"); }),
			"port 0 is rejected");
	check(throws_runtime_error([] { parse_port("PORT", "65536"); }),
			"port 65536 is rejected");
	check(throws_runtime_error([] { parse_port("PORT", "80a"); }),
			"port with letters is rejected");
	check(throws_runtime_error([] { parse_worker_threads("WORKERS", "0"); }),
			"zero workers are rejected");
	check(throws_runtime_error([] { parse_log_level("LEVEL", "verbose"); }),
			"unknown log level is rejected");

	clear_environment();
	::setenv("ITEMS_SERVICE_PORT", "-1", 1);
	check(throws_runtime_error([] { load_config_from_environment(); }),
			"invalid environment value is reported");
	clear_environment();
}

} /* namespace anonymous */

int main()
{
	defaults_without_environment();
	environment_overrides_defaults();
	invalid_values_are_reported();

	if(failures)
	{
		std::cerr << failures << " check(s) failed" << std::endl;
		return 1;
	}

	return 0;
}
