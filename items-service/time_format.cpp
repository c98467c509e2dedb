#include "time_format.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <ctime>
#include <stdexcept>

namespace items_service
{

namespace
{

struct broken_down_time_t
{
	std::tm m_tm;
	long m_nanoseconds;
};

broken_down_time_t
break_down(std::chrono::system_clock::time_point tp)
{
	using namespace std::chrono;

	auto whole_seconds = time_point_cast<seconds>(tp);
	auto nanos = duration_cast<nanoseconds>(tp - whole_seconds).count();
	// time_point_cast truncates toward zero, the fraction must be positive.
	if(nanos < 0)
	{
		whole_seconds -= seconds{1};
		nanos += 1000000000;
	}

	const std::time_t as_time_t = system_clock::to_time_t(whole_seconds);

	broken_down_time_t result;
	if(!gmtime_r(&as_time_t, &result.m_tm))
		throw std::runtime_error(
				fmt::format("unable to convert time value {} to UTC", as_time_t));
	result.m_nanoseconds = static_cast<long>(nanos);

	return result;
}

} /* namespace anonymous */

std::string
format_rfc3339(std::chrono::system_clock::time_point tp)
{
	const auto t = break_down(tp);

	std::string result = fmt::format("{:%Y-%m-%dT%H:%M:%S}", t.m_tm);

	if(t.m_nanoseconds)
	{
		auto fraction = fmt::format("{:09}", t.m_nanoseconds);
		fraction.erase(fraction.find_last_not_of('0') + 1u);
		result += '.';
		result += fraction;
	}

	result += 'Z';

	return result;
}

std::string
format_for_humans(std::chrono::system_clock::time_point tp)
{
	return fmt::format("{:%b %d, %Y %H:%M}", break_down(tp).m_tm);
}

} /* namespace items_service */
