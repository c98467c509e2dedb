#include "application.hpp"

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

void
normal_completion_gives_zero()
{
	bool called = false;
	check(0 == run_guarded([&called] { called = true; }),
			"normal completion gives 0");
	check(called, "the body is run");
}

void
standard_exception_gives_two()
{
	check(2 == run_guarded([] { throw std::runtime_error("bind failed"); }),
			"std::exception gives 2");
}

void
unknown_exception_gives_three()
{
	check(3 == run_guarded([] { throw 42; }),
			"non-standard exception gives 3");
}

} /* namespace anonymous */

int main()
{
	normal_completion_gives_zero();
	standard_exception_gives_two();
	unknown_exception_gives_three();

	if(failures)
	{
		std::cerr << failures << " check(s) failed" << std::endl;
		return 1;
	}

	return 0;
}
