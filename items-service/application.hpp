#pragma once

#include <exception>
#include <iostream>

namespace items_service
{

// Runs the application body and converts an escaped exception into
// the process exit code: 2 for std::exception, 3 for anything else.
template<typename F>
int
run_guarded(F && f)
{
	try
	{
		f();
	}
	catch(const std::exception & x)
	{
		std::cerr << "Exception caught: " << x.what() << std::endl;
		return 2;
	}
	catch(...)
	{
		std::cerr << "Unknown exception" << std::endl;
		return 3;
	}

	return 0;
}

} /* namespace items_service */
