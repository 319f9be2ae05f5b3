/*!
 * @file
 * @brief Helper function that throws an exception if some
 * system call returns an error.
 */

#pragma once

#include <resolvconf/exception.hpp>

#include <cerrno>
#include <string>
#include <system_error>

namespace resolvconf::utils
{

inline void
ensure_successful_syscall(int ret_code, const std::string & what)
{
	if(-1 == ret_code)
	{
		throw exception_t( what + ": failed -> " +
				std::system_category().message(errno));
	}
}

} /* namespace resolvconf::utils */
