/*!
 * @file
 * @brief Helpers for logging.
 */

#include <resolvconf/logging/wrap_logging.hpp>

#include <stdexcept>

namespace resolvconf::logging
{

namespace impl
{

static std::shared_ptr< spdlog::logger > g_logger;

void
setup_logger( std::shared_ptr< spdlog::logger > logger ) noexcept
{
	g_logger = std::move(logger);
}

void
remove_logger() noexcept
{
	g_logger = {};
}

[[nodiscard]]
spdlog::logger &
logger()
{
	// If there is no logger then there is no sense to work further.
	if( !g_logger )
		throw std::runtime_error( "logger is not set and can't be obtained" );

	return *g_logger;
}

} /* namespace impl */

} /* namespace resolvconf::logging */
