/*!
 * @file
 * @brief Helpers for logging.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace resolvconf
{

namespace logging
{

namespace impl
{

/*!
 * @brief Setup a logger for the whole application.
 *
 * It's assumed that this function is called only once at the
 * beginning of the application. And then @a logger will be used
 * until the finish of the application.
 */
void
setup_logger( std::shared_ptr< spdlog::logger > logger ) noexcept;

/*!
 * @brief Remove the logger previously set via setup_logger.
 */
void
remove_logger() noexcept;

/*!
 * @brief Get access to logger that previously set via setup_logger.
 *
 * @throw std::runtime_error if there is no logger.
 */
[[nodiscard]]
spdlog::logger &
logger();

} /* namespace impl */

/*!
 * @brief Helper class for setting/removing logger in RAII style.
 *
 * Calls impl::setup_logger() in the constructor, then impl::remove_logger()
 * in the destructor.
 */
class logger_holder_t
{
public:
	logger_holder_t( std::shared_ptr< spdlog::logger > logger ) noexcept
	{
		impl::setup_logger( std::move(logger) );
	}

	~logger_holder_t()
	{
		impl::remove_logger();
	}

	logger_holder_t( const logger_holder_t & ) = delete;
	logger_holder_t &
	operator=( const logger_holder_t & ) = delete;
};

/*!
 * @brief Marker that tells that logging should be performed
 * via the main logger.
 */
struct direct_logging_marker_t {};

/*!
 * @brief A special wrapper around logging-level that tells that
 * logging is performed from wrap_logging helper.
 */
class processed_log_level_t
{
	spdlog::level::level_enum m_level;

public:
	explicit processed_log_level_t(
		spdlog::level::level_enum level )
		:	m_level{ level }
	{}

	[[nodiscard]]
	auto
	value() const noexcept { return m_level; }

	[[nodiscard]]
	operator spdlog::level::level_enum() const noexcept { return value(); }
};

/*!
 * @brief Perform logging via logger object directly.
 *
 * The functor @a action is called only if @a level is enabled
 * for logging.
 *
 * The functor @a action should have the following format:
 * @code
 * void(spdlog::logger &, processed_log_level_t);
 * @endcode
 */
template< typename Logging_Action >
void
wrap_logging(
	direct_logging_marker_t,
	spdlog::level::level_enum level,
	Logging_Action && action )
{
	auto & logger = impl::logger();
	if( logger.should_log( level ) )
	{
		action( logger, processed_log_level_t{ level } );
	}
}

} /* namespace logging */

inline constexpr logging::direct_logging_marker_t direct_logging_mode;

} /* namespace resolvconf */
