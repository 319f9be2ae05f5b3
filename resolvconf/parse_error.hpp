/*!
 * @file
 * @brief Errors that can be detected during parsing of resolv.conf.
 */

#pragma once

#include <resolvconf/ip.hpp>

#include <resolvconf/utils/line_extractor.hpp>
#include <resolvconf/utils/utf8_check.hpp>

#include <ostream>
#include <string>
#include <variant>

namespace resolvconf
{

//! Type for storing number of file line.
/*!
 * Line numbers start from 0.
 */
using line_number_t = utils::line_extractor_t::line_number_t;

namespace parse_errors
{

//! A line is not a valid UTF-8 text.
struct invalid_utf8_t
{
	line_number_t m_line;
	utils::utf8_error_t m_cause;

	[[nodiscard]]
	bool
	operator==( const invalid_utf8_t & b ) const noexcept
	{
		return m_line == b.m_line && m_cause == b.m_cause;
	}
};

//! A value for a directive is missing or invalid.
struct invalid_value_t
{
	line_number_t m_line;

	[[nodiscard]]
	bool
	operator==( const invalid_value_t & b ) const noexcept
	{
		return m_line == b.m_line;
	}
};

//! A value for an option is missing or invalid.
struct invalid_option_value_t
{
	line_number_t m_line;

	[[nodiscard]]
	bool
	operator==( const invalid_option_value_t & b ) const noexcept
	{
		return m_line == b.m_line;
	}
};

//! An unknown option.
struct invalid_option_t
{
	line_number_t m_line;

	[[nodiscard]]
	bool
	operator==( const invalid_option_t & b ) const noexcept
	{
		return m_line == b.m_line;
	}
};

//! An unknown directive.
struct invalid_directive_t
{
	line_number_t m_line;

	[[nodiscard]]
	bool
	operator==( const invalid_directive_t & b ) const noexcept
	{
		return m_line == b.m_line;
	}
};

//! A value can't be parsed as IP-address or network.
struct invalid_ip_t
{
	line_number_t m_line;
	addr_parse_error_t m_cause;

	[[nodiscard]]
	bool
	operator==( const invalid_ip_t & b ) const noexcept
	{
		return m_line == b.m_line && m_cause == b.m_cause;
	}
};

//! There is unexpected data at the end of a line.
struct extra_data_t
{
	line_number_t m_line;

	[[nodiscard]]
	bool
	operator==( const extra_data_t & b ) const noexcept
	{
		return m_line == b.m_line;
	}
};

} /* namespace parse_errors */

//
// parse_error_t
//
/*!
 * @brief Description of the first error found in resolv.conf.
 */
using parse_error_t = std::variant<
		parse_errors::invalid_utf8_t,
		parse_errors::invalid_value_t,
		parse_errors::invalid_option_value_t,
		parse_errors::invalid_option_t,
		parse_errors::invalid_directive_t,
		parse_errors::invalid_ip_t,
		parse_errors::extra_data_t >;

//! Get the number of the line where the error was found.
[[nodiscard]]
line_number_t
line_of( const parse_error_t & err ) noexcept;

//! Human-readable description of the error.
[[nodiscard]]
std::string
describe( const parse_error_t & err );

std::ostream &
operator<<( std::ostream & to, const parse_error_t & err );

} /* namespace resolvconf */
