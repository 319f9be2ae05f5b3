/*!
 * @file
 * @brief Parser for the content of resolv.conf.
 */

#pragma once

#include <resolvconf/exception.hpp>

#include <resolvconf/config.hpp>
#include <resolvconf/parse_error.hpp>

#include <restinio/expected.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace resolvconf
{

//! Result of parsing of resolv.conf content.
using parse_result_t = restinio::expected_t< config_t, parse_error_t >;

//
// config_parser_t
//
/*!
 * @brief A class for parsing the content of resolv.conf.
 *
 * It's supposed that an instance of that class is created just
 * once and then reused. The parsing doesn't change the state of
 * the parser, so the same instance can be used from different
 * threads.
 *
 * The content is processed line by line and the processing stops
 * at the first error.
 */
class config_parser_t
{
public:
	//! Type of exception for parsing errors.
	class parser_exception_t : public exception_t
	{
		parse_error_t m_error;

	public:
		parser_exception_t( parse_error_t error );

		//! Description of the problem.
		[[nodiscard]]
		const parse_error_t &
		error() const noexcept { return m_error; }
	};

	config_parser_t();
	~config_parser_t();

	//! Parse the content of resolv.conf.
	/*!
	 * The content can contain any bytes. Invalid UTF-8 sequences
	 * are allowed only inside comment lines.
	 *
	 * Doesn't throw on malformed content, the description of the
	 * first problem found is returned instead.
	 */
	[[nodiscard]]
	parse_result_t
	try_parse( std::string_view content ) const;

	//! Parse the content of resolv.conf.
	/*!
	 * @throw parser_exception_t in the case of an error.
	 */
	[[nodiscard]]
	config_t
	parse( std::string_view content ) const;

private:
	struct impl_t;

	std::unique_ptr<impl_t> m_impl;
};

} /* namespace resolvconf */
