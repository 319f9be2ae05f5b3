/*!
 * @file
 * @brief Helpers for parsing IP-addresses.
 */

#pragma once

#include <restinio/helpers/easy_parser.hpp>

#include <asio/ip/address.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>

namespace resolvconf::utils::parsers
{

//
// is_ip_address_char_predicate_t
//
/*!
 * @brief A predicate that detects symbols enabled
 * to be used in IP-addresses.
 */
struct is_ip_address_char_predicate_t
{
	[[nodiscard]]
	bool
	operator()( char ch ) const noexcept
	{
		return restinio::easy_parser::impl::is_hexdigit(ch)
				|| '.' == ch
				|| ':' == ch
				;
	}
};

//
// consists_of_ip_address_chars
//
/*!
 * @brief Checks that @a what is not empty and contains only symbols
 * enabled to be used in IP-addresses.
 *
 * This check is performed before passing a value to asio because
 * asio works with null-terminated strings and the value can contain
 * zero bytes.
 */
[[nodiscard]]
inline bool
consists_of_ip_address_chars( std::string_view what ) noexcept
{
	return !what.empty() &&
			std::all_of( what.begin(), what.end(),
					is_ip_address_char_predicate_t{} );
}

//
// try_make_address_v4
//
/*!
 * @brief An attempt to parse dotted IPv4-address.
 *
 * @return std::nullopt if @a what isn't a valid IPv4-address.
 */
[[nodiscard]]
inline std::optional< asio::ip::address_v4 >
try_make_address_v4( std::string_view what )
{
	if( !consists_of_ip_address_chars( what ) )
		return std::nullopt;

	asio::error_code ec;
	auto addr = asio::ip::make_address_v4( std::string{ what }, ec );
	if( ec )
		return std::nullopt;

	return addr;
}

//
// try_make_address_v6
//
/*!
 * @brief An attempt to parse IPv6-address.
 *
 * Scope suffixes (like "%eth0") are not accepted here.
 *
 * @return std::nullopt if @a what isn't a valid IPv6-address.
 */
[[nodiscard]]
inline std::optional< asio::ip::address_v6 >
try_make_address_v6( std::string_view what )
{
	if( !consists_of_ip_address_chars( what ) )
		return std::nullopt;

	asio::error_code ec;
	auto addr = asio::ip::make_address_v6( std::string{ what }, ec );
	if( ec )
		return std::nullopt;

	return addr;
}

} /* namespace resolvconf::utils::parsers */
