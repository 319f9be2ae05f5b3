/*!
 * @file
 * @brief Types for IP-addresses and networks from resolv.conf.
 */

#pragma once

#include <resolvconf/ip_version.hpp>

#include <restinio/expected.hpp>

#include <asio/ip/address.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

namespace resolvconf
{

//
// addr_parse_failure_t
//
/*!
 * @brief The reason of a failure during parsing an address or a network.
 */
enum class addr_parse_failure_t
{
	//! The value isn't an IP-address at all.
	invalid_syntax,
	//! IPv4 network can't be specified with 0.0.0.0 address.
	unspecified_address,
	//! The netmask isn't a contiguous run of ones.
	invalid_mask,
	//! Scope is specified for IPv4 or it's empty or it has illegal symbols.
	invalid_scope
};

//
// addr_parse_error_t
//
struct addr_parse_error_t
{
	addr_parse_failure_t m_reason;

	[[nodiscard]]
	bool
	operator==( const addr_parse_error_t & b ) const noexcept
	{
		return m_reason == b.m_reason;
	}
};

//! Short description of the error.
[[nodiscard]]
std::string_view
describe( const addr_parse_error_t & err ) noexcept;

std::ostream &
operator<<( std::ostream & to, const addr_parse_error_t & err );

//! Result of parsing an address or a network.
template< typename T >
using addr_parse_result_t = restinio::expected_t< T, addr_parse_error_t >;

//
// ip_v4_t
//
struct ip_v4_t
{
	asio::ip::address_v4 m_address;

	[[nodiscard]]
	bool
	operator==( const ip_v4_t & b ) const noexcept
	{
		return m_address == b.m_address;
	}
};

//
// ip_v6_t
//
/*!
 * @brief IPv6-address with optional scope.
 *
 * The scope is stored as is, it is not resolved into an interface index.
 */
struct ip_v6_t
{
	asio::ip::address_v6 m_address;
	std::optional< std::string > m_scope;

	[[nodiscard]]
	bool
	operator==( const ip_v6_t & b ) const noexcept
	{
		return m_address == b.m_address && m_scope == b.m_scope;
	}
};

//! Address of a nameserver.
using ip_t = std::variant< ip_v4_t, ip_v6_t >;

//
// network_v4_t
//
struct network_v4_t
{
	asio::ip::address_v4 m_address;
	asio::ip::address_v4 m_mask;

	[[nodiscard]]
	bool
	operator==( const network_v4_t & b ) const noexcept
	{
		return m_address == b.m_address && m_mask == b.m_mask;
	}
};

//
// network_v6_t
//
struct network_v6_t
{
	asio::ip::address_v6 m_address;
	asio::ip::address_v6 m_mask;

	[[nodiscard]]
	bool
	operator==( const network_v6_t & b ) const noexcept
	{
		return m_address == b.m_address && m_mask == b.m_mask;
	}
};

//! A single item of sortlist.
using network_t = std::variant< network_v4_t, network_v6_t >;

// For debugging purposes only.
std::ostream &
operator<<( std::ostream & to, const ip_t & ip );

// For debugging purposes only.
std::ostream &
operator<<( std::ostream & to, const network_t & net );

[[nodiscard]]
ip_version_t
ip_version( const ip_t & ip ) noexcept;

[[nodiscard]]
ip_version_t
ip_version( const network_t & net ) noexcept;

//
// parse_ip
//
/*!
 * @brief Parses an address of a nameserver.
 *
 * Accepts dotted IPv4-address or IPv6-address with optional
 * "%scope" suffix. The scope should be a non-empty sequence
 * of alphanumeric symbols.
 */
[[nodiscard]]
addr_parse_result_t< ip_t >
parse_ip( std::string_view what );

//
// is_valid_netmask_v4
//
/*!
 * @return true if @a mask is a non-empty left-aligned run of ones.
 */
[[nodiscard]]
bool
is_valid_netmask_v4( const asio::ip::address_v4 & mask ) noexcept;

//
// infer_netmask_v4
//
/*!
 * @brief Makes a netmask for an address without explicit netmask.
 *
 * Only whole octets are taken into account: the count of trailing
 * zero octets (only the last three octets are examined) defines
 * the mask. So the mask for 128.192.0.0 is 255.255.0.0.
 */
[[nodiscard]]
asio::ip::address_v4
infer_netmask_v4( const asio::ip::address_v4 & address ) noexcept;

//
// parse_network_v4
//
/*!
 * @brief Parses a value in the form ADDRESS or ADDRESS/MASK.
 *
 * 0.0.0.0 isn't allowed as the address. An explicit mask has to
 * pass is_valid_netmask_v4() check. If there is no mask then it
 * is produced by infer_netmask_v4().
 */
[[nodiscard]]
addr_parse_result_t< network_t >
parse_network_v4( std::string_view what );

//
// parse_network_v6
//
/*!
 * @brief Parses a value in the form ADDRESS or ADDRESS/MASK.
 *
 * An explicit mask is accepted as is. If there is no mask
 * then all-ones mask is used.
 */
[[nodiscard]]
addr_parse_result_t< network_t >
parse_network_v6( std::string_view what );

//
// parse_network
//
/*!
 * @brief Tries parse_network_v4() first and then parse_network_v6().
 *
 * If both fail the error from parse_network_v4() is returned for
 * values without ':', and the error from parse_network_v6() otherwise.
 */
[[nodiscard]]
addr_parse_result_t< network_t >
parse_network( std::string_view what );

} /* namespace resolvconf */
