/*!
 * @file
 * @brief Types for IP-addresses and networks from resolv.conf.
 */

#include <resolvconf/ip.hpp>

#include <resolvconf/utils/ip_address_parsers.hpp>
#include <resolvconf/utils/overloaded.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <cstdint>
#include <tuple>

namespace resolvconf
{

namespace
{

[[nodiscard]]
auto
make_failure( addr_parse_failure_t reason )
{
	return restinio::make_unexpected( addr_parse_error_t{ reason } );
}

/*!
 * @brief Splits ADDRESS/MASK value into parts.
 *
 * The second item is empty if there is no '/' in the value.
 */
[[nodiscard]]
std::tuple< std::string_view, std::optional< std::string_view > >
split_address_and_mask( std::string_view what ) noexcept
{
	const auto slash = what.find( '/' );
	if( std::string_view::npos == slash )
		return { what, std::nullopt };

	return { what.substr( 0u, slash ), what.substr( slash + 1u ) };
}

[[nodiscard]]
bool
is_valid_scope( std::string_view scope ) noexcept
{
	const auto is_alnum = []( char ch ) noexcept {
		return ( ch >= '0' && ch <= '9' )
				|| ( ch >= 'a' && ch <= 'z' )
				|| ( ch >= 'A' && ch <= 'Z' );
	};

	return !scope.empty() && std::all_of( scope.begin(), scope.end(), is_alnum );
}

} /* namespace anonymous */

[[nodiscard]]
std::string_view
describe( const addr_parse_error_t & err ) noexcept
{
	std::string_view r{ "unknown error" };
	switch( err.m_reason )
	{
		case addr_parse_failure_t::invalid_syntax:
			r = "invalid IP address syntax"; break;
		case addr_parse_failure_t::unspecified_address:
			r = "unspecified address can't be used as a network"; break;
		case addr_parse_failure_t::invalid_mask:
			r = "invalid netmask"; break;
		case addr_parse_failure_t::invalid_scope:
			r = "invalid scope of IP address"; break;
	}
	return r;
}

std::ostream &
operator<<( std::ostream & to, const addr_parse_error_t & err )
{
	return (to << describe( err ));
}

std::ostream &
operator<<( std::ostream & to, const ip_t & ip )
{
	std::visit( utils::overloaded{
			[&to]( const ip_v4_t & v ) {
				fmt::print( to, "{}", v.m_address.to_string() );
			},
			[&to]( const ip_v6_t & v ) {
				fmt::print( to, "{}", v.m_address.to_string() );
				if( v.m_scope )
					fmt::print( to, "%{}", *(v.m_scope) );
			}
		},
		ip );

	return to;
}

std::ostream &
operator<<( std::ostream & to, const network_t & net )
{
	std::visit( [&to]( const auto & v ) {
			fmt::print( to, "{}/{}",
					v.m_address.to_string(),
					v.m_mask.to_string() );
		},
		net );

	return to;
}

[[nodiscard]]
ip_version_t
ip_version( const ip_t & ip ) noexcept
{
	return std::holds_alternative< ip_v4_t >( ip ) ?
			ip_version_t::ip_v4 : ip_version_t::ip_v6;
}

[[nodiscard]]
ip_version_t
ip_version( const network_t & net ) noexcept
{
	return std::holds_alternative< network_v4_t >( net ) ?
			ip_version_t::ip_v4 : ip_version_t::ip_v6;
}

[[nodiscard]]
addr_parse_result_t< ip_t >
parse_ip( std::string_view what )
{
	using namespace utils::parsers;

	const auto percent = what.find( '%' );
	const auto address_part = what.substr( 0u, percent );

	if( const auto v4 = try_make_address_v4( address_part ); v4 )
	{
		// IPv4 addresses have no scope.
		if( std::string_view::npos != percent )
			return make_failure( addr_parse_failure_t::invalid_scope );

		return ip_t{ ip_v4_t{ *v4 } };
	}

	if( const auto v6 = try_make_address_v6( address_part ); v6 )
	{
		if( std::string_view::npos == percent )
			return ip_t{ ip_v6_t{ *v6, std::nullopt } };

		const auto scope = what.substr( percent + 1u );
		if( !is_valid_scope( scope ) )
			return make_failure( addr_parse_failure_t::invalid_scope );

		return ip_t{ ip_v6_t{ *v6, std::string{ scope } } };
	}

	return make_failure( addr_parse_failure_t::invalid_syntax );
}

[[nodiscard]]
bool
is_valid_netmask_v4( const asio::ip::address_v4 & mask ) noexcept
{
	const auto bits = static_cast< std::uint32_t >( mask.to_uint() );
	const std::uint32_t inverted = ~bits;

	// The inverted value of a valid mask has the form 0..01..1,
	// so adding 1 to it clears all of its bits.
	return 0u != bits && 0u == ( inverted & ( inverted + 1u ) );
}

[[nodiscard]]
asio::ip::address_v4
infer_netmask_v4( const asio::ip::address_v4 & address ) noexcept
{
	const auto octets = address.to_bytes();

	asio::ip::address_v4::bytes_type mask{ 255u, 255u, 255u, 255u };
	if( 0u == octets[ 3 ] )
	{
		mask[ 3 ] = 0u;
		if( 0u == octets[ 2 ] )
		{
			mask[ 2 ] = 0u;
			if( 0u == octets[ 1 ] )
				mask[ 1 ] = 0u;
		}
	}

	return asio::ip::address_v4{ mask };
}

[[nodiscard]]
addr_parse_result_t< network_t >
parse_network_v4( std::string_view what )
{
	using utils::parsers::try_make_address_v4;

	const auto [address_part, mask_part] = split_address_and_mask( what );

	const auto address = try_make_address_v4( address_part );
	if( !address )
		return make_failure( addr_parse_failure_t::invalid_syntax );

	// A sortlist item can't point to the unspecified network.
	if( address->is_unspecified() )
		return make_failure( addr_parse_failure_t::unspecified_address );

	if( !mask_part )
		return network_t{
				network_v4_t{ *address, infer_netmask_v4( *address ) }
			};

	const auto mask = try_make_address_v4( *mask_part );
	if( !mask )
		return make_failure( addr_parse_failure_t::invalid_syntax );

	if( !is_valid_netmask_v4( *mask ) )
		return make_failure( addr_parse_failure_t::invalid_mask );

	return network_t{ network_v4_t{ *address, *mask } };
}

[[nodiscard]]
addr_parse_result_t< network_t >
parse_network_v6( std::string_view what )
{
	using utils::parsers::try_make_address_v6;

	const auto [address_part, mask_part] = split_address_and_mask( what );

	const auto address = try_make_address_v6( address_part );
	if( !address )
		return make_failure( addr_parse_failure_t::invalid_syntax );

	if( !mask_part )
	{
		asio::ip::address_v6::bytes_type all_ones;
		all_ones.fill( 0xffu );

		return network_t{
				network_v6_t{ *address, asio::ip::address_v6{ all_ones } }
			};
	}

	const auto mask = try_make_address_v6( *mask_part );
	if( !mask )
		return make_failure( addr_parse_failure_t::invalid_syntax );

	return network_t{ network_v6_t{ *address, *mask } };
}

[[nodiscard]]
addr_parse_result_t< network_t >
parse_network( std::string_view what )
{
	auto v4 = parse_network_v4( what );
	if( v4 )
		return v4;

	auto v6 = parse_network_v6( what );
	if( v6 )
		return v6;

	if( std::string_view::npos == what.find( ':' ) )
		return v4;
	else
		return v6;
}

} /* namespace resolvconf */
