#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <resolvconf/ip.hpp>

#include <resolvconf/utils/ip_address_parsers.hpp>

#include <sstream>

using namespace std::string_view_literals;

namespace
{

[[nodiscard]]
auto
v4( const char * v )
{
	return asio::ip::make_address_v4( v );
}

[[nodiscard]]
auto
v6( const char * v )
{
	return asio::ip::make_address_v6( v );
}

template< typename T >
[[nodiscard]]
std::string
to_string( const T & v )
{
	std::ostringstream s;
	s << v;
	return s.str();
}

[[nodiscard]]
resolvconf::addr_parse_failure_t
failure_of( const resolvconf::addr_parse_result_t< resolvconf::network_t > & r )
{
	REQUIRE( !r );
	return r.error().m_reason;
}

} /* namespace anonymous */

TEST_CASE("try_make_address") {
	using namespace resolvconf::utils::parsers;

	REQUIRE( try_make_address_v4( "192.168.1.1"sv ) );
	REQUIRE( v4( "192.168.1.1" ) == *try_make_address_v4( "192.168.1.1"sv ) );
	REQUIRE( !try_make_address_v4( ""sv ) );
	REQUIRE( !try_make_address_v4( "192.168.1"sv ) );
	REQUIRE( !try_make_address_v4( "192.168.1.256"sv ) );
	REQUIRE( !try_make_address_v4( "::1"sv ) );
	REQUIRE( !try_make_address_v4( " 1.1.1.1"sv ) );
	REQUIRE( !try_make_address_v4( std::string_view{ "1.1.1.1\0x", 9u } ) );

	REQUIRE( try_make_address_v6( "::1"sv ) );
	REQUIRE( try_make_address_v6( "::ffff:1.2.3.4"sv ) );
	REQUIRE( !try_make_address_v6( "1.2.3.4"sv ) );
	REQUIRE( !try_make_address_v6( "fe80::1%eth0"sv ) );
	REQUIRE( !try_make_address_v6( "2001:db8:::1"sv ) );
}

TEST_CASE("parse_ip") {
	using namespace resolvconf;

	{
		const auto r = parse_ip( "8.8.4.4"sv );
		REQUIRE( r );
		REQUIRE( *r == ip_t{ ip_v4_t{ v4( "8.8.4.4" ) } } );
		REQUIRE( ip_version_t::ip_v4 == ip_version( *r ) );
		REQUIRE( "8.8.4.4" == to_string( *r ) );
	}

	{
		// Nameserver address can be 0.0.0.0.
		const auto r = parse_ip( "0.0.0.0"sv );
		REQUIRE( r );
	}

	{
		const auto r = parse_ip( "2001:4860:4860::8888"sv );
		REQUIRE( r );
		REQUIRE( *r == ip_t{ ip_v6_t{ v6( "2001:4860:4860::8888" ), std::nullopt } } );
		REQUIRE( ip_version_t::ip_v6 == ip_version( *r ) );
	}

	{
		const auto r = parse_ip( "fe80::1%eth0"sv );
		REQUIRE( r );
		REQUIRE( *r == ip_t{ ip_v6_t{ v6( "fe80::1" ), std::string{ "eth0" } } } );
		REQUIRE( "fe80::1%eth0" == to_string( *r ) );
	}

	{
		const auto r = parse_ip( "fe80::1%"sv );
		REQUIRE( !r );
		REQUIRE( addr_parse_failure_t::invalid_scope == r.error().m_reason );
	}

	{
		const auto r = parse_ip( "fe80::1%eth-0"sv );
		REQUIRE( !r );
		REQUIRE( addr_parse_failure_t::invalid_scope == r.error().m_reason );
	}

	{
		const auto r = parse_ip( "fe80::1%eth0%1"sv );
		REQUIRE( !r );
		REQUIRE( addr_parse_failure_t::invalid_scope == r.error().m_reason );
	}

	{
		const auto r = parse_ip( "1.2.3.4%1"sv );
		REQUIRE( !r );
		REQUIRE( addr_parse_failure_t::invalid_scope == r.error().m_reason );
	}

	{
		const auto r = parse_ip( "localhost"sv );
		REQUIRE( !r );
		REQUIRE( addr_parse_failure_t::invalid_syntax == r.error().m_reason );
	}
}

TEST_CASE("is_valid_netmask_v4") {
	using resolvconf::is_valid_netmask_v4;

	REQUIRE( is_valid_netmask_v4( v4( "255.255.255.255" ) ) );
	REQUIRE( is_valid_netmask_v4( v4( "255.255.240.0" ) ) );
	REQUIRE( is_valid_netmask_v4( v4( "255.0.0.0" ) ) );
	REQUIRE( is_valid_netmask_v4( v4( "128.0.0.0" ) ) );
	REQUIRE( is_valid_netmask_v4( v4( "255.255.255.254" ) ) );

	REQUIRE( !is_valid_netmask_v4( v4( "0.0.0.0" ) ) );
	REQUIRE( !is_valid_netmask_v4( v4( "255.0.255.0" ) ) );
	REQUIRE( !is_valid_netmask_v4( v4( "0.255.255.255" ) ) );
	REQUIRE( !is_valid_netmask_v4( v4( "255.255.255.253" ) ) );
}

TEST_CASE("infer_netmask_v4") {
	using resolvconf::infer_netmask_v4;

	REQUIRE( v4( "255.255.255.255" ) == infer_netmask_v4( v4( "10.1.2.3" ) ) );
	REQUIRE( v4( "255.255.255.0" ) == infer_netmask_v4( v4( "10.1.2.0" ) ) );
	REQUIRE( v4( "255.255.0.0" ) == infer_netmask_v4( v4( "10.1.0.0" ) ) );
	REQUIRE( v4( "255.0.0.0" ) == infer_netmask_v4( v4( "10.0.0.0" ) ) );

	// Only whole octets are taken into account.
	REQUIRE( v4( "255.255.0.0" ) == infer_netmask_v4( v4( "128.192.0.0" ) ) );

	// Zeros in the middle don't matter.
	REQUIRE( v4( "255.255.255.255" ) == infer_netmask_v4( v4( "10.0.0.1" ) ) );
	REQUIRE( v4( "255.255.255.0" ) == infer_netmask_v4( v4( "10.0.1.0" ) ) );
}

TEST_CASE("parse_network_v4") {
	using namespace resolvconf;

	{
		const auto r = parse_network_v4( "130.155.160.0/255.255.240.0"sv );
		REQUIRE( r );
		REQUIRE( *r == network_t{
				network_v4_t{ v4( "130.155.160.0" ), v4( "255.255.240.0" ) } } );
		REQUIRE( ip_version_t::ip_v4 == ip_version( *r ) );
		REQUIRE( "130.155.160.0/255.255.240.0" == to_string( *r ) );
	}

	{
		const auto r = parse_network_v4( "130.155.0.0"sv );
		REQUIRE( r );
		REQUIRE( *r == network_t{
				network_v4_t{ v4( "130.155.0.0" ), v4( "255.255.0.0" ) } } );
	}

	REQUIRE( addr_parse_failure_t::unspecified_address ==
			failure_of( parse_network_v4( "0.0.0.0"sv ) ) );
	REQUIRE( addr_parse_failure_t::unspecified_address ==
			failure_of( parse_network_v4( "0.0.0.0/255.0.0.0"sv ) ) );

	// The mask is checked, not the address.
	{
		const auto r = parse_network_v4( "10.0.0.1/255.255.255.0"sv );
		REQUIRE( r );
	}
	REQUIRE( addr_parse_failure_t::invalid_mask ==
			failure_of( parse_network_v4( "10.0.0.0/0.0.0.0"sv ) ) );
	REQUIRE( addr_parse_failure_t::invalid_mask ==
			failure_of( parse_network_v4( "10.0.0.0/255.0.255.0"sv ) ) );

	REQUIRE( addr_parse_failure_t::invalid_syntax ==
			failure_of( parse_network_v4( "10.0.0.0/"sv ) ) );
	REQUIRE( addr_parse_failure_t::invalid_syntax ==
			failure_of( parse_network_v4( "10.0.0.0/8"sv ) ) );
	REQUIRE( addr_parse_failure_t::invalid_syntax ==
			failure_of( parse_network_v4( "10.0.0.0/255.0.0.0/1"sv ) ) );
	REQUIRE( addr_parse_failure_t::invalid_syntax ==
			failure_of( parse_network_v4( "::1"sv ) ) );
}

TEST_CASE("parse_network_v6") {
	using namespace resolvconf;

	{
		const auto r = parse_network_v6( "2001:db8::1"sv );
		REQUIRE( r );
		REQUIRE( *r == network_t{
				network_v6_t{ v6( "2001:db8::1" ),
						v6( "ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff" ) } } );
		REQUIRE( ip_version_t::ip_v6 == ip_version( *r ) );
	}

	{
		// Any explicit mask is accepted.
		const auto r = parse_network_v6( "2001:db8::/ff00::ff"sv );
		REQUIRE( r );
		REQUIRE( *r == network_t{
				network_v6_t{ v6( "2001:db8::" ), v6( "ff00::ff" ) } } );
	}

	{
		// The unspecified address is allowed for IPv6.
		const auto r = parse_network_v6( "::"sv );
		REQUIRE( r );
	}

	REQUIRE( addr_parse_failure_t::invalid_syntax ==
			failure_of( parse_network_v6( "10.0.0.0"sv ) ) );
	REQUIRE( addr_parse_failure_t::invalid_syntax ==
			failure_of( parse_network_v6( "2001:db8::/64"sv ) ) );
	REQUIRE( addr_parse_failure_t::invalid_syntax ==
			failure_of( parse_network_v6( "fe80::1%eth0"sv ) ) );
}

TEST_CASE("parse_network") {
	using namespace resolvconf;

	REQUIRE( parse_network( "10.0.0.0"sv ) );
	REQUIRE( parse_network( "2001:db8::"sv ) );

	REQUIRE( addr_parse_failure_t::unspecified_address ==
			failure_of( parse_network( "0.0.0.0"sv ) ) );
	REQUIRE( addr_parse_failure_t::invalid_mask ==
			failure_of( parse_network( "10.0.0.0/0.255.0.0"sv ) ) );
	REQUIRE( addr_parse_failure_t::invalid_syntax ==
			failure_of( parse_network( "2001:db8::/xyz"sv ) ) );
	REQUIRE( addr_parse_failure_t::invalid_syntax ==
			failure_of( parse_network( "example"sv ) ) );
}

TEST_CASE("addr_parse_error_t descriptions") {
	using namespace resolvconf;

	REQUIRE( "invalid IP address syntax" == describe(
			addr_parse_error_t{ addr_parse_failure_t::invalid_syntax } ) );
	REQUIRE( "invalid netmask" == to_string(
			addr_parse_error_t{ addr_parse_failure_t::invalid_mask } ) );
}
