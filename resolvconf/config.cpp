/*!
 * @file
 * @brief Stuff for working with resolver configuration.
 */

#include <resolvconf/config.hpp>

#include <resolvconf/utils/overloaded.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <asio/ip/address_v4.hpp>
#include <asio/ip/address_v6.hpp>

#include <tuple>

namespace resolvconf
{

namespace
{

// Prints items of a container in the form [a, b, c].
template< typename Container >
void
print_list( std::ostream & to, const Container & items )
{
	to << '[';
	bool first{ true };
	for( const auto & i : items )
	{
		if( !first )
			to << ", ";
		first = false;

		to << i;
	}
	to << ']';
}

} /* namespace anonymous */

std::ostream &
operator<<( std::ostream & to, const lookup_t & lookup )
{
	std::visit( utils::overloaded{
			[&to]( const lookup_t::file_t & ) { to << "file"; },
			[&to]( const lookup_t::bind_t & ) { to << "bind"; },
			[&to]( const lookup_t::extra_t & e ) { to << e.m_name; }
		},
		lookup.m_value );

	return to;
}

std::ostream &
operator<<( std::ostream & to, family_t family )
{
	const auto n = [family]() noexcept -> const char * {
		const char * r = "unknown";
		switch( family )
		{
			case family_t::inet4: r = "inet4"; break;
			case family_t::inet6: r = "inet6"; break;
		}
		return r;
	};

	return (to << n());
}

//
// config_t
//
void
config_t::set_domain( std::string domain )
{
	m_domain = std::move(domain);
	m_search.clear();
}

void
config_t::set_search( search_list_t search )
{
	m_search = std::move(search);
	m_domain = std::nullopt;
}

[[nodiscard]]
config_t::search_list_t
config_t::search_list() const
{
	if( !m_search.empty() )
		return m_search;

	if( m_domain )
		return { *m_domain };

	return {};
}

[[nodiscard]]
config_t::nameserver_container_t
config_t::nameservers_or_local() const
{
	if( !m_nameservers.empty() )
		return m_nameservers;

	return {
		ip_t{ ip_v4_t{ asio::ip::address_v4::loopback() } },
		ip_t{ ip_v6_t{ asio::ip::address_v6::loopback(), std::nullopt } }
	};
}

[[nodiscard]]
bool
config_t::operator==( const config_t & b ) const
{
	const auto tup = []( const auto & v ) {
		return std::tie( v.m_nameservers, v.m_domain, v.m_search,
				v.m_sortlist,
				v.m_debug, v.m_ndots, v.m_timeout, v.m_attempts,
				v.m_rotate, v.m_no_check_names, v.m_inet6,
				v.m_ip6_bytestring, v.m_ip6_dotint, v.m_edns0,
				v.m_single_request, v.m_single_request_reopen,
				v.m_no_reload, v.m_trust_ad, v.m_no_tld_query, v.m_use_vc,
				v.m_lookup, v.m_family );
	};
	return tup( *this ) == tup( b );
}

std::ostream &
operator<<( std::ostream & to, const config_t & cfg )
{
	to << "nameservers: ";
	print_list( to, cfg.m_nameservers );

	fmt::print( to, "\ndomain: {}", cfg.m_domain ? *cfg.m_domain : "(none)" );

	to << "\nsearch: ";
	print_list( to, cfg.m_search );

	to << "\nsortlist: ";
	print_list( to, cfg.m_sortlist );

	fmt::print( to, "\noptions: ndots={} timeout={} attempts={}",
			cfg.m_ndots, cfg.m_timeout, cfg.m_attempts );

	const auto flag = [&to]( bool v, const char * name ) {
		if( v )
			fmt::print( to, " {}", name );
	};
	flag( cfg.m_debug, "debug" );
	flag( cfg.m_rotate, "rotate" );
	flag( cfg.m_no_check_names, "no-check-names" );
	flag( cfg.m_inet6, "inet6" );
	flag( cfg.m_ip6_bytestring, "ip6-bytestring" );
	flag( cfg.m_ip6_dotint, "ip6-dotint" );
	flag( cfg.m_edns0, "edns0" );
	flag( cfg.m_single_request, "single-request" );
	flag( cfg.m_single_request_reopen, "single-request-reopen" );
	flag( cfg.m_no_reload, "no-reload" );
	flag( cfg.m_trust_ad, "trust-ad" );
	flag( cfg.m_no_tld_query, "no-tld-query" );
	flag( cfg.m_use_vc, "use-vc" );

	to << "\nlookup: ";
	print_list( to, cfg.m_lookup );

	to << "\nfamily: ";
	print_list( to, cfg.m_family );

	return to;
}

} /* namespace resolvconf */
