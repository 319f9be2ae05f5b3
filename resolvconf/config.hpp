/*!
 * @file
 * @brief Stuff for working with resolver configuration.
 */

#pragma once

#include <resolvconf/ip.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace resolvconf
{

//
// lookup_t
//
/*!
 * @brief An item of `lookup` directive.
 */
struct lookup_t
{
	//! Lookup in /etc/hosts.
	struct file_t
	{
		[[nodiscard]]
		bool
		operator==( const file_t & ) const noexcept { return true; }
	};

	//! Lookup via DNS.
	struct bind_t
	{
		[[nodiscard]]
		bool
		operator==( const bind_t & ) const noexcept { return true; }
	};

	//! Any other value. It's stored as is.
	struct extra_t
	{
		std::string m_name;

		[[nodiscard]]
		bool
		operator==( const extra_t & b ) const noexcept
		{
			return m_name == b.m_name;
		}
	};

	using value_t = std::variant< file_t, bind_t, extra_t >;

	value_t m_value;

	[[nodiscard]]
	bool
	operator==( const lookup_t & b ) const noexcept
	{
		return m_value == b.m_value;
	}
};

// For debugging purposes only.
std::ostream &
operator<<( std::ostream & to, const lookup_t & lookup );

//
// family_t
//
/*!
 * @brief An item of `family` directive.
 */
enum class family_t
{
	inet4,
	inet6
};

// For debugging purposes only.
std::ostream &
operator<<( std::ostream & to, family_t family );

//
// config_t
//
/*!
 * @brief The content of resolv.conf.
 *
 * Default values of numeric options are the same as in
 * the classic resolver.
 */
struct config_t
{
	//! Type of storage for nameservers.
	using nameserver_container_t = std::vector< ip_t >;

	//! Type of storage for search domains.
	using search_list_t = std::vector< std::string >;

	//! Type of storage for sortlist.
	using sortlist_container_t = std::vector< network_t >;

	using lookup_container_t = std::vector< lookup_t >;

	using family_container_t = std::vector< family_t >;

	/*!
	 * @brief Nameservers in the order of appearance.
	 *
	 * Duplicates are allowed.
	 */
	nameserver_container_t m_nameservers;

	/*!
	 * @brief Local domain name.
	 *
	 * Please use set_domain() for changing this value.
	 */
	std::optional< std::string > m_domain;

	/*!
	 * @brief Search list for host-name lookup.
	 *
	 * Please use set_search() for changing this value.
	 */
	search_list_t m_search;

	//! Networks for sorting addresses returned by name resolution.
	sortlist_container_t m_sortlist;

	/*!
	 * @name Values of `options` directive.
	 * @{
	 */
	bool m_debug{ false };
	//! Dots required in a name before an initial absolute query.
	std::uint32_t m_ndots{ 1u };
	//! Time-out for a single query, in seconds.
	std::uint32_t m_timeout{ 5u };
	//! Number of attempts before giving up.
	std::uint32_t m_attempts{ 2u };
	bool m_rotate{ false };
	bool m_no_check_names{ false };
	bool m_inet6{ false };
	bool m_ip6_bytestring{ false };
	bool m_ip6_dotint{ false };
	bool m_edns0{ false };
	bool m_single_request{ false };
	bool m_single_request_reopen{ false };
	bool m_no_reload{ false };
	bool m_trust_ad{ false };
	bool m_no_tld_query{ false };
	bool m_use_vc{ false };
	/*!
	 * @}
	 */

	//! Lookup order. Used by some BSD systems.
	lookup_container_t m_lookup;

	//! Address families for lookups. Used by some BSD systems.
	family_container_t m_family;

	/*!
	 * @brief Set the local domain name.
	 *
	 * `domain` and `search` are mutually exclusive, so the search
	 * list is cleared.
	 */
	void
	set_domain( std::string domain );

	/*!
	 * @brief Set the search list.
	 *
	 * `domain` and `search` are mutually exclusive, so the local
	 * domain name is cleared.
	 */
	void
	set_search( search_list_t search );

	/*!
	 * @brief Get the search list that should be used for lookups.
	 *
	 * It's m_search if it isn't empty, or the local domain name if
	 * it's set. Otherwise an empty list is returned.
	 */
	[[nodiscard]]
	search_list_t
	search_list() const;

	/*!
	 * @brief Get nameservers to be used.
	 *
	 * If there are no nameservers in the config then the local
	 * nameserver is assumed (127.0.0.1 and ::1).
	 */
	[[nodiscard]]
	nameserver_container_t
	nameservers_or_local() const;

	[[nodiscard]]
	bool
	operator==( const config_t & b ) const;

	[[nodiscard]]
	bool
	operator!=( const config_t & b ) const
	{
		return !( *this == b );
	}
};

// For debugging purposes only.
std::ostream &
operator<<( std::ostream & to, const config_t & cfg );

} /* namespace resolvconf */
