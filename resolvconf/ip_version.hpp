/*!
 * @file
 * @brief Definition of ip_version type.
 */

#pragma once

#include <ostream>

namespace resolvconf
{

//! Enumeration for available IP versions.
enum class ip_version_t
{
	ip_v4,
	ip_v6
};

// For debugging purposes only.
inline std::ostream &
operator<<( std::ostream & to, ip_version_t v )
{
	return (to << (ip_version_t::ip_v4 == v ? "IPv4" : "IPv6"));
}

} /* namespace resolvconf */
