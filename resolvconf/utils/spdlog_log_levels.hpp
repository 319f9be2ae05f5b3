/*!
 * @file
 * @brief Helpers for working with spdlog's severity levels.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace resolvconf::utils
{

//! Names of log-levels that can be used in command line.
[[nodiscard]]
inline const auto &
spdlog_level_names() noexcept
{
	using item_t = std::pair< std::string_view, spdlog::level::level_enum >;

	static const std::array< item_t, 7u > names{
		item_t{ "trace", spdlog::level::trace },
		item_t{ "debug", spdlog::level::debug },
		item_t{ "info", spdlog::level::info },
		item_t{ "warn", spdlog::level::warn },
		item_t{ "error", spdlog::level::err },
		item_t{ "crit", spdlog::level::critical },
		item_t{ "off", spdlog::level::off }
	};

	return names;
}

[[nodiscard]]
inline std::optional< spdlog::level::level_enum >
name_to_spdlog_level_enum( std::string_view name ) noexcept
{
	const auto & names = spdlog_level_names();
	const auto it = std::find_if( names.begin(), names.end(),
			[name]( const auto & item ) { return item.first == name; } );
	if( it == names.end() )
		return std::nullopt;

	return it->second;
}

//! All names of log-levels separated by '|'.
[[nodiscard]]
inline std::string
spdlog_level_names_list()
{
	std::string result;
	for( const auto & item : spdlog_level_names() )
	{
		if( !result.empty() )
			result += '|';
		result += item.first;
	}

	return result;
}

} /* namespace resolvconf::utils */
