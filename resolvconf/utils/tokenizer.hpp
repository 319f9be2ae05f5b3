/*!
 * @file
 * @brief Helpers for splitting a line into whitespace-separated tokens.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace resolvconf::utils
{

//! Type of container for tokens of a single line.
/*!
 * Tokens refer to the content of the source buffer.
 */
using token_container_t = std::vector< std::string_view >;

namespace impl
{

//
// is_space_code_point
//
//! Is @a cp a whitespace symbol from Unicode White_Space property?
/*!
 * '\r' is here to handle files with CRLF line endings.
 */
[[nodiscard]]
inline constexpr bool
is_space_code_point( char32_t cp ) noexcept
{
	return ( cp >= 0x09u && cp <= 0x0Du )
			|| 0x20u == cp
			|| 0x85u == cp
			|| 0xA0u == cp
			|| 0x1680u == cp
			|| ( cp >= 0x2000u && cp <= 0x200Au )
			|| 0x2028u == cp
			|| 0x2029u == cp
			|| 0x202Fu == cp
			|| 0x205Fu == cp
			|| 0x3000u == cp;
}

//
// decoded_symbol_t
//
//! A symbol decoded from UTF-8 text.
struct decoded_symbol_t
{
	char32_t m_code_point;
	//! Count of bytes occupied by the symbol.
	std::size_t m_length;
};

//
// decode_symbol_at
//
/*!
 * @brief Decodes the symbol that starts at @a pos.
 *
 * @a line is expected to be valid UTF-8 text. A truncated sequence
 * is treated as a symbol with code point 0xFFFD that occupies the
 * rest of the line.
 */
[[nodiscard]]
inline decoded_symbol_t
decode_symbol_at( std::string_view line, std::size_t pos ) noexcept
{
	const auto byte_at = [line]( std::size_t i ) -> char32_t {
		return static_cast< unsigned char >( line[ i ] );
	};

	const char32_t lead = byte_at( pos );

	std::size_t length = 1u;
	char32_t cp = lead;
	if( lead >= 0xF0u ) { length = 4u; cp = lead & 0x07u; }
	else if( lead >= 0xE0u ) { length = 3u; cp = lead & 0x0Fu; }
	else if( lead >= 0xC0u ) { length = 2u; cp = lead & 0x1Fu; }

	if( line.size() - pos < length )
		return { 0xFFFDu, line.size() - pos };

	for( std::size_t i = 1u; i != length; ++i )
		cp = ( cp << 6u ) | ( byte_at( pos + i ) & 0x3Fu );

	return { cp, length };
}

} /* namespace impl */

//
// strip_inline_comment
//
/*!
 * @brief Removes everything starting from the first '#' or ';'.
 */
[[nodiscard]]
inline std::string_view
strip_inline_comment( std::string_view line ) noexcept
{
	return line.substr( 0u, line.find_first_of( "#;" ) );
}

//
// split_to_tokens
//
/*!
 * @brief Splits @a line by runs of whitespace symbols.
 *
 * @a line must already be checked for UTF-8 validity. All symbols
 * with Unicode White_Space property act as separators, not only
 * ASCII ones.
 *
 * There is no quoting or escaping. Leading and trailing spaces
 * are ignored, so an empty container is returned for an empty line.
 */
[[nodiscard]]
inline token_container_t
split_to_tokens( std::string_view line )
{
	token_container_t result;

	std::optional< std::size_t > token_start;
	std::size_t pos = 0u;
	while( pos < line.size() )
	{
		const auto symbol = impl::decode_symbol_at( line, pos );
		if( impl::is_space_code_point( symbol.m_code_point ) )
		{
			if( token_start )
			{
				result.push_back(
						line.substr( *token_start, pos - *token_start ) );
				token_start = std::nullopt;
			}
		}
		else if( !token_start )
			token_start = pos;

		pos += symbol.m_length;
	}

	if( token_start )
		result.push_back( line.substr( *token_start ) );

	return result;
}

} /* namespace resolvconf::utils */
