/*!
 * @file
 * @brief Helper for checking the validity of UTF-8 text.
 */

#pragma once

#include <restinio/utils/utf8_checker.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace resolvconf::utils
{

//
// utf8_error_t
//
/*!
 * @brief Description of a problem found in UTF-8 text.
 */
struct utf8_error_t
{
	//! Length of the valid prefix of the text.
	/*!
	 * It is also the index of the first byte of the broken sequence.
	 */
	std::size_t m_valid_up_to;

	//! Is the text ended in the middle of a multibyte sequence?
	/*!
	 * If false then an unexpected byte was found.
	 */
	bool m_incomplete;

	[[nodiscard]]
	bool
	operator==( const utf8_error_t & b ) const noexcept
	{
		return m_valid_up_to == b.m_valid_up_to
				&& m_incomplete == b.m_incomplete;
	}
};

namespace impl
{

//
// is_valid_sequence_prefix
//
/*!
 * @brief Can @a prefix be completed to a valid UTF-8 sequence?
 *
 * Only the leading byte and the second byte are inspected: they
 * define whether the sequence is overlong, a surrogate, or is
 * out of Unicode range. Subsequent bytes are expected to be
 * continuation bytes already.
 */
[[nodiscard]]
inline bool
is_valid_sequence_prefix( std::string_view prefix ) noexcept
{
	if( prefix.empty() )
		return true;

	const auto lead = static_cast< std::uint8_t >( prefix[ 0 ] );

	std::uint8_t low = 0x80u;
	std::uint8_t high = 0xBFu;
	if( lead < 0xC2u || lead > 0xF4u )
		return false;
	else if( 0xE0u == lead )
		low = 0xA0u;
	else if( 0xEDu == lead )
		high = 0x9Fu;
	else if( 0xF0u == lead )
		low = 0x90u;
	else if( 0xF4u == lead )
		high = 0x8Fu;

	if( prefix.size() < 2u )
		return true;

	const auto second = static_cast< std::uint8_t >( prefix[ 1 ] );
	return second >= low && second <= high;
}

} /* namespace impl */

//
// check_utf8
//
/*!
 * @return std::nullopt if @a text is a valid UTF-8 sequence.
 */
[[nodiscard]]
inline std::optional< utf8_error_t >
check_utf8( std::string_view text ) noexcept
{
	restinio::utils::utf8_checker_t checker;

	// Index of the first byte of the current symbol.
	std::size_t symbol_start{ 0u };

	for( std::size_t i = 0u; i != text.size(); ++i )
	{
		if( !checker.process_byte( static_cast< std::uint8_t >( text[ i ] ) ) )
			return utf8_error_t{ symbol_start, false };

		if( checker.finalized() )
			symbol_start = i + 1u;
	}

	// A sequence that can't be completed is reported as invalid
	// even if it is cut by the end of the text.
	if( !checker.finalized() )
		return utf8_error_t{
				symbol_start,
				impl::is_valid_sequence_prefix( text.substr( symbol_start ) )
			};

	return std::nullopt;
}

} /* namespace resolvconf::utils */
