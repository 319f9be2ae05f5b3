/*!
 * @file
 * @brief A tool for spliting a char array into lines.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace resolvconf::utils
{

//
// line_extractor_t
//
/*!
 * @brief A helper class for line-by-line extraction of the content
 * of previously loaded file.
 *
 * The content is split by '\n' symbols only. Line numbers start from 0.
 *
 * This class counts line numbers and skips lines with comments.
 * A line is treated as a comment if the first symbol that is neither
 * a space nor a tab is '#' or ';'. The content of comment lines isn't
 * inspected at all, so it can contain arbitrary bytes.
 *
 * Lines that contain only spaces and tabs are ignored too.
 *
 * Extracted lines are returned as is (without the trailing '\n').
 */
class line_extractor_t
{
public:
	//! Type for holding line numbers.
	using line_number_t = std::size_t;

private:
	[[nodiscard]]
	static constexpr std::string_view
	leading_spaces() noexcept { return { " \t" }; }

	std::string_view m_content;

	//! Is there something to extract?
	/*!
	 * Becomes false after the extraction of the last line.
	 * Please note that an empty content still has one (empty) line.
	 */
	bool m_has_more{ true };

	//! Number of the line to be extracted by the next get_next() call.
	line_number_t m_next_line_number{ 0u };

	//! Number of the line returned by the last get_next() call.
	line_number_t m_line_number{ 0u };

	[[nodiscard]]
	static bool
	should_be_skipped( std::string_view line ) noexcept
	{
		const auto pos = line.find_first_not_of( leading_spaces() );
		if( std::string_view::npos == pos )
			// Nothing but spaces.
			return true;

		const auto front_ch = line[ pos ];
		return '#' == front_ch || ';' == front_ch;
	}

	[[nodiscard]]
	std::string_view
	extract_current_line() noexcept
	{
		std::string_view result;

		const auto eol = m_content.find( '\n' );
		if( std::string_view::npos == eol )
		{
			result = m_content;
			m_content = std::string_view{};
			m_has_more = false;
		}
		else
		{
			result = m_content.substr( 0u, eol );
			m_content.remove_prefix( eol + 1u );
		}

		m_line_number = m_next_line_number;
		++m_next_line_number;

		return result;
	}

public:
	line_extractor_t( std::string_view content ) noexcept
		:	m_content{ content }
	{}

	//! Number of the line returned by the last successful get_next().
	[[nodiscard]]
	auto
	line_number() const noexcept { return m_line_number; }

	[[nodiscard]]
	std::optional< std::string_view >
	get_next() noexcept
	{
		std::optional< std::string_view > result{ std::nullopt };

		while( !result && m_has_more )
		{
			const auto line = extract_current_line();
			if( !should_be_skipped( line ) )
				result = line;
		}

		// We are here in two cases only:
		// - the next line extracted;
		// - the end of the content reached.
		return result;
	}
};

} /* namespace resolvconf::utils */
