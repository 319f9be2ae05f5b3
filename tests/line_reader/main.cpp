#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <resolvconf/utils/line_reader.hpp>
#include <resolvconf/utils/tokenizer.hpp>
#include <resolvconf/utils/utf8_check.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace std::string_view_literals;

namespace
{

using line_info_t = std::pair< std::size_t, std::string >;
using lines_t = std::vector< line_info_t >;

[[nodiscard]]
lines_t
collect_lines( std::string_view content )
{
	using resolvconf::utils::line_reader_t;

	lines_t result;

	line_reader_t reader{ content };
	reader.for_each_line( [&]( const line_reader_t::line_t & line ) {
			result.emplace_back( line.number(), std::string{ line.content() } );
			return line_reader_t::next_step_t::go_on;
		} );

	return result;
}

} /* namespace anonymous */

TEST_CASE("line_extractor") {
	using resolvconf::utils::line_extractor_t;

	{
		line_extractor_t extractor{ ""sv };
		REQUIRE( !extractor.get_next() );
	}

	{
		line_extractor_t extractor{ "first\n\nthird"sv };

		auto r = extractor.get_next();
		REQUIRE( r );
		REQUIRE( "first"sv == *r );
		REQUIRE( 0u == extractor.line_number() );

		r = extractor.get_next();
		REQUIRE( r );
		REQUIRE( "third"sv == *r );
		REQUIRE( 2u == extractor.line_number() );

		REQUIRE( !extractor.get_next() );
		REQUIRE( !extractor.get_next() );
	}
}

TEST_CASE("comments and empty lines are skipped") {
	const auto lines = collect_lines(
R"(# comment
; comment
  	# comment with leading spaces
first line

  	 
second line # with comment
	third line
)"sv );

	REQUIRE( lines == lines_t{
			{ 3u, "first line" },
			{ 6u, "second line # with comment" },
			{ 7u, "\tthird line" }
		} );
}

TEST_CASE("only '\\n' separates lines") {
	const auto lines = collect_lines( "first\r\nsecond\rstill second\n"sv );

	REQUIRE( lines == lines_t{
			{ 0u, "first\r" },
			{ 1u, "second\rstill second" }
		} );
}

TEST_CASE("comment lines aren't inspected") {
	const std::string content = "#\xff\xfe\n;\x80\nok\n";

	const auto lines = collect_lines( content );

	REQUIRE( lines == lines_t{ { 2u, "ok" } } );
}

TEST_CASE("iteration can be stopped") {
	using resolvconf::utils::line_reader_t;

	std::size_t calls{};

	line_reader_t reader{ "a\nb\nc\n"sv };
	reader.for_each_line( [&]( const line_reader_t::line_t & line ) {
			++calls;
			return 1u == line.number() ?
					line_reader_t::next_step_t::stop :
					line_reader_t::next_step_t::go_on;
		} );

	REQUIRE( 2u == calls );
}

TEST_CASE("strip_inline_comment") {
	using resolvconf::utils::strip_inline_comment;

	REQUIRE( "nameserver 1.1.1.1 "sv ==
			strip_inline_comment( "nameserver 1.1.1.1 # comment"sv ) );
	REQUIRE( "search a"sv == strip_inline_comment( "search a;b#c"sv ) );
	REQUIRE( "search a"sv == strip_inline_comment( "search a#b;c"sv ) );
	REQUIRE( "search"sv == strip_inline_comment( "search"sv ) );
	REQUIRE( ""sv == strip_inline_comment( "#"sv ) );
}

TEST_CASE("split_to_tokens") {
	using resolvconf::utils::split_to_tokens;
	using resolvconf::utils::token_container_t;

	REQUIRE( split_to_tokens( ""sv ).empty() );
	REQUIRE( split_to_tokens( " \t\r "sv ).empty() );

	REQUIRE( split_to_tokens( "search a b"sv ) ==
			token_container_t{ "search"sv, "a"sv, "b"sv } );
	REQUIRE( split_to_tokens( "\t search\t\ta  b \r"sv ) ==
			token_container_t{ "search"sv, "a"sv, "b"sv } );
	REQUIRE( split_to_tokens( "options\x0bndots:1\x0c"sv ) ==
			token_container_t{ "options"sv, "ndots:1"sv } );
}

TEST_CASE("split_to_tokens with unicode spaces") {
	using resolvconf::utils::split_to_tokens;
	using resolvconf::utils::token_container_t;

	// NO-BREAK SPACE (U+00A0).
	REQUIRE( split_to_tokens( "nameserver\xc2\xa0" "8.8.8.8"sv ) ==
			token_container_t{ "nameserver"sv, "8.8.8.8"sv } );

	// IDEOGRAPHIC SPACE (U+3000).
	REQUIRE( split_to_tokens( "search a\xe3\x80\x80" "b"sv ) ==
			token_container_t{ "search"sv, "a"sv, "b"sv } );

	// NEXT LINE (U+0085), OGHAM SPACE MARK (U+1680), EN QUAD (U+2000),
	// HAIR SPACE (U+200A), LINE SEPARATOR (U+2028),
	// PARAGRAPH SEPARATOR (U+2029), NARROW NO-BREAK SPACE (U+202F),
	// MEDIUM MATHEMATICAL SPACE (U+205F).
	REQUIRE( split_to_tokens(
				"\xc2\x85" "a\xe1\x9a\x80" "b\xe2\x80\x80" "c\xe2\x80\x8a"
				"d\xe2\x80\xa8" "e\xe2\x80\xa9" "f\xe2\x80\xaf"
				"g\xe2\x81\x9f"sv ) ==
			token_container_t{
				"a"sv, "b"sv, "c"sv, "d"sv, "e"sv, "f"sv, "g"sv } );

	// Only separators.
	REQUIRE( split_to_tokens( "\xc2\xa0 \xe3\x80\x80\t"sv ).empty() );

	// Non-space multibyte symbols stay inside tokens.
	// ZERO WIDTH SPACE (U+200B) isn't a White_Space symbol.
	REQUIRE( split_to_tokens( "search \xc3\xa9t\xc3\xa9 x\xe2\x80\x8by"sv ) ==
			token_container_t{
				"search"sv, "\xc3\xa9t\xc3\xa9"sv, "x\xe2\x80\x8by"sv } );
}

TEST_CASE("check_utf8") {
	using resolvconf::utils::check_utf8;
	using resolvconf::utils::utf8_error_t;

	REQUIRE( !check_utf8( ""sv ) );
	REQUIRE( !check_utf8( "plain ascii"sv ) );
	REQUIRE( !check_utf8( "\xc3\xa9t\xc3\xa9"sv ) );
	REQUIRE( !check_utf8( "\xf0\x9f\x98\x80"sv ) );

	{
		const auto r = check_utf8( "ab\xff"sv );
		REQUIRE( r );
		REQUIRE( utf8_error_t{ 2u, false } == *r );
	}

	{
		const auto r = check_utf8( "ab\xc3\xa9" "cd\xe2\x82"sv );
		REQUIRE( r );
		REQUIRE( utf8_error_t{ 6u, true } == *r );
	}

	{
		// A continuation byte without a leading one.
		const auto r = check_utf8( "\x80"sv );
		REQUIRE( r );
		REQUIRE( utf8_error_t{ 0u, false } == *r );
	}

	{
		// A leading byte followed by an ASCII symbol.
		const auto r = check_utf8( "x\xc3y"sv );
		REQUIRE( r );
		REQUIRE( utf8_error_t{ 1u, false } == *r );
	}

	{
		// Truncated, but the second byte makes the sequence overlong.
		const auto r = check_utf8( "ab\xe0\x80"sv );
		REQUIRE( r );
		REQUIRE( utf8_error_t{ 2u, false } == *r );
	}

	{
		// Truncated surrogate.
		const auto r = check_utf8( "\xed\xa0"sv );
		REQUIRE( r );
		REQUIRE( utf8_error_t{ 0u, false } == *r );
	}

	{
		// Truncated sequence beyond U+10FFFF.
		const auto r = check_utf8( "a\xf4\x90\x80"sv );
		REQUIRE( r );
		REQUIRE( utf8_error_t{ 1u, false } == *r );
	}

	{
		// Truncated, but can be completed.
		const auto r = check_utf8( "a\xe0\xa0"sv );
		REQUIRE( r );
		REQUIRE( utf8_error_t{ 1u, true } == *r );
	}
}
