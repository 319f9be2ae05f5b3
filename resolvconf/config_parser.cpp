/*!
 * @file
 * @brief Parser for the content of resolv.conf.
 */

#include <resolvconf/config_parser.hpp>

#include <resolvconf/utils/line_reader.hpp>
#include <resolvconf/utils/tokenizer.hpp>
#include <resolvconf/utils/utf8_check.hpp>

#include <restinio/helpers/easy_parser.hpp>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace resolvconf
{

namespace parse_config_impl
{

struct success_t {};

using command_handling_result_t = std::variant< success_t, parse_error_t >;

//! Arguments of a directive (all tokens except the directive name).
using arguments_t = utils::token_container_t;

class command_handler_t
{
public:
	virtual ~command_handler_t() = default;

	[[nodiscard]]
	virtual command_handling_result_t
	try_handle(
		line_number_t line,
		const arguments_t & args,
		config_t & current_cfg ) const = 0;
};

using command_handler_unique_ptr_t = std::unique_ptr< command_handler_t >;

namespace parsers
{

//
// try_parse_uint32
//
/*!
 * @brief An attempt to parse a non-negative decimal number.
 *
 * The whole @a value should be consumed. Values that don't fit
 * into 32 bits are rejected. A single leading '+' is allowed.
 */
[[nodiscard]]
static std::optional< std::uint32_t >
try_parse_uint32( std::string_view value )
{
	using namespace restinio::easy_parser;

	if( !value.empty() && '+' == value.front() )
		value.remove_prefix( 1u );

	auto r = try_parse(
			value,
			non_negative_decimal_number_p< std::uint32_t >() );
	if( !r )
		return std::nullopt;

	return *r;
}

} /* namespace parsers */

//
// nameserver_handler_t
//
/*!
 * @brief Handler for `nameserver` directive.
 *
 * Expects exactly one address. New address is added to
 * the end of the list.
 */
class nameserver_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		line_number_t line,
		const arguments_t & args,
		config_t & current_cfg ) const override
	{
		if( args.empty() )
			return parse_errors::invalid_value_t{ line };

		auto ip = parse_ip( args.front() );
		if( !ip )
			return parse_errors::invalid_ip_t{ line, ip.error() };

		if( args.size() > 1u )
			return parse_errors::extra_data_t{ line };

		current_cfg.m_nameservers.push_back( std::move(*ip) );

		return success_t{};
	}
};

//
// domain_handler_t
//
/*!
 * @brief Handler for `domain` directive.
 */
class domain_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		line_number_t line,
		const arguments_t & args,
		config_t & current_cfg ) const override
	{
		if( args.empty() )
			return parse_errors::invalid_value_t{ line };

		if( args.size() > 1u )
			return parse_errors::extra_data_t{ line };

		current_cfg.set_domain( std::string{ args.front() } );

		return success_t{};
	}
};

//
// search_handler_t
//
/*!
 * @brief Handler for `search` directive.
 *
 * The previous search list is replaced even if the new one is empty.
 */
class search_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		line_number_t /*line*/,
		const arguments_t & args,
		config_t & current_cfg ) const override
	{
		config_t::search_list_t search;
		search.reserve( args.size() );
		std::transform( args.begin(), args.end(),
				std::back_inserter( search ),
				[]( std::string_view v ) { return std::string{ v }; } );

		current_cfg.set_search( std::move(search) );

		return success_t{};
	}
};

//
// sortlist_handler_t
//
/*!
 * @brief Handler for `sortlist` directive.
 *
 * The previous sortlist is dropped.
 */
class sortlist_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		line_number_t line,
		const arguments_t & args,
		config_t & current_cfg ) const override
	{
		current_cfg.m_sortlist.clear();

		for( const auto & a : args )
		{
			auto net = parse_network( a );
			if( !net )
				return parse_errors::invalid_ip_t{ line, net.error() };

			current_cfg.m_sortlist.push_back( std::move(*net) );
		}

		return success_t{};
	}
};

//
// option_handler_t
//
/*!
 * @brief Interface for a handler of a single item of `options` directive.
 */
class option_handler_t
{
public:
	virtual ~option_handler_t() = default;

	[[nodiscard]]
	virtual command_handling_result_t
	try_handle(
		line_number_t line,
		std::optional< std::string_view > value,
		config_t & current_cfg ) const = 0;
};

using option_handler_unique_ptr_t = std::unique_ptr< option_handler_t >;

//
// flag_option_handler_t
//
/*!
 * @brief Handler for boolean options.
 *
 * A value of the option is ignored if present.
 */
template< bool config_t::*Field, bool Value >
class flag_option_handler_t : public option_handler_t
{
public:
	command_handling_result_t
	try_handle(
		line_number_t /*line*/,
		std::optional< std::string_view > /*value*/,
		config_t & current_cfg ) const override
	{
		current_cfg.*Field = Value;

		return success_t{};
	}
};

//
// numeric_option_handler_t
//
/*!
 * @brief Handler for `ndots`, `timeout`, `attempts` options.
 */
template< std::uint32_t config_t::*Field >
class numeric_option_handler_t : public option_handler_t
{
public:
	command_handling_result_t
	try_handle(
		line_number_t line,
		std::optional< std::string_view > value,
		config_t & current_cfg ) const override
	{
		if( !value )
			return parse_errors::invalid_option_value_t{ line };

		const auto v = parsers::try_parse_uint32( *value );
		if( !v )
			return parse_errors::invalid_option_value_t{ line };

		current_cfg.*Field = *v;

		return success_t{};
	}
};

//
// options_handler_t
//
/*!
 * @brief Handler for `options` directive.
 *
 * Every argument has the form `name` or `name:value`.
 */
class options_handler_t : public command_handler_t
{
	using option_map_t = std::map<
			std::string,
			option_handler_unique_ptr_t,
			std::less<> >;

	option_map_t m_options;

	template< bool config_t::*Field, bool Value = true >
	void
	add_flag( std::string name )
	{
		m_options.emplace(
				std::move(name),
				std::make_unique< flag_option_handler_t< Field, Value > >() );
	}

	template< std::uint32_t config_t::*Field >
	void
	add_numeric( std::string name )
	{
		m_options.emplace(
				std::move(name),
				std::make_unique< numeric_option_handler_t< Field > >() );
	}

	/*!
	 * @return nullptr, if option handler isn't found.
	 */
	[[nodiscard]]
	const option_handler_t *
	find_option_handler( std::string_view name ) const noexcept
	{
		const auto it = m_options.find( name );
		if( it != m_options.end() )
			return it->second.get();
		else
			return nullptr;
	}

public:
	options_handler_t()
	{
		add_flag< &config_t::m_debug >( "debug" );
		add_flag< &config_t::m_rotate >( "rotate" );
		add_flag< &config_t::m_no_check_names >( "no-check-names" );
		add_flag< &config_t::m_inet6 >( "inet6" );
		add_flag< &config_t::m_ip6_bytestring >( "ip6-bytestring" );
		add_flag< &config_t::m_ip6_dotint >( "ip6-dotint" );
		add_flag< &config_t::m_ip6_dotint, false >( "no-ip6-dotint" );
		add_flag< &config_t::m_edns0 >( "edns0" );
		add_flag< &config_t::m_single_request >( "single-request" );
		add_flag< &config_t::m_single_request_reopen >(
				"single-request-reopen" );
		add_flag< &config_t::m_no_reload >( "no-reload" );
		add_flag< &config_t::m_trust_ad >( "trust-ad" );
		add_flag< &config_t::m_no_tld_query >( "no-tld-query" );
		add_flag< &config_t::m_use_vc >( "use-vc" );

		add_numeric< &config_t::m_ndots >( "ndots" );
		add_numeric< &config_t::m_timeout >( "timeout" );
		add_numeric< &config_t::m_attempts >( "attempts" );
	}

	command_handling_result_t
	try_handle(
		line_number_t line,
		const arguments_t & args,
		config_t & current_cfg ) const override
	{
		for( const auto & a : args )
		{
			std::string_view name = a;
			std::optional< std::string_view > value;

			if( const auto colon = a.find( ':' );
					std::string_view::npos != colon )
			{
				name = a.substr( 0u, colon );
				value = a.substr( colon + 1u );

				// Only one value is allowed.
				if( std::string_view::npos != value->find( ':' ) )
					return parse_errors::extra_data_t{ line };
			}

			const auto handler = find_option_handler( name );
			if( !handler )
				return parse_errors::invalid_option_t{ line };

			auto r = handler->try_handle( line, value, current_cfg );
			if( std::holds_alternative< parse_error_t >( r ) )
				return r;
		}

		return success_t{};
	}
};

//
// lookup_handler_t
//
/*!
 * @brief Handler for `lookup` directive.
 *
 * Unknown values are accepted and stored as is.
 */
class lookup_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		line_number_t /*line*/,
		const arguments_t & args,
		config_t & current_cfg ) const override
	{
		for( const auto & a : args )
		{
			if( "file" == a )
				current_cfg.m_lookup.push_back( lookup_t{ lookup_t::file_t{} } );
			else if( "bind" == a )
				current_cfg.m_lookup.push_back( lookup_t{ lookup_t::bind_t{} } );
			else
				current_cfg.m_lookup.push_back(
						lookup_t{ lookup_t::extra_t{ std::string{ a } } } );
		}

		return success_t{};
	}
};

//
// family_handler_t
//
/*!
 * @brief Handler for `family` directive.
 *
 * Only `inet4` and `inet6` are allowed.
 */
class family_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		line_number_t line,
		const arguments_t & args,
		config_t & current_cfg ) const override
	{
		for( const auto & a : args )
		{
			if( "inet4" == a )
				current_cfg.m_family.push_back( family_t::inet4 );
			else if( "inet6" == a )
				current_cfg.m_family.push_back( family_t::inet6 );
			else
				return parse_errors::invalid_value_t{ line };
		}

		return success_t{};
	}
};

//
// line_reader_t
//
using line_reader_t = ::resolvconf::utils::line_reader_t;

} /* namespace parse_config_impl */

//
// config_parser_t::parser_exception_t
//
config_parser_t::parser_exception_t::parser_exception_t(
	parse_error_t error )
	:	exception_t{ "resolvconf: " + describe( error ) }
	,	m_error{ std::move(error) }
{}

//
// config_parser_t::impl_t
//
struct config_parser_t::impl_t
{
	using command_map_t = std::map<
			std::string,
			parse_config_impl::command_handler_unique_ptr_t,
			std::less<> >;

	command_map_t m_commands;

	/*!
	 * @return nullptr, if command handler isn't found.
	 */
	[[nodiscard]]
	const parse_config_impl::command_handler_t *
	find_command_handler( std::string_view name ) const noexcept
	{
		const auto it = m_commands.find( name );
		if( it != m_commands.end() )
			return it->second.get();
		else
			return nullptr;
	}

	//! Processing of a single line.
	[[nodiscard]]
	parse_config_impl::command_handling_result_t
	handle_line(
		const parse_config_impl::line_reader_t::line_t & line,
		config_t & current_cfg ) const
	{
		using namespace parse_config_impl;

		if( const auto utf8_error = utils::check_utf8( line.content() );
				utf8_error )
		{
			return parse_errors::invalid_utf8_t{ line.number(), *utf8_error };
		}

		auto tokens = utils::split_to_tokens(
				utils::strip_inline_comment( line.content() ) );
		if( tokens.empty() )
			// There was only a comment after some spaces.
			return success_t{};

		const auto handler = find_command_handler( tokens.front() );
		if( !handler )
			return parse_errors::invalid_directive_t{ line.number() };

		// Only arguments are passed to the handler.
		tokens.erase( tokens.begin() );

		return handler->try_handle( line.number(), tokens, current_cfg );
	}
};

//
// config_parser_t
//
config_parser_t::config_parser_t()
	:	m_impl{ new impl_t{} }
{
	using namespace parse_config_impl;
	using namespace std::string_literals;

	m_impl->m_commands.emplace(
			"nameserver"s,
			std::make_unique< nameserver_handler_t >() );
	m_impl->m_commands.emplace(
			"domain"s,
			std::make_unique< domain_handler_t >() );
	m_impl->m_commands.emplace(
			"search"s,
			std::make_unique< search_handler_t >() );
	m_impl->m_commands.emplace(
			"sortlist"s,
			std::make_unique< sortlist_handler_t >() );
	m_impl->m_commands.emplace(
			"options"s,
			std::make_unique< options_handler_t >() );
	m_impl->m_commands.emplace(
			"lookup"s,
			std::make_unique< lookup_handler_t >() );
	m_impl->m_commands.emplace(
			"family"s,
			std::make_unique< family_handler_t >() );
}

config_parser_t::~config_parser_t()
{}

[[nodiscard]]
parse_result_t
config_parser_t::try_parse( std::string_view content ) const
{
	using namespace parse_config_impl;

	config_t result;
	std::optional< parse_error_t > error;

	line_reader_t line_reader{ content };
	line_reader.for_each_line( [&]( const line_reader_t::line_t & line ) {
			auto handling_result = m_impl->handle_line( line, result );
			if( auto * failure = std::get_if< parse_error_t >( &handling_result ) )
			{
				error = std::move(*failure);
				return line_reader_t::next_step_t::stop;
			}

			return line_reader_t::next_step_t::go_on;
		} );

	if( error )
		return restinio::make_unexpected( std::move(*error) );

	return parse_result_t{ std::move(result) };
}

[[nodiscard]]
config_t
config_parser_t::parse( std::string_view content ) const
{
	auto result = try_parse( content );
	if( !result )
		throw parser_exception_t{ std::move(result.error()) };

	return std::move(*result);
}

} /* namespace resolvconf */
