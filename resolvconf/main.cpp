#include <resolvconf/config_parser.hpp>

#include <resolvconf/logging/wrap_logging.hpp>

#include <resolvconf/utils/load_file_into_memory.hpp>
#include <resolvconf/utils/spdlog_log_levels.hpp>

#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <args/args.hxx>

#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <fmt/format.h>
#include <fmt/ostream.h>

namespace {

const char version_string[] =
R"ver(resolvconf_dump v.0.1.0
)ver";

const std::string default_config_file = "/etc/resolv.conf";

//
// detect_log_level
//

[[nodiscard]]
spdlog::level::level_enum
detect_log_level(const std::string & name)
{
	const auto r = resolvconf::utils::name_to_spdlog_level_enum( name );

	if( !r )
	{
		throw std::runtime_error( "Unsupported log-level: " + name );
	}

	return *r;
}

//
// cmd_line_args_t
//

//! Command-line arguments.
struct cmd_line_args_t
{
	std::string m_config_file{ default_config_file };

	spdlog::level::level_enum m_log_level{ spdlog::level::warn };

	//! Should effective values be printed too?
	bool m_show_effective{ false };
};

//
// finish_app_ex_t
//

//! An exception for errors related to command-line args parsing.
/*!
 * If such an exception is throw then the application has to be finished.
 */
class finish_app_ex_t : public std::runtime_error {

	int m_exit_code;

public:
	finish_app_ex_t(
		const char * what_arg,
		int exit_code )
	:	std::runtime_error{ what_arg }
	,	m_exit_code{ exit_code }
	{
	}

	int
	exit_code() const noexcept { return m_exit_code; }
};

// Exit codes of the application.
constexpr int exit_code_ok = 0;
constexpr int exit_code_help = 1;
constexpr int exit_code_cmd_line_error = 2;
constexpr int exit_code_parse_error = 3;
constexpr int exit_code_failure = 4;

//
// parse_cmd_line
//

/*!
 * Returns values of command-line args or throws finish_app_ex_t
 * in the case of an error.
 */
[[nodiscard]]
cmd_line_args_t
parse_cmd_line( int argc, char ** argv )
{
	cmd_line_args_t result;

	args::ArgumentParser parser( "resolvconf_dump",
			"Parses resolv.conf file and prints its content" );

	args::HelpFlag help( parser, "help", "Display this help text",
			{ 'h', "help" } );

	args::Flag version(parser, "version", "Show version number",
			{ 'v', "version" } );

	args::ValueFlag< std::string > log_level( parser,
			resolvconf::utils::spdlog_level_names_list(),
			"Set logging level. Value 'off' turns logging off "
			" (default: " + std::string(
				spdlog::level::to_string_view(result.m_log_level).data(),
				spdlog::level::to_string_view(result.m_log_level).size() )
			+ ")",
			{ 'l', "log-level" } );

	args::Flag effective( parser, "effective",
			"Show the effective search list and nameservers",
			{ "effective" } );

	args::Positional< std::string > config_file( parser,
			"FILE", "Path to resolv.conf (default: " +
			default_config_file + ")" );

	try
	{
		parser.ParseCLI( argc, argv );
	}
	catch( const args::Help & /*e*/ )
	{
		std::cout << parser;
		throw finish_app_ex_t( "cmd-line-help", exit_code_help );
	}
	catch( const args::ParseError & e )
	{
		std::cerr << e.what() << std::endl;
		throw finish_app_ex_t( "cmd-line-parse-error", exit_code_cmd_line_error );
	}

	if( version )
	{
		std::cout << version_string << std::endl;
		throw finish_app_ex_t( "show-version-only", exit_code_ok );
	}

	if( log_level )
	{
		try
		{
			result.m_log_level = detect_log_level( args::get( log_level ) );
		}
		catch( const std::exception & x )
		{
			std::cerr << x.what() << std::endl;
			throw finish_app_ex_t( "cmd-line-invalid-log-level",
					exit_code_cmd_line_error );
		}
	}

	if( effective )
		result.m_show_effective = true;

	if( config_file )
		result.m_config_file = args::get( config_file );

	return result;
}

[[nodiscard]]
std::shared_ptr<spdlog::logger>
make_logger( spdlog::level::level_enum level )
{
	// Logs go to stderr, the content of the config goes to stdout.
	auto logger = std::make_shared< spdlog::logger >(
		"resolvconf",
		std::make_shared< spdlog::sinks::stderr_color_sink_mt >() );

	logger->set_level( level );

	return logger;
}

void
print_effective_values( const resolvconf::config_t & cfg )
{
	std::cout << "\neffective search:";
	for( const auto & s : cfg.search_list() )
		std::cout << ' ' << s;

	std::cout << "\neffective nameservers:";
	for( const auto & ns : cfg.nameservers_or_local() )
		std::cout << ' ' << ns;

	std::cout << std::endl;
}

[[nodiscard]]
int
run_app( const cmd_line_args_t & args )
{
	using namespace resolvconf;

	wrap_logging( direct_logging_mode, spdlog::level::debug,
		[&]( auto & logger, auto level ) {
			logger.log( level, "loading {}", args.m_config_file );
		} );

	const auto content = utils::load_file_into_memory( args.m_config_file );

	wrap_logging( direct_logging_mode, spdlog::level::debug,
		[&]( auto & logger, auto level ) {
			logger.log( level, "{} byte(s) loaded", content.size() );
		} );

	const config_parser_t parser;
	const auto result = parser.try_parse(
			std::string_view{ content.data(), content.size() } );
	if( !result )
	{
		wrap_logging( direct_logging_mode, spdlog::level::err,
			[&]( auto & logger, auto level ) {
				logger.log( level, "{}: parse error: {}",
						args.m_config_file,
						describe( result.error() ) );
			} );

		return exit_code_parse_error;
	}

	wrap_logging( direct_logging_mode, spdlog::level::info,
		[&]( auto & logger, auto level ) {
			logger.log( level, "{} parsed: {} nameserver(s), "
					"{} search domain(s), {} sortlist item(s)",
					args.m_config_file,
					result->m_nameservers.size(),
					result->m_search.size(),
					result->m_sortlist.size() );
		} );

	std::cout << *result << std::endl;

	if( args.m_show_effective )
		print_effective_values( *result );

	return exit_code_ok;
}

} /* namespace anonymous */

int
main( int argc, char ** argv )
{
	try
	{
		const auto args = parse_cmd_line( argc, argv );

		resolvconf::logging::logger_holder_t logger_holder{
				make_logger( args.m_log_level )
		};

		try
		{
			return run_app( args );
		}
		catch( const std::exception & x )
		{
			resolvconf::logging::wrap_logging(
					resolvconf::direct_logging_mode,
					spdlog::level::critical,
					[&]( auto & logger, auto level ) {
						logger.log( level, "failure: {}", x.what() );
					} );
		}
	}
	catch( const finish_app_ex_t & ex )
	{
		return ex.exit_code();
	}
	catch( const std::exception & ex )
	{
		std::cerr << "Error: " << ex.what() << std::endl;
	}

	return exit_code_failure;
}
