/*!
 * @file
 * @brief Errors that can be detected during parsing of resolv.conf.
 */

#include <resolvconf/parse_error.hpp>

#include <resolvconf/utils/overloaded.hpp>

#include <fmt/format.h>

namespace resolvconf
{

[[nodiscard]]
line_number_t
line_of( const parse_error_t & err ) noexcept
{
	return std::visit( []( const auto & e ) noexcept { return e.m_line; }, err );
}

[[nodiscard]]
std::string
describe( const parse_error_t & err )
{
	using namespace parse_errors;

	return std::visit( utils::overloaded{
			[]( const invalid_utf8_t & e ) {
				return fmt::format( "bad unicode at line {}: {} from index {}",
						e.m_line,
						e.m_cause.m_incomplete ?
								"incomplete utf-8 byte sequence" :
								"invalid utf-8 sequence",
						e.m_cause.m_valid_up_to );
			},
			[]( const invalid_value_t & e ) {
				return fmt::format( "directive at line {} is improperly formatted "
						"or contains invalid value", e.m_line );
			},
			[]( const invalid_option_value_t & e ) {
				return fmt::format( "directive options at line {} contains invalid "
						"value of some option", e.m_line );
			},
			[]( const invalid_option_t & e ) {
				return fmt::format( "option at line {} is not recognized",
						e.m_line );
			},
			[]( const invalid_directive_t & e ) {
				return fmt::format( "directive at line {} is not recognized",
						e.m_line );
			},
			[]( const invalid_ip_t & e ) {
				return fmt::format( "directive at line {} contains invalid IP: {}",
						e.m_line, describe( e.m_cause ) );
			},
			[]( const extra_data_t & e ) {
				return fmt::format( "extra data at the end of the line {}",
						e.m_line );
			}
		},
		err );
}

std::ostream &
operator<<( std::ostream & to, const parse_error_t & err )
{
	return (to << describe( err ));
}

} /* namespace resolvconf */
