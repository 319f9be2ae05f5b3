/*!
 * @file
 * @brief Helper function for loading the whole file content into memory.
 */

#pragma once

#include <resolvconf/utils/ensure_successful_syscall.hpp>

#include <resolvconf/exception.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <vector>

namespace resolvconf::utils
{

// An exception is thrown in the case of the absence of file or
// if there is some error.
[[nodiscard]]
inline std::vector< char >
load_file_into_memory(
	const std::filesystem::path & file_name )
{
	std::vector< char > buffer;

	const auto file_size = std::filesystem::file_size( file_name );
	if( file_size )
	{
		std::ifstream file;
		file.open( file_name, std::ios_base::in | std::ios_base::binary );
		if( !file )
			ensure_successful_syscall( -1,
					fmt::format( "trying to open file '{}'", file_name.string() ) );

		file.exceptions( std::ifstream::badbit | std::ifstream::failbit );

		buffer.resize( file_size );
		file.read( buffer.data(), static_cast<std::streamsize>(file_size) );

		if( file.gcount() != static_cast<std::streamsize>(file_size) )
			throw exception_t{
					fmt::format( "number of bytes loaded mismatches the size of "
							"the file: bytes_loaded={}, file_size={}",
							file.gcount(),
							file_size )
				};
	}

	return buffer;
}

} /* namespace resolvconf::utils */
