#ifndef JSONEASE_FS_FILE_IO_HPP
#define JSONEASE_FS_FILE_IO_HPP

#include <fstream>

#include <jsonease/core/exception.hpp>
#include <jsonease/fs/types.hpp>

namespace jsonease {

// Open a file into the given stream. Throw an error if the open operation
// fails, and enable the exception bits on the stream so that subsequent
// failures will throw exceptions.
void
open_file(std::ifstream& file, file_path const& path, std::ios::openmode mode);
void
open_file(std::ofstream& file, file_path const& path, std::ios::openmode mode);

// If the above fails, it throws the following exception.
JSONEASE_DEFINE_EXCEPTION(open_file_error)
JSONEASE_DEFINE_ERROR_INFO(file_path, file_path)
JSONEASE_DEFINE_ERROR_INFO(std::ios::openmode, open_mode)
// the operating system's description of the failure
JSONEASE_DEFINE_ERROR_INFO(string, internal_error_message)

// Get the contents of a file as a string.
string
read_file_contents(file_path const& path);

// Write a string to a file (overwriting anything that might have been in it).
void
dump_string_to_file(file_path const& path, string const& contents);

} // namespace jsonease

#endif
