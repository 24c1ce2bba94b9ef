#ifndef JSONEASE_FS_TYPES_HPP
#define JSONEASE_FS_TYPES_HPP

#include <filesystem>

namespace jsonease {

// (Note that file_path is of course slightly incorrect because the path could
// refer to a directory, but it's a lot easier to read.)
typedef std::filesystem::path file_path;

} // namespace jsonease

#endif
