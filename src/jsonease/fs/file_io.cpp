#include <jsonease/fs/file_io.hpp>

#include <cerrno>
#include <cstring>

#include <jsonease/core/logging.hpp>

namespace jsonease {

template<class Stream>
static void
open_stream(Stream& file, file_path const& path, std::ios::openmode mode)
{
    file.open(path.c_str(), mode);
    if (!file)
    {
        get_logger()->warn("unable to open {}", path.string());
        JSONEASE_THROW(
            open_file_error() << file_path_info(path) << open_mode_info(mode)
                              << internal_error_message_info(strerror(errno)));
    }
    file.exceptions(std::ios::failbit | std::ios::badbit);
}

void
open_file(std::ifstream& file, file_path const& path, std::ios::openmode mode)
{
    open_stream(file, path, mode);
}
void
open_file(std::ofstream& file, file_path const& path, std::ios::openmode mode)
{
    open_stream(file, path, mode);
}

string
read_file_contents(file_path const& path)
{
    get_logger()->debug("reading {}", path.string());
    std::ifstream in;
    open_file(in, path, std::ios::in | std::ios::binary);
    string contents;
    in.seekg(0, std::ios::end);
    contents.resize(size_t(in.tellg()));
    in.seekg(0, std::ios::beg);
    if (!contents.empty())
        in.read(&contents[0], contents.size());
    in.close();
    return contents;
}

void
dump_string_to_file(file_path const& path, string const& contents)
{
    get_logger()->debug("writing {}", path.string());
    std::ofstream output;
    open_file(
        output, path, std::ios::out | std::ios::trunc | std::ios::binary);
    output << contents;
}

} // namespace jsonease
