#include <jsonease/api.hpp>

#include <iterator>

#include <jsonease/core/logging.hpp>
#include <jsonease/fs/file_io.hpp>

namespace jsonease {

string
dumps(dynamic const& value, dump_options const& options)
{
    string text = make_encoder(options.tier, options.encoding).encode(value);
    if (options.indent)
        return format(text, formatter_config());
    return text;
}

void
dump(
    dynamic const& value,
    std::ostream& destination,
    dump_options const& options)
{
    destination << from_utf8(
        dumps(value, options), parse_text_encoding(options.encoding));
}

dynamic
loads(string const& text, load_options const& options)
{
    if (options.target)
    {
        return customize(
            make_decoder(chain_tier::CUSTOM, options.encoding).decode(text),
            *options.target);
    }
    return make_decoder(options.tier, options.encoding).decode(text);
}

dynamic
load(std::istream& source, load_options const& options)
{
    string text{
        std::istreambuf_iterator<char>(source),
        std::istreambuf_iterator<char>()};
    return loads(text, options);
}

string
format(string const& text, formatter_config const& config)
{
    return formatter(config).format(text);
}

dynamic
load_file(file_path const& path, load_options const& options)
{
    string const path_string = path.string();
    JSONEASE_LOG_CALL(<< JSONEASE_LOG_ARG(path_string))
    return loads(read_file_contents(path), options);
}

void
dump_file(dynamic const& value, file_path const& path, dump_options const& options)
{
    string const path_string = path.string();
    JSONEASE_LOG_CALL(<< JSONEASE_LOG_ARG(path_string))
    dump_string_to_file(
        path,
        from_utf8(dumps(value, options), parse_text_encoding(options.encoding)));
}

} // namespace jsonease
