#include <jsonease/config.hpp>

namespace jsonease {

template<class Field>
static void
read_field(Field* field, dynamic_object const& object, char const* name)
{
    dynamic const* value;
    if (!get_field(&value, object, name))
        return;
    try
    {
        from_dynamic(field, *value);
    }
    catch (boost::exception& e)
    {
        add_dynamic_path_element(e, name);
        throw;
    }
}

void
from_dynamic(tool_config* config, dynamic const& v)
{
    auto const& object = cast<dynamic_object>(v);
    read_field(&config->tier, object, "tier");
    read_field(&config->encoding, object, "encoding");
    read_field(&config->format, object, "format");
    read_field(&config->indent, object, "indent");
    read_field(&config->align, object, "align");
    read_field(&config->line_ending, object, "line_ending");
}

void
to_dynamic(dynamic* v, tool_config const& config)
{
    dynamic_object object;
    to_dynamic(&object["tier"], config.tier);
    to_dynamic(&object["encoding"], config.encoding);
    to_dynamic(&object["format"], config.format);
    to_dynamic(&object["indent"], config.indent);
    to_dynamic(&object["align"], config.align);
    to_dynamic(&object["line_ending"], config.line_ending);
    *v = std::move(object);
}

} // namespace jsonease
