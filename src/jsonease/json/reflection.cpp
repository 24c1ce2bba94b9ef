#include <jsonease/json/reflection.hpp>

namespace jsonease {

dynamic_object
reflect_structure(structure const& s)
{
    dynamic_object fields = s.fields();
    for (auto const& layer : s.inherited_fields())
    {
        for (auto const& field : layer)
        {
            if (!fields.contains(field.first))
                fields.set(field.first, field.second);
        }
    }
    return fields;
}

} // namespace jsonease
