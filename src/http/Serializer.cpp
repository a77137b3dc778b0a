#include "http/Serializer.hpp"

#include "utils/Json.hpp"

#include <yyjson.h>

namespace tbl::http
{

namespace
{
std::string single_field(char const *key, std::string_view value,
                         char const *fallback)
{
    tbl::json::MutableDocument doc;
    auto *root = doc.object_root();
    if (root == nullptr)
    {
        return fallback;
    }
    yyjson_mut_obj_add_strncpy(doc.doc(), root, key, value.data(),
                               value.size());
    return doc.write(fallback);
}
} // namespace

std::string serialize_status(std::string_view status)
{
    return single_field("status", status, "{\"status\":\"error\"}");
}

} // namespace tbl::http
