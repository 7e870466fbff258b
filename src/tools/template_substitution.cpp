#include "tools/template_substitution.hpp"

namespace facetmcp::tools {

using nlohmann::json;

std::string render_variable(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string substitute(const std::string& source, const json& variables) {
    if (!variables.is_object() || variables.empty()) {
        return source;
    }

    std::string result = source;
    for (const auto& item : variables.items()) {
        const std::string placeholder = "{{" + item.key() + "}}";
        const std::string replacement = render_variable(item.value());

        std::string::size_type pos = result.find(placeholder);
        while (pos != std::string::npos) {
            result.replace(pos, placeholder.size(), replacement);
            pos = result.find(placeholder, pos + replacement.size());
        }
    }
    return result;
}

}  // namespace facetmcp::tools
