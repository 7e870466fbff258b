#include "tools/document_engine.hpp"

#include <cctype>
#include <optional>
#include <sstream>
#include <vector>
#include "protocol/json_depth.hpp"

namespace facetmcp::tools {

using core::errors::ErrorCategory;
using core::errors::ServiceError;
using nlohmann::json;

namespace {

ServiceError document_error(const std::size_t line_no, const std::string& detail) {
    return ServiceError{ErrorCategory::Document,
                        "line " + std::to_string(line_no) + ": " + detail,
                        "document_invalid"};
}

std::string strip(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

bool is_identifier(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    const auto head = static_cast<unsigned char>(text[0]);
    if (std::isalpha(head) == 0 && text[0] != '_') {
        return false;
    }
    for (const char c : text) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) == 0 && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

json parse_scalar(const std::string& raw) {
    const std::string text = strip(raw);
    if (text.size() >= 2 && text.front() == '\'' && text.back() == '\'') {
        return text.substr(1, text.size() - 2);
    }

    if (!protocol::exceeds_json_depth(text)) {
        json parsed = json::parse(text, nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }
    if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
        return text.substr(1, text.size() - 2);
    }
    return text;
}

// Splits "a=1, b=\"x, y\"" on commas outside double quotes.
std::vector<std::string> split_attributes(const std::string& text) {
    std::vector<std::string> parts;
    std::string current;
    bool in_quotes = false;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '"' && (i == 0 || text[i - 1] != '\\')) {
            in_quotes = !in_quotes;
        }
        if (c == ',' && !in_quotes) {
            parts.push_back(current);
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    if (!strip(current).empty() || !parts.empty()) {
        parts.push_back(current);
    }
    return parts;
}

core::errors::Result<json> parse_attributes(const std::size_t line_no,
                                            const std::string& text) {
    json attrs = json::object();
    for (const auto& part : split_attributes(text)) {
        const auto eq = part.find('=');
        if (eq == std::string::npos) {
            return document_error(line_no, "attribute without '=': " + strip(part));
        }
        const std::string key = strip(part.substr(0, eq));
        if (!is_identifier(key)) {
            return document_error(line_no, "invalid attribute name: " + key);
        }
        attrs[key] = parse_scalar(part.substr(eq + 1));
    }
    return attrs;
}

}  // namespace

core::errors::Result<json> BasicDocumentEngine::execute(const std::string& source) const {
    json document = json::object();
    std::string current_facet;
    std::optional<std::string> open_list;

    std::istringstream in(source);
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const std::string content = strip(line);
        if (content.empty() || content[0] == '#') {
            continue;
        }

        const bool indented = line[0] == ' ' || line[0] == '\t';
        if (!indented) {
            if (content[0] != '@') {
                return document_error(line_no, "expected a facet header starting with '@'");
            }

            std::string header = content.substr(1);
            json attrs;
            const auto open = header.find('(');
            if (open != std::string::npos) {
                if (header.back() != ')') {
                    return document_error(line_no, "unterminated attribute list");
                }
                auto parsed = parse_attributes(
                    line_no, header.substr(open + 1, header.size() - open - 2));
                if (core::errors::is_error(parsed)) {
                    return core::errors::get_error(parsed);
                }
                attrs = core::errors::get_value(parsed);
                header = strip(header.substr(0, open));
            }

            if (!is_identifier(header)) {
                return document_error(line_no, "invalid facet name: " + header);
            }
            if (document.contains(header)) {
                return document_error(line_no, "duplicate facet: " + header);
            }

            document[header] = json::object();
            if (!attrs.is_null() && !attrs.empty()) {
                document[header]["_attrs"] = attrs;
            }
            current_facet = header;
            open_list.reset();
            continue;
        }

        if (current_facet.empty()) {
            return document_error(line_no, "content before the first facet header");
        }
        json& facet = document[current_facet];

        if (content[0] == '-' && (content.size() == 1 || content[1] == ' ')) {
            if (!open_list.has_value()) {
                return document_error(line_no, "list item without a preceding 'key:' line");
            }
            facet[open_list.value()].push_back(parse_scalar(content.substr(1)));
            continue;
        }

        const auto colon = content.find(':');
        if (colon == std::string::npos) {
            return document_error(line_no, "expected 'key: value'");
        }
        const std::string key = strip(content.substr(0, colon));
        if (!is_identifier(key)) {
            return document_error(line_no, "invalid key: " + key);
        }

        const std::string value = strip(content.substr(colon + 1));
        if (value.empty()) {
            facet[key] = json::array();
            open_list = key;
        } else {
            facet[key] = parse_scalar(value);
            open_list.reset();
        }
    }

    if (document.empty()) {
        return ServiceError{ErrorCategory::Document, "document contains no facets",
                            "document_empty"};
    }
    return document;
}

}  // namespace facetmcp::tools
