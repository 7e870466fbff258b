#include "tools/lens_chain.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <system_error>
#include <nlohmann/json.hpp>
#include "protocol/json_depth.hpp"

namespace facetmcp::tools {

using core::errors::ErrorCategory;
using core::errors::ServiceError;

namespace {

ServiceError lens_error(const std::string& lens, const std::string& detail) {
    return ServiceError{ErrorCategory::Lens,
                        "Error applying lens '" + lens + "': " + detail,
                        "lens_failed"};
}

bool is_blank(const char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string strip(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && is_blank(text[begin])) {
        ++begin;
    }
    while (end > begin && is_blank(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

// Byte length of the first `max_chars` code points of UTF-8 `text`.
std::size_t utf8_prefix_bytes(const std::string& text, const std::size_t max_chars) {
    std::size_t chars = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto byte = static_cast<unsigned char>(text[i]);
        if ((byte & 0xC0) != 0x80) {
            if (chars == max_chars) {
                return i;
            }
            ++chars;
        }
    }
    return text.size();
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string::size_type start = 0;
    while (true) {
        const auto pos = text.find('\n', start);
        if (pos == std::string::npos) {
            lines.push_back(text.substr(start));
            return lines;
        }
        lines.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            out.push_back('\n');
        }
        out += lines[i];
    }
    return out;
}

std::string dedent(const std::string& text) {
    auto lines = split_lines(text);
    std::size_t common = std::numeric_limits<std::size_t>::max();
    for (const auto& line : lines) {
        const auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        common = std::min(common, first);
    }
    if (common == std::numeric_limits<std::size_t>::max() || common == 0) {
        return text;
    }

    for (auto& line : lines) {
        if (line.find_first_not_of(" \t") == std::string::npos) {
            line.clear();
            continue;
        }
        line.erase(0, common);
    }
    return join_lines(lines);
}

std::string squeeze_spaces(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        if (c == ' ' && !out.empty() && out.back() == ' ') {
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::string normalize_newlines(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            continue;
        }
        out.push_back(text[i]);
    }
    return out;
}

std::string change_case(std::string text, const bool upper) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [upper](const unsigned char c) {
                       return static_cast<char>(upper ? std::toupper(c)
                                                      : std::tolower(c));
                   });
    return text;
}

std::string strip_markdown(const std::string& text) {
    auto lines = split_lines(text);
    for (auto& line : lines) {
        const auto indent = line.find_first_not_of(" \t");
        if (indent == std::string::npos) {
            continue;
        }
        std::string body = line.substr(indent);

        if (body[0] == '#') {
            const auto after = body.find_first_not_of('#');
            if (after == std::string::npos) {
                body.clear();
            } else if (body[after] == ' ') {
                body = body.substr(after + 1);
            }
        } else if (body.size() > 1 && (body[0] == '-' || body[0] == '*' || body[0] == '+') &&
                   body[1] == ' ') {
            body = body.substr(2);
        } else if (body[0] == '>') {
            body = body.substr(body.size() > 1 && body[1] == ' ' ? 2 : 1);
        }

        std::string cleaned;
        cleaned.reserve(body.size());
        for (const char c : body) {
            if (c == '*' || c == '_' || c == '`') {
                continue;
            }
            cleaned.push_back(c);
        }
        line = line.substr(0, indent) + cleaned;
    }
    return join_lines(lines);
}

}  // namespace

const std::vector<std::string>& builtin_lens_names() {
    static const std::vector<std::string> names = {
        "trim",      "dedent",    "squeeze_spaces", "normalize_newlines",
        "uppercase", "lowercase", "limit",          "json_minify",
        "strip_markdown"};
    return names;
}

core::errors::Result<LensSpec> parse_lens_spec(const std::string& spec) {
    const std::string trimmed = strip(spec);
    if (trimmed.empty()) {
        return ServiceError{ErrorCategory::Lens, "Lens name cannot be empty.",
                            "empty_lens"};
    }

    LensSpec lens;
    const auto open = trimmed.find('(');
    if (open == std::string::npos) {
        if (trimmed.find(')') != std::string::npos) {
            return lens_error(spec, "unbalanced parenthesis");
        }
        lens.name = trimmed;
        return lens;
    }

    if (trimmed.back() != ')' || trimmed.find('(', open + 1) != std::string::npos) {
        return lens_error(spec, "malformed argument syntax");
    }

    lens.name = strip(trimmed.substr(0, open));
    if (lens.name.empty()) {
        return lens_error(spec, "missing lens name");
    }

    const std::string arg_text = strip(trimmed.substr(open + 1, trimmed.size() - open - 2));
    if (arg_text.empty()) {
        return lens;
    }

    std::int64_t value = 0;
    const char* begin = arg_text.data();
    const char* end = arg_text.data() + arg_text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return lens_error(spec, "unsupported lens arguments: " + arg_text);
    }
    lens.argument = value;
    return lens;
}

core::errors::Result<std::string> apply_lens(const std::string& text,
                                             const LensSpec& lens) {
    const auto& name = lens.name;
    const auto& known = builtin_lens_names();
    if (std::find(known.begin(), known.end(), name) == known.end()) {
        return ServiceError{ErrorCategory::Lens, "Unknown lens: " + name, "unknown_lens"};
    }

    if (name == "limit") {
        if (!lens.argument.has_value()) {
            return lens_error(name, "limit requires an integer argument, e.g. limit(100)");
        }
        if (lens.argument.value() < 0) {
            return lens_error(name, "limit must not be negative");
        }
        const auto max = static_cast<std::size_t>(lens.argument.value());
        return text.substr(0, utf8_prefix_bytes(text, max));
    }

    if (lens.argument.has_value()) {
        return lens_error(name, "lens does not take an argument");
    }

    if (name == "trim") {
        return strip(text);
    }
    if (name == "dedent") {
        return dedent(text);
    }
    if (name == "squeeze_spaces") {
        return squeeze_spaces(text);
    }
    if (name == "normalize_newlines") {
        return normalize_newlines(text);
    }
    if (name == "uppercase") {
        return change_case(text, true);
    }
    if (name == "lowercase") {
        return change_case(text, false);
    }
    if (name == "json_minify") {
        if (protocol::exceeds_json_depth(text)) {
            return lens_error(name, "input nests deeper than " +
                                        std::to_string(protocol::kMaxJsonDepth) + " levels");
        }
        const auto parsed = nlohmann::json::parse(text, nullptr, false);
        if (parsed.is_discarded()) {
            return lens_error(name, "input is not valid JSON");
        }
        return parsed.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    if (name == "strip_markdown") {
        return strip_markdown(text);
    }

    return ServiceError{ErrorCategory::Internal, "Lens has no implementation: " + name,
                        "lens_not_implemented"};
}

core::errors::Result<std::string> apply_lens_chain(
    const std::string& text, const std::vector<std::string>& specs,
    const std::shared_ptr<std::atomic_bool>& cancel_token) {
    std::string current = text;
    for (const auto& spec : specs) {
        if (cancel_token && cancel_token->load()) {
            return ServiceError{ErrorCategory::Cancelled,
                                "Lens chain cancelled before '" + spec + "'.",
                                "dispatch_cancelled"};
        }

        auto parsed = parse_lens_spec(spec);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }

        auto applied = apply_lens(current, core::errors::get_value(parsed));
        if (core::errors::is_error(applied)) {
            return core::errors::get_error(applied);
        }
        current = std::move(core::errors::get_value(applied));
    }
    return current;
}

}  // namespace facetmcp::tools
