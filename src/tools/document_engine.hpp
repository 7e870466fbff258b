#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/service_errors.hpp"

namespace facetmcp::tools {

// Turns a document source into its JSON form. Implementations must be safe
// to call from several connection threads at once.
class DocumentEngine {
public:
    virtual ~DocumentEngine() = default;

    virtual core::errors::Result<nlohmann::json> execute(const std::string& source) const = 0;
};

// Line-oriented reader for the facet subset the server ships with:
//
//   # comment
//   @summary(lang="en")
//     title: "Weekly report"
//     count: 3
//     tags:
//       - alpha
//       - beta
//
// Each "@name" header opens a facet object; attributes land under "_attrs".
// Indented "key: value" lines become members, values typed as JSON when
// they parse as JSON and kept as text otherwise.
class BasicDocumentEngine : public DocumentEngine {
public:
    core::errors::Result<nlohmann::json> execute(const std::string& source) const override;
};

}  // namespace facetmcp::tools
