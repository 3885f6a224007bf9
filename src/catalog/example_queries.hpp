//===----------------------------------------------------------------------===//
//                         SQLGate
//
// catalog/example_queries.hpp
//
// Categorized SQL templates handed to callers verbatim
//===----------------------------------------------------------------------===//

#pragma once

#include "catalog/catalog_metadata.hpp"

namespace sqlgate {

struct ExampleQueryResult {
    std::string category;  // normalized, "all" when none was requested
    std::vector<ExampleQuery> examples;
    std::vector<std::string> available_categories;  // sorted
    std::string note;
};

class ExampleQueryCatalog {
public:
    ExampleQueryCatalog(std::vector<ExampleQuery> templates_p, std::string note_p);

    // Empty or blank category returns every template. Throws
    // GatewayException(NOT_FOUND) for a category with no templates.
    ExampleQueryResult Get(const std::string& category = "") const;

    const std::vector<std::string>& GetCategories() const { return categories; }
    size_t Size() const { return templates.size(); }

    static std::vector<ExampleQuery> BuiltinTemplates();

private:
    std::vector<ExampleQuery> templates;
    std::vector<std::string> categories;
    std::string note;
};

} // namespace sqlgate
