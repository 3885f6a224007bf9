//===----------------------------------------------------------------------===//
//                         SQLGate
//
// catalog/catalog_metadata.hpp
//
// Human-readable descriptions for catalog objects and example templates
//===----------------------------------------------------------------------===//

#pragma once

#include <map>
#include <string>
#include <vector>

namespace sqlgate {

struct ExampleQuery {
    std::string category;
    std::string title;
    std::string description;
    std::string sql;
    std::string use_case;
};

struct CatalogMetadata {
    std::map<std::string, std::string> table_descriptions;
    std::map<std::string, std::string> column_descriptions;
    std::string recommendation;
    std::string examples_note;
    std::vector<ExampleQuery> examples;

    // Built-in descriptions for the credit union store
    static CatalogMetadata Defaults();

    // Merge descriptions from a YAML file over the current ones. A non-empty
    // `examples` list replaces the built-in templates.
    // Returns false and sets error if the file cannot be used.
    bool LoadOverrides(const std::string& path, std::string& error);

    // Empty string when unknown
    std::string TableDescription(const std::string& name) const;
    std::string ColumnDescription(const std::string& name) const;
};

} // namespace sqlgate
