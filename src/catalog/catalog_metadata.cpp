//===----------------------------------------------------------------------===//
//                         SQLGate
//
// catalog/catalog_metadata.cpp
//
// Catalog metadata defaults and YAML overrides
//===----------------------------------------------------------------------===//

#include "catalog/catalog_metadata.hpp"
#include "catalog/example_queries.hpp"
#include "config/yaml_config.hpp"
#include "logging/logger.hpp"

namespace sqlgate {

CatalogMetadata CatalogMetadata::Defaults() {
    CatalogMetadata metadata;

    metadata.table_descriptions = {
        {"cu_with_ratios", "Consolidated view that joins identifying info with pre-calculated ratios"},
        {"foicu", "Credit union identity (charter, branchings, geography)"},
        {"fs220", "Primary financial schedule with core account balances"},
        {"fs220a", "Supplemental schedule (non-interest income, employee stats)"},
        {"fs220b", "Breakouts for investment balances"},
        {"fs220c", "Allowance and delinquency metrics"},
        {"fs220g", "Member business loan detail"},
        {"fs220h", "Mortgage and real estate balances"},
        {"fs220i", "Indirect lending detail"},
        {"fs220j", "Deposit and share account detail"},
        {"fs220k", "Capital and net worth detail"},
        {"fs220l", "Income statement breakouts"},
        {"fs220m", "Expense detail"},
        {"fs220n", "Other operating income detail"},
        {"fs220p", "Product penetration data"},
        {"fs220q", "Member service measurements"},
        {"fs220r", "Technology and channel usage"},
        {"acctdesc", "Account code dictionary mapping acct_XXX columns to names"},
    };

    metadata.column_descriptions = {
        {"cu_number", "Unique credit union identifier assigned by the NCUA"},
        {"cycle_date", "Quarter end date for the reported metrics"},
        {"cu_name", "Credit union legal name"},
        {"city", "Headquarters city"},
        {"state", "Two-letter state or territory code"},
        {"assets", "Total assets reported for the quarter"},
        {"member_count", "Number of members"},
        {"member_growth_yoy", "Year-over-year member growth percentage"},
        {"loan_growth_yoy", "Year-over-year loan balance growth percentage"},
        {"share_growth_yoy", "Year-over-year share/deposit growth percentage"},
        {"asset_growth_yoy", "Year-over-year asset growth percentage"},
        {"roa", "Return on Assets (annualized percentage)"},
        {"efficiency_ratio", "Operating expenses as % of revenue (lower is better, typical range 50-90%)"},
        {"operating_expense_ratio", "Operating expenses as % of assets (annualized, different from efficiency ratio)"},
        {"loan_to_share_ratio", "Loan to share (deposit) ratio"},
        {"net_worth_ratio", "Net worth ratio (capital / assets)"},
        {"net_interest_margin", "Net interest income as % of assets (typical range 2-4%)"},
        {"non_interest_income_ratio", "Non-interest income as % of assets (annualized)"},
        {"members_per_employee", "Average members per full-time employee"},
        {"indirect_lending_ratio", "Indirect lending share of total loans"},
        {"avg_member_relationship", "Average relationship per member in dollars"},
    };

    metadata.recommendation = "Use the cu_with_ratios view for most analytical queries";
    metadata.examples_note = "All queries reference the cu_with_ratios view and can be used as-is";
    metadata.examples = ExampleQueryCatalog::BuiltinTemplates();
    return metadata;
}

bool CatalogMetadata::LoadOverrides(const std::string& path, std::string& error) {
    YamlConfig yaml;
    if (!yaml.Load(path)) {
        error = yaml.GetError();
        return false;
    }

    try {
        YAML::Node tables = yaml.Node("tables");
        if (tables && tables.IsMap()) {
            for (const auto& entry : tables) {
                table_descriptions[entry.first.as<std::string>()] = entry.second.as<std::string>();
            }
        }

        YAML::Node columns = yaml.Node("columns");
        if (columns && columns.IsMap()) {
            for (const auto& entry : columns) {
                column_descriptions[entry.first.as<std::string>()] = entry.second.as<std::string>();
            }
        }

        recommendation = yaml.GetString("recommendation", recommendation);
        examples_note = yaml.GetString("examples_note", examples_note);

        YAML::Node templates = yaml.Node("examples");
        if (templates && templates.IsSequence() && templates.size() > 0) {
            std::vector<ExampleQuery> loaded;
            for (const auto& item : templates) {
                ExampleQuery example;
                example.category = item["category"].as<std::string>("");
                example.title = item["title"].as<std::string>("");
                example.description = item["description"].as<std::string>("");
                example.sql = item["sql"].as<std::string>("");
                example.use_case = item["use_case"].as<std::string>("");
                if (example.category.empty() || example.sql.empty()) {
                    error = "Example '" + example.title + "' needs both category and sql";
                    return false;
                }
                loaded.push_back(std::move(example));
            }
            examples = std::move(loaded);
        }
    } catch (const YAML::Exception& e) {
        error = "Invalid catalog metadata in " + path + ": " + e.what();
        return false;
    }

    LOG_INFO("catalog", "Loaded catalog metadata from " + path + " (" +
             std::to_string(table_descriptions.size()) + " tables, " +
             std::to_string(examples.size()) + " examples)");
    return true;
}

std::string CatalogMetadata::TableDescription(const std::string& name) const {
    auto it = table_descriptions.find(name);
    return it == table_descriptions.end() ? std::string() : it->second;
}

std::string CatalogMetadata::ColumnDescription(const std::string& name) const {
    auto it = column_descriptions.find(name);
    return it == column_descriptions.end() ? std::string() : it->second;
}

} // namespace sqlgate
