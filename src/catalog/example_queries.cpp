//===----------------------------------------------------------------------===//
//                         SQLGate
//
// catalog/example_queries.cpp
//
// Example query catalog implementation
//===----------------------------------------------------------------------===//

#include "catalog/example_queries.hpp"
#include "gateway/gateway_error.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace sqlgate {

namespace {

std::string Normalize(const std::string& category) {
    size_t begin = 0;
    size_t end = category.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(category[begin]))) {
        begin++;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(category[end - 1]))) {
        end--;
    }
    std::string normalized = category.substr(begin, end - begin);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

std::string JoinCategories(const std::vector<std::string>& categories) {
    std::string joined;
    for (const auto& category : categories) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += category;
    }
    return joined;
}

} // anonymous namespace

ExampleQueryCatalog::ExampleQueryCatalog(std::vector<ExampleQuery> templates_p, std::string note_p)
    : templates(std::move(templates_p))
    , note(std::move(note_p)) {

    std::set<std::string> unique;
    for (const auto& example : templates) {
        unique.insert(example.category);
    }
    categories.assign(unique.begin(), unique.end());
}

ExampleQueryResult ExampleQueryCatalog::Get(const std::string& category) const {
    ExampleQueryResult result;
    result.available_categories = categories;
    result.note = note;

    std::string normalized = Normalize(category);
    if (normalized.empty()) {
        result.category = "all";
        result.examples = templates;
        return result;
    }

    if (!std::binary_search(categories.begin(), categories.end(), normalized)) {
        throw GatewayException(ErrorKind::NOT_FOUND,
                               "Unknown example category '" + category + "'",
                               "Use one of: " + JoinCategories(categories));
    }

    result.category = normalized;
    for (const auto& example : templates) {
        if (example.category == normalized) {
            result.examples.push_back(example);
        }
    }
    return result;
}

std::vector<ExampleQuery> ExampleQueryCatalog::BuiltinTemplates() {
    return {
        {"search",
         "Find credit unions by name pattern",
         "Locate credit unions that partially match a provided name substring",
         R"SQL(-- Use LOWER() with wildcards so name matching is flexible
SELECT cu_name, state, city, assets, member_count
FROM cu_with_ratios
WHERE LOWER(cu_name) LIKE '%navy%'
  AND cycle_date = (SELECT MAX(cycle_date) FROM cu_with_ratios)
ORDER BY assets DESC;)SQL",
         "When users only know part of the credit union's name"},

        {"search",
         "Filter by state and asset threshold",
         "State-level screening with asset floors for size comparisons",
         R"SQL(-- Latest quarter filter keeps the result list current
SELECT cu_name, city, assets, member_count, roa
FROM cu_with_ratios
WHERE state = 'WA'
  AND assets > 500000000
  AND cycle_date = (SELECT MAX(cycle_date) FROM cu_with_ratios)
ORDER BY assets DESC;)SQL",
         "Great starting point for \"show me CUs in <state> above $X\" questions"},

        {"search",
         "Multi-criteria performance search",
         "Combine efficiency, ROA, and size filters to find standout performers",
         R"SQL(-- Keep criteria explicit so thresholds are easy to tweak
SELECT cu_name, state, assets, roa, efficiency_ratio
FROM cu_with_ratios
WHERE cycle_date = (SELECT MAX(cycle_date) FROM cu_with_ratios)
  AND roa > 1.0
  AND efficiency_ratio < 70
  AND assets > 100000000
ORDER BY roa DESC;)SQL",
         "Use when the user lists multiple numeric constraints"},

        {"search",
         "Find CUs by metric range",
         "Filter on ROA within a desired band to control volatility",
         R"SQL(-- BETWEEN keeps ROA within a manageable band
SELECT cu_name, state, assets, roa, efficiency_ratio
FROM cu_with_ratios
WHERE cycle_date = (SELECT MAX(cycle_date) FROM cu_with_ratios)
  AND roa BETWEEN 1.0 AND 2.0
ORDER BY roa DESC;)SQL",
         "Answer \"find CUs with ROA between 1% and 2%\" style prompts"},

        {"comparison",
         "Compare two specific credit unions",
         "Side-by-side snapshot for two named institutions",
         R"SQL(-- Provide consistent list of key operating metrics
SELECT cu_name, assets, roa, efficiency_ratio, net_worth_ratio, loan_to_share_ratio
FROM cu_with_ratios
WHERE cu_name IN ('NAVY FEDERAL CREDIT UNION', 'PENTAGON FEDERAL CREDIT UNION')
  AND cycle_date = (SELECT MAX(cycle_date) FROM cu_with_ratios);)SQL",
         "Use when the user mentions two institutions explicitly"},

        {"comparison",
         "Compare a CU to its state peers",
         "Rank a target CU in the context of other CUs in the same state",
         R"SQL(-- Use window functions for percentile style context
WITH state_peers AS (
    SELECT cu_name,
           state,
           assets,
           roa,
           efficiency_ratio,
           PERCENT_RANK() OVER (ORDER BY assets) AS asset_percentile
    FROM cu_with_ratios
    WHERE state = 'WA'
      AND cycle_date = (SELECT MAX(cycle_date) FROM cu_with_ratios)
)
SELECT *
FROM state_peers
ORDER BY assets DESC
LIMIT 20;)SQL",
         "Good follow-up when users ask how a CU compares to others nearby"},

        {"comparison",
         "Compare CU metrics to national averages",
         "Show how a selected CU stacks up against US-wide averages",
         R"SQL(-- Compute national averages then join back for context
WITH latest AS (
    SELECT *
    FROM cu_with_ratios
    WHERE cycle_date = (SELECT MAX(cycle_date) FROM cu_with_ratios)
),
national AS (
    SELECT AVG(roa) AS avg_roa,
           AVG(efficiency_ratio) AS avg_efficiency,
           AVG(net_worth_ratio) AS avg_net_worth
    FROM latest
)
SELECT l.cu_name,
       l.state,
       l.assets,
       l.roa,
       l.efficiency_ratio,
       l.net_worth_ratio,
       n.avg_roa,
       n.avg_efficiency,
       n.avg_net_worth
FROM latest AS l
CROSS JOIN national AS n
WHERE l.cu_name = 'NAVY FEDERAL CREDIT UNION';)SQL",
         "When the prompt mentions \"national average\" or \"typical CU\""},

        {"ranking",
         "Top 10 by assets",
         "Basic league-table ranked by total assets",
         R"SQL(-- Keep ORDER BY aligned with ranking metric
SELECT cu_name, state, assets, roa
FROM cu_with_ratios
WHERE cycle_date = (SELECT MAX(cycle_date) FROM cu_with_ratios)
ORDER BY assets DESC
LIMIT 10;)SQL",
         "Answer \"largest credit unions\" questions"},

        {"ranking",
         "Bottom 10 by efficiency ratio",
         "Identify most efficient operators using ASC ordering",
         R"SQL(-- Lower efficiency ratio is better
SELECT cu_name, state, assets, efficiency_ratio
FROM cu_with_ratios
WHERE cycle_date = (SELECT MAX(cycle_date) FROM cu_with_ratios)
  AND efficiency_ratio IS NOT NULL
ORDER BY efficiency_ratio ASC
LIMIT 10;)SQL",
         "Useful when looking for \"most efficient\" institutions"},

        {"ranking",
         "Top ROA performers with size filter",
         "Rank ROA but exclude very small CUs for stability",
         R"SQL(-- Add an assets filter to focus on meaningful peers
SELECT cu_name, state, assets, roa, efficiency_ratio
FROM cu_with_ratios
WHERE cycle_date = (SELECT MAX(cycle_date) FROM cu_with_ratios)
  AND roa IS NOT NULL
  AND assets > 100000000
ORDER BY roa DESC
LIMIT 15;)SQL",
         "Use when asked for \"top performers\""},

        {"ranking",
         "Ranking within a state",
         "Dense_rank within a single state to show position",
         R"SQL(-- Window functions keep ordinal ranking with ties
WITH latest AS (
    SELECT *
    FROM cu_with_ratios
    WHERE cycle_date = (SELECT MAX(cycle_date) FROM cu_with_ratios)
),
ranked AS (
    SELECT cu_name,
           state,
           assets,
           roa,
           DENSE_RANK() OVER (PARTITION BY state ORDER BY roa DESC) AS roa_rank
    FROM latest
    WHERE state = 'CA'
)
SELECT *
FROM ranked
WHERE roa_rank <= 10
ORDER BY roa_rank;)SQL",
         "When the request narrows to a particular geography"},

        {"trends",
         "Show metrics over time for one CU",
         "List every quarter for a CU to analyze trajectory",
         R"SQL(-- No date filter so all quarters are returned
SELECT cycle_date, cu_name, assets, roa, efficiency_ratio, member_count
FROM cu_with_ratios
WHERE cu_name = 'NAVY FEDERAL CREDIT UNION'
ORDER BY cycle_date;)SQL",
         "Use when the prompt says \"over time\" or \"trend\""},

        {"trends",
         "Quarter-over-quarter growth",
         "Use window functions to calculate QoQ deltas",
         R"SQL(-- LAG() compares the current quarter to the previous
WITH ordered AS (
    SELECT cu_name,
           cycle_date,
           assets,
           LAG(assets) OVER (PARTITION BY cu_name ORDER BY cycle_date) AS prev_assets,
           member_count,
           LAG(member_count) OVER (PARTITION BY cu_name ORDER BY cycle_date) AS prev_members
    FROM cu_with_ratios
    WHERE cu_name = 'NAVY FEDERAL CREDIT UNION'
)
SELECT cu_name,
       cycle_date,
       assets,
       prev_assets,
       (assets - prev_assets) / NULLIF(prev_assets, 0) * 100 AS assets_qoq_growth,
       member_count,
       prev_members,
       (member_count - prev_members) / NULLIF(prev_members, 0) * 100 AS member_qoq_growth
FROM ordered
ORDER BY cycle_date;)SQL",
         "When asked about sequential quarter changes"},

        {"trends",
         "Year-over-year comparison",
         "Show YOY metrics already calculated in the dataset",
         R"SQL(-- Uses the *_growth_yoy columns baked into cu_with_ratios
SELECT cu_name,
       cycle_date,
       member_growth_yoy,
       loan_growth_yoy,
       share_growth_yoy
FROM cu_with_ratios
WHERE cu_name LIKE '%NAVY FEDERAL%'
  AND member_growth_yoy IS NOT NULL
ORDER BY cycle_date;)SQL",
         "Quickly answer YOY questions without extra math"},

        {"trends",
         "Identify improving efficiency",
         "Aggregate min/max efficiency to gauge improvement",
         R"SQL(-- Improvement = worst minus best (positive means trending better)
WITH stats AS (
    SELECT cu_name,
           state,
           MIN(efficiency_ratio) AS best_efficiency,
           MAX(efficiency_ratio) AS worst_efficiency
    FROM cu_with_ratios
    WHERE efficiency_ratio IS NOT NULL
    GROUP BY cu_name, state
)
SELECT cu_name,
       state,
       worst_efficiency - best_efficiency AS improvement
FROM stats
WHERE worst_efficiency - best_efficiency >= 5
ORDER BY improvement DESC
LIMIT 20;)SQL",
         "Surface CUs that improved cost structure materially"},

        {"financial_analysis",
         "High performers across multiple metrics",
         "Filter on ROA, efficiency, net worth, and size simultaneously",
         R"SQL(-- Combine thresholds to satisfy complex multi-metric prompts
SELECT cu_name, state, assets, roa, efficiency_ratio, net_worth_ratio
FROM cu_with_ratios
WHERE cycle_date = (SELECT MAX(cycle_date) FROM cu_with_ratios)
  AND roa > 1.0
  AND efficiency_ratio < 70
  AND net_worth_ratio > 10
  AND assets > 100000000
ORDER BY roa DESC;)SQL",
         "Answer \"find top performers by multiple metrics\" questions"},

        {"financial_analysis",
         "Percentile analysis",
         "Use percent_rank to compute ROA percentile",
         R"SQL(-- Multiply PERCENT_RANK by 100 to express as percentile
WITH latest AS (
    SELECT *
    FROM cu_with_ratios
    WHERE cycle_date = (SELECT MAX(cycle_date) FROM cu_with_ratios)
      AND roa IS NOT NULL
)
SELECT cu_name,
       state,
       assets,
       roa,
       PERCENT_RANK() OVER (ORDER BY roa) * 100 AS roa_percentile
FROM latest
ORDER BY roa DESC
LIMIT 50;)SQL",
         "Useful for \"top quartile\" or \"top 25%\" prompts"},

        {"financial_analysis",
         "Correlation between ROA and loan-to-share ratio",
         "Quantify how two metrics move together",
         R"SQL(-- corr() summarizes the relationship in one number
WITH latest AS (
    SELECT roa, loan_to_share_ratio
    FROM cu_with_ratios
    WHERE cycle_date = (SELECT MAX(cycle_date) FROM cu_with_ratios)
      AND roa IS NOT NULL
      AND loan_to_share_ratio IS NOT NULL
)
SELECT corr(roa, loan_to_share_ratio) AS roa_vs_loan_to_share_corr
FROM latest;)SQL",
         "When users ask \"do CUs with X tend to have Y\""},

        {"financial_analysis",
         "Geographic averages",
         "Aggregate by state to summarize efficiency and ROA",
         R"SQL(-- Aggregate metrics to build quick state scorecards
SELECT state,
       COUNT(*) AS cu_count,
       AVG(assets) AS avg_assets,
       AVG(roa) AS avg_roa,
       AVG(efficiency_ratio) AS avg_efficiency
FROM cu_with_ratios
WHERE cycle_date = (SELECT MAX(cycle_date) FROM cu_with_ratios)
GROUP BY state
ORDER BY avg_assets DESC;)SQL",
         "Use for \"state level averages\" prompts"},
    };
}

} // namespace sqlgate
