#pragma once

#include "query/database_query.h"
#include <nlohmann/json.hpp>
#include <string>

namespace strata {
namespace query {

/**
 * Converts a loosely typed request object into QueryOptions.
 *
 * Accepts the permissive calling convention of older clients: fields and
 * filters as JSON strings, comma separated lists or "*", filters passed in
 * the fields slot (and field lists in the filters slot), and the
 * start/page_length/limit aliases. The core only ever sees QueryOptions.
 */
class LegacyArgsAdapter {
public:
    explicit LegacyArgsAdapter(std::string doctype) : doctype_(std::move(doctype)) {}

    QueryOptions adapt(const nlohmann::json& args) const;

    /// "*", a JSON array string, a comma separated string or an array
    static std::vector<std::string> parseFields(const nlohmann::json& fields);

    /// True when `fields` is shaped like a filter (object or list of lists)
    static bool looksLikeFilters(const nlohmann::json& fields);

private:
    std::string doctype_;
};

} // namespace query
} // namespace strata
