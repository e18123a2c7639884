#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace pqoidc {

// application/x-www-form-urlencoded: unreserved characters pass through,
// space becomes '+', everything else is %XX.
std::string url_encode(const std::string &value);

// Throws std::invalid_argument on a truncated or non-hex escape.
std::string url_decode(const std::string &value);

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Appends params to `base` with '?' or '&' as appropriate.
std::string append_query(const std::string &base, const QueryParams &params);

// Parses the query part of a URL (everything after the first '?', up to any
// '#'). A repeated key keeps its first value.
std::map<std::string, std::string> parse_query(const std::string &url);

} // namespace pqoidc
