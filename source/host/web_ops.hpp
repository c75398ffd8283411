#ifndef CMCPS_WEB_OPS_HPP
#define CMCPS_WEB_OPS_HPP

// Web search (Google Custom Search JSON API) and plain URL fetching.

#include <string>

#include "config/server_config.hpp"
#include "host/host_ops_abi.hpp"

namespace web_ops {

constexpr const char *SEARCH_ENDPOINT = "https://www.googleapis.com/customsearch/v1";

// Request URL for query with the configured credentials.
std::string build_search_url(const std::string &query, const server_config::ServerConfig &config);

// Run query against the search API. Results are the raw JSON response text.
// Missing credentials fail before any network access.
host_ops::Result<host_ops::SearchResults> search_web(const std::string &query,
                                                     const server_config::ServerConfig &config);

// Fetch url and return the raw response body. HTTP status >= 400 is a NetworkFailure.
host_ops::Result<host_ops::FileContent> fetch_url(const std::string &url, int timeout_milliseconds = 0);

} // namespace web_ops

#endif // CMCPS_WEB_OPS_HPP
