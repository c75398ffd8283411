#ifndef CMCPS_HTTP_CLIENT_HPP
#define CMCPS_HTTP_CLIENT_HPP

// Minimal HTTP(S) GET client on top of libwebsockets' client HTTP support.
// Each request owns its own lws_context, so requests issued from concurrent tool
// calls share no state.

#include <string>
#include <utility>
#include <vector>

#include "host/host_ops_abi.hpp"

namespace http_client {

struct HttpResponse {
    int status = 0;
    std::string body;
};

// Components of an http:// or https:// URL.
struct ParsedUrl {
    bool use_tls = false;
    std::string host;
    int port = 80;
    std::string path = "/"; // includes the query string
};

// Split url into scheme/host/port/path. Fragments are dropped.
// Returns false (and sets error_message) for unsupported schemes or a missing host.
bool parse_url(const std::string &url, ParsedUrl &output_url, std::string &error_message);

// RFC 3986 percent-encoding of everything except unreserved characters.
std::string percent_encode(const std::string &text);

// base_url + "?" + k1=v1&k2=v2 with keys and values percent-encoded.
std::string build_query_url(const std::string &base_url,
                            const std::vector<std::pair<std::string, std::string>> &query_parameters);

// Perform a GET request, following redirects. Any HTTP status is a successful
// result; callers decide what a 4xx/5xx means. Connection, TLS and timeout errors
// are NetworkFailure. timeout_milliseconds <= 0 means no client-side deadline.
host_ops::Result<HttpResponse> get(const std::string &url, int timeout_milliseconds = 0);

} // namespace http_client

#endif // CMCPS_HTTP_CLIENT_HPP
