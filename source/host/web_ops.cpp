#include "host/web_ops.hpp"
#include "host/http/http_client.hpp"
#include "utils/debug_log.hpp"

#include <utility>
#include <vector>

namespace web_ops {

static constexpr size_t kErrorBodyExcerptLength = 200;

static std::string describe_http_error(int status, const std::string &url, const std::string &body) {
    std::string message = "HTTP " + std::to_string(status) + " from " + url;
    if (!body.empty()) {
        message += ": " + body.substr(0, kErrorBodyExcerptLength);
    }
    return message;
}

std::string build_search_url(const std::string &query, const server_config::ServerConfig &config) {
    std::vector<std::pair<std::string, std::string>> query_parameters = {
        {"q", query},
        {"key", config.search_api_key},
        {"cx", config.search_engine_id}
    };
    return http_client::build_query_url(SEARCH_ENDPOINT, query_parameters);
}

host_ops::Result<host_ops::SearchResults> search_web(const std::string &query,
                                                     const server_config::ServerConfig &config) {
    if (!config.has_search_credentials()) {
        return host_ops::make_failure(host_ops::ErrorKind::NetworkFailure,
                                      std::string("Web search is not configured: set ") +
                                          server_config::SEARCH_API_KEY_VARIABLE + " and " +
                                          server_config::SEARCH_ENGINE_ID_VARIABLE);
    }

    debug_log::log("search_web: " + query);
    auto response_result = http_client::get(build_search_url(query, config),
                                            config.network_timeout_milliseconds);
    if (!host_ops::succeeded(response_result)) {
        return std::get<host_ops::Failure>(response_result);
    }

    http_client::HttpResponse &response = std::get<http_client::HttpResponse>(response_result);
    if (response.status >= 400) {
        // The key itself is part of the URL; report the endpoint only.
        return host_ops::make_failure(host_ops::ErrorKind::NetworkFailure,
                                      describe_http_error(response.status, SEARCH_ENDPOINT, response.body));
    }

    host_ops::SearchResults search_results;
    search_results.results = std::move(response.body);
    return search_results;
}

host_ops::Result<host_ops::FileContent> fetch_url(const std::string &url, int timeout_milliseconds) {
    debug_log::log("fetch_url: " + url);
    auto response_result = http_client::get(url, timeout_milliseconds);
    if (!host_ops::succeeded(response_result)) {
        host_ops::Failure failure = std::get<host_ops::Failure>(response_result);
        if (failure.message.find(url) == std::string::npos) {
            failure.message += " (" + url + ")";
        }
        return failure;
    }

    http_client::HttpResponse &response = std::get<http_client::HttpResponse>(response_result);
    if (response.status >= 400) {
        return host_ops::make_failure(host_ops::ErrorKind::NetworkFailure,
                                      describe_http_error(response.status, url, response.body));
    }

    host_ops::FileContent file_content;
    file_content.content = std::move(response.body);
    return file_content;
}

} // namespace web_ops
