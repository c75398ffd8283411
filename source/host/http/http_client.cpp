#include "host/http/http_client.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <mutex>

namespace http_client {

static const char USER_AGENT[] = "cmcps/0.1";

// Per-request state, reachable from the callback through lws_context_user().
struct RequestState {
    int status = 0;
    std::string body;
    bool completed = false;
    bool failed = false;
    std::string error_message;
};

static int http_callback(struct lws *connection, enum lws_callback_reasons reason,
                         void *user_data, void *incoming_data, size_t incoming_length);

static const struct lws_protocols http_protocols[] = {
    {
        "cmcps-http-client",
        http_callback,
        0,    // per-session data size
        0     // rx buffer size (library default)
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

static RequestState *request_state_of(struct lws *connection) {
    return static_cast<RequestState *>(lws_context_user(lws_get_context(connection)));
}

static void mark_failed(struct lws *connection, RequestState *state, const std::string &message) {
    if (!state->completed && !state->failed) {
        state->failed = true;
        state->error_message = message;
    }
    lws_cancel_service(lws_get_context(connection));
}

// --- HTTP client callback ---

static int http_callback(struct lws *connection, enum lws_callback_reasons reason,
                         void *user_data, void *incoming_data, size_t incoming_length) {
    switch (reason) {
    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
        const char *error_text = incoming_data ? static_cast<const char *>(incoming_data) : "connection error";
        debug_log::log("HTTP connection error (LWS): " + std::string(error_text));
        mark_failed(connection, request_state_of(connection), error_text);
        break;
    }

    case LWS_CALLBACK_ESTABLISHED_CLIENT_HTTP:
        request_state_of(connection)->status = static_cast<int>(lws_http_client_http_response(connection));
        debug_log::log("HTTP response status " + std::to_string(request_state_of(connection)->status));
        break;

    case LWS_CALLBACK_CLIENT_APPEND_HANDSHAKE_HEADER: {
        unsigned char **header_position = static_cast<unsigned char **>(incoming_data);
        unsigned char *header_end = *header_position + incoming_length;
        if (lws_add_http_header_by_token(connection, WSI_TOKEN_HTTP_USER_AGENT,
                                         reinterpret_cast<const unsigned char *>(USER_AGENT),
                                         static_cast<int>(strlen(USER_AGENT)),
                                         header_position, header_end)) {
            return -1;
        }
        break;
    }

    case LWS_CALLBACK_RECEIVE_CLIENT_HTTP_READ: {
        // A chunk of the response body.
        const char *data_pointer = static_cast<const char *>(incoming_data);
        request_state_of(connection)->body.append(data_pointer, incoming_length);
        return 0;
    }

    case LWS_CALLBACK_RECEIVE_CLIENT_HTTP: {
        // Body data is pending; lws_http_client_read() delivers it as RECEIVE_CLIENT_HTTP_READ.
        char read_buffer[LWS_PRE + 4096];
        char *read_pointer = read_buffer + LWS_PRE;
        int read_length = static_cast<int>(sizeof(read_buffer) - LWS_PRE);
        if (lws_http_client_read(connection, &read_pointer, &read_length) < 0) {
            return -1;
        }
        return 0;
    }

    case LWS_CALLBACK_COMPLETED_CLIENT_HTTP: {
        RequestState *state = request_state_of(connection);
        state->completed = true;
        lws_cancel_service(lws_get_context(connection));
        break;
    }

    case LWS_CALLBACK_CLOSED_CLIENT_HTTP:
        mark_failed(connection, request_state_of(connection), "connection closed before the response completed");
        break;

    default:
        break;
    }

    return lws_callback_http_dummy(connection, reason, user_data, incoming_data, incoming_length);
}

static void quiet_library_logging() {
    static std::once_flag once;
    std::call_once(once, [] {
        lws_set_log_level(LLL_ERR, nullptr);
    });
}

// --- URL helpers ---

bool parse_url(const std::string &url, ParsedUrl &output_url, std::string &error_message) {
    ParsedUrl parsed;

    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        error_message = "Invalid URL '" + url + "': no scheme supplied";
        return false;
    }
    std::string scheme = url.substr(0, scheme_end);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    if (scheme == "https") {
        parsed.use_tls = true;
        parsed.port = 443;
    } else if (scheme == "http") {
        parsed.use_tls = false;
        parsed.port = 80;
    } else {
        error_message = "Unsupported URL scheme '" + scheme + "' in '" + url + "'";
        return false;
    }

    std::string remainder = url.substr(scheme_end + 3);
    auto fragment_position = remainder.find('#');
    if (fragment_position != std::string::npos) {
        remainder = remainder.substr(0, fragment_position);
    }

    // Split authority from path/query.
    std::string authority = remainder;
    auto path_position = remainder.find_first_of("/?");
    if (path_position != std::string::npos) {
        authority = remainder.substr(0, path_position);
        parsed.path = remainder.substr(path_position);
        if (parsed.path[0] == '?') {
            parsed.path = "/" + parsed.path;
        }
    }

    // Drop any user:password@ prefix.
    auto at_position = authority.rfind('@');
    if (at_position != std::string::npos) {
        authority = authority.substr(at_position + 1);
    }

    // Split host from port, allowing bracketed IPv6 literals.
    std::string port_text;
    if (!authority.empty() && authority[0] == '[') {
        auto bracket_end = authority.find(']');
        if (bracket_end == std::string::npos) {
            error_message = "Invalid URL '" + url + "': unterminated IPv6 address";
            return false;
        }
        parsed.host = authority.substr(1, bracket_end - 1);
        if (bracket_end + 1 < authority.size() && authority[bracket_end + 1] == ':') {
            port_text = authority.substr(bracket_end + 2);
        }
    } else {
        auto colon_position = authority.find(':');
        parsed.host = authority.substr(0, colon_position);
        if (colon_position != std::string::npos) {
            port_text = authority.substr(colon_position + 1);
        }
    }

    if (parsed.host.empty()) {
        error_message = "Invalid URL '" + url + "': no host supplied";
        return false;
    }

    if (!port_text.empty()) {
        int port = 0;
        for (char character : port_text) {
            if (character < '0' || character > '9' || port > 65535) {
                error_message = "Invalid port in URL '" + url + "'";
                return false;
            }
            port = port * 10 + (character - '0');
        }
        if (port <= 0 || port > 65535) {
            error_message = "Invalid port in URL '" + url + "'";
            return false;
        }
        parsed.port = port;
    }

    output_url = parsed;
    return true;
}

std::string percent_encode(const std::string &text) {
    static const char hex_digits[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(text.size() * 3);
    for (unsigned char character : text) {
        if (std::isalnum(character) || character == '-' || character == '.' ||
            character == '_' || character == '~') {
            encoded += static_cast<char>(character);
        } else {
            encoded += '%';
            encoded += hex_digits[character >> 4];
            encoded += hex_digits[character & 0x0F];
        }
    }
    return encoded;
}

std::string build_query_url(const std::string &base_url,
                            const std::vector<std::pair<std::string, std::string>> &query_parameters) {
    std::string url = base_url;
    char separator = (base_url.find('?') == std::string::npos) ? '?' : '&';
    for (const auto &parameter : query_parameters) {
        url += separator;
        url += percent_encode(parameter.first);
        url += '=';
        url += percent_encode(parameter.second);
        separator = '&';
    }
    return url;
}

// --- Request ---

host_ops::Result<HttpResponse> get(const std::string &url, int timeout_milliseconds) {
    ParsedUrl parsed_url;
    std::string parse_error;
    if (!parse_url(url, parsed_url, parse_error)) {
        return host_ops::make_failure(host_ops::ErrorKind::NetworkFailure, parse_error);
    }

    quiet_library_logging();
    debug_log::log("HTTP GET " + url);

    RequestState state;

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.options = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
    context_info.port = CONTEXT_PORT_NO_LISTEN; // Client mode, no listening.
    context_info.protocols = http_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.user = &state;

    struct lws_context *context = lws_create_context(&context_info);
    if (context == nullptr) {
        return host_ops::make_failure(host_ops::ErrorKind::NetworkFailure,
                                      "Failed to create libwebsockets context");
    }

    struct lws *connection = nullptr;
    struct lws_client_connect_info connect_info;
    memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = context;
    connect_info.address = parsed_url.host.c_str();
    connect_info.port = parsed_url.port;
    connect_info.path = parsed_url.path.c_str();
    connect_info.host = parsed_url.host.c_str();
    connect_info.origin = parsed_url.host.c_str();
    connect_info.method = "GET";
    connect_info.alpn = "http/1.1";
    connect_info.protocol = http_protocols[0].name;
    connect_info.ssl_connection = parsed_url.use_tls ? LCCSCF_USE_SSL : 0;
    connect_info.pwsi = &connection;

    if (lws_client_connect_via_info(&connect_info) == nullptr && !state.failed) {
        lws_context_destroy(context);
        return host_ops::make_failure(host_ops::ErrorKind::NetworkFailure,
                                      "Failed to connect to " + parsed_url.host + ":" +
                                          std::to_string(parsed_url.port));
    }

    if (timeout_milliseconds > 0 && connection != nullptr) {
        // The library closes the connection itself once this expires, waking the loop below.
        long long timeout_seconds = (static_cast<long long>(timeout_milliseconds) + 999) / 1000;
        lws_set_timeout(connection, PENDING_TIMEOUT_USER_OK, static_cast<int>(timeout_seconds));
    }

    auto start_time = std::chrono::steady_clock::now();
    bool timed_out = false;

    while (!state.completed && !state.failed) {
        if (lws_service(context, 50) < 0) {
            state.failed = true;
            state.error_message = "libwebsockets service loop failed";
            break;
        }

        if (timeout_milliseconds > 0) {
            auto elapsed = std::chrono::steady_clock::now() - start_time;
            if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > timeout_milliseconds) {
                timed_out = true;
                break;
            }
        }
    }

    lws_context_destroy(context);

    if (timed_out) {
        return host_ops::make_failure(host_ops::ErrorKind::NetworkFailure,
                                      "Timed out after " + std::to_string(timeout_milliseconds) + " ms");
    }
    if (state.failed && !state.completed) {
        return host_ops::make_failure(host_ops::ErrorKind::NetworkFailure,
                                      state.error_message);
    }

    HttpResponse response;
    response.status = state.status;
    response.body = std::move(state.body);
    return response;
}

} // namespace http_client
