// Copyright (c) 2026 changcheng967. All rights reserved.

#include <patchsync/core/http_session.hpp>
#include <patchsync/core/log.hpp>
#include <patchsync/disk/error.hpp>
#include <curl/curl.h>

#include <cctype>
#include <charconv>
#include <map>

namespace patchsync::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

using HeaderMap = std::map<std::string, std::string>;

// Per-transfer state shared by the callbacks
struct TransferState {
    CURL* curl{nullptr};
    std::stop_token stop;
    HeaderMap headers;

    // fetch() only
    const FetchRequest* request{nullptr};
    const HeadHandler* on_head{nullptr};
    const BodyHandler* on_body{nullptr};
    bool head_delivered{false};
    std::error_code handler_error;

    // get_text() only
    std::string* text{nullptr};
};

std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* state = static_cast<TransferState*>(userdata);
    if (!state) return total;

    std::string_view header(buffer, total);

    // A new status line starts a new response (redirects, 100-continue)
    if (header.starts_with("HTTP/")) {
        state->headers.clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    state->headers[lower_name] = std::string(value);
    return total;
}

std::optional<std::uint64_t> parse_u64(std::string_view text) noexcept {
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

ResponseHead build_head(TransferState& state) {
    ResponseHead head;

    long http_code = 0;
    curl_easy_getinfo(state.curl, CURLINFO_RESPONSE_CODE, &http_code);
    head.status_code = static_cast<std::int32_t>(http_code);

    // Non-HTTP protocols (file://) report no status and honour the range as asked
    if (http_code == 0) {
        head.partial = state.request->wants_range();
        head.range_start = state.request->offset;
        return head;
    }

    if (http_code == 206) {
        auto it = state.headers.find("content-range");
        if (it != state.headers.end()) {
            if (auto range = HttpSession::parse_content_range(it->second)) {
                head.partial = true;
                head.range_start = range->first;
                head.total_size = range->total;
            }
        }
        return head;
    }

    auto it = state.headers.find("content-length");
    if (it != state.headers.end()) {
        head.total_size = parse_u64(it->second);
    }
    return head;
}

std::error_code deliver_head(TransferState& state) {
    state.head_delivered = true;
    if (!state.on_head || !*state.on_head) return {};
    return (*state.on_head)(build_head(state));
}

std::size_t body_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* state = static_cast<TransferState*>(userdata);
    std::size_t bytes = size * nmemb;

    try {
        if (!state->head_delivered) {
            if (auto ec = deliver_head(*state)) {
                state->handler_error = ec;
                return 0;
            }
        }
        if (auto ec = (*state->on_body)(std::span<const std::byte>(
                reinterpret_cast<const std::byte*>(ptr), bytes))) {
            state->handler_error = ec;
            return 0;
        }
    } catch (const std::exception& e) {
        logger()->error("Body handler threw: {}", e.what());
        state->handler_error = make_error_code(SyncErrc::transfer_failed);
        return 0;
    }
    return bytes;
}

std::size_t text_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* state = static_cast<TransferState*>(userdata);
    std::size_t bytes = size * nmemb;
    try {
        state->text->append(ptr, bytes);
    } catch (const std::bad_alloc&) {
        state->handler_error = make_error_code(disk::DiskErrc::allocation_failed);
        return 0;
    }
    return bytes;
}

// libcurl progress callback - aborts the transfer once a stop is requested
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* state = static_cast<TransferState*>(userdata);
    return state->stop.stop_requested() ? 1 : 0;
}

void apply_common_options(CURL* curl, const std::string& url, const HttpOptions& options,
                          TransferState& state) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);

    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }

    // Timeouts
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connect_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options.stall_timeout_sec));

    // SSL options
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);

    if (!options.user_agent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &state);

    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
}

std::error_code map_result(CURLcode result, TransferState& state) {
    switch (result) {
        case CURLE_OK:
            return {};
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(SyncErrc::cancelled);
        case CURLE_WRITE_ERROR:
            if (state.handler_error) return state.handler_error;
            return make_error_code(disk::DiskErrc::write_error);
        case CURLE_HTTP_RETURNED_ERROR: {
            long http_code = 0;
            curl_easy_getinfo(state.curl, CURLINFO_RESPONSE_CODE, &http_code);
            return HttpSession::status_error(http_code);
        }
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(SyncErrc::stall_detected);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return make_error_code(SyncErrc::network_transient);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(SyncErrc::invalid_url);
        case CURLE_FILE_COULDNT_READ_FILE:
        case CURLE_REMOTE_FILE_NOT_FOUND:
            return make_error_code(SyncErrc::not_found);
        case CURLE_RANGE_ERROR:
            return make_error_code(SyncErrc::range_unsupported);
        default:
            return make_error_code(SyncErrc::transfer_failed);
    }
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(HttpOptions options)
    : options_(std::move(options)) {}

std::expected<RemoteInfo, std::error_code>
HttpSession::head(const std::string& url, std::stop_token stop) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(SyncErrc::network_transient));
    }

    TransferState state;
    state.curl = curl.ptr;
    state.stop = std::move(stop);

    apply_common_options(curl.ptr, url, options_, state);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (auto ec = map_result(result, state)) {
        logger()->debug("HEAD {} failed: {}", url, ec.message());
        return std::unexpected(ec);
    }

    RemoteInfo info;
    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    info.status_code = static_cast<std::int32_t>(http_code);

    // CURLINFO_CONTENT_LENGTH_DOWNLOAD_T is not reliable for HEAD, read the header first
    auto cl_it = state.headers.find("content-length");
    if (cl_it != state.headers.end()) {
        info.content_length = parse_u64(cl_it->second);
    }
    if (!info.content_length) {
        curl_off_t cl = -1;
        if (curl_easy_getinfo(curl.ptr, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl) == CURLE_OK && cl >= 0) {
            info.content_length = static_cast<std::uint64_t>(cl);
        }
    }
    return info;
}

std::expected<std::string, std::error_code>
HttpSession::get_text(const std::string& url, std::stop_token stop) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(SyncErrc::network_transient));
    }

    std::string text;
    TransferState state;
    state.curl = curl.ptr;
    state.stop = std::move(stop);
    state.text = &text;

    apply_common_options(curl.ptr, url, options_, state);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, text_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &state);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (auto ec = map_result(result, state)) {
        return std::unexpected(ec);
    }
    return text;
}

std::error_code HttpSession::fetch(const FetchRequest& request,
                                   const HeadHandler& on_head,
                                   const BodyHandler& on_body,
                                   std::stop_token stop) {
    if (request.last_byte && *request.last_byte < request.offset) {
        return make_error_code(SyncErrc::invalid_range);
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return make_error_code(SyncErrc::network_transient);
    }

    TransferState state;
    state.curl = curl.ptr;
    state.stop = std::move(stop);
    state.request = &request;
    state.on_head = &on_head;
    state.on_body = &on_body;

    apply_common_options(curl.ptr, request.url, options_, state);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, body_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(TRANSFER_BUFFER_SIZE));

    std::string range;
    if (request.wants_range()) {
        range = std::to_string(request.offset) + "-";
        if (request.last_byte) {
            range += std::to_string(*request.last_byte);
        }
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
    }

    logger()->debug("GET {} range [{}]", request.url, range.empty() ? "full" : range);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (auto ec = map_result(result, state)) {
        return ec;
    }

    // Empty body: the head handler has not seen the response yet
    if (!state.head_delivered) {
        return deliver_head(state);
    }
    return {};
}

std::error_code HttpSession::status_error(long http_code) noexcept {
    if (http_code == 404 || http_code == 410) {
        return make_error_code(SyncErrc::not_found);
    }
    if (http_code == 408 || http_code == 429 || http_code >= 500) {
        return make_error_code(SyncErrc::network_transient);
    }
    if (http_code == 416) {
        return make_error_code(SyncErrc::invalid_range);
    }
    return make_error_code(SyncErrc::http_error);
}

std::optional<HttpSession::ContentRange>
HttpSession::parse_content_range(std::string_view value) noexcept {
    // "bytes 100-199/1000"
    constexpr std::string_view prefix = "bytes ";
    if (!value.starts_with(prefix)) return std::nullopt;
    value.remove_prefix(prefix.size());

    auto dash = value.find('-');
    auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || slash < dash) {
        return std::nullopt;
    }

    auto first = parse_u64(value.substr(0, dash));
    auto last = parse_u64(value.substr(dash + 1, slash - dash - 1));
    if (!first || !last || *last < *first) return std::nullopt;

    ContentRange range{*first, *last, std::nullopt};
    auto total = value.substr(slash + 1);
    if (total != "*") {
        range.total = parse_u64(total);
        if (!range.total) return std::nullopt;
    }
    return range;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace patchsync::core
