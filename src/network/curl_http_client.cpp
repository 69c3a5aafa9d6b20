#include "harvest/network/curl_http_client.hpp"

#include "harvest/network/curl_support.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace harvest::network {

namespace {

struct TransferContext {
    std::vector<std::uint8_t>* body = nullptr;
    std::uint64_t max_body_bytes = 0;
    const CancellationToken* cancel = nullptr;
    bool body_limit_hit = false;
};

size_t write_cb(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    const size_t total = size * nmemb;
    if (ctx->body->size() + total > ctx->max_body_bytes) {
        ctx->body_limit_hit = true;
        return 0;   // CURLE_WRITE_ERROR
    }
    ctx->body->insert(ctx->body->end(), data, data + total);
    return total;
}

int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* ctx = static_cast<const TransferContext*>(userdata);
    return ctx->cancel->is_cancelled() ? 1 : 0;   // non-zero aborts the transfer
}

Error make_curl_error(CURLcode code, const TransferContext& ctx, const char* detail) {
    const std::string reason = detail[0] != '\0' ? detail : curl_easy_strerror(code);
    switch (code) {
        case CURLE_ABORTED_BY_CALLBACK:
            return Error{ErrorCode::Cancelled, "request cancelled"};
        case CURLE_OPERATION_TIMEDOUT:
            return Error{ErrorCode::Timeout, "request timed out: " + reason};
        case CURLE_WRITE_ERROR:
            if (ctx.body_limit_hit) {
                return Error{ErrorCode::NetworkError, "response body exceeds the configured limit"};
            }
            break;
        default:
            break;
    }
    return Error{ErrorCode::NetworkError, reason};
}

} // namespace

CurlHttpClient::CurlHttpClient(Options options) : options_(std::move(options)) {
    ensure_curl_initialized();
}

Result<FetchResponse> CurlHttpClient::get(const std::string& url,
                                          const session::CookieList& cookies,
                                          const CancellationToken& cancel) {
    if (cancel.is_cancelled()) {
        return Err<FetchResponse>(ErrorCode::Cancelled, "request cancelled before start");
    }

    auto handle = make_curl_easy();
    if (handle.is_error()) {
        return Err<FetchResponse>(handle.error());
    }
    CURL* curl = handle.value().get();

    FetchResponse response;
    TransferContext ctx;
    ctx.body = &response.body;
    ctx.max_body_bytes = options_.max_body_bytes;
    ctx.cancel = &cancel;
    char error_buffer[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Timeouts
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(options_.timeout).count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::min(options_.connect_timeout, options_.timeout)).count()));

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(options_.max_redirects));

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    // Cookies: an empty COOKIEFILE switches the engine on without reading a file
    curl_easy_setopt(curl, CURLOPT_COOKIEFILE, "");
    for (const auto& line : cookies) {
        if (curl_easy_setopt(curl, CURLOPT_COOKIELIST, line.c_str()) != CURLE_OK) {
            spdlog::warn("libcurl rejected cookie line: {}", line);
        }
    }

    // Body and cancellation
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);

    const CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        if (cancel.is_cancelled()) {
            return Err<FetchResponse>(ErrorCode::Cancelled, "request cancelled");
        }
        return Err<FetchResponse>(make_curl_error(rc, ctx, error_buffer));
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<int>(status);

    const char* content_type = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
        response.content_type = content_type;
    }
    const char* effective_url = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective_url) == CURLE_OK && effective_url) {
        response.final_url = effective_url;
    }

    long redirects = 0;
    curl_easy_getinfo(curl, CURLINFO_REDIRECT_COUNT, &redirects);
    if (redirects > 0) {
        spdlog::debug("GET {} followed {} redirects to {}", url, redirects, response.final_url);
    }
    spdlog::debug("GET {} -> {} ({} bytes)", url, response.status, response.body.size());
    return Ok(std::move(response));
}

} // namespace harvest::network
