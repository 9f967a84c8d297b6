/**
 * @file http_transport.cpp
 * @brief libcurl implementation of HttpTransport
 *
 * **Threading Model**:
 * - curl_global_init() runs exactly once per process
 * - every request owns a private easy handle
 * - a CURLSH share handle pools connections, DNS and TLS sessions; libcurl
 *   serialises access to it through the lock callbacks below
 *
 * **Abort Handling**:
 * Streaming calls install a write callback (per chunk) and an xferinfo
 * callback (polled by libcurl roughly once per second even while idle).
 * Either one stopping the transfer yields HttpResponse::aborted.
 *
 * @date 2025
 */

#include "threatweaver/utils/http_transport.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <array>
#include <mutex>
#include <stdexcept>

namespace threatweaver {
namespace utils {

namespace {

std::once_flag g_curl_init_flag;

void EnsureCurlInitialized() {
    std::call_once(g_curl_init_flag, []() {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_global_init failed: ") +
                                     curl_easy_strerror(rc));
        }
    });
}

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};
struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
struct MimeDeleter {
    void operator()(curl_mime* mime) const { curl_mime_free(mime); }
};

/**
 * @brief Per-transfer state reachable from libcurl callbacks
 */
struct TransferContext {
    std::string* body{nullptr};
    const ChunkHandler* on_chunk{nullptr};
    const AbortCheck* should_abort{nullptr};
    bool aborted{false};
};

size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    size_t bytes = size * nmemb;

    if (ctx->on_chunk != nullptr && *ctx->on_chunk) {
        if (!(*ctx->on_chunk)(ptr, bytes)) {
            ctx->aborted = true;
            return 0;  // CURLE_WRITE_ERROR
        }
        return bytes;
    }

    if (ctx->body != nullptr) {
        ctx->body->append(ptr, bytes);
    }
    return bytes;
}

int XferInfoCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (ctx->should_abort != nullptr && *ctx->should_abort && (*ctx->should_abort)()) {
        ctx->aborted = true;
        return 1;  // CURLE_ABORTED_BY_CALLBACK
    }
    return 0;
}

} // anonymous namespace

// ============================================================================
// SHARED CONNECTION POOL
// ============================================================================

struct CurlHttpTransport::SharedState {
    CURLSH* share{nullptr};
    std::array<std::mutex, CURL_LOCK_DATA_LAST> locks;

    static void Lock(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<SharedState*>(userptr)->locks[static_cast<std::size_t>(data)].lock();
    }

    static void Unlock(CURL*, curl_lock_data data, void* userptr) {
        static_cast<SharedState*>(userptr)->locks[static_cast<std::size_t>(data)].unlock();
    }
};

CurlHttpTransport::CurlHttpTransport()
    : shared_(std::make_unique<SharedState>()) {
    EnsureCurlInitialized();

    shared_->share = curl_share_init();
    if (shared_->share == nullptr) {
        throw std::runtime_error("curl_share_init failed");
    }

    curl_share_setopt(shared_->share, CURLSHOPT_LOCKFUNC, &SharedState::Lock);
    curl_share_setopt(shared_->share, CURLSHOPT_UNLOCKFUNC, &SharedState::Unlock);
    curl_share_setopt(shared_->share, CURLSHOPT_USERDATA, shared_.get());
    curl_share_setopt(shared_->share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(shared_->share, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
    curl_share_setopt(shared_->share, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);

    spdlog::debug("HTTP transport initialized ({})", curl_version());
}

CurlHttpTransport::~CurlHttpTransport() {
    if (shared_ && shared_->share != nullptr) {
        curl_share_cleanup(shared_->share);
    }
}

// ============================================================================
// REQUEST EXECUTION
// ============================================================================

HttpResponse CurlHttpTransport::Send(const HttpRequest& request) {
    return Perform(request, nullptr, nullptr);
}

HttpResponse CurlHttpTransport::Stream(const HttpRequest& request,
                                       const ChunkHandler& on_chunk,
                                       const AbortCheck& should_abort) {
    return Perform(request, &on_chunk, &should_abort);
}

HttpResponse CurlHttpTransport::Perform(const HttpRequest& request,
                                        const ChunkHandler* on_chunk,
                                        const AbortCheck* should_abort) {
    HttpResponse response;

    std::unique_ptr<CURL, EasyDeleter> easy(curl_easy_init());
    if (!easy) {
        response.transport_error = "curl_easy_init failed";
        return response;
    }
    CURL* handle = easy.get();

    TransferContext ctx;
    ctx.body = &response.body;
    ctx.on_chunk = on_chunk;
    ctx.should_abort = should_abort;

    curl_easy_setopt(handle, CURLOPT_SHARE, shared_->share);
    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, &WriteCallback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, &XferInfoCallback);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(request.connect_timeout.count()));

    std::unique_ptr<curl_slist, SlistDeleter> headers;
    for (const auto& [name, value] : request.headers) {
        std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(headers.get(), line.c_str());
        if (appended == nullptr) {
            response.transport_error = "curl_slist_append failed";
            return response;
        }
        headers.release();
        headers.reset(appended);
    }
    if (headers) {
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
    }

    std::unique_ptr<curl_mime, MimeDeleter> mime;
    if (request.multipart) {
        mime.reset(curl_mime_init(handle));
        curl_mimepart* part = curl_mime_addpart(mime.get());
        curl_mime_name(part, request.multipart->field_name.c_str());
        curl_mime_filename(part, request.multipart->file_name.c_str());
        curl_mime_data(part, request.multipart->content.data(), request.multipart->content.size());
        curl_easy_setopt(handle, CURLOPT_MIMEPOST, mime.get());
    } else if (request.method == "POST" || request.method == "PUT" || request.method == "PATCH") {
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body.size()));
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.data());
    }

    if (request.method != "GET" && request.method != "POST") {
        curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    spdlog::debug("HTTP {} {}", request.method, request.url);

    CURLcode rc = curl_easy_perform(handle);

    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);

    if (ctx.aborted) {
        response.aborted = true;
    } else if (rc != CURLE_OK) {
        response.transport_error = curl_easy_strerror(rc);
        spdlog::debug("HTTP {} {} failed: {}", request.method, request.url, response.transport_error);
    }

    return response;
}

} // namespace utils
} // namespace threatweaver
