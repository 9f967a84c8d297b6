/**
 * @file http_transport.hpp
 * @brief HTTP client abstraction for the remote sandbox backend
 *
 * The remote backend talks to a REST control plane and to an agent running
 * inside each micro-VM. Both go through HttpTransport so that the protocol
 * logic can be exercised against a scripted fake in tests. The production
 * implementation is built on libcurl.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace threatweaver {
namespace utils {

/**
 * @struct MultipartFile
 * @brief Single file part of a multipart/form-data upload
 */
struct MultipartFile {
    std::string field_name{"file"};  ///< Form field name
    std::string file_name;           ///< Filename reported to the server
    std::string content;             ///< Raw bytes
};

/**
 * @struct HttpRequest
 * @brief Outgoing request description
 */
struct HttpRequest {
    std::string method{"GET"};                                  ///< HTTP verb
    std::string url;                                            ///< Absolute URL
    std::vector<std::pair<std::string, std::string>> headers;   ///< Extra headers
    std::string body;                                           ///< Request body
    std::optional<MultipartFile> multipart;                     ///< Multipart upload (replaces body)
    std::chrono::milliseconds timeout{30000};                   ///< Whole-transfer limit, 0 = none
    std::chrono::milliseconds connect_timeout{10000};           ///< Connection phase limit
};

/**
 * @struct HttpResponse
 * @brief Response status and body
 *
 * status is 0 when no HTTP response was received; transport_error then
 * describes why (DNS failure, refused connection, TLS error, timeout).
 */
struct HttpResponse {
    long status{0};                 ///< HTTP status code
    std::string body;               ///< Response body (empty for streamed calls)
    std::string transport_error;    ///< Non-empty on transport failure
    bool aborted{false};            ///< Transfer stopped by the caller's abort hook

    bool Ok() const { return transport_error.empty() && !aborted && status >= 200 && status < 300; }
};

/// Receives each chunk of a streamed response body. Return false to abort.
using ChunkHandler = std::function<bool(const char* data, std::size_t length)>;

/// Polled while a transfer is in flight. Return true to abort.
using AbortCheck = std::function<bool()>;

/**
 * @class HttpTransport
 * @brief Abstract HTTP client
 *
 * Implementations must be safe to call from many threads at once.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /// Perform a request and buffer the whole response body.
    virtual HttpResponse Send(const HttpRequest& request) = 0;

    /**
     * @brief Perform a request, delivering the body incrementally
     *
     * @param request Request to send
     * @param on_chunk Called for each received body chunk
     * @param should_abort Polled during the transfer (also while idle)
     * @return Response with empty body; aborted=true if either hook stopped it
     */
    virtual HttpResponse Stream(const HttpRequest& request,
                                const ChunkHandler& on_chunk,
                                const AbortCheck& should_abort) = 0;
};

/**
 * @class CurlHttpTransport
 * @brief libcurl-based HttpTransport
 *
 * Each call uses its own easy handle. Handles share DNS cache, TLS
 * sessions and the connection pool through a lock-protected share handle,
 * which is the only state shared between concurrent executions.
 */
class CurlHttpTransport : public HttpTransport {
public:
    CurlHttpTransport();
    ~CurlHttpTransport() override;

    CurlHttpTransport(const CurlHttpTransport&) = delete;
    CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

    HttpResponse Send(const HttpRequest& request) override;

    HttpResponse Stream(const HttpRequest& request,
                        const ChunkHandler& on_chunk,
                        const AbortCheck& should_abort) override;

private:
    struct SharedState;
    std::unique_ptr<SharedState> shared_;

    HttpResponse Perform(const HttpRequest& request,
                         const ChunkHandler* on_chunk,
                         const AbortCheck* should_abort);
};

} // namespace utils
} // namespace threatweaver
