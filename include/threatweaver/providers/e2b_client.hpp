/**
 * @file e2b_client.hpp
 * @brief Protocol client for the E2B micro-VM service
 *
 * Two endpoints are involved:
 * - **Control plane** (`{api_url}`): create, list and kill sandboxes,
 *   authenticated with the `X-API-Key` header
 * - **In-sandbox agent** (`https://49983-{sandbox_id}.{domain}`): filesystem
 *   and process RPCs. Process output arrives as a Connect-protocol server
 *   stream of length-prefixed JSON envelopes.
 *
 * The client only speaks the protocol; sandbox policy lives in E2bProvider.
 *
 * @date 2025
 */

#pragma once

#include "threatweaver/utils/http_transport.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace threatweaver {
namespace providers {

/**
 * @class E2bError
 * @brief Control plane or agent call failed
 */
class E2bError : public std::runtime_error {
public:
    explicit E2bError(const std::string& message, long status = 0)
        : std::runtime_error(message), status_(status) {}

    /// HTTP status of the failing call, 0 for transport failures.
    long Status() const { return status_; }

private:
    long status_;
};

// ============================================================================
// CONNECT STREAM FRAMING
// ============================================================================

/// Envelope flag marking the trailing end-of-stream message.
constexpr std::uint8_t kConnectEndStreamFlag = 0x02;

/**
 * @struct ConnectEnvelope
 * @brief One frame of a Connect streaming body
 *
 * Wire format: 1 flag byte, 4-byte big-endian payload length, payload.
 */
struct ConnectEnvelope {
    std::uint8_t flags{0};
    std::string payload;

    bool EndStream() const { return (flags & kConnectEndStreamFlag) != 0; }
};

/// Frame a payload as a Connect envelope.
std::string EncodeConnectEnvelope(const std::string& payload, std::uint8_t flags = 0);

/**
 * @class ConnectEnvelopeDecoder
 * @brief Incremental decoder for envelopes split across network chunks
 */
class ConnectEnvelopeDecoder {
public:
    /// Maximum accepted payload size; larger frames are a protocol error.
    static constexpr std::size_t kMaxPayloadBytes = 16 * 1024 * 1024;

    void Feed(const char* data, std::size_t length);

    /**
     * @brief Pop the next complete envelope
     * @return false if more bytes are needed
     * @throws E2bError if a frame announces more than kMaxPayloadBytes
     */
    bool Next(ConnectEnvelope& envelope);

    std::size_t Buffered() const { return buffer_.size() - offset_; }

private:
    std::string buffer_;
    std::size_t offset_{0};
};

// ============================================================================
// REQUEST / RESPONSE TYPES
// ============================================================================

/**
 * @struct E2bClientOptions
 * @brief Endpoints and credentials
 */
struct E2bClientOptions {
    std::string api_url{"https://api.e2b.app"};
    std::string api_key;                          ///< Never logged
    std::string domain{"e2b.app"};
    std::string user{"user"};                     ///< Account for agent calls
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds transfer_timeout{300000};  ///< File uploads and downloads
    int envd_port{49983};
};

/**
 * @struct E2bSandbox
 * @brief Handle of a created sandbox
 */
struct E2bSandbox {
    std::string sandbox_id;
    std::string access_token;  ///< Agent token; empty if the sandbox is not secured
};

/**
 * @struct CreateSandboxRequest
 * @brief Parameters of POST /sandboxes
 */
struct CreateSandboxRequest {
    std::string template_id;
    std::chrono::seconds timeout{300};               ///< Service-side lifetime
    std::map<std::string, std::string> metadata;     ///< Searchable labels
    std::map<std::string, std::string> env_vars;     ///< Sandbox-wide environment
    bool allow_internet_access{true};
};

/**
 * @struct ProcessRequest
 * @brief Program to start through the agent
 */
struct ProcessRequest {
    std::string cmd;
    std::vector<std::string> args;
    std::map<std::string, std::string> envs;
    std::string cwd;
};

/**
 * @struct ProcessOutcome
 * @brief Everything observed on a process stream
 */
struct ProcessOutcome {
    bool started{false};          ///< start event received
    std::uint32_t pid{0};
    bool ended{false};            ///< end event received
    bool exited{false};           ///< Process exited normally (not by signal)
    int exit_code{-1};
    std::string status;           ///< Agent status text, e.g. "exit status 1", "signal: killed"
    std::string error;            ///< Agent-reported error
    bool aborted{false};          ///< Caller's abort hook stopped the stream
    long http_status{0};
    std::string transport_error;  ///< Transport or protocol failure
};

/// Receives decoded process output; is_stderr selects the stream.
using ProcessOutputSink = std::function<void(bool is_stderr, const std::string& data)>;

/**
 * @class E2bClient
 * @brief Stateless protocol client over an HttpTransport
 *
 * **Thread Safety**: Safe for concurrent use if the transport is.
 */
class E2bClient {
public:
    E2bClient(std::shared_ptr<utils::HttpTransport> transport, E2bClientOptions options);

    // ---- Control plane ----

    /**
     * @brief Create a sandbox
     * @throws E2bError on any non-2xx answer or malformed reply
     */
    E2bSandbox CreateSandbox(const CreateSandboxRequest& request);

    /**
     * @brief Kill a sandbox
     * @return true if killed, false if it no longer existed
     * @throws E2bError on any other failure
     */
    bool KillSandbox(const std::string& sandbox_id);

    /**
     * @brief IDs of running sandboxes whose metadata contains all pairs
     * @throws E2bError on failure
     */
    std::vector<std::string> ListSandboxes(const std::map<std::string, std::string>& metadata);

    /**
     * @brief Authenticated read-only call against the control plane
     * @return HTTP status, 0 if the service could not be reached
     */
    long ProbeControlPlane(std::chrono::milliseconds timeout);

    // ---- In-sandbox agent ----

    /// Create a directory (and parents); existing directories are fine.
    void MakeDir(const E2bSandbox& sandbox, const std::string& path);

    /**
     * @brief Upload a file, creating parent directories
     * @param should_abort Polled during the transfer; true stops it
     * @throws E2bError on failure, timeout or abort
     */
    void WriteFile(const E2bSandbox& sandbox, const std::string& path, const std::string& content,
                   const utils::AbortCheck& should_abort);

    /**
     * @brief Stream a file's contents to a sink
     *
     * Chunks reach on_chunk as they arrive, before the status is known;
     * callers must discard what they received unless the call returns true.
     *
     * @param on_chunk Receives the body; returning false stops the transfer
     * @param should_abort Polled during the transfer; true stops it
     * @return true if the file was downloaded, false if it does not exist
     * @throws E2bError on other failures, timeout or abort
     */
    bool DownloadFile(const E2bSandbox& sandbox, const std::string& path,
                      const utils::ChunkHandler& on_chunk,
                      const utils::AbortCheck& should_abort);

    /**
     * @brief Start a process and stream its output until it ends
     *
     * Never throws; failures are reported in the outcome.
     *
     * @param sandbox Target sandbox
     * @param request Program, arguments, environment, working directory
     * @param on_output Receives decoded stdout/stderr chunks
     * @param should_abort Polled while streaming; true stops the stream
     */
    ProcessOutcome RunProcess(const E2bSandbox& sandbox,
                              const ProcessRequest& request,
                              const ProcessOutputSink& on_output,
                              const utils::AbortCheck& should_abort);

    /// Base URL of a sandbox's agent.
    std::string AgentUrl(const std::string& sandbox_id) const;

    const E2bClientOptions& Options() const { return options_; }

private:
    std::shared_ptr<utils::HttpTransport> transport_;
    E2bClientOptions options_;

    utils::HttpRequest ControlRequest(const std::string& method, const std::string& path) const;
    utils::HttpRequest AgentRequest(const E2bSandbox& sandbox, const std::string& method,
                                    const std::string& path) const;
    static std::string DescribeFailure(const std::string& what, const utils::HttpResponse& response);
    static void HandleProcessEvent(const std::string& payload, ProcessOutcome& outcome,
                                   const ProcessOutputSink& on_output);
};

} // namespace providers
} // namespace threatweaver
