/**
 * @file e2b_client.cpp
 * @brief Control plane REST calls and agent RPCs for E2B sandboxes
 *
 * **Process Stream Events** (one JSON object per envelope):
 * ```json
 * {"event": {"start": {"pid": 42}}}
 * {"event": {"data": {"stdout": "aGVsbG8K"}}}
 * {"event": {"end": {"exitCode": 0, "exited": true, "status": "exit status 0"}}}
 * {"event": {"keepalive": {}}}
 * ```
 * The stream closes with an end-stream envelope (flag 0x02) that carries
 * `{"error": {...}}` when the RPC itself failed.
 *
 * @date 2025
 */

#include "threatweaver/providers/e2b_client.hpp"
#include "threatweaver/utils/output_buffer.hpp"
#include "threatweaver/utils/string_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

using json = nlohmann::json;

namespace threatweaver {
namespace providers {

using utils::HttpRequest;
using utils::HttpResponse;
using utils::StringUtils;

namespace {

/// Reply bytes kept for error messages.
constexpr std::size_t kDiagnosticBytes = 4096;

} // anonymous namespace

// ============================================================================
// CONNECT ENVELOPES
// ============================================================================

std::string EncodeConnectEnvelope(const std::string& payload, std::uint8_t flags) {
    std::string frame;
    frame.reserve(payload.size() + 5);

    auto length = static_cast<std::uint32_t>(payload.size());
    frame.push_back(static_cast<char>(flags));
    frame.push_back(static_cast<char>((length >> 24) & 0xFF));
    frame.push_back(static_cast<char>((length >> 16) & 0xFF));
    frame.push_back(static_cast<char>((length >> 8) & 0xFF));
    frame.push_back(static_cast<char>(length & 0xFF));
    frame.append(payload);
    return frame;
}

void ConnectEnvelopeDecoder::Feed(const char* data, std::size_t length) {
    // Drop consumed bytes once they dominate the buffer.
    if (offset_ > 0 && offset_ >= buffer_.size() / 2) {
        buffer_.erase(0, offset_);
        offset_ = 0;
    }
    buffer_.append(data, length);
}

bool ConnectEnvelopeDecoder::Next(ConnectEnvelope& envelope) {
    if (Buffered() < 5) {
        return false;
    }

    const auto* header = reinterpret_cast<const unsigned char*>(buffer_.data() + offset_);
    std::uint32_t length = (static_cast<std::uint32_t>(header[1]) << 24) |
                           (static_cast<std::uint32_t>(header[2]) << 16) |
                           (static_cast<std::uint32_t>(header[3]) << 8) |
                           static_cast<std::uint32_t>(header[4]);

    if (length > kMaxPayloadBytes) {
        throw E2bError("stream frame of " + std::to_string(length) + " bytes exceeds limit");
    }
    if (Buffered() < 5 + static_cast<std::size_t>(length)) {
        return false;
    }

    envelope.flags = header[0];
    envelope.payload.assign(buffer_, offset_ + 5, length);
    offset_ += 5 + length;
    return true;
}

// ============================================================================
// CONSTRUCTION AND REQUEST HELPERS
// ============================================================================

E2bClient::E2bClient(std::shared_ptr<utils::HttpTransport> transport, E2bClientOptions options)
    : transport_(std::move(transport)), options_(std::move(options)) {
    if (!transport_) {
        throw std::invalid_argument("E2bClient requires an HTTP transport");
    }
    while (StringUtils::EndsWith(options_.api_url, "/")) {
        options_.api_url.pop_back();
    }
}

std::string E2bClient::AgentUrl(const std::string& sandbox_id) const {
    return "https://" + std::to_string(options_.envd_port) + "-" + sandbox_id + "." + options_.domain;
}

HttpRequest E2bClient::ControlRequest(const std::string& method, const std::string& path) const {
    HttpRequest request;
    request.method = method;
    request.url = options_.api_url + path;
    request.headers.emplace_back("X-API-Key", options_.api_key);
    request.timeout = options_.request_timeout;
    return request;
}

HttpRequest E2bClient::AgentRequest(const E2bSandbox& sandbox, const std::string& method,
                                    const std::string& path) const {
    HttpRequest request;
    request.method = method;
    request.url = AgentUrl(sandbox.sandbox_id) + path;
    request.headers.emplace_back("Authorization", "Basic " + StringUtils::ToBase64(options_.user + ":"));
    if (!sandbox.access_token.empty()) {
        request.headers.emplace_back("X-Access-Token", sandbox.access_token);
    }
    request.timeout = options_.request_timeout;
    return request;
}

std::string E2bClient::DescribeFailure(const std::string& what, const HttpResponse& response) {
    if (!response.transport_error.empty()) {
        return what + ": " + response.transport_error;
    }
    if (response.aborted) {
        return what + ": aborted";
    }

    std::string detail;
    try {
        json j = json::parse(response.body);
        if (j.is_object() && j.contains("message") && j["message"].is_string()) {
            detail = j["message"].get<std::string>();
        }
    } catch (const json::exception&) {
        detail = StringUtils::Trim(StringUtils::Tail(response.body, 300));
    }

    std::string message = what + ": HTTP " + std::to_string(response.status);
    if (!detail.empty()) {
        message += " (" + StringUtils::Sanitize(detail) + ")";
    }
    return message;
}

// ============================================================================
// CONTROL PLANE
// ============================================================================

E2bSandbox E2bClient::CreateSandbox(const CreateSandboxRequest& create) {
    json body = {
        {"templateID", create.template_id},
        {"timeout", create.timeout.count()},
        {"metadata", create.metadata},
        {"envVars", create.env_vars},
        {"allow_internet_access", create.allow_internet_access},
        {"secure", true}
    };

    HttpRequest request = ControlRequest("POST", "/sandboxes");
    request.headers.emplace_back("Content-Type", "application/json");
    request.body = body.dump();

    spdlog::debug("Creating E2B sandbox from template {}", create.template_id);
    HttpResponse response = transport_->Send(request);
    if (!response.Ok()) {
        throw E2bError(DescribeFailure("create sandbox", response), response.status);
    }

    E2bSandbox sandbox;
    try {
        json reply = json::parse(response.body);
        sandbox.sandbox_id = reply.at("sandboxID").get<std::string>();
        if (reply.contains("envdAccessToken") && reply["envdAccessToken"].is_string()) {
            sandbox.access_token = reply["envdAccessToken"].get<std::string>();
        }
    } catch (const json::exception& e) {
        throw E2bError(std::string("create sandbox: malformed reply: ") + e.what(), response.status);
    }

    if (sandbox.sandbox_id.empty()) {
        throw E2bError("create sandbox: empty sandbox id", response.status);
    }
    return sandbox;
}

bool E2bClient::KillSandbox(const std::string& sandbox_id) {
    HttpRequest request = ControlRequest("DELETE", "/sandboxes/" + StringUtils::UrlEncode(sandbox_id));
    HttpResponse response = transport_->Send(request);

    if (response.Ok()) {
        return true;
    }
    if (response.transport_error.empty() && response.status == 404) {
        return false;
    }
    throw E2bError(DescribeFailure("kill sandbox " + sandbox_id, response), response.status);
}

std::vector<std::string> E2bClient::ListSandboxes(const std::map<std::string, std::string>& metadata) {
    std::vector<std::string> pairs;
    for (const auto& [key, value] : metadata) {
        pairs.push_back(StringUtils::UrlEncode(key) + "=" + StringUtils::UrlEncode(value));
    }

    std::string path = "/sandboxes";
    if (!pairs.empty()) {
        path += "?metadata=" + StringUtils::UrlEncode(StringUtils::Join(pairs, "&"));
    }

    HttpResponse response = transport_->Send(ControlRequest("GET", path));
    if (!response.Ok()) {
        throw E2bError(DescribeFailure("list sandboxes", response), response.status);
    }

    std::vector<std::string> ids;
    try {
        json reply = json::parse(response.body);
        if (!reply.is_array()) {
            throw E2bError("list sandboxes: expected an array", response.status);
        }
        for (const auto& entry : reply) {
            if (entry.contains("sandboxID") && entry["sandboxID"].is_string()) {
                ids.push_back(entry["sandboxID"].get<std::string>());
            }
        }
    } catch (const json::exception& e) {
        throw E2bError(std::string("list sandboxes: malformed reply: ") + e.what(), response.status);
    }
    return ids;
}

long E2bClient::ProbeControlPlane(std::chrono::milliseconds timeout) {
    HttpRequest request = ControlRequest("GET", "/sandboxes");
    request.timeout = timeout;
    request.connect_timeout = timeout;

    HttpResponse response = transport_->Send(request);
    if (!response.transport_error.empty()) {
        spdlog::debug("E2B control plane unreachable: {}", response.transport_error);
        return 0;
    }
    return response.status;
}

// ============================================================================
// AGENT: FILESYSTEM
// ============================================================================

void E2bClient::MakeDir(const E2bSandbox& sandbox, const std::string& path) {
    HttpRequest request = AgentRequest(sandbox, "POST", "/filesystem.Filesystem/MakeDir");
    request.headers.emplace_back("Content-Type", "application/json");
    request.headers.emplace_back("Connect-Protocol-Version", "1");
    request.body = json{{"path", path}}.dump();

    HttpResponse response = transport_->Send(request);
    if (response.Ok()) {
        return;
    }
    // Connect maps already_exists to 409
    if (response.transport_error.empty() && response.status == 409) {
        return;
    }
    throw E2bError(DescribeFailure("make dir " + path, response), response.status);
}

void E2bClient::WriteFile(const E2bSandbox& sandbox, const std::string& path, const std::string& content,
                          const utils::AbortCheck& should_abort) {
    HttpRequest request = AgentRequest(
        sandbox, "POST",
        "/files?path=" + StringUtils::UrlEncode(path) + "&username=" + StringUtils::UrlEncode(options_.user));

    utils::MultipartFile file;
    auto slash = path.find_last_of('/');
    file.file_name = slash == std::string::npos ? path : path.substr(slash + 1);
    file.content = content;
    request.multipart = std::move(file);
    request.timeout = options_.transfer_timeout;

    utils::BoundedOutputBuffer reply(kDiagnosticBytes);
    HttpResponse response = transport_->Stream(
        request,
        [&reply](const char* data, std::size_t length) {
            reply.Append(data, length);
            return true;
        },
        should_abort);

    if (!response.Ok()) {
        response.body = reply.Release();
        throw E2bError(DescribeFailure("upload " + path, response), response.status);
    }
}

bool E2bClient::DownloadFile(const E2bSandbox& sandbox, const std::string& path,
                             const utils::ChunkHandler& on_chunk,
                             const utils::AbortCheck& should_abort) {
    HttpRequest request = AgentRequest(
        sandbox, "GET",
        "/files?path=" + StringUtils::UrlEncode(path) + "&username=" + StringUtils::UrlEncode(options_.user));
    request.timeout = options_.transfer_timeout;

    // First bytes are kept for the error message of a failed call.
    utils::BoundedOutputBuffer head(kDiagnosticBytes);
    HttpResponse response = transport_->Stream(
        request,
        [&head, &on_chunk](const char* data, std::size_t length) {
            head.Append(data, length);
            return on_chunk(data, length);
        },
        should_abort);

    if (response.transport_error.empty() && !response.aborted && response.status == 404) {
        return false;
    }
    if (!response.Ok()) {
        response.body = head.Release();
        throw E2bError(DescribeFailure("download " + path, response), response.status);
    }
    return true;
}

// ============================================================================
// AGENT: PROCESSES
// ============================================================================

void E2bClient::HandleProcessEvent(const std::string& payload, ProcessOutcome& outcome,
                                   const ProcessOutputSink& on_output) {
    json j = json::parse(payload);
    const json& event = j.contains("event") ? j["event"] : j;
    if (!event.is_object()) {
        return;
    }

    if (event.contains("start")) {
        outcome.started = true;
        outcome.pid = event["start"].value("pid", 0u);
    } else if (event.contains("data")) {
        const json& data = event["data"];
        if (data.contains("stdout") && data["stdout"].is_string()) {
            on_output(false, StringUtils::FromBase64(data["stdout"].get<std::string>()));
        }
        if (data.contains("stderr") && data["stderr"].is_string()) {
            on_output(true, StringUtils::FromBase64(data["stderr"].get<std::string>()));
        }
    } else if (event.contains("end")) {
        const json& end = event["end"];
        outcome.ended = true;
        // Zero values are omitted from the JSON encoding.
        outcome.exit_code = end.value("exitCode", 0);
        outcome.exited = end.value("exited", false);
        outcome.status = end.value("status", "");
        outcome.error = end.value("error", "");
    }
}

ProcessOutcome E2bClient::RunProcess(const E2bSandbox& sandbox,
                                     const ProcessRequest& process,
                                     const ProcessOutputSink& on_output,
                                     const utils::AbortCheck& should_abort) {
    ProcessOutcome outcome;

    json body = {
        {"process", {
            {"cmd", process.cmd},
            {"args", process.args},
            {"envs", process.envs},
            {"cwd", process.cwd}
        }}
    };

    HttpRequest request = AgentRequest(sandbox, "POST", "/process.Process/Start");
    request.headers.emplace_back("Content-Type", "application/connect+json");
    request.headers.emplace_back("Keepalive-Ping-Interval", "50");
    request.body = EncodeConnectEnvelope(body.dump());
    request.timeout = std::chrono::milliseconds(0);

    ConnectEnvelopeDecoder decoder;
    std::string protocol_error;
    std::string raw_prefix;  // kept for error replies, which are not framed

    auto on_chunk = [&](const char* data, std::size_t length) -> bool {
        if (raw_prefix.size() < 1024) {
            raw_prefix.append(data, std::min<std::size_t>(length, 1024 - raw_prefix.size()));
        }
        try {
            decoder.Feed(data, length);
            ConnectEnvelope envelope;
            while (decoder.Next(envelope)) {
                if (envelope.EndStream()) {
                    json trailer = json::parse(envelope.payload.empty() ? "{}" : envelope.payload);
                    if (trailer.contains("error") && trailer["error"].is_object()) {
                        const json& error = trailer["error"];
                        outcome.error = error.value("code", "unknown") + ": " + error.value("message", "");
                    }
                    continue;
                }
                HandleProcessEvent(envelope.payload, outcome, on_output);
            }
        } catch (const std::exception& e) {
            protocol_error = std::string("malformed process stream: ") + e.what();
            return false;
        }
        return true;
    };

    spdlog::debug("Starting process '{}' in sandbox {}", process.cmd, sandbox.sandbox_id);
    HttpResponse response = transport_->Stream(request, on_chunk, should_abort);
    outcome.http_status = response.status;

    if (response.status >= 300) {
        response.body = raw_prefix;
        outcome.transport_error = DescribeFailure("start process", response);
    } else if (!protocol_error.empty()) {
        outcome.transport_error = protocol_error;
    } else if (response.aborted) {
        outcome.aborted = true;
    } else if (!response.transport_error.empty()) {
        outcome.transport_error = "start process: " + response.transport_error;
    } else if (response.status == 0) {
        outcome.transport_error = "start process: no response";
    }

    return outcome;
}

} // namespace providers
} // namespace threatweaver
