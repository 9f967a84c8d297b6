/**
 * @file fake_e2b_service.cpp
 * @brief In-memory E2B service
 *
 * @date 2025
 */

#include "fakes/fake_e2b_service.hpp"
#include "threatweaver/providers/e2b_client.hpp"
#include "threatweaver/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>

using json = nlohmann::json;

namespace threatweaver {
namespace fakes {

using utils::HttpRequest;
using utils::HttpResponse;
using utils::StringUtils;

namespace {

const std::string kAgentPrefix = "https://49983-";

HttpResponse Reply(long status, const std::string& body = "") {
    HttpResponse response;
    response.status = status;
    response.body = body;
    return response;
}

HttpResponse ErrorReply(long status, const std::string& message) {
    return Reply(status, json{{"code", status}, {"message", message}}.dump());
}

std::string Event(const json& event) {
    return providers::EncodeConnectEnvelope(json{{"event", event}}.dump());
}

/// Deliver a body in small pieces; false if the handler stopped the transfer.
bool Deliver(const std::string& body, const utils::ChunkHandler& on_chunk, std::size_t piece) {
    for (std::size_t offset = 0; offset < body.size(); offset += piece) {
        std::size_t length = std::min(piece, body.size() - offset);
        if (!on_chunk(body.data() + offset, length)) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

FakeE2bService::FakeE2bService() : process_handler_(&FakeE2bService::DefaultProcess) {}

// ============================================================================
// TEST CONTROLS
// ============================================================================

void FakeE2bService::SetProcessHandler(ProcessHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    process_handler_ = std::move(handler);
}

void FakeE2bService::SetFailure(const std::string& operation, long status) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_[operation] = status;
}

void FakeE2bService::ClearFailures() {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.clear();
}

void FakeE2bService::SetStall(const std::string& operation) {
    std::lock_guard<std::mutex> lock(mutex_);
    stalls_.insert(operation);
}

std::size_t FakeE2bService::StalledCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stalled_;
}

std::string FakeE2bService::AddSandbox(const std::map<std::string, std::string>& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    return CreateLocked(json{{"templateID", "base"}, {"timeout", 300}, {"metadata", metadata}});
}

std::vector<FakeSandbox> FakeE2bService::Sandboxes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<FakeSandbox> all;
    for (const auto& entry : sandboxes_) {
        all.push_back(entry.second);
    }
    return all;
}

std::vector<std::string> FakeE2bService::AliveSandboxIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& entry : sandboxes_) {
        if (entry.second.alive) {
            ids.push_back(entry.first);
        }
    }
    return ids;
}

FakeSandbox FakeE2bService::GetSandbox(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sandboxes_.find(id);
    return it == sandboxes_.end() ? FakeSandbox{} : it->second;
}

std::size_t FakeE2bService::CreatedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sandboxes_.size();
}

std::vector<HttpRequest> FakeE2bService::Requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

json FakeE2bService::LastCreateBody() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_create_;
}

std::vector<ProcessCall> FakeE2bService::ProcessCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_calls_;
}

// ============================================================================
// TRANSPORT
// ============================================================================

HttpResponse FakeE2bService::Send(const HttpRequest& request) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
    }

    const std::string api = kApiUrl;
    if (StringUtils::StartsWith(request.url, api)) {
        return HandleControl(request, request.url.substr(api.size()));
    }

    if (StringUtils::StartsWith(request.url, kAgentPrefix)) {
        std::string rest = request.url.substr(kAgentPrefix.size());
        auto slash = rest.find('/');
        std::string host = rest.substr(0, slash);
        std::string path = slash == std::string::npos ? "/" : rest.substr(slash);
        std::string suffix = std::string(".") + kDomain;
        if (StringUtils::EndsWith(host, suffix)) {
            return HandleAgent(request, host.substr(0, host.size() - suffix.size()), path);
        }
    }

    HttpResponse response;
    response.transport_error = "Could not resolve host";
    return response;
}

HttpResponse FakeE2bService::Stream(const HttpRequest& request,
                                    const utils::ChunkHandler& on_chunk,
                                    const utils::AbortCheck& should_abort) {
    if (StringUtils::StartsWith(request.url, kAgentPrefix) &&
        StringUtils::Contains(request.url, "/process.Process/Start")) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }
        std::string rest = request.url.substr(kAgentPrefix.size());
        std::string host = rest.substr(0, rest.find('/'));
        std::string sandbox_id = host.substr(0, host.size() - std::string(kDomain).size() - 1);
        return StreamProcess(request, sandbox_id, on_chunk, should_abort);
    }

    if (StringUtils::StartsWith(request.url, kAgentPrefix) && StringUtils::Contains(request.url, "/files?")) {
        std::string operation = request.method == "POST" ? "upload" : "read";
        bool stall = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stall = stalls_.count(operation) != 0;
            if (stall) {
                requests_.push_back(request);
                ++stalled_;
            }
        }
        if (stall) {
            HttpResponse response;
            auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(60);
            while (std::chrono::steady_clock::now() < give_up) {
                if (should_abort && should_abort()) {
                    response.aborted = true;
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            if (!response.aborted) {
                response.transport_error = "Operation timed out";
            }
            std::lock_guard<std::mutex> lock(mutex_);
            --stalled_;
            return response;
        }
    }

    if (should_abort && should_abort()) {
        HttpResponse response;
        response.aborted = true;
        return response;
    }

    HttpResponse response = Send(request);
    if (response.transport_error.empty()) {
        std::string body = std::move(response.body);
        response.body.clear();
        if (!Deliver(body, on_chunk, 4096)) {
            response.aborted = true;
        }
    }
    return response;
}

bool FakeE2bService::Failing(const std::string& operation, HttpResponse& response) const {
    auto it = failures_.find(operation);
    if (it == failures_.end()) {
        return false;
    }
    if (it->second == 0) {
        response = HttpResponse{};
        response.transport_error = "Connection refused";
    } else {
        response = ErrorReply(it->second, "injected failure");
    }
    return true;
}

// ============================================================================
// CONTROL PLANE
// ============================================================================

std::string FakeE2bService::CreateLocked(const json& body) {
    FakeSandbox sandbox;
    sandbox.id = "sbx" + std::to_string(next_id_++);
    sandbox.template_id = body.value("templateID", "");
    sandbox.timeout = body.value("timeout", 0L);
    if (body.contains("metadata")) {
        sandbox.metadata = body["metadata"].get<std::map<std::string, std::string>>();
    }
    if (body.contains("envVars")) {
        sandbox.env_vars = body["envVars"].get<std::map<std::string, std::string>>();
    }
    sandbox.allow_internet_access = body.value("allow_internet_access", true);
    sandboxes_[sandbox.id] = sandbox;
    return sandbox.id;
}

HttpResponse FakeE2bService::HandleControl(const HttpRequest& request, const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    HttpResponse failure;

    if (Header(request, "X-API-Key") != kApiKey) {
        return ErrorReply(401, "Invalid API key");
    }

    if (request.method == "POST" && path == "/sandboxes") {
        if (Failing("create", failure)) {
            return failure;
        }
        json body = json::parse(request.body);
        last_create_ = body;
        std::string id = CreateLocked(body);
        return Reply(201, json{{"sandboxID", id},
                               {"templateID", sandboxes_[id].template_id},
                               {"clientID", "fake"},
                               {"envdAccessToken", "tok-" + id}}.dump());
    }

    if (request.method == "GET" && (path == "/sandboxes" || StringUtils::StartsWith(path, "/sandboxes?"))) {
        if (Failing("list", failure)) {
            return failure;
        }
        std::map<std::string, std::string> filter;
        std::string metadata = UrlDecode(QueryParam(path, "metadata"));
        if (!metadata.empty()) {
            for (const auto& pair : StringUtils::Split(metadata, '&')) {
                auto eq = pair.find('=');
                if (eq != std::string::npos) {
                    filter[UrlDecode(pair.substr(0, eq))] = UrlDecode(pair.substr(eq + 1));
                }
            }
        }

        json list = json::array();
        for (const auto& [id, sandbox] : sandboxes_) {
            if (!sandbox.alive) {
                continue;
            }
            bool match = std::all_of(filter.begin(), filter.end(), [&sandbox](const auto& kv) {
                auto it = sandbox.metadata.find(kv.first);
                return it != sandbox.metadata.end() && it->second == kv.second;
            });
            if (match) {
                list.push_back({{"sandboxID", id}, {"templateID", sandbox.template_id},
                                {"metadata", sandbox.metadata}});
            }
        }
        return Reply(200, list.dump());
    }

    const std::string prefix = "/sandboxes/";
    if (request.method == "DELETE" && StringUtils::StartsWith(path, prefix)) {
        if (Failing("kill", failure)) {
            return failure;
        }
        auto it = sandboxes_.find(UrlDecode(path.substr(prefix.size())));
        if (it == sandboxes_.end() || !it->second.alive) {
            return ErrorReply(404, "sandbox not found");
        }
        it->second.alive = false;
        return Reply(204);
    }

    return ErrorReply(404, "no route");
}

// ============================================================================
// AGENT
// ============================================================================

HttpResponse FakeE2bService::HandleAgent(const HttpRequest& request, const std::string& sandbox_id,
                                         const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    HttpResponse failure;

    auto it = sandboxes_.find(sandbox_id);
    if (it == sandboxes_.end() || !it->second.alive) {
        return ErrorReply(502, "sandbox not found");
    }
    if (Header(request, "X-Access-Token") != "tok-" + sandbox_id) {
        return ErrorReply(401, "invalid access token");
    }
    FakeSandbox& sandbox = it->second;

    if (request.method == "POST" && path == "/filesystem.Filesystem/MakeDir") {
        if (Failing("makedir", failure)) {
            return failure;
        }
        std::string dir = json::parse(request.body).value("path", "");
        if (!sandbox.dirs.insert(dir).second) {
            return Reply(409, json{{"code", "already_exists"}, {"message", "directory exists"}}.dump());
        }
        return Reply(200, "{}");
    }

    if (StringUtils::StartsWith(path, "/files?")) {
        std::string file = UrlDecode(QueryParam(path, "path"));

        if (request.method == "POST") {
            if (Failing("upload", failure)) {
                return failure;
            }
            if (!request.multipart) {
                return ErrorReply(400, "expected multipart body");
            }
            sandbox.files[file] = request.multipart->content;
            json entry = {{"name", file}, {"type", "file"}, {"path", file}};
            return Reply(200, json::array({entry}).dump());
        }

        if (request.method == "GET") {
            if (Failing("read", failure)) {
                return failure;
            }
            auto found = sandbox.files.find(file);
            if (found == sandbox.files.end()) {
                return ErrorReply(404, "file not found");
            }
            return Reply(200, found->second);
        }
    }

    return ErrorReply(404, "no route");
}

HttpResponse FakeE2bService::StreamProcess(const HttpRequest& request, const std::string& sandbox_id,
                                           const utils::ChunkHandler& on_chunk,
                                           const utils::AbortCheck& should_abort) {
    ProcessCall call;
    ProcessHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        HttpResponse failure;
        if (Failing("start", failure)) {
            if (failure.transport_error.empty()) {
                std::string body = std::move(failure.body);
                failure.body.clear();
                Deliver(body, on_chunk, 4096);
            }
            return failure;
        }

        auto it = sandboxes_.find(sandbox_id);
        if (it == sandboxes_.end() || !it->second.alive) {
            HttpResponse missing = Reply(502);
            Deliver(R"({"message":"sandbox not found"})", on_chunk, 4096);
            return missing;
        }

        json body = json::parse(request.body.substr(5));
        const json& process = body.at("process");
        call.sandbox_id = sandbox_id;
        call.cmd = process.value("cmd", "");
        call.args = process.value("args", std::vector<std::string>{});
        call.envs = process.value("envs", std::map<std::string, std::string>{});
        call.cwd = process.value("cwd", "");
        call.files = it->second.files;
        process_calls_.push_back(call);
        handler = process_handler_;
    }

    ProcessScript script = handler(call);
    HttpResponse response = Reply(200);

    std::string head = Event({{"start", {{"pid", 1000}}}});
    if (!script.stdout_data.empty()) {
        head += Event({{"data", {{"stdout", StringUtils::ToBase64(script.stdout_data)}}}});
    }
    if (!script.stderr_data.empty()) {
        head += Event({{"data", {{"stderr", StringUtils::ToBase64(script.stderr_data)}}}});
    }
    if (!Deliver(head, on_chunk, 7)) {
        response.aborted = true;
        return response;
    }

    if (script.hang) {
        auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(60);
        while (std::chrono::steady_clock::now() < give_up) {
            if (should_abort()) {
                response.aborted = true;
                return response;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        response.transport_error = "Operation timed out";
        return response;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sandboxes_.find(sandbox_id);
        if (it != sandboxes_.end() && it->second.alive) {
            for (const auto& [path, content] : script.writes) {
                std::string absolute = StringUtils::StartsWith(path, "/") ? path : call.cwd + "/" + path;
                it->second.files[absolute] = content;
            }
        }
    }

    json end = {{"exited", script.exited},
                {"status", script.status.empty()
                               ? "exit status " + std::to_string(script.exit_code)
                               : script.status}};
    if (script.exit_code != 0) {
        end["exitCode"] = script.exit_code;
    }
    std::string tail = Event({{"end", end}});

    json trailer = json::object();
    if (!script.trailer_error.empty()) {
        trailer["error"] = {{"code", script.trailer_error}, {"message", "process failed"}};
    }
    tail += providers::EncodeConnectEnvelope(trailer.dump(), providers::kConnectEndStreamFlag);

    if (!Deliver(tail, on_chunk, 7)) {
        response.aborted = true;
    }
    return response;
}

// ============================================================================
// HELPERS
// ============================================================================

ProcessScript FakeE2bService::DefaultProcess(const ProcessCall& call) {
    ProcessScript script;

    if (call.cmd == "echo") {
        script.stdout_data = StringUtils::Join(call.args, " ") + "\n";
    } else if (call.cmd == "sleep") {
        script.hang = true;
    } else if (call.cmd == "sh" && call.args.size() == 2 && call.args[0] == "-c" &&
               StringUtils::StartsWith(call.args[1], "echo ")) {
        const std::string& line = call.args[1];
        auto redirect = line.find(" > ");
        if (redirect == std::string::npos) {
            script.stdout_data = line.substr(5) + "\n";
        } else {
            script.writes[StringUtils::Trim(line.substr(redirect + 3))] =
                line.substr(5, redirect - 5) + "\n";
        }
    } else {
        script.exit_code = 127;
        script.stderr_data = "sh: " + call.cmd + ": command not found\n";
    }
    return script;
}

std::string FakeE2bService::Header(const HttpRequest& request, const std::string& name) {
    for (const auto& [key, value] : request.headers) {
        if (StringUtils::ToLower(key) == StringUtils::ToLower(name)) {
            return value;
        }
    }
    return "";
}

std::string FakeE2bService::UrlDecode(const std::string& text) {
    std::string out;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size() &&
            std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(text[i]);
        }
    }
    return out;
}

std::string FakeE2bService::QueryParam(const std::string& url, const std::string& name) {
    auto query = url.find('?');
    if (query == std::string::npos) {
        return "";
    }
    for (const auto& pair : StringUtils::Split(url.substr(query + 1), '&')) {
        if (StringUtils::StartsWith(pair, name + "=")) {
            return pair.substr(name.size() + 1);
        }
    }
    return "";
}

} // namespace fakes
} // namespace threatweaver
