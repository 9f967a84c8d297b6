#include "threatweaver/providers/e2b_provider.hpp"
#include "fakes/fake_e2b_service.hpp"
#include "fakes/temp_workspace.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <filesystem>
#include <thread>

using namespace threatweaver;
using core::ExecutionState;
using core::ToolInvocationBuilder;
using fakes::FakeE2bService;
using fakes::ProcessCall;
using fakes::ProcessScript;
using fakes::TempWorkspace;
using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace {

class E2bProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.provider = "e2b";
        config_.e2b_api_key = FakeE2bService::kApiKey;
        config_.e2b_api_url = FakeE2bService::kApiUrl;
        config_.e2b_domain = FakeE2bService::kDomain;
        service_ = std::make_shared<FakeE2bService>();
        provider_ = std::make_unique<providers::E2bProvider>(config_, service_);
    }

    static core::ToolInvocationSpec Command(const std::string& cmd,
                                            const std::vector<std::string>& args,
                                            std::chrono::seconds timeout = std::chrono::seconds(30)) {
        return ToolInvocationBuilder(cmd).WithCommand(cmd).WithArgs(args).WithTimeout(timeout).Build();
    }

    core::SandboxConfig config_;
    std::shared_ptr<FakeE2bService> service_;
    std::unique_ptr<providers::E2bProvider> provider_;
    TempWorkspace workspace_;
};

} // anonymous namespace

TEST_F(E2bProviderTest, EchoSucceeds) {
    auto result = provider_->Execute(Command("echo", {"hello"}), workspace_.Path(), "scan-1");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(0, result.exit_code);
    EXPECT_EQ("hello\n", result.stdout_output);
    EXPECT_EQ(ExecutionState::SUCCEEDED, result.outcome);
    EXPECT_EQ("sbx1", result.sandbox_id);
    EXPECT_TRUE(result.teardown_errors.empty());

    EXPECT_TRUE(service_->AliveSandboxIds().empty());
    EXPECT_EQ(0u, provider_->ActiveSandboxCount("scan-1"));
}

TEST_F(E2bProviderTest, SandboxIsCreatedInScanNamespace) {
    auto spec = ToolInvocationBuilder("nuclei")
        .WithCommand("echo")
        .WithTimeout(std::chrono::seconds(120))
        .WithEnv("TARGET", "10.0.0.1")
        .WithBlockedEgress()
        .Build();

    provider_->Execute(spec, workspace_.Path(), "scan-a");

    core::IsolationNamespace ns("scan-a", config_.resource_prefix);
    auto body = service_->LastCreateBody();
    EXPECT_EQ("base", body["templateID"].get<std::string>());
    EXPECT_EQ(150, body["timeout"].get<int>());
    EXPECT_EQ(ns.Slug(), body["metadata"][ns.MetadataKey()].get<std::string>());
    EXPECT_EQ("nuclei", body["metadata"]["threatweaver_tool"].get<std::string>());
    EXPECT_FALSE(body["allow_internet_access"].get<bool>());

    auto calls = service_->ProcessCalls();
    ASSERT_EQ(1u, calls.size());
    EXPECT_EQ("/workspace", calls[0].cwd);
    EXPECT_EQ("10.0.0.1", calls[0].envs.at("TARGET"));
}

TEST_F(E2bProviderTest, RegistryImagesFallBackToTemplate) {
    config_.e2b_template_id = "security-tools";
    providers::E2bProvider provider(config_, service_);

    auto bare = ToolInvocationBuilder("t").WithCommand("t").WithImage("nmap-tools").Build();
    auto registry = ToolInvocationBuilder("t").WithCommand("t").WithImage("projectdiscovery/nuclei:latest").Build();
    auto none = ToolInvocationBuilder("t").WithCommand("t").Build();

    EXPECT_EQ("nmap-tools", provider.SelectTemplate(bare).template_id);
    EXPECT_EQ("security-tools", provider.SelectTemplate(registry).template_id);
    EXPECT_EQ("security-tools", provider.SelectTemplate(none).template_id);
}

TEST_F(E2bProviderTest, SmallestFittingTemplateIsChosen) {
    config_.e2b_template_id = "security-tools";
    config_.e2b_template_sizes = {
        {"security-tools-medium", 2.0, 4096},
        {"security-tools-small", 1.0, 1024},
    };
    providers::E2bProvider provider(config_, service_);

    auto small = ToolInvocationBuilder("subfinder").WithCommand("subfinder")
        .WithCpuLimit(1.0).WithMemoryLimit(1024).Build();
    auto medium = ToolInvocationBuilder("httpx").WithCommand("httpx")
        .WithCpuLimit(1.0).WithMemoryLimit(2048).Build();
    auto large = ToolInvocationBuilder("nuclei").WithCommand("nuclei")
        .WithCpuLimit(4.0).WithMemoryLimit(2048).Build();

    auto chosen = provider.SelectTemplate(small);
    EXPECT_EQ("security-tools-small", chosen.template_id);
    EXPECT_EQ(1024u, chosen.memory_mb);
    EXPECT_EQ("security-tools-medium", provider.SelectTemplate(medium).template_id);
    EXPECT_EQ("security-tools", provider.SelectTemplate(large).template_id);

    provider.Execute(ToolInvocationBuilder("subfinder").WithCommand("echo")
                         .WithCpuLimit(1.0).WithMemoryLimit(1024).Build(),
                     workspace_.Path(), "scan-1");
    EXPECT_EQ("security-tools-small", service_->LastCreateBody()["templateID"].get<std::string>());
}

TEST_F(E2bProviderTest, NamedTemplateUsesItsConfiguredSize) {
    config_.e2b_template_sizes = {{"nmap-tools", 1.0, 1024}};
    providers::E2bProvider provider(config_, service_);

    auto fits = ToolInvocationBuilder("nmap").WithCommand("nmap").WithImage("nmap-tools")
        .WithCpuLimit(1.0).WithMemoryLimit(512).Build();
    auto too_big = ToolInvocationBuilder("nmap").WithCommand("nmap").WithImage("nmap-tools")
        .WithCpuLimit(1.0).WithMemoryLimit(2048).Build();

    EXPECT_EQ(1024u, provider.SelectTemplate(fits).memory_mb);
    EXPECT_THROW(provider.SelectTemplate(too_big), providers::E2bError);
}

TEST_F(E2bProviderTest, TimeoutKillsSandbox) {
    auto result = provider_->Execute(Command("sleep", {"9999"}, std::chrono::seconds(1)),
                                     workspace_.Path(), "scan-1");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(ExecutionState::TIMED_OUT, result.outcome);
    EXPECT_EQ(core::kNoExitCode, result.exit_code);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(core::ErrorKind::kTimeout, result.error->kind);
    EXPECT_EQ("tool 'sleep' exceeded timeout of 1s and was killed", result.error->message);
    EXPECT_GE(result.duration, std::chrono::milliseconds(900));
    EXPECT_LT(result.duration, std::chrono::milliseconds(5000));

    EXPECT_TRUE(service_->AliveSandboxIds().empty());
}

TEST_F(E2bProviderTest, CancellationKillsSandbox) {
    utils::CancellationToken token;
    auto future = provider_->ExecuteAsync(Command("sleep", {"9999"}), workspace_.Path(), "scan-1", token);
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    token.Cancel();
    auto result = future.get();

    EXPECT_EQ(ExecutionState::FAILED, result.outcome);
    EXPECT_THAT(result.error->message, HasSubstr("cancelled"));
    EXPECT_TRUE(service_->AliveSandboxIds().empty());
}

TEST_F(E2bProviderTest, NonZeroExitQuotesStderr) {
    auto result = provider_->Execute(Command("nmap", {"-sV"}), workspace_.Path(), "scan-1");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(127, result.exit_code);
    EXPECT_EQ(core::ErrorKind::kExecution, result.error->kind);
    EXPECT_THAT(result.error->message, HasSubstr("exited with code 127"));
    EXPECT_THAT(result.error->message, HasSubstr("command not found"));
}

TEST_F(E2bProviderTest, KilledBySignalIsResourceFault) {
    service_->SetProcessHandler([](const ProcessCall&) {
        ProcessScript script;
        script.exited = false;
        script.exit_code = -1;
        script.status = "signal: killed";
        return script;
    });

    auto result = provider_->Execute(Command("nuclei", {}), workspace_.Path(), "scan-1");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(core::ErrorKind::kResource, result.error->kind);
    EXPECT_THAT(result.error->message, HasSubstr("memory limit of 8192 MB"));
}

TEST_F(E2bProviderTest, ResourceFaultQuotesTheTemplateCeiling) {
    config_.e2b_template_sizes = {{"security-tools-medium", 2.0, 4096}};
    providers::E2bProvider provider(config_, service_);
    service_->SetProcessHandler([](const ProcessCall&) {
        ProcessScript script;
        script.exited = false;
        script.exit_code = -1;
        script.status = "signal: killed";
        return script;
    });
    auto spec = ToolInvocationBuilder("httpx").WithCommand("httpx")
        .WithCpuLimit(1.0).WithMemoryLimit(2048).Build();

    auto result = provider.Execute(spec, workspace_.Path(), "scan-1");

    EXPECT_EQ(core::ErrorKind::kResource, result.error->kind);
    EXPECT_THAT(result.error->message, HasSubstr("memory limit of 4096 MB"));
    EXPECT_EQ("security-tools-medium", service_->LastCreateBody()["templateID"].get<std::string>());
}

TEST_F(E2bProviderTest, AgentErrorIsBackendFault) {
    service_->SetProcessHandler([](const ProcessCall&) {
        ProcessScript script;
        script.trailer_error = "internal";
        return script;
    });

    auto result = provider_->Execute(Command("echo", {"x"}), workspace_.Path(), "scan-1");

    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.error->message, StartsWith("backend error: "));
}

TEST_F(E2bProviderTest, StreamFailureIsBackendFault) {
    service_->SetFailure("start", 0);

    auto result = provider_->Execute(Command("echo", {"x"}), workspace_.Path(), "scan-1");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(core::kNoExitCode, result.exit_code);
    EXPECT_THAT(result.error->message, HasSubstr("Connection refused"));
    EXPECT_TRUE(service_->AliveSandboxIds().empty());
}

TEST_F(E2bProviderTest, CapacityExceededIsSetupFailure) {
    auto spec = ToolInvocationBuilder("big").WithCommand("big").WithMemoryLimit(16384).Build();

    auto result = provider_->Execute(spec, workspace_.Path(), "scan-1");

    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.error->message, StartsWith("setup failure: "));
    EXPECT_THAT(result.error->message, HasSubstr("exceeds template capacity"));
    EXPECT_EQ(0u, service_->CreatedCount());
}

TEST_F(E2bProviderTest, CreateFailureIsSetupFailure) {
    service_->SetFailure("create", 500);

    auto result = provider_->Execute(Command("echo", {"x"}), workspace_.Path(), "scan-1");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(core::kNoExitCode, result.exit_code);
    EXPECT_THAT(result.error->message, StartsWith("setup failure: create sandbox: HTTP 500"));
    EXPECT_TRUE(service_->ProcessCalls().empty());
}

TEST_F(E2bProviderTest, UploadFailureTearsDownSandbox) {
    workspace_.Write("targets.txt", "10.0.0.1\n");
    service_->SetFailure("upload", 507);

    auto result = provider_->Execute(Command("echo", {"x"}), workspace_.Path(), "scan-1");

    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.error->message, StartsWith("setup failure: upload"));
    EXPECT_EQ(1u, service_->CreatedCount());
    EXPECT_TRUE(service_->AliveSandboxIds().empty());
    EXPECT_EQ(0u, provider_->ActiveSandboxCount("scan-1"));
}

TEST_F(E2bProviderTest, WorkspaceIsUploadedWithoutSymlinks) {
    workspace_.Write("targets.txt", "10.0.0.1\n");
    workspace_.Write("lists/hosts.txt", "a.example.com\n");
    TempWorkspace outside;
    outside.Write("secret.txt", "host secret");
    std::filesystem::create_symlink(outside.Path() / "secret.txt", workspace_.Path() / "link.txt");

    provider_->Execute(Command("echo", {"x"}), workspace_.Path(), "scan-1");

    auto calls = service_->ProcessCalls();
    ASSERT_EQ(1u, calls.size());
    EXPECT_EQ("10.0.0.1\n", calls[0].files.at("/workspace/targets.txt"));
    EXPECT_EQ("a.example.com\n", calls[0].files.at("/workspace/lists/hosts.txt"));
    EXPECT_EQ(0u, calls[0].files.count("/workspace/link.txt"));

    auto sandbox = service_->GetSandbox("sbx1");
    EXPECT_EQ(1u, sandbox.dirs.count("/workspace/lists"));
}

TEST_F(E2bProviderTest, UploadLimitIsEnforced) {
    config_.max_upload_bytes = 8;
    providers::E2bProvider provider(config_, service_);
    workspace_.Write("big.txt", std::string(64, 'x'));

    auto result = provider.Execute(Command("echo", {"x"}), workspace_.Path(), "scan-1");

    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.error->message, HasSubstr("upload limit"));
}

TEST_F(E2bProviderTest, DeclaredOutputsAreDownloaded) {
    auto spec = ToolInvocationBuilder("writer")
        .WithCommand("sh")
        .WithArgs({"-c", "echo found > results/out.txt"})
        .DeclareOutput("/workspace/results/out.txt")
        .DeclareOutput("missing.txt")
        .Build();

    auto result = provider_->Execute(spec, workspace_.Path(), "scan-1");

    ASSERT_TRUE(result.success);
    ASSERT_EQ(1u, result.output_files.size());
    EXPECT_EQ("found\n", result.output_files.at("/workspace/results/out.txt"));
    EXPECT_EQ("found\n", workspace_.Read("results/out.txt"));

    auto sandbox = service_->GetSandbox("sbx1");
    EXPECT_EQ(1u, sandbox.dirs.count("/workspace/results"));
}

TEST_F(E2bProviderTest, OversizedOutputIsTruncated) {
    config_.max_output_file_bytes = 4;
    providers::E2bProvider provider(config_, service_);
    service_->SetProcessHandler([](const ProcessCall&) {
        ProcessScript script;
        script.writes["out.txt"] = "abcdefgh";
        return script;
    });
    auto spec = ToolInvocationBuilder("writer").WithCommand("writer").DeclareOutput("out.txt").Build();

    auto result = provider.Execute(spec, workspace_.Path(), "scan-1");

    ASSERT_TRUE(result.success);
    EXPECT_EQ("abcd", result.output_files.at("out.txt"));
    ASSERT_EQ(1u, result.truncated_output_files.size());
    EXPECT_EQ("out.txt", result.truncated_output_files[0]);

    // Only the reported copy is cut; the next invocation sees the whole file.
    EXPECT_EQ("abcdefgh", workspace_.Read("out.txt"));
}

TEST_F(E2bProviderTest, OutputLargerThanWorkspaceCeilingIsNotWritten) {
    config_.max_upload_bytes = 4;
    providers::E2bProvider provider(config_, service_);
    service_->SetProcessHandler([](const ProcessCall&) {
        ProcessScript script;
        script.writes["out.txt"] = "abcdefgh";
        return script;
    });
    auto spec = ToolInvocationBuilder("writer").WithCommand("writer").DeclareOutput("out.txt").Build();

    auto result = provider.Execute(spec, workspace_.Path(), "scan-1");

    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.output_files.empty());
    EXPECT_FALSE(std::filesystem::exists(workspace_.Path() / "out.txt"));
    EXPECT_FALSE(std::filesystem::exists(workspace_.Path() / ".out.txt.threatweaver-part"));
}

TEST_F(E2bProviderTest, CancellationDuringUploadTearsDown) {
    workspace_.Write("targets.txt", "10.0.0.1\n");
    service_->SetStall("upload");
    utils::CancellationToken token;

    auto future = provider_->ExecuteAsync(Command("echo", {"x"}), workspace_.Path(), "scan-1", token);
    while (service_->StalledCount() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    token.Cancel();
    auto result = future.get();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(ExecutionState::FAILED, result.outcome);
    EXPECT_EQ("setup failure: cancelled before start", result.error->message);
    EXPECT_TRUE(service_->ProcessCalls().empty());
    EXPECT_TRUE(service_->AliveSandboxIds().empty());
    EXPECT_EQ(0u, provider_->ActiveSandboxCount("scan-1"));
}

TEST_F(E2bProviderTest, CancellationDuringDownloadTearsDown) {
    service_->SetStall("read");
    service_->SetProcessHandler([](const ProcessCall&) {
        ProcessScript script;
        script.writes["out.txt"] = "result";
        return script;
    });
    auto spec = ToolInvocationBuilder("writer").WithCommand("writer").DeclareOutput("out.txt").Build();
    utils::CancellationToken token;

    auto future = provider_->ExecuteAsync(spec, workspace_.Path(), "scan-1", token);
    while (service_->StalledCount() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    token.Cancel();
    auto result = future.get();

    EXPECT_TRUE(result.output_files.empty());
    EXPECT_FALSE(std::filesystem::exists(workspace_.Path() / "out.txt"));
    EXPECT_FALSE(std::filesystem::exists(workspace_.Path() / ".out.txt.threatweaver-part"));
    EXPECT_TRUE(service_->AliveSandboxIds().empty());
    EXPECT_EQ(0u, provider_->ActiveSandboxCount("scan-1"));
}

TEST_F(E2bProviderTest, TransfersAreBounded) {
    config_.transfer_timeout = std::chrono::seconds(120);
    providers::E2bProvider provider(config_, service_);
    workspace_.Write("targets.txt", "10.0.0.1\n");
    auto spec = ToolInvocationBuilder("writer")
        .WithCommand("sh")
        .WithArgs({"-c", "echo found > out.txt"})
        .DeclareOutput("out.txt")
        .Build();

    provider.Execute(spec, workspace_.Path(), "scan-1");

    std::size_t transfers = 0;
    for (const auto& request : service_->Requests()) {
        if (request.url.find("/files?") != std::string::npos) {
            EXPECT_EQ(std::chrono::milliseconds(120000), request.timeout);
            ++transfers;
        }
    }
    EXPECT_EQ(2u, transfers);
}

TEST_F(E2bProviderTest, OutputsAreNotFetchedAfterTimeout) {
    auto spec = ToolInvocationBuilder("sleep")
        .WithCommand("sleep")
        .WithTimeout(std::chrono::seconds(1))
        .DeclareOutput("out.txt")
        .Build();

    auto result = provider_->Execute(spec, workspace_.Path(), "scan-1");

    EXPECT_EQ(ExecutionState::TIMED_OUT, result.outcome);
    EXPECT_TRUE(result.output_files.empty());
    for (const auto& request : service_->Requests()) {
        EXPECT_FALSE(request.method == "GET" && request.url.find("/files?") != std::string::npos);
    }
}

TEST_F(E2bProviderTest, ConcurrentScansAreIsolated) {
    TempWorkspace workspace_b;
    auto spec_a = Command("sh", {"-c", "echo scan-a > out.txt"});
    auto spec_b = Command("sh", {"-c", "echo scan-b > out.txt"});
    auto declare = [](const core::ToolInvocationSpec& spec) {
        return ToolInvocationBuilder(spec.Name())
            .WithCommand(spec.Command())
            .WithArgs(spec.Args())
            .DeclareOutput("out.txt")
            .Build();
    };

    auto a = provider_->ExecuteAsync(declare(spec_a), workspace_.Path(), "scan-a");
    auto b = provider_->ExecuteAsync(declare(spec_b), workspace_b.Path(), "scan-b");
    auto result_a = a.get();
    auto result_b = b.get();

    ASSERT_TRUE(result_a.success);
    ASSERT_TRUE(result_b.success);
    EXPECT_EQ("scan-a\n", result_a.output_files.at("out.txt"));
    EXPECT_EQ("scan-b\n", result_b.output_files.at("out.txt"));
    EXPECT_NE(result_a.sandbox_id, result_b.sandbox_id);

    core::IsolationNamespace ns_a("scan-a", config_.resource_prefix);
    core::IsolationNamespace ns_b("scan-b", config_.resource_prefix);
    auto sandbox_a = service_->GetSandbox(result_a.sandbox_id);
    auto sandbox_b = service_->GetSandbox(result_b.sandbox_id);
    EXPECT_EQ(ns_a.Slug(), sandbox_a.metadata.at(ns_a.MetadataKey()));
    EXPECT_EQ(ns_b.Slug(), sandbox_b.metadata.at(ns_b.MetadataKey()));
}

TEST_F(E2bProviderTest, TeardownFailureIsRetriedByCleanup) {
    service_->SetFailure("kill", 503);

    auto result = provider_->Execute(Command("echo", {"x"}), workspace_.Path(), "scan-1");

    EXPECT_TRUE(result.success);
    ASSERT_EQ(1u, result.teardown_errors.size());
    EXPECT_THAT(result.teardown_errors[0], HasSubstr("HTTP 503"));
    EXPECT_EQ(1u, provider_->ActiveSandboxCount("scan-1"));

    auto failed = provider_->Cleanup("scan-1");
    EXPECT_FALSE(failed.Clean());
    EXPECT_EQ(1u, provider_->ActiveSandboxCount("scan-1"));

    service_->ClearFailures();
    auto report = provider_->Cleanup("scan-1");
    EXPECT_TRUE(report.Clean());
    EXPECT_EQ(1u, report.released);
    EXPECT_EQ(0u, provider_->ActiveSandboxCount("scan-1"));
    EXPECT_TRUE(service_->AliveSandboxIds().empty());
}

TEST_F(E2bProviderTest, CleanupFindsStragglersByMetadata) {
    core::IsolationNamespace ns("scan-1", config_.resource_prefix);
    core::IsolationNamespace other("scan-2", config_.resource_prefix);
    service_->AddSandbox({{ns.MetadataKey(), ns.Slug()}});
    std::string survivor = service_->AddSandbox({{other.MetadataKey(), other.Slug()}});

    auto report = provider_->Cleanup("scan-1");

    EXPECT_TRUE(report.Clean());
    EXPECT_EQ(1u, report.released);
    EXPECT_THAT(service_->AliveSandboxIds(), ::testing::ElementsAre(survivor));
}

TEST_F(E2bProviderTest, CleanupIsIdempotent) {
    provider_->Execute(Command("echo", {"x"}), workspace_.Path(), "scan-1");

    auto first = provider_->Cleanup("scan-1");
    auto second = provider_->Cleanup("scan-1");

    EXPECT_TRUE(first.Clean());
    EXPECT_TRUE(second.Clean());
    EXPECT_EQ(0u, second.released);
}

TEST_F(E2bProviderTest, CleanupReportsListFailure) {
    service_->SetFailure("list", 0);

    auto report = provider_->Cleanup("scan-1");

    EXPECT_FALSE(report.Clean());
    EXPECT_THAT(report.failures[0], HasSubstr("Connection refused"));
}

TEST_F(E2bProviderTest, HealthCheck) {
    EXPECT_TRUE(provider_->HealthCheck());

    config_.e2b_api_key = "e2b_wrong";
    providers::E2bProvider wrong_key(config_, service_);
    EXPECT_FALSE(wrong_key.HealthCheck());

    service_->SetFailure("list", 0);
    EXPECT_FALSE(provider_->HealthCheck());
}
