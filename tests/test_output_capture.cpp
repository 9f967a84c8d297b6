#include "threatweaver/core/output_capture.hpp"
#include "fakes/temp_workspace.hpp"

#include <gtest/gtest.h>

using namespace threatweaver::core;
using threatweaver::fakes::TempWorkspace;

namespace fs = std::filesystem;

TEST(OutputCaptureTest, RelativeDeclaredPathStripsMountPoint) {
    EXPECT_EQ("out.txt", OutputCapture::RelativeDeclaredPath("/workspace/out.txt"));
    EXPECT_EQ("out.txt", OutputCapture::RelativeDeclaredPath("/out.txt"));
    EXPECT_EQ("out.txt", OutputCapture::RelativeDeclaredPath("out.txt"));
    EXPECT_EQ("results/scan.xml", OutputCapture::RelativeDeclaredPath("results/./scan.xml"));
    EXPECT_EQ("b", OutputCapture::RelativeDeclaredPath("a/../b"));
}

TEST(OutputCaptureTest, RelativeDeclaredPathRejectsEscapes) {
    EXPECT_EQ("", OutputCapture::RelativeDeclaredPath("../secret"));
    EXPECT_EQ("", OutputCapture::RelativeDeclaredPath("/workspace/../../etc/passwd"));
    EXPECT_EQ("", OutputCapture::RelativeDeclaredPath("/"));
    EXPECT_EQ("", OutputCapture::RelativeDeclaredPath("."));
}

TEST(OutputCaptureTest, CollectsCreatedFilesOnly) {
    TempWorkspace ws;
    auto snapshot = OutputCapture::Snapshot(ws.Path(), {"/workspace/out.txt", "missing.txt"});

    ws.Write("out.txt", "hello\n");

    SandboxExecutionResult result;
    OutputCapture::Collect(snapshot, 1024, result);

    ASSERT_EQ(1u, result.output_files.size());
    EXPECT_EQ("hello\n", result.output_files.at("/workspace/out.txt"));
    EXPECT_TRUE(result.truncated_output_files.empty());
}

TEST(OutputCaptureTest, UnchangedPreexistingFileIsNotReported) {
    TempWorkspace ws;
    ws.Write("input.txt", "targets\n");
    auto snapshot = OutputCapture::Snapshot(ws.Path(), {"input.txt"});

    SandboxExecutionResult result;
    OutputCapture::Collect(snapshot, 1024, result);

    EXPECT_TRUE(result.output_files.empty());
}

TEST(OutputCaptureTest, ModifiedPreexistingFileIsReported) {
    TempWorkspace ws;
    ws.Write("report.json", "{}");
    auto snapshot = OutputCapture::Snapshot(ws.Path(), {"report.json"});

    ws.Write("report.json", "{\"findings\": 3}");

    SandboxExecutionResult result;
    OutputCapture::Collect(snapshot, 1024, result);

    EXPECT_EQ("{\"findings\": 3}", result.output_files.at("report.json"));
}

TEST(OutputCaptureTest, OversizedFileIsTruncated) {
    TempWorkspace ws;
    auto snapshot = OutputCapture::Snapshot(ws.Path(), {"big.txt"});
    ws.Write("big.txt", std::string(100, 'a'));

    SandboxExecutionResult result;
    OutputCapture::Collect(snapshot, 10, result);

    EXPECT_EQ(std::string(10, 'a'), result.output_files.at("big.txt"));
    ASSERT_EQ(1u, result.truncated_output_files.size());
    EXPECT_EQ("big.txt", result.truncated_output_files[0]);
}

TEST(OutputCaptureTest, SymlinkOutputIsNotFollowed) {
    TempWorkspace ws;
    TempWorkspace outside;
    outside.Write("secret.txt", "host secret");

    auto snapshot = OutputCapture::Snapshot(ws.Path(), {"out.txt"});
    fs::create_symlink(outside.Path() / "secret.txt", ws.Path() / "out.txt");

    SandboxExecutionResult result;
    OutputCapture::Collect(snapshot, 1024, result);

    EXPECT_TRUE(result.output_files.empty());
}

TEST(OutputCaptureTest, SymlinkedDirectoryCannotLeakHostFiles) {
    TempWorkspace ws;
    TempWorkspace outside;
    outside.Write("secret.txt", "host secret");

    auto snapshot = OutputCapture::Snapshot(ws.Path(), {"dir/secret.txt"});
    fs::create_directory_symlink(outside.Path(), ws.Path() / "dir");

    SandboxExecutionResult result;
    OutputCapture::Collect(snapshot, 1024, result);

    EXPECT_TRUE(result.output_files.empty());
}

TEST(OutputCaptureTest, DirectoryOutputIsSkipped) {
    TempWorkspace ws;
    auto snapshot = OutputCapture::Snapshot(ws.Path(), {"results"});
    fs::create_directories(ws.Path() / "results");

    SandboxExecutionResult result;
    OutputCapture::Collect(snapshot, 1024, result);

    EXPECT_TRUE(result.output_files.empty());
}

TEST(OutputCaptureTest, EscapingDeclarationIsIgnored) {
    TempWorkspace ws;
    auto snapshot = OutputCapture::Snapshot(ws.Path(), {"../outside.txt"});

    SandboxExecutionResult result;
    OutputCapture::Collect(snapshot, 1024, result);

    EXPECT_TRUE(result.output_files.empty());
}

TEST(OutputCaptureTest, SmallFilesDoNotReserveTheCeiling) {
    TempWorkspace ws;
    std::vector<std::string> declared;
    for (int i = 0; i < 8; ++i) {
        declared.push_back("out" + std::to_string(i) + ".txt");
    }
    auto snapshot = OutputCapture::Snapshot(ws.Path(), declared);
    for (const auto& name : declared) {
        ws.Write(name, "ok");
    }

    SandboxExecutionResult result;
    OutputCapture::Collect(snapshot, 50 * 1024 * 1024, result);

    ASSERT_EQ(8u, result.output_files.size());
    std::size_t capacity = 0;
    for (const auto& entry : result.output_files) {
        EXPECT_EQ("ok", entry.second);
        capacity += entry.second.capacity();
    }
    EXPECT_LT(capacity, 1024u * 1024u);
}

TEST(OutputCaptureTest, FileExactlyAtCeilingIsNotTruncated) {
    TempWorkspace ws;
    auto snapshot = OutputCapture::Snapshot(ws.Path(), {"exact.txt"});
    ws.Write("exact.txt", std::string(10, 'b'));

    SandboxExecutionResult result;
    OutputCapture::Collect(snapshot, 10, result);

    EXPECT_EQ(std::string(10, 'b'), result.output_files.at("exact.txt"));
    EXPECT_TRUE(result.truncated_output_files.empty());
}
