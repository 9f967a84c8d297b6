#include "threatweaver/core/isolation_namespace.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace threatweaver::core;

TEST(IsolationNamespaceTest, SlugIsStableAndReadable) {
    IsolationNamespace a("Scan_42", "threatweaver");
    IsolationNamespace b("Scan_42", "threatweaver");

    EXPECT_EQ(a.Slug(), b.Slug());
    EXPECT_EQ(0u, a.Slug().rfind("scan-42-", 0));
    EXPECT_EQ(std::string("scan-42-").size() + IsolationNamespace::kDigestLength, a.Slug().size());
}

TEST(IsolationNamespaceTest, DistinctIdsNeverCollide) {
    // Same sanitised text, different raw ids.
    IsolationNamespace a("scan/a", "threatweaver");
    IsolationNamespace b("scan a", "threatweaver");
    IsolationNamespace c("SCAN-A", "threatweaver");

    EXPECT_NE(a.Slug(), b.Slug());
    EXPECT_NE(a.Slug(), c.Slug());
    EXPECT_NE(b.Slug(), c.Slug());
}

TEST(IsolationNamespaceTest, ResourceNamesCarryPrefixKindAndSlug) {
    IsolationNamespace ns("scan-a", "threatweaver");

    EXPECT_EQ("threatweaver-net-" + ns.Slug(), ns.NetworkName());
    EXPECT_EQ("threatweaver-run-" + ns.Slug(), ns.ResourceName("run"));
    EXPECT_EQ("threatweaver.namespace", ns.LabelKey());
    EXPECT_EQ("threatweaver.namespace=" + ns.Slug(), ns.LabelSelector());
    EXPECT_EQ("threatweaver_ns", ns.MetadataKey());
    EXPECT_EQ("scan-a", ns.ScanId());
}

TEST(IsolationNamespaceTest, HostileIdsAreSanitised) {
    IsolationNamespace ns("../../etc/passwd; rm -rf /", "threatweaver");

    for (char c : ns.Slug()) {
        EXPECT_TRUE((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-') << c;
    }
    EXPECT_NE('-', ns.Slug().front());
}

TEST(IsolationNamespaceTest, LongIdsAreBounded) {
    IsolationNamespace ns(std::string(500, 'x'), "threatweaver");
    EXPECT_LE(ns.Slug().size(), IsolationNamespace::kMaxPrefixLength + 1 + IsolationNamespace::kDigestLength);
}

TEST(IsolationNamespaceTest, SymbolOnlyIdFallsBack) {
    IsolationNamespace ns("!!!", "threatweaver");
    EXPECT_EQ(0u, ns.Slug().rfind("scan-", 0));
}

TEST(IsolationNamespaceTest, RejectsEmptyOrNulIds) {
    EXPECT_THROW(IsolationNamespace("", "threatweaver"), std::invalid_argument);
    EXPECT_THROW(IsolationNamespace(std::string("a\0b", 3), "threatweaver"), std::invalid_argument);
}

TEST(IsolationNamespaceTest, CustomPrefix) {
    IsolationNamespace ns("scan-a", "TW Test");
    EXPECT_EQ("tw-test", ns.ResourcePrefix());
    EXPECT_EQ("tw-test-net-" + ns.Slug(), ns.NetworkName());
}
