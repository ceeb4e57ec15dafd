/**
 * @file test_cli.cpp
 * @brief Unit tests for CLI functionality (GoogleTest)
 *
 * Covers the library paths overlay-cli goes through:
 * - merge of the positional files
 * - --get: Path::parse + find_at on the merged tree
 * - --keep-resets: pending resets rendered for stderr
 * - --append-sequences: SequencePolicy::AppendUnique
 *
 * Note: These tests verify the underlying functions used by the CLI,
 * not the full CLI binary.
 */

#include <gtest/gtest.h>

#include "overlay/Errors.hpp"
#include "overlay/Overlay.hpp"
#include "overlay/Path.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace overlay;

// ============================================================================
// Test Utilities
// ============================================================================

/**
 * @brief RAII wrapper for temporary files
 */
class TempFile {
public:
    explicit TempFile(const std::string& filename, const std::string& content)
        : path_(fs::temp_directory_path() / (test_prefix() + filename)) {
        std::ofstream f(path_);
        f << content;
        f.close();
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    // Tests run as separate processes under ctest
    static std::string test_prefix() {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        return info ? std::string(info->name()) + "_" : std::string();
    }

    fs::path path_;
};

class CliTest : public ::testing::Test {
protected:
    TempFile base{"overlay_cli_base.yaml",
        "services:\n"
        "  web:\n"
        "    image: nginx:1\n"
        "    ports: ['80:80']\n"
        "networks:\n"
        "  test: {external: true}\n"
        "  front: {}\n"};

    TempFile local{"overlay_cli_local.yaml",
        "services:\n"
        "  web:\n"
        "    image: nginx:2\n"
        "    ports: ['443:443']\n"
        "networks:\n"
        "  test: !reset {}\n"};

    LoadOptions options() const {
        LoadOptions opts;
        opts.files = {base.path(), local.path()};
        return opts;
    }
};

// ============================================================================
// Merge output
// ============================================================================

TEST_F(CliTest, MergesFilesInCommandLineOrder) {
    MergeResult r = load_and_merge(options());
    EXPECT_EQ(r.tree["services"]["web"]["image"], "nginx:2");
    EXPECT_FALSE(r.tree["networks"].contains("test"));
}

TEST_F(CliTest, ReversedOrderReversesPrecedence) {
    LoadOptions opts;
    opts.files = {local.path(), base.path()};
    MergeResult r = load_and_merge(opts);
    EXPECT_EQ(r.tree["services"]["web"]["image"], "nginx:1");
    // The reset still wins over the later file
    EXPECT_FALSE(r.tree["networks"].contains("test"));
}

// ============================================================================
// --get
// ============================================================================

TEST_F(CliTest, GetNestedValue) {
    MergeResult r = load_and_merge(options());
    const Value* v = find_at(r.tree, Path::parse("services.web.ports[0]"));
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(*v, "443:443");
}

TEST_F(CliTest, GetMissingPath) {
    MergeResult r = load_and_merge(options());
    EXPECT_EQ(find_at(r.tree, Path::parse("networks.test")), nullptr);
}

TEST_F(CliTest, GetMalformedPath) {
    EXPECT_THROW(Path::parse("services..web"), PathSyntaxError);
}

// ============================================================================
// --keep-resets / --append-sequences
// ============================================================================

TEST_F(CliTest, KeepResetsReportsPaths) {
    LoadOptions opts = options();
    opts.merge.apply_resets = false;

    MergeResult r = load_and_merge(opts);
    EXPECT_TRUE(r.tree["networks"].contains("test"));

    auto lines = render_all(r.resets);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "networks.test");
}

TEST_F(CliTest, AppendSequences) {
    LoadOptions opts = options();
    opts.merge.sequences = SequencePolicy::AppendUnique;

    MergeResult r = load_and_merge(opts);
    EXPECT_EQ(r.tree["services"]["web"]["ports"], (Value{"80:80", "443:443"}));
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(CliTest, UnsupportedInput) {
    TempFile ini("overlay_cli_bad.ini", "[a]\n");
    LoadOptions opts = options();
    opts.files.push_back(ini.path());
    EXPECT_THROW(load_and_merge(opts), UnsupportedFormatError);
}
