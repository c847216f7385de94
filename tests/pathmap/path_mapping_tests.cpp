/**
 * @file path_mapping_tests.cpp
 * @brief Unit tests for PathMapper and the path mapping document.
 */
#include <gtest/gtest.h>
#include "jobtmpl/pathmap/path_mapping.hpp"

using namespace jobtmpl;

namespace
{

PathMappingRule posix_rule(std::string source, std::string destination)
{
    return PathMappingRule{PathFormat::Posix, std::move(source), std::move(destination)};
}

} // namespace

// ============================================================================
// split_path
// ============================================================================

TEST(SplitPathTests, Posix_RootIsComponent)
{
    EXPECT_EQ(split_path("/mnt//shared/", PathFormat::Posix),
              (std::vector<std::string>{"/", "mnt", "shared"}));
    EXPECT_EQ(split_path("rel/a", PathFormat::Posix), (std::vector<std::string>{"rel", "a"}));
}

TEST(SplitPathTests, Windows_DriveAndMixedSeparators)
{
    EXPECT_EQ(split_path("C:\\Users/me\\file.txt", PathFormat::Windows),
              (std::vector<std::string>{"C:\\", "Users", "me", "file.txt"}));
}

TEST(SplitPathTests, Windows_UncAnchor)
{
    EXPECT_EQ(split_path("\\\\server\\share\\dir", PathFormat::Windows),
              (std::vector<std::string>{"\\\\server\\share\\", "dir"}));
}

// ============================================================================
// Translation
// ============================================================================

TEST(PathMapperTests, Translate_PrefixReplaced)
{
    PathMapper mapper({posix_rule("/mnt/shared/demo", "/local/demo")}, PathFormat::Posix);
    EXPECT_EQ(mapper.translate("/mnt/shared/demo/3d/scene.blend"), "/local/demo/3d/scene.blend");
}

TEST(PathMapperTests, Translate_ExactPrefix)
{
    PathMapper mapper({posix_rule("/mnt/shared/demo", "/local/demo")}, PathFormat::Posix);
    EXPECT_EQ(mapper.translate("/mnt/shared/demo"), "/local/demo");
}

TEST(PathMapperTests, Translate_NoMatch_Unchanged)
{
    PathMapper mapper({posix_rule("/mnt/shared/demo", "/local/demo")}, PathFormat::Posix);
    EXPECT_EQ(mapper.translate("/home/user/scene.blend"), "/home/user/scene.blend");
}

TEST(PathMapperTests, Translate_MatchesWholeComponentsOnly)
{
    PathMapper mapper({posix_rule("/mnt/shared", "/local")}, PathFormat::Posix);
    EXPECT_EQ(mapper.translate("/mnt/sharedfoo/x"), "/mnt/sharedfoo/x");
}

TEST(PathMapperTests, Translate_PosixIsCaseSensitive)
{
    PathMapper mapper({posix_rule("/mnt/shared", "/local")}, PathFormat::Posix);
    EXPECT_EQ(mapper.translate("/MNT/shared/x"), "/MNT/shared/x");
}

TEST(PathMapperTests, Translate_LongestPrefixWins)
{
    PathMapper mapper({posix_rule("/mnt", "/a"), posix_rule("/mnt/shared", "/b")}, PathFormat::Posix);
    EXPECT_EQ(mapper.translate("/mnt/shared/x"), "/b/x");
    EXPECT_EQ(mapper.translate("/mnt/other/x"), "/a/other/x");
    EXPECT_EQ(mapper.match_rule("/mnt/shared/x"), std::optional<size_t>{1});
}

TEST(PathMapperTests, Translate_EqualPrefix_FirstRuleWins)
{
    PathMapper mapper({posix_rule("/mnt/shared", "/first"), posix_rule("/mnt/shared", "/second")},
                      PathFormat::Posix);
    EXPECT_EQ(mapper.translate("/mnt/shared/x"), "/first/x");
}

TEST(PathMapperTests, Translate_WindowsSourceIsCaseInsensitive)
{
    PathMapper mapper({PathMappingRule{PathFormat::Windows, "C:\\Users\\Me", "/home/me"}}, PathFormat::Posix);
    EXPECT_EQ(mapper.translate("c:\\users\\ME\\scene.blend"), "/home/me/scene.blend");
}

TEST(PathMapperTests, Translate_WindowsDestinationSeparator)
{
    PathMapper mapper({posix_rule("/mnt/shared", "Z:\\shared")}, PathFormat::Windows);
    EXPECT_EQ(mapper.translate("/mnt/shared/a/b.txt"), "Z:\\shared\\a\\b.txt");
}

TEST(PathMapperTests, Translate_SourceFormatFilter)
{
    PathMapper mapper({PathMappingRule{PathFormat::Windows, "C:\\data", "/data"}}, PathFormat::Posix);
    EXPECT_EQ(mapper.translate("C:\\data\\x", PathFormat::Posix), "C:\\data\\x");
    EXPECT_EQ(mapper.translate("C:\\data\\x", PathFormat::Windows), "/data/x");
}

TEST(PathMapperTests, EmptySourcePath_Throws)
{
    EXPECT_THROW(PathMapper({posix_rule("", "/x")}), PathMappingError);
}

// ============================================================================
// Configuration document
// ============================================================================

TEST(PathMappingDocumentTests, Parse_ValidDocument)
{
    auto rules = parse_path_mapping_rules(R"({
        "version": "pathmapping-1.0",
        "path_mapping_rules": [
            {"source_path_format": "POSIX", "source_path": "/mnt/shared", "destination_path": "/local"},
            {"source_path_format": "WINDOWS", "source_path": "C:\\data", "destination_path": "/data"}
        ]
    })");
    ASSERT_EQ(rules.size(), 2u);
    EXPECT_EQ(rules[0].source_path, "/mnt/shared");
    EXPECT_EQ(rules[1].source_path_format, PathFormat::Windows);
    EXPECT_EQ(rules[1].source_path, "C:\\data");
}

TEST(PathMappingDocumentTests, Parse_WrongVersion_Throws)
{
    EXPECT_THROW(parse_path_mapping_rules(R"({"version": "2.0", "path_mapping_rules": []})"),
                 PathMappingError);
}

TEST(PathMappingDocumentTests, Parse_UnknownFormat_Throws)
{
    EXPECT_THROW(parse_path_mapping_rules(R"({"version": "pathmapping-1.0", "path_mapping_rules": [
        {"source_path_format": "MACOS", "source_path": "/a", "destination_path": "/b"}]})"),
                 PathMappingError);
}

TEST(PathMappingDocumentTests, Parse_EmptySource_Throws)
{
    EXPECT_THROW(parse_path_mapping_rules(R"({"version": "pathmapping-1.0", "path_mapping_rules": [
        {"source_path_format": "POSIX", "source_path": "", "destination_path": "/b"}]})"),
                 PathMappingError);
}

TEST(PathMappingDocumentTests, Emit_CanBeParsedBack)
{
    std::vector<PathMappingRule> rules{posix_rule("/mnt/shared", "/local"),
                                       PathMappingRule{PathFormat::Windows, "C:\\data", "/data"}};
    auto parsed = parse_path_mapping_rules(emit_path_mapping_rules(rules));
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[1].source_path, "C:\\data");
    EXPECT_EQ(parsed[1].source_path_format, PathFormat::Windows);
}
