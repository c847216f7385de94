/**
 * @file format_string_tests.cpp
 * @brief Unit tests for format string parsing, binding and resolution.
 */
#include <gtest/gtest.h>
#include "jobtmpl/format/resolver.hpp"
#include "jobtmpl/format/symbol_table.hpp"

using namespace jobtmpl;

// ============================================================================
// Parsing
// ============================================================================

TEST(FormatStringTests, Parse_LiteralOnly)
{
    auto format = FormatString::parse("echo hello");
    EXPECT_TRUE(format.is_literal());
    EXPECT_EQ(format.literals(), (std::vector<std::string>{"echo hello"}));
}

TEST(FormatStringTests, Parse_SplitsLiteralsAroundReferences)
{
    auto format = FormatString::parse("--frame={{ Task.Param.Frame }}-{{Param.End}}");
    ASSERT_EQ(format.references().size(), 2u);
    EXPECT_EQ(format.literals(), (std::vector<std::string>{"--frame=", "-", ""}));

    const auto& first = format.references()[0];
    EXPECT_EQ(first.placeholder, "{{ Task.Param.Frame }}");
    EXPECT_EQ(first.expression, "Task.Param.Frame");
    EXPECT_EQ(first.scope, SymbolScope::TaskParam);
    EXPECT_EQ(first.name, "Frame");
    EXPECT_EQ(format.references()[1].scope, SymbolScope::Param);
}

TEST(FormatStringTests, Parse_AllScopes)
{
    auto format = FormatString::parse(
        "{{RawParam.A}}{{Task.RawParam.B}}{{Task.File.C}}{{Env.File.D}}{{Session.WorkingDirectory}}");
    ASSERT_EQ(format.references().size(), 5u);
    EXPECT_EQ(format.references()[0].scope, SymbolScope::RawParam);
    EXPECT_EQ(format.references()[1].scope, SymbolScope::TaskRawParam);
    EXPECT_EQ(format.references()[2].scope, SymbolScope::TaskFile);
    EXPECT_EQ(format.references()[3].scope, SymbolScope::EnvFile);
    EXPECT_EQ(format.references()[4].scope, SymbolScope::Session);
    EXPECT_EQ(format.references()[4].handle, static_cast<size_t>(SessionSymbol::WorkingDirectory));
    EXPECT_TRUE(format.references_scope(SymbolScope::EnvFile));
    EXPECT_FALSE(format.references_scope(SymbolScope::Param));
}

TEST(FormatStringTests, Parse_Errors)
{
    EXPECT_THROW(FormatString::parse("{{Param.A"), FormatStringError);
    EXPECT_THROW(FormatString::parse("{{  }}"), FormatStringError);
    EXPECT_THROW(FormatString::parse("{{Job.Name}}"), FormatStringError);
    EXPECT_THROW(FormatString::parse("{{Param.1x}}"), FormatStringError);
    EXPECT_THROW(FormatString::parse("{{Session.Nope}}"), FormatStringError);
}

TEST(FormatStringTests, IsIdentifier)
{
    EXPECT_TRUE(is_identifier("Frame_2"));
    EXPECT_TRUE(is_identifier("_x"));
    EXPECT_FALSE(is_identifier("2x"));
    EXPECT_FALSE(is_identifier("a-b"));
    EXPECT_FALSE(is_identifier(""));
}

// ============================================================================
// Binding
// ============================================================================

TEST(SymbolTableTests, Bind_ResolvesHandles)
{
    SymbolTable symbols;
    symbols.allow(SymbolScope::Param, {"Start", "End"});
    auto format = FormatString::parse("{{Param.End}}");
    EXPECT_TRUE(bind_references(format, symbols).empty());
    EXPECT_EQ(format.references()[0].handle, 1u);
}

TEST(SymbolTableTests, Bind_ScopeNotAvailable)
{
    SymbolTable symbols;
    symbols.allow(SymbolScope::Param, {"A"});
    symbols.set_description("job name");
    auto format = FormatString::parse("{{Task.Param.Frame}}");
    auto problems = bind_references(format, symbols);
    ASSERT_EQ(problems.size(), 1u);
    EXPECT_NE(problems[0].find("'{{Task.Param.Frame}}'"), std::string::npos);
    EXPECT_NE(problems[0].find("not available here (job name)"), std::string::npos);
}

TEST(SymbolTableTests, Bind_UnknownName)
{
    SymbolTable symbols;
    symbols.allow(SymbolScope::Param, {"A"});
    auto format = FormatString::parse("{{Param.B}}");
    auto problems = bind_references(format, symbols);
    ASSERT_EQ(problems.size(), 1u);
    EXPECT_NE(problems[0].find("no Param named 'B'"), std::string::npos);
    EXPECT_EQ(format.references()[0].handle, k_unbound_handle);
}

// ============================================================================
// Resolution
// ============================================================================

TEST(ResolverTests, Resolve_SubstitutesLiterally)
{
    SymbolTable symbols;
    symbols.allow(SymbolScope::Param, {"Name"});
    symbols.allow(SymbolScope::TaskParam, {"Frame"});
    auto format = FormatString::parse("render {{Param.Name}} --frame {{Task.Param.Frame}}");
    ASSERT_TRUE(bind_references(format, symbols).empty());

    SymbolValues job_values;
    job_values.set_values(SymbolScope::Param, {"scene.blend"});
    SymbolValues task_values(&job_values);
    task_values.set_values(SymbolScope::TaskParam, {"12"});

    EXPECT_EQ(resolve(format, task_values), "render scene.blend --frame 12");
}

TEST(ResolverTests, Resolve_ValueIsNotRescanned)
{
    SymbolTable symbols;
    symbols.allow(SymbolScope::Param, {"A"});
    auto format = FormatString::parse("x{{Param.A}}y");
    ASSERT_TRUE(bind_references(format, symbols).empty());

    SymbolValues values;
    values.set_values(SymbolScope::Param, {"{{Param.A}}"});
    EXPECT_EQ(resolve(format, values), "x{{Param.A}}y");
}

TEST(ResolverTests, Resolve_ChildFrameShadowsParent)
{
    SymbolTable symbols;
    symbols.allow(SymbolScope::Param, {"A"});
    auto format = FormatString::parse("{{Param.A}}");
    ASSERT_TRUE(bind_references(format, symbols).empty());

    SymbolValues parent;
    parent.set_values(SymbolScope::Param, {"outer"});
    SymbolValues child(&parent);
    child.set_value(SymbolScope::Param, 0, "inner");
    EXPECT_EQ(resolve(format, child), "inner");
    EXPECT_EQ(resolve(format, parent), "outer");
}

TEST(ResolverTests, Resolve_MissingValue_NamesPlaceholder)
{
    SymbolTable symbols;
    symbols.allow(SymbolScope::TaskFile, {"Script"});
    auto format = FormatString::parse("sh {{ Task.File.Script }}");
    ASSERT_TRUE(bind_references(format, symbols).empty());

    SymbolValues values;
    try
    {
        resolve(format, values, "steps[0].onRun.args[0]");
        FAIL() << "Expected UnresolvedReferenceError";
    }
    catch (const UnresolvedReferenceError& e)
    {
        const std::string message = e.what();
        EXPECT_NE(message.find("'{{ Task.File.Script }}'"), std::string::npos);
        EXPECT_NE(message.find("Task.File scope"), std::string::npos);
        EXPECT_NE(message.find("steps[0].onRun.args[0]"), std::string::npos);
    }
}

TEST(ResolverTests, Resolve_UnboundReference_Throws)
{
    auto format = FormatString::parse("{{Param.A}}");
    SymbolValues values;
    values.set_values(SymbolScope::Param, {"x"});
    EXPECT_THROW(resolve(format, values), UnresolvedReferenceError);
}

TEST(ResolverTests, Resolve_Literal)
{
    SymbolValues values;
    EXPECT_EQ(resolve(FormatString::literal("{{not parsed}}"), values), "{{not parsed}}");
}
