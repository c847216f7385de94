/**
 * @file template_validator_tests.cpp
 * @brief Tests for template parsing and validation.
 */
#include <gtest/gtest.h>
#include "jobtmpl/template/template_validator.hpp"

using namespace jobtmpl;

namespace
{

const char* const k_render_template = R"(
specificationVersion: jobtemplate-2023-09
name: Render {{Param.SceneFile}}
parameterDefinitions:
  - name: SceneFile
    type: PATH
    dataFlow: IN
    objectType: FILE
  - name: FrameEnd
    type: INT
    default: 380
    minValue: 1
steps:
  - name: Render
    parameterSpace:
      taskParameterDefinitions:
        - name: Start
          type: INT
          range: "1-{{Param.FrameEnd}}:11"
        - name: End
          type: INT
          range: "11-{{Param.FrameEnd}}:11,{{Param.FrameEnd}}"
      combination: (Start, End)
    script:
      actions:
        onRun:
          command: "{{Task.File.Run}}"
          args: ["{{Param.SceneFile}}", "{{Task.Param.Start}}", "{{Task.Param.End}}"]
          timeout: 3600
      embeddedFiles:
        - name: Run
          type: TEXT
          runnable: true
          data: |
            #!/bin/sh
            echo rendering "$@"
  - name: Encode
    dependencies:
      - dependsOn: Render
    script:
      actions:
        onRun:
          command: /bin/echo
          args: [encode]
jobEnvironments:
  - name: Setup
    variables:
      RENDER_ROOT: "{{Session.WorkingDirectory}}"
)";

/// Wrap a single step body into a complete document.
std::string with_steps(const std::string& steps, const std::string& params = std::string())
{
    std::string doc = "specificationVersion: jobtemplate-2023-09\nname: Test\n";
    if (!params.empty())
    {
        doc += "parameterDefinitions:\n" + params;
    }
    doc += "steps:\n" + steps;
    return doc;
}

std::string simple_step(const std::string& name, const std::string& command = "/bin/true")
{
    return "  - name: " + name + "\n"
           "    script:\n"
           "      actions:\n"
           "        onRun:\n"
           "          command: \"" + command + "\"\n";
}

bool has_message(const Diagnostics& diagnostics, const std::string& fragment)
{
    for (const auto& item : diagnostics.errors())
    {
        if (item.message.find(fragment) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

} // namespace

// ============================================================================
// Valid documents
// ============================================================================

TEST(TemplateValidatorTests, Validate_RenderTemplate_Succeeds)
{
    auto result = validate(k_render_template);
    ASSERT_TRUE(result.ok()) << (result.diagnostics.items().empty() ? "" : result.diagnostics.items().front().to_string());

    const auto& tmpl = *result.job_template;
    EXPECT_EQ(tmpl.specification_version, k_specification_version);
    ASSERT_EQ(tmpl.parameter_definitions.size(), 2u);
    EXPECT_EQ(tmpl.parameter_definitions[0].type, ParameterType::Path);
    EXPECT_EQ(tmpl.parameter_definitions[1].default_value, std::optional<std::string>{"380"});
    ASSERT_EQ(tmpl.steps.size(), 2u);
    ASSERT_EQ(tmpl.job_environments.size(), 1u);
}

TEST(TemplateValidatorTests, Validate_ResolvesHandles)
{
    auto result = validate(k_render_template);
    ASSERT_TRUE(result.ok());
    const auto& tmpl = *result.job_template;

    const auto& encode = tmpl.steps[1];
    ASSERT_EQ(encode.dependencies.size(), 1u);
    EXPECT_EQ(encode.dependencies[0].handle, 0u);

    const auto& render = tmpl.steps[0];
    ASSERT_TRUE(render.parameter_space.has_value());
    ASSERT_NE(render.parameter_space->combination_tree, nullptr);
    EXPECT_EQ(to_string(*render.parameter_space->combination_tree), "(Start, End)");

    const auto& args = render.script.on_run.args;
    ASSERT_EQ(args.size(), 3u);
    EXPECT_EQ(args[1].references()[0].handle, 0u);
    EXPECT_EQ(args[2].references()[0].handle, 1u);
    EXPECT_EQ(render.script.on_run.command.references()[0].scope, SymbolScope::TaskFile);
    EXPECT_EQ(render.script.on_run.timeout, std::optional<std::chrono::seconds>{3600});
}

TEST(TemplateValidatorTests, Validate_JsonDocument_Succeeds)
{
    auto result = validate(R"({
        "specificationVersion": "jobtemplate-2023-09",
        "name": "Json",
        "steps": [{"name": "Only", "script": {"actions": {"onRun": {"command": "/bin/true"}}}}]
    })");
    EXPECT_TRUE(result.ok());
}

TEST(TemplateValidatorTests, Validate_DefaultCombinationIsProduct)
{
    auto result = validate(with_steps(R"(  - name: Grid
    parameterSpace:
      taskParameterDefinitions:
        - name: Num
          type: INT
          range: [1, 2, 3]
        - name: Letter
          type: STRING
          range: [A, B, C]
    script:
      actions:
        onRun:
          command: /bin/echo
)"));
    ASSERT_TRUE(result.ok());
    const auto& space = *result.job_template->steps[0].parameter_space;
    EXPECT_FALSE(space.combination.has_value());
    EXPECT_EQ(to_string(*space.combination_tree), "Num * Letter");
}

// ============================================================================
// Structural errors
// ============================================================================

TEST(TemplateValidatorTests, MalformedYaml_SingleDocumentDiagnostic)
{
    auto result = validate("steps: [unclosed");
    EXPECT_FALSE(result.ok());
    ASSERT_EQ(result.diagnostics.errors().size(), 1u);
    EXPECT_TRUE(result.diagnostics.errors()[0].location.empty());
}

TEST(TemplateValidatorTests, WrongSpecificationVersion_Fails)
{
    auto result = validate("specificationVersion: jobtemplate-1999\nname: X\nsteps:\n" + simple_step("A"));
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.diagnostics.errors()[0].location, "specificationVersion");
}

TEST(TemplateValidatorTests, MissingSteps_Fails)
{
    auto result = validate("specificationVersion: jobtemplate-2023-09\nname: X\n");
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(has_message(result.diagnostics, "Missing required key 'steps'"));
}

TEST(TemplateValidatorTests, UnknownKey_NamedWithLocationAndLine)
{
    auto result = validate(with_steps(simple_step("A") + "    retries: 3\n"));
    EXPECT_FALSE(result.ok());
    const auto errors = result.diagnostics.errors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].location, "steps[0].retries");
    EXPECT_EQ(errors[0].message, "Unknown key 'retries'");
    EXPECT_GT(errors[0].line, 0);
}

TEST(TemplateValidatorTests, NonPositiveTimeout_Fails)
{
    auto result = validate(with_steps(simple_step("A") + "          timeout: 0\n"));
    EXPECT_FALSE(result.ok());
}

TEST(TemplateValidatorTests, HugeTimeout_Fails)
{
    auto result = validate(with_steps(simple_step("A") + "          timeout: 10000000000\n"));
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.diagnostics.errors().size(), 1u);
    EXPECT_TRUE(has_message(result.diagnostics, "'timeout' must be between 1 and 2147483647"));
}

TEST(TemplateValidatorTests, MaximumTimeout_Accepted)
{
    auto result = validate(with_steps(simple_step("A") + "          timeout: 2147483647\n"));
    EXPECT_TRUE(result.ok());
}

TEST(TemplateValidatorTests, EmbeddedFilenameWithSeparator_Fails)
{
    auto result = validate(with_steps(simple_step("A") + R"(      embeddedFiles:
        - name: F
          type: TEXT
          filename: ../escape.sh
          data: x
)"));
    EXPECT_FALSE(result.ok());
}

TEST(TemplateValidatorTests, ScalarRangeForString_Fails)
{
    auto result = validate(with_steps(R"(  - name: A
    parameterSpace:
      taskParameterDefinitions:
        - name: Word
          type: STRING
          range: "1-3"
    script:
      actions:
        onRun:
          command: /bin/echo
)"));
    EXPECT_FALSE(result.ok());
}

// ============================================================================
// Names
// ============================================================================

TEST(TemplateValidatorTests, DuplicateStepNames_Fails)
{
    auto result = validate(with_steps(simple_step("A") + simple_step("A")));
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(has_message(result.diagnostics, "Duplicate step name 'A'"));
}

TEST(TemplateValidatorTests, DuplicateParameterNames_Fails)
{
    auto result = validate(with_steps(simple_step("A"), "  - name: P\n    type: INT\n  - name: P\n    type: STRING\n"));
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(has_message(result.diagnostics, "Duplicate parameter name 'P'"));
}

TEST(TemplateValidatorTests, InvalidParameterIdentifier_Fails)
{
    auto result = validate(with_steps(simple_step("A"), "  - name: 2fast\n    type: INT\n"));
    EXPECT_FALSE(result.ok());
}

// ============================================================================
// Dependencies
// ============================================================================

TEST(TemplateValidatorTests, Cycle_NamedInDiagnostic)
{
    auto result = validate(with_steps(simple_step("A") + "    dependencies:\n      - dependsOn: B\n" +
                                      simple_step("B") + "    dependencies:\n      - dependsOn: A\n"));
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.diagnostics.has_error_code(ErrorCode::CyclicDependency));
    EXPECT_TRUE(has_message(result.diagnostics, "Cyclic step dependency: A -> B -> A"));
}

TEST(TemplateValidatorTests, Cycle_ValidateOrThrowRaisesCyclicDependencyError)
{
    const std::string doc = with_steps(simple_step("A") + "    dependencies:\n      - dependsOn: B\n" +
                                       simple_step("B") + "    dependencies:\n      - dependsOn: A\n");
    EXPECT_THROW(validate_or_throw(doc), CyclicDependencyError);
}

TEST(TemplateValidatorTests, SelfDependency_Fails)
{
    auto result = validate(with_steps(simple_step("A") + "    dependencies:\n      - dependsOn: A\n"));
    EXPECT_TRUE(result.diagnostics.has_error_code(ErrorCode::CyclicDependency));
}

TEST(TemplateValidatorTests, UnknownDependency_Fails)
{
    auto result = validate(with_steps(simple_step("A") + "    dependencies:\n      - dependsOn: Nope\n"));
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(has_message(result.diagnostics, "depends on unknown step 'Nope'"));
}

// ============================================================================
// Format string references
// ============================================================================

TEST(TemplateValidatorTests, UnknownParamReference_Fails)
{
    auto result = validate(with_steps(simple_step("A", "{{Param.Missing}}")));
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.diagnostics.has_error_code(ErrorCode::UnresolvedReference));
    EXPECT_TRUE(has_message(result.diagnostics, "'{{Param.Missing}}'"));
}

TEST(TemplateValidatorTests, TaskParamInJobName_Fails)
{
    auto result = validate("specificationVersion: jobtemplate-2023-09\nname: \"{{Task.Param.X}}\"\nsteps:\n" +
                           simple_step("A"));
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.diagnostics.has_error_code(ErrorCode::UnresolvedReference));
}

TEST(TemplateValidatorTests, EnvFileInStep_Fails)
{
    auto result = validate(with_steps(simple_step("A", "{{Env.File.Setup}}")));
    EXPECT_TRUE(result.diagnostics.has_error_code(ErrorCode::UnresolvedReference));
}

TEST(TemplateValidatorTests, MalformedPlaceholder_IsFormatStringError)
{
    auto result = validate(with_steps(simple_step("A", "{{Param.X")));
    EXPECT_TRUE(result.diagnostics.has_error_code(ErrorCode::FormatString));
}

TEST(TemplateValidatorTests, EnvFileInsideEnvironment_Succeeds)
{
    auto result = validate(with_steps(simple_step("A")) + R"(jobEnvironments:
  - name: Env1
    script:
      actions:
        onEnter:
          command: "{{Env.File.Enter}}"
      embeddedFiles:
        - name: Enter
          type: TEXT
          runnable: true
          data: "#!/bin/sh\n"
)");
    EXPECT_TRUE(result.ok());
}

// ============================================================================
// Parameter spaces
// ============================================================================

TEST(TemplateValidatorTests, UnequalAssociation_FailsBeforeExecution)
{
    auto result = validate(with_steps(R"(  - name: Zip
    parameterSpace:
      taskParameterDefinitions:
        - name: A
          type: INT
          range: [1, 2, 3]
        - name: B
          type: INT
          range: [1, 2]
      combination: (A, B)
    script:
      actions:
        onRun:
          command: /bin/echo
)"));
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.diagnostics.has_error_code(ErrorCode::AssociationCardinality));
}

TEST(TemplateValidatorTests, InvalidRangeExpression_IsRangeExpansionError)
{
    auto result = validate(with_steps(R"(  - name: R
    parameterSpace:
      taskParameterDefinitions:
        - name: Frame
          type: INT
          range: "10-1"
    script:
      actions:
        onRun:
          command: /bin/echo
)"));
    EXPECT_TRUE(result.diagnostics.has_error_code(ErrorCode::RangeExpansion));
}

TEST(TemplateValidatorTests, InvalidIntListItem_Fails)
{
    auto result = validate(with_steps(R"(  - name: R
    parameterSpace:
      taskParameterDefinitions:
        - name: Frame
          type: INT
          range: [1, two]
    script:
      actions:
        onRun:
          command: /bin/echo
)"));
    EXPECT_FALSE(result.ok());
}

TEST(TemplateValidatorTests, CombinationMissingParameter_Fails)
{
    auto result = validate(with_steps(R"(  - name: R
    parameterSpace:
      taskParameterDefinitions:
        - name: A
          type: INT
          range: [1]
        - name: B
          type: INT
          range: [1]
      combination: A
    script:
      actions:
        onRun:
          command: /bin/echo
)"));
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(has_message(result.diagnostics, "does not use task parameter 'B'"));
}

// ============================================================================
// Parameter constraints
// ============================================================================

TEST(TemplateValidatorTests, MinGreaterThanMax_Fails)
{
    auto result = validate(with_steps(simple_step("A"), "  - name: N\n    type: INT\n    minValue: 10\n    maxValue: 1\n"));
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(has_message(result.diagnostics, "minValue is greater than maxValue"));
}

TEST(TemplateValidatorTests, DefaultOutsideBounds_Fails)
{
    auto result = validate(with_steps(simple_step("A"), "  - name: N\n    type: INT\n    default: 0\n    minValue: 1\n"));
    EXPECT_FALSE(result.ok());
}

TEST(TemplateValidatorTests, DefaultNotAllowed_Fails)
{
    auto result = validate(with_steps(simple_step("A"),
                                      "  - name: Mode\n    type: STRING\n    allowedValues: [fast, slow]\n    default: medium\n"));
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(has_message(result.diagnostics, "is not one of allowedValues"));
}

TEST(TemplateValidatorTests, LengthKeyOnInt_Fails)
{
    auto result = validate(with_steps(simple_step("A"), "  - name: N\n    type: INT\n    minLength: 1\n"));
    EXPECT_FALSE(result.ok());
}

TEST(TemplateValidatorTests, UserInterfaceBlock_IsIgnored)
{
    auto result = validate(with_steps(simple_step("A"),
                                      "  - name: N\n    type: INT\n    default: 1\n    userInterface:\n      control: SPIN_BOX\n"));
    EXPECT_TRUE(result.ok());
}
