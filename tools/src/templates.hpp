// Built-in templates for generated fixtures.
//
// Partials rendered with fmt named arguments use doubled braces for literal
// braces. Headers use {{NAME}} placeholders substituted by replace_all.
#pragma once

#include <string_view>

namespace fixturegen::codegen::tpl {

// fmt fields: annotation, name, runner, file
inline constexpr std::string_view test_entry = R"(        [Test]{annotation}
        public void {name}()
        {{
            {runner}("{file}");
        }}

)";

// fmt fields: path
inline constexpr std::string_view fixture_footer = R"(        override protected string GetRelativeTestCasesPath()
        {{
            return "{path}";
        }}
    }}
}}
)";

// Placeholders: {{FIXTURE_NAME}}, {{LABEL}}
inline constexpr std::string_view integration_header = R"(
    namespace BooCompiler.Tests
    {
        using NUnit.Framework;

        [TestFixture]
        [Category("{{LABEL}}")]
        public class {{FIXTURE_NAME}} : AbstractCompilerTestCase
        {
    )";

} // namespace fixturegen::codegen::tpl
