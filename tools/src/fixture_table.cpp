#include "fixture_table.hpp"

#include "render.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace fixturegen::codegen {
namespace {

// Placeholders: {{CLASS}}, {{BASE}}
constexpr std::string_view kPlainHeader = R"(
    namespace BooCompiler.Tests
    {
        using NUnit.Framework;

        [TestFixture]
        public class {{CLASS}} : {{BASE}}
        {
    )";

std::string plain_header(std::string_view class_name, std::string_view base = "AbstractCompilerTestCase") {
    std::string header(kPlainHeader);
    render::replace_all(header, "{{CLASS}}", class_name);
    render::replace_all(header, "{{BASE}}", base);
    return header;
}

FixtureSpec make_spec(std::string name, std::string source_dir, std::string header, std::string runner = "RunCompilerTestCase") {
    FixtureSpec spec;
    spec.target_file = name + "TestFixture.cs";
    spec.name        = std::move(name);
    spec.source_dir  = std::move(source_dir);
    spec.header      = std::move(header);
    spec.runner      = std::move(runner);
    return spec;
}

constexpr std::string_view kDuckyHeader = R"(
    namespace BooCompiler.Tests
    {
        using NUnit.Framework;

        [TestFixture]
        public class DuckyTestFixture : AbstractCompilerTestCase
        {
            protected override void CustomizeCompilerParameters()
            {
                _parameters.Ducky = true;
            }

    )";

constexpr std::string_view kSemanticsHeader = R"(
    namespace BooCompiler.Tests
    {
        using NUnit.Framework;
        using Boo.Lang.Compiler;

        [TestFixture]
        public class SemanticsTestFixture : AbstractCompilerTestCase
        {
            protected override CompilerPipeline SetUpCompilerPipeline()
            {
                return new Boo.Lang.Compiler.Pipelines.CompileToBoo();
            }

    )";

constexpr std::string_view kGenericsHeader = R"(
    namespace BooCompiler.Tests
    {
        using NUnit.Framework;

        [TestFixture]
        public class GenericsTestFixture : AbstractCompilerTestCase
        {
            [TestFixtureSetUp]
            public override void SetUpFixture()
            {
                System.Version version = System.Environment.Version;
                if (version.Major < 2)
                {
                    Assert.Ignore("Test requires .net 2.");
                }
                base.SetUpFixture();
            }

    )";

constexpr std::string_view kUnsafeHeader = R"(
    namespace BooCompiler.Tests
    {
        using NUnit.Framework;

        [TestFixture]
        public class UnsafeTestFixture : AbstractCompilerTestCase
        {
            protected override void CustomizeCompilerParameters()
            {
                _parameters.Unsafe = true;
            }

    )";

constexpr std::string_view kWhitespaceRoundtripHeader = R"(
    namespace BooCompiler.Tests
    {
        using NUnit.Framework;
        using Boo.Lang.Compiler;

        [TestFixture]
        public class WhitespaceRoundtripTestFixture : AbstractParserTestFixture
        {
            protected override ICompilerStep NewParserStep()
            {
                return new Boo.Lang.Parser.WhitespaceSignificantParsingStep();
            }

    )";

} // namespace

std::vector<FixtureSpec> default_fixture_table() {
    std::vector<FixtureSpec> table;
    table.reserve(18);

    table.push_back(make_spec("CompilerErrors", "errors", plain_header("CompilerErrorsTestFixture", "AbstractCompilerErrorsTestFixture")));
    table.push_back(make_spec("CompilerWarnings", "warnings", plain_header("CompilerWarningsTestFixture")));
    table.push_back(make_spec("Regression", "regression", plain_header("RegressionTestFixture")));
    table.push_back(make_spec("Macros", "macros", plain_header("MacrosTestFixture")));
    table.push_back(make_spec("Attributes", "attributes", plain_header("AttributesTestFixture")));
    table.push_back(make_spec("Callables", "callables", plain_header("CallablesTestFixture")));
    table.push_back(make_spec("Closures", "closures", plain_header("ClosuresTestFixture")));
    table.push_back(make_spec("Generators", "generators", plain_header("GeneratorsTestFixture")));
    table.push_back(make_spec("Ducky", "ducky", std::string(kDuckyHeader)));
    table.push_back(make_spec("Semantics", "semantics", std::string(kSemanticsHeader)));
    table.push_back(make_spec("Generics", "net2/generics", std::string(kGenericsHeader)));
    table.push_back(make_spec("Unsafe", "unsafe", std::string(kUnsafeHeader)));
    table.push_back(make_spec("StdLib", "stdlib", plain_header("StdLibTestFixture")));
    table.push_back(make_spec("Statements", "statements", plain_header("StatementsTestFixture")));
    table.push_back(make_spec("TypeSystem", "types", plain_header("TypeSystemTestFixture")));
    table.push_back(make_spec("Extensions", "extensions", plain_header("ExtensionsTestFixture")));
    table.push_back(make_spec("ParserRoundtrip", "parser/roundtrip", plain_header("ParserRoundtripTestFixture", "AbstractParserTestFixture"),
                              "RunParserTestCase"));

    auto whitespace = make_spec("WhitespaceRoundtrip", "parser/roundtrip-ws", std::string(kWhitespaceRoundtripHeader), "RunParserTestCase");
    whitespace.roundtrip_source = "parser/roundtrip";
    whitespace.sorted           = true;
    table.push_back(std::move(whitespace));

    return table;
}

} // namespace fixturegen::codegen
