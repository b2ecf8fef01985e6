// weave

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "weave/blocks.hh"
#include "weave/expression_compiler.hh"
#include "weave/graph_compiler.hh"

#include "leak_alloc.hh"
#include "patch_runner.hh"

#include <cmath>

using namespace weave;

namespace {
    constexpr wvOutputPortIndex out0{0};
    constexpr wvInputPortIndex in0{0};

    // folds an expression down to a constant
    class ConstantFolder
    {
    public:
        explicit ConstantFolder(wvAllocator& alloc) : compiler_(wvCreateExpressionCompiler(alloc)) {}
        ~ConstantFolder() { wvDestroyExpressionCompiler(compiler_); }

        ConstantFolder(ConstantFolder const&) = delete;
        ConstantFolder& operator=(ConstantFolder const&) = delete;

        bool fold(char const* expression, float& out_value)
        {
            return compiler_->compile(expression) && compiler_->optimize() && compiler_->asConstant(out_value);
        }

        wvExpressionCompiler& compiler() noexcept { return *compiler_; }

    private:
        wvExpressionCompiler* compiler_ = nullptr;
    };

    // evaluates an Expression block fed by two constants
    class ExpressionTester
    {
    public:
        explicit ExpressionTester(wvAllocator& alloc) : runner_(alloc) {}

        float evaluate(char const* expression, float a = 0.f, float b = 0.f)
        {
            describe(expression, a, b);
            if (!runner_.compileAndInstall(++version_) || !runner_.advance(frameMs_))
                return std::nanf("");
            frameMs_ += 16.0;
            return runner_.output("out");
        }

        bool fails(char const* expression)
        {
            describe(expression, 0.f, 0.f);
            return !runner_.compile(++version_) && runner_.hasError(wvCompileErrorCode::ExpressionCompileError);
        }

    private:
        void describe(char const* expression, float a, float b)
        {
            wvGraphCompiler& compiler = runner_.compiler();
            compiler.reset();

            compiler.beginNode(wvNodeId{1}, wvConstBlockId);
            compiler.setParam("value", a);
            compiler.beginNode(wvNodeId{2}, wvConstBlockId);
            compiler.setParam("value", b);
            compiler.beginNode(wvNodeId{3}, wvExpressionBlockId);
            compiler.setParamText("expression", expression);
            compiler.beginNode(wvNodeId{4}, wvProbeBlockId);
            compiler.setParamText("name", "out");

            compiler.addEdge(wvNodeId{1}, out0, wvNodeId{3}, in0);
            compiler.addEdge(wvNodeId{2}, out0, wvNodeId{3}, in0);
            compiler.addEdge(wvNodeId{3}, out0, wvNodeId{4}, in0);
        }

        test::PatchRunner runner_;
        uint64_t version_ = 0;
        double frameMs_ = 0.0;
    };
} // namespace

TEST_CASE("Expression folding", "[expression]")
{
    test::LeakTestAllocator alloc;
    ConstantFolder folder(alloc);
    float value = 0.f;

    SECTION("Arithmetic")
    {
        REQUIRE(folder.fold("1 + 2 * 3", value));
        CHECK(value == 7.f);
        REQUIRE(folder.fold("(1 + 2) * 3", value));
        CHECK(value == 9.f);
        REQUIRE(folder.fold("--4", value));
        CHECK(value == 4.f);
        REQUIRE(folder.fold("10 / 4", value));
        CHECK(value == 2.5f);
        REQUIRE(folder.fold("0.25", value));
        CHECK(value == 0.25f);
    }

    SECTION("Functions")
    {
        REQUIRE(folder.fold("max(2, 5) + min(2, 5)", value));
        CHECK(value == 7.f);
        REQUIRE(folder.fold("clamp(7, 0, 1)", value));
        CHECK(value == 1.f);
    }

    SECTION("Free identifiers stay open")
    {
        REQUIRE(folder.compiler().compile("a + 1"));
        REQUIRE(folder.compiler().optimize());
        CHECK_FALSE(folder.compiler().isConstant());
        CHECK_FALSE(folder.compiler().asConstant(value));
    }

    SECTION("Empty input")
    {
        REQUIRE(folder.compiler().compile(""));
        CHECK(folder.compiler().isEmpty());
    }

    SECTION("Syntax errors")
    {
        CHECK_FALSE(folder.compiler().compile("1 +"));
        CHECK_FALSE(folder.compiler().compile("(1 + 2"));
        CHECK_FALSE(folder.compiler().compile("1 $ 2"));
        CHECK(folder.compiler().errorOffset() == 2);
        CHECK_FALSE(folder.compiler().compile("if a then b"));
        CHECK_FALSE(folder.compiler().compile("nosuch(1)"));
        CHECK_FALSE(folder.compiler().compile("sin(1, 2)"));
    }
}

TEST_CASE("Expression blocks", "[expression]")
{
    test::LeakTestAllocator alloc;
    ExpressionTester tester(alloc);

    SECTION("Inputs and precedence")
    {
        CHECK(tester.evaluate("a + b * 2", 1.f, 3.f) == 7.f);
        CHECK(tester.evaluate("(a + b) * 2", 1.f, 3.f) == 8.f);
        CHECK(tester.evaluate("-a - b", 1.f, 3.f) == -4.f);
    }

    SECTION("Total arithmetic")
    {
        CHECK(tester.evaluate("a / b", 5.f, 0.f) == 0.f);
        CHECK(tester.evaluate("mod(a, b)", -1.f, 3.f) == 2.f);
        CHECK(tester.evaluate("mod(a, b)", 7.f, 3.f) == 1.f);
        CHECK(tester.evaluate("mod(a, b)", 7.f, 0.f) == 0.f);
    }

    SECTION("Functions")
    {
        CHECK(tester.evaluate("clamp(a, 0, b)", 4.f, 2.f) == 2.f);
        CHECK(tester.evaluate("mix(a, b, 0.25)", 0.f, 8.f) == 2.f);
        CHECK(tester.evaluate("select(a, 10, 20)", 1.f) == 10.f);
        CHECK(tester.evaluate("select(a, 10, 20)", 0.f) == 20.f);
        CHECK(tester.evaluate("sqrt(a)", 9.f) == 3.f);
        CHECK(tester.evaluate("pow(a, b)", 2.f, 10.f) == 1024.f);
        CHECK(tester.evaluate("abs(a)", -3.f) == 3.f);
        CHECK(tester.evaluate("floor(a)", -1.5f) == -2.f);
        CHECK(tester.evaluate("fract(a)", 1.25f) == Catch::Approx(0.25f));
        CHECK(tester.evaluate("sin(a)", 0.f) == 0.f);
        CHECK(tester.evaluate("cos(a)", 0.f) == 1.f);
    }

    SECTION("Logic")
    {
        CHECK(tester.evaluate("a < b", 1.f, 2.f) == 1.f);
        CHECK(tester.evaluate("a > b", 1.f, 2.f) == 0.f);
        CHECK(tester.evaluate("a and b", 1.f, 0.f) == 0.f);
        CHECK(tester.evaluate("a or b", 1.f, 0.f) == 1.f);
        CHECK(tester.evaluate("a xor b", 1.f, 1.f) == 0.f);
        CHECK(tester.evaluate("not a", 0.f) == 1.f);
        CHECK(tester.evaluate("true and not false") == 1.f);
    }

    SECTION("Errors")
    {
        CHECK(tester.fails("a +"));
        CHECK(tester.fails("unknown + 1"));
        CHECK(tester.fails("c"));

        // element identifiers only exist on fields
        CHECK(tester.fails("i + a"));
        CHECK(tester.fails("n"));
    }
}
