// weave

#include <catch2/catch_test_macros.hpp>

#include "weave/canonical_type.hh"

#include "leak_alloc.hh"
#include "solver.hh"

using namespace weave;

TEST_CASE("Axis solver", "[solver]")
{
    test::LeakTestAllocator alloc;
    wvAxisSolver<wvPayload> solver(alloc);

    SECTION("Binding a class binds every member")
    {
        wvTypeVarId const a = solver.makeVariable();
        wvTypeVarId const b = solver.makeVariable();
        wvTypeVarId const c = solver.makeVariable();

        CHECK(solver.unify(a, b));
        CHECK(solver.unify(b, c));
        CHECK_FALSE(solver.isBound(a));

        CHECK(solver.bind(c, wvPayload::Vec3));
        CHECK(solver.isBound(a));
        CHECK(solver.value(a) == wvPayload::Vec3);
        CHECK(solver.resolve(b).value() == wvPayload::Vec3);
    }

    SECTION("Conflicts leave both classes untouched")
    {
        wvTypeVarId const left = solver.makeBound(wvPayload::Float);
        wvTypeVarId const right = solver.makeBound(wvPayload::Int);

        wvPayload reportedLeft = wvPayload::Bool;
        wvPayload reportedRight = wvPayload::Bool;
        CHECK_FALSE(solver.canUnify(left, right));
        CHECK_FALSE(solver.unify(left, right, &reportedLeft, &reportedRight));
        CHECK(reportedLeft == wvPayload::Float);
        CHECK(reportedRight == wvPayload::Int);

        CHECK(solver.value(left) == wvPayload::Float);
        CHECK(solver.value(right) == wvPayload::Int);
        CHECK_FALSE(solver.find(left) == solver.find(right));
    }

    SECTION("Binding a bound class to another value fails")
    {
        wvTypeVarId const var = solver.makeBound(wvPayload::Color);
        CHECK(solver.bind(var, wvPayload::Color));
        CHECK_FALSE(solver.bind(var, wvPayload::Float));
        CHECK(solver.value(var) == wvPayload::Color);
    }

    SECTION("Unbound classes resolve to their root")
    {
        wvTypeVarId const a = solver.makeVariable();
        wvTypeVarId const b = solver.makeVariable();
        CHECK(solver.unify(b, a));

        wvAxis<wvPayload> const resolved = solver.resolve(b);
        CHECK(resolved.isVariable());
        CHECK(resolved.var() == a);
    }

    SECTION("Merging agrees with single axis unification")
    {
        wvTypeVarId const vars[] = {
            solver.makeVariable(),
            solver.makeVariable(),
            solver.makeBound(wvPayload::Vec2),
            solver.makeBound(wvPayload::Vec2),
            solver.makeBound(wvPayload::Int),
        };

        for (wvTypeVarId const left : vars)
        {
            for (wvTypeVarId const right : vars)
            {
                wvAxis<wvPayload> expected = solver.resolve(left);
                bool const allowed = wvUnifyAxis(solver.resolve(left), solver.resolve(right), expected);
                CHECK(solver.canUnify(left, right) == allowed);
                CHECK(solver.canUnify(right, left) == allowed);
            }
        }

        wvAxis<wvPayload> expected = solver.resolve(vars[0]);
        REQUIRE(wvUnifyAxis(solver.resolve(vars[0]), solver.resolve(vars[2]), expected));
        REQUIRE(solver.unify(vars[0], vars[2]));
        CHECK(solver.resolve(vars[0]) == expected);
        CHECK(solver.resolve(vars[2]) == expected);

        CHECK(solver.unify(vars[3], vars[0]));
        CHECK_FALSE((solver.unify(vars[4], vars[1]) && solver.unify(vars[1], vars[0])));
        CHECK(solver.value(vars[0]) == wvPayload::Vec2);
    }
}

TEST_CASE("Unification order does not change the result", "[solver]")
{
    test::LeakTestAllocator alloc;

    wvAxisSolver<wvCardinality> forward(alloc);
    wvAxisSolver<wvCardinality> backward(alloc);

    constexpr uint32_t count = 6;
    for (uint32_t index = 0; index != count; ++index)
    {
        forward.makeVariable();
        backward.makeVariable();
    }

    constexpr uint32_t pairs[][2] = {{0, 1}, {2, 3}, {1, 3}, {4, 5}};
    for (auto const& pair : pairs)
        CHECK(forward.unify(wvTypeVarId{pair[0]}, wvTypeVarId{pair[1]}));
    for (auto const& pair : pairs)
        CHECK(backward.unify(wvTypeVarId{pair[1]}, wvTypeVarId{pair[0]}));

    CHECK(forward.bind(wvTypeVarId{5}, wvCardinality::many(wvInstanceId{9})));
    CHECK(backward.bind(wvTypeVarId{4}, wvCardinality::many(wvInstanceId{9})));

    for (uint32_t index = 0; index != count; ++index)
    {
        wvAxis<wvCardinality> const left = forward.resolve(wvTypeVarId{index});
        wvAxis<wvCardinality> const right = backward.resolve(wvTypeVarId{index});
        CHECK(left == right);
    }
}

TEST_CASE("Type solver", "[solver]")
{
    test::LeakTestAllocator alloc;
    wvTypeSolver solver(alloc);

    auto const makePort = [&solver](wvPayload payload) {
        wvPortVars vars;
        vars.payload = solver.payload().makeBound(payload);
        vars.cardinality = solver.cardinality().makeVariable();
        vars.temporality = solver.temporality().makeVariable();
        vars.binding = solver.binding().makeVariable();
        vars.perspective = solver.perspective().makeVariable();
        vars.branch = solver.branch().makeVariable();
        return vars;
    };

    SECTION("Probing changes nothing")
    {
        wvPortVars const left = makePort(wvPayload::Float);
        wvPortVars const right = makePort(wvPayload::Float);

        CHECK(solver.canUnify(left, right));
        CHECK_FALSE(solver.cardinality().find(left.cardinality) == solver.cardinality().find(right.cardinality));

        CHECK(solver.unify(left, right));
        CHECK(solver.cardinality().find(left.cardinality) == solver.cardinality().find(right.cardinality));
    }

    SECTION("A payload conflict unifies no axis")
    {
        wvPortVars const left = makePort(wvPayload::Float);
        wvPortVars const right = makePort(wvPayload::Vec2);

        wvAxisConflict conflict;
        CHECK_FALSE(solver.unify(left, right, &conflict));
        CHECK(conflict.axis == wvAxisName::Payload);
        CHECK(conflict.left.payload == wvPayload::Float);
        CHECK(conflict.right.payload == wvPayload::Vec2);
        CHECK_FALSE(solver.cardinality().find(left.cardinality) == solver.cardinality().find(right.cardinality));
    }

    SECTION("Defaults bind what is left open")
    {
        wvPortVars const port = makePort(wvPayload::Color);
        solver.applyDefaults();
        CHECK(solver.defaultsApplied());

        wvCanonicalType const type = solver.resolve(port);
        CHECK(type.payload == wvPayload::Color);
        CHECK(type.extent.cardinality.value() == wvCardinality::one());
        CHECK(type.extent.temporality.value() == wvTemporality::Continuous);
    }
}
