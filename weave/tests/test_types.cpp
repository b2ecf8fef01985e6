// weave

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "weave/canonical_type.hh"
#include "weave/compile_types.hh"
#include "weave/diagnostics.hh"
#include "weave/ops.hh"
#include "weave/program.hh"

#include "kernels.hh"

#include <limits>
#include <string>
#include <vector>

using namespace weave;

namespace {
    // three variables and two distinct resolved values
    template <typename ValueT>
    std::vector<wvAxis<ValueT>> axisSamples(ValueT const& first, ValueT const& second)
    {
        return {
            wvAxis<ValueT>::variable(wvTypeVarId{1}),
            wvAxis<ValueT>::variable(wvTypeVarId{2}),
            wvAxis<ValueT>::variable(wvTypeVarId{3}),
            wvAxis<ValueT>::resolved(first),
            wvAxis<ValueT>::resolved(second),
        };
    }

    template <typename ValueT>
    void checkUnificationLaws(ValueT const& first, ValueT const& second)
    {
        std::vector<wvAxis<ValueT>> const samples = axisSamples(first, second);

        for (wvAxis<ValueT> const& left : samples)
        {
            for (wvAxis<ValueT> const& right : samples)
            {
                wvAxis<ValueT> forward = left;
                wvAxis<ValueT> backward = left;
                bool const forwardOk = wvUnifyAxis(left, right, forward);
                bool const backwardOk = wvUnifyAxis(right, left, backward);

                CHECK(forwardOk == backwardOk);
                if (forwardOk && backwardOk)
                    CHECK(forward == backward);

                for (wvAxis<ValueT> const& third : samples)
                {
                    wvAxis<ValueT> leftPair = left;
                    wvAxis<ValueT> leftChain = left;
                    bool const leftOk = wvUnifyAxis(left, right, leftPair) && wvUnifyAxis(leftPair, third, leftChain);

                    wvAxis<ValueT> rightPair = left;
                    wvAxis<ValueT> rightChain = left;
                    bool const rightOk = wvUnifyAxis(right, third, rightPair) && wvUnifyAxis(left, rightPair, rightChain);

                    CHECK(leftOk == rightOk);
                    if (leftOk && rightOk)
                        CHECK(leftChain == rightChain);
                }
            }
        }
    }
} // namespace

TEST_CASE("Payload strides", "[types]")
{
    CHECK(wvPayloadStride(wvPayload::Float) == 1);
    CHECK(wvPayloadStride(wvPayload::Int) == 1);
    CHECK(wvPayloadStride(wvPayload::Bool) == 1);
    CHECK(wvPayloadStride(wvPayload::Vec2) == 2);
    CHECK(wvPayloadStride(wvPayload::Vec3) == 3);
    CHECK(wvPayloadStride(wvPayload::Color) == 4);
    CHECK(wvPayloadStride(wvPayload::Shape) == 1);
    CHECK(wvPayloadStride(wvPayload::CameraProjection) == 1);
}

TEST_CASE("Cardinality equality", "[types]")
{
    constexpr wvInstanceId first{1};
    constexpr wvInstanceId second{2};

    CHECK(wvCardinality::one() == wvCardinality::one());
    CHECK_FALSE(wvCardinality::one() == wvCardinality::zero());
    CHECK(wvCardinality::many(first) == wvCardinality::many(first));
    CHECK_FALSE(wvCardinality::many(first) == wvCardinality::many(second));
    CHECK_FALSE(wvCardinality::many(first) == wvCardinality::one());
}

TEST_CASE("Axis values", "[types]")
{
    using Axis = wvAxis<wvPayload>;

    Axis const variable = Axis::variable(wvTypeVarId{3});
    Axis const resolved = Axis::resolved(wvPayload::Vec2);

    CHECK(variable.isVariable());
    CHECK(variable.var() == wvTypeVarId{3});
    CHECK(resolved.isResolved());
    CHECK(resolved.value() == wvPayload::Vec2);

    CHECK(variable == Axis::variable(wvTypeVarId{3}));
    CHECK_FALSE(variable == Axis::variable(wvTypeVarId{4}));
    CHECK_FALSE(variable == resolved);
    CHECK(resolved == Axis::resolved(wvPayload::Vec2));
}

TEST_CASE("Axis unification laws", "[types]")
{
    SECTION("Every axis is commutative and associative")
    {
        checkUnificationLaws(wvPayload::Float, wvPayload::Vec2);
        checkUnificationLaws(wvCardinality::one(), wvCardinality::many(wvInstanceId{4}));
        checkUnificationLaws(wvCardinality::many(wvInstanceId{4}), wvCardinality::many(wvInstanceId{5}));
        checkUnificationLaws(wvTemporality::Continuous, wvTemporality::Discrete);
        checkUnificationLaws(wvBinding{}, wvBinding{.kind = wvBindingKind::Strong, .referent = wvReferentId{7}});
        checkUnificationLaws(wvPerspectiveId{0}, wvPerspectiveId{1});
        checkUnificationLaws(wvBranchId{0}, wvBranchId{1});
    }

    SECTION("Variables pick the lower id in either order")
    {
        auto const low = wvAxis<wvTemporality>::variable(wvTypeVarId{2});
        auto const high = wvAxis<wvTemporality>::variable(wvTypeVarId{9});

        wvAxis<wvTemporality> result = high;
        REQUIRE(wvUnifyAxis(high, low, result));
        CHECK(result == low);
        REQUIRE(wvUnifyAxis(low, high, result));
        CHECK(result == low);
    }

    SECTION("Extent conflicts name the same axis both ways")
    {
        wvExtent signal;
        wvExtent event;
        event.temporality = wvAxis<wvTemporality>::resolved(wvTemporality::Discrete);

        wvExtent result;
        wvAxisConflict forward;
        wvAxisConflict backward;
        CHECK_FALSE(wvUnifyExtent(signal, event, result, &forward));
        CHECK_FALSE(wvUnifyExtent(event, signal, result, &backward));
        CHECK(forward.axis == wvAxisName::Temporality);
        CHECK(backward.axis == forward.axis);
    }

    SECTION("Types unify the same way both ways")
    {
        wvCanonicalType field = wvFieldType(wvPayload::Vec2, wvInstanceId{3});
        field.extent.temporality = wvAxis<wvTemporality>::variable(wvTypeVarId{1});
        wvCanonicalType const signal = wvSignalType(wvPayload::Vec2);

        wvCanonicalType forward;
        wvCanonicalType backward;
        wvAxisConflict conflict;
        CHECK_FALSE(wvUnifyType(field, signal, forward, &conflict));
        CHECK(conflict.axis == wvAxisName::Cardinality);
        CHECK_FALSE(wvUnifyType(signal, field, backward, &conflict));
        CHECK(conflict.axis == wvAxisName::Cardinality);

        wvCanonicalType const continuousField = wvFieldType(wvPayload::Vec2, wvInstanceId{3});
        REQUIRE(wvUnifyType(field, continuousField, forward));
        REQUIRE(wvUnifyType(continuousField, field, backward));
        CHECK(forward.extent.temporality == backward.extent.temporality);
        CHECK(forward.extent.cardinality == backward.extent.cardinality);
    }
}

TEST_CASE("Hsv conversion", "[types]")
{
    float rgba[4] = {};

    wvHsvToRgb(0.f, 1.f, 1.f, rgba);
    CHECK(rgba[0] == 1.f);
    CHECK(rgba[1] == 0.f);
    CHECK(rgba[2] == 0.f);
    CHECK(rgba[3] == 1.f);

    wvHsvToRgb(1.f / 3.f, 1.f, 1.f, rgba);
    CHECK(rgba[0] == Catch::Approx(0.f).margin(1e-5));
    CHECK(rgba[1] == Catch::Approx(1.f));

    // hue wraps, and a hue that is not a number reads as zero
    float wrapped[4] = {};
    wvHsvToRgb(-2.f / 3.f, 1.f, 1.f, wrapped);
    CHECK(wrapped[1] == Catch::Approx(1.f));

    float const invalid[] = {std::numeric_limits<float>::quiet_NaN(), std::numeric_limits<float>::infinity(),
        -std::numeric_limits<float>::infinity()};
    for (float const hue : invalid)
    {
        wvHsvToRgb(hue, 1.f, 0.5f, rgba);
        CHECK(rgba[0] == 0.5f);
        CHECK(rgba[1] == 0.f);
        CHECK(rgba[2] == 0.f);
    }
}

TEST_CASE("Operator arity", "[types]")
{
    CHECK(wvOpArity(wvOpCode::Neg) == 1);
    CHECK(wvOpArity(wvOpCode::Component) == 1);
    CHECK(wvOpArity(wvOpCode::Add) == 2);
    CHECK(wvOpArity(wvOpCode::Equal) == 2);
    CHECK(wvOpArity(wvOpCode::Mix) == 3);
    CHECK(wvOpArity(wvOpCode::HsvToRgb) == 3);
    CHECK(wvOpArity(wvOpCode::Pack) == 0);
}

TEST_CASE("Stable ids", "[types]")
{
    constexpr wvNodeId node{42};

    CHECK(wvMakeStableId(node, "state") == wvMakeStableId(node, "state"));
    CHECK_FALSE(wvMakeStableId(node, "state") == wvMakeStableId(node, "other"));
    CHECK_FALSE(wvMakeStableId(node, "state") == wvMakeStableId(wvNodeId{43}, "state"));

    char const key[] = "state-and-more";
    CHECK(wvMakeStableId(node, key, key + 5) == wvMakeStableId(node, "state"));
}

TEST_CASE("Diagnostics", "[types]")
{
    CHECK(std::string(wvPayloadName(wvPayload::Vec2)) == "vec2");
    CHECK(std::string(wvCompileErrorName(wvCompileErrorCode::NoAdapterFound)) == "NoAdapterFound");
    CHECK(std::string(wvRuntimeErrorName(wvRuntimeErrorCode::PhaseViolation)) == "PhaseViolation");

    wvCompileError const error{
        .code = wvCompileErrorCode::VarargConnectionCount,
        .nodeId = wvNodeId{0x10},
        .port = wvInputPortIndex{0},
        .count = 0,
    };
    std::string const text = wvDescribeError(error);
    CHECK(text.find("VarargConnectionCount") != std::string::npos);
    CHECK(text.find("0 connections") != std::string::npos);
}
