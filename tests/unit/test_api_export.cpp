// File: tests/unit/test_api_export.cpp
// Purpose: Exercise the public export and cast entry points end to end.
// Key invariants: Fallible forms report diagnostics and never throw for
//                 unsupported input; throwing forms prefix the diagnostic with
//                 the operation and the input's type.
// Ownership/Lifetime: Uses the shared default exporters.
// Links: DESIGN.md#api

#include <gtest/gtest.h>

#include "litexport/Export.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace litexport;
using core::Type;
using core::TypeRef;
using core::Value;

namespace
{
TypeRef basic(Type::Kind k)
{
    return Type::basic(k);
}

TypeRef any()
{
    return Type::interfaceOf();
}

TypeRef doer()
{
    return Type::interfaceOf({"Do()"});
}

Value anySlice(std::vector<Value> elems)
{
    return Value::sequence(Type::slice(any()), std::move(elems));
}

/// Expected outcome of one export scenario.
struct Scenario
{
    const char *label;
    Value input;
    std::string output; ///< Literal on success
    std::string error;  ///< Diagnostic message on failure
};

void expectExport(const Scenario &s)
{
    SCOPED_TRACE(s.label);
    auto out = exportValue(s.input);
    if (s.error.empty())
    {
        ASSERT_TRUE(out) << out.error().message;
        EXPECT_EQ(out.value(), s.output);
        EXPECT_EQ(mustExport(s.input), s.output);
        return;
    }

    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().message, s.error);
    try
    {
        (void)mustExport(s.input);
        ADD_FAILURE() << "mustExport did not throw";
    }
    catch (const ExportFailure &e)
    {
        EXPECT_EQ(std::string(e.what()),
                  "cannot export " + core::typeName(s.input) + " to string: " + s.error);
        EXPECT_EQ(e.diagnostic().message, s.error);
    }
}
} // namespace

TEST(ApiExport, Scalars)
{
    auto myString = Type::named("exporter", "myString", basic(Type::Kind::String));
    auto myInt = Type::named("exporter", "myInt", basic(Type::Kind::Int));
    auto myBool = Type::named("exporter", "myBool", basic(Type::Kind::Bool));

    const Scenario scenarios[] = {
        {"nil", Value::absent(), "nil", ""},
        {"false", core::toValue(false), "false", ""},
        {"true", core::toValue(true), "true", ""},
        {"int", core::toValue(123), "int(123)", ""},
        {"string", core::toValue("hello world"), "\"hello world\"", ""},
        {"bytes",
         Value::bytes("hello world \xe4\xbd\xa0\xe5\xa5\xbd\xef\xbc\x8c\xe4\xb8\x96\xe7\x95\x8c"),
         "[]byte(\"hello world \\u4f60\\u597d\\uff0c\\u4e16\\u754c\")", ""},
        {"struct", Value::opaque(Type::structOf()), "", "type struct {} is not supported"},
        {"pointer", Value::opaque(Type::pointer(Type::named("testing", "T", Type::structOf()))),
         "", "type *testing.T is not supported"},
        {"named string", Value::text("foo", myString), "",
         "type exporter.myString is not supported"},
        {"named int", Value::signedInt(myInt, 5), "", "type exporter.myInt is not supported"},
        {"named bool", Value::boolean(true, myBool), "", "type exporter.myBool is not supported"},
        {"float32", core::toValue(3.1416f), "float32(3.1416)", ""},
    };
    for (const auto &s : scenarios)
        expectExport(s);
}

TEST(ApiExport, Sequences)
{
    const Scenario scenarios[] = {
        {"mixed", anySlice({core::toValue(1), core::toValue("2"), core::toValue(3.14)}),
         "[]interface{}{int(1), \"2\", float64(3.14)}", ""},
        {"empty any", anySlice({}), "make([]interface{}, 0)", ""},
        {"nil any", Value::nilSequence(Type::slice(any())), "([]interface{})(nil)", ""},
        {"ints", core::toValue(std::vector<int>{1, 2, 3, -1000000}),
         "[]int{int(1), int(2), int(3), int(-1000000)}", ""},
        {"nil ints", core::toValue(std::optional<std::vector<int>>{}), "([]int)(nil)", ""},
        {"uints", core::toValue(std::vector<unsigned>{1, 2, 3}),
         "[]uint{uint(1), uint(2), uint(3)}", ""},
        {"empty floats", core::toValue(std::vector<float>{}), "make([]float32, 0)", ""},
        {"nested nil",
         anySlice({core::toValue(std::optional<std::vector<unsigned>>{}),
                   core::toValue(std::vector<int>{1, 2, 3})}),
         "[]interface{}{([]uint)(nil), []int{int(1), int(2), int(3)}}", ""},
        {"nil inner",
         core::toValue(std::vector<std::optional<std::vector<int>>>{
             std::nullopt, std::vector<int>{1, 2, 3}}),
         "[][]int{([]int)(nil), []int{int(1), int(2), int(3)}}", ""},
        {"three nils", anySlice({Value::absent(), Value::absent(), Value::absent()}),
         "[]interface{}{nil, nil, nil}", ""},
        {"mixed widths",
         anySlice({Value::signedInt(basic(Type::Kind::Int32), 1),
                   Value::signedInt(basic(Type::Kind::Int64), 2), core::toValue(3.14f),
                   core::toValue("hello world")}),
         "[]interface{}{int32(1), int64(2), float32(3.14), \"hello world\"}", ""},
        {"invalid utf8 bytes", core::toValue(std::vector<std::uint8_t>{0xff}),
         "[]uint8{uint8(255)}", ""},
    };
    for (const auto &s : scenarios)
        expectExport(s);
}

TEST(ApiExport, Arrays)
{
    const Scenario scenarios[] = {
        {"mixed",
         core::toValue(std::array<Value, 3>{core::toValue(1), core::toValue("2"),
                                            core::toValue(3.14)}),
         "[3]interface{}{int(1), \"2\", float64(3.14)}", ""},
        {"placeholders",
         core::toValue(std::array<Value, 3>{Value::absent(), core::toValue(1.5),
                                            core::toValue("hello world")}),
         "[3]interface{}{nil, float64(1.5), \"hello world\"}", ""},
        {"zero any", Value::zero(Type::array(3, any())), "[3]interface{}{nil, nil, nil}", ""},
        {"empty any", Value::zero(Type::array(0, any())), "[0]interface{}{}", ""},
        {"ints", core::toValue(std::array<int, 3>{1, 2, 3}), "[3]int{int(1), int(2), int(3)}",
         ""},
        {"uints", core::toValue(std::array<unsigned, 3>{1, 2, 3}),
         "[3]uint{uint(1), uint(2), uint(3)}", ""},
        {"empty ints", core::toValue(std::array<int, 0>{}), "[0]int{}", ""},
        {"empty uints", core::toValue(std::array<unsigned, 0>{}), "[0]uint{}", ""},
        {"empty floats", core::toValue(std::array<float, 0>{}), "[0]float32{}", ""},
        {"empty nested", Value::zero(Type::array(0, Type::slice(Type::slice(any())))),
         "[0][][]interface{}{}", ""},
    };
    for (const auto &s : scenarios)
        expectExport(s);
}

TEST(ApiExport, MultidimensionalContainers)
{
    using Grid = std::vector<std::vector<int>>;

    // [][2][][]int{{{{1, 2}}, nil}}
    const Value deep = core::toValue(
        std::vector<std::array<std::optional<Grid>, 2>>{{Grid{{1, 2}}, std::nullopt}});
    // [2][][]int{nil, {{1, 2, 3}}}
    const Value pair =
        core::toValue(std::array<std::optional<Grid>, 2>{std::nullopt, Grid{{1, 2, 3}}});
    const TypeRef anyCube = Type::slice(Type::slice(Type::slice(any())));

    const Scenario scenarios[] = {
        {"deep", deep,
         "[][2][][]int{[2][][]int{[][]int{[]int{int(1), int(2)}}, ([][]int)(nil)}}", ""},
        {"pair", pair, "[2][][]int{([][]int)(nil), [][]int{[]int{int(1), int(2), int(3)}}}", ""},
        {"mixed", anySlice({core::toValue(Grid{{1, 2}, {3, 4}}), Value::nilSequence(anyCube)}),
         "[]interface{}{[][]int{[]int{int(1), int(2)}, []int{int(3), int(4)}}, "
         "([][][]interface{})(nil)}",
         ""},
        {"nil nested",
         Value::nilSequence(Type::slice(Type::array(2, Type::slice(Type::slice(any()))))),
         "([][2][][]interface{})(nil)", ""},
    };
    for (const auto &s : scenarios)
        expectExport(s);
}

TEST(ApiExport, UnsupportedContainers)
{
    const Value intPtr = Value::opaque(Type::pointer(basic(Type::Kind::Int)));
    const TypeRef anySliceT = Type::slice(any());

    const Scenario scenarios[] = {
        {"struct element", anySlice({Value::opaque(Type::structOf())}), "",
         "cannot export ([]interface{})[0]: type struct {} is not supported"},
        {"struct in array",
         Value::array(Type::array(1, any()), {Value::opaque(Type::structOf())}), "",
         "cannot export ([1]interface{})[0]: type struct {} is not supported"},
        {"pointer element", anySlice({intPtr}), "",
         "cannot export ([]interface{})[0]: type *int is not supported"},
        {"pointer nested",
         Value::sequence(Type::slice(anySliceT), {Value::nilSequence(anySliceT),
                                                  Value::nilSequence(anySliceT),
                                                  anySlice({intPtr})}),
         "",
         "cannot export ([][]interface{})[2]: cannot export ([]interface{})[0]: type *int is "
         "not supported"},
        {"doer slice",
         Value::sequence(Type::slice(doer()), {Value::absent(), Value::absent(), Value::absent()}),
         "", "type []interface { Do() } is not supported"},
        {"doer single", Value::sequence(Type::slice(doer()), {Value::absent()}), "",
         "type []interface { Do() } is not supported"},
        {"doer array", Value::zero(Type::array(3, doer())), "",
         "type [3]interface { Do() } is not supported"},
    };
    for (const auto &s : scenarios)
        expectExport(s);
}

TEST(ApiExport, PointerLoop)
{
    Value a = anySlice({Value::absent(), Value::absent()});
    a.elements()[1] = a;

    auto out = exportValue(a);
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().message, "cannot export ([]interface{})[1]: unexpected infinite loop");
    EXPECT_EQ(out.error().cause, support::ErrorKind::InfiniteLoop);
    EXPECT_THROW((void)mustExport(a), ExportFailure);

    a.elements()[1] = Value::absent();
}

TEST(ApiExport, HostValueOverloads)
{
    EXPECT_EQ(mustExport(5), "int(5)");
    EXPECT_EQ(mustExport(nullptr), "nil");
    EXPECT_EQ(mustExport(std::string("hello world")), "\"hello world\"");
    EXPECT_EQ(mustExport(std::vector<std::string>{"a", "b"}), "[]string{\"a\", \"b\"}");
    auto out = exportValue(std::vector<Value>{});
    ASSERT_TRUE(out);
    EXPECT_EQ(out.value(), "make([]interface{}, 0)");
}

TEST(ApiExport, LargeFloatsUseShortestDigits)
{
    EXPECT_EQ(mustExport(1e23), "float64(100000000000000000000000)");
    EXPECT_EQ(mustExport(3e10f), "float32(30000000000)");
}

TEST(ApiExport, ConcurrentCallsAreIndependent)
{
    Value v = core::toValue(std::vector<std::vector<int>>{{1, 2}, {3}});
    std::vector<std::thread> workers;
    std::vector<std::string> results(8);
    for (std::size_t i = 0; i < results.size(); ++i)
        workers.emplace_back([&, i] { results[i] = mustExport(v); });
    for (auto &w : workers)
        w.join();
    for (const auto &r : results)
        EXPECT_EQ(r, "[][]int{[]int{int(1), int(2)}, []int{int(3)}}");
}

TEST(ApiCast, Scenarios)
{
    struct CastScenario
    {
        Value input;
        std::string output;
        std::string error;
    };

    const CastScenario scenarios[] = {
        {core::toValue(true), "true", ""},
        {core::toValue(false), "false", ""},
        {Value::absent(), "nil", ""},
        {Value::opaque(Type::structOf()), "", "type struct {} is not supported"},
        {core::toValue("Bernhard Riemann"), "Bernhard Riemann", ""},
        {core::toValue("hello world"), "hello world", ""},
        {core::toValue(5), "5", ""},
        {core::toValue(3.14), "3.14", ""},
        {Value::signedInt(basic(Type::Kind::Int), 10000000000LL), "10000000000", ""},
        {core::toValue(10000000000.0), "10000000000", ""},
        {core::toValue(10000000000.0f), "10000000000", ""},
        {core::toValue(3.1416f), "3.1416", ""},
        {core::toValue(std::vector<int>{1}), "", "type []int is not supported"},
        {Value::bytes("abc"), "", "type []uint8 is not supported"},
        {Value::text("foo", Type::named("exporter", "myString", basic(Type::Kind::String))), "",
         "type exporter.myString is not supported"},
    };

    for (const auto &s : scenarios)
    {
        SCOPED_TRACE(core::typeName(s.input));
        auto out = castToString(s.input);
        if (s.error.empty())
        {
            ASSERT_TRUE(out) << out.error().message;
            EXPECT_EQ(out.value(), s.output);
            EXPECT_EQ(mustCastToString(s.input), s.output);
            continue;
        }

        ASSERT_FALSE(out);
        EXPECT_EQ(out.error().message, s.error);
        try
        {
            (void)mustCastToString(s.input);
            ADD_FAILURE() << "mustCastToString did not throw";
        }
        catch (const ExportFailure &e)
        {
            EXPECT_EQ(std::string(e.what()),
                      "cannot cast " + core::typeName(s.input) + " to string: " + s.error);
        }
    }
}

TEST(ApiCast, HostValueOverloads)
{
    EXPECT_EQ(mustCastToString("hello world"), "hello world");
    EXPECT_EQ(mustCastToString(false), "false");
    EXPECT_EQ(mustCastToString(nullptr), "nil");
    EXPECT_EQ(mustCastToString(3.1416f), "3.1416");
    EXPECT_THROW((void)mustCastToString(std::vector<int>{}), ExportFailure);
}

TEST(ApiExport, ExporterSupportsChecksTopLevelOnly)
{
    EXPECT_TRUE(defaultExporter().supports(core::toValue(1)));
    EXPECT_FALSE(defaultExporter().supports(Value::opaque(Type::structOf())));
    // Elements are only inspected while rendering.
    EXPECT_TRUE(defaultExporter().supports(anySlice({Value::opaque(Type::structOf())})));
    EXPECT_TRUE(defaultExporter().options().explicitTypes);

    EXPECT_TRUE(defaultCaster().supports(Value::absent()));
    EXPECT_FALSE(defaultCaster().supports(core::toValue(std::vector<int>{1})));
    EXPECT_FALSE(defaultCaster().options().composites);
}
