#include <any>
#include <cmath>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "lunar/runtime.hpp"
#include "lunar/type_system.hpp"
#include "test_support.hpp"

using lunar::CallbackResult;
using lunar::CallContext;
using lunar::Constant;
using lunar::OpCode;
using lunar::StepStatus;
using lunar::Value;
using namespace lunar::test;

namespace {

// return <name>
std::shared_ptr<const lunar::Prototype> readGlobal(const std::string& name) {
    return makeMain({Constant::String(name)}, {
        I(OpCode::GetTabUp, 0, 0, K(0)),
        I(OpCode::Return, 0, 2),
    });
}

// local x = ...; return x * 2
std::shared_ptr<const lunar::Prototype> doubler() {
    return makeMain({Constant::Integer(2)}, {
        I(OpCode::VarArg, 0, 2),
        I(OpCode::Mul, 0, 0, K(0)),
        I(OpCode::Return, 0, 2),
    });
}

// local a, b = ...; return a == b
std::shared_ptr<const lunar::Prototype> equalityCheck() {
    return makeMain({}, {
        I(OpCode::VarArg, 0, 3),
        I(OpCode::Eq, 1, 0, 1),
        I(OpCode::LoadBool, 2, 1, 1),
        I(OpCode::LoadBool, 2, 0, 0),
        I(OpCode::Return, 2, 2),
    });
}

// local u = ...; return u.size
std::shared_ptr<const lunar::Prototype> readSize() {
    return makeMain({Constant::String("size")}, {
        I(OpCode::VarArg, 0, 2),
        I(OpCode::GetTable, 1, 0, K(0)),
        I(OpCode::Return, 1, 2),
    });
}

} // namespace

TEST(RuntimeBinding, TypedFunctionsConvertArgumentsAndResults) {
    lunar::Runtime runtime;
    runtime.bind("hypot", [](double a, double b) { return std::sqrt(a * a + b * b); });
    runtime.bind("rep", [](std::string text, std::int64_t count) {
        std::string out;
        for (std::int64_t i = 0; i < count; ++i) {
            out += text;
        }
        return out;
    });

    auto result = runtime.call(runtime.getGlobal("hypot"), {Value::Integer(3), Value::Integer(4)});
    ASSERT_EQ(result.status, StepStatus::Finished) << result.message;
    EXPECT_EQ(render(result.values), strings({"5.0"}));

    result = runtime.call(runtime.getGlobal("rep"), {runtime.createString("ab"), Value::Integer(3)});
    ASSERT_EQ(result.status, StepStatus::Finished) << result.message;
    EXPECT_EQ(render(result.values), strings({"ababab"}));
}

TEST(RuntimeBinding, BadArgumentsNameTheFunction) {
    lunar::Runtime runtime;
    runtime.bind("hypot", [](double a, double b) { return std::sqrt(a * a + b * b); });
    runtime.bind("rep", [](std::string text, std::int64_t count) { return text + std::to_string(count); });

    auto result = runtime.call(runtime.getGlobal("hypot"), {runtime.createString("x"), Value::Integer(4)});
    ASSERT_EQ(result.status, StepStatus::Errored);
    EXPECT_EQ(result.message, "bad argument #1 to 'hypot' (number expected, got string)");

    result = runtime.call(runtime.getGlobal("rep"), {runtime.createString("a"), Value::Float(1.5)});
    ASSERT_EQ(result.status, StepStatus::Errored);
    EXPECT_EQ(result.message, "bad argument #2 to 'rep' (number has no integer representation)");

    result = runtime.call(runtime.getGlobal("rep"), {runtime.createTable(), Value::Integer(1)});
    ASSERT_EQ(result.status, StepStatus::Errored);
    EXPECT_EQ(result.message, "bad argument #1 to 'rep' (string expected, got table)");
}

TEST(RuntimeBinding, VoidFunctionsReturnNothing) {
    lunar::Runtime runtime;
    std::int64_t total = 0;
    runtime.bind("accumulate", [&total](std::int64_t amount) { total += amount; });

    const Value accumulate = runtime.getGlobal("accumulate");
    EXPECT_TRUE(runtime.call(accumulate, {Value::Integer(5)}).values.empty());
    runtime.call(accumulate, {Value::Integer(7)});
    EXPECT_EQ(total, 12);
}

TEST(RuntimeBinding, NativeCallbacksCanCallBackIntoScripts) {
    lunar::Runtime runtime;
    runtime.registerFunction("twice", [](CallContext& ctx, std::vector<Value> args) {
        const Value function = args.at(0);
        std::vector<Value> once = ctx.call(function, {args.at(1)});
        return CallbackResult::Return(ctx.call(function, once));
    });

    const Value fn = runtime.load(doubler());
    const auto result = runtime.call(runtime.getGlobal("twice"), {fn, Value::Integer(5)});
    ASSERT_EQ(result.status, StepStatus::Finished) << result.message;
    EXPECT_EQ(render(result.values), strings({"20"}));
}

TEST(RuntimeGlobals, SetGlobalIsVisibleToScripts) {
    lunar::Runtime runtime;
    runtime.setGlobal("answer", Value::Integer(42));
    EXPECT_EQ(runtime.getGlobal("answer").asInteger(), 42);
    EXPECT_TRUE(runtime.getGlobal("missing").isNil());

    const auto result = runChunk(runtime, readGlobal("answer"));
    ASSERT_EQ(result.status, StepStatus::Finished);
    EXPECT_EQ(render(result.values), strings({"42"}));
}

TEST(RuntimeGlobals, ModulesAreSharedTables) {
    lunar::Runtime runtime;
    const Value module = runtime.defineModule("geo");
    ASSERT_TRUE(module.isTable());
    EXPECT_TRUE(lunar::rawEquals(runtime.defineModule("geo"), module));

    runtime.setModuleField("geo", "origin", Value::Integer(0));
    runtime.bindModuleFunction("geo", "double", [](CallContext&, std::vector<Value> args) {
        return CallbackResult::Return({Value::Integer(args.at(0).asInteger() * 2)});
    });

    // return geo.double(21), geo.origin
    auto chunk = makeMain({Constant::String("geo"), Constant::String("double"), Constant::Integer(21),
                           Constant::String("origin")},
                          {
                              I(OpCode::GetTabUp, 0, 0, K(0)),
                              I(OpCode::GetTable, 1, 0, K(1)),
                              I(OpCode::LoadK, 2, 2),
                              I(OpCode::Call, 1, 2, 2),
                              I(OpCode::GetTable, 2, 0, K(3)),
                              I(OpCode::Return, 1, 3),
                          });
    const auto result = runChunk(runtime, chunk);
    ASSERT_EQ(result.status, StepStatus::Finished) << result.message;
    EXPECT_EQ(render(result.values), strings({"42", "0"}));

    runtime.setGlobal("answer", Value::Integer(1));
    EXPECT_THROW(runtime.defineModule("answer"), std::runtime_error);
}

TEST(RuntimeGlobals, StandardLibraryIsOptional) {
    lunar::RuntimeOptions options;
    options.openStandardLibrary = false;
    lunar::Runtime bare(options);
    EXPECT_TRUE(bare.getGlobal("print").isNil());
    EXPECT_TRUE(bare.getGlobal("math").isNil());

    lunar::Runtime full;
    EXPECT_TRUE(full.getGlobal("print").isFunction());
    EXPECT_TRUE(full.getGlobal("coroutine").isTable());
    EXPECT_TRUE(lunar::rawEquals(full.getGlobal("_G"), full.globals()));
}

TEST(RuntimeLoad, CustomEnvironmentReplacesGlobals) {
    lunar::Runtime runtime;
    runtime.setGlobal("x", Value::Integer(1));
    const Value env = runtime.createTable();
    runtime.addRoot(env);
    env.asTable().set(runtime.heap(), runtime.createString("x"), Value::Integer(7));

    auto result = runtime.call(runtime.load(readGlobal("x"), env));
    ASSERT_EQ(result.status, StepStatus::Finished);
    EXPECT_EQ(render(result.values), strings({"7"}));

    result = runChunk(runtime, readGlobal("x"));
    EXPECT_EQ(render(result.values), strings({"1"}));

    result = runtime.call(runtime.load(readGlobal("print"), env));
    EXPECT_EQ(render(result.values), strings({"nil"}));
}

TEST(RuntimeLoad, MissingPrototypeIsRejected) {
    lunar::Runtime runtime;
    EXPECT_THROW(runtime.load(nullptr), std::runtime_error);
}

TEST(RuntimeRoots, RootedValuesSurviveCollection) {
    lunar::Runtime runtime;
    const Value table = runtime.createTable();
    const lunar::TableObject* object = &table.asTable();
    runtime.addRoot(table);
    runtime.heap().collectFull();
    EXPECT_TRUE(runtime.heap().contains(object));

    runtime.removeRoot(table);
    runtime.heap().collectFull();
    EXPECT_FALSE(runtime.heap().contains(object));
}

TEST(RuntimeRoots, GlobalsAreAlwaysReachable) {
    lunar::Runtime runtime;
    const Value table = runtime.createTable();
    runtime.setGlobal("kept", table);
    runtime.heap().collectFull();
    EXPECT_TRUE(runtime.heap().contains(&table.asTable()));
}

TEST(RuntimeIsolation, RuntimesShareNothing) {
    lunar::Runtime first;
    lunar::Runtime second;
    first.setGlobal("shared", first.createString("first"));

    EXPECT_EQ(first.toString(first.getGlobal("shared")), "first");
    EXPECT_TRUE(second.getGlobal("shared").isNil());
    EXPECT_FALSE(lunar::rawEquals(first.globals(), second.globals()));

    const auto result = runChunk(second, readGlobal("shared"));
    EXPECT_EQ(render(result.values), strings({"nil"}));
}

TEST(RuntimeUserData, IndexHandlerSeesThePayload) {
    lunar::Runtime runtime;
    const Value box = runtime.createUserData(std::int64_t{42});
    runtime.addRoot(box);
    const Value metatable = runtime.createTable();
    metatable.asTable().set(runtime.heap(), runtime.createString("__index"),
                            runtime.createFunction("index", [](CallContext&, std::vector<Value> args) {
                                const auto payload = std::any_cast<std::int64_t>(args.at(0).asUserData().payload());
                                return CallbackResult::Return({Value::Integer(payload)});
                            }));
    runtime.setMetatable(box, metatable);

    auto result = runtime.call(runtime.load(readSize()), {box});
    ASSERT_EQ(result.status, StepStatus::Finished) << result.message;
    EXPECT_EQ(render(result.values), strings({"42"}));

    runtime.setMetatable(box, Value::Nil());
    result = runtime.call(runtime.load(readSize()), {box});
    ASSERT_EQ(result.status, StepStatus::Errored);
    EXPECT_EQ(result.message, "attempt to index a userdata value");
}

TEST(RuntimeUserData, EqualityHandlerComparesDistinctObjects) {
    lunar::Runtime runtime;
    const Value first = runtime.createUserData(std::string("a"));
    const Value second = runtime.createUserData(std::string("b"));
    runtime.addRoot(first);
    runtime.addRoot(second);
    const Value function = runtime.load(equalityCheck());
    runtime.addRoot(function);

    auto result = runtime.call(function, {first, second});
    EXPECT_EQ(render(result.values), strings({"false"}));
    result = runtime.call(function, {first, first});
    EXPECT_EQ(render(result.values), strings({"true"}));

    const Value metatable = runtime.createTable();
    metatable.asTable().set(runtime.heap(), runtime.createString("__eq"),
                            runtime.createFunction("eq", [](CallContext&, std::vector<Value>) {
                                return CallbackResult::Return({Value::Boolean(true)});
                            }));
    runtime.setMetatable(first, metatable);
    runtime.setMetatable(second, metatable);

    result = runtime.call(function, {first, second});
    ASSERT_EQ(result.status, StepStatus::Finished) << result.message;
    EXPECT_EQ(render(result.values), strings({"true"}));
    EXPECT_FALSE(lunar::rawEquals(first, second));
}

TEST(RuntimeUserData, ScriptsReadTheHostMetatable) {
    lunar::Runtime runtime;
    const Value box = runtime.createUserData(3.5);
    runtime.addRoot(box);
    const Value metatable = runtime.createTable();
    runtime.setMetatable(box, metatable);

    auto result = runtime.call(runtime.getGlobal("getmetatable"), {box});
    ASSERT_EQ(result.status, StepStatus::Finished) << result.message;
    ASSERT_EQ(result.values.size(), 1u);
    EXPECT_TRUE(lunar::rawEquals(result.values[0], metatable));

    result = runtime.call(runtime.getGlobal("type"), {box});
    EXPECT_EQ(render(result.values), strings({"userdata"}));

    // setmetatable only accepts tables from scripts.
    result = runtime.call(runtime.getGlobal("setmetatable"), {box, Value::Nil()});
    EXPECT_EQ(result.status, StepStatus::Errored);

    EXPECT_THROW(runtime.setMetatable(Value::Integer(1), metatable), std::runtime_error);
    EXPECT_THROW(runtime.setMetatable(box, Value::Integer(1)), std::runtime_error);
}

TEST(RuntimeUserData, PayloadIsReleasedWithTheObject) {
    lunar::Runtime runtime;
    auto resource = std::make_shared<int>(7);
    std::weak_ptr<int> watch = resource;

    const Value kept = runtime.createUserData(resource);
    runtime.createUserData(std::move(resource));
    runtime.addRoot(kept);
    const Value metatable = runtime.createTable();
    const lunar::TableObject* metatableObject = &metatable.asTable();
    runtime.setMetatable(kept, metatable);

    runtime.heap().collectFull();
    EXPECT_TRUE(runtime.heap().contains(&kept.asUserData()));
    EXPECT_TRUE(runtime.heap().contains(metatableObject));
    EXPECT_FALSE(watch.expired());

    runtime.removeRoot(kept);
    runtime.heap().collectFull();
    EXPECT_FALSE(runtime.heap().contains(metatableObject));
    EXPECT_TRUE(watch.expired());
}

TEST(RuntimeUserData, NativesCanCreateUserData) {
    lunar::Runtime runtime;
    runtime.registerFunction("wrap", [](CallContext& ctx, std::vector<Value> args) {
        return CallbackResult::Return({ctx.createUserData(args.at(0).asInteger())});
    });

    const auto result = runtime.call(runtime.getGlobal("wrap"), {Value::Integer(9)});
    ASSERT_EQ(result.status, StepStatus::Finished) << result.message;
    ASSERT_EQ(result.values.size(), 1u);
    ASSERT_TRUE(result.values[0].isUserData());
    EXPECT_EQ(std::any_cast<std::int64_t>(result.values[0].asUserData().payload()), 9);
}
