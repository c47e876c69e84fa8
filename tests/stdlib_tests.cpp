#include <cmath>
#include <cstdint>
#include <numbers>
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

class StdlibTest : public ::testing::Test {
protected:
    Value global(const std::string& name) { return runtime_.getGlobal(name); }

    Value field(const std::string& module, const std::string& name) {
        return runtime_.getGlobal(module).asTable().get(runtime_.createString(name));
    }

    Value str(const std::string& text) { return runtime_.createString(text); }

    // A table that stays alive across several calls.
    Value rootedTable() {
        const Value table = runtime_.createTable();
        runtime_.addRoot(table);
        return table;
    }

    void setField(const Value& table, const std::string& key, const Value& value) {
        table.asTable().set(runtime_.heap(), str(key), value);
    }

    Value native(const std::string& name, lunar::NativeFunction function) {
        const Value fn = runtime_.createFunction(name, std::move(function));
        runtime_.addRoot(fn);
        return fn;
    }

    lunar::StepResult call(const Value& function, std::vector<Value> args = {}) {
        return runtime_.call(function, std::move(args));
    }

    std::vector<std::string> callOk(const Value& function, std::vector<Value> args = {}) {
        const lunar::StepResult result = runtime_.call(function, std::move(args));
        EXPECT_EQ(result.status, StepStatus::Finished) << result.message;
        return render(result.values);
    }

    std::string callError(const Value& function, std::vector<Value> args = {}) {
        const lunar::StepResult result = runtime_.call(function, std::move(args));
        EXPECT_EQ(result.status, StepStatus::Errored);
        return result.message;
    }

    lunar::Runtime runtime_;
};

CallbackResult echo(CallContext&, std::vector<Value> args) {
    return CallbackResult::Return(std::move(args));
}

} // namespace

// ============================================================================
// math
// ============================================================================

TEST_F(StdlibTest, FloorAndCeilReturnIntegersWhenTheyFit) {
    const auto floor = call(field("math", "floor"), {Value::Float(3.7)});
    ASSERT_EQ(floor.status, StepStatus::Finished);
    ASSERT_TRUE(floor.values.at(0).isInteger());
    EXPECT_EQ(floor.values[0].asInteger(), 3);

    EXPECT_EQ(callOk(field("math", "ceil"), {Value::Float(3.2)}), strings({"4"}));
    EXPECT_EQ(callOk(field("math", "floor"), {Value::Float(-0.5)}), strings({"-1"}));
    EXPECT_EQ(callOk(field("math", "floor"), {Value::Integer(7)}), strings({"7"}));
}

TEST_F(StdlibTest, MaxAndMinKeepTheWinningValue) {
    EXPECT_EQ(callOk(field("math", "max"), {Value::Integer(1), Value::Float(2.5), Value::Integer(2)}),
              strings({"2.5"}));
    EXPECT_EQ(callOk(field("math", "min"), {Value::Integer(3), Value::Integer(1), Value::Integer(2)}),
              strings({"1"}));
    EXPECT_EQ(callError(field("math", "max")), "bad argument to max");
    EXPECT_EQ(callError(field("math", "min"), {Value::Integer(1), str("x")}), "bad argument to min");
}

TEST_F(StdlibTest, ToIntegerAndTypeDistinguishSubtypes) {
    EXPECT_EQ(callOk(field("math", "tointeger"), {Value::Float(3.0)}), strings({"3"}));
    EXPECT_EQ(callOk(field("math", "tointeger"), {Value::Float(3.5)}), strings({"nil"}));
    EXPECT_EQ(callOk(field("math", "tointeger"), {str("8")}), strings({"nil"}));

    EXPECT_EQ(callOk(field("math", "type"), {Value::Integer(1)}), strings({"integer"}));
    EXPECT_EQ(callOk(field("math", "type"), {Value::Float(1.0)}), strings({"float"}));
    EXPECT_EQ(callOk(field("math", "type"), {str("1")}), strings({"nil"}));
}

TEST_F(StdlibTest, ModfSplitsTowardZero) {
    EXPECT_EQ(callOk(field("math", "modf"), {Value::Float(3.5)}), strings({"3", "0.5"}));
    EXPECT_EQ(callOk(field("math", "modf"), {Value::Float(-2.25)}), strings({"-2", "-0.25"}));
}

TEST_F(StdlibTest, RandomStaysInItsInterval) {
    ASSERT_EQ(call(field("math", "randomseed"), {Value::Integer(42)}).status, StepStatus::Finished);
    for (int i = 0; i < 20; ++i) {
        const auto roll = call(field("math", "random"), {Value::Integer(1), Value::Integer(6)});
        ASSERT_EQ(roll.status, StepStatus::Finished);
        EXPECT_GE(roll.values.at(0).asInteger(), 1);
        EXPECT_LE(roll.values.at(0).asInteger(), 6);
    }
    const auto unit = call(field("math", "random"));
    ASSERT_TRUE(unit.values.at(0).isFloat());
    EXPECT_GE(unit.values[0].asFloat(), 0.0);
    EXPECT_LT(unit.values[0].asFloat(), 1.0);

    EXPECT_EQ(callError(field("math", "random"), {Value::Integer(3), Value::Integer(1)}),
              "bad argument to random (interval is empty)");
}

TEST_F(StdlibTest, MathConstantsAndBadArguments) {
    EXPECT_TRUE(field("math", "maxinteger").isInteger());
    EXPECT_DOUBLE_EQ(field("math", "pi").asFloat(), std::numbers::pi);
    EXPECT_TRUE(std::isinf(field("math", "huge").asFloat()));
    EXPECT_EQ(callError(field("math", "floor"), {runtime_.createTable()}), "bad argument to floor");
}

// ============================================================================
// base
// ============================================================================

TEST_F(StdlibTest, SelectCountsAndIndexesFromEitherEnd) {
    const Value select = global("select");
    const Value a = str("a");
    const Value b = str("b");
    const Value c = str("c");
    EXPECT_EQ(callOk(select, {str("#"), a, b, c}), strings({"3"}));
    EXPECT_EQ(callOk(select, {Value::Integer(2), a, b, c}), strings({"b", "c"}));
    EXPECT_EQ(callOk(select, {Value::Integer(-1), a, b, c}), strings({"c"}));
    EXPECT_EQ(callOk(select, {Value::Integer(-3), a, b, c}), strings({"a", "b", "c"}));
    EXPECT_TRUE(callOk(select, {Value::Integer(5), a}).empty());
    EXPECT_EQ(callError(select, {Value::Integer(0), a}), "bad argument #1 to 'select' (index out of range)");
    EXPECT_EQ(callError(select, {Value::Integer(-4), a, b, c}), "bad argument #1 to 'select' (index out of range)");
}

TEST_F(StdlibTest, ToNumberParsesNumeralsAndBases) {
    const Value tonumber = global("tonumber");
    EXPECT_EQ(callOk(tonumber, {str("0x10")}), strings({"16"}));
    EXPECT_EQ(callOk(tonumber, {str("  12  ")}), strings({"12"}));
    EXPECT_EQ(callOk(tonumber, {str("1.5")}), strings({"1.5"}));
    EXPECT_EQ(callOk(tonumber, {str("abc")}), strings({"nil"}));
    EXPECT_EQ(callOk(tonumber, {runtime_.createTable()}), strings({"nil"}));
    EXPECT_EQ(callOk(tonumber, {str("z"), Value::Integer(36)}), strings({"35"}));
    EXPECT_EQ(callOk(tonumber, {str("102"), Value::Integer(2)}), strings({"nil"}));
    EXPECT_EQ(callError(tonumber, {str("ff"), Value::Integer(99)}),
              "bad argument #2 to 'tonumber' (base out of range)");
}

TEST_F(StdlibTest, TypeNamesEveryValue) {
    const Value type = global("type");
    EXPECT_EQ(callOk(type, {Value::Nil()}), strings({"nil"}));
    EXPECT_EQ(callOk(type, {Value::Float(1.5)}), strings({"number"}));
    EXPECT_EQ(callOk(type, {global("print")}), strings({"function"}));
    EXPECT_EQ(callError(type), "bad argument #1 to 'type' (value expected)");
}

TEST_F(StdlibTest, ToStringConsultsTheMetatable) {
    const Value point = rootedTable();
    const Value metatable = rootedTable();
    setField(metatable, "__tostring", native("describe", [](CallContext& ctx, std::vector<Value>) {
        return CallbackResult::Return({ctx.createString("point(1, 2)")});
    }));
    point.asTable().setMetatable(runtime_.heap(), lunar::Handle<lunar::TableObject>(&metatable.asTable()));

    EXPECT_EQ(callOk(global("tostring"), {point}), strings({"point(1, 2)"}));
    EXPECT_EQ(callOk(global("tostring"), {Value::Float(1.5)}), strings({"1.5"}));

    setField(metatable, "__tostring", native("broken", [](CallContext&, std::vector<Value>) {
        return CallbackResult::Return({Value::Integer(1)});
    }));
    EXPECT_EQ(callError(global("tostring"), {point}), "'__tostring' must return a string");
}

TEST_F(StdlibTest, ProtectedMetatablesCannotBeReplaced) {
    const Value object = rootedTable();
    const Value metatable = rootedTable();
    setField(metatable, "__metatable", str("locked"));

    const auto set = call(global("setmetatable"), {object, metatable});
    ASSERT_EQ(set.status, StepStatus::Finished) << set.message;
    EXPECT_TRUE(lunar::rawEquals(set.values.at(0), object));

    EXPECT_EQ(callOk(global("getmetatable"), {object}), strings({"locked"}));
    EXPECT_EQ(callError(global("setmetatable"), {object, runtime_.createTable()}),
              "cannot change a protected metatable");
    EXPECT_EQ(callError(global("setmetatable"), {Value::Integer(1), Value::Nil()}),
              "bad argument #1 to 'setmetatable' (table expected, got number)");
    EXPECT_EQ(callOk(global("getmetatable"), {Value::Integer(1)}), strings({"nil"}));
}

TEST_F(StdlibTest, RawAccessIgnoresMetamethods) {
    const Value object = rootedTable();
    const Value metatable = rootedTable();
    setField(metatable, "__index", native("fallback", [](CallContext& ctx, std::vector<Value>) {
        return CallbackResult::Return({ctx.createString("fallback")});
    }));
    object.asTable().setMetatable(runtime_.heap(), lunar::Handle<lunar::TableObject>(&metatable.asTable()));

    EXPECT_EQ(callOk(global("rawget"), {object, str("missing")}), strings({"nil"}));
    ASSERT_EQ(call(global("rawset"), {object, str("k"), Value::Integer(5)}).status, StepStatus::Finished);
    EXPECT_EQ(callOk(global("rawget"), {object, str("k")}), strings({"5"}));
    EXPECT_EQ(callOk(global("rawlen"), {str("abc")}), strings({"3"}));
    EXPECT_EQ(callOk(global("rawequal"), {object, object}), strings({"true"}));
    EXPECT_EQ(callOk(global("rawequal"), {object, metatable}), strings({"false"}));
}

TEST_F(StdlibTest, IpairsStopsAtTheFirstNil) {
    const Value list = rootedTable();
    list.asTable().set(runtime_.heap(), Value::Integer(1), str("a"));
    list.asTable().set(runtime_.heap(), Value::Integer(2), str("b"));
    list.asTable().set(runtime_.heap(), Value::Integer(4), str("d"));

    const auto start = call(global("ipairs"), {list});
    ASSERT_EQ(start.status, StepStatus::Finished);
    ASSERT_EQ(start.values.size(), 3u);
    const Value step = start.values[0];
    runtime_.addRoot(step);

    EXPECT_EQ(callOk(step, {list, Value::Integer(0)}), strings({"1", "a"}));
    EXPECT_EQ(callOk(step, {list, Value::Integer(1)}), strings({"2", "b"}));
    EXPECT_EQ(callOk(step, {list, Value::Integer(2)}), strings({"nil"}));
}

TEST_F(StdlibTest, AssertPassesValuesThroughOrRaises) {
    const Value assertFn = global("assert");
    EXPECT_EQ(callOk(assertFn, {Value::Integer(1), str("unused")}), strings({"1", "unused"}));
    EXPECT_EQ(callError(assertFn, {Value::Nil()}), "assertion failed!");
    EXPECT_EQ(callError(assertFn, {Value::Boolean(false), str("custom")}), "custom");
}

TEST_F(StdlibTest, PcallReportsSuccessAndFailure) {
    const Value pcall = global("pcall");
    EXPECT_EQ(callOk(pcall, {native("echo", echo), Value::Integer(1), Value::Integer(2)}),
              strings({"true", "1", "2"}));
    EXPECT_EQ(callOk(pcall, {global("error"), str("boom")}), strings({"false", "boom"}));
    EXPECT_EQ(callOk(pcall, {Value::Nil()}), strings({"false", "attempt to call a nil value"}));
    EXPECT_EQ(callError(pcall), "bad argument #1 to 'pcall' (value expected)");
}

TEST_F(StdlibTest, PcallPreservesNonStringErrors) {
    const Value payload = rootedTable();
    const auto result = call(global("pcall"), {global("error"), payload});
    ASSERT_EQ(result.status, StepStatus::Finished);
    ASSERT_EQ(result.values.size(), 2u);
    EXPECT_TRUE(lunar::rawEquals(result.values[1], payload));
}

TEST_F(StdlibTest, XpcallHandsTheErrorToTheHandler) {
    const Value handler = native("handler", [](CallContext& ctx, std::vector<Value> args) {
        return CallbackResult::Return({ctx.createString("handled: " + ctx.toString(args.at(0)))});
    });
    const Value xpcall = global("xpcall");
    EXPECT_EQ(callOk(xpcall, {global("error"), handler, str("boom")}), strings({"false", "handled: boom"}));
    EXPECT_EQ(callOk(xpcall, {native("echo", echo), handler, Value::Integer(5)}), strings({"true", "5"}));
    EXPECT_EQ(callError(xpcall, {native("echo", echo)}), "bad argument #2 to 'xpcall' (value expected)");
}

TEST_F(StdlibTest, ErrorAddsThePositionOfTheCaller) {
    // line 3: error("boom")
    ProtoSpec chunk;
    chunk.vararg = true;
    chunk.constants = {Constant::String("error"), Constant::String("boom")};
    chunk.upvalues = {envUpvalue()};
    chunk.code = {
        I(OpCode::GetTabUp, 0, 0, K(0)),
        I(OpCode::LoadK, 1, 1),
        I(OpCode::Call, 0, 2, 1),
        I(OpCode::Return, 0, 1),
    };
    chunk.lines = {2, 3, 3, 4};

    const auto result = runChunk(runtime_, makeProto(chunk));
    ASSERT_EQ(result.status, StepStatus::Errored);
    EXPECT_EQ(result.message, "test.lua:3: boom");
}

TEST_F(StdlibTest, ErrorLevelSelectsTheFrame) {
    // function fail(level) error("deep", level) end
    ProtoSpec fail;
    fail.name = "fail";
    fail.params = 1;
    fail.registers = 4;
    fail.constants = {Constant::String("error"), Constant::String("deep")};
    fail.upvalues = {parentUpvalue(0, "_ENV")};
    fail.code = {
        I(OpCode::GetTabUp, 1, 0, K(0)),
        I(OpCode::LoadK, 2, 1),
        I(OpCode::Move, 3, 0),
        I(OpCode::Call, 1, 3, 1),
        I(OpCode::Return, 0, 1),
    };
    fail.lines = {10, 10, 10, 10, 11};

    // pcall(fail, 2); pcall(fail, 0) from line 5 and 6
    ProtoSpec caller;
    caller.vararg = true;
    caller.constants = {Constant::String("pcall"), Constant::Integer(2), Constant::Integer(0)};
    caller.upvalues = {envUpvalue()};
    caller.children = {makeProto(fail)};
    caller.code = {
        I(OpCode::Closure, 0, 0),
        I(OpCode::GetTabUp, 1, 0, K(0)),
        I(OpCode::Move, 2, 0),
        I(OpCode::LoadK, 3, 1),
        I(OpCode::Call, 1, 3, 3),
        I(OpCode::GetTabUp, 3, 0, K(0)),
        I(OpCode::Move, 4, 0),
        I(OpCode::LoadK, 5, 2),
        I(OpCode::Call, 3, 3, 3),
        I(OpCode::Move, 1, 2),
        I(OpCode::Move, 2, 4),
        I(OpCode::Return, 1, 3),
    };
    caller.lines = {4, 5, 5, 5, 5, 6, 6, 6, 6, 7, 7, 7};

    const auto result = runChunk(runtime_, makeProto(caller));
    ASSERT_EQ(result.status, StepStatus::Finished) << result.message;
    EXPECT_EQ(render(result.values), strings({"test.lua:5: deep", "deep"}));
}

TEST_F(StdlibTest, CollectGarbageCollectsAtTheNextSafePoint) {
    const Value collectgarbage = global("collectgarbage");
    const auto count = call(collectgarbage, {str("count")});
    ASSERT_EQ(count.status, StepStatus::Finished);
    ASSERT_TRUE(count.values.at(0).isInteger());
    EXPECT_GT(count.values[0].asInteger(), 0);

    const std::size_t before = runtime_.heap().stats().cyclesCompleted;
    EXPECT_EQ(callOk(collectgarbage), strings({"0"}));
    EXPECT_GT(runtime_.heap().stats().cyclesCompleted, before);

    EXPECT_EQ(callError(collectgarbage, {str("bogus")}),
              "bad argument #1 to 'collectgarbage' (invalid option 'bogus')");
}

// ============================================================================
// coroutine
// ============================================================================

TEST_F(StdlibTest, ResumeReportsStatusAndValues) {
    // yield(x + 1); return "done"
    ProtoSpec body;
    body.name = "worker";
    body.params = 1;
    body.registers = 3;
    body.constants = {Constant::Integer(1), Constant::String("done")};
    body.code = {
        I(OpCode::Add, 1, 0, K(0)),
        I(OpCode::Yield, 1, 2, 1),
        I(OpCode::LoadK, 1, 1),
        I(OpCode::Return, 1, 2),
    };

    const auto created = call(field("coroutine", "create"), {runtime_.load(makeProto(body))});
    ASSERT_EQ(created.status, StepStatus::Finished) << created.message;
    const Value thread = created.values.at(0);
    ASSERT_TRUE(thread.isThread());
    runtime_.addRoot(thread);

    const Value resume = field("coroutine", "resume");
    const Value status = field("coroutine", "status");
    EXPECT_EQ(callOk(status, {thread}), strings({"suspended"}));
    EXPECT_EQ(callOk(resume, {thread, Value::Integer(41)}), strings({"true", "42"}));
    EXPECT_EQ(callOk(status, {thread}), strings({"suspended"}));
    EXPECT_EQ(callOk(resume, {thread}), strings({"true", "done"}));
    EXPECT_EQ(callOk(status, {thread}), strings({"dead"}));
    EXPECT_EQ(callOk(resume, {thread}), strings({"false", "cannot resume dead coroutine"}));
    EXPECT_EQ(callError(resume, {Value::Integer(1)}), "bad argument #1 to 'resume' (coroutine expected)");
}

TEST_F(StdlibTest, ResumeCatchesErrorsInsideTheCoroutine) {
    auto body = makeMain({Constant::String("error"), Constant::String("inner")}, {
        I(OpCode::GetTabUp, 0, 0, K(0)),
        I(OpCode::LoadK, 1, 1),
        I(OpCode::Call, 0, 2, 1),
        I(OpCode::Return, 0, 1),
    });
    const auto created = call(field("coroutine", "create"), {runtime_.load(body)});
    const Value thread = created.values.at(0);
    runtime_.addRoot(thread);

    EXPECT_EQ(callOk(field("coroutine", "resume"), {thread}), strings({"false", "inner"}));
    EXPECT_EQ(callOk(field("coroutine", "status"), {thread}), strings({"dead"}));
}

TEST_F(StdlibTest, WrapReturnsValuesAndRaisesOnDeath) {
    ProtoSpec body;
    body.name = "counter";
    body.registers = 2;
    body.constants = {Constant::Integer(1), Constant::Integer(2)};
    body.code = {
        I(OpCode::LoadK, 0, 0),
        I(OpCode::Yield, 0, 2, 1),
        I(OpCode::LoadK, 0, 1),
        I(OpCode::Return, 0, 2),
    };

    const auto wrapped = call(field("coroutine", "wrap"), {runtime_.load(makeProto(body))});
    ASSERT_EQ(wrapped.status, StepStatus::Finished) << wrapped.message;
    const Value next = wrapped.values.at(0);
    ASSERT_TRUE(next.isFunction());
    runtime_.addRoot(next);

    EXPECT_EQ(callOk(next), strings({"1"}));
    EXPECT_EQ(callOk(next), strings({"2"}));
    EXPECT_EQ(callError(next), "cannot resume dead coroutine");
    EXPECT_EQ(callError(field("coroutine", "wrap"), {Value::Integer(1)}),
              "bad argument #1 to 'wrap' (function expected)");
}

TEST_F(StdlibTest, RunningAndYieldableDependOnTheThread) {
    // local co = coroutine; return co.status(co.running()), co.isyieldable()
    auto probe = makeMain(
        {Constant::String("coroutine"), Constant::String("status"), Constant::String("running"),
         Constant::String("isyieldable")},
        {
            I(OpCode::GetTabUp, 0, 0, K(0)),
            I(OpCode::GetTable, 1, 0, K(1)),
            I(OpCode::GetTable, 2, 0, K(2)),
            I(OpCode::Call, 2, 1, 2),
            I(OpCode::Call, 1, 2, 2),
            I(OpCode::GetTable, 2, 0, K(3)),
            I(OpCode::Call, 2, 1, 2),
            I(OpCode::Return, 1, 3),
        });

    const auto onMain = runChunk(runtime_, probe);
    ASSERT_EQ(onMain.status, StepStatus::Finished) << onMain.message;
    EXPECT_EQ(render(onMain.values), strings({"running", "false"}));

    const Value thread = runtime_.createThread(runtime_.load(probe));
    runtime_.addRoot(thread);
    const auto inside = runtime_.resume(thread);
    ASSERT_EQ(inside.status, lunar::ResumeStatus::Returned) << inside.message;
    EXPECT_EQ(render(inside.values), strings({"running", "true"}));

    const auto running = call(field("coroutine", "running"));
    ASSERT_EQ(running.values.size(), 2u);
    EXPECT_TRUE(running.values[0].isThread());
    EXPECT_EQ(render({running.values[1]}), strings({"true"}));
}

TEST_F(StdlibTest, YieldAcrossANativeCallIsAnError) {
    runtime_.registerFunction("callback", [](CallContext& ctx, std::vector<Value> args) {
        return CallbackResult::Return(ctx.call(args.at(0), {}));
    });

    // callback(coroutine.yield)
    auto body = makeMain({Constant::String("callback"), Constant::String("coroutine"), Constant::String("yield")}, {
        I(OpCode::GetTabUp, 0, 0, K(0)),
        I(OpCode::GetTabUp, 1, 0, K(1)),
        I(OpCode::GetTable, 1, 1, K(2)),
        I(OpCode::Call, 0, 2, 1),
        I(OpCode::Return, 0, 1),
    });
    const Value thread = runtime_.createThread(runtime_.load(body));
    runtime_.addRoot(thread);

    const auto result = runtime_.resume(thread);
    ASSERT_EQ(result.status, lunar::ResumeStatus::Errored);
    EXPECT_FALSE(result.protocolViolation);
    EXPECT_NE(result.message.find("attempt to yield across a native call boundary"), std::string::npos)
        << result.message;
    EXPECT_EQ(thread.asThread().status(), lunar::ThreadStatus::Dead);
}
