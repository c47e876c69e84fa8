#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include <system_error>

#include <gtest/gtest.h>

#include "lunar/chunk_io.hpp"
#include "lunar/runtime.hpp"
#include "test_support.hpp"

using lunar::Constant;
using lunar::OpCode;
using lunar::StepStatus;
using namespace lunar::test;

namespace fs = std::filesystem;

namespace {

// local base = 0.5; local function add(x) return base + x end
// return add(2), "say \"hi\"\n"
std::shared_ptr<const lunar::Prototype> closureProgram() {
    ProtoSpec add;
    add.name = "add";
    add.params = 1;
    add.registers = 2;
    add.upvalues = {parentLocal(0, "base")};
    add.code = {
        I(OpCode::GetUpval, 1, 0),
        I(OpCode::Add, 1, 1, 0),
        I(OpCode::Return, 1, 2),
    };

    ProtoSpec chunk;
    chunk.vararg = true;
    chunk.registers = 4;
    chunk.constants = {Constant::Float(0.5), Constant::Integer(2), Constant::String("say \"hi\"\n"),
                       Constant::Boolean(true), Constant::Nil()};
    chunk.upvalues = {envUpvalue()};
    chunk.children = {makeProto(add)};
    chunk.code = {
        I(OpCode::LoadK, 0, 0),
        I(OpCode::Closure, 1, 0),
        I(OpCode::LoadK, 2, 1),
        I(OpCode::Call, 1, 2, 2),
        I(OpCode::LoadK, 2, 2),
        I(OpCode::Return, 1, 3),
    };
    chunk.lines = {1, 1, 2, 2, 2, 2};
    return makeProto(chunk);
}

const char* kHandWritten = R"(LUNARC1
function "main" "hand.lua" 0 0 1 4
constants 2
int 40
int 2
upvalues 1
upvalue 0 "_ENV"
code 3 lines
LOADK 0 0 0 1
ADD 0 0 1048577 1
RETURN 0 2 0 2
prototypes 0
end
)";

std::string loadError(const std::string& text) {
    try {
        lunar::deserializeChunkText(text);
    } catch (const std::runtime_error& error) {
        return error.what();
    }
    return {};
}

fs::path tempChunkPath(const std::string& name) {
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return fs::temp_directory_path() / ("lunar_chunk_test_" + name + "_" + std::to_string(now) + ".lbc");
}

} // namespace

TEST(ChunkText, ReloadedProgramBehavesTheSame) {
    const auto original = closureProgram();
    const std::string text = lunar::serializeChunkText(*original);
    const auto reloaded = lunar::deserializeChunkText(text);

    EXPECT_EQ(lunar::serializeChunkText(*reloaded), text);
    ASSERT_EQ(reloaded->prototypes.size(), 1u);
    EXPECT_EQ(reloaded->prototypes[0]->name, "add");
    EXPECT_TRUE(reloaded->prototypes[0]->upvalues.at(0).fromParentLocal);
    EXPECT_EQ(reloaded->lineInfo, original->lineInfo);

    lunar::Runtime runtime;
    const auto expected = runChunk(runtime, original);
    const auto actual = runChunk(runtime, reloaded);
    ASSERT_EQ(actual.status, StepStatus::Finished) << actual.message;
    EXPECT_EQ(render(actual.values), render(expected.values));
    EXPECT_EQ(render(actual.values), std::vector<std::string>({"2.5", "say \"hi\"\n"}));
}

TEST(ChunkText, FloatConstantsSurviveExactly) {
    ProtoSpec spec;
    spec.constants = {Constant::Float(0.1), Constant::Float(-1e300)};
    spec.code = {I(OpCode::Return, 0, 1)};
    const auto reloaded = lunar::deserializeChunkText(lunar::serializeChunkText(*makeProto(spec)));
    ASSERT_EQ(reloaded->constants.size(), 2u);
    EXPECT_EQ(reloaded->constants[0].number, 0.1);
    EXPECT_EQ(reloaded->constants[1].number, -1e300);
}

TEST(ChunkText, HandWrittenChunkRuns) {
    const auto proto = lunar::deserializeChunkText(kHandWritten);
    EXPECT_EQ(proto->source, "hand.lua");
    EXPECT_TRUE(proto->isVararg);
    ASSERT_EQ(proto->code.size(), 3u);
    EXPECT_EQ(proto->code[1].op, OpCode::Add);
    EXPECT_EQ(proto->code[1].c, K(1));

    lunar::Runtime runtime;
    const auto result = runChunk(runtime, proto);
    ASSERT_EQ(result.status, StepStatus::Finished) << result.message;
    EXPECT_EQ(render(result.values), strings({"42"}));
}

TEST(ChunkText, MalformedInputIsRejected) {
    EXPECT_EQ(loadError("NOTLUNAR\n"), "Invalid chunk header");
    EXPECT_EQ(loadError(""), "Invalid chunk header");

    std::string badOpcode = kHandWritten;
    badOpcode.replace(badOpcode.find("ADD"), 3, "FROB");
    EXPECT_EQ(loadError(badOpcode), "Malformed chunk: unknown opcode 'FROB'");

    std::string truncated = kHandWritten;
    truncated.resize(truncated.find("prototypes"));
    EXPECT_EQ(loadError(truncated).rfind("Malformed chunk:", 0), 0u);

    std::string badConstant = kHandWritten;
    badConstant.replace(badConstant.find("int 40"), 6, "blob 40");
    EXPECT_EQ(loadError(badConstant), "Malformed chunk: unknown constant kind 'blob'");
}

TEST(ChunkText, DisassemblyAnnotatesConstants) {
    const std::string listing = lunar::disassemble(*lunar::deserializeChunkText(kHandWritten));
    EXPECT_NE(listing.find("function main (hand.lua:0)"), std::string::npos) << listing;
    EXPECT_NE(listing.find("LOADK"), std::string::npos);
    EXPECT_NE(listing.find("K0(40)"), std::string::npos);
    EXPECT_NE(listing.find("R0 K1(2)"), std::string::npos);
    EXPECT_NE(listing.find("upvalue 0 _ENV <- upvalue 0"), std::string::npos);

    const std::string nested = lunar::disassemble(*closureProgram());
    EXPECT_NE(nested.find("  function add"), std::string::npos) << nested;
    EXPECT_NE(nested.find("base <- local 0"), std::string::npos);
}

TEST(ChunkText, DisassemblyNamesUpvalueOperands) {
    // x = print
    ProtoSpec spec;
    spec.constants = {Constant::String("print"), Constant::String("x")};
    spec.upvalues = {envUpvalue()};
    spec.code = {
        I(OpCode::GetTabUp, 0, 0, K(0)),
        I(OpCode::SetTabUp, 0, K(1), 0),
        I(OpCode::Return, 0, 1),
    };
    spec.lines = {3};
    const auto proto = makeProto(spec);

    std::string listing;
    ASSERT_NO_THROW(listing = lunar::disassemble(*proto));
    EXPECT_NE(listing.find("; U0 K0(\"print\")"), std::string::npos) << listing;
    EXPECT_NE(listing.find("; U0 K1(\"x\") R0"), std::string::npos) << listing;
    EXPECT_NE(listing.find("[3] GETTABUP"), std::string::npos) << listing;
    EXPECT_NE(listing.find("[0] RETURN"), std::string::npos) << listing;

    const auto reloaded = lunar::deserializeChunkText(lunar::serializeChunkText(*proto));
    EXPECT_EQ(reloaded->lineInfo, std::vector<std::int32_t>({3, 0, 0}));
}

TEST(ChunkFile, SaveThenLoad) {
    const fs::path path = tempChunkPath("save");
    lunar::saveChunkFile(path.string(), *lunar::deserializeChunkText(kHandWritten));
    ASSERT_TRUE(fs::exists(path));

    const auto proto = lunar::loadChunkFile(path.string());
    lunar::Runtime runtime;
    EXPECT_EQ(render(runChunk(runtime, proto).values), strings({"42"}));

    std::error_code ec;
    fs::remove(path, ec);
    EXPECT_THROW(lunar::loadChunkFile(path.string()), std::runtime_error);
}
