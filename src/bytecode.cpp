#include "lunar/bytecode.hpp"

#include <array>

namespace lunar {

namespace {

constexpr std::array<const char*, 47> kOpCodeNames = {
    "MOVE", "LOADK", "LOADBOOL", "LOADNIL", "GETUPVAL", "SETUPVAL", "GETTABUP", "SETTABUP",
    "GETTABLE", "SETTABLE", "NEWTABLE", "SELF", "ADD", "SUB", "MUL", "DIV", "MOD", "POW",
    "IDIV", "BAND", "BOR", "BXOR", "SHL", "SHR", "UNM", "NOT", "LEN", "BNOT", "CONCAT",
    "JMP", "EQ", "LT", "LE", "TEST", "TESTSET", "CALL", "TAILCALL", "RETURN", "FORPREP",
    "FORLOOP", "TFORCALL", "TFORLOOP", "SETLIST", "CLOSURE", "VARARG", "CLOSE", "YIELD"};

static_assert(kOpCodeNames.size() == static_cast<std::size_t>(OpCode::Yield) + 1,
              "opcode name table out of sync");

} // namespace

const char* opCodeName(OpCode op) {
    const auto index = static_cast<std::size_t>(op);
    if (index >= kOpCodeNames.size()) {
        return "UNKNOWN";
    }
    return kOpCodeNames[index];
}

std::optional<OpCode> parseOpCode(std::string_view name) {
    for (std::size_t i = 0; i < kOpCodeNames.size(); ++i) {
        if (name == kOpCodeNames[i]) {
            return static_cast<OpCode>(i);
        }
    }
    return std::nullopt;
}

std::int64_t instructionCost(OpCode op) {
    switch (op) {
    case OpCode::Call:
    case OpCode::TailCall:
    case OpCode::TForCall:
    case OpCode::Closure:
    case OpCode::NewTable:
    case OpCode::Concat:
        return 2;
    default:
        return 1;
    }
}

} // namespace lunar
