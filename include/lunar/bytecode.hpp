#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lunar {

// Register machine instruction set. R[x] is a register of the current frame,
// K[x] a constant, U[x] an upvalue and RK(x) a register or, when x carries
// kConstantOperandFlag, a constant.
enum class OpCode : std::uint8_t {
    Move,      // R[A] = R[B]
    LoadK,     // R[A] = K[B]
    LoadBool,  // R[A] = B != 0; if C != 0 skip next
    LoadNil,   // R[A..A+B] = nil
    GetUpval,  // R[A] = U[B]
    SetUpval,  // U[B] = R[A]
    GetTabUp,  // R[A] = U[B][RK(C)]
    SetTabUp,  // U[A][RK(B)] = RK(C)
    GetTable,  // R[A] = R[B][RK(C)]
    SetTable,  // R[A][RK(B)] = RK(C)
    NewTable,  // R[A] = {} (B array hint, C hash hint)
    Self,      // R[A+1] = R[B]; R[A] = R[B][RK(C)]
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    Pow,
    IDiv,
    BAnd,
    BOr,
    BXor,
    Shl,
    Shr,
    Unm,       // R[A] = -R[B]
    Not,       // R[A] = not R[B]
    Len,       // R[A] = #R[B]
    BNot,      // R[A] = ~R[B]
    Concat,    // R[A] = R[B] .. ... .. R[C]
    Jmp,       // pc += B; if A > 0 close upvalues >= R[A-1]
    Eq,        // if (RK(B) == RK(C)) ~= (A != 0) skip next
    Lt,
    Le,
    Test,      // if truthy(R[A]) ~= (C != 0) skip next
    TestSet,   // if truthy(R[B]) == (C != 0) R[A] = R[B] else skip next
    Call,      // R[A..A+C-2] = R[A](R[A+1..A+B-1]); B == 0 uses top, C == 0 sets top
    TailCall,  // return R[A](R[A+1..A+B-1])
    Return,    // return R[A..A+B-2]; B == 0 uses top
    ForPrep,   // numeric loop setup over R[A..A+3]; B is the body length
    ForLoop,   // numeric loop step; jumps back B + 1 instructions
    TForCall,  // R[A+4..A+3+C] = R[A](R[A+1], R[A+2])
    TForLoop,  // if R[A+4] ~= nil { R[A+2] = R[A+4]; pc += B }
    SetList,   // R[A][C+i] = R[A+i], 1 <= i <= B; B == 0 uses top
    Closure,   // R[A] = closure(child prototype B)
    VarArg,    // R[A..A+B-2] = ...; B == 0 copies all and sets top
    Close,     // close upvalues >= R[A]
    Yield      // yield R[A..A+B-2]; resumed values land in R[A..A+C-2]
};

constexpr std::int32_t kConstantOperandFlag = 1 << 20;

constexpr bool isConstantOperand(std::int32_t operand) {
    return operand >= kConstantOperandFlag;
}

constexpr std::int32_t constantOperand(std::int32_t index) {
    return index + kConstantOperandFlag;
}

constexpr std::int32_t constantIndex(std::int32_t operand) {
    return operand - kConstantOperandFlag;
}

struct Instruction {
    OpCode op{OpCode::Move};
    std::int32_t a{0};
    std::int32_t b{0};
    std::int32_t c{0};
};

enum class ConstantKind : std::uint8_t {
    Nil,
    Boolean,
    Integer,
    Float,
    String
};

struct Constant {
    ConstantKind kind{ConstantKind::Nil};
    bool boolean{false};
    std::int64_t integer{0};
    double number{0.0};
    std::string text;

    static Constant Nil() { return {}; }
    static Constant Boolean(bool v) {
        Constant out;
        out.kind = ConstantKind::Boolean;
        out.boolean = v;
        return out;
    }
    static Constant Integer(std::int64_t v) {
        Constant out;
        out.kind = ConstantKind::Integer;
        out.integer = v;
        return out;
    }
    static Constant Float(double v) {
        Constant out;
        out.kind = ConstantKind::Float;
        out.number = v;
        return out;
    }
    static Constant String(std::string v) {
        Constant out;
        out.kind = ConstantKind::String;
        out.text = std::move(v);
        return out;
    }
};

// fromParentLocal: capture register `index` of the enclosing frame.
// Otherwise share upvalue `index` of the enclosing closure.
struct UpvalueDescriptor {
    bool fromParentLocal{false};
    std::uint32_t index{0};
    std::string name;
};

struct Prototype {
    std::string name;
    std::string source;
    std::int32_t lineDefined{0};
    std::uint32_t paramCount{0};
    bool isVararg{false};
    std::uint32_t registerCount{0};
    std::vector<Instruction> code;
    std::vector<Constant> constants;
    std::vector<UpvalueDescriptor> upvalues;
    std::vector<std::shared_ptr<const Prototype>> prototypes;
    // Optional; parallel to code when present.
    std::vector<std::int32_t> lineInfo;
};

const char* opCodeName(OpCode op);
std::optional<OpCode> parseOpCode(std::string_view name);

// Fuel charged for executing one instruction.
std::int64_t instructionCost(OpCode op);

} // namespace lunar
