#include "lunar/chunk_io.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace lunar {

namespace {

constexpr const char* kChunkHeader = "LUNARC1";

std::string formatFloat(double value) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%a", value);
    return buffer;
}

void expectWord(std::istream& in, const char* word) {
    std::string token;
    if (!(in >> token) || token != word) {
        throw std::runtime_error(std::string("Malformed chunk: expected '") + word + "', got '" + token + "'");
    }
}

template <typename T>
T readNumber(std::istream& in, const char* what) {
    T value{};
    if (!(in >> value)) {
        throw std::runtime_error(std::string("Malformed chunk: bad ") + what);
    }
    return value;
}

std::string readQuoted(std::istream& in, const char* what) {
    std::string value;
    if (!(in >> std::quoted(value))) {
        throw std::runtime_error(std::string("Malformed chunk: bad ") + what);
    }
    return value;
}

// Instructions past the end of a partial line table report line 0.
std::int32_t lineAt(const Prototype& proto, std::size_t pc) {
    return pc < proto.lineInfo.size() ? proto.lineInfo[pc] : 0;
}

void writePrototype(std::ostream& out, const Prototype& proto) {
    out << "function " << std::quoted(proto.name) << ' ' << std::quoted(proto.source) << ' ' << proto.lineDefined
        << ' ' << proto.paramCount << ' ' << (proto.isVararg ? 1 : 0) << ' ' << proto.registerCount << "\n";

    out << "constants " << proto.constants.size() << "\n";
    for (const auto& constant : proto.constants) {
        switch (constant.kind) {
        case ConstantKind::Nil:
            out << "nil\n";
            break;
        case ConstantKind::Boolean:
            out << "bool " << (constant.boolean ? 1 : 0) << "\n";
            break;
        case ConstantKind::Integer:
            out << "int " << constant.integer << "\n";
            break;
        case ConstantKind::Float:
            out << "float " << formatFloat(constant.number) << "\n";
            break;
        case ConstantKind::String:
            out << "string " << std::quoted(constant.text) << "\n";
            break;
        }
    }

    out << "upvalues " << proto.upvalues.size() << "\n";
    for (const auto& upvalue : proto.upvalues) {
        out << (upvalue.fromParentLocal ? "local " : "upvalue ") << upvalue.index << ' ' << std::quoted(upvalue.name)
            << "\n";
    }

    const bool hasLines = !proto.lineInfo.empty();
    out << "code " << proto.code.size() << ' ' << (hasLines ? "lines" : "nolines") << "\n";
    for (std::size_t i = 0; i < proto.code.size(); ++i) {
        const Instruction& ins = proto.code[i];
        out << opCodeName(ins.op) << ' ' << ins.a << ' ' << ins.b << ' ' << ins.c;
        if (hasLines) {
            out << ' ' << lineAt(proto, i);
        }
        out << "\n";
    }

    out << "prototypes " << proto.prototypes.size() << "\n";
    for (const auto& child : proto.prototypes) {
        writePrototype(out, *child);
    }
    out << "end\n";
}

std::shared_ptr<const Prototype> readPrototype(std::istream& in) {
    auto proto = std::make_shared<Prototype>();
    expectWord(in, "function");
    proto->name = readQuoted(in, "function name");
    proto->source = readQuoted(in, "source name");
    proto->lineDefined = readNumber<std::int32_t>(in, "line");
    proto->paramCount = readNumber<std::uint32_t>(in, "parameter count");
    proto->isVararg = readNumber<int>(in, "vararg flag") != 0;
    proto->registerCount = readNumber<std::uint32_t>(in, "register count");

    expectWord(in, "constants");
    const auto constantCount = readNumber<std::size_t>(in, "constant count");
    proto->constants.reserve(constantCount);
    for (std::size_t i = 0; i < constantCount; ++i) {
        std::string kind;
        in >> kind;
        if (kind == "nil") {
            proto->constants.push_back(Constant::Nil());
        } else if (kind == "bool") {
            proto->constants.push_back(Constant::Boolean(readNumber<int>(in, "boolean") != 0));
        } else if (kind == "int") {
            proto->constants.push_back(Constant::Integer(readNumber<std::int64_t>(in, "integer")));
        } else if (kind == "float") {
            std::string token;
            in >> token;
            char* end = nullptr;
            const double value = std::strtod(token.c_str(), &end);
            if (token.empty() || end != token.c_str() + token.size()) {
                throw std::runtime_error("Malformed chunk: bad float '" + token + "'");
            }
            proto->constants.push_back(Constant::Float(value));
        } else if (kind == "string") {
            proto->constants.push_back(Constant::String(readQuoted(in, "string constant")));
        } else {
            throw std::runtime_error("Malformed chunk: unknown constant kind '" + kind + "'");
        }
    }

    expectWord(in, "upvalues");
    const auto upvalueCount = readNumber<std::size_t>(in, "upvalue count");
    for (std::size_t i = 0; i < upvalueCount; ++i) {
        std::string kind;
        in >> kind;
        if (kind != "local" && kind != "upvalue") {
            throw std::runtime_error("Malformed chunk: unknown upvalue kind '" + kind + "'");
        }
        UpvalueDescriptor upvalue;
        upvalue.fromParentLocal = kind == "local";
        upvalue.index = readNumber<std::uint32_t>(in, "upvalue index");
        upvalue.name = readQuoted(in, "upvalue name");
        proto->upvalues.push_back(std::move(upvalue));
    }

    expectWord(in, "code");
    const auto codeCount = readNumber<std::size_t>(in, "code size");
    std::string lineMode;
    in >> lineMode;
    if (lineMode != "lines" && lineMode != "nolines") {
        throw std::runtime_error("Malformed chunk: bad line mode '" + lineMode + "'");
    }
    const bool hasLines = lineMode == "lines";
    proto->code.reserve(codeCount);
    for (std::size_t i = 0; i < codeCount; ++i) {
        std::string mnemonic;
        in >> mnemonic;
        auto op = parseOpCode(mnemonic);
        if (!op) {
            throw std::runtime_error("Malformed chunk: unknown opcode '" + mnemonic + "'");
        }
        Instruction ins;
        ins.op = *op;
        ins.a = readNumber<std::int32_t>(in, "operand");
        ins.b = readNumber<std::int32_t>(in, "operand");
        ins.c = readNumber<std::int32_t>(in, "operand");
        proto->code.push_back(ins);
        if (hasLines) {
            proto->lineInfo.push_back(readNumber<std::int32_t>(in, "line"));
        }
    }

    expectWord(in, "prototypes");
    const auto childCount = readNumber<std::size_t>(in, "prototype count");
    for (std::size_t i = 0; i < childCount; ++i) {
        proto->prototypes.push_back(readPrototype(in));
    }
    expectWord(in, "end");
    return proto;
}

std::string describeOperand(const Prototype& proto, std::int32_t operand) {
    if (!isConstantOperand(operand)) {
        return "R" + std::to_string(operand);
    }
    const auto index = static_cast<std::size_t>(constantIndex(operand));
    std::ostringstream out;
    out << "K" << index;
    if (index < proto.constants.size()) {
        const Constant& constant = proto.constants[index];
        switch (constant.kind) {
        case ConstantKind::Nil:
            out << "(nil)";
            break;
        case ConstantKind::Boolean:
            out << (constant.boolean ? "(true)" : "(false)");
            break;
        case ConstantKind::Integer:
            out << '(' << constant.integer << ')';
            break;
        case ConstantKind::Float:
            out << '(' << constant.number << ')';
            break;
        case ConstantKind::String:
            out << '(' << std::quoted(constant.text) << ')';
            break;
        }
    }
    return out.str();
}

bool usesRkOperands(OpCode op) {
    switch (op) {
    case OpCode::GetTable:
    case OpCode::SetTable:
    case OpCode::Self:
    case OpCode::Add:
    case OpCode::Sub:
    case OpCode::Mul:
    case OpCode::Div:
    case OpCode::Mod:
    case OpCode::Pow:
    case OpCode::IDiv:
    case OpCode::BAnd:
    case OpCode::BOr:
    case OpCode::BXor:
    case OpCode::Shl:
    case OpCode::Shr:
    case OpCode::Eq:
    case OpCode::Lt:
    case OpCode::Le:
        return true;
    default:
        return false;
    }
}

void writeListing(std::ostream& out, const Prototype& proto, const std::string& indent) {
    out << indent << "function " << (proto.name.empty() ? "?" : proto.name) << " ("
        << (proto.source.empty() ? "?" : proto.source) << ':' << proto.lineDefined << ") params=" << proto.paramCount
        << (proto.isVararg ? "+" : "") << " registers=" << proto.registerCount << " upvalues=" << proto.upvalues.size()
        << "\n";
    for (std::size_t i = 0; i < proto.code.size(); ++i) {
        const Instruction& ins = proto.code[i];
        out << indent << "  " << std::setw(4) << i << "  ";
        if (!proto.lineInfo.empty()) {
            out << '[' << lineAt(proto, i) << "] ";
        }
        out << std::left << std::setw(10) << opCodeName(ins.op) << std::right << ins.a << ' ' << ins.b << ' ' << ins.c;
        if (ins.op == OpCode::LoadK) {
            out << "  ; " << describeOperand(proto, constantOperand(ins.b));
        } else if (ins.op == OpCode::GetTabUp) {
            out << "  ; U" << ins.b << ' ' << describeOperand(proto, ins.c);
        } else if (ins.op == OpCode::SetTabUp) {
            out << "  ; U" << ins.a << ' ' << describeOperand(proto, ins.b) << ' ' << describeOperand(proto, ins.c);
        } else if (usesRkOperands(ins.op)) {
            out << "  ; " << describeOperand(proto, ins.b) << ' ' << describeOperand(proto, ins.c);
        }
        out << "\n";
    }
    for (std::size_t i = 0; i < proto.upvalues.size(); ++i) {
        const auto& upvalue = proto.upvalues[i];
        out << indent << "  upvalue " << i << ' ' << (upvalue.name.empty() ? "?" : upvalue.name)
            << (upvalue.fromParentLocal ? " <- local " : " <- upvalue ") << upvalue.index << "\n";
    }
    for (const auto& child : proto.prototypes) {
        writeListing(out, *child, indent + "  ");
    }
}

} // namespace

std::string serializeChunkText(const Prototype& prototype) {
    std::ostringstream out;
    out << kChunkHeader << "\n";
    writePrototype(out, prototype);
    return out.str();
}

std::shared_ptr<const Prototype> deserializeChunkText(const std::string& text) {
    std::istringstream in(text);
    std::string magic;
    in >> magic;
    if (magic != kChunkHeader) {
        throw std::runtime_error("Invalid chunk header");
    }
    return readPrototype(in);
}

std::shared_ptr<const Prototype> loadChunkFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open chunk file: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return deserializeChunkText(buffer.str());
}

void saveChunkFile(const std::string& path, const Prototype& prototype) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot write chunk file: " + path);
    }
    file << serializeChunkText(prototype);
}

std::string disassemble(const Prototype& prototype) {
    std::ostringstream out;
    writeListing(out, prototype, "");
    return out.str();
}

} // namespace lunar
