#pragma once

#include "lunar/bytecode.hpp"

#include <memory>
#include <string>

namespace lunar {

// Line-oriented text form of a prototype tree, header "LUNARC1". Throws
// std::runtime_error on malformed input.
std::string serializeChunkText(const Prototype& prototype);
std::shared_ptr<const Prototype> deserializeChunkText(const std::string& text);

std::shared_ptr<const Prototype> loadChunkFile(const std::string& path);
void saveChunkFile(const std::string& path, const Prototype& prototype);

// Human-readable listing of a prototype and its children.
std::string disassemble(const Prototype& prototype);

} // namespace lunar
