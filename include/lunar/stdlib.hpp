#pragma once

namespace lunar {

class Runtime;

// Globals: assert, error, pcall, xpcall, type, tostring, tonumber, select,
// raw*, metatables, next/pairs/ipairs, print, collectgarbage.
void bindBaseModule(Runtime& runtime);
void bindCoroutineModule(Runtime& runtime);
void bindMathModule(Runtime& runtime);

void openStandardLibrary(Runtime& runtime);

} // namespace lunar
