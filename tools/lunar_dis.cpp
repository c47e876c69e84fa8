#include "lunar/chunk_io.hpp"

#include <iostream>

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "Usage: lunar-dis <chunk.lbc>\n";
        return 1;
    }

    try {
        const auto chunk = lunar::loadChunkFile(argv[1]);
        std::cout << lunar::disassemble(*chunk);
    } catch (const std::exception& ex) {
        std::cerr << "Disassembly failed: " << ex.what() << "\n";
        return 10;
    }
    return 0;
}
