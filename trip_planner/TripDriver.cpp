#include <iostream>
#include "batch.hpp"

int main(int argc, char* argv[]) {
    if (argc != 4) {
        std::cerr << "Usage: " << argv[0] << " <config.json> <requests.json> <output.json>" << std::endl;
        return 1;
    }
    return run_batch(argv[1], argv[2], argv[3]);
}
