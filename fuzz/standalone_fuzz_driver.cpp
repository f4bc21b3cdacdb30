// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

// Runs a fuzz target over input files when libFuzzer is not available

#ifdef STANDALONE_FUZZ_TARGET_DRIVER

#include "util/files.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdio>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);

int main(int argc, char **argv) {
    if (argc < 2) {
        fprintf(stderr, "Usage: %s <input_file> [input_file...]\n", argv[0]);
        fprintf(stderr, "\nFor coverage-guided fuzzing, build with clang and "
                        "-DBUILD_FUZZERS=ON.\n");
        return 1;
    }

    for (int i = 1; i < argc; ++i) {
        auto contents = blockledger::util::read_file_string(argv[i]);
        if (!contents) {
            fprintf(stderr, "Error: Cannot read file '%s'\n", argv[i]);
            return 1;
        }

        printf("Running %s (%zu bytes)\n", argv[i], contents->size());
        LLVMFuzzerTestOneInput(reinterpret_cast<const uint8_t *>(contents->data()),
                               contents->size());
    }

    printf("Fuzzer completed successfully\n");
    return 0;
}

#endif // STANDALONE_FUZZ_TARGET_DRIVER
