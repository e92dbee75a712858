// Replays corpus files through a fuzz target when libFuzzer is not available
// (ALGOPROBE_FUZZ_STANDALONE builds). Arguments are files or directories.

#ifdef STANDALONE_FUZZ_TARGET_DRIVER

#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);

namespace {

bool RunFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        fprintf(stderr, "Error: Cannot open file '%s'\n", path.c_str());
        return false;
    }
    std::vector<uint8_t> buffer((std::istreambuf_iterator<char>(file)),
                                std::istreambuf_iterator<char>());
    LLVMFuzzerTestOneInput(buffer.data(), buffer.size());
    return true;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        fprintf(stderr, "Usage: %s <file-or-corpus-dir>...\n", argv[0]);
        return 1;
    }

    size_t runs = 0;
    for (int i = 1; i < argc; ++i) {
        std::filesystem::path arg(argv[i]);
        std::error_code ec;
        if (std::filesystem::is_directory(arg, ec)) {
            for (const auto& entry : std::filesystem::directory_iterator(arg, ec)) {
                if (entry.is_regular_file() && RunFile(entry.path())) {
                    ++runs;
                }
            }
        } else if (RunFile(arg)) {
            ++runs;
        }
        if (ec) {
            fprintf(stderr, "Error: Cannot read '%s': %s\n", argv[i], ec.message().c_str());
            return 1;
        }
    }

    printf("Replayed %zu inputs\n", runs);
    return 0;
}

#endif // STANDALONE_FUZZ_TARGET_DRIVER
