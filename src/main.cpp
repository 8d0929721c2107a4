#include "velcorr.h"
#include <cstring>
#include <map>

namespace {

struct Command {
    int32_t (*func)(int32_t, char**);
    const char* description;
};

const std::map<std::string, Command>& commands() {
    static const std::map<std::string, Command> cmds = {
        {"velocity-corr", {cmdVelocityCorr, "Spatial velocity correlation over a range of radii"}},
        {"grid-info", {cmdGridInfo, "Resolve the grid of a PIV table and report its geometry"}},
    };
    return cmds;
}

void printUsage(const char* prog) {
    std::cerr << "velcorr " << VELCORR_VERSION << "\n"
              << "Usage: " << prog << " <command> [options]\n\nCommands:\n";
    for (const auto& kv : commands()) {
        std::cerr << "  " << kv.first << "\n      " << kv.second.description << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2 || std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0) {
        printUsage(argv[0]);
        return argc < 2 ? 1 : 0;
    }
    if (std::strcmp(argv[1], "--version") == 0) {
        std::cout << VELCORR_VERSION << "\n";
        return 0;
    }
    auto it = commands().find(argv[1]);
    if (it == commands().end()) {
        std::cerr << "Unknown command: " << argv[1] << "\n";
        printUsage(argv[0]);
        return 1;
    }
    try {
        return it->second.func(argc - 1, argv + 1);
    } catch (const VelcorrError& ex) {
        std::cerr << "Failed with " << errorKindName(ex.kind()) << ": " << ex.what() << "\n";
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "Failed: " << ex.what() << "\n";
        return 1;
    }
}
