// penumbra - multi-light shadow-mapped scene viewer

#include <penumbra/config.h>
#include <penumbra/viewer.h>

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    penumbra::ViewerConfig config;

    // Help, version and bad arguments don't need a window or GPU
    int cliResult = penumbra::parseArguments(argc, argv, config);
    if (cliResult >= 0) {
        return cliResult;
    }

    try {
        penumbra::Viewer viewer(config);
        viewer.run();
    } catch (const std::exception& e) {
        std::cerr << "[penumbra] Fatal: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
