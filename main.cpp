#include <iostream>
#include <string>
#include <cstdlib>

#include "src/header/EmuApp.h"

// usage: famiaudio [config path] [seconds]
int main(int argc, char** argv) {
    std::string cfgPath = "audio.cfg";
    double seconds = 16.0;

    if (argc > 1) cfgPath = argv[1];
    if (argc > 2) {
        seconds = std::atof(argv[2]);
        if (!(seconds > 0.0)) {
            std::cerr << "Invalid duration: " << argv[2] << "\n";
            return -1;
        }
    }

    EmuApp app;
    if (!app.init(cfgPath)) {
        std::cerr << "Failed to init\n";
        return -1;
    }

    int rc = app.run(seconds);
    app.shutdown();

    return rc;
}
