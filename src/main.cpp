#include <csignal>
#include <iostream>
#include <optional>

#include "helpers/Log.hpp"
#include "core/PortalManager.hpp"

void printHelp() {
    std::cout << R"#(┃ xdg-desktop-portal-screenrecorder
┣━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━
┃ -v (--verbose)       → enable trace logging
┃ -q (--quiet)         → disable logging
┃ -c (--config) PATH   → use PATH instead of the default config file
┃ -h (--help)          → print this menu
┃ -V (--version)       → print xdpsr's version
)#";
}

static void onTerminateSignal(int sig) {
    if (g_pPortalManager)
        g_pPortalManager->terminate();
}

int main(int argc, char** argv, char** envp) {
    std::optional<std::string> configPath;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--verbose" || arg == "-v")
            Debug::verbose = true;

        else if (arg == "--quiet" || arg == "-q")
            Debug::quiet = true;

        else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::cerr << arg << " needs a path\n";
                printHelp();
                return 1;
            }

            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printHelp();
            return 0;
        } else if (arg == "--version" || arg == "-V") {
            std::cout << "xdg-desktop-portal-screenrecorder v" << XDPSR_VERSION << "\n";
            return 0;
        } else {
            printHelp();
            return 1;
        }
    }

    Debug::log(LOG, "Initializing xdpsr...");

    g_pPortalManager = std::make_unique<CPortalManager>(configPath);

    signal(SIGINT, onTerminateSignal);
    signal(SIGTERM, onTerminateSignal);

    g_pPortalManager->init();

    return 0;
}
