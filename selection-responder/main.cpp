#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <hyprutils/os/FileDescriptor.hpp>
using namespace Hyprutils::OS;

#include "../src/helpers/Log.hpp"
#include "../src/shared/SelectionClient.hpp"
#include "../src/shared/SelectionProtocol.hpp"
#include "Responder.hpp"

/*
    Stands in for the screen recorder during development: answers every GET_SELECTION
    on the picker socket with a canned reply.
*/

void printHelp() {
    std::cout << R"#(┃ xdpsr-selection-responder
┣━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━
┃ --monitor ID              → answer with a monitor
┃ --window ID               → answer with a window
┃ --region ID X Y W H       → answer with a region of monitor ID
┃ --none                    → answer that nothing is selected
┃ --error MSG               → answer with an error
┃ -s (--socket) PATH        → listen on PATH instead of the default socket
┃ -d (--delay) MS           → wait MS before every reply
┃ -1 (--once)               → exit after the first reply
┃ -v (--verbose)            → enable trace logging
┃ -h (--help)               → print this menu
)#";
}

static volatile sig_atomic_t g_bStop = 0;

static void onSignal(int sig) {
    g_bStop = 1;
}

static std::optional<int> toInt(const char* str) {
    try {
        size_t     idx = 0;
        const auto VAL = std::stoi(str, &idx);
        if (str[idx] != '\0')
            return std::nullopt;
        return VAL;
    } catch (std::exception& e) { return std::nullopt; }
}

int main(int argc, char** argv) {
    SelectionReply reply      = SNoSelection{};
    std::string    socketPath = getDefaultSelectionSocketPath();
    int            delayMs    = 0;
    bool           once       = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg  = argv[i];
        const int   LEFT = argc - i - 1;

        if ((arg == "--monitor" || arg == "--window") && LEFT >= 1) {
            reply = SSelection{.sourceType = arg == "--monitor" ? SELECTION_SOURCE_MONITOR : SELECTION_SOURCE_WINDOW, .sourceID = argv[++i]};
        } else if (arg == "--region" && LEFT >= 5) {
            const std::string ID = argv[++i];
            const auto        X = toInt(argv[++i]), Y = toInt(argv[++i]), W = toInt(argv[++i]), H = toInt(argv[++i]);
            if (!X || !Y || !W || !H || *W < 0 || *H < 0) {
                std::cerr << "--region takes ID X Y W H with integer coordinates\n";
                return 1;
            }

            reply = SSelection{
                .sourceType = SELECTION_SOURCE_REGION,
                .sourceID   = ID,
                .geometry   = SSelectionGeometry{.x = *X, .y = *Y, .width = (uint32_t)*W, .height = (uint32_t)*H},
            };
        } else if (arg == "--none")
            reply = SNoSelection{};
        else if (arg == "--error" && LEFT >= 1)
            reply = SSelectionError{.message = argv[++i]};
        else if ((arg == "--socket" || arg == "-s") && LEFT >= 1)
            socketPath = argv[++i];
        else if ((arg == "--delay" || arg == "-d") && LEFT >= 1) {
            const auto MS = toInt(argv[++i]);
            if (!MS || *MS < 0) {
                std::cerr << "--delay takes a non-negative number of milliseconds\n";
                return 1;
            }
            delayMs = *MS;
        } else if (arg == "--once" || arg == "-1")
            once = true;
        else if (arg == "--verbose" || arg == "-v")
            Debug::verbose = true;
        else if (arg == "--help" || arg == "-h") {
            printHelp();
            return 0;
        } else {
            printHelp();
            return 1;
        }
    }

    sockaddr_un addr = {.sun_family = AF_UNIX};
    if (socketPath.size() >= sizeof(addr.sun_path)) {
        Debug::log(CRIT, "[responder] socket path {} is too long", socketPath);
        return 1;
    }
    strncpy(addr.sun_path, socketPath.c_str(), sizeof(addr.sun_path) - 1);

    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path{socketPath}.parent_path(), ec);
    if (ec) {
        Debug::log(CRIT, "[responder] couldn't create the socket directory: {}", ec.message());
        return 1;
    }

    std::filesystem::remove(socketPath, ec);

    CFileDescriptor listenFd{socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0)};
    if (!listenFd.isValid()) {
        Debug::log(CRIT, "[responder] socket() failed: {}", strerror(errno));
        return 1;
    }

    if (bind(listenFd.get(), (sockaddr*)&addr, SUN_LEN(&addr)) < 0 || listen(listenFd.get(), 8) < 0) {
        Debug::log(CRIT, "[responder] couldn't listen on {}: {}", socketPath, strerror(errno));
        return 1;
    }

    // no SA_RESTART so accept() returns on a signal
    struct sigaction sa = {};
    sa.sa_handler       = onSignal;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    Debug::log(LOG, "[responder] listening on {}", socketPath);

    while (!g_bStop) {
        CFileDescriptor client{accept4(listenFd.get(), nullptr, nullptr, SOCK_CLOEXEC | SOCK_NONBLOCK)};
        if (!client.isValid()) {
            if (errno == EINTR)
                continue;
            Debug::log(ERR, "[responder] accept failed: {}", strerror(errno));
            break;
        }

        if (const auto QUERY = answerSelectionQuery(client.get(), reply, delayMs); !QUERY)
            Debug::log(WARN, "[responder] dropped a client: {}", QUERY.error());

        if (once)
            break;
    }

    std::filesystem::remove(socketPath, ec);

    return 0;
}
