#include "SelectionClient.hpp"
#include "../helpers/Log.hpp"
#include "../helpers/Timer.hpp"
#include "SocketIO.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <hyprutils/os/FileDescriptor.hpp>
using namespace Hyprutils::OS;

std::string getDefaultSelectionSocketPath() {
    const auto XDG_RUNTIME_DIR = getenv("XDG_RUNTIME_DIR");

    if (XDG_RUNTIME_DIR && XDG_RUNTIME_DIR[0] != '\0')
        return std::string{XDG_RUNTIME_DIR} + "/screen-recorder/picker.sock";

    return std::format("/tmp/screen-recorder-{}/picker.sock", getuid());
}

CSelectionClient::CSelectionClient(const std::string& socketPath, int timeoutMs) : m_szSocketPath(socketPath), m_iTimeoutMs(timeoutMs) {
    ;
}

static std::expected<CFileDescriptor, std::string> connectToCompanion(const std::string& path, const CTimer& deadline) {
    sockaddr_un addr = {.sun_family = AF_UNIX};

    if (path.size() >= sizeof(addr.sun_path))
        return std::unexpected(std::format("socket path too long ({} chars)", path.size()));

    strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    CFileDescriptor fd{socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0)};
    if (!fd.isValid())
        return std::unexpected(std::format("socket() failed: {}", strerror(errno)));

    if (connect(fd.get(), (sockaddr*)&addr, SUN_LEN(&addr)) == 0)
        return fd;

    if (errno != EINPROGRESS)
        return std::unexpected(std::format("connect to {} failed: {}", path, strerror(errno)));

    if (const auto FAILURE = waitForFd(fd.get(), POLLOUT, deadline); !FAILURE.empty())
        return std::unexpected(std::format("connect to {}: {}", path, FAILURE));

    int       sockErr = 0;
    socklen_t len     = sizeof(sockErr);
    if (getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &sockErr, &len) < 0 || sockErr != 0)
        return std::unexpected(std::format("connect to {} failed: {}", path, strerror(sockErr ? sockErr : errno)));

    return fd;
}

std::expected<SelectionReply, std::string> CSelectionClient::querySelection(const SSelectionQuery& query) {
    const CTimer DEADLINE{(float)m_iTimeoutMs};

    Debug::log(TRACE, "[ipc] querying {} (timeout {}ms)", m_szSocketPath, m_iTimeoutMs);

    auto fd = connectToCompanion(m_szSocketPath, DEADLINE);
    if (!fd)
        return std::unexpected(fd.error());

    const auto REQUEST = encodeMessage(IPC_MESSAGE_GET_SELECTION, encodeQueryPayload(query));

    if (const auto FAILURE = writeAll(fd->get(), REQUEST, DEADLINE); !FAILURE.empty())
        return std::unexpected(std::format("sending request: {}", FAILURE));

    std::array<uint8_t, XDPSR_IPC_HEADER_LEN> headerBuf;
    if (const auto FAILURE = readExact(fd->get(), headerBuf.data(), headerBuf.size(), DEADLINE); !FAILURE.empty())
        return std::unexpected(std::format("reading reply header: {}", FAILURE));

    const auto HEADER = decodeHeader(headerBuf.data(), headerBuf.size());
    if (!HEADER)
        return std::unexpected(std::format("bad reply header: {}", HEADER.error()));

    if (HEADER->type != IPC_MESSAGE_SELECTION)
        return std::unexpected(std::format("unexpected reply type {}", (uint32_t)HEADER->type));

    std::string payload;
    payload.resize(HEADER->length);
    if (const auto FAILURE = readExact(fd->get(), (uint8_t*)payload.data(), payload.size(), DEADLINE); !FAILURE.empty())
        return std::unexpected(std::format("reading reply payload: {}", FAILURE));

    Debug::log(TRACE, "[ipc] got reply: {}", payload);

    auto reply = decodeReplyPayload(payload);
    if (!reply)
        return std::unexpected(std::format("bad reply payload: {}", reply.error()));

    return reply;
}
