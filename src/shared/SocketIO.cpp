#include "SocketIO.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <poll.h>
#include <sys/socket.h>

std::string waitForFd(int fd, short events, const CTimer& deadline) {
    while (true) {
        if (deadline.passed())
            return "timed out";

        pollfd pfd = {
            .fd     = fd,
            .events = events,
        };

        int ret = poll(&pfd, 1, deadline.remainingMs());

        if (ret < 0) {
            if (errno == EINTR)
                continue;
            return std::format("poll failed: {}", strerror(errno));
        }

        if (ret == 0)
            return "timed out";

        if (pfd.revents & events)
            return "";

        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))
            return "connection dropped";
    }
}

std::string writeAll(int fd, const std::string& data, const CTimer& deadline) {
    size_t written = 0;

    while (written < data.size()) {
        ssize_t ret = send(fd, data.data() + written, data.size() - written, MSG_NOSIGNAL);

        if (ret < 0) {
            if (errno == EINTR)
                continue;

            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                if (const auto FAILURE = waitForFd(fd, POLLOUT, deadline); !FAILURE.empty())
                    return FAILURE;
                continue;
            }

            return std::format("send failed: {}", strerror(errno));
        }

        written += ret;
    }

    return "";
}

std::string readExact(int fd, uint8_t* buf, size_t len, const CTimer& deadline) {
    size_t got = 0;

    while (got < len) {
        ssize_t ret = recv(fd, buf + got, len - got, 0);

        if (ret == 0)
            return std::format("connection closed after {} of {} bytes", got, len);

        if (ret < 0) {
            if (errno == EINTR)
                continue;

            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                if (const auto FAILURE = waitForFd(fd, POLLIN, deadline); !FAILURE.empty())
                    return FAILURE;
                continue;
            }

            return std::format("recv failed: {}", strerror(errno));
        }

        got += ret;
    }

    return "";
}

