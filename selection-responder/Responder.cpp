#include "Responder.hpp"
#include "../src/helpers/Log.hpp"
#include "../src/helpers/Timer.hpp"
#include "../src/shared/SocketIO.hpp"

#include <array>
#include <chrono>
#include <thread>

std::expected<SSelectionQuery, std::string> answerSelectionQuery(int fd, const SelectionReply& reply, int delayMs, int readTimeoutMs) {
    const CTimer                              READ_DEADLINE{(float)readTimeoutMs};

    std::array<uint8_t, XDPSR_IPC_HEADER_LEN> headerBuf;
    if (const auto FAILURE = readExact(fd, headerBuf.data(), headerBuf.size(), READ_DEADLINE); !FAILURE.empty())
        return std::unexpected(std::format("reading header: {}", FAILURE));

    const auto HEADER = decodeHeader(headerBuf.data(), headerBuf.size());
    if (!HEADER)
        return std::unexpected(std::format("bad header: {}", HEADER.error()));

    std::string payload;
    payload.resize(HEADER->length);
    if (const auto FAILURE = readExact(fd, (uint8_t*)payload.data(), payload.size(), READ_DEADLINE); !FAILURE.empty())
        return std::unexpected(std::format("reading payload: {}", FAILURE));

    if (HEADER->type != IPC_MESSAGE_GET_SELECTION)
        return std::unexpected(std::format("unexpected message type {}", (uint32_t)HEADER->type));

    auto query = decodeQueryPayload(payload);
    if (!query)
        return std::unexpected(std::format("bad query: {}", query.error()));

    Debug::log(LOG, "[responder] query: source types {}, cursor mode {}, restore token {}", query->sourceTypes, query->cursorMode, query->restoreToken.value_or("<none>"));

    if (delayMs > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));

    const CTimer WRITE_DEADLINE{(float)readTimeoutMs};
    if (const auto FAILURE = writeAll(fd, encodeMessage(IPC_MESSAGE_SELECTION, encodeReplyPayload(reply)), WRITE_DEADLINE); !FAILURE.empty())
        return std::unexpected(std::format("sending reply: {}", FAILURE));

    return query;
}
