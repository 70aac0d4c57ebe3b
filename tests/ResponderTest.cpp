#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include <sys/socket.h>
#include <unistd.h>

#include <hyprutils/os/FileDescriptor.hpp>
using namespace Hyprutils::OS;

#include "../selection-responder/Responder.hpp"
#include "helpers/Timer.hpp"
#include "shared/SocketIO.hpp"

// [0] is the responder's end, [1] the portal's
static std::pair<CFileDescriptor, CFileDescriptor> makeSocketPair() {
    int fds[2] = {-1, -1};
    EXPECT_EQ(socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0, fds), 0);
    return {CFileDescriptor{fds[0]}, CFileDescriptor{fds[1]}};
}

TEST(Responder, SilentClientIsDroppedAfterTimeout) {
    auto [responderEnd, clientEnd] = makeSocketPair();

    const auto START = std::chrono::steady_clock::now();
    const auto QUERY = answerSelectionQuery(responderEnd.get(), SNoSelection{}, 0, 150);
    const auto TOOK  = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - START).count();

    ASSERT_FALSE(QUERY.has_value());
    EXPECT_NE(QUERY.error().find("timed out"), std::string::npos) << QUERY.error();
    EXPECT_LT(TOOK, 1000);
}

TEST(Responder, HalfSentQueryIsDroppedAfterTimeout) {
    auto       [responderEnd, clientEnd] = makeSocketPair();

    const auto MSG = encodeMessage(IPC_MESSAGE_GET_SELECTION, encodeQueryPayload({}));
    ASSERT_EQ(write(clientEnd.get(), MSG.data(), MSG.size() / 2), (ssize_t)(MSG.size() / 2));

    const auto QUERY = answerSelectionQuery(responderEnd.get(), SNoSelection{}, 0, 150);

    ASSERT_FALSE(QUERY.has_value());
    EXPECT_NE(QUERY.error().find("timed out"), std::string::npos) << QUERY.error();
}

TEST(Responder, AnswersAQuery) {
    auto       [responderEnd, clientEnd] = makeSocketPair();

    const auto MSG = encodeMessage(IPC_MESSAGE_GET_SELECTION, encodeQueryPayload({.sourceTypes = 2, .cursorMode = 1}));
    ASSERT_EQ(write(clientEnd.get(), MSG.data(), MSG.size()), (ssize_t)MSG.size());

    const auto QUERY = answerSelectionQuery(responderEnd.get(), SSelection{.sourceType = SELECTION_SOURCE_WINDOW, .sourceID = "0x1"}, 0, 500);
    ASSERT_TRUE(QUERY.has_value()) << QUERY.error();
    EXPECT_EQ(QUERY->sourceTypes, 2u);

    const CTimer                              DEADLINE{500};
    std::array<uint8_t, XDPSR_IPC_HEADER_LEN> header;
    ASSERT_EQ(readExact(clientEnd.get(), header.data(), header.size(), DEADLINE), "");

    const auto DECODED = decodeHeader(header.data(), header.size());
    ASSERT_TRUE(DECODED.has_value());
    EXPECT_EQ(DECODED->type, IPC_MESSAGE_SELECTION);

    std::string payload(DECODED->length, '\0');
    ASSERT_EQ(readExact(clientEnd.get(), (uint8_t*)payload.data(), payload.size(), DEADLINE), "");

    const auto REPLY = decodeReplyPayload(payload);
    ASSERT_TRUE(REPLY.has_value());
    EXPECT_EQ(std::get<SSelection>(*REPLY).sourceID, "0x1");
}
