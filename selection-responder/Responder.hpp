#pragma once

#include <expected>
#include <string>

#include "../src/shared/SelectionProtocol.hpp"

#define XDPSR_RESPONDER_READ_TIMEOUT_MS 5000

// Reads one GET_SELECTION from a non-blocking client fd and answers it with reply.
// A client that doesn't send a full query within readTimeoutMs is dropped.
std::expected<SSelectionQuery, std::string> answerSelectionQuery(int fd, const SelectionReply& reply, int delayMs, int readTimeoutMs = XDPSR_RESPONDER_READ_TIMEOUT_MS);
