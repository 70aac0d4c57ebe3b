#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <variant>

/*
    Wire protocol between xdpsr and the screen recorder (the companion app).

    Every message is a 14 byte header followed by a json payload:
        [0..5]   magic "SRPICK"
        [6..9]   payload length, u32 LE
        [10..13] message type, u32 LE
*/

#define XDPSR_IPC_MAGIC            "SRPICK"
#define XDPSR_IPC_MAGIC_LEN        6
#define XDPSR_IPC_HEADER_LEN       14
#define XDPSR_IPC_MAX_PAYLOAD      (1024 * 1024)
#define XDPSR_IPC_PROTOCOL_VERSION 1

enum eIPCMessageType : uint32_t
{
    IPC_MESSAGE_GET_SELECTION = 1,
    IPC_MESSAGE_SELECTION     = 2,
};

enum eSelectionSourceType
{
    SELECTION_SOURCE_MONITOR = 0,
    SELECTION_SOURCE_WINDOW,
    SELECTION_SOURCE_REGION,
    SELECTION_SOURCE_UNKNOWN,
};

struct SSelectionGeometry {
    int32_t  x = 0, y = 0;
    uint32_t width = 0, height = 0;
};

struct SSelection {
    eSelectionSourceType              sourceType = SELECTION_SOURCE_UNKNOWN;
    std::string                       sourceID;
    std::optional<SSelectionGeometry> geometry;
};

struct SNoSelection {};

struct SSelectionError {
    std::string message;
};

using SelectionReply = std::variant<SSelection, SNoSelection, SSelectionError>;

// preferences forwarded with a GET_SELECTION, the companion may ignore them
struct SSelectionQuery {
    uint32_t                   sourceTypes = 0;
    uint32_t                   cursorMode  = 0;
    std::optional<std::string> restoreToken;
};

struct SIPCHeader {
    uint32_t        length = 0;
    eIPCMessageType type   = IPC_MESSAGE_GET_SELECTION;
};

eSelectionSourceType                        sourceTypeFromString(const std::string& str);
std::string                                 sourceTypeToString(eSelectionSourceType type);

std::array<uint8_t, XDPSR_IPC_HEADER_LEN>   encodeHeader(eIPCMessageType type, uint32_t length);
std::expected<SIPCHeader, std::string>      decodeHeader(const uint8_t* data, size_t len);

std::string                                 encodeMessage(eIPCMessageType type, const std::string& payload);

std::string                                 encodeQueryPayload(const SSelectionQuery& query);
std::expected<SSelectionQuery, std::string> decodeQueryPayload(const std::string& payload);

std::string                                 encodeReplyPayload(const SelectionReply& reply);
std::expected<SelectionReply, std::string>  decodeReplyPayload(const std::string& payload);
