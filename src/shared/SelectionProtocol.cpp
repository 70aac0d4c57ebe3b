#include "SelectionProtocol.hpp"

#include <cstring>
#include <format>
#include <limits>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

eSelectionSourceType sourceTypeFromString(const std::string& str) {
    if (str == "monitor")
        return SELECTION_SOURCE_MONITOR;
    if (str == "window")
        return SELECTION_SOURCE_WINDOW;
    if (str == "region")
        return SELECTION_SOURCE_REGION;
    return SELECTION_SOURCE_UNKNOWN;
}

std::string sourceTypeToString(eSelectionSourceType type) {
    switch (type) {
        case SELECTION_SOURCE_MONITOR: return "monitor";
        case SELECTION_SOURCE_WINDOW: return "window";
        case SELECTION_SOURCE_REGION: return "region";
        default: break;
    }
    return "unknown";
}

static void writeU32LE(uint8_t* dst, uint32_t value) {
    dst[0] = value & 0xFF;
    dst[1] = (value >> 8) & 0xFF;
    dst[2] = (value >> 16) & 0xFF;
    dst[3] = (value >> 24) & 0xFF;
}

static uint32_t readU32LE(const uint8_t* src) {
    return (uint32_t)src[0] | ((uint32_t)src[1] << 8) | ((uint32_t)src[2] << 16) | ((uint32_t)src[3] << 24);
}

std::array<uint8_t, XDPSR_IPC_HEADER_LEN> encodeHeader(eIPCMessageType type, uint32_t length) {
    std::array<uint8_t, XDPSR_IPC_HEADER_LEN> header;
    memcpy(header.data(), XDPSR_IPC_MAGIC, XDPSR_IPC_MAGIC_LEN);
    writeU32LE(header.data() + 6, length);
    writeU32LE(header.data() + 10, (uint32_t)type);
    return header;
}

std::expected<SIPCHeader, std::string> decodeHeader(const uint8_t* data, size_t len) {
    if (len < XDPSR_IPC_HEADER_LEN)
        return std::unexpected(std::format("short header ({} bytes)", len));

    if (memcmp(data, XDPSR_IPC_MAGIC, XDPSR_IPC_MAGIC_LEN) != 0)
        return std::unexpected("bad magic");

    SIPCHeader header;
    header.length = readU32LE(data + 6);

    if (header.length > XDPSR_IPC_MAX_PAYLOAD)
        return std::unexpected(std::format("payload too large ({} bytes)", header.length));

    const auto TYPE = readU32LE(data + 10);
    if (TYPE != IPC_MESSAGE_GET_SELECTION && TYPE != IPC_MESSAGE_SELECTION)
        return std::unexpected(std::format("unknown message type {}", TYPE));

    header.type = (eIPCMessageType)TYPE;

    return header;
}

std::string encodeMessage(eIPCMessageType type, const std::string& payload) {
    const auto  HEADER = encodeHeader(type, (uint32_t)payload.size());

    std::string msg;
    msg.reserve(HEADER.size() + payload.size());
    msg.append((const char*)HEADER.data(), HEADER.size());
    msg.append(payload);
    return msg;
}

static std::expected<json, std::string> parseVersioned(const std::string& payload) {
    auto j = json::parse(payload, nullptr, false);

    if (j.is_discarded())
        return std::unexpected("payload is not valid json");

    if (!j.is_object())
        return std::unexpected("payload is not a json object");

    if (!j.contains("version") || !j["version"].is_number_unsigned())
        return std::unexpected("payload has no version");

    if (j["version"].get<uint64_t>() != XDPSR_IPC_PROTOCOL_VERSION)
        return std::unexpected(std::format("unsupported protocol version {}", j["version"].get<uint64_t>()));

    return j;
}

template <typename T>
static bool readInt(const json& obj, const char* key, T& out) {
    if (!obj.contains(key) || !obj[key].is_number_integer())
        return false;

    if (obj[key].is_number_unsigned()) {
        const auto V = obj[key].get<uint64_t>();
        if (V > (uint64_t)std::numeric_limits<T>::max())
            return false;
        out = (T)V;
        return true;
    }

    const auto V = obj[key].get<int64_t>();
    if (V < (int64_t)std::numeric_limits<T>::min() || V > (int64_t)std::numeric_limits<T>::max())
        return false;
    out = (T)V;
    return true;
}

std::string encodeQueryPayload(const SSelectionQuery& query) {
    json j;
    j["version"]     = XDPSR_IPC_PROTOCOL_VERSION;
    j["types"]       = query.sourceTypes;
    j["cursor_mode"] = query.cursorMode;
    if (query.restoreToken.has_value())
        j["restore_token"] = *query.restoreToken;
    return j.dump();
}

std::expected<SSelectionQuery, std::string> decodeQueryPayload(const std::string& payload) {
    const auto PARSED = parseVersioned(payload);
    if (!PARSED)
        return std::unexpected(PARSED.error());

    const auto&     j = *PARSED;
    SSelectionQuery query;

    // hints only, a missing field is fine
    readInt(j, "types", query.sourceTypes);
    readInt(j, "cursor_mode", query.cursorMode);

    if (j.contains("restore_token") && j["restore_token"].is_string())
        query.restoreToken = j["restore_token"].get<std::string>();

    return query;
}

std::string encodeReplyPayload(const SelectionReply& reply) {
    json j;
    j["version"] = XDPSR_IPC_PROTOCOL_VERSION;

    if (const auto* SEL = std::get_if<SSelection>(&reply)) {
        j["result"]      = "selection";
        j["source_type"] = sourceTypeToString(SEL->sourceType);
        j["source_id"]   = SEL->sourceID;
        if (SEL->geometry.has_value())
            j["geometry"] = {{"x", SEL->geometry->x}, {"y", SEL->geometry->y}, {"width", SEL->geometry->width}, {"height", SEL->geometry->height}};
    } else if (const auto* PERROR = std::get_if<SSelectionError>(&reply)) {
        j["result"]  = "error";
        j["message"] = PERROR->message;
    } else
        j["result"] = "none";

    return j.dump();
}

std::expected<SelectionReply, std::string> decodeReplyPayload(const std::string& payload) {
    const auto PARSED = parseVersioned(payload);
    if (!PARSED)
        return std::unexpected(PARSED.error());

    const auto& j = *PARSED;

    if (!j.contains("result") || !j["result"].is_string())
        return std::unexpected("reply has no result");

    const auto RESULT = j["result"].get<std::string>();

    if (RESULT == "none")
        return SNoSelection{};

    if (RESULT == "error") {
        SSelectionError error;
        if (j.contains("message") && j["message"].is_string())
            error.message = j["message"].get<std::string>();
        return error;
    }

    if (RESULT != "selection")
        return std::unexpected(std::format("unknown result \"{}\"", RESULT));

    if (!j.contains("source_type") || !j["source_type"].is_string())
        return std::unexpected("selection has no source_type");

    if (!j.contains("source_id") || !j["source_id"].is_string())
        return std::unexpected("selection has no source_id");

    SSelection selection;
    selection.sourceType = sourceTypeFromString(j["source_type"].get<std::string>());
    selection.sourceID   = j["source_id"].get<std::string>();

    if (j.contains("geometry") && !j["geometry"].is_null()) {
        const auto&        GEOM = j["geometry"];
        SSelectionGeometry geometry;

        if (!GEOM.is_object() || !readInt(GEOM, "x", geometry.x) || !readInt(GEOM, "y", geometry.y) || !readInt(GEOM, "width", geometry.width) ||
            !readInt(GEOM, "height", geometry.height))
            return std::unexpected("selection has malformed geometry");

        selection.geometry = geometry;
    }

    return selection;
}
