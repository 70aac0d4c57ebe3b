#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

enum eCursorModes : uint32_t
{
    CURSOR_HIDDEN   = 1,
    CURSOR_EMBEDDED = 2,
    CURSOR_METADATA = 4,
};

enum eSourceTypes : uint32_t
{
    SOURCE_MONITOR = 1,
    SOURCE_WINDOW  = 2,
    SOURCE_VIRTUAL = 4,
};

enum ePersistModes : uint32_t
{
    PERSIST_NONE       = 0,
    PERSIST_TRANSIENT  = 1,
    PERSIST_PERSISTENT = 2,
};

// Capture preferences a ScreenCast session accumulates before Start.
struct SScreencastSession {
    uint32_t                   sourceTypes = 0; // unset until SelectSources
    uint32_t                   cursorMode  = CURSOR_EMBEDDED;
    uint32_t                   persistMode = PERSIST_NONE;
    std::optional<std::string> restoreToken;

    bool                       operator==(const SScreencastSession&) const = default;
};

// What a SelectSources call carries, already defaulted.
struct SSourceSelectOptions {
    uint32_t                   sourceTypes = SOURCE_MONITOR | SOURCE_WINDOW;
    uint32_t                   cursorMode  = CURSOR_EMBEDDED;
    uint32_t                   persistMode = PERSIST_NONE;
    std::optional<std::string> restoreToken;
};

/*
    Session handle -> preferences. Every method takes the lock for the map operation only,
    callers must never hold anything across an ipc round trip.
*/
class CSessionRegistry {
  public:
    // overwrites an existing entry
    void                              create(const std::string& handle);

    // false (and a warning) if the handle is unknown, nothing is inserted then
    bool                              update(const std::string& handle, const SSourceSelectOptions& options);

    std::optional<SScreencastSession> get(const std::string& handle) const;

    bool                              remove(const std::string& handle);
    size_t                            size() const;

  private:
    mutable std::mutex                                  m_mLock;
    std::unordered_map<std::string, SScreencastSession> m_mSessions;
};
