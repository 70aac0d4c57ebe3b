#include "SessionRegistry.hpp"
#include "../helpers/Log.hpp"

void CSessionRegistry::create(const std::string& handle) {
    bool replaced = false;

    {
        std::lock_guard<std::mutex> lg(m_mLock);
        replaced            = m_mSessions.contains(handle);
        m_mSessions[handle] = SScreencastSession{};
    }

    if (replaced)
        Debug::log(LOG, "[sessions] {} created again, preferences reset", handle);
    else
        Debug::log(TRACE, "[sessions] created {}", handle);
}

bool CSessionRegistry::update(const std::string& handle, const SSourceSelectOptions& options) {
    {
        std::lock_guard<std::mutex> lg(m_mLock);

        const auto                  IT = m_mSessions.find(handle);
        if (IT != m_mSessions.end()) {
            IT->second.sourceTypes  = options.sourceTypes;
            IT->second.cursorMode   = options.cursorMode;
            IT->second.persistMode  = options.persistMode;
            IT->second.restoreToken = options.restoreToken;
            return true;
        }
    }

    Debug::log(WARN, "[sessions] update for unknown session {}, ignoring", handle);
    return false;
}

std::optional<SScreencastSession> CSessionRegistry::get(const std::string& handle) const {
    std::lock_guard<std::mutex> lg(m_mLock);

    const auto                  IT = m_mSessions.find(handle);
    if (IT == m_mSessions.end())
        return std::nullopt;

    return IT->second;
}

bool CSessionRegistry::remove(const std::string& handle) {
    std::lock_guard<std::mutex> lg(m_mLock);
    return m_mSessions.erase(handle) > 0;
}

size_t CSessionRegistry::size() const {
    std::lock_guard<std::mutex> lg(m_mLock);
    return m_mSessions.size();
}
