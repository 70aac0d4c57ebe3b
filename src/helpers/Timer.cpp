#include "Timer.hpp"

#include <algorithm>
#include <cstdint>

CTimer::CTimer(float ms) {
    m_fDuration = ms;
    m_tStart    = std::chrono::steady_clock::now();
}

bool CTimer::passed() const {
    return std::chrono::steady_clock::now() > (m_tStart + std::chrono::milliseconds((uint64_t)m_fDuration));
}

float CTimer::passedMs() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - m_tStart).count();
}

float CTimer::duration() const {
    return m_fDuration;
}

int CTimer::remainingMs() const {
    return std::max(0, (int)(m_fDuration - passedMs()));
}
