#pragma once

#include <chrono>

class CTimer {
  public:
    explicit CTimer(float ms);

    bool  passed() const;
    float passedMs() const;
    float duration() const;

    // ms left until the timer passes, never negative
    int   remainingMs() const;

  private:
    std::chrono::steady_clock::time_point m_tStart;
    float                                 m_fDuration;
};
