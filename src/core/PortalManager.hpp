#pragma once

#include <memory>
#include <sdbus-c++/sdbus-c++.h>
#include <hyprlang.hpp>

#include "../portals/Screencast.hpp"
#include "../includes.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

#define XDPSR_SERVICE_NAME "org.freedesktop.impl.portal.desktop.screenrecorder"

class CPortalManager {
  public:
    CPortalManager(std::optional<std::string> configPath = std::nullopt);

    void                init();

    // runs fn on the event loop thread. Safe to call from any thread.
    void                dispatchOnLoop(std::function<void()> fn);

    struct {
        std::unique_ptr<CScreencastPortal> screencast;
    } m_sPortals;

    struct {
        std::unique_ptr<Hyprlang::CConfig> config;
        std::string                        path;
    } m_sConfig;

    // safe to call from a signal handler
    void terminate();

  private:
    void                                startEventLoop();
    void                                drainDispatchQueue();

    std::string                         getConfiguredSocketPath();
    int                                 getConfiguredTimeout();

    std::atomic<bool>                   m_bTerminate = false;

    std::unique_ptr<sdbus::IConnection> m_pConnection;

    struct {
        int                                wakeFd = -1;
        std::mutex                         queueMutex;
        std::vector<std::function<void()>> queue;
    } m_sEventLoopInternals;
};

inline std::unique_ptr<CPortalManager> g_pPortalManager;
