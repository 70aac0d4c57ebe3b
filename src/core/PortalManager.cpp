#include "PortalManager.hpp"
#include "../helpers/Log.hpp"

#include <algorithm>
#include <any>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#define QUERY_TIMEOUT_MIN_MS 100
#define QUERY_TIMEOUT_MAX_MS 30000

CPortalManager::CPortalManager(std::optional<std::string> configPath) {
    if (configPath.has_value())
        m_sConfig.path = *configPath;
    else {
        const auto XDG_CONFIG_HOME = getenv("XDG_CONFIG_HOME");
        const auto HOME            = getenv("HOME");

        if (!HOME && !XDG_CONFIG_HOME)
            Debug::log(WARN, "[config] neither $HOME nor $XDG_CONFIG_HOME is present in env");

        m_sConfig.path = (!XDG_CONFIG_HOME && !HOME) ?
            "/tmp/xdpsr.conf" :
            (XDG_CONFIG_HOME ? std::string{XDG_CONFIG_HOME} + "/hypr/xdpsr.conf" : std::string{HOME} + "/.config/hypr/xdpsr.conf");
    }

    m_sConfig.config = std::make_unique<Hyprlang::CConfig>(m_sConfig.path.c_str(), Hyprlang::SConfigOptions{.allowMissingConfig = true});

    m_sConfig.config->addConfigValue("general:socket_path", Hyprlang::STRING{""});
    m_sConfig.config->addConfigValue("general:query_timeout_ms", Hyprlang::INT{XDPSR_DEFAULT_QUERY_TIMEOUT_MS});
    m_sConfig.config->addConfigValue("screencast:restore_tokens", Hyprlang::INT{1L});

    m_sConfig.config->commence();

    const auto RESULT = m_sConfig.config->parse();
    if (RESULT.error)
        Debug::log(ERR, "[config] error parsing {}: {}", m_sConfig.path, RESULT.getError());
    else
        Debug::log(LOG, "[config] using {}", m_sConfig.path);
}

std::string CPortalManager::getConfiguredSocketPath() {
    try {
        const auto VALUE = std::any_cast<Hyprlang::STRING>(m_sConfig.config->getConfigValue("general:socket_path"));
        if (VALUE && VALUE[0] != '\0')
            return VALUE;
    } catch (std::bad_any_cast& e) { Debug::log(WARN, "[config] general:socket_path is not a string, ignoring"); }

    return getDefaultSelectionSocketPath();
}

int CPortalManager::getConfiguredTimeout() {
    Hyprlang::INT value = XDPSR_DEFAULT_QUERY_TIMEOUT_MS;

    try {
        value = std::any_cast<Hyprlang::INT>(m_sConfig.config->getConfigValue("general:query_timeout_ms"));
    } catch (std::bad_any_cast& e) { Debug::log(WARN, "[config] general:query_timeout_ms is not an int, ignoring"); }

    const auto CLAMPED = std::clamp<Hyprlang::INT>(value, QUERY_TIMEOUT_MIN_MS, QUERY_TIMEOUT_MAX_MS);
    if (CLAMPED != value)
        Debug::log(WARN, "[config] general:query_timeout_ms {} out of range, using {}", value, CLAMPED);

    return (int)CLAMPED;
}

static bool getConfiguredRestoreTokens(Hyprlang::CConfig* config) {
    try {
        return std::any_cast<Hyprlang::INT>(config->getConfigValue("screencast:restore_tokens")) != 0;
    } catch (std::bad_any_cast& e) { Debug::log(WARN, "[config] screencast:restore_tokens is not an int, ignoring"); }

    return true;
}

void CPortalManager::init() {
    try {
        m_pConnection = sdbus::createSessionBusConnection(sdbus::ServiceName{XDPSR_SERVICE_NAME});
    } catch (std::exception& e) {
        Debug::log(CRIT, "[core] Couldn't create the dbus connection ({})", e.what());
        exit(1);
    }

    if (!m_pConnection) {
        Debug::log(CRIT, "[core] Couldn't connect to dbus");
        exit(1);
    }

    m_sEventLoopInternals.wakeFd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (m_sEventLoopInternals.wakeFd < 0) {
        Debug::log(CRIT, "[core] Couldn't create an eventfd: {}", strerror(errno));
        exit(1);
    }

    const auto SOCKET_PATH = getConfiguredSocketPath();
    const auto TIMEOUT     = getConfiguredTimeout();

    m_sPortals.screencast = std::make_unique<CScreencastPortal>(makeShared<CSelectionClient>(SOCKET_PATH, TIMEOUT));
    m_sPortals.screencast->setRestoreTokensEnabled(getConfiguredRestoreTokens(m_sConfig.config.get()));

    try {
        m_sPortals.screencast->registerObject(*m_pConnection);
    } catch (sdbus::Error& e) {
        Debug::log(CRIT, "[core] Couldn't export the screencast interface: {}", e.what());
        exit(1);
    }

    Debug::log(LOG, "[core] Asking the screen recorder at {} (timeout {}ms)", SOCKET_PATH, TIMEOUT);

    startEventLoop();
}

void CPortalManager::startEventLoop() {
    while (!m_bTerminate) {
        const auto POLLDATA = m_pConnection->getEventLoopPollData();

        pollfd     pollfds[] = {
            {
                    .fd     = POLLDATA.fd,
                    .events = POLLDATA.events,
            },
            {
                    .fd     = POLLDATA.eventFd,
                    .events = POLLIN,
            },
            {
                    .fd     = m_sEventLoopInternals.wakeFd,
                    .events = POLLIN,
            },
        };

        // the bus may ask for an infinite wait. Cap it so a lost wakeup can't hang us.
        int timeout = POLLDATA.getPollTimeout();
        if (timeout < 0 || timeout > 5000)
            timeout = 5000;

        int ret = poll(pollfds, 3, timeout);
        if (ret < 0) {
            if (errno == EINTR)
                continue;

            Debug::log(CRIT, "[core] Polling fds failed with {}", strerror(errno));
            break;
        }

        if (pollfds[0].revents & POLLHUP) {
            Debug::log(CRIT, "[core] Disconnected from the bus");
            break;
        }

        if (pollfds[2].revents & POLLIN) {
            uint64_t count = 0;
            if (read(m_sEventLoopInternals.wakeFd, &count, sizeof(count)) < 0 && errno != EAGAIN)
                Debug::log(ERR, "[core] reading the wake fd failed: {}", strerror(errno));
        }

        if (m_bTerminate)
            break;

        while (m_pConnection->processPendingEvent()) {
            ;
        }

        drainDispatchQueue();
    }

    Debug::log(LOG, "[core] Shutting down");

    // let in-flight Start calls reply before the bus goes away
    m_sPortals.screencast->waitForPendingStarts();
    drainDispatchQueue();

    while (m_pConnection->processPendingEvent()) {
        ;
    }

    m_sPortals.screencast.reset();
    m_pConnection.reset();

    close(m_sEventLoopInternals.wakeFd);
    m_sEventLoopInternals.wakeFd = -1;
}

void CPortalManager::drainDispatchQueue() {
    std::vector<std::function<void()>> queue;

    {
        std::lock_guard<std::mutex> lg(m_sEventLoopInternals.queueMutex);
        queue.swap(m_sEventLoopInternals.queue);
    }

    for (auto& fn : queue) {
        fn();
    }
}

void CPortalManager::dispatchOnLoop(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lg(m_sEventLoopInternals.queueMutex);
        m_sEventLoopInternals.queue.emplace_back(std::move(fn));
    }

    if (m_sEventLoopInternals.wakeFd < 0)
        return;

    const uint64_t ONE = 1;
    if (write(m_sEventLoopInternals.wakeFd, &ONE, sizeof(ONE)) < 0)
        Debug::log(ERR, "[core] waking the event loop failed: {}", strerror(errno));
}

void CPortalManager::terminate() {
    m_bTerminate = true;

    if (m_sEventLoopInternals.wakeFd < 0)
        return;

    const uint64_t ONE = 1;
    // nothing to report from a signal handler if this fails, the poll timeout catches it
    (void)!write(m_sEventLoopInternals.wakeFd, &ONE, sizeof(ONE));
}
