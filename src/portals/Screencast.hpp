#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include <sdbus-c++/sdbus-c++.h>

#include "../includes.hpp"
#include "../dbusDefines.hpp"
#include "../shared/Session.hpp"
#include "../shared/SessionRegistry.hpp"
#include "../shared/SelectionClient.hpp"

#define XDPSR_RESTORE_ISSUER  "screenrecorder"
#define XDPSR_RESTORE_VERSION 1

// Start workers allowed in flight at once. Each one lives at most the ipc timeout.
#define XDPSR_MAX_PENDING_STARTS 16

typedef sdbus::Struct<std::string, uint32_t, sdbus::Variant> dbRestoreData;

// Broker source type code for what the companion picked. Regions are full monitors cropped downstream.
uint32_t             portalSourceTypeFor(eSelectionSourceType type);

// Typed view of a SelectSources option bag. Missing or ill-typed options get their defaults.
SSourceSelectOptions parseSelectSourcesOptions(const dbVardict& options);

// The property map of one stream descriptor: source_type, id and, with geometry, position and size.
dbVardict            buildStreamProperties(const SSelection& selection);

class CScreencastPortal {
  public:
    CScreencastPortal(SP<ISelectionSource> source);
    ~CScreencastPortal();

    // exports org.freedesktop.impl.portal.ScreenCast. Handlers work without it.
    void              registerObject(sdbus::IConnection& connection);

    dbUasv            onCreateSession(sdbus::ObjectPath requestHandle, sdbus::ObjectPath sessionHandle, std::string appID, dbVardict opts);
    dbUasv            onSelectSources(sdbus::ObjectPath requestHandle, sdbus::ObjectPath sessionHandle, std::string appID, dbVardict opts);

    // blocks for up to the ipc timeout. On the bus it runs on a worker, see startAsync
    dbUasv            onStart(sdbus::ObjectPath requestHandle, sdbus::ObjectPath sessionHandle, std::string appID, std::string parentWindow, dbVardict opts);

    // runs onStart on a worker thread and hands the response to done, on that worker.
    // Over the pending limit done gets CANCELLED right away.
    void              runStart(std::function<void(dbUasv)> done, sdbus::ObjectPath requestHandle, sdbus::ObjectPath sessionHandle, std::string appID,
                               std::string parentWindow, dbVardict opts);

    size_t            pendingStarts();
    void              setMaxPendingStarts(size_t max);

    void              setRestoreTokensEnabled(bool enabled);

    // joins every worker still answering a Start
    void              waitForPendingStarts();

    CSessionRegistry& sessions();

  private:
    struct SStartWorker {
        std::thread       thread;
        std::atomic<bool> done = false;
    };

    void                                                           startAsync(dbUasvResult&& result, sdbus::ObjectPath requestHandle, sdbus::ObjectPath sessionHandle,
                                                                              std::string appID, std::string parentWindow, dbVardict opts);
    void                                                           reapWorkers();
    void                                                           onSessionClosed(const std::string& handle);

    SP<ISelectionSource>                                           m_pSource;
    CSessionRegistry                                               m_sessions;
    std::atomic<bool>                                              m_bRestoreTokens = true;
    std::atomic<size_t>                                            m_iMaxPendingStarts = XDPSR_MAX_PENDING_STARTS;

    std::unique_ptr<sdbus::IObject>                                m_pObject;
    sdbus::IConnection*                                            m_pConnection = nullptr;

    // bus objects, only touched from the event loop thread
    std::unordered_map<std::string, std::unique_ptr<SHandleObject>> m_mBusSessions;
    std::unordered_map<std::string, std::unique_ptr<SHandleObject>> m_mBusRequests;

    std::mutex                                                     m_mWorkersLock;
    std::vector<std::unique_ptr<SStartWorker>>                     m_vWorkers;

    const sdbus::InterfaceName                                     INTERFACE_NAME = sdbus::InterfaceName{"org.freedesktop.impl.portal.ScreenCast"};
    const sdbus::ObjectPath                                        OBJECT_PATH    = sdbus::ObjectPath{"/org/freedesktop/portal/desktop"};
};
