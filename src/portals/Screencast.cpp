#include "Screencast.hpp"
#include "../core/PortalManager.hpp"
#include "../helpers/Log.hpp"

#include <algorithm>
#include <limits>

template <typename T>
static std::optional<T> optionValue(const dbVardict& options, const std::string& key) {
    const auto IT = options.find(key);
    if (IT == options.end())
        return std::nullopt;

    if (!IT->second.containsValueOfType<T>()) {
        Debug::log(WARN, "[screencast] option {} has unexpected type {}, using default", key, IT->second.peekValueType());
        return std::nullopt;
    }

    return IT->second.get<T>();
}

// restore_data we handed out earlier: ("screenrecorder", 1, <a{sv} with "id">)
static std::optional<std::string> restoreTokenFromRestoreData(const dbVardict& options) {
    const auto RESTOREDATA = optionValue<dbRestoreData>(options, "restore_data");
    if (!RESTOREDATA)
        return std::nullopt;

    const auto ISSUER  = RESTOREDATA->get<0>();
    const auto VERSION = RESTOREDATA->get<1>();
    const auto DATA    = RESTOREDATA->get<2>();

    if (ISSUER != XDPSR_RESTORE_ISSUER) {
        Debug::log(LOG, "[screencast] restore data from {}, ignoring", ISSUER);
        return std::nullopt;
    }

    if (VERSION != XDPSR_RESTORE_VERSION) {
        Debug::log(LOG, "[screencast] restore data ver {} unsupported, ignoring", VERSION);
        return std::nullopt;
    }

    if (!DATA.containsValueOfType<dbVardict>())
        return std::nullopt;

    return optionValue<std::string>(DATA.get<dbVardict>(), "id");
}

uint32_t portalSourceTypeFor(eSelectionSourceType type) {
    switch (type) {
        case SELECTION_SOURCE_WINDOW: return SOURCE_WINDOW;
        case SELECTION_SOURCE_MONITOR:
        case SELECTION_SOURCE_REGION:
        default: break;
    }
    return SOURCE_MONITOR;
}

SSourceSelectOptions parseSelectSourcesOptions(const dbVardict& options) {
    SSourceSelectOptions parsed;

    if (const auto V = optionValue<uint32_t>(options, "types"); V)
        parsed.sourceTypes = *V;
    if (const auto V = optionValue<uint32_t>(options, "cursor_mode"); V)
        parsed.cursorMode = *V;
    if (const auto V = optionValue<uint32_t>(options, "persist_mode"); V)
        parsed.persistMode = *V;

    parsed.restoreToken = optionValue<std::string>(options, "restore_token");
    if (!parsed.restoreToken)
        parsed.restoreToken = restoreTokenFromRestoreData(options);

    for (auto& [key, val] : options) {
        if (key != "types" && key != "cursor_mode" && key != "persist_mode" && key != "restore_token" && key != "restore_data")
            Debug::log(LOG, "[screencast] unused option {}", key);
    }

    return parsed;
}

static int32_t clampToI32(uint32_t v) {
    return (int32_t)std::min<uint32_t>(v, std::numeric_limits<int32_t>::max());
}

dbVardict buildStreamProperties(const SSelection& selection) {
    dbVardict props;
    props["source_type"] = sdbus::Variant{uint32_t{portalSourceTypeFor(selection.sourceType)}};
    props["id"]          = sdbus::Variant{selection.sourceID};

    if (selection.geometry.has_value()) {
        props["position"] = sdbus::Variant{sdbus::Struct<int32_t, int32_t>{selection.geometry->x, selection.geometry->y}};
        props["size"]     = sdbus::Variant{sdbus::Struct<int32_t, int32_t>{clampToI32(selection.geometry->width), clampToI32(selection.geometry->height)}};
    }

    return props;
}

static dbRestoreData buildRestoreData(const SSelection& selection) {
    dbVardict data;
    data["source_type"] = sdbus::Variant{sourceTypeToString(selection.sourceType)};
    data["id"]          = sdbus::Variant{selection.sourceID};

    return dbRestoreData{XDPSR_RESTORE_ISSUER, XDPSR_RESTORE_VERSION, sdbus::Variant{data}};
}

//

CScreencastPortal::CScreencastPortal(SP<ISelectionSource> source) : m_pSource(source) {
    ;
}

CScreencastPortal::~CScreencastPortal() {
    waitForPendingStarts();
}

void CScreencastPortal::waitForPendingStarts() {
    std::lock_guard<std::mutex> lg(m_mWorkersLock);

    if (!m_vWorkers.empty())
        Debug::log(LOG, "[screencast] waiting for {} Start call(s) in flight", m_vWorkers.size());

    for (auto& w : m_vWorkers) {
        if (w->thread.joinable())
            w->thread.join();
    }

    m_vWorkers.clear();
}

CSessionRegistry& CScreencastPortal::sessions() {
    return m_sessions;
}

void CScreencastPortal::setRestoreTokensEnabled(bool enabled) {
    m_bRestoreTokens = enabled;
}

dbUasv CScreencastPortal::onCreateSession(sdbus::ObjectPath requestHandle, sdbus::ObjectPath sessionHandle, std::string appID, dbVardict opts) {
    Debug::log(LOG, "[screencast] New session:");
    Debug::log(LOG, "[screencast]  | {}", requestHandle.c_str());
    Debug::log(LOG, "[screencast]  | {}", sessionHandle.c_str());
    Debug::log(LOG, "[screencast]  | appid: {}", appID);

    m_sessions.create(sessionHandle);

    if (m_pConnection && !m_mBusSessions.contains(sessionHandle)) {
        try {
            auto       session = exportHandleObject(*m_pConnection, sessionHandle, HANDLE_OBJECT_SESSION);
            const auto HANDLE  = std::string{sessionHandle};
            session->onClose   = [this, HANDLE]() { onSessionClosed(HANDLE); };
            m_mBusSessions.emplace(sessionHandle, std::move(session));
        } catch (sdbus::Error& e) {
            Debug::log(ERR, "[screencast] couldn't export session object {}: {}", sessionHandle.c_str(), e.what());
        }
    }

    return {PORTAL_RESPONSE_SUCCESS, {}};
}

dbUasv CScreencastPortal::onSelectSources(sdbus::ObjectPath requestHandle, sdbus::ObjectPath sessionHandle, std::string appID, dbVardict opts) {
    Debug::log(LOG, "[screencast] SelectSources:");
    Debug::log(LOG, "[screencast]  | {}", requestHandle.c_str());
    Debug::log(LOG, "[screencast]  | {}", sessionHandle.c_str());
    Debug::log(LOG, "[screencast]  | appid: {}", appID);

    const auto OPTIONS = parseSelectSourcesOptions(opts);

    Debug::log(LOG, "[screencast] options: types {} cursor_mode {} persist_mode {} restore_token {}", OPTIONS.sourceTypes, OPTIONS.cursorMode, OPTIONS.persistMode,
               OPTIONS.restoreToken.value_or("<none>"));

    // an unknown session is logged by the registry. The broker can't do anything about it.
    m_sessions.update(sessionHandle, OPTIONS);

    return {PORTAL_RESPONSE_SUCCESS, {}};
}

dbUasv CScreencastPortal::onStart(sdbus::ObjectPath requestHandle, sdbus::ObjectPath sessionHandle, std::string appID, std::string parentWindow, dbVardict opts) {
    Debug::log(LOG, "[screencast] Start:");
    Debug::log(LOG, "[screencast]  | {}", requestHandle.c_str());
    Debug::log(LOG, "[screencast]  | {}", sessionHandle.c_str());
    Debug::log(LOG, "[screencast]  | appid: {}", appID);
    Debug::log(LOG, "[screencast]  | parent_window: {}", parentWindow);

    auto session = m_sessions.get(sessionHandle);
    if (!session) {
        Debug::log(WARN, "[screencast] Start: unknown session {}, querying with defaults", sessionHandle.c_str());
        session = SScreencastSession{};
    }

    const SSelectionQuery QUERY = {
        .sourceTypes  = session->sourceTypes,
        .cursorMode   = session->cursorMode,
        .restoreToken = session->restoreToken,
    };

    // no lock held here, this is the slow part
    const auto REPLY = m_pSource->querySelection(QUERY);

    if (!REPLY) {
        Debug::log(ERR, "[screencast] Start: couldn't reach the screen recorder: {}", REPLY.error());
        return {PORTAL_RESPONSE_CANCELLED, {}};
    }

    if (std::holds_alternative<SNoSelection>(*REPLY)) {
        Debug::log(WARN, "[screencast] Start: the screen recorder has no selection, cancelling");
        return {PORTAL_RESPONSE_CANCELLED, {}};
    }

    if (const auto* PERROR = std::get_if<SSelectionError>(&*REPLY)) {
        Debug::log(ERR, "[screencast] Start: the screen recorder reported an error: {}", PERROR->message);
        return {PORTAL_RESPONSE_CANCELLED, {}};
    }

    const auto& SELECTION = std::get<SSelection>(*REPLY);

    Debug::log(LOG, "[screencast] Start: got selection type {} id {}{}", sourceTypeToString(SELECTION.sourceType), SELECTION.sourceID,
               SELECTION.geometry ? std::format(" geometry {},{} {}x{}", SELECTION.geometry->x, SELECTION.geometry->y, SELECTION.geometry->width, SELECTION.geometry->height) : "");

    const auto                                           STREAMPROPS = buildStreamProperties(SELECTION);

    // node id 0: the broker resolves the source id to a real node
    std::vector<dbUasv>                                  streams = {dbUasv{0, STREAMPROPS}};

    std::unordered_map<std::string, sdbus::Variant> results;
    results["streams"]     = sdbus::Variant{streams};
    results["source_type"] = sdbus::Variant{uint32_t{portalSourceTypeFor(SELECTION.sourceType)}};

    if (session->persistMode != PERSIST_NONE && m_bRestoreTokens) {
        results["persist_mode"] = sdbus::Variant{uint32_t{session->persistMode}};
        results["restore_data"] = sdbus::Variant{buildRestoreData(SELECTION)};
        Debug::log(LOG, "[screencast] Sent restore data to {}", sessionHandle.c_str());
    }

    return {PORTAL_RESPONSE_SUCCESS, results};
}

void CScreencastPortal::startAsync(dbUasvResult&& result, sdbus::ObjectPath requestHandle, sdbus::ObjectPath sessionHandle, std::string appID, std::string parentWindow,
                                   dbVardict opts) {
    if (m_pConnection && !m_mBusRequests.contains(requestHandle)) {
        try {
            auto       request = exportHandleObject(*m_pConnection, requestHandle, HANDLE_OBJECT_REQUEST);
            const auto HANDLE  = std::string{requestHandle};
            request->onClose   = [HANDLE]() { Debug::log(LOG, "[screencast] request {} closed by the broker while in flight", HANDLE); };
            m_mBusRequests.emplace(requestHandle, std::move(request));
        } catch (sdbus::Error& e) { Debug::log(ERR, "[screencast] couldn't export request object {}: {}", requestHandle.c_str(), e.what()); }
    }

    // Result is move-only, std::function wants copies
    auto pResult = std::make_shared<dbUasvResult>(std::move(result));

    runStart(
        [this, pResult, requestHandle](dbUasv reply) {
            g_pPortalManager->dispatchOnLoop([this, pResult, reply, requestHandle]() {
                pResult->returnResults(std::get<0>(reply), std::get<1>(reply));
                m_mBusRequests.erase(requestHandle);
            });
        },
        requestHandle, sessionHandle, appID, parentWindow, opts);
}

void CScreencastPortal::runStart(std::function<void(dbUasv)> done, sdbus::ObjectPath requestHandle, sdbus::ObjectPath sessionHandle, std::string appID,
                                 std::string parentWindow, dbVardict opts) {
    reapWorkers();

    {
        std::lock_guard<std::mutex> lg(m_mWorkersLock);

        const auto                  PENDING = std::count_if(m_vWorkers.begin(), m_vWorkers.end(), [](const auto& w) { return !w->done; });

        if ((size_t)PENDING < m_iMaxPendingStarts) {
            const auto PWORKER = m_vWorkers.emplace_back(std::make_unique<SStartWorker>()).get();

            PWORKER->thread = std::thread([this, PWORKER, done, requestHandle, sessionHandle, appID, parentWindow, opts]() {
                done(onStart(requestHandle, sessionHandle, appID, parentWindow, opts));
                PWORKER->done = true;
            });

            return;
        }

        Debug::log(WARN, "[screencast] Start: {} calls already in flight, cancelling {}", PENDING, requestHandle.c_str());
    }

    done(dbUasv{PORTAL_RESPONSE_CANCELLED, {}});
}

size_t CScreencastPortal::pendingStarts() {
    std::lock_guard<std::mutex> lg(m_mWorkersLock);
    return std::count_if(m_vWorkers.begin(), m_vWorkers.end(), [](const auto& w) { return !w->done; });
}

void CScreencastPortal::setMaxPendingStarts(size_t max) {
    m_iMaxPendingStarts = max;
}

void CScreencastPortal::reapWorkers() {
    std::lock_guard<std::mutex> lg(m_mWorkersLock);

    std::erase_if(m_vWorkers, [](const auto& w) {
        if (!w->done)
            return false;

        if (w->thread.joinable())
            w->thread.join();

        return true;
    });
}

void CScreencastPortal::onSessionClosed(const std::string& handle) {
    Debug::log(LOG, "[screencast] Session {} closed", handle);

    m_sessions.remove(handle);

    // we are inside the object's own Close handler, drop it after the dispatch returns
    g_pPortalManager->dispatchOnLoop([this, handle]() { m_mBusSessions.erase(handle); });
}

void CScreencastPortal::registerObject(sdbus::IConnection& connection) {
    m_pConnection = &connection;

    m_pObject = sdbus::createObject(connection, OBJECT_PATH);

    m_pObject
        ->addVTable(sdbus::registerMethod("CreateSession")
                        .implementedAs([this](sdbus::ObjectPath o1, sdbus::ObjectPath o2, std::string s1, dbVardict m1) { return onCreateSession(o1, o2, s1, m1); }),
                    sdbus::registerMethod("SelectSources")
                        .implementedAs([this](sdbus::ObjectPath o1, sdbus::ObjectPath o2, std::string s1, dbVardict m1) { return onSelectSources(o1, o2, s1, m1); }),
                    sdbus::registerMethod("Start").implementedAs([this](dbUasvResult&& result, sdbus::ObjectPath o1, sdbus::ObjectPath o2, std::string s1, std::string s2,
                                                                        dbVardict m1) { startAsync(std::move(result), o1, o2, s1, s2, m1); }),
                    sdbus::registerProperty("AvailableSourceTypes").withGetter([]() { return uint32_t{SOURCE_MONITOR | SOURCE_WINDOW}; }),
                    sdbus::registerProperty("AvailableCursorModes").withGetter([]() { return uint32_t{CURSOR_EMBEDDED}; }),
                    sdbus::registerProperty("Version").withGetter([]() { return uint32_t{4}; }),
                    // xdg-desktop-portal reads the lower-case name
                    sdbus::registerProperty("version").withGetter([]() { return uint32_t{4}; }))
        .forInterface(INTERFACE_NAME);

    Debug::log(LOG, "[screencast] init successful");
}
