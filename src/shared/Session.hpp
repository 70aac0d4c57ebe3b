#pragma once

#include <functional>
#include <memory>
#include <sdbus-c++/sdbus-c++.h>

enum eHandleObjectKind
{
    HANDLE_OBJECT_SESSION = 0, // org.freedesktop.impl.portal.Session, Close
    HANDLE_OBJECT_REQUEST,     // org.freedesktop.impl.portal.Request, Close
};

// A bus object living at a session or request handle the broker gave us.
struct SHandleObject {
    eHandleObjectKind               kind = HANDLE_OBJECT_SESSION;
    sdbus::ObjectPath               handle;
    std::unique_ptr<sdbus::IObject> object;

    // called from the object's Close, on the event loop thread
    std::function<void()>           onClose;
};

std::unique_ptr<SHandleObject> exportHandleObject(sdbus::IConnection& connection, sdbus::ObjectPath handle, eHandleObjectKind kind);
