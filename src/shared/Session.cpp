#include "Session.hpp"
#include "../helpers/Log.hpp"

static void onCloseHandle(SHandleObject* obj) {
    if (!obj)
        return;

    Debug::log(TRACE, "[internal] Close on {} {}", obj->kind == HANDLE_OBJECT_SESSION ? "session" : "request", obj->handle.c_str());

    if (obj->onClose)
        obj->onClose();
}

std::unique_ptr<SHandleObject> exportHandleObject(sdbus::IConnection& connection, sdbus::ObjectPath handle, eHandleObjectKind kind) {
    Debug::log(TRACE, "[internal] Exporting {} object at {}", kind == HANDLE_OBJECT_SESSION ? "session" : "request", handle.c_str());

    auto       pObject = std::make_unique<SHandleObject>();
    const auto POBJECT = pObject.get();

    pObject->kind   = kind;
    pObject->handle = handle;
    pObject->object = sdbus::createObject(connection, handle);

    pObject->object->addVTable(sdbus::registerMethod("Close").implementedAs([POBJECT]() { onCloseHandle(POBJECT); }))
        .forInterface(std::string{kind == HANDLE_OBJECT_SESSION ? "org.freedesktop.impl.portal.Session" : "org.freedesktop.impl.portal.Request"});

    return pObject;
}
