#pragma once

#include <sdbus-c++/sdbus-c++.h>

typedef std::unordered_map<std::string, sdbus::Variant>               dbVardict;
typedef sdbus::Struct<uint32_t, std::unordered_map<std::string, sdbus::Variant>> dbUasv;
typedef sdbus::Result<uint32_t, std::unordered_map<std::string, sdbus::Variant>> dbUasvResult;

// org.freedesktop.impl.portal.Request response codes
enum ePortalResponse : uint32_t
{
    PORTAL_RESPONSE_SUCCESS     = 0,
    PORTAL_RESPONSE_CANCELLED   = 1,
    PORTAL_RESPONSE_OTHER_ERROR = 2,
};
