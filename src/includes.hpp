#pragma once

#include <hyprutils/memory/SharedPtr.hpp>

using namespace Hyprutils::Memory;

#define SP CSharedPointer
