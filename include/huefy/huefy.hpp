// include/huefy/huefy.hpp
// Umbrella header for the Huefy C++ SDK.

#pragma once

#include "client.hpp"
#include "config.hpp"
#include "error.hpp"
#include "error_registry.hpp"
#include "models.hpp"
#include "retry.hpp"
#include "transport.hpp"
#include "types.hpp"

#define HUEFY_SDK_VERSION_MAJOR 1
#define HUEFY_SDK_VERSION_MINOR 0
#define HUEFY_SDK_VERSION_PATCH 0
#define HUEFY_SDK_VERSION "1.0.0"
