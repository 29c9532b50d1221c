#pragma once

#define BEACON_VERSION_MAJOR 0
#define BEACON_VERSION_MINOR 3
#define BEACON_VERSION_PATCH 1
#define BEACON_VERSION_STRING "0.3.1"
