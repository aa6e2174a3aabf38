#pragma once

#define BULKGET_VERSION_MAJOR 0
#define BULKGET_VERSION_MINOR 3
#define BULKGET_VERSION_PATCH 0
#define BULKGET_VERSION_STRING "0.3.0"
