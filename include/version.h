// include/version.h
#pragma once

// Firmware identity (V1)
#define HHR_FIRMWARE_NAME "harmony-hub-remote"
#define HHR_FIRMWARE_VERSION "0.1.0-dev"

// Schema versions (V1)
#define HHR_CONFIG_SCHEMA_VERSION 1
#define HHR_LOG_SCHEMA_VERSION 1
#define HHR_CACHE_RECORD_VERSION 1

// Debug-level log lines are compiled out when 0.
#ifndef HHR_FEATURE_DEBUG_LOG
#define HHR_FEATURE_DEBUG_LOG 1
#endif

#ifndef HHR_FEATURE_WEB
#define HHR_FEATURE_WEB 1
#endif
