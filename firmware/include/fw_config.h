#pragma once

// ============================
// Firmware Version Definition
// ============================

#define FW_NAME "booth-lights"

// Major version number (increment on breaking host protocol changes)
#define FW_VERSION_MAJOR 1

// Minor version (add new phases or commands)
#define FW_VERSION_MINOR 0

// Patch version (bug fixes)
#define FW_VERSION_PATCH 0

// String form
#define STR_HELPER(x) #x
#define STR(x) STR_HELPER(x)

#define FW_VERSION_STRING  \
    STR(FW_VERSION_MAJOR) "." STR(FW_VERSION_MINOR) "." STR(FW_VERSION_PATCH)


// ============================
// Build Metadata
// ============================

// Auto-insert build date/time (gcc predefined macros)
#define FW_BUILD_DATE __DATE__
#define FW_BUILD_TIME __TIME__

// Optional git hash, injected by the build with -DFW_BUILD_HASH=\"...\"
#ifndef FW_BUILD_HASH
#define FW_BUILD_HASH "dev"
#endif
