#pragma once

// Define version components
#define ZUUID_VERSION_MAJOR 0
#define ZUUID_VERSION_MINOR 2
#define ZUUID_VERSION_PATCH 0

// Helper macros for string conversion
#define ZUUID_STRINGIFY(x) #x
#define ZUUID_TOSTRING(x) ZUUID_STRINGIFY(x)

// Version as string in format "MAJOR.MINOR.PATCH"
#define ZUUID_VERSION_STRING ZUUID_TOSTRING(ZUUID_VERSION_MAJOR) "." ZUUID_TOSTRING(ZUUID_VERSION_MINOR) "." ZUUID_TOSTRING(ZUUID_VERSION_PATCH)
