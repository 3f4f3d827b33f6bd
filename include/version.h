#pragma once

// Define version components
#define FLUENT_REQUEST_VERSION_MAJOR 0
#define FLUENT_REQUEST_VERSION_MINOR 1
#define FLUENT_REQUEST_VERSION_PATCH 0

// Helper macros for string conversion
#define FLUENT_REQUEST_STRINGIFY(x) #x
#define FLUENT_REQUEST_TOSTRING(x) FLUENT_REQUEST_STRINGIFY(x)

// Version as string in format "MAJOR.MINOR.PATCH"
#define FLUENT_REQUEST_VERSION_STRING                      \
    FLUENT_REQUEST_TOSTRING(FLUENT_REQUEST_VERSION_MAJOR) "." \
    FLUENT_REQUEST_TOSTRING(FLUENT_REQUEST_VERSION_MINOR) "." \
    FLUENT_REQUEST_TOSTRING(FLUENT_REQUEST_VERSION_PATCH)
