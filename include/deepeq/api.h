// api.h - DLL export/import macros for deepeq

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for deepeq library.
///
/// Usage:
/// - When building deepeq as a SHARED library:
///   - CMake automatically defines DEEPEQ_EXPORTS (private) and DEEPEQ_SHARED (public)
///   - Functions/classes marked with DEEPEQ_API will be exported
///
/// - When using deepeq as a SHARED library:
///   - Link against deepeq target (CMake propagates DEEPEQ_SHARED)
///   - Functions/classes marked with DEEPEQ_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, DEEPEQ_API expands to nothing
///
/// Example:
/// @code
/// class DEEPEQ_API MyClass { ... };           // Export entire class
/// DEEPEQ_API void my_function();              // Export free function
/// @endcode

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    // Windows platform (MSVC, MinGW, Clang-CL)
    #ifdef DEEPEQ_SHARED
        #ifdef DEEPEQ_EXPORTS
            // Building the DLL: export symbols
            #define DEEPEQ_API __declspec(dllexport)
        #else
            // Using the DLL: import symbols
            #define DEEPEQ_API __declspec(dllimport)
        #endif
    #else
        // Static library: no decoration needed
        #define DEEPEQ_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    // GCC/Clang on Unix-like platforms
    #if defined(DEEPEQ_SHARED) && defined(DEEPEQ_EXPORTS)
        // Building shared library: set default visibility
        #define DEEPEQ_API __attribute__((visibility("default")))
    #else
        // Static library or using shared library
        #define DEEPEQ_API
    #endif
#else
    // Unknown compiler: no decoration
    #define DEEPEQ_API
#endif
