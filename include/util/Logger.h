#pragma once

#include <iostream>
#include <string>

// =============================================================================
// Simple Logging System for the Ocean Sweep Simulator
//
// Provides toggleable console output for following a run. Off by default so
// tests and batch runs stay quiet; the CLI turns it on with --verbose.
// =============================================================================

namespace Log {

    // Global logging enable flag - toggled by the CLI
    inline bool enabled = false;

    // Log categories for fine-grained control
    inline bool showConfig = true;
    inline bool showProgress = true;
    inline bool showClamps = false;     // one line per clamped position, noisy
    inline bool showUnderflow = true;

    // Core logging function
    template<typename... Args>
    inline void print(Args&&... args) {
        if (!enabled) return;
        (std::cout << ... << std::forward<Args>(args));
    }

    // Category-specific logging helpers
    template<typename... Args>
    inline void config(Args&&... args) {
        if (!enabled || !showConfig) return;
        (std::cout << ... << std::forward<Args>(args));
    }

    template<typename... Args>
    inline void progress(Args&&... args) {
        if (!enabled || !showProgress) return;
        (std::cout << ... << std::forward<Args>(args));
    }

    template<typename... Args>
    inline void clamp(Args&&... args) {
        if (!enabled || !showClamps) return;
        (std::cout << ... << std::forward<Args>(args));
    }

    template<typename... Args>
    inline void underflow(Args&&... args) {
        if (!enabled || !showUnderflow) return;
        (std::cout << ... << std::forward<Args>(args));
    }

} // namespace Log
