#pragma once
#include "Config.h"
#include <atomic>

namespace rack_scan {

// Per-run state handed to every stage. Cancellation is cooperative: stages
// check it before starting new work; in-flight probes run to their timeout.
struct ScanContext {
    explicit ScanContext(const Config& cfg) : config(cfg) {}
    ScanContext(const ScanContext&) = delete;
    ScanContext& operator=(const ScanContext&) = delete;

    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

    const Config& config;
private:
    std::atomic<bool> cancelled_{false};
};

}
