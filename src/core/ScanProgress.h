#pragma once
#include "Discovery.h"
#include "Scanner.h"
#include <mutex>
#include <optional>

namespace rack_scan {

// The one shared aggregate of a run. Host tasks mutate it only through these
// methods; the mutex is held for the counter update alone, never across I/O.
class ScanProgress {
public:
    ScanProgress(DiscoveryScan initial, int report_interval);

    void set_total(int total);
    void record_found();
    // Counts one finished host (probed, skipped or failed). Returns a snapshot
    // when this host hits a reporting milestone (every Nth host, or the last).
    std::optional<DiscoveryScan> record_scanned();

    void complete(const std::string& note = "");
    void fail(const std::string& message);
    DiscoveryScan snapshot() const;
    const std::string& scan_id() const { return id_; } // fixed at construction

    // Delivers a snapshot to on_update. Deliveries are serialized and a
    // snapshot older than one already delivered is dropped.
    void report(const DiscoveryScan& snap, const ScanUpdateFn& on_update);
private:
    const std::string id_;
    mutable std::mutex mutex_;
    DiscoveryScan scan_;
    int interval_;

    std::mutex report_mutex_;
    int last_reported_scanned_ = -1;
    bool terminal_reported_ = false;
};

}
