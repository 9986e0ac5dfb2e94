#include "ScanProgress.h"
#include "Logging.h"
#include <chrono>

namespace rack_scan {

ScanProgress::ScanProgress(DiscoveryScan initial, int report_interval)
    : id_(initial.id), scan_(std::move(initial)), interval_(report_interval > 0 ? report_interval : 1) {}

void ScanProgress::set_total(int total){
    std::lock_guard<std::mutex> lock(mutex_);
    scan_.total_hosts = total;
}

void ScanProgress::record_found(){
    std::lock_guard<std::mutex> lock(mutex_);
    ++scan_.found_hosts;
}

std::optional<DiscoveryScan> ScanProgress::record_scanned(){
    std::lock_guard<std::mutex> lock(mutex_);
    ++scan_.scanned_hosts;
    if(scan_.total_hosts > 0)
        scan_.progress_percent = static_cast<double>(scan_.scanned_hosts) / static_cast<double>(scan_.total_hosts) * 100.0;
    bool milestone = scan_.scanned_hosts % interval_ == 0 || scan_.scanned_hosts == scan_.total_hosts;
    if(!milestone) return std::nullopt;
    return scan_;
}

void ScanProgress::complete(const std::string& note){
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    scan_.status = ScanStatus::Completed;
    scan_.completed_at = now;
    scan_.progress_percent = 100.0;
    if(!note.empty()) scan_.error_message = note;
    if(scan_.started_at)
        scan_.duration_seconds = static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(now - *scan_.started_at).count());
}

void ScanProgress::fail(const std::string& message){
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    scan_.status = ScanStatus::Failed;
    scan_.error_message = message;
    scan_.completed_at = now;
    if(scan_.started_at)
        scan_.duration_seconds = static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(now - *scan_.started_at).count());
}

DiscoveryScan ScanProgress::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scan_;
}

void ScanProgress::report(const DiscoveryScan& snap, const ScanUpdateFn& on_update){
    if(!on_update) return;
    // report_mutex_ is held across on_update so deliveries stay ordered. Only
    // milestone reports contend for it; counter updates use mutex_ alone.
    std::lock_guard<std::mutex> lock(report_mutex_);
    if(terminal_reported_) return;
    if(!snap.terminal() && snap.scanned_hosts < last_reported_scanned_) return; // stale
    last_reported_scanned_ = snap.scanned_hosts;
    if(snap.terminal()) terminal_reported_ = true;
    try {
        on_update(snap);
    } catch(const std::exception& ex) {
        Logger::instance().error("Scan update callback failed", {{"scan_id", snap.id}, {"error", ex.what()}});
    }
}

}
