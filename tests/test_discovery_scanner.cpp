#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "scanners/DiscoveryScanner.h"
#include "core/MemoryStore.h"
#include "core/ScanContext.h"
#include "core/Config.h"
#include "core/Errors.h"
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace rack_scan {

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Invoke;
using ::testing::InvokeWithoutArgs;
using ::testing::StartsWith;
using ::testing::HasSubstr;
using ::testing::Not;

class MockReachability : public ReachabilityProbe {
public:
    MOCK_METHOD(std::optional<bool>, ping, (const std::string& ip, std::chrono::milliseconds timeout, const ScanContext& context), (override));
    MOCK_METHOD(bool, privileged, (), (const, override));
};

class MockIdentity : public IdentityProbe {
public:
    MOCK_METHOD(std::optional<std::string>, lookup_mac, (const std::string& ip, const ScanContext& context), (override));
    MOCK_METHOD(std::optional<std::string>, lookup_hostname, (const std::string& ip, const ScanContext& context), (override));
};

class MockPorts : public PortProbe {
public:
    MOCK_METHOD(std::vector<int>, scan_ports, (const std::string& ip, const DiscoveryRule& rule, const ScanContext& context), (override));
};

class MockServices : public ServiceProbe {
public:
    MOCK_METHOD(std::vector<ServiceInfo>, detect_services, (const std::string& ip, const std::vector<int>& ports, const ScanContext& context), (override));
};

// Rejects writes for one address; everything else goes to the in-memory store.
class FlakyStore : public MemoryStore {
public:
    explicit FlakyStore(std::string bad_ip) : bad_ip_(std::move(bad_ip)) {}
    void create_or_update_discovered_device(const DiscoveredDevice& device) override {
        if (device.ip == bad_ip_) throw StorageError("disk full");
        MemoryStore::create_or_update_discovered_device(device);
    }
private:
    std::string bad_ip_;
};

class DiscoveryScannerTest : public ::testing::Test {
protected:
    DiscoveryScannerTest() : context(cfg) {}

    void SetUp() override {
        add_network("net-1", "10.0.0.0/29"); // 10.0.0.1 - 10.0.0.6
        rule.timeout_seconds = 1;
    }

    void add_network(const std::string& id, const std::string& subnet) {
        Network n;
        n.id = id;
        n.name = id;
        n.subnet = subnet;
        store->add_network(n);
    }

    // Probes report nothing unless a test says otherwise.
    std::unique_ptr<DiscoveryScanner> make_scanner() {
        auto r = std::make_unique<NiceMock<MockReachability>>();
        auto i = std::make_unique<NiceMock<MockIdentity>>();
        auto p = std::make_unique<NiceMock<MockPorts>>();
        auto s = std::make_unique<NiceMock<MockServices>>();
        reach = r.get(); identity = i.get(); ports = p.get(); services = s.get();
        ON_CALL(*reach, ping(_, _, _)).WillByDefault(Return(std::optional<bool>(false)));
        ON_CALL(*reach, privileged()).WillByDefault(Return(true));
        ON_CALL(*identity, lookup_mac(_, _)).WillByDefault(Return(std::optional<std::string>()));
        ON_CALL(*identity, lookup_hostname(_, _)).WillByDefault(Return(std::optional<std::string>()));
        ON_CALL(*ports, scan_ports(_, _, _)).WillByDefault(Return(std::vector<int>{}));
        ON_CALL(*services, detect_services(_, _, _)).WillByDefault(Return(std::vector<ServiceInfo>{}));

        ProbeSet set;
        set.reachability = std::move(r);
        set.identity = std::move(i);
        set.ports = std::move(p);
        set.services = std::move(s);
        return std::make_unique<DiscoveryScanner>(*store, std::move(set));
    }

    DiscoveryScan run(DiscoveryScanner& scanner, const std::string& network_id = "net-1") {
        return scanner.scan_network(context, network_id, rule, [this](const DiscoveryScan& s) {
            std::lock_guard<std::mutex> lock(updates_mutex);
            updates.push_back(s);
            store->update_discovery_scan(s);
        });
    }

    Config cfg;
    ScanContext context;
    DiscoveryRule rule;
    std::unique_ptr<MemoryStore> store = std::make_unique<MemoryStore>();
    MockReachability* reach = nullptr;
    MockIdentity* identity = nullptr;
    MockPorts* ports = nullptr;
    MockServices* services = nullptr;
    std::mutex updates_mutex;
    std::vector<DiscoveryScan> updates;
};

TEST_F(DiscoveryScannerTest, RequiresEveryProbe) {
    auto build = [this] { return std::make_unique<DiscoveryScanner>(*store, ProbeSet{}); };
    EXPECT_THROW(build(), std::invalid_argument);
}

TEST_F(DiscoveryScannerTest, QuickScanKeepsOnlyIcmpResponders) {
    rule.scan_type = ScanType::Quick;
    auto scanner = make_scanner();
    ON_CALL(*reach, ping("10.0.0.2", _, _)).WillByDefault(Return(std::optional<bool>(true)));
    ON_CALL(*reach, ping("10.0.0.3", _, _)).WillByDefault(Return(std::optional<bool>())); // no privilege
    EXPECT_CALL(*ports, scan_ports(_, _, _)).Times(0);

    auto result = run(*scanner);

    EXPECT_EQ(result.status, ScanStatus::Completed);
    EXPECT_EQ(result.scan_depth, 1);
    EXPECT_EQ(result.total_hosts, 6);
    EXPECT_EQ(result.scanned_hosts, 6);
    EXPECT_EQ(result.found_hosts, 1);

    auto devices = store->list_discovered_devices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].ip, "10.0.0.2");
    EXPECT_EQ(devices[0].status, DeviceStatus::Online);
    EXPECT_EQ(devices[0].network_id, "net-1");
    EXPECT_EQ(devices[0].last_scan_id, result.id);
}

TEST_F(DiscoveryScannerTest, FullScanFallsBackToPortEvidence) {
    auto scanner = make_scanner();
    ON_CALL(*reach, ping(_, _, _)).WillByDefault(Return(std::optional<bool>()));
    ON_CALL(*ports, scan_ports("10.0.0.3", _, _)).WillByDefault(Return(std::vector<int>{22, 80}));
    ServiceInfo ssh;
    ssh.port = 22;
    ssh.service = "SSH";
    EXPECT_CALL(*services, detect_services("10.0.0.3", std::vector<int>{22, 80}, _))
        .WillOnce(Return(std::vector<ServiceInfo>{ssh}));
    EXPECT_CALL(*identity, lookup_mac(_, _)).Times(0);

    auto result = run(*scanner);

    EXPECT_EQ(result.status, ScanStatus::Completed);
    EXPECT_EQ(result.scan_depth, 3);
    EXPECT_EQ(result.found_hosts, 6);

    auto host = store->find_discovered_device("10.0.0.3");
    ASSERT_TRUE(host.has_value());
    EXPECT_EQ(host->status, DeviceStatus::Online);
    EXPECT_EQ(host->open_ports, (std::vector<int>{22, 80}));
    ASSERT_EQ(host->services.size(), 1u);
    EXPECT_EQ(host->os_guess, "Linux");
    EXPECT_EQ(host->os_family, "Unix");
    EXPECT_EQ(host->confidence, 65);

    auto quiet = store->find_discovered_device("10.0.0.1");
    ASSERT_TRUE(quiet.has_value());
    EXPECT_EQ(quiet->status, DeviceStatus::Unknown);
    EXPECT_EQ(quiet->os_guess, "Unknown");
    EXPECT_EQ(quiet->confidence, 55);
}

TEST_F(DiscoveryScannerTest, ResponsiveHostGetsIdentity) {
    auto scanner = make_scanner();
    ON_CALL(*reach, ping("10.0.0.1", _, _)).WillByDefault(Return(std::optional<bool>(true)));
    EXPECT_CALL(*identity, lookup_mac("10.0.0.1", _)).WillOnce(Return(std::optional<std::string>("aa:bb:cc:dd:ee:01")));
    EXPECT_CALL(*identity, lookup_hostname("10.0.0.1", _)).WillOnce(Return(std::optional<std::string>("gw.rack.local")));
    ON_CALL(*ports, scan_ports("10.0.0.1", _, _)).WillByDefault(Return(std::vector<int>{445}));

    run(*scanner);

    auto gw = store->find_discovered_device("10.0.0.1");
    ASSERT_TRUE(gw.has_value());
    EXPECT_EQ(gw->mac_address, "aa:bb:cc:dd:ee:01");
    EXPECT_EQ(gw->hostname, "gw.rack.local");
    EXPECT_EQ(gw->os_family, "Windows");
    EXPECT_EQ(gw->confidence, 100);
}

TEST_F(DiscoveryScannerTest, DisabledStagesAreSkipped) {
    rule.scan_ports = false;
    rule.service_detection = false;
    rule.os_detection = false;
    auto scanner = make_scanner();
    EXPECT_CALL(*ports, scan_ports(_, _, _)).Times(0);
    EXPECT_CALL(*services, detect_services(_, _, _)).Times(0);

    run(*scanner);

    auto d = store->find_discovered_device("10.0.0.1");
    ASSERT_TRUE(d.has_value());
    EXPECT_TRUE(d->os_guess.empty());
    EXPECT_TRUE(d->os_family.empty());
}

TEST_F(DiscoveryScannerTest, MissingNetworkFailsTheRun) {
    auto scanner = make_scanner();
    EXPECT_CALL(*reach, ping(_, _, _)).Times(0);

    try {
        run(*scanner, "nope");
        FAIL() << "expected ScanError";
    } catch (const ScanError& ex) {
        EXPECT_THAT(ex.what(), StartsWith("getting network: "));
    }

    ASSERT_GE(updates.size(), 2u);
    EXPECT_EQ(updates.front().status, ScanStatus::Running);
    const auto& last = updates.back();
    EXPECT_EQ(last.status, ScanStatus::Failed);
    EXPECT_EQ(last.scanned_hosts, 0);
    EXPECT_THAT(last.error_message, StartsWith("getting network: "));
    EXPECT_TRUE(last.completed_at.has_value());

    auto stored = store->find_scan(last.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, ScanStatus::Failed);
}

TEST_F(DiscoveryScannerTest, InvalidSubnetFailsTheRun) {
    add_network("broken", "10.0.0.0/40");
    auto scanner = make_scanner();
    EXPECT_CALL(*reach, ping(_, _, _)).Times(0);

    EXPECT_THROW(run(*scanner, "broken"), ScanError);
    ASSERT_FALSE(updates.empty());
    EXPECT_EQ(updates.back().status, ScanStatus::Failed);
    EXPECT_THAT(updates.back().error_message, StartsWith("generating IP list: "));
    EXPECT_TRUE(store->list_discovered_devices().empty());
}

TEST_F(DiscoveryScannerTest, OversizedSubnetFailsTheRun) {
    cfg.max_hosts = 100;
    add_network("big", "10.0.0.0/16");
    auto scanner = make_scanner();
    EXPECT_THROW(run(*scanner, "big"), ScanError);
    EXPECT_EQ(updates.back().status, ScanStatus::Failed);
    EXPECT_THAT(updates.back().error_message, StartsWith("generating IP list: subnet 10.0.0.0/16 has 65534 hosts"));
    EXPECT_THAT(updates.back().error_message, Not(HasSubstr("invalid CIDR")));
}

TEST_F(DiscoveryScannerTest, CompletionAccountsForEveryHost) {
    add_network("wide", "10.0.0.0/26"); // 62 hosts
    auto scanner = make_scanner();

    auto result = run(*scanner, "wide");

    EXPECT_EQ(result.status, ScanStatus::Completed);
    EXPECT_EQ(result.total_hosts, 62);
    EXPECT_EQ(result.scanned_hosts, 62);
    EXPECT_DOUBLE_EQ(result.progress_percent, 100.0);
    EXPECT_TRUE(result.started_at.has_value());
    EXPECT_TRUE(result.completed_at.has_value());
    EXPECT_GE(result.duration_seconds, 0);
    EXPECT_TRUE(result.error_message.empty());
    EXPECT_EQ(updates.back().id, result.id);
    EXPECT_EQ(updates.back().status, ScanStatus::Completed);
}

TEST_F(DiscoveryScannerTest, WorkerPoolIsBounded) {
    cfg.max_concurrent_hosts = 5;
    add_network("pool", "10.0.0.0/27"); // 30 hosts
    auto scanner = make_scanner();

    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};
    ON_CALL(*reach, ping(_, _, _)).WillByDefault(InvokeWithoutArgs([&]() {
        int now = ++in_flight;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        --in_flight;
        return std::optional<bool>(false);
    }));

    auto result = run(*scanner, "pool");

    EXPECT_EQ(result.scanned_hosts, 30);
    EXPECT_GE(peak.load(), 1);
    EXPECT_LE(peak.load(), 5);
}

TEST_F(DiscoveryScannerTest, ProgressUpdatesAreThrottledAndMonotonic) {
    cfg.progress_interval = 4;
    add_network("mid", "10.0.0.0/28"); // 14 hosts
    auto scanner = make_scanner();

    run(*scanner, "mid");

    // running, total known, milestones 4/8/12/14, final
    EXPECT_LE(updates.size(), 7u);
    EXPECT_GE(updates.size(), 3u);
    for (size_t i = 1; i < updates.size(); ++i)
        EXPECT_GE(updates[i].scanned_hosts, updates[i - 1].scanned_hosts);
    size_t terminal = 0;
    for (const auto& u : updates) if (u.terminal()) ++terminal;
    EXPECT_EQ(terminal, 1u);
    EXPECT_TRUE(updates.back().terminal());
    EXPECT_EQ(updates.back().scanned_hosts, 14);
}

TEST_F(DiscoveryScannerTest, ExcludedHostsAreSkippedButCounted) {
    rule.exclude_ips = {"10.0.0.2", "10.0.0.4/31"};
    auto scanner = make_scanner();
    EXPECT_CALL(*reach, ping("10.0.0.2", _, _)).Times(0);
    EXPECT_CALL(*reach, ping("10.0.0.4", _, _)).Times(0);
    EXPECT_CALL(*reach, ping("10.0.0.5", _, _)).Times(0);

    auto result = run(*scanner);

    EXPECT_EQ(result.scanned_hosts, 6);
    EXPECT_EQ(result.found_hosts, 3);
    EXPECT_FALSE(store->find_discovered_device("10.0.0.2").has_value());
    EXPECT_FALSE(store->find_discovered_device("10.0.0.5").has_value());
    EXPECT_TRUE(store->find_discovered_device("10.0.0.6").has_value());
}

TEST_F(DiscoveryScannerTest, StoreFailureDoesNotFailTheRun) {
    store = std::make_unique<FlakyStore>("10.0.0.3");
    add_network("net-1", "10.0.0.0/29");
    auto scanner = make_scanner();

    auto result = run(*scanner);

    EXPECT_EQ(result.status, ScanStatus::Completed);
    EXPECT_EQ(result.scanned_hosts, 6);
    EXPECT_EQ(result.found_hosts, 6);
    EXPECT_FALSE(store->find_discovered_device("10.0.0.3").has_value());
    EXPECT_EQ(store->list_discovered_devices().size(), 5u);
}

TEST_F(DiscoveryScannerTest, ProbeExceptionsStayWithTheirHost) {
    auto scanner = make_scanner();
    ON_CALL(*ports, scan_ports("10.0.0.4", _, _)).WillByDefault(Invoke(
        [](const std::string&, const DiscoveryRule&, const ScanContext&) -> std::vector<int> {
            throw std::runtime_error("probe exploded");
        }));

    auto result = run(*scanner);

    EXPECT_EQ(result.status, ScanStatus::Completed);
    EXPECT_EQ(result.scanned_hosts, 6);
    EXPECT_EQ(result.found_hosts, 5);
    EXPECT_FALSE(store->find_discovered_device("10.0.0.4").has_value());
}

TEST_F(DiscoveryScannerTest, CancellationStopsNewHosts) {
    cfg.max_concurrent_hosts = 1;
    auto scanner = make_scanner();
    EXPECT_CALL(*reach, ping(_, _, _)).WillOnce(InvokeWithoutArgs([this]() {
        context.cancel();
        return std::optional<bool>(false);
    }));
    EXPECT_CALL(*ports, scan_ports(_, _, _)).Times(0);

    auto result = run(*scanner);

    EXPECT_EQ(result.status, ScanStatus::Completed);
    EXPECT_EQ(result.error_message, "scan cancelled");
    EXPECT_EQ(result.scanned_hosts, result.total_hosts);
    EXPECT_LE(result.found_hosts, 1);
}

TEST_F(DiscoveryScannerTest, RescanOverwritesDevice) {
    auto scanner = make_scanner();
    ON_CALL(*ports, scan_ports("10.0.0.1", _, _)).WillByDefault(Return(std::vector<int>{22}));
    auto first = run(*scanner);
    auto before = store->find_discovered_device("10.0.0.1");
    ASSERT_TRUE(before.has_value());

    ON_CALL(*ports, scan_ports("10.0.0.1", _, _)).WillByDefault(Return(std::vector<int>{}));
    auto second = run(*scanner);
    auto after = store->find_discovered_device("10.0.0.1");
    ASSERT_TRUE(after.has_value());

    EXPECT_NE(first.id, second.id);
    EXPECT_EQ(after->id, before->id);
    EXPECT_EQ(after->last_scan_id, second.id);
    EXPECT_TRUE(after->open_ports.empty());
    EXPECT_EQ(after->status, DeviceStatus::Unknown);
}

}
