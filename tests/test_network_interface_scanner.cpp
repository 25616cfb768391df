#include "radarscope/scanner/NetworkInterfaceScanner.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>

using namespace radarscope;

namespace {

const char* const kProcNetDev =
    "Inter-|   Receive                                                |  Transmit\n"
    " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs drop fifo colls carrier compressed\n"
    "    lo:  123456    1500    0    0    0     0          0         0   123456     1500    0    0    0     0       0          0\n"
    "  eth0: 98765432 250000    0    0    0     0          0         0  1234567    20000    0    0    0     0       0          0\n"
    " wlan0: 5000000    4000    0    0    0     0          0         0   600000     3000    0    0    0     0       0          0\n"
    "docker0:      0       0    0    0    0     0          0         0        0        0    0    0    0     0       0          0\n";

const char* const kProcNetTcp =
    "  sl  local_address rem_address   st tx_queue rx_queue tr tm->when retrnsmt   uid  timeout inode\n"
    "   0: 0100007F:0016 00000000:0000 0A 00000000:00000000 00:00000000 00000000     0        0 11 1 0 100 0 0 10 0\n"
    "   1: 0F02000A:0016 0102000A:C350 01 00000000:00000000 00:00000000 00000000     0        0 12 1 0 100 0 0 10 0\n"
    "   2: 0F02000A:D431 22D8B85D:01BB 01 00000000:00000000 00:00000000 00000000  1000        0 13 1 0 100 0 0 10 0\n"
    "   3: 0F02000A:D432 22D8B85D:0050 01 00000000:00000000 00:00000000 00000000  1000        0 14 1 0 100 0 0 10 0\n"
    "   4: 0F02000A:D433 08080808:0035 06 00000000:00000000 00:00000000 00000000  1000        0 15 1 0 100 0 0 10 0\n"
    "   5: 0F02000A:D434 01010101:1F90 01 00000000:00000000 00:00000000 00000000  1000        0 16 1 0 100 0 0 10 0\n";

const char* const kProcNetTcp6 =
    "  sl  local_address                         remote_address                        st tx_queue rx_queue tr tm->when retrnsmt   uid  timeout inode\n"
    "   0: 00000000000000000000000001000000:1F90 0000000000000000FFFF00000100007F:01BB 01 00000000:00000000 00:00000000 00000000  1000        0 21 1 0 100 0 0 10 0\n"
    "   1: 00000000000000000000000001000000:0016 00000000000000000000000000000000:0000 0A 00000000:00000000 00:00000000 00000000     0        0 22 1 0 100 0 0 10 0\n";

class TempFile {
public:
    TempFile(const std::string& name, const std::string& content)
        : path_(::testing::TempDir() + name) {
        std::ofstream out(path_);
        out << content;
    }
    ~TempFile() { std::remove(path_.c_str()); }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

}  // namespace

TEST(NetworkInterfaceScannerTest, ParsesActiveInterfaces) {
    auto signals = NetworkInterfaceScanner::parseProcNetDev(kProcNetDev, 1000000);

    ASSERT_EQ(signals.size(), 2u);

    EXPECT_EQ(signals[0].name, "eth0 Interface");
    EXPECT_EQ(signals[0].kind, SignalKind::NETWORK);
    EXPECT_EQ(signals[0].strength, 100);
    EXPECT_DOUBLE_EQ(signals[0].distance, 1.0);

    EXPECT_EQ(signals[1].name, "wlan0 Interface");
    EXPECT_EQ(signals[1].kind, SignalKind::WIFI);
    EXPECT_EQ(signals[1].strength, 10);
    EXPECT_NEAR(signals[1].distance, 9.1, 1e-9);

    for (const auto& signal : signals) {
        EXPECT_EQ(signal.origin, SignalOrigin::REAL);
        EXPECT_GE(signal.angle, 0.0);
        EXPECT_LT(signal.angle, TWO_PI);
        EXPECT_EQ(signal.history.size(), 1u);
    }
}

TEST(NetworkInterfaceScannerTest, BearingIsStableAcrossScans) {
    auto first = NetworkInterfaceScanner::parseProcNetDev(kProcNetDev, 1000000);
    auto second = NetworkInterfaceScanner::parseProcNetDev(kProcNetDev, 9000000);

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_DOUBLE_EQ(first[i].angle, second[i].angle);
    }
}

TEST(NetworkInterfaceScannerTest, IgnoresMalformedLines) {
    auto signals = NetworkInterfaceScanner::parseProcNetDev(
        "garbage\n  eth1: 1 2 3\n\n", 1000000);
    EXPECT_TRUE(signals.empty());
}

TEST(NetworkInterfaceScannerTest, GroupsEstablishedConnectionsByService) {
    auto signals = NetworkInterfaceScanner::parseProcNetTcp(kProcNetTcp, 1000000);

    ASSERT_EQ(signals.size(), 3u);
    EXPECT_EQ(signals[0].name, "HTTP Connections");
    EXPECT_EQ(signals[0].strength, 40);
    EXPECT_EQ(signals[1].name, "SSH Connections");
    EXPECT_EQ(signals[1].strength, 20);
    EXPECT_EQ(signals[2].name, "Other Connections");
    EXPECT_EQ(signals[2].strength, 20);

    for (const auto& signal : signals) {
        EXPECT_EQ(signal.kind, SignalKind::NETWORK);
    }
}

TEST(NetworkInterfaceScannerTest, CountsIpv6Connections) {
    auto signals = NetworkInterfaceScanner::parseProcNetTcp(kProcNetTcp6, 1000000);

    ASSERT_EQ(signals.size(), 1u);
    EXPECT_EQ(signals[0].name, "HTTP Connections");
    EXPECT_EQ(signals[0].strength, 20);
}

TEST(NetworkInterfaceScannerTest, ScanSumsIpv4AndIpv6Connections) {
    TempFile dev("radarscope_net_dev_dual", kProcNetDev);
    TempFile tcp("radarscope_net_tcp_dual", kProcNetTcp);
    TempFile tcp6("radarscope_net_tcp6_dual", kProcNetTcp6);

    ScanConfig config;
    ManualClock clock;
    NetworkInterfaceScanner scanner(config, dev.path(), {tcp.path(), tcp6.path()}, clock);

    ScanResult result = scanner.scan(ScanContext::background());
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.signals.size(), 5u);
    EXPECT_EQ(result.signals[2].name, "HTTP Connections");
    EXPECT_EQ(result.signals[2].strength, 60);
    EXPECT_EQ(result.signals[3].name, "SSH Connections");
    EXPECT_EQ(result.signals[3].strength, 20);
}

TEST(NetworkInterfaceScannerTest, MissingIpv6TableStillCountsIpv4) {
    TempFile dev("radarscope_net_dev_v4", kProcNetDev);
    TempFile tcp("radarscope_net_tcp_v4", kProcNetTcp);

    ScanConfig config;
    NetworkInterfaceScanner scanner(config, dev.path(),
                                    {tcp.path(), "/nonexistent/radarscope/tcp6"});

    ScanResult result = scanner.scan(ScanContext::background());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.signals.size(), 5u);
}

TEST(NetworkInterfaceScannerTest, ScanReadsBothTables) {
    TempFile dev("radarscope_net_dev", kProcNetDev);
    TempFile tcp("radarscope_net_tcp", kProcNetTcp);

    ScanConfig config;
    ManualClock clock;
    NetworkInterfaceScanner scanner(config, dev.path(), {tcp.path()}, clock);

    EXPECT_TRUE(scanner.isAvailable());

    ScanResult result = scanner.scan(ScanContext::background());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.signals.size(), 5u);
    EXPECT_EQ(result.signals[0].createdAt, clock.now());
}

TEST(NetworkInterfaceScannerTest, ScanTruncatesToMaxSignals) {
    TempFile dev("radarscope_net_dev_max", kProcNetDev);
    TempFile tcp("radarscope_net_tcp_max", kProcNetTcp);

    ScanConfig config;
    config.maxSignals = 3;
    NetworkInterfaceScanner scanner(config, dev.path(), {tcp.path()});

    ScanResult result = scanner.scan(ScanContext::background());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.signals.size(), 3u);
}

TEST(NetworkInterfaceScannerTest, MissingTableMakesScannerUnavailable) {
    ScanConfig config;
    NetworkInterfaceScanner scanner(config, "/nonexistent/radarscope/dev", {});

    EXPECT_FALSE(scanner.isAvailable());

    ScanResult result = scanner.scan(ScanContext::background());
    EXPECT_EQ(result.error, ScanError::SCAN_FAILED);
    EXPECT_TRUE(result.signals.empty());
}

TEST(NetworkInterfaceScannerTest, CancelledContextSkipsScan) {
    TempFile dev("radarscope_net_dev_cancel", kProcNetDev);

    ScanConfig config;
    NetworkInterfaceScanner scanner(config, dev.path(), {});

    ScanContext ctx;
    ctx.cancel();

    EXPECT_EQ(scanner.scan(ctx).error, ScanError::SCAN_TIMEOUT);
}
