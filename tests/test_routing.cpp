/**
 * @file test_routing.cpp
 * @brief Tests for ServiceRoutingTable / NodeIpResolver RCU semantics + name handling.
 *
 * Validates:
 *  - Snapshot publication via atomic_load/store on shared_ptr (RCU pattern)
 *  - upsert / remove / clear behavior and case-insensitive keys
 *  - Invalid input is rejected and never published
 *  - No torn reads under 1 writer / many readers
 *  - Node IP bookkeeping and family filtering
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "poolsync/routing/ip_family.hpp"
#include "poolsync/routing/node_ip_resolver.hpp"
#include "poolsync/routing/service_name.hpp"
#include "poolsync/routing/service_routing_table.hpp"

using namespace std::chrono_literals;
using poolsync::cloud::IpSet;
using poolsync::routing::family_of;
using poolsync::routing::IpFamily;
using poolsync::routing::NodeIpResolver;
using poolsync::routing::parse_ip_family;
using poolsync::routing::RegistryErr;
using poolsync::routing::ServiceName;
using poolsync::routing::ServiceRoute;
using poolsync::routing::ServiceRoutingTable;

// --------------------------- Service names ---------------------------------

TEST(ServiceName, Key_IsLowercased) {
  const ServiceName n{.ns = "Prod", .name = "Web-API"};
  EXPECT_EQ(n.key(), "prod/web-api");
}

TEST(ServiceName, Parse) {
  const auto ok = ServiceName::parse("ns1/svc1");
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ(ok->ns, "ns1");
  EXPECT_EQ(ok->name, "svc1");

  EXPECT_FALSE(ServiceName::parse("no-slash").has_value());
  EXPECT_FALSE(ServiceName::parse("/svc").has_value());
  EXPECT_FALSE(ServiceName::parse("ns/").has_value());
  EXPECT_FALSE(ServiceName::parse("a/b/c").has_value());
}

TEST(IpFamily, Classification) {
  EXPECT_EQ(family_of("10.0.0.1"), IpFamily::IPv4);
  EXPECT_EQ(family_of("fd00::1"), IpFamily::IPv6);
  EXPECT_FALSE(family_of("").has_value());
  EXPECT_FALSE(family_of("node1").has_value());
  EXPECT_FALSE(family_of("10.0.0.256").has_value());

  EXPECT_EQ(parse_ip_family("IPv6"), IpFamily::IPv6);
  EXPECT_EQ(parse_ip_family("ipv4"), IpFamily::IPv4);
  EXPECT_FALSE(parse_ip_family("dual").has_value());
}

// --------------------------- Routing table ----------------------------------

/**
 * @test Table_Construct_Empty
 * @brief Fresh table publishes a valid empty snapshot.
 */
TEST(ServiceRoutingTable, Table_Construct_Empty) {
  ServiceRoutingTable table;

  auto snap = table.snapshot();
  ASSERT_TRUE(snap);
  EXPECT_TRUE(snap->empty());
  EXPECT_EQ(table.size(), 0u);
  EXPECT_FALSE(table.is_local("ns/svc"));
}

/**
 * @test Table_Upsert_And_Lookup
 * @brief Upsert with mixed case, find via any casing and via heterogeneous snapshot find.
 */
TEST(ServiceRoutingTable, Table_Upsert_And_Lookup) {
  ServiceRoutingTable table;
  const auto v0 = table.version();

  ASSERT_EQ(table.upsert({.ns = "NS1", .name = "Svc1"}, {.load_balancer = "lb1"}), RegistryErr::Ok);
  EXPECT_GT(table.version(), v0);

  const auto r = table.lookup("ns1/svc1");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->load_balancer, "lb1");
  EXPECT_EQ(r->family, IpFamily::IPv4);
  EXPECT_TRUE(table.is_local("NS1/SVC1"));
  EXPECT_TRUE(table.lookup(ServiceName{.ns = "ns1", .name = "svc1"}).has_value());

  auto snap = table.snapshot();
  EXPECT_NE(snap->find(std::string_view{"ns1/svc1"}), snap->end());
}

TEST(ServiceRoutingTable, Table_Upsert_Replaces) {
  ServiceRoutingTable table;
  const ServiceName svc{.ns = "ns1", .name = "svc1"};
  ASSERT_EQ(table.upsert(svc, {.load_balancer = "lb1"}), RegistryErr::Ok);
  ASSERT_EQ(table.upsert(svc, {.load_balancer = "lb2", .family = IpFamily::IPv6}), RegistryErr::Ok);

  EXPECT_EQ(table.size(), 1u);
  EXPECT_EQ(table.lookup("ns1/svc1"), (ServiceRoute{.load_balancer = "lb2", .family = IpFamily::IPv6}));
  EXPECT_EQ(table.stats().upserts, 2u);
}

TEST(ServiceRoutingTable, Table_Invalid_NotPublished) {
  ServiceRoutingTable table;
  const auto v0 = table.version();

  EXPECT_EQ(table.upsert({.ns = "", .name = "svc"}, {.load_balancer = "lb1"}), RegistryErr::Invalid);
  EXPECT_EQ(table.upsert({.ns = "ns", .name = ""}, {.load_balancer = "lb1"}), RegistryErr::Invalid);
  EXPECT_EQ(table.upsert({.ns = "ns", .name = "svc"}, {.load_balancer = ""}), RegistryErr::Invalid);

  EXPECT_EQ(table.version(), v0);
  EXPECT_EQ(table.size(), 0u);
  EXPECT_EQ(table.stats().failures, 3u);
}

TEST(ServiceRoutingTable, Table_Remove_And_Clear) {
  ServiceRoutingTable table;
  ASSERT_EQ(table.upsert({.ns = "ns", .name = "a"}, {.load_balancer = "lb1"}), RegistryErr::Ok);
  ASSERT_EQ(table.upsert({.ns = "ns", .name = "b"}, {.load_balancer = "lb1"}), RegistryErr::Ok);

  auto names = table.list_services();
  std::sort(names.begin(), names.end());
  EXPECT_EQ(names, (std::vector<std::string>{"ns/a", "ns/b"}));

  EXPECT_TRUE(table.remove("NS/A"));
  EXPECT_FALSE(table.remove("ns/a"));
  EXPECT_FALSE(table.is_local("ns/a"));
  EXPECT_TRUE(table.is_local("ns/b"));

  table.clear();
  EXPECT_EQ(table.size(), 0u);
}

/**
 * @test Table_Snapshot_IsStable
 * @brief A held snapshot does not observe later writes.
 */
TEST(ServiceRoutingTable, Table_Snapshot_IsStable) {
  ServiceRoutingTable table;
  ASSERT_EQ(table.upsert({.ns = "ns", .name = "a"}, {.load_balancer = "lb1"}), RegistryErr::Ok);
  auto before = table.snapshot();

  ASSERT_EQ(table.upsert({.ns = "ns", .name = "a"}, {.load_balancer = "lb2"}), RegistryErr::Ok);
  EXPECT_EQ(before->at("ns/a").load_balancer, "lb1");
  EXPECT_EQ(table.lookup("ns/a")->load_balancer, "lb2");
}

/**
 * @test Table_Concurrent_ReadersSeeConsistentRoutes
 * @brief 1 writer flips the LB of a service; readers only ever see one of the two values.
 */
TEST(ServiceRoutingTable, Table_Concurrent_ReadersSeeConsistentRoutes) {
  ServiceRoutingTable table;
  const ServiceName svc{.ns = "ns", .name = "svc"};
  ASSERT_EQ(table.upsert(svc, {.load_balancer = "lb-even"}), RegistryErr::Ok);

  std::atomic<bool> stop{false};
  std::atomic<int> torn{0};

  std::vector<std::thread> readers;
  for (int i = 0; i < 4; ++i) {
    readers.emplace_back([&] {
      while (!stop.load(std::memory_order_relaxed)) {
        const auto r = table.lookup("ns/svc");
        if (!r || (r->load_balancer != "lb-even" && r->load_balancer != "lb-odd")) torn++;
      }
    });
  }

  std::thread writer([&] {
    for (int i = 0; i < 2000; ++i) {
      (void)table.upsert(svc, {.load_balancer = (i % 2) ? "lb-odd" : "lb-even"});
    }
  });

  writer.join();
  std::this_thread::sleep_for(10ms);
  stop = true;
  for (auto& t : readers) t.join();

  EXPECT_EQ(torn.load(), 0);
  EXPECT_EQ(table.stats().upserts, 2001u);
}

// --------------------------- Node resolver ----------------------------------

TEST(NodeIpResolver, SetAndResolve) {
  NodeIpResolver nodes;
  ASSERT_EQ(nodes.set_node_ips("node1", {"10.0.0.1", "fd00::1"}), RegistryErr::Ok);
  ASSERT_EQ(nodes.set_node_ips("Node2", {"10.0.0.2"}), RegistryErr::Ok);

  EXPECT_EQ(nodes.size(), 2u);
  EXPECT_EQ(nodes.ips_of("NODE1"), (IpSet{"10.0.0.1", "fd00::1"}));
  EXPECT_TRUE(nodes.ips_of("node9").empty());

  EXPECT_EQ(nodes.resolve({"node1", "node2", "ghost"}),
            (IpSet{"10.0.0.1", "10.0.0.2", "fd00::1"}));
  EXPECT_EQ(nodes.resolve({"node1", "node2"}, IpFamily::IPv4), (IpSet{"10.0.0.1", "10.0.0.2"}));
  EXPECT_EQ(nodes.resolve({"node1", "node2"}, IpFamily::IPv6), (IpSet{"fd00::1"}));
}

TEST(NodeIpResolver, InvalidInput_Rejected) {
  NodeIpResolver nodes;
  const auto v0 = nodes.version();
  EXPECT_EQ(nodes.set_node_ips("node1", {"10.0.0.1", "bogus"}), RegistryErr::Invalid);
  EXPECT_EQ(nodes.set_node_ips("", {"10.0.0.1"}), RegistryErr::Invalid);
  EXPECT_EQ(nodes.add_node_ip("node1", "not-an-ip"), RegistryErr::Invalid);
  EXPECT_EQ(nodes.version(), v0);
  EXPECT_EQ(nodes.size(), 0u);
}

TEST(NodeIpResolver, AddRemoveIp_ForgetsEmptyNode) {
  NodeIpResolver nodes;
  ASSERT_EQ(nodes.add_node_ip("node1", "10.0.0.1"), RegistryErr::Ok);
  ASSERT_EQ(nodes.add_node_ip("node1", "10.0.0.2"), RegistryErr::Ok);
  EXPECT_EQ(nodes.ips_of("node1"), (IpSet{"10.0.0.1", "10.0.0.2"}));

  EXPECT_EQ(nodes.remove_node_ip("node1", "10.0.0.9"), RegistryErr::NotFound);
  EXPECT_EQ(nodes.remove_node_ip("ghost", "10.0.0.1"), RegistryErr::NotFound);
  EXPECT_EQ(nodes.remove_node_ip("node1", "10.0.0.1"), RegistryErr::Ok);
  EXPECT_EQ(nodes.remove_node_ip("node1", "10.0.0.2"), RegistryErr::Ok);
  EXPECT_EQ(nodes.size(), 0u);
}

TEST(NodeIpResolver, SetEmpty_And_RemoveNode) {
  NodeIpResolver nodes;
  ASSERT_EQ(nodes.set_node_ips("node1", {"10.0.0.1"}), RegistryErr::Ok);
  ASSERT_EQ(nodes.set_node_ips("node2", {"10.0.0.2"}), RegistryErr::Ok);

  EXPECT_EQ(nodes.set_node_ips("node1", {}), RegistryErr::Ok);
  EXPECT_TRUE(nodes.ips_of("node1").empty());
  EXPECT_TRUE(nodes.remove_node("NODE2"));
  EXPECT_FALSE(nodes.remove_node("node2"));
  EXPECT_EQ(nodes.size(), 0u);
}

/**
 * @test Resolver_ConcurrentWriters_LoseNothing
 * @brief Writers are serialized: every add from every thread is published.
 */
TEST(NodeIpResolver, Resolver_ConcurrentWriters_LoseNothing) {
  NodeIpResolver nodes;
  constexpr int kThreads = 4, kPerThread = 50;

  std::vector<std::thread> writers;
  for (int t = 0; t < kThreads; ++t) {
    writers.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        (void)nodes.add_node_ip("node" + std::to_string(t), "10." + std::to_string(t) + ".0." + std::to_string(i + 1));
      }
    });
  }
  for (auto& w : writers) w.join();

  EXPECT_EQ(nodes.size(), static_cast<std::size_t>(kThreads));
  for (int t = 0; t < kThreads; ++t) {
    EXPECT_EQ(nodes.ips_of("node" + std::to_string(t)).size(), static_cast<std::size_t>(kPerThread));
  }
}
