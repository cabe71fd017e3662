/**
 * @file main.cpp
 * @brief poolsync_sim: replays a short membership scenario against an in-memory cloud.
 *
 * **Bootstrap**
 * Load config (optional path argument); construct routing table, node table,
 * simulated pool API, updater and diff engine.
 *
 * **Scenario**
 * - web moves from node1 to node1+node2, then to node2+node3.
 * - api stops being local while an operation for it is still queued.
 * - A transient failure on the first update of the web pool is retried once.
 *
 * Each step runs one drain tick synchronously and prints the resulting pool.
 *
 * Usage:
 *   ./poolsync_sim [config_file]
 */

#include <cstdlib>
#include <iostream>
#include <string>

#include "poolsync/cloud/pool_client_sim.hpp"
#include "poolsync/config/config_loader.hpp"
#include "poolsync/reconcile/backend_pool_updater.hpp"
#include "poolsync/reconcile/endpoint_diff.hpp"
#include "poolsync/routing/node_ip_resolver.hpp"
#include "poolsync/routing/service_routing_table.hpp"
#include "poolsync/version.hpp"

using namespace poolsync;

static void print_pool(const cloud::PoolClientSim& api, const std::string& lb, const std::string& pool) {
    const auto p = api.pool(lb, pool);
    std::cout << "  " << cloud::pool_key(lb, pool) << " = {";
    if (p) {
        const char* sep = "";
        for (const auto& a : p->addresses) { std::cout << sep << a.ip_address; sep = ", "; }
    }
    std::cout << "}\n";
}

static void print_tick(const reconcile::TickReport& t) {
    std::cout << "tick: drained=" << t.drained << " stale=" << t.stale_dropped
              << " groups=" << t.groups.size() << "\n";
    for (const auto& g : t.groups) {
        std::cout << "  " << g.pool_key << " -> " << reconcile::to_string(g.outcome)
                  << " (attempts=" << g.attempts << ", ops=" << g.operations << ")";
        if (!g.reason.empty()) std::cout << " error: " << g.reason;
        std::cout << "\n";
    }
}

int main(int argc, char** argv) {
    config::SyncConfig cfg = config::Loader::defaults();
    if (argc > 1) {
        auto loaded = config::Loader::load_from_file(argv[1]);
        if (!loaded) {
            std::cerr << "poolsync_sim: " << loaded.error().to_string() << std::endl;
            return EXIT_FAILURE;
        }
        cfg = *loaded;
    }
    obs::set_simple_observer_output(cfg.emit_events);

    std::cout << "poolsync " << version_string << " - poolsync_sim\n";

    routing::ServiceRoutingTable routes;
    routing::NodeIpResolver nodes;
    cloud::PoolClientSim api;

    const routing::ServiceName web{.ns = "default", .name = "web"};
    const routing::ServiceName svc_api{.ns = "default", .name = "api"};
    (void)routes.upsert(web, routing::ServiceRoute{.load_balancer = "lb1"});
    (void)routes.upsert(svc_api, routing::ServiceRoute{.load_balancer = "lb1"});

    (void)nodes.set_node_ips("node1", {"10.0.0.1"});
    (void)nodes.set_node_ips("node2", {"10.0.0.2"});
    (void)nodes.set_node_ips("node3", {"10.0.0.3", "fd00::3"});

    const std::string web_pool = reconcile::local_service_pool_name(web, routing::IpFamily::IPv4);
    const std::string api_pool = reconcile::local_service_pool_name(svc_api, routing::IpFamily::IPv4);
    api.put_pool(cloud::BackendPool{.name = web_pool, .load_balancer = "lb1", .addresses = {}});
    api.put_pool(cloud::BackendPool{.name = api_pool, .load_balancer = "lb1", .addresses = {}});

    reconcile::BackendPoolUpdater updater(api, &routes, cfg.updater);
    reconcile::EndpointDiffEngine diff(routes, nodes, updater);

    std::cout << "\n[1] web: {} -> {node1, node2}, first update fails transiently\n";
    api.fail_next_update("lb1", web_pool, cloud::CloudError::transient("throttled", 429));
    auto ops = diff.on_membership_change({.service = web, .old_nodes = {}, .new_nodes = {"node1", "node2"}});
    print_tick(updater.process_once());
    for (const auto& op : ops) {
        const auto r = op->wait();
        std::cout << "  op " << reconcile::to_string(op->kind()) << " -> " << (r.ok ? "ok" : r.error->to_string()) << "\n";
    }
    print_pool(api, "lb1", web_pool);

    std::cout << "\n[2] web: {node1, node2} -> {node2, node3}; api gains node1 then stops being local\n";
    (void)diff.on_membership_change({.service = web, .old_nodes = {"node1", "node2"}, .new_nodes = {"node2", "node3"}});
    auto api_ops = diff.on_membership_change({.service = svc_api, .old_nodes = {}, .new_nodes = {"node1"}});
    (void)routes.remove(svc_api.key());
    print_tick(updater.process_once());
    for (const auto& op : api_ops) {
        const auto r = op->wait();
        std::cout << "  api op -> " << (r.ok ? "ok" : r.error->to_string()) << "\n";
    }
    print_pool(api, "lb1", web_pool);
    print_pool(api, "lb1", api_pool);

    std::cout << "\n[3] web: event for an unknown service identity is ignored\n";
    const auto ignored = diff.on_membership_change({.service = std::nullopt, .old_nodes = {"node1"}, .new_nodes = {}});
    std::cout << "  operations produced: " << ignored.size() << "\n";

    updater.stop();

    const auto c = obs::make_simple_observer()->snapshot();
    std::cout << "\ncounters: enqueued=" << c.enqueued << " ticks=" << c.ticks
              << " updates=" << c.pool_updates << " retries=" << c.retries
              << " failures=" << c.failures << " stale=" << c.stale_dropped << std::endl;
    return EXIT_SUCCESS;
}
