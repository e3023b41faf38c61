#pragma once

#include "connection_tracker.hpp"
#include "../routing/route_table.hpp"

#include <functional>
#include <string>

using ActivityCB = std::function<void(const std::string& p_tunnel_id)>;

// What every public-facing session needs. Each session keeps its own copy;
// the referenced objects must outlive the io_context.
struct ProxyContext {
    RouteTable& routes;
    ConnectionTracker& tracker;
    ActivityCB on_activity;

    ProxyContext(RouteTable& route_table, ConnectionTracker& connection_tracker)
        : routes(route_table), tracker(connection_tracker) {}

    void report_activity(const std::string& tunnel_id) const {
        if (on_activity) {
            on_activity(tunnel_id);
        }
    }
};
