// SPDX-License-Identifier: Apache-2.0
#include "common/metrics.hpp"
#include "worker/net/metrics_http.hpp"

#include <cassert>
#include <iostream>
#include <string>

int main()
{
    auto &rt = hdw::metrics::runtime();
    rt.ingest.runs.store(7);
    rt.events_new.store(3);
    rt.players_online.store(2);
    hdw::metrics::add_task_duration(rt.perf, 1500000); // 1.5ms

    auto body = hdw::net::build_metrics_body();
    assert(body.find("hdw_task_runs{task=\"ingest\"} 7\n") != std::string::npos);
    assert(body.find("hdw_events_new 3\n") != std::string::npos);
    assert(body.find("# TYPE hdw_players_online gauge\nhdw_players_online 2\n") != std::string::npos);
    assert(body.find("hdw_task_duration_ns_bucket{le=\"1000000\"} 0\n") != std::string::npos);
    assert(body.find("hdw_task_duration_ns_bucket{le=\"2000000\"} 1\n") != std::string::npos);
    assert(body.find("hdw_task_duration_ns_bucket{le=\"+Inf\"} 1\n") != std::string::npos);
    assert(body.find("hdw_task_duration_ns_count 1\n") != std::string::npos);

    using hdw::net::build_response;
    auto ok = build_response("GET /metrics?x=1 HTTP/1.1\r\nHost: localhost\r\n\r\n");
    assert(ok.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    assert(ok.find("hdw_events_new 3\n") != std::string::npos);
    auto cl = ok.find("Content-Length: ");
    auto body_at = ok.find("\r\n\r\n");
    assert(cl != std::string::npos && body_at != std::string::npos);
    assert(std::stoul(ok.substr(cl + 16)) == ok.size() - body_at - 4);

    auto health = build_response("GET /healthz HTTP/1.0\r\n\r\n");
    assert(health.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    assert(health.substr(health.size() - 3) == "ok\n");

    // A path that merely starts with /metrics is not the metrics route.
    assert(build_response("GET /metricsfoo HTTP/1.1\r\n\r\n").rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);
    auto post = build_response("POST /metrics HTTP/1.1\r\n\r\n");
    assert(post.rfind("HTTP/1.1 405 Method Not Allowed\r\n", 0) == 0);
    assert(post.find("Allow: GET\r\n") != std::string::npos);
    assert(build_response("garbage").rfind("HTTP/1.1 400 Bad Request\r\n", 0) == 0);
    assert(build_response("GET /metrics").rfind("HTTP/1.1 400", 0) == 0);

    std::cout << "unit_metrics_http OK" << std::endl;
    return 0;
}
