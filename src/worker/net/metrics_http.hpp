// SPDX-License-Identifier: Apache-2.0
// metrics_http.hpp
// Prometheus text-format endpoint (GET /metrics) over the worker counters.
#pragma once
#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace hdw::net {

std::string build_metrics_body();

// Full HTTP/1.1 response for a raw request head. Routes on the request line only:
//  GET /metrics -> 200 exposition, GET /healthz -> 200 "ok", other GET paths -> 404,
//  other methods -> 405, unparsable request line -> 400. The query string is ignored.
std::string build_response(std::string_view request);

// Accept loop; returns once stop is set (checked at least every 500ms).
coro::task<void> run_metrics_endpoint(
    std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, const std::atomic_bool &stop);

} // namespace hdw::net
