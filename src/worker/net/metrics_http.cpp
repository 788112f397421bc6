// SPDX-License-Identifier: Apache-2.0
#include "worker/net/metrics_http.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <span>
#include <sstream>
#include <string>
#include <string_view>

namespace hdw::net {

namespace {
void write_task(std::ostringstream &oss, const char *task, const metrics::TaskCounters &c)
{
    oss << "hdw_task_runs{task=\"" << task << "\"} " << c.runs.load() << "\n";
    oss << "hdw_task_failures{task=\"" << task << "\"} " << c.failures.load() << "\n";
    oss << "hdw_task_last_duration_ns{task=\"" << task << "\"} " << c.last_duration_ns.load() << "\n";
}

void write_counter(std::ostringstream &oss, const char *name, const char *type, uint64_t value)
{
    oss << "# TYPE " << name << " " << type << "\n";
    oss << name << " " << value << "\n";
}
} // namespace

std::string build_metrics_body()
{
    std::ostringstream oss;
    auto &rt = metrics::runtime();
    oss << "# TYPE hdw_task_runs counter\n";
    oss << "# TYPE hdw_task_failures counter\n";
    oss << "# TYPE hdw_task_last_duration_ns gauge\n";
    write_task(oss, "perf", rt.perf);
    write_task(oss, "ingest", rt.ingest);
    write_task(oss, "cleanup", rt.cleanup);
    write_counter(oss, "hdw_events_extracted", "counter", rt.events_extracted.load());
    write_counter(oss, "hdw_events_merged", "counter", rt.events_merged.load());
    write_counter(oss, "hdw_events_new", "counter", rt.events_new.load());
    write_counter(oss, "hdw_checkpoint_advances", "counter", rt.checkpoint_advances.load());
    write_counter(oss, "hdw_query_failures", "counter", rt.query_failures.load());
    write_counter(oss, "hdw_backfill_players", "gauge", rt.backfill_players.load());
    write_counter(oss, "hdw_samples_written", "counter", rt.samples_written.load());
    write_counter(oss, "hdw_probe_misses", "counter", rt.probe_misses.load());
    write_counter(oss, "hdw_players_online", "gauge", rt.players_online.load());
    write_counter(oss, "hdw_samples_pruned", "counter", rt.samples_pruned.load());
    write_counter(oss, "hdw_events_pruned", "counter", rt.events_pruned.load());
    write_counter(oss, "hdw_compactions", "counter", rt.compactions.load());
    write_counter(oss, "hdw_events_deduplicated", "counter", rt.events_deduplicated.load());
    // Task duration histogram: geometric (x2) buckets from 1ms, last bucket is overflow.
    oss << "# TYPE hdw_task_duration_ns histogram\n";
    uint64_t cumulative = 0;
    constexpr uint64_t base = 1000000;
    for (int i = 0; i < metrics::RuntimeCounters::TASK_BUCKETS - 1; ++i) {
        cumulative += rt.task_hist[i].load();
        oss << "hdw_task_duration_ns_bucket{le=\"" << (base << i) << "\"} " << cumulative << "\n";
    }
    cumulative += rt.task_hist[metrics::RuntimeCounters::TASK_BUCKETS - 1].load();
    oss << "hdw_task_duration_ns_bucket{le=\"+Inf\"} " << cumulative << "\n";
    oss << "hdw_task_duration_ns_sum " << rt.task_duration_ns_accum.load() << "\n";
    oss << "hdw_task_duration_ns_count " << rt.task_samples.load() << "\n";
    return oss.str();
}

namespace {
std::string render(int code, const char *reason, const std::string &body, const char *extra_header = nullptr)
{
    std::ostringstream resp;
    resp << "HTTP/1.1 " << code << ' ' << reason << "\r\n";
    resp << "Content-Type: text/plain; version=0.0.4\r\n";
    resp << "Content-Length: " << body.size() << "\r\n";
    if (extra_header)
        resp << extra_header << "\r\n";
    resp << "Connection: close\r\n\r\n";
    resp << body;
    return resp.str();
}

constexpr size_t k_max_request = 2048;
} // namespace

std::string build_response(std::string_view request)
{
    const auto eol = request.find("\r\n");
    std::string_view line = request.substr(0, eol);
    const auto sp1 = line.find(' ');
    const auto sp2 = sp1 == std::string_view::npos ? sp1 : line.find(' ', sp1 + 1);
    if (sp1 == 0 || sp2 == std::string_view::npos || sp2 == sp1 + 1)
        return render(400, "Bad Request", "bad request\n");
    std::string_view method = line.substr(0, sp1);
    std::string_view target = line.substr(sp1 + 1, sp2 - sp1 - 1);
    if (auto q = target.find('?'); q != std::string_view::npos)
        target = target.substr(0, q);

    if (method != "GET")
        return render(405, "Method Not Allowed", "method not allowed\n", "Allow: GET");
    if (target == "/metrics")
        return render(200, "OK", build_metrics_body());
    if (target == "/healthz")
        return render(200, "OK", "ok\n");
    return render(404, "Not Found", "not found\n");
}

// Reads until the request line is complete, the peer stops sending, or the head grows too large.
static coro::task<std::string> read_request_head(coro::net::tcp::client &client)
{
    std::string head;
    std::string buf(512, '\0');
    while (head.find("\r\n") == std::string::npos && head.size() < k_max_request) {
        if (co_await client.poll(coro::poll_op::read, std::chrono::milliseconds(200)) != coro::poll_status::event)
            break;
        auto [rs, span] = client.recv(buf);
        if (rs == coro::net::recv_status::would_block)
            continue;
        if (rs != coro::net::recv_status::ok || span.empty())
            break;
        head.append(span.data(), span.size());
    }
    co_return head;
}

static coro::task<void> serve_one(std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client)
{
    co_await scheduler->schedule();
    const std::string head = co_await read_request_head(client);
    if (head.empty())
        co_return;
    const std::string resp = build_response(head);
    std::span<const char> pending{resp.data(), resp.size()};
    while (!pending.empty()) {
        if (co_await client.poll(coro::poll_op::write, std::chrono::milliseconds(1000)) != coro::poll_status::event) {
            log::debug("[metrics] client stalled; dropping {} unsent bytes", pending.size());
            co_return;
        }
        auto [st, rest] = client.send(pending);
        if (st != coro::net::send_status::ok && st != coro::net::send_status::would_block)
            co_return;
        pending = rest;
    }
}

coro::task<void> run_metrics_endpoint(
    std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, const std::atomic_bool &stop)
{
    co_await scheduler->schedule();
    log::info("[metrics] HTTP endpoint on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (!stop.load(std::memory_order_acquire)) {
        auto st = co_await server.poll(std::chrono::milliseconds(500));
        if (st == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid())
                scheduler->spawn(serve_one(scheduler, std::move(client)));
        } else if (st == coro::poll_status::error || st == coro::poll_status::closed) {
            log::error("[metrics] server poll error/closed");
            co_return;
        }
    }
    log::debug("[metrics] endpoint stopped");
}

} // namespace hdw::net
