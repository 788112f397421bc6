// SPDX-License-Identifier: Apache-2.0
// process_probe.hpp
// Locates the game server process and samples its CPU / memory usage from procfs.
#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace hdw::probe {

class IPidResolver
{
public:
    virtual ~IPidResolver() = default;
    // nullopt when no matching process exists; never throws for "not running".
    virtual std::optional<pid_t> resolve() = 0;
};

// A percentage is nullopt when procfs did not give enough to compute it (no uptime, no elapsed
// time, no MemTotal); it is never reported as zero in that case.
struct ResourceUsage
{
    std::optional<double> cpu_percent;
    std::optional<double> ram_percent;
    int64_t ram_kb{0};
};

class IResourceProbe
{
public:
    virtual ~IResourceProbe() = default;
    // nullopt when the process vanished or procfs could not be read.
    virtual std::optional<ResourceUsage> sample(pid_t pid) = 0;
};

struct PidResolverConfig
{
    std::string unit{"hytale"};
    std::string process_name{"java"}; // child of the unit's MainPID (wrapper script)
    std::string cmdline_marker{"HytaleServer.jar"};
    std::chrono::seconds timeout{10};
    std::string proc_root{"/proc"};
};

// systemd MainPID -> child by process name -> any process whose cmdline contains the marker.
class SystemdPidResolver : public IPidResolver
{
public:
    explicit SystemdPidResolver(PidResolverConfig cfg) : m_cfg(std::move(cfg)) {}
    std::optional<pid_t> resolve() override;

    std::optional<pid_t> find_child(pid_t parent) const;
    std::optional<pid_t> find_by_cmdline() const;

private:
    std::optional<pid_t> main_pid() const;

    PidResolverConfig m_cfg;
};

// CPU% is the delta since the previous sample of the same pid; the first sample of a pid is the
// lifetime average, as ps reports it.
class ProcResourceProbe : public IResourceProbe
{
public:
    explicit ProcResourceProbe(std::string proc_root = "/proc") : m_proc_root(std::move(proc_root)) {}
    std::optional<ResourceUsage> sample(pid_t pid) override;

private:
    struct Previous
    {
        pid_t pid{0};
        uint64_t cpu_ticks{0};
        std::chrono::steady_clock::time_point at{};
    };

    std::string m_proc_root;
    std::optional<Previous> m_prev;
};

} // namespace hdw::probe
