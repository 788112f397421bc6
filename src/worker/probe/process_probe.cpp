// SPDX-License-Identifier: Apache-2.0
#include "worker/probe/process_probe.hpp"

#include "common/logger.hpp"
#include "worker/source/command.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace hdw::probe {

namespace {
std::optional<std::string> read_file(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string trim(std::string s)
{
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' '))
        s.pop_back();
    size_t i = 0;
    while (i < s.size() && s[i] == ' ')
        ++i;
    return s.substr(i);
}

// Fields of /proc/<pid>/stat after the parenthesised comm (which may contain spaces).
// Index 0 is field 3 (state).
std::optional<std::vector<std::string>> stat_fields(const std::string &stat)
{
    auto rp = stat.rfind(')');
    if (rp == std::string::npos || rp + 2 > stat.size())
        return std::nullopt;
    std::vector<std::string> fields;
    std::istringstream iss(stat.substr(rp + 2));
    std::string tok;
    while (iss >> tok)
        fields.push_back(tok);
    return fields;
}

std::vector<pid_t> list_pids(const std::string &proc_root)
{
    std::vector<pid_t> pids;
    std::error_code ec;
    for (const auto &entry : std::filesystem::directory_iterator(proc_root, ec)) {
        const auto name = entry.path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isdigit(c); }))
            continue;
        pids.push_back(static_cast<pid_t>(std::strtol(name.c_str(), nullptr, 10)));
    }
    if (ec)
        log::warn("[probe] cannot list {}: {}", proc_root, ec.message());
    std::sort(pids.begin(), pids.end());
    return pids;
}

long clock_ticks()
{
    long clk_tck = sysconf(_SC_CLK_TCK);
    return clk_tck > 0 ? clk_tck : 100;
}
} // namespace

std::optional<pid_t> SystemdPidResolver::main_pid() const
{
    source::CommandResult res;
    try {
        res = source::run_command(
            {"systemctl", "show", m_cfg.unit, "--property=MainPID", "--value"},
            std::chrono::duration_cast<std::chrono::milliseconds>(m_cfg.timeout));
    } catch (const source::CommandError &ex) {
        log::warn("[probe] systemctl show {}: {}", m_cfg.unit, ex.what());
        return std::nullopt;
    }
    if (res.exit_code != 0)
        return std::nullopt;
    auto value = trim(res.output);
    if (value.empty() || value == "0")
        return std::nullopt;
    char *end = nullptr;
    long pid = std::strtol(value.c_str(), &end, 10);
    if (end == value.c_str() || *end != '\0' || pid <= 0)
        return std::nullopt;
    return static_cast<pid_t>(pid);
}

std::optional<pid_t> SystemdPidResolver::find_child(pid_t parent) const
{
    for (pid_t pid : list_pids(m_cfg.proc_root)) {
        const std::string dir = m_cfg.proc_root + "/" + std::to_string(pid);
        auto stat = read_file(dir + "/stat");
        if (!stat)
            continue;
        auto fields = stat_fields(*stat);
        // field 4 (ppid) -> index 1
        if (!fields || fields->size() < 2 || std::strtol((*fields)[1].c_str(), nullptr, 10) != parent)
            continue;
        auto comm = read_file(dir + "/comm");
        if (comm && trim(*comm) == m_cfg.process_name)
            return pid;
    }
    return std::nullopt;
}

std::optional<pid_t> SystemdPidResolver::find_by_cmdline() const
{
    const pid_t self = getpid();
    for (pid_t pid : list_pids(m_cfg.proc_root)) {
        if (pid == self)
            continue;
        auto cmdline = read_file(m_cfg.proc_root + "/" + std::to_string(pid) + "/cmdline");
        if (!cmdline)
            continue;
        std::replace(cmdline->begin(), cmdline->end(), '\0', ' ');
        if (cmdline->find(m_cfg.cmdline_marker) != std::string::npos)
            return pid;
    }
    return std::nullopt;
}

std::optional<pid_t> SystemdPidResolver::resolve()
{
    if (auto wrapper = main_pid()) {
        if (auto child = find_child(*wrapper))
            return child;
    }
    if (m_cfg.cmdline_marker.empty())
        return std::nullopt;
    return find_by_cmdline();
}

std::optional<ResourceUsage> ProcResourceProbe::sample(pid_t pid)
{
    const std::string dir = m_proc_root + "/" + std::to_string(pid);
    auto stat = read_file(dir + "/stat");
    auto statm = read_file(dir + "/statm");
    if (!stat || !statm)
        return std::nullopt;

    auto fields = stat_fields(*stat);
    // utime=14, stime=15, starttime=22 -> indices 11, 12, 19
    if (!fields || fields->size() < 20)
        return std::nullopt;
    uint64_t utime = std::strtoull((*fields)[11].c_str(), nullptr, 10);
    uint64_t stime = std::strtoull((*fields)[12].c_str(), nullptr, 10);
    uint64_t starttime = std::strtoull((*fields)[19].c_str(), nullptr, 10);
    uint64_t ticks = utime + stime;

    unsigned long pages_total = 0, pages_res = 0;
    {
        std::istringstream iss(*statm);
        if (!(iss >> pages_total >> pages_res))
            return std::nullopt;
    }
    long page_sz = sysconf(_SC_PAGESIZE);
    if (page_sz <= 0)
        page_sz = 4096;
    int64_t rss_kb = static_cast<int64_t>(pages_res) * page_sz / 1024;

    int64_t mem_total_kb = 0;
    if (auto meminfo = read_file(m_proc_root + "/meminfo")) {
        std::istringstream iss(*meminfo);
        std::string key;
        int64_t value = 0;
        std::string unit;
        while (iss >> key >> value >> unit) {
            if (key == "MemTotal:") {
                mem_total_kb = value;
                break;
            }
        }
    }

    const long clk_tck = clock_ticks();
    const auto now = std::chrono::steady_clock::now();
    std::optional<double> cpu_pct;
    if (m_prev && m_prev->pid == pid && ticks >= m_prev->cpu_ticks) {
        double wall_s = std::chrono::duration<double>(now - m_prev->at).count();
        if (wall_s > 0.0)
            cpu_pct = 100.0 * (double)(ticks - m_prev->cpu_ticks) / (double)clk_tck / wall_s;
    } else {
        auto uptime = read_file(m_proc_root + "/uptime");
        if (uptime) {
            double elapsed_s = std::strtod(uptime->c_str(), nullptr) - (double)starttime / (double)clk_tck;
            if (elapsed_s > 0.0)
                cpu_pct = 100.0 * (double)ticks / (double)clk_tck / elapsed_s;
        }
    }
    m_prev = Previous{pid, ticks, now};

    ResourceUsage usage;
    usage.cpu_percent = cpu_pct;
    usage.ram_kb = rss_kb;
    if (mem_total_kb > 0)
        usage.ram_percent = 100.0 * (double)rss_kb / (double)mem_total_kb;
    return usage;
}

} // namespace hdw::probe
