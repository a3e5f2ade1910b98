#include "adapters/secondary/ProcSystemMonitor.hpp"
#include <sys/statvfs.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

namespace apiclient::adapters::secondary {

ProcSystemMonitor::ProcSystemMonitor(std::string procRoot, std::string diskPath)
    : procRoot_(std::move(procRoot))
    , diskPath_(std::move(diskPath))
{}

ports::output::SystemUsage ProcSystemMonitor::sample() {
    ports::output::SystemUsage usage;
    usage.cpuPercent = cpuPercent();
    usage.memoryPercent = parseMemoryPercent(readFile("meminfo"));
    usage.diskPercent = diskPercent();
    parseNetworkBytes(readFile("net/dev"), usage.networkBytesSent, usage.networkBytesRecv);
    usage.openFiles = countOpenFiles();
    usage.threads = parseThreads(readFile("self/status"));
    return usage;
}

double ProcSystemMonitor::parseMemoryPercent(const std::string& meminfo) {
    std::istringstream in(meminfo);
    std::string line;
    uint64_t total = 0;
    uint64_t available = 0;

    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string key;
        uint64_t value = 0;
        fields >> key >> value;
        if (key == "MemTotal:") {
            total = value;
        } else if (key == "MemAvailable:") {
            available = value;
        }
    }

    if (total == 0) {
        return 0.0;
    }
    return 100.0 * static_cast<double>(total - std::min(available, total)) / static_cast<double>(total);
}

void ProcSystemMonitor::parseNetworkBytes(const std::string& netDev, uint64_t& sent, uint64_t& received) {
    sent = 0;
    received = 0;

    std::istringstream in(netDev);
    std::string line;
    while (std::getline(in, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;  // заголовки
        }

        std::string iface = line.substr(0, colon);
        iface.erase(0, iface.find_first_not_of(' '));
        if (iface == "lo") {
            continue;
        }

        // rx: bytes packets errs drop fifo frame compressed multicast, затем tx: bytes ...
        std::istringstream fields(line.substr(colon + 1));
        std::vector<uint64_t> values;
        uint64_t v = 0;
        while (fields >> v) {
            values.push_back(v);
        }
        if (values.size() >= 9) {
            received += values[0];
            sent += values[8];
        }
    }
}

uint64_t ProcSystemMonitor::parseThreads(const std::string& status) {
    std::istringstream in(status);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("Threads:", 0) == 0) {
            std::istringstream fields(line.substr(8));
            uint64_t threads = 0;
            fields >> threads;
            return threads;
        }
    }
    return 0;
}

std::optional<ProcSystemMonitor::CpuTimes> ProcSystemMonitor::readCpuTimes() const {
    std::istringstream in(readFile("stat"));
    std::string label;
    in >> label;
    if (label != "cpu") {
        return std::nullopt;
    }

    // user nice system idle iowait irq softirq steal
    std::vector<uint64_t> values;
    uint64_t v = 0;
    while (values.size() < 8 && in >> v) {
        values.push_back(v);
    }
    if (values.size() < 4) {
        return std::nullopt;
    }

    CpuTimes times;
    for (auto value : values) {
        times.total += value;
    }
    times.idle = values[3] + (values.size() > 4 ? values[4] : 0);
    return times;
}

double ProcSystemMonitor::cpuPercent() {
    auto current = readCpuTimes();
    if (!current) {
        return 0.0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    CpuTimes previous = lastCpu_.value_or(CpuTimes{});
    lastCpu_ = current;

    uint64_t totalDelta = current->total - previous.total;
    uint64_t idleDelta = current->idle - previous.idle;
    if (totalDelta == 0) {
        return 0.0;
    }
    return 100.0 * static_cast<double>(totalDelta - idleDelta) / static_cast<double>(totalDelta);
}

double ProcSystemMonitor::diskPercent() const {
    struct statvfs stats {};
    if (statvfs(diskPath_.c_str(), &stats) != 0 || stats.f_blocks == 0) {
        std::cerr << "[ProcSystemMonitor] statvfs failed for " << diskPath_ << std::endl;
        return 0.0;
    }

    auto total = static_cast<double>(stats.f_blocks);
    auto free = static_cast<double>(stats.f_bfree);
    return 100.0 * (total - free) / total;
}

uint64_t ProcSystemMonitor::countOpenFiles() const {
    std::error_code ec;
    std::filesystem::directory_iterator it(procRoot_ + "/self/fd", ec);
    if (ec) {
        return 0;
    }

    uint64_t count = 0;
    for (const auto& entry : it) {
        (void)entry;
        ++count;
    }
    return count;
}

std::string ProcSystemMonitor::readFile(const std::string& relative) const {
    std::ifstream in(procRoot_ + "/" + relative);
    if (!in) {
        return {};
    }
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

} // namespace apiclient::adapters::secondary
