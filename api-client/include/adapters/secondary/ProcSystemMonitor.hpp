#pragma once

#include "ports/output/ISystemMonitor.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace apiclient::adapters::secondary {

/**
 * @brief Ресурсы хоста и процесса из /proc (Linux)
 *
 * - cpu: доля не-idle времени из /proc/stat между двумя вызовами
 *   (первый вызов - среднее с момента загрузки)
 * - memory: 1 - MemAvailable / MemTotal
 * - disk: занятое место на diskPath (statvfs)
 * - network: сумма байт по интерфейсам кроме lo
 * - openFiles / threads: текущий процесс
 */
class ProcSystemMonitor : public ports::output::ISystemMonitor {
public:
    explicit ProcSystemMonitor(std::string procRoot = "/proc", std::string diskPath = "/");

    ports::output::SystemUsage sample() override;

    static double parseMemoryPercent(const std::string& meminfo);

    static void parseNetworkBytes(const std::string& netDev, uint64_t& sent, uint64_t& received);

    static uint64_t parseThreads(const std::string& status);

private:
    struct CpuTimes {
        uint64_t idle = 0;
        uint64_t total = 0;
    };

    std::optional<CpuTimes> readCpuTimes() const;
    double cpuPercent();
    double diskPercent() const;
    uint64_t countOpenFiles() const;
    std::string readFile(const std::string& relative) const;

    std::string procRoot_;
    std::string diskPath_;

    std::mutex mutex_;
    std::optional<CpuTimes> lastCpu_;
};

} // namespace apiclient::adapters::secondary
