#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace apiclient::ports::output {

/**
 * @brief Использование ресурсов процессом и хостом
 */
struct SystemUsage {
    double cpuPercent = 0.0;
    double memoryPercent = 0.0;
    double diskPercent = 0.0;
    uint64_t networkBytesSent = 0;
    uint64_t networkBytesRecv = 0;
    uint64_t openFiles = 0;
    uint64_t threads = 0;

    /**
     * @brief Значения под именами метрик system_<name>
     */
    std::map<std::string, double> asMetrics() const {
        return {
            {"cpu_percent", cpuPercent},
            {"memory_percent", memoryPercent},
            {"disk_percent", diskPercent},
            {"network_bytes_sent", static_cast<double>(networkBytesSent)},
            {"network_bytes_recv", static_cast<double>(networkBytesRecv)},
            {"open_files", static_cast<double>(openFiles)},
            {"threads", static_cast<double>(threads)}
        };
    }
};

class ISystemMonitor {
public:
    virtual ~ISystemMonitor() = default;

    virtual SystemUsage sample() = 0;
};

} // namespace apiclient::ports::output
