#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include "model/Snapshot.hpp"
#include "app/GpuEstimator.hpp"

// Pure transformations from raw provider readings to response records.
// Shared by every endpoint so the basic and extended views cannot drift.
namespace hostpulse::app {

inline constexpr double kBytesPerGiB = 1024.0 * 1024.0 * 1024.0;
inline constexpr double kPackageBaselineC = 45.0;
inline constexpr double kSystemBaselineC = 35.0;

// Aggregate frequency, else the first core's, else 0
[[nodiscard]] uint64_t resolve_frequency_mhz(uint64_t aggregate_mhz, const std::vector<uint64_t>& per_core_mhz);

[[nodiscard]] hostpulse::model::CpuSnapshot make_cpu_snapshot(const hostpulse::model::CpuReading& r);

[[nodiscard]] hostpulse::model::RealtimeStats make_realtime_stats(double cpu_usage,
                                                                  const hostpulse::model::MemorySnapshot& mem);

// Raw per-process percent of one core divided by the logical core count
[[nodiscard]] double normalize_cpu_usage(double raw_pct, unsigned logical_cpus);

// Normalize, estimate GPU usage, rank by cpu_usage descending (stable) and keep `limit`
[[nodiscard]] std::vector<hostpulse::model::ProcessSnapshot> select_top_processes(
    const hostpulse::model::ProcessTable& table, size_t limit, const GpuEstimator& gpu);

// Fixed placeholder list ("CPU Package", "System"), flagged synthetic
[[nodiscard]] std::vector<hostpulse::model::TemperatureReading> placeholder_temperatures();

// Placeholder list shifted by CPU load: baseline + 0.5*cpu and baseline + 0.3*cpu
[[nodiscard]] std::vector<hostpulse::model::TemperatureReading> estimate_temperatures(double cpu_usage);

[[nodiscard]] std::map<std::string, std::pair<uint64_t, uint64_t>> make_network_activity(
    const std::vector<hostpulse::model::NetworkInterfaceSnapshot>& ifs);

[[nodiscard]] hostpulse::model::AdvancedSystemInfo make_advanced_info(size_t process_count,
                                                                      const std::array<double, 3>& load);

// RFC 3339 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.123Z
[[nodiscard]] std::string format_rfc3339(std::chrono::system_clock::time_point tp);

} // namespace hostpulse::app
