#pragma once
#include <atomic>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace cidispatch::core::config {

    // Tag for one tool call, e.g. "req-12-1f3a09cd". The sequence number keeps
    // tags unique within a process; the random part keeps them apart across
    // restarts when logs from several servers are merged.
    inline std::string generate_request_id(const std::string& prefix = "req-") {
        static std::atomic<std::uint64_t> sequence{0};
        thread_local std::mt19937 gen{std::random_device{}()};
        std::uniform_int_distribution<std::uint32_t> dis(0, 0xffffffffu);

        std::ostringstream ss;
        ss << prefix << ++sequence << '-' << std::hex << std::setw(8) << std::setfill('0')
           << dis(gen);
        return ss.str();
    }

} // namespace cidispatch::core::config
