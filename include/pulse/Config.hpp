#pragma once

#include "pulse/util/Logger.hpp"

#include <cstddef>

namespace pulse {
struct Defaults {
    static constexpr util::LogLevel LogLevelInit    = util::LogLevel::Info;
    static constexpr bool           JsonLogs        = false;
    static constexpr unsigned       MetricsReportMs = 0;    // reporter off
    static constexpr std::size_t    ConfigLineMax   = 1024; // longer lines are split by fgets
};
}
