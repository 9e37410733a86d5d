#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/logger.hpp"


namespace shardwire::examples::cli::rate_limit {

struct Params {
    int limit                 = 5;
    std::uint32_t window_ms   = 1000;
    std::uint32_t threads     = 4;
    std::uint32_t requests    = 10;
    std::string log_level     = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Limit     : " << limit << " per window\n"
           << "  Window    : " << window_ms << " ms\n"
           << "  Threads   : " << threads << "\n"
           << "  Requests  : " << requests << " per thread\n"
           << "  Log Level : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("--limit", params.limit, "Requests allowed per window by the simulated server")->check(CLI::Range(1, 10000))->default_val(params.limit);
    app.add_option("-w,--window-ms", params.window_ms, "Window length in milliseconds")->check(CLI::Range(10u, 60000u))->default_val(params.window_ms);
    app.add_option("-t,--threads", params.threads, "Concurrent callers")->check(CLI::Range(1u, 256u))->default_val(params.threads);
    app.add_option("-n,--requests", params.requests, "Requests per caller")->check(CLI::Range(1u, 100000u))->default_val(params.requests);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->default_val(params.log_level);

    app.footer(
        "The simulated server answers every request with its remaining budget\n"
        "and reset delay, and counts every request that exceeds the window."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e, std::cout, std::cerr);
        std::exit(EXIT_FAILURE);
    }

    set_log_level(params.log_level);
    return params;
}

} // namespace shardwire::examples::cli::rate_limit
