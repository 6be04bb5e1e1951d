#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "rateguard/factory.h"
#include "rateguard/version.h"

namespace {

// Ticks and units on the command line are decimal; stoull caps them at 64 bits.
rg::Uint parse_uint(const std::string& s) {
    if (s.empty() || s[0] == '-') throw std::invalid_argument("not an unsigned integer: " + s);
    size_t pos = 0;
    unsigned long long v = std::stoull(s, &pos);
    if (pos != s.size()) throw std::invalid_argument("not an unsigned integer: " + s);
    return static_cast<rg::Uint>(v);
}

void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " <algorithm> <capacity> <param>...\n"
              << "  fixed_window               <capacity> <window_ticks>\n"
              << "  leaky_bucket               <capacity> <leak_interval> <leak_amount>\n"
              << "  token_bucket               <capacity> <refill_interval> <refill_amount>\n"
              << "  sliding_window             <capacity> <bucket_ticks> <bucket_count>\n"
              << "  approximate_sliding_window <capacity> <window_ticks>\n"
              << "then one '<tick> <units>' request per line on stdin.\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 4) {
        usage(argv[0]);
        return 1;
    }

    std::unique_ptr<rg::RateLimiter> limiter;
    try {
        rg::Algorithm alg = rg::parse_algorithm(argv[1]);
        rg::Uint capacity = parse_uint(argv[2]);
        std::vector<rg::Uint> params;
        for (int i = 3; i < argc; ++i) params.push_back(parse_uint(argv[i]));
        limiter = rg::make_rate_limiter(rg::make_limiter_config(alg, capacity, params));
        SPDLOG_INFO("rateguard {} {} capacity={}", RG_VERSION, rg::to_string(alg),
                    rg::to_string(limiter->capacity()));
    } catch (const std::exception& e) {
        SPDLOG_ERROR("invalid configuration: {}", e.what());
        usage(argv[0]);
        return 1;
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(std::cin, line)) {
        ++line_no;
        if (line.empty() || line[0] == '#') continue;

        std::istringstream in(line);
        std::string tick_s, units_s;
        if (!(in >> tick_s >> units_s)) {
            SPDLOG_WARN("line {}: expected '<tick> <units>'", line_no);
            continue;
        }
        rg::Uint tick, units;
        try {
            tick = parse_uint(tick_s);
            units = parse_uint(units_s);
        } catch (const std::exception& e) {
            SPDLOG_WARN("line {}: {}", line_no, e.what());
            continue;
        }

        rg::Decision d = limiter->try_acquire_verbose(tick, units);
        std::cout << "tick=" << rg::to_string(tick) << " units=" << rg::to_string(units)
                  << " -> " << rg::to_string(d.outcome);
        if (!d.allowed()) std::cout << " (" << rg::describe(d) << ")";
        std::cout << " remaining=" << rg::to_string(limiter->current_capacity_at(tick).units) << "\n";
    }
    return 0;
}
