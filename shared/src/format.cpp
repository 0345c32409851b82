#include "minishare/format.hpp"

#include <array>
#include <cmath>

#include <spdlog/common.h>
#include <spdlog/fmt/fmt.h>

namespace minishare
{

    std::string format_size(std::uint64_t bytes)
    {
        if (bytes < 1024)
        {
            return spdlog::fmt_lib::format("{} B", bytes);
        }
        static constexpr std::array<char, 6> kPrefixes{'K', 'M', 'G', 'T', 'P', 'E'};
        double value = static_cast<double>(bytes);
        std::size_t exponent = 0;
        while (value >= 1024.0 && exponent < kPrefixes.size())
        {
            value /= 1024.0;
            ++exponent;
        }
        return spdlog::fmt_lib::format("{:.1f} {}B", value, kPrefixes[exponent - 1]);
    }

    std::string format_rate(double bytes_per_second)
    {
        if (!std::isfinite(bytes_per_second) || bytes_per_second < 0.0)
        {
            return "-";
        }
        return format_size(static_cast<std::uint64_t>(bytes_per_second)) + "/s";
    }

} // namespace minishare
