/**
 * MiniShare - Human readable sizes and rates.
 */
#pragma once

#include <cstdint>
#include <string>

namespace minishare
{

    // "512 B", "9.8 KB", "1.5 MB" ... base 1024, one decimal above bytes.
    std::string format_size(std::uint64_t bytes);

    std::string format_rate(double bytes_per_second);

} // namespace minishare
