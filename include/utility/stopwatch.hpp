#ifndef INCLUDED_STOPWATCH
#define INCLUDED_STOPWATCH

#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>

#ifndef BENCH_OSTREAM
#    define BENCH_OSTREAM std::cout
#endif

namespace utility::timing
{

/// Scoped timer. Reports the elapsed time on destruction and, when an
/// operation count is given, the mean time per operation.
class stopwatch
{
    using clock_type = std::chrono::steady_clock;

public:
    explicit stopwatch(const char* label = "Process", std::size_t operations = 0) :
        label_{ label },
        operations_{ operations },
        start_{ clock_type::now() }
    {
    }

    stopwatch(stopwatch const&)                    = delete;
    stopwatch(stopwatch&&)                         = delete;
    auto operator=(stopwatch const&) -> stopwatch& = delete;
    auto operator=(stopwatch&&) -> stopwatch&      = delete;

    ~stopwatch()
    {
        const auto duration = clock_type::now() - start_;
        const auto us = std::chrono::duration_cast<std::chrono::microseconds>(duration);
        BENCH_OSTREAM << std::setw(28) << std::left << label_ << " took " << std::right
                      << std::setw(10) << us.count() << "us";
        if (operations_ != 0)
        {
            const auto ns =
                std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count();
            BENCH_OSTREAM << "\t (" << std::fixed << std::setprecision(2)
                          << static_cast<double>(ns) / static_cast<double>(operations_)
                          << " ns/op)" << std::defaultfloat;
        }
        BENCH_OSTREAM << '\n';
    }

private:
    const char*                  label_{};
    const std::size_t            operations_{};
    const clock_type::time_point start_{};
};

} // namespace utility::timing

#endif // INCLUDED_STOPWATCH
