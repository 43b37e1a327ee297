#include <when/parser.h>

#include <fmt/format.h>

#include <array>
#include <atomic>
#include <chrono>
#include <string_view>
#include <thread>
#include <vector>

using namespace std::chrono;
using namespace std::string_view_literals;

int main()
{
    constexpr auto total_threads = 6UZ;
    constexpr auto total_tasks = 200000Z;

    constexpr auto inputs = std::to_array({
        "now"sv,
        "next monday at 14:30"sv,
        "31.01.2025"sv,
        "01/31/2025 5 pm est"sv,
        "jutro o 15:00"sv,
        "yesterday evening utc+2"sv,
        "2025-01-31T14:30:00+02:00"sv,
        "the 23rd of december at 8 am"sv,
    });
    auto const now = sys_days{2025y / January / 15d} + 12h;

    for (auto num_threads = 1UZ; num_threads != total_threads + 1;
         ++num_threads) {
        std::atomic_int_least64_t remaining_tasks{total_tasks};
        std::atomic_int_least64_t failures{0};
        auto task = [&]() {
            while (true) {
                auto old =
                    remaining_tasks.fetch_sub(1, std::memory_order_relaxed);
                if (old <= 0)
                    break;

                try {
                    auto const ts = when::parse(
                        inputs[static_cast<std::size_t>(old) % inputs.size()],
                        now);
                    static_cast<void>(ts);
                }
                catch (when::ParseError const &) {
                    failures.fetch_add(1, std::memory_order_relaxed);
                }
            }
        };

        std::vector<std::jthread> threads;
        threads.reserve(num_threads);

        auto const start = steady_clock::now();
        for (auto i = 0UZ; i != num_threads; ++i) {
            threads.push_back(std::jthread(task));
        }
        for (auto &t : threads) {
            if (t.joinable()) {
                t.join();
            }
        }
        auto s = duration<double>(steady_clock::now() - start);
        fmt::print("Threads: {:3}, Rate: {:10.0f} parses/s, Failures: {}\n",
                   num_threads, static_cast<double>(total_tasks) / s.count(),
                   failures.load());
    }
}
