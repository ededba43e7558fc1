#include "oncal/calendar/oncalendar.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

#include <absl/time/clock.h>
#include <spdlog/cfg/env.h>

// Usage: oncal_example_backward_iterator <expression> [count] [zone] [start]
//   count  number of occurrences to print (default 5)
//   zone   tz database name such as Europe/Riga (default: naive wall clock)
//   start  YYYY-MM-DDTHH:MM:SS in that zone (default: now)
int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    if (argc < 2) {
        std::cerr << "usage: " << argv[0]
                  << " <expression> [count] [zone] [start]" << std::endl;
        return 2;
    }

    try {
        const std::string expression = argv[1];
        const std::size_t count =
            argc > 2 ? std::stoul(argv[2]) : std::size_t{5};

        // Parse first so that a bad expression is reported before anything
        // else is looked at
        auto spec = oncal::parseExpression(expression);

        oncal::Timestamp start;
        if (argc > 3) {
            auto zone = oncal::loadTimeZone(argv[3]);
            if (argc > 4) {
                absl::CivilSecond local;
                if (!absl::ParseCivilTime(argv[4], &local)) {
                    std::cerr << "Invalid start time: " << argv[4]
                              << std::endl;
                    return 2;
                }
                start = oncal::Timestamp(local, zone);
            } else {
                start = oncal::Timestamp::now(zone);
            }
        } else {
            start = oncal::Timestamp(
                absl::ToCivilSecond(absl::Now(), absl::LocalTimeZone()));
        }

        oncal::BackwardIterator iterator(spec, start);
        std::cout << "Occurrences of '" << expression << "' before "
                  << start.toIsoString() << ":" << std::endl;
        for (const auto& timestamp : iterator.take(count)) {
            std::cout << "  " << timestamp.toIsoString() << std::endl;
        }
        if (iterator.exhausted()) {
            std::cout << "  (no earlier occurrence)" << std::endl;
        }
    } catch (const oncal::error::Exception& e) {
        std::cerr << e.getMessage() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    return EXIT_SUCCESS;
}
