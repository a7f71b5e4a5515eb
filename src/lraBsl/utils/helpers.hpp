#pragma once

#include "../core/types.hpp"
#include <etl/string.h>

namespace lraBsl {
    namespace utils {

        constexpr size_t progress_bar_width = 50;

        /**
         * @brief Render "[####------]" for the bytes already sent
         */
        inline etl::string<progress_bar_width + 2> progress_bar(size_t remaining, size_t total) noexcept {
            size_t filled = progress_bar_width;
            if (total > 0 && remaining <= total) {
                filled = ((total - remaining) * progress_bar_width) / total;
            }
            etl::string<progress_bar_width + 2> bar;
            bar.push_back('[');
            bar.append(filled, '#');
            bar.append(progress_bar_width - filled, '-');
            bar.push_back(']');
            return bar;
        }

    } // namespace utils
} // namespace lraBsl
