#pragma once

#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

#include "log.hpp"

// Called once per chunk with the running byte count and the declared size.
using ProgressCallback = std::function<void(std::uint64_t done, std::uint64_t total)>;

// An empty file is complete as soon as it starts. Anything short of the
// declared size stays below 100, even where the division rounds up.
inline double progress_percent(std::uint64_t done, std::uint64_t total) {
    if (total == 0) return 100.0;
    if (done >= total) return 100.0;
    const double pct = static_cast<double>(done) * 100.0 / static_cast<double>(total);
    return std::min(pct, std::nextafter(100.0, 0.0));
}

// Renders "\r[*] Progress: 42.0% (a/b bytes)" on stdout, with a bar in front
// when stdout is a wide enough terminal.
class ConsoleProgress {
   public:
    explicit ConsoleProgress(std::string label = "Progress") : m_label(std::move(label)) {}

    void operator()(std::uint64_t done, std::uint64_t total) const {
        if (Log::level() == Log::Level::Quiet) return;
        double pct = progress_percent(done, total);
        // one decimal would print 100.0 for the last fraction of a large file
        if (done < total) pct = std::min(pct, 99.9);

        std::ostringstream line;
        line << "\r[*] " << m_label << ": ";
        const int width = bar_width();
        if (width > 0) {
            const int pos = static_cast<int>(width * pct / 100.0);
            line << "[";
            for (int i = 0; i < width; ++i) {
                if (i < pos) line << "=";
                else if (i == pos) line << ">";
                else line << " ";
            }
            line << "] ";
        }
        line << std::fixed << std::setprecision(1) << pct << "% (" << done << "/" << total << " bytes)";

        std::lock_guard<std::mutex> lock(Log::console_mutex());
        std::cout << line.str();
        if (done >= total) {
            std::cout << std::endl;
        } else {
            std::cout << std::flush;
        }
    }

   private:
    static int bar_width() {
        if (!isatty(STDOUT_FILENO)) return 0;
        struct winsize w {};
        if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) != 0) return 0;
        if (w.ws_col < 70) return 0;
        return (w.ws_col - 50 < 40) ? w.ws_col - 50 : 40;
    }

    std::string m_label;
};
