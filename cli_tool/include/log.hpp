#pragma once

#include <iostream>
#include <mutex>
#include <string>

namespace Log {
enum class Level { Debug, Info, Quiet };

inline Level& level() {
    static Level current = Level::Info;
    return current;
}

inline void set_level(Level l) { level() = l; }

inline std::mutex& console_mutex() {
    static std::mutex m;
    return m;
}

inline void write(std::ostream& os, const char* prefix, const std::string& msg) {
    std::lock_guard<std::mutex> lock(console_mutex());
    os << prefix << " " << msg << std::endl;
}

inline void debug(const std::string& msg) {
    if (level() == Level::Debug) write(std::cout, "[.]", msg);
}

inline void info(const std::string& msg) {
    if (level() != Level::Quiet) write(std::cout, "[*]", msg);
}

inline void ok(const std::string& msg) {
    if (level() != Level::Quiet) write(std::cout, "[+]", msg);
}

inline void warn(const std::string& msg) {
    if (level() != Level::Quiet) write(std::cerr, "[!]", msg);
}

// errors are printed even when quiet
inline void error(const std::string& msg) { write(std::cerr, "[-]", msg); }
}  // namespace Log
