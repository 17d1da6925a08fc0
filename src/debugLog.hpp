#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace nbns
{
namespace debug
{
#if defined(NBNS_ENABLE_LOGGING)

inline std::string timestamp()
{
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto timeT = system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &timeT);
#else
    localtime_r(&timeT, &tm);
#endif
    const auto duration = now.time_since_epoch();
    const auto secondsPart = duration_cast<seconds>(duration);
    const auto microsPart = duration_cast<microseconds>(duration - secondsPart);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << microsPart.count();
    return oss.str();
}

inline void log(const std::string& component, const std::string& message)
{
    std::cout << '[' << timestamp() << "] [" << component << "] " << message << std::endl;
}

// Hex dump, 16 bytes per row, each row prefixed by its offset.
inline void logBuffer(const std::string& component,
                      const std::string& label,
                      const std::string& buffer)
{
    std::ostringstream text;
    text << label << " (" << buffer.size() << " bytes)" << std::setfill('0') << std::hex;

    for (std::size_t i = 0; i < buffer.size(); ++i)
    {
        if ((i % 16) == 0)
            text << std::endl << "    " << std::setw(4) << i << ": ";
        text << std::setw(2) << static_cast<unsigned int>(static_cast<unsigned char>(buffer[i])) << ' ';
    }

    log(component, text.str());
}

#else

inline void log(const std::string& component, const std::string& message)
{
    (void)component;
    (void)message;
}

inline void logBuffer(const std::string& component,
                      const std::string& label,
                      const std::string& buffer)
{
    (void)component;
    (void)label;
    (void)buffer;
}

#endif
} // namespace debug
} // namespace nbns
