#include <ctime>
#include <iostream>

#include "clock.hpp"

namespace wl {
    namespace misc {

        Clock::Clock(const std::string & msg) : _message(msg) {
            std::cout << "[" << _message << "] Started." << std::endl;
            _startTime = std::chrono::steady_clock::now();
        }

        Clock::~Clock() {
            auto duration = std::chrono::steady_clock::now() - _startTime;
            std::cout
                << "[" << _message << "] Stopped. Time Elapsed: "
                << std::chrono::duration_cast<std::chrono::milliseconds>(duration).count()
                << " ms" << std::endl;
        }

        std::string CurrentTimeString(bool tagified) {
            std::time_t t = std::time(nullptr);
            char buffer[64];
            const char * format = tagified ? "%Y%m%d_%H%M%S" : "%Y-%m-%d %H:%M:%S";
            std::strftime(buffer, sizeof(buffer), format, std::localtime(&t));
            return buffer;
        }
    }
}
