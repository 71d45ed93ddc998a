#pragma once

#include <chrono>
#include <string>

namespace wl {
    namespace misc {

        // prints start, stop and elapsed time of a scope
        class Clock {
        public:
            explicit Clock(const std::string & msg);
            ~Clock();

        private:
            std::chrono::steady_clock::time_point _startTime;
            std::string _message;
        };

#define SetClock() wl::misc::Clock clock##__COUNTER__(__func__)

        std::string CurrentTimeString(bool tagified = false);
    }
}
