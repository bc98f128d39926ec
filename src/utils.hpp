#pragma once

#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <chrono>
#include <unordered_map>
#include <iostream>
#include <iomanip>

namespace Utils {

    inline std::string toLower(const std::string& s) {
        std::string result = s;
        std::transform(result.begin(), result.end(), result.begin(), ::tolower);
        return result;
    }

    inline std::string trim(const std::string& s) {
        size_t begin = 0;
        size_t end = s.size();
        while (begin < end && isspace(static_cast<unsigned char>(s[begin]))) begin++;
        while (end > begin && isspace(static_cast<unsigned char>(s[end - 1]))) end--;
        return s.substr(begin, end - begin);
    }

    inline bool endsWith(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() &&
               s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    inline std::vector<std::string> splitLines(const std::string& text) {
        std::vector<std::string> lines;
        std::stringstream ss(text);
        std::string line;
        while (std::getline(ss, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            lines.push_back(line);
        }
        return lines;
    }

    // Quotes a CSV field when it contains a delimiter, quote or newline
    inline std::string csvField(const std::string& value) {
        if (value.find_first_of(",\"\n\r") == std::string::npos) return value;
        std::string out = "\"";
        for (char c : value) {
            if (c == '"') out += '"';
            out += c;
        }
        out += '"';
        return out;
    }

    // Profiling helpers
    struct TimerStats {
        double total_ms = 0;
        size_t count = 0;
    };

    class Profiler {
    public:
        static Profiler& instance() {
            static Profiler inst;
            return inst;
        }

        void start(const std::string& name) {
            start_times[name] = std::chrono::high_resolution_clock::now();
        }

        void stop(const std::string& name) {
            auto end = std::chrono::high_resolution_clock::now();
            auto it = start_times.find(name);
            if (it != start_times.end()) {
                std::chrono::duration<double, std::milli> ms = end - it->second;
                stats[name].total_ms += ms.count();
                stats[name].count++;
            }
        }

        const std::unordered_map<std::string, TimerStats>& allStats() const { return stats; }

        void printStats(std::ostream& out = std::cout) const {
            out << "\n--- Profiling Stats ---" << std::endl;
            out << std::left << std::setw(25) << "Name"
                << std::right << std::setw(15) << "Total (ms)"
                << std::setw(10) << "Calls"
                << std::setw(15) << "Avg (ms)" << std::endl;
            out << std::string(65, '-') << std::endl;

            for (const auto& pair : stats) {
                double avg = pair.second.count > 0 ? pair.second.total_ms / pair.second.count : 0.0;
                out << std::left << std::setw(25) << pair.first
                    << std::right << std::setw(15) << std::fixed << std::setprecision(2) << pair.second.total_ms
                    << std::setw(10) << pair.second.count
                    << std::setw(15) << avg << std::endl;
            }
            out << std::string(65, '-') << std::endl;
        }

    private:
        std::unordered_map<std::string, std::chrono::time_point<std::chrono::high_resolution_clock>> start_times;
        std::unordered_map<std::string, TimerStats> stats;
    };

    class ScopedTimer {
    public:
        ScopedTimer(const std::string& name) : name(name) {
            Profiler::instance().start(name);
        }
        ~ScopedTimer() {
            Profiler::instance().stop(name);
        }
    private:
        std::string name;
    };
}
