#include <fcntl.h>
#include <linux/input.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "key_names.hpp"
#include "recording_types.hpp"

/*
    Keeps track of hook latency samples and records each one to a file.
*/
class LatencyLogger {

    private:
        std::string log_file;
        std::ofstream log_fstream;
        int sequence_number;
        double latency_sum_us;

    public:
        LatencyLogger(const std::string& log_file)
            : log_file(log_file), sequence_number(0), latency_sum_us(0) {
            // Check if file already exists
            if (std::filesystem::exists(log_file)) {
                throw std::runtime_error("File already exists: " + log_file);
            }

            log_fstream.open(log_file, std::ios::out);
            if (!log_fstream.is_open()) {
                throw std::runtime_error("Failed to open log file: " + log_file);
            }
        }

        ~LatencyLogger() {
            if (log_fstream.is_open()) {
                log_fstream.close();
            }
        }

        void record(const input_event& event, int64_t delivered_us) {
            int64_t kernel_us = static_cast<int64_t>(event.input_event_sec) * 1'000'000 + event.input_event_usec;
            int64_t latency_us = delivered_us - kernel_us;

            log_fstream << "{"
                        << "\"sequence_number\": " << sequence_number << ", "
                        << "\"key\": \"" << key_name_from_code(event.code) << "\", "
                        << "\"down\": " << (event.value == 1 ? "true" : "false") << ", "
                        << "\"ts_kernel_us\": " << kernel_us << ", "
                        << "\"ts_delivered_us\": " << delivered_us << ", "
                        << "\"latency_us\": " << latency_us
                        << "}" << std::endl;

            latency_sum_us += latency_us;
            sequence_number++;
        }

        int samples() const { return sequence_number; }
        double mean_latency_us() const { return sequence_number > 0 ? latency_sum_us / sequence_number : 0.0; }
};


int main(int argc, char* argv[]) {
    try {
        if (argc < 4) {
            std::cerr << "Usage: " << argv[0] << " <keyboard_device> <seconds> <output_file.jsonl>" << std::endl;
            return 1;
        }
        const std::string device = argv[1];
        const int duration_s = std::stoi(argv[2]);
        LatencyLogger logger(argv[3]);

        int fd = open(device.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) {
            throw std::runtime_error("Failed to open " + device + ": " + std::strerror(errno));
        }
        // Kernel timestamps on the same clock as std::chrono::steady_clock
        int clock_id = CLOCK_MONOTONIC;
        if (ioctl(fd, EVIOCSCLOCKID, &clock_id) < 0) {
            close(fd);
            throw std::runtime_error("Failed to switch " + device + " to CLOCK_MONOTONIC: " + std::strerror(errno));
        }

        std::cout << "Press keys for " << duration_s << " seconds..." << std::endl;
        auto end_time = std::chrono::steady_clock::now() + std::chrono::seconds(duration_s);
        pollfd pfd{fd, POLLIN, 0};
        while (std::chrono::steady_clock::now() < end_time) {
            int ready = poll(&pfd, 1, 50);
            if (ready < 0 && errno != EINTR) {
                close(fd);
                throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
            }
            if (ready <= 0) {
                continue;
            }
            input_event event;
            while (read(fd, &event, sizeof(event)) == static_cast<ssize_t>(sizeof(event))) {
                if (event.type == EV_KEY && event.value != 2) {
                    logger.record(event, now_us());
                }
            }
        }
        close(fd);

        std::cout << "Hook latency is logged to " << argv[3] << std::endl;
        std::cout << "Samples: " << logger.samples() << ", mean latency: " << logger.mean_latency_us() << " us" << std::endl;
        if (logger.samples() > 0) {
            std::cout << "Suggested --key-delay-sec " << -logger.mean_latency_us() / 1'000'000.0 << std::endl;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
