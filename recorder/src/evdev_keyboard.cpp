#include "evdev_keyboard.hpp"

#include <fcntl.h>
#include <linux/input.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>

#include "key_names.hpp"
#include "recording_types.hpp"

namespace {

constexpr int POLL_TIMEOUT_MS = 50;

bool test_bit(const std::vector<unsigned long>& bits, int bit) {
    const size_t per_word = sizeof(unsigned long) * 8;
    return (bits[bit / per_word] >> (bit % per_word)) & 1UL;
}

// A device counts as a keyboard if it reports EV_KEY with the letter row.
bool looks_like_keyboard(int fd) {
    const size_t per_word = sizeof(unsigned long) * 8;
    std::vector<unsigned long> ev_bits(EV_MAX / per_word + 1, 0);
    if (ioctl(fd, EVIOCGBIT(0, ev_bits.size() * sizeof(unsigned long)), ev_bits.data()) < 0) {
        return false;
    }
    if (!test_bit(ev_bits, EV_KEY)) {
        return false;
    }
    std::vector<unsigned long> key_bits(KEY_MAX / per_word + 1, 0);
    if (ioctl(fd, EVIOCGBIT(EV_KEY, key_bits.size() * sizeof(unsigned long)), key_bits.data()) < 0) {
        return false;
    }
    return test_bit(key_bits, KEY_A) && test_bit(key_bits, KEY_Z) && test_bit(key_bits, KEY_SPACE);
}

}  // namespace

std::vector<std::string> find_keyboard_devices() {
    std::vector<std::string> devices;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator("/dev/input", ec)) {
        const std::string name = entry.path().filename().string();
        if (name.rfind("event", 0) != 0) {
            continue;
        }
        int fd = open(entry.path().c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) {
            continue;
        }
        if (looks_like_keyboard(fd)) {
            devices.push_back(entry.path().string());
        }
        close(fd);
    }
    if (ec) {
        std::cerr << "[keyboard] Cannot list /dev/input: " << ec.message() << std::endl;
    }
    std::sort(devices.begin(), devices.end());
    return devices;
}

EvdevKeyboard::EvdevKeyboard() : running_(false), failed_(false), next_id_(1) {}

EvdevKeyboard::~EvdevKeyboard() {
    stop();
    for (int fd : fds_) {
        close(fd);
    }
}

bool EvdevKeyboard::initialize(const std::vector<std::string>& device_paths) {
    device_paths_ = device_paths.empty() ? find_keyboard_devices() : device_paths;
    if (device_paths_.empty()) {
        fail_("no keyboard device found under /dev/input (check read permission)");
        std::cerr << "[keyboard] " << last_error() << std::endl;
        return false;
    }

    for (const auto& path : device_paths_) {
        int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) {
            fail_("failed to open " + path + ": " + std::strerror(errno));
            std::cerr << "[keyboard] " << last_error() << std::endl;
            return false;
        }
        fds_.push_back(fd);
        std::cout << "[keyboard] Listening on " << path << std::endl;
    }
    return true;
}

bool EvdevKeyboard::start() {
    if (fds_.empty()) {
        std::cerr << "[keyboard] Keyboard not initialized" << std::endl;
        return false;
    }
    if (running_.exchange(true)) {
        return true;
    }
    key_state_.clear();
    reader_thread_ = std::make_unique<std::thread>(&EvdevKeyboard::reader_thread_func_, this);
    return true;
}

void EvdevKeyboard::stop() {
    running_ = false;
    if (reader_thread_ && reader_thread_->joinable()) {
        reader_thread_->join();
    }
    reader_thread_.reset();
}

void EvdevKeyboard::reader_thread_func_() {
    std::vector<pollfd> pfds;
    for (int fd : fds_) {
        pfds.push_back(pollfd{fd, POLLIN, 0});
    }

    while (running_) {
        int ready = poll(pfds.data(), pfds.size(), POLL_TIMEOUT_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            fail_(std::string("poll failed: ") + std::strerror(errno));
            return;
        }
        if (ready == 0) {
            continue;
        }

        for (size_t i = 0; i < pfds.size(); i++) {
            if (pfds[i].revents & (POLLERR | POLLHUP | POLLNVAL)) {
                fail_("keyboard device " + device_paths_[i] + " disappeared");
                return;
            }
            if (!(pfds[i].revents & POLLIN)) {
                continue;
            }
            // Drain everything the device has queued
            input_event events[64];
            while (true) {
                ssize_t n = read(pfds[i].fd, events, sizeof(events));
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) break;
                    fail_("read from " + device_paths_[i] + " failed: " + std::strerror(errno));
                    return;
                }
                if (n == 0) break;
                size_t count = static_cast<size_t>(n) / sizeof(input_event);
                for (size_t e = 0; e < count; e++) {
                    // value: 1 = press, 0 = release, 2 = auto-repeat
                    if (events[e].type == EV_KEY && events[e].value != 2) {
                        deliver_(static_cast<int>(i), events[e].code, events[e].value == 1);
                    }
                }
            }
        }
    }
}

void EvdevKeyboard::deliver_(int device, int code, bool down) {
    std::string name;
    if (!key_state_.apply(device, code, down, name)) {
        return;
    }
    KeyTransition transition{name, now_us(), down};

    std::lock_guard<std::mutex> lock(subscribers_mtx_);
    for (auto& entry : subscribers_) {
        if (entry.second.key == name) {
            entry.second.callback(transition);
        }
    }
}

SubscriptionId EvdevKeyboard::subscribe(const std::string& key, KeyCallback callback) {
    std::lock_guard<std::mutex> lock(subscribers_mtx_);
    SubscriptionId id = next_id_++;
    subscribers_.emplace(id, Subscription{normalize_key_name(key), std::move(callback)});
    return id;
}

void EvdevKeyboard::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(subscribers_mtx_);
    subscribers_.erase(id);
}

void EvdevKeyboard::fail_(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(error_mtx_);
        last_error_ = message;
    }
    failed_ = true;
}

bool EvdevKeyboard::failed() const {
    return failed_.load();
}

std::string EvdevKeyboard::last_error() const {
    std::lock_guard<std::mutex> lock(error_mtx_);
    return last_error_;
}
