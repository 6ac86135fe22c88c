#include "recorder_config.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <utility>

#include "key_names.hpp"

namespace {

// Leaves `value` untouched unless the whole text is a finite number.
bool parse_double(const std::string& text, double& value) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    double parsed = std::strtod(text.c_str(), &end);
    if (end == nullptr || *end != '\0') return false;
    if (errno == ERANGE || !std::isfinite(parsed)) return false;
    value = parsed;
    return true;
}

bool parse_int(const std::string& text, int& value) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(text.c_str(), &end, 10);
    if (end == nullptr || *end != '\0') return false;
    if (errno == ERANGE || parsed < INT_MIN || parsed > INT_MAX) return false;
    value = static_cast<int>(parsed);
    return true;
}

// Splits on `sep` and parses exactly `count` integers.
bool parse_ints(const std::string& text, char sep, size_t count, std::vector<int>& out) {
    out.clear();
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, sep)) {
        int value;
        if (!parse_int(part, value)) return false;
        out.push_back(value);
    }
    return out.size() == count;
}

}  // namespace

std::vector<std::string> RecorderConfig::validate() const {
    std::vector<std::string> errors;

    if (output_dir.empty()) {
        errors.push_back("output directory must not be empty");
    }
    if (recording_keys.empty()) {
        errors.push_back("at least one recording key is required");
    }
    for (const auto& key : recording_keys) {
        if (!is_known_key(key)) {
            errors.push_back("unknown recording key '" + key + "'");
        }
        if (std::count(recording_keys.begin(), recording_keys.end(), key) > 1) {
            errors.push_back("recording key '" + key + "' is listed more than once");
        }
    }
    const std::pair<const char*, const std::string*> control_keys[] = {
        {"finish", &finish_key}, {"start", &start_key}, {"quit", &quit_key}
    };
    for (const auto& [role, key] : control_keys) {
        if (!is_known_key(*key)) {
            errors.push_back(std::string("unknown ") + role + " key '" + *key + "'");
        } else if (std::find(recording_keys.begin(), recording_keys.end(), *key) != recording_keys.end()) {
            errors.push_back(std::string(role) + " key '" + *key + "' is also a recording key");
        }
    }
    if (finish_key == quit_key) {
        errors.push_back("finish key and quit key must differ");
    }
    if (start_key == quit_key) {
        errors.push_back("start key and quit key must differ");
    }

    if (!std::isfinite(discard_tail_sec) || discard_tail_sec < 0 || discard_tail_sec > MAX_TIME_OFFSET_SEC) {
        errors.push_back("discard tail must be between 0 and " + std::to_string(MAX_TIME_OFFSET_SEC) + " seconds");
    }
    if (!std::isfinite(key_delay_sec) || std::fabs(key_delay_sec) > MAX_TIME_OFFSET_SEC) {
        errors.push_back("key delay must be between -" + std::to_string(MAX_TIME_OFFSET_SEC) + " and "
                         + std::to_string(MAX_TIME_OFFSET_SEC) + " seconds");
    }
    if (max_fps <= 0) {
        errors.push_back("max fps must be positive");
    }
    if (output_width <= 0 || output_height <= 0) {
        errors.push_back("output size must be positive");
    }
    if (!region.is_full_screen() && (region.width <= 0 || region.height <= 0 || region.x < 0 || region.y < 0)) {
        errors.push_back("capture region must have a non-negative origin and a positive extent");
    }

    // Duplicates are reported once per occurrence above, collapse them.
    std::sort(errors.begin(), errors.end());
    errors.erase(std::unique(errors.begin(), errors.end()), errors.end());
    return errors;
}

bool parse_size(const std::string& text, int& width, int& height) {
    std::vector<int> values;
    if (!parse_ints(text, 'x', 2, values)) return false;
    width = values[0];
    height = values[1];
    return true;
}

bool parse_region(const std::string& text, CaptureRegion& region) {
    std::vector<int> values;
    if (!parse_ints(text, ',', 4, values)) return false;
    region.x = values[0];
    region.y = values[1];
    region.width = values[2];
    region.height = values[3];
    return true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "\nRecords screen frames together with the keys held at each frame.\n"
              << "Press the start key to begin, the finish key to save a session and\n"
              << "start the next one, the quit key (or Ctrl+C) to stop without saving.\n"
              << "\nOptions:\n"
              << "  --output-dir <path>          Output directory for sessions (default: data)\n"
              << "  --keys <k1,k2,...>           Recording keys (default: w,a,s,d)\n"
              << "  --finish-key <key>           Save-and-next key (default: space)\n"
              << "  --start-key <key>            Start key (default: e)\n"
              << "  --quit-key <key>             Quit key (default: q)\n"
              << "  --discard-tail-sec <sec>     Seconds dropped at the end (default: 3)\n"
              << "  --key-delay-sec <sec>        Key timestamp offset (default: -0.010)\n"
              << "  --abort-on-orphan-release    Fail the session on a release without press\n"
              << "  --max-fps <n>                Capture rate limit (default: 30)\n"
              << "  --size <WxH>                 Output frame size (default: 180x100)\n"
              << "  --region <x,y,w,h>           Screen region (default: whole screen)\n"
              << "  --display <name>             X display (default: $DISPLAY)\n"
              << "  --keyboard-device <path>     evdev keyboard, repeatable (default: auto)\n"
              << "  --help                       Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --output-dir ./data --keys w,a,s,d,space --finish-key enter\n"
              << std::endl;
}

bool parse_arguments(int argc, char** argv, RecorderConfig& config, bool& show_help, std::string& error) {
    show_help = false;
    for (int i = 1; i < argc; i++) {
        std::string arg = std::string(argv[i]);

        if (arg == "--help") {
            show_help = true;
            return true;
        }
        if (arg == "--abort-on-orphan-release") {
            config.orphan_policy = OrphanReleasePolicy::ABORT;
            continue;
        }

        // Every other flag takes a value
        if (i + 1 >= argc) {
            error = arg + " requires a value";
            return false;
        }
        std::string value = std::string(argv[++i]);

        if (arg == "--output-dir") {
            config.output_dir = value;
        } else if (arg == "--keys") {
            config.recording_keys = split_key_list(value);
        } else if (arg == "--finish-key") {
            config.finish_key = normalize_key_name(value);
        } else if (arg == "--start-key") {
            config.start_key = normalize_key_name(value);
        } else if (arg == "--quit-key") {
            config.quit_key = normalize_key_name(value);
        } else if (arg == "--discard-tail-sec") {
            if (!parse_double(value, config.discard_tail_sec)) {
                error = "invalid --discard-tail-sec '" + value + "'";
                return false;
            }
        } else if (arg == "--key-delay-sec") {
            if (!parse_double(value, config.key_delay_sec)) {
                error = "invalid --key-delay-sec '" + value + "'";
                return false;
            }
        } else if (arg == "--max-fps") {
            if (!parse_int(value, config.max_fps)) {
                error = "invalid --max-fps '" + value + "'";
                return false;
            }
        } else if (arg == "--size") {
            if (!parse_size(value, config.output_width, config.output_height)) {
                error = "invalid --size '" + value + "', expected WxH";
                return false;
            }
        } else if (arg == "--region") {
            if (!parse_region(value, config.region)) {
                error = "invalid --region '" + value + "', expected x,y,w,h";
                return false;
            }
        } else if (arg == "--display") {
            config.display_name = value;
        } else if (arg == "--keyboard-device") {
            config.keyboard_devices.push_back(value);
        } else {
            error = "unknown argument '" + arg + "'";
            return false;
        }
    }
    return true;
}
