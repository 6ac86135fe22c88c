#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include "evdev_keyboard.hpp"
#include "finish_trigger.hpp"
#include "recorder.hpp"
#include "recorder_config.hpp"

int main(int argc, char** argv) {
    RecorderConfig config;
    bool show_help = false;
    std::string error;

    // Parse command-line arguments
    if (!parse_arguments(argc, argv, config, show_help, error)) {
        std::cerr << "Error: " << error << "\n" << std::endl;
        print_usage(argv[0]);
        return 1;
    }
    if (show_help) {
        print_usage(argv[0]);
        return 0;
    }

    // Validate configuration
    std::vector<std::string> problems = config.validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "Error: " << problem << std::endl;
        }
        std::cerr << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(config.output_dir, ec);
    if (ec) {
        std::cerr << "Error: cannot create output directory " << config.output_dir << ": " << ec.message() << std::endl;
        return 1;
    }

    // Set up signal handler for graceful shutdown
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    EvdevKeyboard keyboard;
    if (!keyboard.initialize(config.keyboard_devices) || !keyboard.start()) {
        std::cerr << "Failed to start keyboard capture" << std::endl;
        return 1;
    }

    // The quit key ends recording from anywhere, including mid-session
    KeySubscription quit_subscription(keyboard, config.quit_key, [](const KeyTransition& transition) {
        if (transition.down) {
            keep_running = 0;
        }
    });

    std::cout << "press \"" << config.start_key << "\" to start recording." << std::endl;
    {
        KeyFinishTrigger start_trigger(keyboard, config.start_key, &keep_running);
        while (!start_trigger.wait_for(std::chrono::milliseconds(200))) {
            if (keyboard.failed()) {
                std::cerr << "Keyboard capture failed: " << keyboard.last_error() << std::endl;
                return 1;
            }
        }
    }
    if (!keep_running) {
        std::cout << "\nShutting down..." << std::endl;
        return 0;
    }

    std::cout << "start recording... (press \"" << config.quit_key << "\" to exit, press \""
              << config.finish_key << "\" to save and start next recording)" << std::endl;

    Recorder recorder(config, keyboard);
    int saved = 0;
    while (keep_running) {
        SessionOutcome outcome = recorder.record_session();
        if (outcome == SessionOutcome::SAVED) {
            saved++;
        }

        // A dead keyboard can't deliver the finish or quit key anymore
        if (keyboard.failed()) {
            std::cerr << "Keyboard capture failed: " << keyboard.last_error() << std::endl;
            break;
        }

        // Don't spin on a backend that fails immediately, wait for the user to retry
        if (outcome == SessionOutcome::FAILED && keep_running) {
            std::cout << "press \"" << config.finish_key << "\" to start the next recording." << std::endl;
            KeyFinishTrigger retry_trigger(keyboard, config.finish_key, &keep_running);
            while (!retry_trigger.wait_for(std::chrono::milliseconds(200)) && !keyboard.failed()) {
            }
        }
    }

    std::cout << "\nShutting down... " << saved << " session(s) saved to " << config.output_dir << std::endl;
    keyboard.stop();
    return keyboard.failed() ? 1 : 0;
}
