/*
 * main.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: hearthd, a headless front end that prints device events and
reads commands from stdin

**************************************************/

#include <atomic>
#include <csignal>
#include <deque>
#include <future>
#include <filesystem>
#include <iostream>
#include <list>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "app/device_manager.hpp"
#include "config/config_provider.hpp"
#include "device/common/device_exceptions.hpp"
#include "logging/logging_manager.hpp"

namespace po = boost::program_options;

using namespace hearth;
using namespace hearth::device;

namespace {

std::atomic<bool> gInterrupted{false};

void onSignal(int) { gInterrupted = true; }

/**
 * @brief Lines typed by the user, handed from the reader to the main thread
 */
struct InputChannel {
    std::mutex mutex;
    std::deque<std::string> lines;

    auto take() -> std::optional<std::string> {
        std::lock_guard<std::mutex> lock(mutex);
        if (lines.empty()) {
            return std::nullopt;
        }
        auto line = std::move(lines.front());
        lines.pop_front();
        return line;
    }
};

struct PendingCommand {
    std::string description;
    std::future<DeviceVoidResult> result;
};

void printUsage() {
    fmt::print(
        "commands:\n"
        "  list\n"
        "  power <id> on|off\n"
        "  toggle <id>\n"
        "  brightness <id> <0-100>\n"
        "  color <id> <r> <g> <b>\n"
        "  volume <id> <0-100>\n"
        "  media <id> play|pause|stop\n"
        "  status\n"
        "  rescan\n"
        "  reload\n"
        "  quit\n");
}

void printDevices(const std::vector<DeviceSnapshot>& devices) {
    if (devices.empty()) {
        fmt::print("no devices\n");
        return;
    }
    for (const auto& device : devices) {
        const auto& d = device.descriptor;
        const auto& s = device.state;
        std::string details;
        if (s.brightness) {
            details += fmt::format(" brightness={}", *s.brightness);
        }
        if (s.color) {
            details += fmt::format(" color={},{},{}", s.color->r, s.color->g,
                                   s.color->b);
        }
        if (s.volume) {
            details += fmt::format(" volume={}", *s.volume);
        }
        if (s.mediaInfo) {
            details += fmt::format(
                " media={}", playbackStateToString(s.mediaInfo->playbackState));
            if (s.mediaInfo->title) {
                details += fmt::format(" \"{}\"", *s.mediaInfo->title);
            }
        }
        fmt::print("{:<36} {:<24} {:<10} {:<7} {}{}\n", d.id.str(),
                   d.displayName, protocolToString(d.protocol),
                   s.reachable ? "online" : "offline", s.power ? "on" : "off",
                   details);
    }
}

void printEvent(const DeviceEvent& event) {
    switch (event.type()) {
        case DeviceEventType::DeviceDiscovered: {
            const auto& d = event.as<DeviceDiscoveredEvent>().descriptor;
            fmt::print("+ {} \"{}\" at {}\n", d.id.str(), d.displayName,
                       d.address.toString());
            break;
        }
        case DeviceEventType::DeviceLost:
            fmt::print("- {}\n", event.deviceId().str());
            break;
        case DeviceEventType::DeviceStateChanged:
            fmt::print("~ {} {}\n", event.deviceId().str(),
                       toJson(event.as<DeviceStateChangedEvent>().state).dump());
            break;
        case DeviceEventType::DeviceError:
            fmt::print("! {} {}\n", event.deviceId().str(),
                       event.as<DeviceErrorEvent>().error.toString());
            break;
    }
}

auto parseLevel(const std::string& text) -> std::optional<int> {
    try {
        std::size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

/**
 * @brief Parse the device command part of an input line
 */
auto parseCommand(const std::string& verb,
                  const std::vector<std::string>& args)
    -> std::optional<Command> {
    if (verb == "power" && args.size() == 1) {
        if (args[0] == "on" || args[0] == "off") {
            return SetPower{args[0] == "on"};
        }
        return std::nullopt;
    }
    if (verb == "toggle" && args.empty()) {
        return Toggle{};
    }
    if (verb == "brightness" && args.size() == 1) {
        if (auto level = parseLevel(args[0])) {
            return SetBrightness{*level};
        }
        return std::nullopt;
    }
    if (verb == "volume" && args.size() == 1) {
        if (auto level = parseLevel(args[0])) {
            return SetVolume{*level};
        }
        return std::nullopt;
    }
    if (verb == "color" && args.size() == 3) {
        auto r = parseLevel(args[0]);
        auto g = parseLevel(args[1]);
        auto b = parseLevel(args[2]);
        if (r && g && b) {
            return SetColor{Rgb{*r, *g, *b}};
        }
        return std::nullopt;
    }
    if (verb == "media" && args.size() == 1) {
        if (args[0] == "play") {
            return MediaControl{MediaAction::Play};
        }
        if (args[0] == "pause") {
            return MediaControl{MediaAction::Pause};
        }
        if (args[0] == "stop") {
            return MediaControl{MediaAction::Stop};
        }
    }
    return std::nullopt;
}

/**
 * @brief Handle one input line
 * @return false when the user asked to quit
 */
auto handleLine(app::DeviceManager& manager, const std::string& line,
                std::list<PendingCommand>& pending) -> bool {
    std::istringstream in(line);
    std::string verb;
    in >> verb;
    if (verb.empty()) {
        return true;
    }
    if (verb == "quit" || verb == "exit") {
        return false;
    }
    if (verb == "help") {
        printUsage();
        return true;
    }
    if (verb == "list") {
        printDevices(manager.snapshot());
        return true;
    }
    if (verb == "status") {
        for (const auto& status : manager.probeStatus()) {
            fmt::print("{}\n", status.toJson().dump());
        }
        return true;
    }
    if (verb == "rescan") {
        manager.rescan();
        return true;
    }
    if (verb == "reload") {
        if (auto result = manager.reload(); !result) {
            fmt::print("reload failed: {}\n", result.error().toString());
        }
        return true;
    }

    std::string id;
    in >> id;
    std::vector<std::string> args;
    for (std::string arg; in >> arg;) {
        args.push_back(arg);
    }
    auto command = id.empty() ? std::nullopt : parseCommand(verb, args);
    if (!command) {
        fmt::print("cannot parse '{}'\n", line);
        printUsage();
        return true;
    }
    pending.push_back(PendingCommand{
        fmt::format("{} {}", describeCommand(*command), id),
        manager.invoke(DeviceId(id), std::move(*command))});
    return true;
}

void reportFinished(std::list<PendingCommand>& pending) {
    for (auto it = pending.begin(); it != pending.end();) {
        if (it->result.wait_for(std::chrono::seconds(0)) !=
            std::future_status::ready) {
            ++it;
            continue;
        }
        auto result = it->result.get();
        if (result) {
            fmt::print("ok: {}\n", it->description);
        } else {
            fmt::print("failed: {}: {}\n", it->description,
                       result.error().toString());
        }
        it = pending.erase(it);
    }
}

auto makeProvider(const std::filesystem::path& path)
    -> std::shared_ptr<config::ConfigProvider> {
    if (!std::filesystem::exists(path)) {
        spdlog::warn("hearthd: {} not found, using defaults", path.string());
        return std::make_shared<config::StaticConfigProvider>();
    }
    return std::make_shared<config::JsonConfigProvider>(path);
}

}  // namespace

int main(int argc, char* argv[]) {
    po::options_description options("hearthd options");
    options.add_options()
        ("help,h", "Show this help")
        ("config,c", po::value<std::string>()->default_value("hearth.json"),
         "Path to the configuration file")
        ("log-level,l", po::value<std::string>(),
         "Console log level (trace/debug/info/warn/error)");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, options), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "hearthd: " << e.what() << "\n" << options << "\n";
        return 2;
    }
    if (vm.count("help") != 0U) {
        std::cout << options << "\n";
        return 0;
    }

    std::shared_ptr<config::ConfigProvider> provider;
    try {
        provider = makeProvider(vm["config"].as<std::string>());
    } catch (const DeviceException& e) {
        std::cerr << "hearthd: " << e.what() << "\n";
        return 1;
    }

    auto loggingConfig = provider->current()->logging;
    if (vm.count("log-level") != 0U) {
        loggingConfig.consoleLevel = vm["log-level"].as<std::string>();
    }
    logging::LoggingManager::getInstance().initialize(loggingConfig);

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    app::DeviceManager manager(provider);
    manager.start();
    printUsage();

    // getline cannot be interrupted, so the reader is detached at exit.
    // Without a terminal stdin hits EOF at once and only signals stop us.
    auto input = std::make_shared<InputChannel>();
    std::thread([input] {
        for (std::string line; std::getline(std::cin, line);) {
            std::lock_guard<std::mutex> lock(input->mutex);
            input->lines.push_back(std::move(line));
        }
    }).detach();

    std::list<PendingCommand> pending;
    bool running = true;
    while (running && !gInterrupted) {
        auto& events = manager.events();
        if (auto event = events.waitPop(std::chrono::milliseconds(100))) {
            printEvent(*event);
        }
        for (const auto& event : events.drain()) {
            printEvent(event);
        }
        reportFinished(pending);

        while (auto line = input->take()) {
            if (!handleLine(manager, *line, pending)) {
                running = false;
                break;
            }
        }
    }

    spdlog::info("hearthd: shutting down");
    manager.stop();
    logging::LoggingManager::getInstance().shutdown();
    return 0;
}
