#include "pod_device/config.hpp"
#include "pod_device/debug.hpp"
#include "pod_device/device.hpp"
#include "pod_device/hidraw_channel.hpp"
#include "pod_device/recording.hpp"
#include "pod_device/session.hpp"

#include "pmem_decoder/internal_log.hpp"
#include "pmem_decoder/memory_image.hpp"
#include "pmem_decoder/pmem_file.hpp"
#include "pmem_decoder/track.hpp"

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

namespace po = boost::program_options;

using pod_device::errorCodeToString;

namespace {

const char* USAGE =
    "Usage: gpspod [options] COMMAND [ARGS]\n"
    "\n"
    "Commands:\n"
    "  info                 Model, serial and versions\n"
    "  status               Battery charge\n"
    "  settings             Personal settings\n"
    "  set-settings         Write log settings (--interval, --autolap, --autostart, --autosleep)\n"
    "  sounds               Switch sounds --on or --off\n"
    "  set-time             Set the clock to the local time\n"
    "  sgee-date            Date of the SGEE data on the pod\n"
    "  sgee-upload FILE     Upload SGEE data\n"
    "  reset                Reset the pod\n"
    "  log-headers          Log headers as kept by the pod\n"
    "  dump OUT             Save the filesystem image\n"
    "  tracks               Decode the tracks (--image or device)\n"
    "  internal-log         Decode the internal log (--image or device)\n"
    "  replay REC           Print the messages of a recording\n"
    "  reconstruct REC OUT  Rebuild the filesystem image from a recording\n";

/**
 * @brief Open device connection, optionally recording the traffic
 */
class Connection {
public:
    Connection(const po::variables_map& vm, const std::string& configPath) {
        pod_device::HidrawChannel::Config channelConfig;
        pod_device::Session::Config sessionConfig;
        if (!configPath.empty()) {
            channelConfig = pod_device::Config::loadDeviceConfig(configPath);
            sessionConfig = pod_device::Config::loadSessionConfig(configPath);
        }
        if (vm.count("device")) {
            channelConfig.path = vm["device"].as<std::string>();
        }

        auto hidraw = std::make_shared<pod_device::HidrawChannel>(channelConfig);
        auto opened = hidraw->open();
        if (!opened) {
            throw std::runtime_error(errorCodeToString(opened.errorCode) + " - " + opened.errorMessage);
        }
        pod_device::Session::drain(*hidraw, sessionConfig.pollTimeout, sessionConfig.packetSize);

        std::shared_ptr<pod_device::IChannel> channel = hidraw;
        if (vm.count("record")) {
            recordPath_ = vm["record"].as<std::string>();
            recorder_ = std::make_shared<pod_device::RecordingChannel>(hidraw);
            channel = recorder_;
        }

        pod_ = std::make_shared<pod_device::GpsPod>(std::make_shared<pod_device::Session>(channel, sessionConfig));
    }

    ~Connection() {
        if (!recorder_) {
            return;
        }
        try {
            recorder_->save(recordPath_);
        } catch (const std::exception& e) {
            spdlog::error("Recording not saved: {}", e.what());
        }
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    pod_device::GpsPod& pod() { return *pod_; }
    std::shared_ptr<pod_device::GpsPod> podPtr() { return pod_; }

private:
    std::shared_ptr<pod_device::GpsPod> pod_;
    std::shared_ptr<pod_device::RecordingChannel> recorder_;
    std::string recordPath_;
};

const std::string& argument(const std::vector<std::string>& args, size_t index, const std::string& command,
                            const char* name) {
    if (args.size() <= index) {
        throw std::invalid_argument(command + " needs " + name);
    }
    return args[index];
}

template<typename T>
int report(const pod_device::Result<T>& result) {
    std::cerr << "Error: " << errorCodeToString(result.errorCode) << " - " << result.errorMessage << std::endl;
    return 1;
}

void printJson(const nlohmann::json& json) {
    std::cout << json.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

pod_device::Bytes readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open " + path);
    }
    return pod_device::Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

nlohmann::json decodeTracks(pmem_decoder::MemoryImage& image, bool recover) {
    pmem_decoder::PmemFile file(image);
    pmem_decoder::TrackLog log(file);
    log.load();

    nlohmann::json tracks = nlohmann::json::array();
    for (const auto& track : log.tracks()) {
        tracks.push_back(track.toJson());
    }

    if (recover) {
        auto recovered = log.recoverTrack();
        if (recovered) {
            tracks.push_back(recovered->toJson());
        } else {
            spdlog::info("No track could be recovered");
        }
    }
    return tracks;
}

nlohmann::json decodeInternalLog(pmem_decoder::MemoryImage& image) {
    pmem_decoder::PmemFile file(image);
    pmem_decoder::InternalLog log(file);
    log.load();
    return log.toJson();
}

nlohmann::json missingJson(const pmem_decoder::MemoryImage& image) {
    nlohmann::json missing = nlohmann::json::array();
    for (const auto& range : image.missingRanges()) {
        missing.push_back({range.first, range.second});
    }
    return missing;
}

pod_protocol::LogSettingsBody logSettingsFromOptions(const po::variables_map& vm) {
    auto settings = pod_protocol::LogSettingsBody::defaults();
    if (vm.count("interval")) {
        settings.setInterval(vm["interval"].as<uint16_t>());
    }
    if (vm.count("autolap")) {
        settings.setAutolap(vm["autolap"].as<uint16_t>());
    }
    if (vm.count("autostart")) {
        settings.setAutostart(vm["autostart"].as<bool>());
    }
    if (vm.count("autosleep")) {
        settings.setAutosleep(vm["autosleep"].as<uint16_t>());
    }
    return settings;
}

int runDeviceCommand(const std::string& command, const std::vector<std::string>& args,
                     const po::variables_map& vm, const std::string& configPath) {
    Connection connection(vm, configPath);
    auto& pod = connection.pod();

    if (command == "info") {
        auto result = pod.deviceInfo();
        if (!result) return report(result);
        printJson(result.value.toJson());
    } else if (command == "status") {
        auto result = pod.deviceStatus();
        if (!result) return report(result);
        printJson(result.value.toJson());
    } else if (command == "settings") {
        auto result = pod.readSettings();
        if (!result) return report(result);
        printJson(result.value.toJson());
    } else if (command == "set-settings") {
        auto settings = logSettingsFromOptions(vm);
        auto result = pod.writeLogSettings(settings);
        if (!result) return report(result);
        printJson(settings.toJson());
    } else if (command == "sounds") {
        if (vm["on"].as<bool>() == vm["off"].as<bool>()) {
            throw std::invalid_argument("sounds needs exactly one of --on or --off");
        }
        const bool enabled = vm["on"].as<bool>();
        auto result = pod.setSounds(enabled);
        if (!result) return report(result);
        printJson({{"sounds", enabled}});
    } else if (command == "set-time") {
        auto now = std::chrono::system_clock::now();
        auto result = pod.setDateTime(now);
        if (!result) return report(result);
        printJson({{"time", std::chrono::system_clock::to_time_t(now)}});
    } else if (command == "sgee-date") {
        auto result = pod.readSgeeDate();
        if (!result) return report(result);
        printJson(result.value.toJson());
    } else if (command == "sgee-upload") {
        auto data = readFile(argument(args, 0, command, "FILE"));
        auto result = pod.writeSgee(data);
        if (!result) return report(result);
        printJson({{"uploaded", data.size()}});
    } else if (command == "reset") {
        auto result = pod.reset();
        if (!result) return report(result);
        printJson({{"reset", true}});
    } else if (command == "log-headers") {
        auto result = pod.readLogHeaders();
        if (!result) return report(result);
        nlohmann::json headers = nlohmann::json::array();
        for (const auto& header : result.value) {
            headers.push_back(header.toJson());
        }
        printJson(headers);
    } else if (command == "dump") {
        const auto& output = argument(args, 0, command, "OUT");
        pmem_decoder::MemoryImage image(nullptr);
        auto result = pod.dumpFilesystem(image, [](size_t done, size_t total) {
            if (done % 512 == 0 || done == total) {
                spdlog::info("Retrieved {} of {} blocks", done, total);
            }
        });
        if (!result) return report(result);
        image.save(output);
        printJson({{"path", output}, {"size", image.size()}});
    } else if (command == "tracks") {
        pmem_decoder::MemoryImage image(connection.podPtr());
        printJson(decodeTracks(image, vm["recover"].as<bool>()));
    } else if (command == "internal-log") {
        pmem_decoder::MemoryImage image(connection.podPtr());
        printJson(decodeInternalLog(image));
    } else {
        throw std::invalid_argument("Unknown command: " + command);
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        // Set up command line options
        po::options_description desc("gpspod options");
        desc.add_options()
            ("help,h", "Print help message")
            ("device,d", po::value<std::string>(), "hidraw device node, found through sysfs when omitted")
            ("image,i", po::value<std::string>(), "Decode a saved filesystem image instead of the device")
            ("config,c", po::value<std::string>(), "JSON configuration file")
            ("record,r", po::value<std::string>(), "Record the USB traffic to this file (.json or .json.gz)")
            ("recover", po::bool_switch()->default_value(false), "Try to recover an overwritten track")
            ("verbose,v", po::bool_switch()->default_value(false), "Enable debug logging")
            ("interval", po::value<uint16_t>(), "Sample interval in seconds (1 or 60)")
            ("autolap", po::value<uint16_t>(), "Autolap distance in meters, 0 for off")
            ("autostart", po::value<bool>(), "Start logging automatically (on/off)")
            ("autosleep", po::value<uint16_t>(), "Autosleep in minutes (0, 10, 30 or 60)")
            ("on", po::bool_switch()->default_value(false), "Switch sounds on")
            ("off", po::bool_switch()->default_value(false), "Switch sounds off");

        po::options_description hidden;
        hidden.add_options()
            ("command", po::value<std::string>(), "Command")
            ("args", po::value<std::vector<std::string>>()->default_value({}, ""), "Command arguments");

        po::options_description all;
        all.add(desc).add(hidden);

        po::positional_options_description positional;
        positional.add("command", 1).add("args", -1);

        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);

        // Check for help
        if (vm.count("help") || !vm.count("command")) {
            std::cout << USAGE << "\n" << desc << std::endl;
            return vm.count("help") ? 0 : 1;
        }

        // Log to stderr, stdout carries the JSON output
        spdlog::set_default_logger(spdlog::stderr_color_mt("gpspod"));

        const std::string configPath = vm.count("config") ? vm["config"].as<std::string>() : "";
        spdlog::set_level(configPath.empty() ? spdlog::level::info : pod_device::Config::loadLoggingLevel(configPath));
        if (vm["verbose"].as<bool>()) {
            spdlog::set_level(spdlog::level::debug);
        }

        const auto command = vm["command"].as<std::string>();
        const auto args = vm["args"].as<std::vector<std::string>>();

        if (command == "replay") {
            auto recording = pod_device::Recording::load(argument(args, 0, command, "REC"));
            pod_device::printInteraction(recording, std::cout, isatty(STDOUT_FILENO) == 1);
            return 0;
        }

        if (command == "reconstruct") {
            auto recording = pod_device::Recording::load(argument(args, 0, command, "REC"));
            const auto& output = argument(args, 1, command, "OUT");

            pmem_decoder::MemoryImage image(nullptr);
            size_t blocks = pod_device::reconstructFilesystem(recording, image);
            image.save(output);
            printJson({{"path", output}, {"blocks", blocks}, {"missing", missingJson(image)}});
            return 0;
        }

        if (vm.count("image") && (command == "tracks" || command == "internal-log")) {
            auto image = pmem_decoder::MemoryImage::fromFile(vm["image"].as<std::string>());
            printJson(command == "tracks" ? decodeTracks(*image, vm["recover"].as<bool>())
                                          : decodeInternalLog(*image));
            return 0;
        }

        return runDeviceCommand(command, args, vm, configPath);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
