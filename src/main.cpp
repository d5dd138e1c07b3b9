#include "app/Application.hpp"
#include "core/types/ScanRequest.hpp"
#include "infrastructure/media/FfmpegTools.hpp"

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>

namespace po = boost::program_options;

using namespace channelscout;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitRejected = 2;

std::atomic<bool> g_interrupted{false};

void handleSignal(int /*signal*/) {
    g_interrupted = true;
}

void printUsage(const po::options_description& options) {
    std::cout << "ChannelScout " << app::Application::kVersion << "\n"
              << "Discover and validate IPTV streams on the local network.\n\n"
              << "Usage:\n"
              << "  channelscout [OPTIONS] <command> [ARGS]\n\n"
              << "Commands:\n"
              << "  scan        Run a template or multicast scan\n"
              << "  validate    Probe a single stream URL\n"
              << "  screenshot  Capture one frame of a stream to PNG\n"
              << "  presets     List the multicast preset catalog\n"
              << "  history     List recorded scan sessions\n"
              << "  export      Print a recorded scan as JSON\n\n"
              << options << "\n"
              << "Examples:\n"
              << "  channelscout scan --mode template --base-url 'http://{ip}:8080/live'"
                 " --start-ip 192.168.1.10 --end-ip 192.168.1.20\n"
              << "  channelscout scan --mode multicast --protocol rtp --range 239.3.1.1-239.3.1.10"
                 " --port 8000 --port 8004 --smart\n"
              << "  channelscout validate rtsp://192.168.1.50:554/stream1\n";
}

core::ScanRequest requestFromOptions(const po::variables_map& vm) {
    if (vm.count("request")) {
        auto path = vm["request"].as<std::string>();
        std::ifstream file(path);
        if (!file) {
            throw core::InvalidScanRequest("Cannot open request file: " + path);
        }
        nlohmann::json j;
        try {
            file >> j;
        } catch (const nlohmann::json::exception& e) {
            throw core::InvalidScanRequest(std::string("Malformed request file: ") + e.what());
        }
        return core::ScanRequest::fromJson(j);
    }

    if (!vm.count("mode")) {
        throw core::InvalidScanRequest("scan requires --request or --mode");
    }

    core::ScanRequest request;
    auto modeName = vm["mode"].as<std::string>();
    auto mode = core::scanModeFromString(modeName);
    if (!mode) {
        throw core::InvalidScanRequest("Unsupported scan mode: " + modeName);
    }
    request.mode = *mode;

    if (vm.count("base-url")) request.baseUrl = vm["base-url"].as<std::string>();
    if (vm.count("start-ip")) request.startIp = vm["start-ip"].as<std::string>();
    if (vm.count("end-ip")) request.endIp = vm["end-ip"].as<std::string>();
    if (vm.count("protocol")) request.protocol = vm["protocol"].as<std::string>();
    if (vm.count("preset")) request.presetId = vm["preset"].as<std::string>();
    if (vm.count("range")) request.ipRanges = vm["range"].as<std::vector<std::string>>();
    if (vm.count("port")) request.ports = vm["port"].as<std::vector<int>>();
    request.timeoutSeconds = vm["timeout"].as<int>();
    request.smartScan = vm.count("smart") > 0;

    request.validate();
    return request;
}

int runScan(app::Application& app, const std::vector<std::string>& args) {
    po::options_description options("scan options");
    options.add_options()
        ("help,h", "Show help for scan")
        ("request,r", po::value<std::string>(), "JSON file holding the scan request")
        ("mode,m", po::value<std::string>(), "Scan mode: template or multicast")
        ("base-url", po::value<std::string>(), "URL pattern containing {ip}")
        ("start-ip", po::value<std::string>(), "First private address of the range")
        ("end-ip", po::value<std::string>(), "Last private address of the range")
        ("protocol", po::value<std::string>(), "Multicast protocol: udp or rtp")
        ("range", po::value<std::vector<std::string>>()->composing(),
         "Multicast range a.b.c.d-e.f.g.h or single address (repeatable)")
        ("port", po::value<std::vector<int>>()->composing(), "Multicast port (repeatable)")
        ("preset", po::value<std::string>(), "Multicast preset id")
        ("timeout,t", po::value<int>()->default_value(app.config().config().timeoutSeconds),
         "Per-probe timeout in seconds (1-60)")
        ("smart", "Use smart port discovery for multicast scans");

    po::variables_map vm;
    po::store(po::command_line_parser(args).options(options).run(), vm);
    po::notify(vm);

    if (vm.count("help")) {
        std::cout << options << "\n";
        return kExitOk;
    }

    auto request = requestFromOptions(vm);

    std::mutex outputMutex;
    auto& sessions = app.sessions();
    sessions.addResultObserver([&outputMutex](const std::string&, const core::ValidationResult& result) {
        std::lock_guard lock(outputMutex);
        std::cout << result.toJson().dump() << std::endl;
    });

    auto started = sessions.startScan(request);
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    bool cancelSent = false;
    while (!sessions.waitForCompletion(started.id, std::chrono::milliseconds(200))) {
        if (g_interrupted && !cancelSent) {
            spdlog::info("Interrupted, cancelling scan {}", started.id);
            sessions.cancelScan(started.id);
            cancelSent = true;
        }
    }

    auto finished = sessions.getScan(started.id);
    if (!finished) {
        spdlog::error("Scan {} disappeared before completion", started.id);
        return kExitFailure;
    }

    // Joins the session task; the observer above must not outlive outputMutex.
    sessions.removeScan(started.id);
    app.results().saveSession(*finished);
    {
        std::lock_guard lock(outputMutex);
        std::cout << nlohmann::json{{"session", finished->toJson()}}.dump() << std::endl;
    }

    return finished->status == core::ScanStatus::Completed ? kExitOk : kExitFailure;
}

int runValidate(app::Application& app, const std::vector<std::string>& args) {
    po::options_description options("validate options");
    options.add_options()
        ("help,h", "Show help for validate")
        ("url", po::value<std::string>(), "Stream URL")
        ("timeout,t", po::value<int>()->default_value(app.config().config().timeoutSeconds),
         "Probe timeout in seconds (1-60)");
    po::positional_options_description positional;
    positional.add("url", 1);

    po::variables_map vm;
    po::store(po::command_line_parser(args).options(options).positional(positional).run(), vm);
    po::notify(vm);

    if (vm.count("help") || !vm.count("url")) {
        std::cout << "Usage: channelscout validate <url> [--timeout N]\n" << options << "\n";
        return vm.count("help") ? kExitOk : kExitRejected;
    }

    auto timeout = vm["timeout"].as<int>();
    if (timeout < core::ScanRequest::kMinTimeoutSeconds ||
        timeout > core::ScanRequest::kMaxTimeoutSeconds) {
        std::cerr << "Error: timeout must be between 1 and 60 seconds\n";
        return kExitRejected;
    }

    auto result = app.validator().validate(vm["url"].as<std::string>(), std::chrono::seconds(timeout));
    std::cout << result.toJson().dump(2) << std::endl;
    return result.isValid ? kExitOk : kExitFailure;
}

int runScreenshot(app::Application& app, const std::vector<std::string>& args) {
    po::options_description options("screenshot options");
    options.add_options()
        ("help,h", "Show help for screenshot")
        ("url", po::value<std::string>(), "Stream URL")
        ("output", po::value<std::string>(), "Destination PNG file")
        ("timeout,t", po::value<int>()->default_value(10), "Capture timeout in seconds (1-60)")
        ("hwaccel", po::value<std::string>()->default_value(app.config().config().hwaccel),
         "Hardware acceleration: vaapi or cuda");
    po::positional_options_description positional;
    positional.add("url", 1).add("output", 1);

    po::variables_map vm;
    po::store(po::command_line_parser(args).options(options).positional(positional).run(), vm);
    po::notify(vm);

    if (vm.count("help") || !vm.count("url")) {
        std::cout << "Usage: channelscout screenshot <url> [output.png] [--timeout N] [--hwaccel X]\n"
                  << options << "\n";
        return vm.count("help") ? kExitOk : kExitRejected;
    }

    auto url = vm["url"].as<std::string>();
    std::filesystem::path output = vm.count("output")
                                       ? std::filesystem::path(vm["output"].as<std::string>())
                                       : app.config().screenshotDir() / "screenshot.png";

    try {
        auto saved = app.screenshots().capture(url, output,
                                               std::chrono::seconds(vm["timeout"].as<int>()),
                                               vm["hwaccel"].as<std::string>());
        std::cout << saved.string() << std::endl;
        return kExitOk;
    } catch (const infra::FfmpegNotFoundError& e) {
        std::cerr << "Error: " << e.what() << "\nInstall FFmpeg using:\n  "
                  << infra::FfmpegTools::installInstructions() << "\n";
        return kExitFailure;
    } catch (const infra::CaptureError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitFailure;
    }
}

int runPresets(app::Application& app) {
    auto list = nlohmann::json::array();
    for (const auto& preset : app.presets().all()) {
        list.push_back(preset.toJson());
    }
    std::cout << nlohmann::json{{"presets", list}}.dump(2) << std::endl;
    return kExitOk;
}

int runHistory(app::Application& app, const std::vector<std::string>& args) {
    po::options_description options("history options");
    options.add_options()
        ("help,h", "Show help for history")
        ("limit,n", po::value<int>()->default_value(20), "Number of sessions to list");

    po::variables_map vm;
    po::store(po::command_line_parser(args).options(options).run(), vm);
    po::notify(vm);

    if (vm.count("help")) {
        std::cout << options << "\n";
        return kExitOk;
    }

    for (const auto& session : app.results().getSessions(vm["limit"].as<int>())) {
        std::cout << session.toJson().dump() << std::endl;
    }
    return kExitOk;
}

int runExport(app::Application& app, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "Usage: channelscout export <scan-id>\n";
        return kExitRejected;
    }
    if (!app.results().getSession(args.front()) && app.results().countByScan(args.front()) == 0) {
        std::cerr << "Error: no recorded scan with id " << args.front() << "\n";
        return kExitFailure;
    }
    std::cout << app.results().exportToJson(args.front()) << std::endl;
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        po::options_description global("Global options");
        global.add_options()
            ("help,h", "Show help message")
            ("version,v", "Show version information")
            ("config-dir,c", po::value<std::string>(), "Configuration directory")
            ("log-level,l", po::value<std::string>(), "Console log level (debug, info, warn, error)");

        po::options_description hidden;
        hidden.add_options()
            ("command", po::value<std::string>())
            ("args", po::value<std::vector<std::string>>());

        po::options_description all;
        all.add(global).add(hidden);

        po::positional_options_description positional;
        positional.add("command", 1).add("args", -1);

        auto parsed = po::command_line_parser(argc, argv)
                          .options(all)
                          .positional(positional)
                          .allow_unregistered()
                          .run();

        po::variables_map vm;
        po::store(parsed, vm);
        po::notify(vm);

        if (vm.count("version")) {
            std::cout << "ChannelScout " << app::Application::kVersion << std::endl;
            return kExitOk;
        }
        if (!vm.count("command")) {
            printUsage(global);
            return vm.count("help") ? kExitOk : kExitRejected;
        }

        auto command = vm["command"].as<std::string>();
        auto args = po::collect_unrecognized(parsed.options, po::include_positional);
        args.erase(args.begin());
        if (vm.count("help")) {
            args.emplace_back("--help");
        }

        auto configDir = vm.count("config-dir")
                             ? std::filesystem::path(vm["config-dir"].as<std::string>())
                             : app::Application::defaultConfigDir();
        std::optional<std::string> logLevel;
        if (vm.count("log-level")) {
            logLevel = vm["log-level"].as<std::string>();
        }

        app::Application application(configDir, logLevel);

        if (command == "scan") {
            return runScan(application, args);
        }
        if (command == "validate") {
            return runValidate(application, args);
        }
        if (command == "screenshot") {
            return runScreenshot(application, args);
        }
        if (command == "presets") {
            return runPresets(application);
        }
        if (command == "history") {
            return runHistory(application, args);
        }
        if (command == "export") {
            return runExport(application, args);
        }

        std::cerr << "Error: unknown command '" << command << "'\n";
        printUsage(global);
        return kExitRejected;
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\nUse --help for usage information\n";
        return kExitRejected;
    } catch (const std::invalid_argument& e) {
        // InvalidScanRequest, PresetNotFound and strategy validation errors.
        spdlog::error("Request rejected: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return kExitRejected;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return kExitFailure;
    }
}
