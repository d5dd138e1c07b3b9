#include "infrastructure/media/FfprobeMediaProbe.hpp"

#include "core/services/IResultStream.hpp"
#include "infrastructure/media/FfmpegTools.hpp"
#include "infrastructure/process/ProcessRunner.hpp"

#include <spdlog/spdlog.h>

namespace channelscout::infra {

FfprobeMediaProbe::FfprobeMediaProbe(std::string ffprobePath, std::vector<std::string> customArgs)
    : ffprobePath_(std::move(ffprobePath)), customArgs_(std::move(customArgs)) {}

bool FfprobeMediaProbe::isAvailable() {
    // A missing tool is looked up again on the next call so installing it mid-run works.
    if (located_.load()) {
        return true;
    }
    if (FfmpegTools::checkInstalled(ffprobePath_)) {
        located_.store(true);
        return true;
    }
    return false;
}

std::vector<std::string> FfprobeMediaProbe::buildArguments(const std::string& url,
                                                           const core::ProbeOptions& options) const {
    std::vector<std::string> args = {"-v",          "error",         "-print_format", "json",
                                     "-show_format", "-show_streams"};
    for (const auto& [key, value] : options) {
        args.push_back("-" + key);
        args.push_back(value);
    }
    args.insert(args.end(), customArgs_.begin(), customArgs_.end());
    args.push_back(url);
    return args;
}

core::ProbeOutcome FfprobeMediaProbe::probe(const std::string& url,
                                            const core::ProbeOptions& options,
                                            std::chrono::seconds timeout,
                                            std::stop_token stopToken) {
    core::ProbeOutcome outcome;

    spdlog::debug("Running ffprobe for {} (timeout {}s)", url, timeout.count());
    auto result = ProcessRunner::run(ffprobePath_, buildArguments(url, options), timeout, stopToken);

    if (result.cancelled) {
        throw core::OperationCancelled();
    }
    if (!result.launched) {
        outcome.diagnostic = result.stderrText.empty() ? "Failed to launch " + ffprobePath_
                                                       : result.stderrText;
        return outcome;
    }
    if (result.timedOut) {
        outcome.diagnostic = "Probe timed out after " + std::to_string(timeout.count()) + " seconds";
        return outcome;
    }
    if (result.exitCode != 0) {
        outcome.diagnostic = result.stderrText.empty()
                                 ? ffprobePath_ + " exited with code " + std::to_string(result.exitCode)
                                 : result.stderrText;
        return outcome;
    }

    try {
        outcome.metadata = nlohmann::json::parse(result.stdoutText);
        outcome.success = true;
    } catch (const nlohmann::json::parse_error& e) {
        outcome.diagnostic = std::string("Failed to parse ffprobe output: ") + e.what();
    }
    return outcome;
}

} // namespace channelscout::infra
