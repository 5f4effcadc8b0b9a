#include "mist/cli/options.hpp"
#include "mist/config/profile.hpp"
#include "mist/core/cancellation.hpp"
#include "mist/crypto/gpg_backend.hpp"
#include "mist/events/components.hpp"
#include "mist/events/event_bus.hpp"
#include "mist/sync/orchestrator.hpp"
#include "mist/sync/rsync_unison_engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

bool confirm_on_terminal(const std::string& question) {
    std::cerr << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return answer == "y" || answer == "yes";
}

int fail(const mist::Error& error) {
    spdlog::error("{}", error.describe());
    return mist::exit_code_for(error);
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    const std::string program = argc > 0 ? fs::path(argv[0]).filename().string() : "mist";
    std::vector<std::string> args(argv + std::min(argc, 1), argv + argc);

    auto parsed = mist::cli::parse_arguments(args);
    if (parsed.is_error()) {
        spdlog::error("{}", parsed.error().message);
        std::cerr << mist::cli::usage(program);
        return mist::exit_code::kUsage;
    }
    const auto& options = parsed.value();

    if (options.help) {
        std::cout << mist::cli::usage(program);
        return mist::exit_code::kDone;
    }
    if (options.version) {
        std::cout << program << " " << mist::cli::kVersion << "\n";
        return mist::exit_code::kDone;
    }
    if (options.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (options.quiet) {
        spdlog::set_level(spdlog::level::warn);
    }

    const char* home_env = std::getenv("HOME");
    if (home_env == nullptr || *home_env == '\0') {
        return fail(mist::Error{mist::ErrorCode::MissingField, "HOME is not set"}.with_field("HOME"));
    }
    const fs::path home(home_env);

    const std::vector<fs::path> search_paths =
        options.config_path ? std::vector<fs::path>{*options.config_path} : mist::config::default_search_paths(home);

    auto config = mist::config::Configuration::load(search_paths, home);
    if (config.is_error()) {
        if (config.error().code == mist::ErrorCode::NoFileFound) {
            for (const auto& candidate : search_paths) {
                spdlog::info("Looked for {}", candidate.string());
            }
        }
        return fail(config.error());
    }
    spdlog::debug("Loaded {} profile(s) from {}", config.value().size(), config.value().origin().string());

    auto profile = config.value().lookup(options.profile);
    if (profile.is_error()) {
        return fail(profile.error());
    }

    mist::CancellationToken cancel;
    mist::install_interrupt_handler(cancel);

    mist::crypto::GpgBackend::Options gpg_options;
    gpg_options.program = profile.value().gpg_program.value_or("gpg");
    gpg_options.armor = profile.value().armor;
    gpg_options.cancel = &cancel;
    mist::crypto::GpgBackend backend(gpg_options);

    mist::sync::RsyncUnisonEngine::Options engine_options;
    engine_options.batch = options.assume_yes;
    engine_options.cancel = &cancel;
    mist::sync::RsyncUnisonEngine engine(engine_options);

    mist::events::EventBus event_bus;
    mist::events::LoggerComponent logger(event_bus);
    mist::events::StatsComponent stats(event_bus);

    mist::sync::OrchestratorOptions orchestrator_options;
    orchestrator_options.assume_yes = options.assume_yes;
    orchestrator_options.confirm = confirm_on_terminal;
    orchestrator_options.cancel = &cancel;
    orchestrator_options.home = home;

    mist::sync::SyncOrchestrator orchestrator(backend, engine, event_bus, orchestrator_options);
    const auto report = orchestrator.run(profile.value(), options.mode);

    if (!report.succeeded()) {
        return report.error ? mist::exit_code_for(*report.error) : mist::exit_code::kIO;
    }

    stats.print_summary();
    return mist::exit_code::kDone;
}
