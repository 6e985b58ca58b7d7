#include "config/ConfigRegistry.hpp"
#include "ingest/Orchestrator.hpp"
#include "storage/PersistentSink.hpp"
#include "storage/Sink.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace pv::config;
using namespace pv::ingest;
using namespace pv::storage;
using pv::log::Registry;

namespace {

constexpr auto kUsage =
    "usage: panoctl [-c <config.yaml>] <command> [args]\n"
    "\n"
    "commands:\n"
    "  ingest <file>   convert a panorama and store its renditions\n"
    "  list            list stored panoramas (object storage only)\n"
    "  probe           self-test the configured object storage\n";

struct Args {
    std::optional<std::filesystem::path> config;
    std::string command;
    std::vector<std::string> rest;
};

std::optional<Args> parseArgs(const int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "-h" || a == "--help") return std::nullopt;
        if (a == "-c" || a == "--config") {
            if (++i >= argc) return std::nullopt;
            args.config = argv[i];
        } else if (args.command.empty()) {
            args.command = a;
        } else {
            args.rest.push_back(a);
        }
    }
    if (args.command.empty()) return std::nullopt;
    return args;
}

std::unique_ptr<PersistentSink> requirePersistentSink(const StorageConfig& cfg) {
    auto sink = makeSink(cfg, credentialFromEnv(cfg));
    if (sink->mode() != SinkMode::Persistent)
        throw std::runtime_error(fmt::format("Object storage not configured: ${} is not set", cfg.credential_env));
    return std::unique_ptr<PersistentSink>(static_cast<PersistentSink*>(sink.release()));
}

int runIngest(const Config& cfg, const std::vector<std::string>& rest) {
    if (rest.size() != 1) {
        fmt::print(stderr, "{}", kUsage);
        return 2;
    }

    const std::filesystem::path file = rest.front();
    RawUpload upload{pv::util::readFileToVector(file), file.filename().string()};

    const Orchestrator orchestrator(cfg, makeSink(cfg.storage, credentialFromEnv(cfg.storage)));
    const auto response = orchestrator.handle(std::move(upload));

    fmt::print("{}\n", nlohmann::json(response).dump(2));
    return response.success ? EXIT_SUCCESS : EXIT_FAILURE;
}

int runList(const Config& cfg) {
    const auto sink = requirePersistentSink(cfg.storage);
    fmt::print("{}\n", nlohmann::json(sink->list()).dump(2));
    return EXIT_SUCCESS;
}

int runProbe(const Config& cfg) {
    const auto sink = requirePersistentSink(cfg.storage);
    const auto report = sink->probe();
    fmt::print("{}\n", nlohmann::json(report).dump(2));
    return report.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
}

}

int main(const int argc, char** argv) {
    const auto args = parseArgs(argc, argv);
    if (!args) {
        fmt::print(stderr, "{}", kUsage);
        return 2;
    }

    try {
        ConfigRegistry::init(args->config);
        const auto& cfg = ConfigRegistry::get();
        Registry::init(cfg.logging);

        Registry::cli()->debug("[panoctl] command '{}' (config: {})", args->command,
                               args->config ? args->config->string() : "defaults");

        if (args->command == "ingest") return runIngest(cfg, args->rest);
        if (args->command == "list") return runList(cfg);
        if (args->command == "probe") return runProbe(cfg);

        fmt::print(stderr, "panoctl: unknown command '{}'\n{}", args->command, kUsage);
        return 2;
    } catch (const std::exception& e) {
        if (Registry::isInitialized()) Registry::cli()->error("[panoctl] {}", e.what());
        else fmt::print(stderr, "panoctl: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
