#pragma once

#include <simcache/app/fixture_loader.h>
#include <simcache/app/services/embeddings_service.h>
#include <simcache/config/embeddings_config.h>
#include <simcache/core/types.h>
#include <simcache/genai/embedding_client.h>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace simcache::tools {

/**
 * Everything a command needs to talk to the embeddings service: resolved configuration,
 * the fixture-backed collaborators and the service built on top of them.
 */
struct Session {
    config::SimcacheConfig config;
    nlohmann::json fixtureDoc;
    app::Fixture fixture;
    std::shared_ptr<genai::OpenAiEmbeddingClient> client;
    std::shared_ptr<vector::EmbeddingCache> cache;
    std::unique_ptr<app::services::EmbeddingsService> service;
};

/**
 * Base class for all CLI commands
 *
 * Provides the shared --data/--config/--format options and session setup
 */
class Command {
public:
    Command(std::string name, std::string description)
        : name_(std::move(name)), description_(std::move(description)) {}

    virtual ~Command() = default;

    // Setup command-specific options
    virtual void setupOptions(CLI::App& app) = 0;

    // Execute the command
    virtual int execute() = 0;

    const std::string& getName() const { return name_; }
    const std::string& getDescription() const { return description_; }

protected:
    struct CommonOptions {
        bool verbose = false;
        bool quiet = false;
        std::string format = "human";
        std::filesystem::path configFile;
        std::filesystem::path dataFile;
    };

    void addCommonOptions(CLI::App& app, bool requireData = true) {
        app.add_flag("-v,--verbose", options_.verbose, "Enable verbose output");
        app.add_flag("-q,--quiet", options_.quiet, "Suppress all output except errors");
        app.add_option("-c,--config", options_.configFile, "Path to configuration file");
        auto* data = app.add_option("-d,--data", options_.dataFile,
                                    "JSON fixture with datasets, records and stored vectors");
        if (requireData)
            data->required()->check(CLI::ExistingFile);
        app.add_option("-f,--format", options_.format, "Output format (human, json)")
            ->default_val("human")
            ->check(CLI::IsMember({"human", "json"}));
    }

    // Loads configuration and, when --data was given, the fixture
    Result<Session> openSession() const;

    bool isJson() const { return options_.format == "json"; }
    bool isVerbose() const { return options_.verbose && !options_.quiet; }
    bool isQuiet() const { return options_.quiet; }
    const CommonOptions& commonOptions() const { return options_; }

    void log(const std::string& message) const {
        if (!isQuiet()) {
            std::cout << message << std::endl;
        }
    }

    void logVerbose(const std::string& message) const {
        if (isVerbose()) {
            std::cout << "[VERBOSE] " << message << std::endl;
        }
    }

    void logError(const std::string& message) const {
        std::cerr << "[ERROR] " << message << std::endl;
    }

    void logError(const Error& error) const {
        logError(std::string(errorToString(error.code)) + ": " + error.message);
    }

    void printJson(const nlohmann::json& j) const { std::cout << j.dump(2) << std::endl; }

private:
    std::string name_;
    std::string description_;
    CommonOptions options_;
};

// Command factories (defined in each command file)
std::unique_ptr<Command> createSearchCommand();
std::unique_ptr<Command> createGenerateCommand();
std::unique_ptr<Command> createStatsCommand();
std::unique_ptr<Command> createCacheStatsCommand();
std::unique_ptr<Command> createTestConnectionCommand();

} // namespace simcache::tools
