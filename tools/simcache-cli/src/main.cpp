#include <simcache/tools/command.h>

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <map>
#include <memory>

namespace simcache::tools {

class SimcacheCli {
public:
    SimcacheCli() : app_("simcache-cli", "Embedding cache and similarity search tool") {
        setupApp();
        registerCommands();
    }

    int run(int argc, char** argv) {
        try {
            app_.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return app_.exit(e);
        }

        spdlog::set_level(debug_ ? spdlog::level::debug : spdlog::level::warn);

        for (auto& [name, cmd] : commands_) {
            if (app_.got_subcommand(name)) {
                try {
                    return cmd->execute();
                } catch (const std::exception& e) {
                    std::cerr << "Error: " << e.what() << std::endl;
                    return 1;
                }
            }
        }

        // No subcommand specified, show help
        std::cout << app_.help() << std::endl;
        return 0;
    }

private:
    void setupApp() {
        app_.set_version_flag("-V,--version", "0.1.0");
        app_.require_subcommand(0, 1);
        app_.add_flag("--debug", debug_, "Enable debug logging");
    }

    void registerCommands() {
        registerCommand(createSearchCommand());
        registerCommand(createGenerateCommand());
        registerCommand(createStatsCommand());
        registerCommand(createCacheStatsCommand());
        registerCommand(createTestConnectionCommand());
    }

    void registerCommand(std::unique_ptr<Command> cmd) {
        if (!cmd)
            return;
        const std::string& name = cmd->getName();
        cmd->setupOptions(app_);
        commands_[name] = std::move(cmd);
    }

    CLI::App app_;
    std::map<std::string, std::unique_ptr<Command>> commands_;
    bool debug_ = false;
};

} // namespace simcache::tools

int main(int argc, char** argv) {
    // Logs go to stderr so --format json output stays parseable
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("simcache", stderr_sink));
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    simcache::tools::SimcacheCli app;
    return app.run(argc, argv);
}
