#include <simcache/app/services/embeddings_json.h>
#include <simcache/tools/command.h>

#include <iomanip>
#include <iostream>

namespace simcache::tools {

// Runs record-id searches against one session so the cache has something to report
class CacheStatsCommand : public Command {
public:
    CacheStatsCommand()
        : Command("cache-stats", "Run searches and report embedding cache statistics") {}

    void setupOptions(CLI::App& app) override {
        auto* cmd = app.add_subcommand("cache-stats", getDescription());

        cmd->add_option("--dataset", dataset_, "Dataset name or id");
        auto* field = cmd->add_option("--field", field_, "Field to search");
        auto* recordMode = cmd->add_flag("--record-mode", recordMode_, "Whole-record embeddings");
        field->excludes(recordMode);
        cmd->add_option("--record-id", recordIds_, "Query record ids")->delimiter(',');
        cmd->add_option("--repeat", repeat_, "Run each search this many times")
            ->default_val(1)
            ->check(CLI::PositiveNumber);
        cmd->add_flag("--clear", clear_, "Clear the cache after reporting");

        addCommonOptions(*cmd, false);
        cmd->callback([this]() { shouldExecute_ = true; });
    }

    int execute() override {
        if (!shouldExecute_)
            return 0;

        auto session = openSession();
        if (!session) {
            logError(session.error());
            return 1;
        }
        auto& service = *session.value().service;

        size_t failures = 0;
        for (int i = 0; i < repeat_; ++i) {
            for (const auto& id : recordIds_) {
                app::services::FindSimilarRequest req;
                req.dataset = dataset_;
                req.field_name = field_;
                req.mode = recordMode_ ? "record" : "field";
                req.record_id = id;
                auto r = service.findSimilar(req);
                if (!r) {
                    ++failures;
                    logVerbose("search for " + id + " failed: " + r.error().message);
                }
            }
        }

        auto stats = service.getCacheStats();
        if (isJson()) {
            auto j = app::services::toJson(stats);
            j["failedSearches"] = failures;
            printJson(j);
        } else {
            std::cout << "Entries: " << stats.entries_count << "  vectors: " << stats.total_vectors
                      << "\nMemory: " << std::fixed << std::setprecision(2)
                      << stats.memory_used_mb << "/" << stats.memory_budget_mb << " MB ("
                      << stats.memory_usage_percent << "%)\nHits: " << stats.hits
                      << "  misses: " << stats.misses << "  evictions: " << stats.evictions
                      << "  expirations: " << stats.expirations
                      << "  not cached: " << stats.skipped << '\n';
            for (const auto& e : stats.entries) {
                std::cout << "  " << e.key << "  " << e.count << " vectors, " << e.memory_mb
                          << " MB\n";
            }
            if (failures > 0)
                std::cout << failures << " searches failed\n";
        }

        if (clear_) {
            service.clearCache();
            logVerbose("Cache cleared");
        }
        return failures == 0 ? 0 : 2;
    }

private:
    std::string dataset_;
    std::string field_;
    bool recordMode_ = false;
    std::vector<std::string> recordIds_;
    int repeat_ = 1;
    bool clear_ = false;
    bool shouldExecute_ = false;
};

std::unique_ptr<Command> createCacheStatsCommand() {
    return std::make_unique<CacheStatsCommand>();
}

} // namespace simcache::tools
