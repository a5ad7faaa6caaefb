#include <simcache/app/services/embeddings_json.h>
#include <simcache/tools/command.h>

#include <iomanip>
#include <iostream>

namespace simcache::tools {

class SearchCommand : public Command {
public:
    SearchCommand() : Command("search", "Find records similar to a text or an existing record") {}

    void setupOptions(CLI::App& app) override {
        auto* cmd = app.add_subcommand("search", getDescription());

        cmd->add_option("--dataset", req_.dataset, "Dataset name or id")->required();
        auto* field = cmd->add_option("--field", req_.field_name, "Field to search");
        auto* recordMode =
            cmd->add_flag("--record-mode", recordMode_, "Search whole-record embeddings");
        field->excludes(recordMode);

        auto* text = cmd->add_option("--text", req_.text, "Query text (embedded via the API)");
        auto* rid = cmd->add_option("--record-id", req_.record_id,
                                    "Use this record's stored embedding as the query");
        text->excludes(rid);

        cmd->add_option("-l,--limit", req_.limit, "Maximum number of results")->default_val(0);
        cmd->add_flag("--debug-info", showDebug_, "Print search diagnostics");

        addCommonOptions(*cmd);
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
        if (recordMode_)
            req_.mode = "record";

        auto res = session.value().service->findSimilar(req_);
        if (!res) {
            logError(res.error());
            return 1;
        }
        const auto& r = res.value();

        if (isJson()) {
            printJson(app::services::toJson(r));
            return 0;
        }

        if (r.results.empty()) {
            log("No similar records found");
        }
        for (size_t i = 0; i < r.results.size(); ++i) {
            std::cout << std::setw(3) << (i + 1) << ". " << r.results[i].record_id << "  "
                      << std::fixed << std::setprecision(4) << r.results[i].similarity << '\n';
        }
        if (showDebug_ || isVerbose()) {
            const auto& d = r.debug;
            std::cout << "\n" << d.dataset_id << ":" << d.field_name << "  query dims "
                      << d.query_embedding_len << ", stored " << d.stored_embeddings
                      << ", processed " << d.processed_count << ", decode errors "
                      << d.error_count << ", cache " << (d.cache_hit ? "hit" : "miss")
                      << (d.cache_skipped ? " (not cached)" : "") << '\n';
            for (const auto& e : d.errors) {
                std::cout << "  " << e << '\n';
            }
        }
        return 0;
    }

private:
    app::services::FindSimilarRequest req_;
    bool recordMode_ = false;
    bool showDebug_ = false;
    bool shouldExecute_ = false;
};

std::unique_ptr<Command> createSearchCommand() {
    return std::make_unique<SearchCommand>();
}

} // namespace simcache::tools
