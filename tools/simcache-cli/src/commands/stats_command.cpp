#include <simcache/app/services/embeddings_json.h>
#include <simcache/tools/command.h>

#include <iostream>

namespace simcache::tools {

class StatsCommand : public Command {
public:
    StatsCommand() : Command("stats", "Show embedding coverage for a dataset field") {}

    void setupOptions(CLI::App& app) override {
        auto* cmd = app.add_subcommand("stats", getDescription());

        cmd->add_option("--dataset", dataset_, "Dataset name or id")->required();
        auto* field = cmd->add_option("--field", field_, "Field name");
        auto* recordMode = cmd->add_flag("--record-mode", recordMode_, "Whole-record embeddings");
        field->excludes(recordMode);
        cmd->add_flag("--pending", showPending_, "List records without an embedding");

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
        auto& service = *session.value().service;
        const std::string field =
            recordMode_ ? std::string(app::services::kRecordLevelFieldName) : field_;

        auto fields = service.getEmbeddableFields(dataset_);
        if (!fields) {
            logError(fields.error());
            return 1;
        }

        nlohmann::json out;
        out["embeddableFields"] = app::services::toJson(fields.value());

        if (!field.empty()) {
            auto stats = service.getEmbeddingStats(dataset_, field);
            if (!stats) {
                logError(stats.error());
                return 1;
            }
            out["stats"] = app::services::toJson(stats.value());
            if (showPending_) {
                auto pending = service.getPendingRecordIds(dataset_, field);
                if (!pending) {
                    logError(pending.error());
                    return 1;
                }
                out["pending"] = pending.value();
            }
        }

        if (isJson()) {
            printJson(out);
            return 0;
        }

        std::cout << "Embeddable fields:";
        if (fields.value().empty())
            std::cout << " (none)";
        for (const auto& f : fields.value()) {
            std::cout << " " << f.name << " (" << f.type << ")";
        }
        std::cout << '\n';
        if (out.contains("stats")) {
            const auto& st = out["stats"];
            std::cout << field << ": " << st["embeddedRecords"].get<size_t>() << "/"
                      << st["totalRecords"].get<size_t>() << " embedded, "
                      << st["notEmbeddedRecords"].get<size_t>() << " pending\n";
        }
        if (out.contains("pending")) {
            for (const auto& id : out["pending"]) {
                std::cout << "  " << id.get<std::string>() << '\n';
            }
        }
        return 0;
    }

private:
    std::string dataset_;
    std::string field_;
    bool recordMode_ = false;
    bool showPending_ = false;
    bool shouldExecute_ = false;
};

std::unique_ptr<Command> createStatsCommand() {
    return std::make_unique<StatsCommand>();
}

} // namespace simcache::tools
