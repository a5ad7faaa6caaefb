#include <simcache/app/fixture_loader.h>
#include <simcache/app/services/embeddings_json.h>
#include <simcache/tools/command.h>

#include <iostream>

namespace simcache::tools {

class GenerateCommand : public Command {
public:
    GenerateCommand() : Command("generate", "Generate and store embeddings for records") {}

    void setupOptions(CLI::App& app) override {
        auto* cmd = app.add_subcommand("generate", getDescription());

        cmd->add_option("--dataset", req_.dataset, "Dataset name or id")->required();
        auto* field = cmd->add_option("--field", req_.field_name, "Field to embed");
        auto* recordMode =
            cmd->add_flag("--record-mode", recordMode_, "Embed whole records as one text");
        field->excludes(recordMode);
        cmd->add_option("--template", req_.record_template,
                        "Record-mode text template with {fieldName} placeholders");
        cmd->add_option("--ids", req_.record_ids, "Only these record ids")->delimiter(',');
        cmd->add_option("-w,--write", writePath_,
                        "Write the fixture with the updated vectors to this file");

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
        auto& s = session.value();
        if (recordMode_)
            req_.mode = "record";

        auto res = s.service->generateEmbeddings(req_);
        if (!res) {
            logError(res.error());
            return 1;
        }

        if (!writePath_.empty()) {
            if (auto w = app::saveFixtureFile(writePath_, s.fixtureDoc, *s.fixture.store); !w) {
                logError(w.error());
                return 1;
            }
            logVerbose("Wrote " + writePath_.string());
        }

        const auto& r = res.value();
        if (isJson()) {
            printJson(app::services::toJson(r));
        } else {
            log("Generated: " + std::to_string(r.generated) +
                "  Skipped: " + std::to_string(r.skipped));
            for (const auto& e : r.errors) {
                std::cerr << "  " << e << '\n';
            }
        }
        return r.errors.empty() ? 0 : 2;
    }

private:
    app::services::EmbeddingRequest req_;
    bool recordMode_ = false;
    std::filesystem::path writePath_;
    bool shouldExecute_ = false;
};

std::unique_ptr<Command> createGenerateCommand() {
    return std::make_unique<GenerateCommand>();
}

} // namespace simcache::tools
