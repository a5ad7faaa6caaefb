#include <simcache/tools/command.h>

#include <spdlog/spdlog.h>

namespace simcache::tools {

Result<Session> Command::openSession() const {
    Session session;
    session.config = config::loadConfig(options_.configFile.string());
    if (!session.config.source.empty()) {
        logVerbose("Using config " + session.config.source.string());
    }

    if (!options_.dataFile.empty()) {
        auto doc = app::readFixtureDocument(options_.dataFile);
        if (!doc) {
            return doc.error();
        }
        auto fx = app::loadFixture(doc.value());
        if (!fx) {
            return fx.error();
        }
        session.fixtureDoc = std::move(doc).value();
        session.fixture = std::move(fx).value();
    } else {
        session.fixture.catalog = std::make_shared<metadata::InMemoryDatasetCatalog>();
        session.fixture.store = std::make_shared<storage::InMemoryVectorStore>();
    }

    const auto& ai = session.config.embeddings;
    genai::OpenAiClientConfig clientCfg;
    clientCfg.api_key = ai.api_key;
    clientCfg.base_url = ai.api_base_url;
    session.client = std::make_shared<genai::OpenAiEmbeddingClient>(std::move(clientCfg));
    session.cache = std::make_shared<vector::EmbeddingCache>(session.config.cache);

    app::services::EmbeddingsServiceDeps deps;
    deps.catalog = session.fixture.catalog;
    deps.store = session.fixture.store;
    deps.client = session.client;
    deps.cache = session.cache;
    deps.engine = std::make_shared<vector::SimilarityEngine>(session.config.search);
    session.service =
        std::make_unique<app::services::EmbeddingsService>(ai, std::move(deps));

    spdlog::debug("[simcache-cli] Session ready (ai enabled: {}, model: '{}')", ai.enabled,
                  ai.embedding_model);
    return session;
}

} // namespace simcache::tools
