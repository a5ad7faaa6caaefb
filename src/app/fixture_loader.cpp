#include <simcache/app/fixture_loader.h>
#include <simcache/vector/vector_codec.h>

#include <spdlog/spdlog.h>

#include <fstream>

namespace simcache::app {

using nlohmann::json;

namespace {

std::string valueToString(const json& v) {
    if (v.is_string())
        return v.get<std::string>();
    if (v.is_null())
        return {};
    return v.dump();
}

// Optional members fall back when absent or null; any other type is InvalidData
Result<std::string> stringMember(const json& j, const char* key, std::string fallback,
                                 const std::string& where) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return fallback;
    if (!it->is_string()) {
        return Error{ErrorCode::InvalidData,
                     where + ": \"" + key + "\" must be a string"};
    }
    return it->get<std::string>();
}

Result<bool> boolMember(const json& j, const char* key, bool fallback, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return fallback;
    if (!it->is_boolean()) {
        return Error{ErrorCode::InvalidData,
                     where + ": \"" + key + "\" must be a boolean"};
    }
    return it->get<bool>();
}

Result<size_t> countMember(const json& j, const char* key, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return size_t{0};
    if (!it->is_number_unsigned()) {
        return Error{ErrorCode::InvalidData,
                     where + ": \"" + key + "\" must be a non-negative integer"};
    }
    return it->get<size_t>();
}

Result<metadata::DatasetInfo> parseDataset(const json& j) {
    if (!j.is_object() || !j.contains("id") || !j["id"].is_string()) {
        return Error{ErrorCode::InvalidData, "dataset entry requires a string \"id\""};
    }
    metadata::DatasetInfo ds;
    ds.id = j["id"].get<std::string>();
    const std::string where = "dataset " + ds.id;
    auto name = stringMember(j, "name", ds.id, where);
    if (!name)
        return name.error();
    ds.name = name.value();

    if (auto it = j.find("fields"); it != j.end() && it->is_array()) {
        for (const auto& f : *it) {
            if (!f.is_object() || !f.contains("name") || !f["name"].is_string()) {
                return Error{ErrorCode::InvalidData,
                             "field entry in " + where + " requires a string \"name\""};
            }
            metadata::FieldInfo field;
            field.name = f["name"].get<std::string>();
            const std::string fieldWhere = where + " field " + field.name;
            auto type = stringMember(f, "type", "text", fieldWhere);
            if (!type)
                return type.error();
            auto embeddable = boolMember(f, "embeddable", false, fieldWhere);
            if (!embeddable)
                return embeddable.error();
            field.type = metadata::fieldTypeFromString(type.value());
            field.embeddable = embeddable.value();
            ds.fields.push_back(std::move(field));
        }
    }
    return ds;
}

Result<storage::StoredVectorRecord> parseVector(const json& vj) {
    if (!vj.is_object()) {
        return Error{ErrorCode::InvalidData, "vector entry must be an object"};
    }
    const std::string where = "vector entry";
    storage::StoredVectorRecord rec;
    for (auto [key, out] : {std::pair{"recordId", &rec.record_id},
                            std::pair{"datasetId", &rec.dataset_id},
                            std::pair{"fieldName", &rec.field_name},
                            std::pair{"model", &rec.model}}) {
        auto v = stringMember(vj, key, std::string{}, where);
        if (!v)
            return v.error();
        *out = std::move(v).value();
    }
    auto dims = countMember(vj, "dimensions", where);
    if (!dims)
        return dims.error();
    rec.dimensions = dims.value();
    if (rec.record_id.empty() || rec.field_name.empty()) {
        return Error{ErrorCode::InvalidData,
                     "vector entry requires \"recordId\" and \"fieldName\""};
    }

    const auto emb = vj.find("embedding");
    if (emb != vj.end() && emb->is_string()) {
        rec.embedding.emplace<std::string>(emb->get<std::string>());
    } else {
        rec.embedding.emplace<json>(emb != vj.end() ? *emb : json());
    }
    return rec;
}

} // namespace

Result<Fixture> loadFixture(const json& doc) {
    if (!doc.is_object()) {
        return Error{ErrorCode::InvalidData, "fixture must be a JSON object"};
    }

    Fixture fx;
    fx.catalog = std::make_shared<metadata::InMemoryDatasetCatalog>();
    fx.store = std::make_shared<storage::InMemoryVectorStore>();

    if (auto it = doc.find("datasets"); it != doc.end() && it->is_array()) {
        for (const auto& dj : *it) {
            auto ds = parseDataset(dj);
            if (!ds) {
                return ds.error();
            }
            const std::string id = ds.value().id;
            fx.catalog->addDataset(std::move(ds).value());

            auto recs = dj.find("records");
            if (recs == dj.end() || !recs->is_array())
                continue;
            for (const auto& rj : *recs) {
                if (!rj.is_object() || !rj.contains("id")) {
                    return Error{ErrorCode::InvalidData,
                                 "record entry in dataset " + id + " requires an \"id\""};
                }
                metadata::RecordData rec;
                rec.id = valueToString(rj["id"]);
                if (auto vals = rj.find("values"); vals != rj.end() && vals->is_object()) {
                    for (const auto& [k, v] : vals->items()) {
                        rec.values[k] = valueToString(v);
                    }
                }
                if (auto r = fx.catalog->addRecord(id, std::move(rec)); !r) {
                    return r.error();
                }
            }
        }
    }

    if (auto it = doc.find("vectors"); it != doc.end() && it->is_array()) {
        for (const auto& vj : *it) {
            auto rec = parseVector(vj);
            if (!rec) {
                return rec.error();
            }
            fx.store->put(std::move(rec).value());
        }
    }

    spdlog::debug("[Fixture] Loaded {} stored vectors", fx.store->size());
    return fx;
}

Result<json> readFixtureDocument(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::NotFound, "cannot open fixture file: " + path.string()};
    }
    auto doc = json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        return Error{ErrorCode::InvalidData, "fixture is not valid JSON: " + path.string()};
    }
    return doc;
}

Result<Fixture> loadFixtureFile(const std::filesystem::path& path) {
    auto doc = readFixtureDocument(path);
    if (!doc) {
        return doc.error();
    }
    return loadFixture(doc.value());
}

Result<void> saveFixtureFile(const std::filesystem::path& path, const json& original,
                             const storage::InMemoryVectorStore& store) {
    json out = original.is_object() ? original : json::object();
    json vectors = json::array();
    for (const auto& rec : store.all()) {
        json v;
        v["recordId"] = rec.record_id;
        v["datasetId"] = rec.dataset_id;
        v["fieldName"] = rec.field_name;
        v["model"] = rec.model;
        v["dimensions"] = rec.dimensions;
        if (auto decoded = vector::decodeVector(rec.embedding)) {
            v["embedding"] = vector::encodeVector(decoded.value());
        } else if (const auto* raw = std::get_if<std::string>(&rec.embedding)) {
            v["embedding"] = *raw;
        } else if (const auto* raw = std::get_if<json>(&rec.embedding)) {
            // Undecodable payloads are written back unchanged
            v["embedding"] = *raw;
        }
        vectors.push_back(std::move(v));
    }
    out["vectors"] = std::move(vectors);

    std::ofstream f(path, std::ios::trunc);
    if (!f) {
        return Error{ErrorCode::InvalidArgument, "cannot write fixture file: " + path.string()};
    }
    f << out.dump(2) << '\n';
    if (!f) {
        return Error{ErrorCode::InternalError, "failed writing fixture file: " + path.string()};
    }
    return Result<void>();
}

} // namespace simcache::app
