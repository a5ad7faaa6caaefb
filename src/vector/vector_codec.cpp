#include <simcache/vector/vector_codec.h>

#include <type_traits>

namespace simcache::vector {

namespace {

Result<Vector> decodeJsonArray(const nlohmann::json& j) {
    if (j.is_null()) {
        return Error{ErrorCode::InvalidData, "embedding field is null"};
    }
    if (!j.is_array()) {
        return Error{ErrorCode::InvalidData,
                     std::string("unexpected embedding type: ") + j.type_name()};
    }

    Vector out;
    out.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        const auto& v = j[i];
        if (!v.is_number()) {
            return Error{ErrorCode::InvalidData, "unexpected type in embedding array at index " +
                                                     std::to_string(i) + ": " + v.type_name()};
        }
        out.push_back(v.get<float>());
    }
    return out;
}

template <class> inline constexpr bool always_false_v = false;

} // namespace

Result<Vector> decodeVector(const StoredVectorPayload& payload) {
    return std::visit(
        [](const auto& value) -> Result<Vector> {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::vector<float>>) {
                return Vector(value);
            } else if constexpr (std::is_same_v<T, std::vector<double>>) {
                return Vector(value.begin(), value.end());
            } else if constexpr (std::is_same_v<T, std::string>) {
                auto parsed = nlohmann::json::parse(value, nullptr, false);
                if (parsed.is_discarded()) {
                    return Error{ErrorCode::InvalidData,
                                 "failed to parse embedding string as JSON"};
                }
                return decodeJsonArray(parsed);
            } else if constexpr (std::is_same_v<T, nlohmann::json>) {
                if (value.is_string()) {
                    // JSON columns sometimes hold the array double-encoded as a string
                    return decodeVector(StoredVectorPayload{std::in_place_index<2>,
                                                            value.template get<std::string>()});
                }
                return decodeJsonArray(value);
            } else {
                static_assert(always_false_v<T>, "unhandled payload type");
            }
        },
        payload);
}

nlohmann::json encodeVector(const Vector& vector) {
    auto arr = nlohmann::json::array();
    for (float v : vector) {
        arr.push_back(static_cast<double>(v));
    }
    return arr;
}

std::string describePayload(const StoredVectorPayload& payload) {
    switch (payload.index()) {
        case 0:
            return "float[" + std::to_string(std::get<0>(payload).size()) + "]";
        case 1:
            return "double[" + std::to_string(std::get<1>(payload).size()) + "]";
        case 2:
            return "string(" + std::to_string(std::get<2>(payload).size()) + " bytes)";
        default:
            return std::string("json ") + std::get<3>(payload).type_name();
    }
}

} // namespace simcache::vector
