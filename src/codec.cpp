#include "mcphost/codec.hpp"
#include "mcphost/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace mcphost {

namespace {

nlohmann::json to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            auto as_int = val.get_int64();
            if (as_int.error() == simdjson::SUCCESS) return nlohmann::json(as_int.value());
            auto as_uint = val.get_uint64();
            if (as_uint.error() == simdjson::SUCCESS) return nlohmann::json(as_uint.value());
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
        default:
            return nlohmann::json(nullptr);
    }
}

} // anonymous namespace

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    auto version = j.find("jsonrpc");
    if (version == j.end()) {
        throw ParseError("Missing 'jsonrpc' field");
    }
    if (!version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
        throw ParseError("Invalid jsonrpc version, expected '2.0'");
    }

    const bool has_id = j.contains("id");
    const bool has_method = j.contains("method");

    if (has_method && !j.at("method").is_string()) {
        throw ParseError("'method' must be a string");
    }
    if (has_id && !j.at("id").is_number_integer() && !j.at("id").is_string()) {
        throw ParseError("'id' must be an integer or a string");
    }

    if (has_method && has_id) {
        JsonRpcRequest req;
        from_json(j, req);
        return req;
    }
    if (has_method) {
        JsonRpcNotification notif;
        from_json(j, notif);
        return notif;
    }
    if (has_id) {
        const bool has_result = j.contains("result");
        const bool has_error = j.contains("error");
        if (has_result == has_error) {
            throw ParseError("Response must carry exactly one of 'result' or 'error'");
        }
        const auto& err = has_error ? j.at("error") : j.at("result");
        if (has_error && (!err.is_object() || !err.contains("code") || !err.contains("message"))) {
            throw ParseError("Malformed 'error' object");
        }
        JsonRpcResponse resp;
        try {
            from_json(j, resp);
        } catch (const nlohmann::json::exception& e) {
            throw ParseError(std::string("Malformed response: ") + e.what());
        }
        return resp;
    }
    throw ParseError("Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    nlohmann::json j;
    try {
        auto val = doc.get_value();
        if (val.error()) {
            throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(val.error()));
        }
        j = to_nlohmann(val.value());
    } catch (const simdjson::simdjson_error& e) {
        throw ParseError(std::string("JSON conversion error: ") + e.what());
    }

    if (!j.is_object()) {
        throw ParseError("Message must be a JSON object");
    }
    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

} // namespace mcphost
