#include "smcp/codec.hpp"
#include "smcp/error.hpp"
#include "smcp/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace smcp {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            auto object = val.get_object();
            for (auto field : object) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Try integer first, then double
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null: {
            bool is_null = val.is_null();
            if (!is_null) {
                throw McpParseError("Invalid literal");
            }
            return nlohmann::json(nullptr);
        }
        default:
            throw McpParseError("Unexpected JSON token");
    }
}

// The root of an on-demand document cannot be taken as a value when it is
// a scalar, so scalars are read directly off the document.
nlohmann::json simdjson_doc_to_nlohmann(simdjson::ondemand::document& doc) {
    nlohmann::json j;
    switch (doc.type()) {
        case simdjson::ondemand::json_type::object:
        case simdjson::ondemand::json_type::array: {
            auto val = doc.get_value();
            if (val.error()) {
                throw McpParseError("Failed to get document value");
            }
            j = simdjson_to_nlohmann(val.value());
            break;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = doc.get_string();
            j = std::string(sv);
            break;
        }
        case simdjson::ondemand::json_type::number: {
            auto result_int = doc.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                j = result_int.value();
                break;
            }
            auto result_uint = doc.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                j = result_uint.value();
                break;
            }
            j = doc.get_double().value();
            break;
        }
        case simdjson::ondemand::json_type::boolean:
            j = doc.get_bool().value();
            break;
        case simdjson::ondemand::json_type::null: {
            bool is_null = doc.is_null();
            if (!is_null) {
                throw McpParseError("Invalid literal");
            }
            j = nullptr;
            break;
        }
        default:
            throw McpParseError("Unexpected JSON token");
    }
    if (!doc.at_end()) {
        throw McpParseError("Trailing content after JSON value");
    }
    return j;
}

} // anonymous namespace

nlohmann::json Codec::parse_json(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    // Use simdjson for fast parsing
    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    // On-demand parsing reports most syntax errors lazily, while walking.
    try {
        return simdjson_doc_to_nlohmann(doc);
    } catch (const McpParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw McpParseError(std::string("JSON parse error: ") + e.what());
    }
}

JsonRpcMessage Codec::decode(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw McpInvalidRequest("Message must be a JSON object");
    }

    // Recover the id first so envelope errors can echo it.
    std::optional<RequestId> id;
    bool has_id = j.contains("id") && !j.at("id").is_null();
    if (has_id && is_valid_request_id(j.at("id"))) {
        RequestId rid;
        from_json(j.at("id"), rid);
        id = std::move(rid);
    }

    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string()
        || version->get_ref<const std::string&>() != JSONRPC_VERSION) {
        throw McpInvalidRequest("Invalid jsonrpc version, expected '2.0'", id);
    }

    auto method = j.find("method");
    if (method == j.end() || !method->is_string()
        || method->get_ref<const std::string&>().empty()) {
        throw McpInvalidRequest("Missing or empty 'method'", id);
    }

    if (has_id && !id) {
        throw McpInvalidRequest("Request ID must be a string or number");
    }

    std::optional<nlohmann::json> params;
    if (j.contains("params")) params = j.at("params");

    if (id) {
        JsonRpcRequest req;
        req.id = std::move(*id);
        req.method = method->get<std::string>();
        req.params = std::move(params);
        return req;
    }

    // Absent or null id: a notification
    JsonRpcNotification notif;
    notif.method = method->get<std::string>();
    notif.params = std::move(params);
    return notif;
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    return decode(parse_json(raw));
}

std::string Codec::serialize(const JsonRpcResponse& resp) {
    nlohmann::json j;
    to_json(j, resp);
    // Compact output never contains a raw newline; strings are escaped.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace smcp
