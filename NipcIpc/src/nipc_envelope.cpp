#include "nipc_envelope.hpp"

namespace nipc {
    namespace ipc {

        EnvelopeType classify_kind(const std::string& kind) {
            if (kind == kErrorKind) return EnvelopeType::Error;
            if (kind == kLogKind) return EnvelopeType::Log;
            return EnvelopeType::Result;
        }

        bool decode_envelope(const uint8_t* payload, size_t len, Envelope& out, std::string& err) {
            if (payload == nullptr || len == 0) {
                err = "empty payload is not an envelope";
                return false;
            }

            nlohmann::json j;
            try {
                j = nlohmann::json::parse(payload, payload + len);
            } catch (const nlohmann::json::parse_error& ex) {
                err = std::string("invalid JSON: ") + ex.what();
                return false;
            }

            if (!j.is_object()) {
                err = std::string("envelope is not a JSON object but ") + j.type_name();
                return false;
            }
            auto kind_it = j.find("kind");
            if (kind_it == j.end()) {
                err = "envelope has no 'kind'";
                return false;
            }
            if (!kind_it->is_string()) {
                err = std::string("envelope 'kind' is ") + kind_it->type_name() + ", expected string";
                return false;
            }

            out.kind = kind_it->get<std::string>();
            auto data_it = j.find("data");
            out.data = (data_it == j.end()) ? nlohmann::json() : std::move(*data_it);
            return true;
        }

        bool encode_envelope(const Envelope& env, std::string& out, std::string& err) {
            try {
                out = env.to_json().dump();
            } catch (const nlohmann::json::type_error& ex) {
                err = std::string("cannot serialize envelope kind=") + env.kind + ": " + ex.what();
                return false;
            }
            return true;
        }

    } // namespace ipc
} // namespace nipc
