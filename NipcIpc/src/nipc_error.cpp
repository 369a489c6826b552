#include "nipc_error.hpp"

#include <unordered_map>

namespace nipc {
    namespace ipc {

        const char* category_name(IpcErrorCategory c) {
            switch (c) {
                case IpcErrorCategory::None:              return "None";
                case IpcErrorCategory::FrameIo:           return "FrameIo";
                case IpcErrorCategory::MalformedEnvelope: return "MalformedEnvelope";
                case IpcErrorCategory::Protocol:          return "Protocol";
                case IpcErrorCategory::Validation:        return "Validation";
                case IpcErrorCategory::UnknownLogLevel:   return "UnknownLogLevel";
                case IpcErrorCategory::UnexpectedKind:    return "UnexpectedKind";
            }
            return "Protocol";
        }

        std::string IpcError::to_string() const {
            std::string s = category_name(category);
            if (!kind.empty()) s += "(" + kind + ")";
            if (!msg.empty()) s += ": " + msg;
            return s;
        }

        IpcErrorCategory classify_daemon_error_kind(const std::string& kind) {
            // 새 kind는 여기에 추가. 목록에 없는 kind는 일반 Protocol 오류.
            static const std::unordered_map<std::string, IpcErrorCategory> refined = {
                {kInvalidArgumentKind, IpcErrorCategory::Validation},
            };
            auto it = refined.find(kind);
            return it == refined.end() ? IpcErrorCategory::Protocol : it->second;
        }

        IpcError error_from_envelope(const nlohmann::json& data) {
            if (!data.is_object()) {
                return IpcError(IpcErrorCategory::MalformedEnvelope, "error-data",
                                "error envelope data is not an object: " + data.dump());
            }
            auto kind_it = data.find("kind");
            auto msg_it = data.find("msg");
            if (kind_it == data.end() || !kind_it->is_string()) {
                return IpcError(IpcErrorCategory::MalformedEnvelope, "error-data",
                                "error envelope data has no string 'kind'");
            }
            if (msg_it == data.end() || !msg_it->is_string()) {
                return IpcError(IpcErrorCategory::MalformedEnvelope, "error-data",
                                "error envelope data has no string 'msg'");
            }
            const std::string kind = kind_it->get<std::string>();
            return IpcError(classify_daemon_error_kind(kind), kind, msg_it->get<std::string>());
        }

    } // namespace ipc
} // namespace nipc
