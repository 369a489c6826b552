/**
 * @file nipc_commands.cpp
 * @brief 명령 envelope 구성. 데몬 측 라우팅 규약({"<kind>": payload})을 그대로 재현한다.
 */
#include "nipc_commands.hpp"

#include <utility>

namespace nipc {
    namespace ipc {

        const char* command_kind_name(CommandKind k) {
            switch (k) {
                case CommandKind::Ping:              return kPingKind;
                case CommandKind::QueryNetworkState: return kQueryNetworkStateKind;
                case CommandKind::ApplyNetworkState: return kApplyNetworkStateKind;
            }
            return kPingKind;
        }

        const char* state_kind_name(StateKind k) {
            switch (k) {
                case StateKind::Running:        return "running-network-state";
                case StateKind::Saved:          return "saved-network-state";
                case StateKind::PostLastCommit: return "post-last-commit-network-state";
            }
            return "running-network-state";
        }

        bool parse_state_kind(const std::string& s, StateKind& out) {
            for (StateKind k : {StateKind::Running, StateKind::Saved, StateKind::PostLastCommit}) {
                if (s == state_kind_name(k)) {
                    out = k;
                    return true;
                }
            }
            return false;
        }

        nlohmann::json QueryOptions::to_json() const {
            return {{"version", version}, {"kind", state_kind_name(kind)}};
        }

        nlohmann::json ApplyOptions::to_json() const {
            return {{"version", version}, {"no-verify", no_verify}};
        }

        Envelope encode_ping() {
            return Envelope(kPingKind, kPingKind);
        }

        Envelope encode_query(const QueryOptions& opt) {
            nlohmann::json data = nlohmann::json::object();
            data[kQueryNetworkStateKind] = opt.to_json();
            return Envelope(kQueryNetworkStateKind, std::move(data));
        }

        Envelope encode_apply(const nlohmann::json& desired_state, const ApplyOptions& opt) {
            // 맵이 아닌 [state, options] 배열이어야 데몬이 튜플로 해석한다
            nlohmann::json pair = nlohmann::json::array();
            pair.push_back(desired_state);
            pair.push_back(opt.to_json());

            nlohmann::json data = nlohmann::json::object();
            data[kApplyNetworkStateKind] = std::move(pair);
            return Envelope(kApplyNetworkStateKind, std::move(data));
        }

        Command Command::ping() {
            return Command(CommandKind::Ping);
        }

        Command Command::query(const QueryOptions& opt) {
            Command c(CommandKind::QueryNetworkState);
            c.query_ = opt;
            return c;
        }

        Command Command::apply(nlohmann::json desired_state, const ApplyOptions& opt) {
            Command c(CommandKind::ApplyNetworkState);
            c.desired_state_ = std::move(desired_state);
            c.apply_ = opt;
            return c;
        }

        Envelope Command::to_envelope() const {
            switch (kind_) {
                case CommandKind::Ping:              return encode_ping();
                case CommandKind::QueryNetworkState: return encode_query(query_);
                case CommandKind::ApplyNetworkState: return encode_apply(desired_state_, apply_);
            }
            return encode_ping();
        }

    } // namespace ipc
} // namespace nipc
