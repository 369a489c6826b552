/**
 * @file nipc_commands.hpp
 * @brief 데몬으로 보내는 명령 envelope 빌더
 *
 * - 명령 kind는 envelope의 kind이자 data 객체의 내부 키로 재사용된다: {"<kind>": payload}
 * - ping만 예외로 data가 "ping" 문자열 그대로다.
 * - desired_state는 검증 없이 그대로 전달한다(스키마는 데몬 소관).
 */
#pragma once
#include "nipc_envelope.hpp"
#include "nipc_ipc_types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace nipc {
    namespace ipc {

        constexpr const char* kPingKind = "ping";
        constexpr const char* kQueryNetworkStateKind = "query-network-state";
        constexpr const char* kApplyNetworkStateKind = "apply-network-state";

        enum class CommandKind { Ping, QueryNetworkState, ApplyNetworkState };

        const char* command_kind_name(CommandKind k);

        /// 조회 대상 상태 종류
        enum class StateKind { Running, Saved, PostLastCommit };

        const char* state_kind_name(StateKind k);
        bool parse_state_kind(const std::string& s, StateKind& out);

        struct QueryOptions {
            int version{kLatestSchemaVersion};
            StateKind kind{StateKind::Running};

            static QueryOptions running() { return QueryOptions{}; }
            static QueryOptions saved() {
                QueryOptions o;
                o.kind = StateKind::Saved;
                return o;
            }

            nlohmann::json to_json() const;
        };

        struct ApplyOptions {
            int version{kLatestSchemaVersion};
            bool no_verify{false};

            ApplyOptions() = default;
            ApplyOptions(int v, bool nv) : version(v), no_verify(nv) {}

            /// 호출자는 "검증 여부"로 지정하고 와이어에는 그 부정(no-verify)이 실린다
            static ApplyOptions with_verify(bool verify_change, int version = kLatestSchemaVersion) {
                return ApplyOptions(version, !verify_change);
            }

            nlohmann::json to_json() const;
        };

        Envelope encode_ping();
        Envelope encode_query(const QueryOptions& opt);
        /// data = {"apply-network-state": [desired_state, options]} (순서 있는 2원소 배열)
        Envelope encode_apply(const nlohmann::json& desired_state, const ApplyOptions& opt);

        /** @brief 명령 값 타입. execute()에 그대로 넘긴다. */
        class Command {
          public:
            static Command ping();
            static Command query(const QueryOptions& opt = QueryOptions{});
            static Command apply(nlohmann::json desired_state, const ApplyOptions& opt = ApplyOptions{});

            CommandKind kind() const { return kind_; }
            const char* kind_name() const { return command_kind_name(kind_); }
            Envelope to_envelope() const;

          private:
            explicit Command(CommandKind k) : kind_(k) {}

            CommandKind kind_;
            QueryOptions query_{};
            ApplyOptions apply_{};
            nlohmann::json desired_state_;
        };

    } // namespace ipc
} // namespace nipc
