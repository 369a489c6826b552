/**
 * @file nipc_client.hpp
 * @brief 기본 데몬 소켓에 붙는 편의 클라이언트
 */
#pragma once
#include "nipc_ipc.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace nipc {
    namespace ipc {

        class Client {
          public:
            explicit Client(ConnectionOptions opt = ConnectionOptions{});

            IpcResult connect(const std::string& socket_path = kDefaultSocketPath);

            /// 성공 시 data는 데몬 응답 문자열("pong")
            IpcResult ping();
            IpcResult query_network_state(const QueryOptions& opt = QueryOptions{});
            IpcResult apply_network_state(const nlohmann::json& desired_state,
                                          const ApplyOptions& opt = ApplyOptions{});

            Connection& connection() { return conn_; }

          private:
            Connection conn_;
        };

        /// 연결 후 running 상태 조회
        IpcResult show(const std::string& socket_path = kDefaultSocketPath);

        /// 연결 후 desired_state 적용
        IpcResult apply(const nlohmann::json& desired_state, bool verify_change = true,
                        const std::string& socket_path = kDefaultSocketPath);

    } // namespace ipc
} // namespace nipc
