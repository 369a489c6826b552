/**
 * @file nipc_ipc_types.hpp
 * ### 파일 설명(한글)
 * IPC에서 사용하는 공용 타입/상수 정의(소켓 경로, 연결 옵션 등)
 */
#pragma once
#include <cstdint>
#include <set>
#include <string>

namespace nipc {
    namespace ipc {
        constexpr const char* kDefaultSocketPath = "/var/run/nipart/sockets/daemon";

        /// 쿼리/적용 옵션의 기본 스키마 버전
        constexpr int kLatestSchemaVersion = 1;

        /// 와이어 상 길이 필드의 최댓값 (uint32)
        constexpr uint32_t kWireMaxFrameBytes = 0xFFFFFFFFu;

        /// 클라이언트 기본 수신 상한 (10 MiB)
        constexpr uint32_t kDefaultMaxFrameBytes = 10u * 1024u * 1024u;

        /// 프레임 수신 제한
        struct FrameLimits {
            int read_timeout_ms{0};                    ///< 0 = 무한 대기
            uint32_t max_frame_bytes{kDefaultMaxFrameBytes};
        };

        struct ConnectionOptions {
            FrameLimits limits{};
            /// true면 요청 kind 또는 accepted_kinds 외의 결과 kind를 거부
            bool strict_kinds{false};
            std::set<std::string> accepted_kinds;
        };
    } // namespace ipc
} // namespace nipc
