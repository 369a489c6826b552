/**
 * @file nipc_frame.hpp
 * @brief 길이 접두 프레임 코덱: [4바이트 big-endian 길이][UTF-8 JSON 페이로드]
 *
 * 빈 페이로드(길이 0)도 유효한 프레임이다. 길이 헤더는 항상 존재하므로
 * 연결 종료와 빈 프레임은 구분된다.
 */
#pragma once
#include "nipc_ipc_types.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace nipc {
    namespace ipc {

        constexpr size_t kFrameHeaderBytes = 4;

        enum class FrameStatus {
            Ok,
            Closed,    ///< 피어가 프레임 완성 전에 연결을 닫음
            Timeout,   ///< read_timeout_ms 내에 데이터 없음
            TooLarge,  ///< 헤더 길이가 max_frame_bytes 초과
            IoError    ///< send/recv/poll 실패
        };

        const char* frame_status_name(FrameStatus s);

        void encode_frame_header(uint32_t len, uint8_t out[kFrameHeaderBytes]);
        uint32_t decode_frame_header(const uint8_t in[kFrameHeaderBytes]);

        /**
         * @brief fd에서 정확히 n바이트를 읽는다(부분 수신은 내부에서 반복).
         * @param timeout_ms 0이면 무한 대기, 양수면 매 대기마다 poll 제한
         */
        FrameStatus read_exact(int fd, uint8_t* buf, size_t n, int timeout_ms, std::string& err);

        /**
         * @brief 프레임 하나를 읽어 out에 페이로드를 채운다.
         * @return Ok 외의 값이면 err에 사유가 기록된다.
         */
        FrameStatus read_frame(int fd, std::vector<uint8_t>& out, std::string& err,
                               const FrameLimits& limits = FrameLimits{});

        /**
         * @brief 헤더+페이로드를 하나의 버퍼로 합쳐 전송한다.
         * @note 같은 fd의 다른 writer와의 직렬화는 호출자(Connection) 책임.
         */
        FrameStatus write_frame(int fd, const uint8_t* data, size_t len, std::string& err);

        inline FrameStatus write_frame(int fd, const std::string& payload, std::string& err) {
            return write_frame(fd, reinterpret_cast<const uint8_t*>(payload.data()), payload.size(), err);
        }

    } // namespace ipc
} // namespace nipc
