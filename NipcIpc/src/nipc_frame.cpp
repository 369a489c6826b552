/**
 * @file nipc_frame.cpp
 * ### 파일 설명(한글)
 * 길이 접두 프레임 송수신 구현.
 * * 수신은 poll + recv 반복으로 정확한 바이트 수를 채우고, 송신은 헤더와 페이로드를
 *   하나의 버퍼로 합쳐 send(MSG_NOSIGNAL)를 반복한다.
 */
#include "nipc_frame.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <new>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace nipc {
    namespace ipc {

        const char* frame_status_name(FrameStatus s) {
            switch (s) {
                case FrameStatus::Ok:       return "ok";
                case FrameStatus::Closed:   return "connection-closed";
                case FrameStatus::Timeout:  return "timeout";
                case FrameStatus::TooLarge: return "frame-too-large";
                case FrameStatus::IoError:  return "io";
            }
            return "io";
        }

        void encode_frame_header(uint32_t len, uint8_t out[kFrameHeaderBytes]) {
            out[0] = static_cast<uint8_t>((len >> 24) & 0xFF);
            out[1] = static_cast<uint8_t>((len >> 16) & 0xFF);
            out[2] = static_cast<uint8_t>((len >> 8) & 0xFF);
            out[3] = static_cast<uint8_t>(len & 0xFF);
        }

        uint32_t decode_frame_header(const uint8_t in[kFrameHeaderBytes]) {
            return (static_cast<uint32_t>(in[0]) << 24) |
                   (static_cast<uint32_t>(in[1]) << 16) |
                   (static_cast<uint32_t>(in[2]) << 8) |
                   static_cast<uint32_t>(in[3]);
        }

        // 페이로드는 실제로 도착한 만큼만 버퍼를 늘린다
        constexpr size_t kReadChunkBytes = 64 * 1024;

        static FrameStatus wait_readable(int fd, int timeout_ms, std::string& err) {
            if (timeout_ms <= 0) return FrameStatus::Ok;
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLIN;
            while (true) {
                int r = ::poll(&pfd, 1, timeout_ms);
                if (r > 0) return FrameStatus::Ok;  // POLLHUP도 recv()가 0으로 알려준다
                if (r == 0) {
                    err = "no data from peer within " + std::to_string(timeout_ms) + " ms";
                    return FrameStatus::Timeout;
                }
                const int e = errno;
                if (e == EINTR) continue;
                err = std::string("poll() failed: ") + std::strerror(e);
                return FrameStatus::IoError;
            }
        }

        FrameStatus read_exact(int fd, uint8_t* buf, size_t n, int timeout_ms, std::string& err) {
            size_t got = 0;
            while (got < n) {
                FrameStatus ws = wait_readable(fd, timeout_ms, err);
                if (ws != FrameStatus::Ok) return ws;

                ssize_t r = ::recv(fd, buf + got, n - got, 0);
                if (r > 0) {
                    got += static_cast<size_t>(r);
                    continue;
                }
                if (r == 0) {
                    err = "peer closed connection after " + std::to_string(got) + " of " +
                          std::to_string(n) + " bytes";
                    return FrameStatus::Closed;
                }
                const int e = errno;
                if (e == EINTR) continue;
                if (e == ECONNRESET) {
                    err = "connection reset by peer";
                    return FrameStatus::Closed;
                }
                err = std::string("recv() failed: ") + std::strerror(e);
                return FrameStatus::IoError;
            }
            return FrameStatus::Ok;
        }

        FrameStatus read_frame(int fd, std::vector<uint8_t>& out, std::string& err, const FrameLimits& limits) {
            err.clear();
            out.clear();

            uint8_t hdr[kFrameHeaderBytes] = {0, 0, 0, 0};
            FrameStatus st = read_exact(fd, hdr, kFrameHeaderBytes, limits.read_timeout_ms, err);
            if (st != FrameStatus::Ok) {
                err = "reading frame header: " + err;
                return st;
            }

            const uint32_t len = decode_frame_header(hdr);
            if (len > limits.max_frame_bytes) {
                err = "frame length " + std::to_string(len) + " exceeds limit " +
                      std::to_string(limits.max_frame_bytes);
                return FrameStatus::TooLarge;
            }
            if (len == 0) return FrameStatus::Ok;

            try {
                size_t got = 0;
                while (got < len) {
                    const size_t chunk = std::min(kReadChunkBytes, static_cast<size_t>(len) - got);
                    out.resize(got + chunk);
                    st = read_exact(fd, out.data() + got, chunk, limits.read_timeout_ms, err);
                    if (st != FrameStatus::Ok) {
                        err = "reading frame payload: " + err;
                        out.clear();
                        return st;
                    }
                    got += chunk;
                }
            } catch (const std::bad_alloc&) {
                out.clear();
                out.shrink_to_fit();
                err = "cannot allocate " + std::to_string(len) + " bytes for frame payload";
                return FrameStatus::TooLarge;
            }
            return FrameStatus::Ok;
        }

        FrameStatus write_frame(int fd, const uint8_t* data, size_t len, std::string& err) {
            err.clear();
            if (len > kWireMaxFrameBytes) {
                err = "payload of " + std::to_string(len) + " bytes does not fit a uint32 length";
                return FrameStatus::TooLarge;
            }

            // 헤더+페이로드를 하나의 버퍼로 합쳐 전송
            std::vector<uint8_t> packet(kFrameHeaderBytes + len);
            encode_frame_header(static_cast<uint32_t>(len), packet.data());
            if (data && len) std::memcpy(packet.data() + kFrameHeaderBytes, data, len);

            size_t sent_total = 0;
            while (sent_total < packet.size()) {
                ssize_t sent = ::send(fd, packet.data() + sent_total, packet.size() - sent_total, MSG_NOSIGNAL);
                if (sent < 0) {
                    const int e = errno;
                    if (e == EINTR) continue;
                    err = std::string("send() failed: ") + std::strerror(e);
                    return (e == EPIPE || e == ECONNRESET) ? FrameStatus::Closed : FrameStatus::IoError;
                }
                if (sent == 0) {
                    err = "send() wrote nothing after " + std::to_string(sent_total) + " bytes";
                    return FrameStatus::IoError;
                }
                sent_total += static_cast<size_t>(sent);
            }
            return FrameStatus::Ok;
        }

    } // namespace ipc
} // namespace nipc
