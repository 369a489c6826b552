/**
 * @file nipc_error.hpp
 * @brief 요청 실패 분류와 결과 타입
 *
 * 호출자는 category로 "데몬에 닿지 못했거나 응답을 해석하지 못함"과
 * "데몬이 도메인 오류를 보고함"을 구분할 수 있다.
 */
#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace nipc {
    namespace ipc {

        /// 오류 분류
        enum class IpcErrorCategory : int {
            None = 0,
            FrameIo = 1,            ///< 전송 계층 실패, 조기 종료, 타임아웃
            MalformedEnvelope = 2,  ///< JSON 해석 불가 또는 envelope 스키마 위반
            Protocol = 3,           ///< 데몬이 보고한 일반 오류
            Validation = 4,         ///< 데몬이 보고한 invalid-argument
            UnknownLogLevel = 5,    ///< 데몬과 로그 레벨 어휘가 어긋남(내부 버그 계열)
            UnexpectedKind = 6      ///< strict 모드에서 거부된 결과 kind
        };

        const char* category_name(IpcErrorCategory c);

        struct IpcError {
            IpcErrorCategory category{IpcErrorCategory::None};
            std::string kind;  ///< 데몬 오류면 와이어 kind, 그 외에는 세부 사유 식별자
            std::string msg;

            IpcError() = default;
            IpcError(IpcErrorCategory c, std::string k, std::string m)
                : category(c), kind(std::move(k)), msg(std::move(m)) {}

            bool is_daemon_error() const {
                return category == IpcErrorCategory::Protocol || category == IpcErrorCategory::Validation;
            }
            bool is_transport_error() const {
                return category == IpcErrorCategory::FrameIo || category == IpcErrorCategory::MalformedEnvelope;
            }
            bool is_validation_error() const { return category == IpcErrorCategory::Validation; }

            /// "Validation(invalid-argument): bad mtu" 형태
            std::string to_string() const;
        };

        struct IpcResult {
            bool ok{true};
            IpcError error;
            nlohmann::json data;

            static IpcResult success(nlohmann::json d) {
                IpcResult r;
                r.data = std::move(d);
                return r;
            }
            static IpcResult failure(IpcError e) {
                IpcResult r;
                r.ok = false;
                r.error = std::move(e);
                return r;
            }
            static IpcResult failure(IpcErrorCategory c, std::string kind, std::string msg) {
                return failure(IpcError(c, std::move(kind), std::move(msg)));
            }
        };

        /// 데몬이 보내는 오류 kind 중 별도 분류가 있는 것
        constexpr const char* kInvalidArgumentKind = "invalid-argument";

        /**
         * @brief "error" envelope의 data({"kind","msg"})를 분류된 오류로 변환
         * @details 알려지지 않은 kind는 항상 Protocol로 떨어진다.
         *          kind/msg가 문자열이 아니면 MalformedEnvelope.
         */
        IpcError error_from_envelope(const nlohmann::json& data);

        /// 와이어 kind 문자열 -> 분류 (기본 Protocol)
        IpcErrorCategory classify_daemon_error_kind(const std::string& kind);

    } // namespace ipc
} // namespace nipc
