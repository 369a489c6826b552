/**
 * @file nipc_envelope.hpp
 * @brief 모든 프레임이 담는 최상위 JSON 구조 {"kind": <string>, "data": <any>}
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace nipc {
    namespace ipc {

        constexpr const char* kErrorKind = "error";
        constexpr const char* kLogKind = "log";

        /// kind 분류: error / log / 그 외 모든 kind는 명령 결과
        enum class EnvelopeType { Error, Log, Result };

        EnvelopeType classify_kind(const std::string& kind);

        struct Envelope {
            std::string kind;
            nlohmann::json data;

            Envelope() = default;
            Envelope(std::string k, nlohmann::json d) : kind(std::move(k)), data(std::move(d)) {}

            EnvelopeType type() const { return classify_kind(kind); }
            nlohmann::json to_json() const { return {{"kind", kind}, {"data", data}}; }
        };

        /**
         * @brief 페이로드 바이트를 Envelope로 해석
         * @return 실패 시 false, err에 사유(잘못된 JSON, 객체 아님, 문자열 kind 없음)
         * @note data가 없으면 null로 채운다.
         */
        bool decode_envelope(const uint8_t* payload, size_t len, Envelope& out, std::string& err);

        inline bool decode_envelope(const std::string& payload, Envelope& out, std::string& err) {
            return decode_envelope(reinterpret_cast<const uint8_t*>(payload.data()), payload.size(), out, err);
        }

        /**
         * @brief 한 줄 JSON 텍스트로 직렬화
         * @return JSON 라이브러리가 값을 거부하면(잘못된 UTF-8 문자열 등) false
         */
        bool encode_envelope(const Envelope& env, std::string& out, std::string& err);

    } // namespace ipc
} // namespace nipc
