/**
 * @file nipc_ipc_internal.hpp
 * @brief NipcIpc 내부 공용 유틸리티(로그 프리뷰) - 내부 전용 헤더
 */
#pragma once
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

namespace nipc { namespace ipc { namespace internal {

/**
 * @brief 긴 문자열을 로그 용도로 자릅니다.
 * @param max_len 유지할 최대 길이
 * @return 잘린 문자열(길이 초과 시 ...(len=N) 접미사 추가)
 */
inline std::string truncate_for_log(const std::string& s, std::size_t max_len = 1024) {
    if (s.size() <= max_len) return s;
    return s.substr(0, max_len) + "...(len=" + std::to_string(s.size()) + ")";
}

constexpr const char* kHiddenSecret = "<_password_hid_by_nipc>";

inline bool is_secret_key(const std::string& key) {
    static const char* const keys[] = {"password", "psk", "private-key", "preshared-key", "secret", "pin"};
    for (const char* k : keys) {
        if (key == k) return true;
    }
    return false;
}

/// 비밀 필드 값을 가린 복사본. 원본은 그대로 송신된다.
inline nlohmann::json redact_secrets(const nlohmann::json& j) {
    if (j.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (is_secret_key(it.key()) && it->is_string()) out[it.key()] = kHiddenSecret;
            else out[it.key()] = redact_secrets(*it);
        }
        return out;
    }
    if (j.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& v : j) out.push_back(redact_secrets(v));
        return out;
    }
    return j;
}

/// FLOW 로그용 한 줄 프리뷰
inline std::string preview_for_log(const nlohmann::json& j, std::size_t max_len = 1024) {
    return truncate_for_log(redact_secrets(j).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                            max_len);
}

}}} // namespace nipc::ipc::internal
