/*
 * 설명: 모듈 경계에서 out-parameter로 전달되는 복구 가능한 오류 코드를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 */
#pragma once

namespace tugchat::error_code {

inline constexpr const char* kAlreadyQueued = "already_queued";
inline constexpr const char* kDuplicateParticipant = "duplicate_participant";
inline constexpr const char* kUnknownMatch = "unknown_match";
inline constexpr const char* kUnknownSession = "unknown_session";
inline constexpr const char* kDeliveryFailed = "delivery_failed";
inline constexpr const char* kBadRequest = "bad_request";
inline constexpr const char* kUnauthorized = "unauthorized";
inline constexpr const char* kNotFound = "not_found";

}  // namespace tugchat::error_code
