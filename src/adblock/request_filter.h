#pragma once

/**
 * @file request_filter.h
 * @brief 요청 필터 (부분 문자열 기반 광고 차단)
 *
 * 엔진이 보내는 모든 네트워크 요청 URL을 검사하여 차단 여부를 결정합니다.
 * 룰은 소문자 부분 문자열이며, 하나라도 URL에 포함되면 차단합니다.
 * 앵커/와일드카드/정규식은 지원하지 않습니다.
 *
 * 대소문자 변환은 ASCII 범위만 합니다. URL과 패턴은 UTF-8 바이트로 비교하므로
 * 비 ASCII 문자는 대소문자까지 정확히 같아야 매칭됩니다.
 */

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace browsey::adblock {

/**
 * @brief 필터 상태 (저장/복원 단위)
 */
struct FilterState {
    bool enabled{true};                 ///< 활성화 여부
    std::vector<std::string> patterns;  ///< 설정된 패턴 (비어있으면 기본값 사용)

    bool operator==(const FilterState&) const = default;
};

/**
 * @brief 요청 필터
 *
 * 설정된 패턴 목록과 실제 매칭에 쓰이는 활성 패턴 목록을 분리해서 보관합니다.
 * 비활성화하면 활성 목록만 비우고 설정 목록은 그대로 유지됩니다.
 */
class RequestFilter {
public:
    /// 기본 패턴으로 초기화 (활성 상태)
    RequestFilter();

    /**
     * @brief 저장된 상태로 초기화
     * @param state 활성화 여부와 패턴 목록 (패턴이 비어있으면 기본 패턴)
     */
    explicit RequestFilter(const FilterState& state);

    /**
     * @brief 요청 차단 여부 확인 (요청 경로, I/O 없음)
     * @param url 요청 URL (대소문자 무관)
     * @return 활성 패턴 중 하나라도 URL에 포함되면 true
     */
    [[nodiscard]] bool shouldBlock(std::string_view url) const;

    /**
     * @brief 차단을 일으킨 패턴 조회 (진단용)
     * @return 매칭된 첫 패턴, 없으면 nullopt
     */
    [[nodiscard]] std::optional<std::string> matchingPattern(std::string_view url) const;

    /**
     * @brief 패턴 목록 교체
     *
     * 주어진 목록을 그대로 소문자로 변환해서 보관합니다.
     * 빈 목록이면 아무것도 차단하지 않고, 빈 문자열 패턴은 모든 URL과 매칭됩니다.
     */
    void setPatterns(const std::vector<std::string>& patterns);

    /**
     * @brief 활성화/비활성화
     *
     * false: 활성 패턴을 비움 (설정 목록은 유지)
     * true: 설정 목록을 활성 패턴으로 복원
     */
    void setEnabled(bool enabled);

    [[nodiscard]] bool isEnabled() const { return enabled_; }

    /// 설정된 패턴 목록 (비활성 상태에서도 유지됨)
    [[nodiscard]] const std::vector<std::string>& patterns() const { return patterns_; }

    /// 현재 매칭에 사용되는 패턴 목록
    [[nodiscard]] const std::vector<std::string>& activePatterns() const { return active_; }

    /// 저장용 스냅샷
    [[nodiscard]] FilterState state() const;

    /// 내장 기본 패턴
    [[nodiscard]] static const std::vector<std::string>& defaultPatterns();

    /// 저장된 목록이 비어있으면 기본 패턴 (저장소 → 필터 경계에서 사용)
    [[nodiscard]] static std::vector<std::string> patternsOrDefaults(const std::vector<std::string>& saved);

private:
    void rebuildActive();

    std::vector<std::string> patterns_;  ///< 설정된 패턴 (소문자)
    std::vector<std::string> active_;    ///< 활성 패턴 (비활성화 시 비어있음)
    bool enabled_{true};
};

} // namespace browsey::adblock
