/**
 * @file request_filter.cpp
 * @brief 요청 필터 구현
 */

#include "request_filter.h"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace browsey::adblock {

namespace {

/// 소문자 변환
std::string toLower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

/// 대소문자 무시 부분 문자열 검색 (pattern은 이미 소문자), 할당 없음
bool containsLowered(std::string_view haystack, const std::string& pattern) {
    // 빈 패턴은 모든 문자열의 부분 문자열
    if (pattern.empty()) return true;
    auto it = std::search(haystack.begin(), haystack.end(),
        pattern.begin(), pattern.end(),
        [](char a, char b) {
            return static_cast<char>(std::tolower(static_cast<unsigned char>(a))) == b;
        });
    return it != haystack.end();
}

} // anonymous namespace

RequestFilter::RequestFilter() {
    setPatterns(defaultPatterns());
}

RequestFilter::RequestFilter(const FilterState& state)
    : enabled_(state.enabled) {
    setPatterns(patternsOrDefaults(state.patterns));
}

std::vector<std::string> RequestFilter::patternsOrDefaults(const std::vector<std::string>& saved) {
    return saved.empty() ? defaultPatterns() : saved;
}

const std::vector<std::string>& RequestFilter::defaultPatterns() {
    static const std::vector<std::string> DEFAULT_PATTERNS = {
        "doubleclick.net",
        "googlesyndication",
        "adservice.google.",
        "pagead2.googlesyndication.com",
        "/ads?",
        "/adserver",
        ".ads.",
        "ads.",
        "advert",
        "adclick",
        "tracking",
        "analytics.js",
        "googletagservices",
        "adsystem",
    };
    return DEFAULT_PATTERNS;
}

bool RequestFilter::shouldBlock(std::string_view url) const {
    return std::any_of(active_.begin(), active_.end(),
        [url](const std::string& p) { return containsLowered(url, p); });
}

std::optional<std::string> RequestFilter::matchingPattern(std::string_view url) const {
    for (const auto& p : active_) {
        if (containsLowered(url, p)) return p;
    }
    return std::nullopt;
}

void RequestFilter::setPatterns(const std::vector<std::string>& patterns) {
    std::vector<std::string> lowered;
    lowered.reserve(patterns.size());
    for (const auto& p : patterns) {
        lowered.push_back(toLower(p));
    }
    patterns_ = std::move(lowered);

    rebuildActive();
    std::cout << "[RequestFilter] 패턴 " << patterns_.size() << "개 설정" << std::endl;
}

void RequestFilter::setEnabled(bool enabled) {
    if (enabled_ == enabled) return;
    enabled_ = enabled;
    rebuildActive();
    std::cout << "[RequestFilter] " << (enabled_ ? "활성화" : "비활성화") << std::endl;
}

FilterState RequestFilter::state() const {
    return FilterState{enabled_, patterns_};
}

void RequestFilter::rebuildActive() {
    if (enabled_) {
        active_ = patterns_;
    } else {
        active_.clear();
    }
}

} // namespace browsey::adblock
