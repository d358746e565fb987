#pragma once

/**
 * @file injection_driver.h
 * @brief 페이지 로드 완료 시 확장 스타일/스크립트 주입
 *
 * 탭의 "load finished" 이벤트마다 카탈로그 전체를 다시 주입합니다.
 * 완료 확인, 재시도, 중복 제거는 하지 않습니다 (fire-and-forget).
 */

#include "extension.h"

#include <QString>

namespace browsey::extensions {

/**
 * @brief 스크립트 실행 대상 (탭 하나의 페이지)
 *
 * 엔진 어댑터가 QWebEnginePage::runJavaScript 로 구현합니다.
 * 호출은 비동기이며 결과를 기다리지 않습니다.
 */
class ScriptTarget {
public:
    virtual ~ScriptTarget() = default;

    virtual void runScript(const QString& source) = 0;
};

// ============================================================
// InjectionDriver
// ============================================================
class InjectionDriver {
public:
    InjectionDriver() = default;

    /**
     * @brief 페이지 로드 완료 처리
     *
     * 카탈로그 순서(이름순)로, 확장마다 스타일 → 스크립트 순으로 주입합니다.
     * @param page 대상 페이지 (nullptr이면 아무것도 하지 않음)
     * @param catalog 주입할 확장 목록
     * @return 페이지에 보낸 스크립트 수
     */
    int onPageLoadFinished(ScriptTarget* page, const ExtensionCatalog& catalog) const;

    /**
     * @brief CSS를 <style> 요소로 추가하는 스크립트 생성
     *
     * CSS 원문은 JSON 문자열 리터럴로 인코딩되어 따옴표/개행/역슬래시가 안전합니다.
     */
    static QString styleInjectionScript(const QString& css);

    /// JS 문자열 리터럴 (큰따옴표 포함)
    static QString toJsStringLiteral(const QString& text);
};

} // namespace browsey::extensions
