#pragma once

#include <QString>

namespace browsey {
namespace engine {

// ============================================================
// EngineResult: 엔진에 요청한 설정이 실제로 적용되었는지
// ============================================================
struct EngineResult {
    enum class Status {
        Applied,      // 적용됨
        Unsupported,  // 엔진(빌드)이 지원하지 않음
        Failed        // 시도했으나 반영되지 않음
    };

    Status status = Status::Applied;
    QString detail;

    bool ok() const { return status == Status::Applied; }

    static EngineResult applied() { return {}; }
    static EngineResult unsupported(const QString& detail) { return {Status::Unsupported, detail}; }
    static EngineResult failed(const QString& detail) { return {Status::Failed, detail}; }
};

} // namespace engine
} // namespace browsey
