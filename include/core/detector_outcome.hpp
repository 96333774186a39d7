#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

/**
 * @brief Why a detector could not complete its normal computation
 */
enum class FailureReason
{
    INPUT_UNREADABLE,   // Image could not be read or decoded
    ENGINE_UNAVAILABLE, // External engine (OCR) missing or not initialisable
    EXTRACTION_FAILED,  // Engine ran but could not extract anything usable
    PROCESSING_FAILED,  // Detector's own computation failed
    UNEXPECTED_ERROR    // Exception caught at the aggregator boundary
};

inline const char *failureReasonName(FailureReason reason)
{
    switch (reason)
    {
    case FailureReason::INPUT_UNREADABLE:
        return "input_unreadable";
    case FailureReason::ENGINE_UNAVAILABLE:
        return "engine_unavailable";
    case FailureReason::EXTRACTION_FAILED:
        return "extraction_failed";
    case FailureReason::PROCESSING_FAILED:
        return "processing_failed";
    case FailureReason::UNEXPECTED_ERROR:
    default:
        return "unexpected_error";
    }
}

struct DetectorFailure
{
    FailureReason reason;
    std::string message;
};

/**
 * @brief Fallback payload for a findings type
 *
 * Every findings type specializes this with a fixed SCORE and a
 * fallback() that builds the inconclusive payload for a failure.
 */
template <typename Findings>
struct FallbackPolicy;

/**
 * @brief Result of one detector run: either its findings or a failure
 *
 * A failed outcome never carries a partial payload. Callers that need the
 * reported shape use resolved(), which substitutes the detector's fallback.
 */
template <typename Findings>
class DetectorOutcome
{
public:
    static DetectorOutcome success(Findings findings)
    {
        return DetectorOutcome(std::move(findings));
    }

    static DetectorOutcome failure(FailureReason reason, const std::string &message)
    {
        return DetectorOutcome(DetectorFailure{reason, message});
    }

    bool ok() const { return std::holds_alternative<Findings>(value_); }

    const Findings &findings() const { return std::get<Findings>(value_); }

    const DetectorFailure &error() const { return std::get<DetectorFailure>(value_); }

    // Findings on success, the fallback payload on failure
    Findings resolved() const
    {
        if (ok())
            return findings();
        return FallbackPolicy<Findings>::fallback(error());
    }

    double score() const
    {
        return ok() ? findings().score : FallbackPolicy<Findings>::SCORE;
    }

    std::optional<std::string> errorMessage() const
    {
        if (ok())
            return std::nullopt;
        return error().message;
    }

private:
    explicit DetectorOutcome(Findings findings) : value_(std::move(findings)) {}
    explicit DetectorOutcome(DetectorFailure failure) : value_(std::move(failure)) {}

    std::variant<Findings, DetectorFailure> value_;
};
