#include "core/forensic_result.hpp"

ElaFindings FallbackPolicy<ElaFindings>::fallback(const DetectorFailure &failure)
{
    ElaFindings findings;
    findings.score = SCORE;
    switch (failure.reason)
    {
    case FailureReason::INPUT_UNREADABLE:
        findings.verdict = "INCONCLUSIVE - ELA read failed";
        break;
    case FailureReason::UNEXPECTED_ERROR:
        findings.verdict = "INCONCLUSIVE - ELA failed";
        break;
    default:
        findings.verdict = "INCONCLUSIVE - ELA processing failed";
        break;
    }
    return findings;
}

MetadataFindings FallbackPolicy<MetadataFindings>::fallback(const DetectorFailure &failure)
{
    MetadataFindings findings;
    findings.score = SCORE;
    if (failure.reason == FailureReason::INPUT_UNREADABLE)
    {
        findings.verdict = "INCONCLUSIVE - Metadata read failed";
        findings.flags.push_back("Could not read image metadata.");
    }
    else
    {
        findings.verdict = "INCONCLUSIVE - Metadata inspection failed";
        findings.flags.push_back("Could not extract EXIF metadata.");
    }
    return findings;
}

OcrFindings FallbackPolicy<OcrFindings>::fallback(const DetectorFailure &failure)
{
    OcrFindings findings;
    findings.score = SCORE;
    switch (failure.reason)
    {
    case FailureReason::ENGINE_UNAVAILABLE:
        findings.verdict = "INCONCLUSIVE - Tesseract not installed";
        findings.flags.push_back("Tesseract OCR is not available; install it to enable OCR checks.");
        break;
    case FailureReason::EXTRACTION_FAILED:
        findings.verdict = "INCONCLUSIVE - OCR extraction failed";
        findings.flags.push_back("OCR extraction failed; poor scan quality can trigger this.");
        break;
    case FailureReason::INPUT_UNREADABLE:
        findings.verdict = "INCONCLUSIVE - OCR read failed";
        findings.flags.push_back("Could not read the invoice image for OCR.");
        break;
    default:
        findings.verdict = "INCONCLUSIVE - OCR failed";
        findings.flags.push_back("OCR validation failed unexpectedly.");
        break;
    }
    return findings;
}
