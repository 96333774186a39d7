#pragma once

#include <string>

/**
 * @brief Risk tiers shared by every detector and the final report
 *
 * Scores at or above HIGH_THRESHOLD are high risk, scores at or above
 * MEDIUM_THRESHOLD are medium risk, everything else is low risk.
 */
enum class RiskTier
{
    LOW,
    MEDIUM,
    HIGH
};

class Verdict
{
public:
    static constexpr double MEDIUM_THRESHOLD = 40.0;
    static constexpr double HIGH_THRESHOLD = 65.0;

    static RiskTier riskTier(double score)
    {
        if (score >= HIGH_THRESHOLD)
            return RiskTier::HIGH;
        if (score >= MEDIUM_THRESHOLD)
            return RiskTier::MEDIUM;
        return RiskTier::LOW;
    }

    /**
     * @brief Detector verdict, e.g. "MEDIUM ELA RISK"
     * @param score Detector score in [0, 100]
     * @param label Detector label ("ELA", "METADATA", "OCR")
     */
    static std::string riskVerdict(double score, const std::string &label)
    {
        return std::string(tierName(riskTier(score))) + " " + label + " RISK";
    }

    /**
     * @brief Verdict for the weighted final score
     */
    static std::string finalVerdict(double score)
    {
        switch (riskTier(score))
        {
        case RiskTier::HIGH:
            return "HIGH RISK - Likely Tampered";
        case RiskTier::MEDIUM:
            return "MEDIUM RISK - Requires Review";
        case RiskTier::LOW:
        default:
            return "LOW RISK - Appears Authentic";
        }
    }

    static const char *tierName(RiskTier tier)
    {
        switch (tier)
        {
        case RiskTier::HIGH:
            return "HIGH";
        case RiskTier::MEDIUM:
            return "MEDIUM";
        case RiskTier::LOW:
        default:
            return "LOW";
        }
    }
};
