#pragma once

#include <string>

#include "common/enums.hpp"

namespace krishi {

enum class Language {
    Hindi,
    Haryanvi,
    English
};

constexpr Language kDefaultLanguage = Language::Hindi;

// "hi", "hr" or "en". Empty selects kDefaultLanguage; anything else falls
// back to English.
Language parseLanguageCode(const std::string &code);
std::string toLanguageCode(Language language);

enum class OutlookLabel {
    FrostDays,
    HeatStressDays,
    FavourableDays
};

// Farmer-facing labels in the selected language. Returned strings are UTF-8.
class AdvisoryTranslator
{
public:
    explicit AdvisoryTranslator(Language language = kDefaultLanguage);

    Language language() const { return m_language; }

    std::string alertCategory(AlertCategory category) const;
    std::string outlookLabel(OutlookLabel label) const;
    std::string weatherRisk(bool extreme) const;
    std::string temperatureDescription(double celsius) const;

private:
    struct Phrase {
        const char *english;
        const char *hindi;
        const char *haryanvi;
    };

    std::string pick(const Phrase &phrase) const;

    Language m_language;
};

} // namespace krishi
