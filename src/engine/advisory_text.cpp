#include "engine/advisory_text.hpp"

#include <QString>

namespace krishi {

Language parseLanguageCode(const std::string &code)
{
    const QString normalized = QString::fromStdString(code).trimmed().toLower();
    if (normalized.isEmpty()) {
        return kDefaultLanguage;
    }
    if (normalized == QStringLiteral("hi")) {
        return Language::Hindi;
    }
    if (normalized == QStringLiteral("hr")) {
        return Language::Haryanvi;
    }
    return Language::English;
}

std::string toLanguageCode(Language language)
{
    switch (language) {
    case Language::Hindi:
        return "hi";
    case Language::Haryanvi:
        return "hr";
    case Language::English:
        return "en";
    }
    return "en";
}

AdvisoryTranslator::AdvisoryTranslator(Language language)
    : m_language(language)
{
}

std::string AdvisoryTranslator::pick(const Phrase &phrase) const
{
    switch (m_language) {
    case Language::Hindi:
        return phrase.hindi;
    case Language::Haryanvi:
        return phrase.haryanvi;
    case Language::English:
        return phrase.english;
    }
    return phrase.english;
}

std::string AdvisoryTranslator::alertCategory(AlertCategory category) const
{
    switch (category) {
    case AlertCategory::FloodRisk:
        return pick({"Heavy Rain Warning", "भारी बारिश की चेतावनी", "तेज बरखा की चेतावनी"});
    case AlertCategory::HeatAdvisory:
        return pick({"Heat Wave Warning", "लू की चेतावनी", "लू की चेतावनी"});
    case AlertCategory::FrostWarning:
        return pick({"Frost Warning", "पाला चेतावनी", "पाला की चेतावनी"});
    case AlertCategory::IrrigationAdvisory:
        return pick({"Irrigation needed", "सिंचाई करें", "पानी देना जरूरी है"});
    case AlertCategory::DiseaseRisk:
        return pick({"Disease Risk", "बीमारी का खतरा", "बीमारी का खतरा"});
    }
    return pick({"Weather Alert", "मौसम चेतावनी", "मौसम की चेतावनी"});
}

std::string AdvisoryTranslator::outlookLabel(OutlookLabel label) const
{
    switch (label) {
    case OutlookLabel::FrostDays:
        return pick({"Frost risk days", "पाले के खतरे वाले दिन", "पाले आले दिन"});
    case OutlookLabel::HeatStressDays:
        return pick({"Heat stress days", "लू वाले दिन", "लू आले दिन"});
    case OutlookLabel::FavourableDays:
        return pick({"Favourable days", "अनुकूल दिन", "बढ़िया दिन"});
    }
    return {};
}

std::string AdvisoryTranslator::weatherRisk(bool extreme) const
{
    if (extreme) {
        return pick({"Extreme weather risk", "गंभीर मौसम का खतरा", "मौसम का घणा खतरा"});
    }
    return pick({"Moderate weather risk", "सामान्य मौसम का खतरा", "मौसम का थोड़ा खतरा"});
}

std::string AdvisoryTranslator::temperatureDescription(double celsius) const
{
    if (celsius <= 5.0) {
        return pick({"Very Cold", "बहुत ठंडा", "बहुत ठंडा"});
    }
    if (celsius <= 15.0) {
        return pick({"Cold", "ठंडा", "ठंडा"});
    }
    if (celsius <= 25.0) {
        return pick({"Moderate", "सामान्य", "ठीक"});
    }
    if (celsius <= 35.0) {
        return pick({"Warm", "गरम", "गरम"});
    }
    return pick({"Hot", "बहुत गरम", "तपत"});
}

} // namespace krishi
