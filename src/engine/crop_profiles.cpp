#include "engine/crop_profiles.hpp"

#include <QString>

#include <utility>

#include "common/errors.hpp"

namespace krishi {

namespace {

std::string normalizeCropId(const std::string &cropId)
{
    return QString::fromStdString(cropId).toUpper().toStdString();
}

CropThresholds makeProfile(const std::string &cropId, double gddBase)
{
    CropThresholds thresholds;
    thresholds.cropId = cropId;
    thresholds.gddBaseCelsius = gddBase;
    return thresholds;
}

} // namespace

StaticCropProfiles::StaticCropProfiles()
{
    m_defaults.cropId = "DEFAULT";
    for (const auto &profile : {makeProfile("TOMATO", 10.0),
                                makeProfile("POTATO", 7.0),
                                makeProfile("CAULIFLOWER", 5.0),
                                makeProfile("CUCUMBER", 12.0)}) {
        m_profiles.emplace(profile.cropId, profile);
    }
}

StaticCropProfiles::StaticCropProfiles(std::map<std::string, CropThresholds> profiles,
                                       CropThresholds defaults)
    : m_defaults(std::move(defaults))
{
    for (auto &item : profiles) {
        m_profiles.emplace(normalizeCropId(item.first), std::move(item.second));
    }
}

std::optional<CropThresholds> StaticCropProfiles::thresholdsFor(const std::string &cropId) const
{
    auto it = m_profiles.find(normalizeCropId(cropId));
    if (it == m_profiles.end()) {
        return std::nullopt;
    }
    return it->second;
}

CropThresholds StaticCropProfiles::defaults() const
{
    return m_defaults;
}

CropThresholds resolveThresholds(const CropProfileProvider &provider, const std::string &cropId)
{
    if (cropId.empty()) {
        return provider.defaults();
    }
    auto thresholds = provider.thresholdsFor(cropId);
    if (!thresholds) {
        throw NotFoundError("unknown crop " + cropId);
    }
    return *thresholds;
}

} // namespace krishi
