#pragma once

#include <map>
#include <optional>
#include <string>

namespace krishi {

struct CropThresholds {
    std::string cropId;
    double gddBaseCelsius = 10.0;
    double dryBelowPercent = 30.0;
    double saturatedAbovePercent = 70.0;
};

// Supplies per-crop thresholds. Returns an empty optional for unknown crops.
class CropProfileProvider
{
public:
    virtual ~CropProfileProvider() = default;

    virtual std::optional<CropThresholds> thresholdsFor(const std::string &cropId) const = 0;
    virtual CropThresholds defaults() const = 0;
};

// Built-in profiles for the crops grown in the covered districts.
class StaticCropProfiles : public CropProfileProvider
{
public:
    StaticCropProfiles();
    StaticCropProfiles(std::map<std::string, CropThresholds> profiles, CropThresholds defaults);

    std::optional<CropThresholds> thresholdsFor(const std::string &cropId) const override;
    CropThresholds defaults() const override;

private:
    std::map<std::string, CropThresholds> m_profiles;
    CropThresholds m_defaults;
};

// Empty crop id selects the defaults; an unknown one throws NotFoundError.
CropThresholds resolveThresholds(const CropProfileProvider &provider, const std::string &cropId);

} // namespace krishi
