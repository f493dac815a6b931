/**
 * WorldLayout.cpp
 */

#include "WorldLayout.h"
#include <algorithm>

namespace Lander {

namespace {
const char* kOceanName = "Atlantic Ocean";
const char* kAfterOceanName = "United Kingdom";
}

const WorldLayout& WorldLayout::standard() {
    static const WorldLayout layout(
        {
            {"Washington DC", -2800.0f, 0.0f},
            {"USA", 0.0f, 0.0f},
            {"Atlantic Ocean", 2000.0f, 0.0f},
            {"United Kingdom", 4000.0f, 0.3f},
            {"France", 6000.0f, 0.4f},
            {"Germany", 9000.0f, 0.5f},
            {"Poland", 12000.0f, 0.6f},
            {"Russia", 16000.0f, 0.2f},
        },
        {
            {-2500.0f, 150.0f, "The White House", true, false},
            {1800.0f, 120.0f, "NYC Fuel Stop", false, false},
            {3800.0f, 100.0f, "Mid-Atlantic Platform", false, false},
            {5800.0f, 80.0f, "Dover Cliffs", false, false},
            {8500.0f, 80.0f, "Berlin Gas Station", false, false},
            {11500.0f, 70.0f, "Warsaw Depot", false, false},
            {15500.0f, 60.0f, "Border Station", false, false},
            {19500.0f, 250.0f, "Putino's Palace", false, true},
        });
    return layout;
}

WorldLayout::WorldLayout(std::vector<CountryInfo> countries, std::vector<LandingPadInfo> pads)
    : countries_(std::move(countries))
    , pads_(std::move(pads)) {
    std::sort(countries_.begin(), countries_.end(),
              [](const CountryInfo& a, const CountryInfo& b) { return a.startX < b.startX; });
    
    if (const CountryInfo* ocean = findCountry(kOceanName)) {
        waterStart_ = ocean->startX;
        oceanEnd_ = ocean->startX + 3000.0f;
    }
    if (const CountryInfo* next = findCountry(kAfterOceanName)) {
        waterEnd_ = next->startX;
    }
}

const CountryInfo& WorldLayout::countryAt(float x) const {
    static const CountryInfo empty;
    if (countries_.empty()) return empty;
    
    const CountryInfo* result = &countries_.front();
    for (const auto& country : countries_) {
        if (x >= country.startX) {
            result = &country;
        }
    }
    return *result;
}

const CountryInfo* WorldLayout::findCountry(const std::string& name) const {
    for (const auto& country : countries_) {
        if (country.name == name) return &country;
    }
    return nullptr;
}

float WorldLayout::countryEndX(const std::string& name) const {
    const CountryInfo* country = findCountry(name);
    if (!country) return 0.0f;
    
    for (const auto& other : countries_) {
        if (other.startX > country->startX) return other.startX;
    }
    return country->startX + 6000.0f;
}

} // namespace Lander
