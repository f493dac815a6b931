/**
 * WorldLayout.h
 * 
 * Static world configuration: country regions, landing pads and water
 * 
 * Features:
 * - Country table ordered by start x
 * - Water region queries for bombs and thrust scorching
 * - Landing pad placement
 */

#pragma once

#include <string>
#include <vector>

namespace Lander {

struct CountryInfo {
    std::string name;
    float startX = 0.0f;
    float cannonDensity = 0.0f;
};

struct LandingPadInfo {
    float x = 0.0f;
    float width = 0.0f;
    std::string name;
    bool isWashington = false;
    bool isFinalDestination = false;
};

/**
 * World layout queries shared by every subsystem
 */
class WorldLayout {
public:
    /** Default layout of the eastbound campaign */
    static const WorldLayout& standard();
    
    WorldLayout(std::vector<CountryInfo> countries, std::vector<LandingPadInfo> pads);
    
    const std::vector<CountryInfo>& getCountries() const { return countries_; }
    const std::vector<LandingPadInfo>& getLandingPads() const { return pads_; }
    
    /** Country whose region contains x (the first one if x is west of all) */
    const CountryInfo& countryAt(float x) const;
    
    const CountryInfo* findCountry(const std::string& name) const;
    
    /** Start x of the region following the named country, or start + 6000 */
    float countryEndX(const std::string& name) const;
    
    /** Open water where bombs sink and thrust pollutes */
    bool isOverWater(float x) const { return x >= waterStart_ && x < waterEnd_; }
    float getWaterStart() const { return waterStart_; }
    float getWaterEnd() const { return waterEnd_; }
    
    /** Wider ocean band in which sea life patrols */
    float getOceanStart() const { return waterStart_; }
    float getOceanEnd() const { return oceanEnd_; }
    
private:
    std::vector<CountryInfo> countries_;
    std::vector<LandingPadInfo> pads_;
    float waterStart_ = 2000.0f;
    float waterEnd_ = 4000.0f;
    float oceanEnd_ = 5000.0f;
};

} // namespace Lander
