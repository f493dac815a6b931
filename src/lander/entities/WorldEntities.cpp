/**
 * WorldEntities.cpp
 */

#include "WorldEntities.h"
#include <algorithm>

namespace Lander {

namespace {

template<typename T>
size_t pruneVector(std::vector<std::unique_ptr<T>>& items) {
    size_t before = items.size();
    items.erase(std::remove_if(items.begin(), items.end(),
                               [](const std::unique_ptr<T>& item) { return !item || item->isDestroyed(); }),
                items.end());
    return before - items.size();
}

template<typename T>
size_t pruneSingle(std::unique_ptr<T>& item) {
    if (item && item->isDestroyed()) {
        item.reset();
        return 1;
    }
    return 0;
}

template<typename T>
size_t countVector(const std::vector<std::unique_ptr<T>>& items) {
    return static_cast<size_t>(std::count_if(items.begin(), items.end(),
        [](const std::unique_ptr<T>& item) { return item && !item->isDestroyed(); }));
}

} // namespace

size_t WorldEntities::pruneDestroyed() {
    size_t removed = 0;
    removed += pruneVector(buildings);
    removed += pruneVector(cannons);
    removed += pruneSingle(golfCart);
    removed += pruneSingle(fisherBoat);
    removed += pruneVector(oilTowers);
    removed += pruneSingle(greenlandIce);
    removed += pruneVector(sharks);
    removed += pruneVector(biplanes);
    return removed;
}

std::vector<Rect> WorldEntities::getBuildingBounds() const {
    std::vector<Rect> result;
    result.reserve(buildings.size());
    for (const auto& building : buildings) {
        if (building && !building->isDestroyed()) {
            result.push_back(building->getCollisionBounds());
        }
    }
    return result;
}

size_t WorldEntities::countAlive() const {
    size_t count = countVector(buildings) + countVector(cannons) + countVector(oilTowers) +
                   countVector(sharks) + countVector(biplanes);
    if (golfCart && !golfCart->isDestroyed()) ++count;
    if (fisherBoat && !fisherBoat->isDestroyed()) ++count;
    if (greenlandIce && !greenlandIce->isDestroyed()) ++count;
    return count;
}

void WorldEntities::clear() {
    buildings.clear();
    cannons.clear();
    golfCart.reset();
    fisherBoat.reset();
    oilTowers.clear();
    greenlandIce.reset();
    sharks.clear();
    biplanes.clear();
}

} // namespace Lander
