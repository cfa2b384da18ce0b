/// @file effect.cpp
/// @brief Effect composition and traversal.

#include "dai/ai/effect.hpp"

namespace dai::ai {

Effect Effect::Combine(std::vector<Effect> effects) {
    std::vector<Effect> kept;
    kept.reserve(effects.size());
    for (auto& effect : effects) {
        if (!effect.IsNone()) {
            kept.push_back(std::move(effect));
        }
    }

    if (kept.empty()) {
        return None();
    }
    if (kept.size() == 1) {
        return std::move(kept.front());
    }
    return MultipleEffects{std::move(kept)};
}

std::vector<Effect> Effect::Flatten() const {
    std::vector<Effect> out;
    flattenInto(out);
    return out;
}

std::size_t Effect::LeafCount() const {
    if (const auto* multiple = std::get_if<MultipleEffects>(&value_)) {
        std::size_t count = 0;
        for (const auto& child : multiple->effects) {
            count += child.LeafCount();
        }
        return count;
    }
    return IsNone() ? 0 : 1;
}

void Effect::flattenInto(std::vector<Effect>& out) const {
    if (const auto* multiple = std::get_if<MultipleEffects>(&value_)) {
        for (const auto& child : multiple->effects) {
            child.flattenInto(out);
        }
        return;
    }
    if (!IsNone()) {
        out.push_back(*this);
    }
}

}  // namespace dai::ai
