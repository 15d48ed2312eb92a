#include <relicta/plugin/types.h>

#include <algorithm>

namespace relicta::plugin {

bool Info::supports(const Hook& hook) const {
    return std::find(hooks.begin(), hooks.end(), hook) != hooks.end();
}

std::size_t CategorizedChanges::total() const noexcept {
    return features.size() + fixes.size() + breaking.size() + performance.size() +
           refactor.size() + docs.size() + other.size();
}

} // namespace relicta::plugin
