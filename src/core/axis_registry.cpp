#include <gigmap/axis_registry.hpp>

namespace gigmap
{

Axis& AxisRegistry::axis(const std::string& name)
{
    auto it = axes_.find(name);
    if (it != axes_.end())
        return *it->second;

    auto& slot = axes_[name];
    slot       = std::make_unique<Axis>(name);
    insertion_order_.push_back(name);
    return *slot;
}

const Axis* AxisRegistry::find(const std::string& name) const
{
    auto it = axes_.find(name);
    return (it != axes_.end()) ? it->second.get() : nullptr;
}

bool AxisRegistry::contains(const std::string& name) const
{
    return axes_.count(name) > 0;
}

}   // namespace gigmap
