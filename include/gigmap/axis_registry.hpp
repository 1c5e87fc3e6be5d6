#pragma once

#include <gigmap/axis.hpp>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace gigmap
{

// Owns one Axis per dimension name for the lifetime of a Builder run.
// References returned by axis() stay valid until the registry is destroyed.
class AxisRegistry
{
   public:
    AxisRegistry()  = default;
    ~AxisRegistry() = default;

    AxisRegistry(const AxisRegistry&)            = delete;
    AxisRegistry& operator=(const AxisRegistry&) = delete;

    // Returns the axis, creating an empty placeholder on first access so a
    // writer can test exists() before populating it.
    Axis& axis(const std::string& name);

    // Lookup without creating. Returns nullptr if never accessed.
    const Axis* find(const std::string& name) const;

    bool contains(const std::string& name) const;

    // Axis names in first-access order.
    const std::vector<std::string>& names() const { return insertion_order_; }
    size_t                          count() const { return axes_.size(); }

   private:
    std::unordered_map<std::string, std::unique_ptr<Axis>> axes_;
    std::vector<std::string>                               insertion_order_;
};

}   // namespace gigmap
