#include <algorithm>
#include <gigmap/builder.hpp>
#include <gigmap/element.hpp>
#include <gigmap/logger.hpp>
#include <stdexcept>

namespace gigmap
{

// ─── Element ────────────────────────────────────────────────────────────────

Element::Element(std::string id, std::vector<Argument> arguments, std::vector<std::string> depends_on)
    : id_(std::move(id)), arguments_(std::move(arguments)), depends_on_(std::move(depends_on))
{
}

void Element::set_disabled(std::string reason)
{
    enabled_         = false;
    disabled_reason_ = std::move(reason);
}

// ─── ReadContext ────────────────────────────────────────────────────────────

ReadContext::ReadContext(Builder& builder, const Element& element)
    : builder_(builder), element_(element)
{
}

const ParamMap& ReadContext::params() const
{
    return builder_.params(element_.id());
}

const ParamMap& ReadContext::global() const
{
    return builder_.params(global_namespace);
}

AxisRegistry& ReadContext::axes()
{
    return builder_.axes();
}

Axis& ReadContext::axis(const std::string& name)
{
    return builder_.axes().axis(name);
}

const Element& ReadContext::dependency(const std::string& id) const
{
    const auto& deps = element_.depends_on();
    if (std::find(deps.begin(), deps.end(), id) == deps.end())
    {
        throw std::logic_error("element '" + element_.id() + "' did not declare a dependency on '"
                               + id + "'");
    }
    // Resolved at construction, so the lookup cannot fail here.
    return *builder_.element(id);
}

bool ReadContext::dependency_enabled(const std::string& id) const
{
    return dependency(id).enabled();
}

// ─── PlotContext ────────────────────────────────────────────────────────────

PlotContext::PlotContext(Builder& builder, const Element& element, Canvas& canvas)
    : builder_(builder), element_(element), canvas_(canvas)
{
}

const ParamMap& PlotContext::params() const
{
    return builder_.params(element_.id());
}

const ParamMap& PlotContext::global() const
{
    return builder_.params(global_namespace);
}

const Axis& PlotContext::axis(const std::string& name) const
{
    const Axis* a = builder_.axes().find(name);
    if (a == nullptr)
    {
        throw std::logic_error("element '" + element_.id() + "' plots against axis '" + name
                               + "', which no element populated");
    }
    return *a;
}

}   // namespace gigmap
