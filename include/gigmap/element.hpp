#pragma once

#include <gigmap/argument.hpp>
#include <gigmap/axis_registry.hpp>
#include <string>
#include <vector>

namespace gigmap
{

class Builder;
class Canvas;
class Element;

// Outcome of an element's read step.
class ReadResult
{
   public:
    static ReadResult ready() { return ReadResult(true, {}); }
    static ReadResult disabled(std::string reason) { return ReadResult(false, std::move(reason)); }

    bool               is_ready() const { return ready_; }
    const std::string& reason() const { return reason_; }

   private:
    ReadResult(bool ready, std::string reason) : ready_(ready), reason_(std::move(reason)) {}

    bool        ready_;
    std::string reason_;
};

// What an element can reach during its read step: its own parameters, the
// global parameters, the shared axes and the state of the elements it
// declared as dependencies.
class ReadContext
{
   public:
    ReadContext(Builder& builder, const Element& element);

    const ParamMap& params() const;
    const ParamMap& global() const;

    AxisRegistry& axes();
    Axis&         axis(const std::string& name);

    // Throws std::logic_error unless `id` is one of the element's declared
    // dependencies.
    const Element& dependency(const std::string& id) const;
    bool           dependency_enabled(const std::string& id) const;

   private:
    Builder&       builder_;
    const Element& element_;
};

// What an element can reach during its plot step. Axes are read-only here.
class PlotContext
{
   public:
    PlotContext(Builder& builder, const Element& element, Canvas& canvas);

    const ParamMap& params() const;
    const ParamMap& global() const;

    const Axis& axis(const std::string& name) const;
    Canvas&     canvas() { return canvas_; }

   private:
    Builder&       builder_;
    const Element& element_;
    Canvas&        canvas_;
};

/**
 * Element — one self-contained panel of a composite figure.
 *
 * An element declares its arguments and the sibling elements it depends on
 * at construction. The Builder calls read() once, in declaration order, and
 * plot() once for every element whose read step returned ready().
 */
class Element
{
   public:
    virtual ~Element() = default;

    Element(const Element&)            = delete;
    Element& operator=(const Element&) = delete;

    const std::string&              id() const { return id_; }
    const std::vector<Argument>&    arguments() const { return arguments_; }
    const std::vector<std::string>& depends_on() const { return depends_on_; }

    bool               enabled() const { return enabled_; }
    const std::string& disabled_reason() const { return disabled_reason_; }

    virtual ReadResult read(ReadContext& ctx) = 0;
    virtual void       plot(PlotContext& ctx) = 0;

   protected:
    Element(std::string id, std::vector<Argument> arguments, std::vector<std::string> depends_on = {});

   private:
    friend class Builder;

    void set_disabled(std::string reason);

    std::string              id_;
    std::vector<Argument>    arguments_;
    std::vector<std::string> depends_on_;
    bool                     enabled_ = true;
    std::string              disabled_reason_;
};

}   // namespace gigmap
