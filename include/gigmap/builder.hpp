#pragma once

#include <gigmap/argument.hpp>
#include <gigmap/axis_registry.hpp>
#include <gigmap/element.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace gigmap
{

class Canvas;

enum class Phase
{
    Constructed,
    ArgumentsParsed,
    DataRead,
    Rendered,
};

const char* phase_name(Phase phase);

// Namespace holding arguments not tied to any element.
inline constexpr const char* global_namespace = "global";

// One boundary key as it appears to the parameter source.
struct BoundaryArgument
{
    std::string     key;         // "width" or "{element}-{argument}"
    std::string     name_space;  // "global" or the element id
    const Argument* argument = nullptr;
};

/**
 * Builder — drives one run of a composite figure.
 *
 * Phases advance strictly Constructed -> ArgumentsParsed -> DataRead ->
 * Rendered; calling a step out of order throws std::logic_error. The axis
 * registry is owned here and handed to each element through its context.
 */
class Builder
{
   public:
    // Throws ConfigError for an empty, reserved or duplicate element id, a
    // boundary key claimed twice, or a dependency on an element that is not
    // declared earlier. `log_id` is the log category of builder-level messages.
    Builder(std::vector<Argument>                 global_arguments,
            std::vector<std::unique_ptr<Element>> elements,
            std::string                           log_id = "builder");
    virtual ~Builder() = default;

    Builder(const Builder&)            = delete;
    Builder& operator=(const Builder&) = delete;

    // Resolve raw boundary values into per-namespace typed parameters.
    // Throws ConfigError for an unrecognized key or an unparseable value.
    void parse_args(const RawParams& raw);

    // Global read step, then every element's read step in declaration order.
    void read_data();

    // Plot step of every enabled element in declaration order, then the
    // global plot step.
    void make_plots(Canvas& canvas);

    void run(const RawParams& raw, Canvas& canvas);

    Phase              phase() const { return phase_; }
    const std::string& log_id() const { return log_id_; }

    // Parameters of "global" or an element id. Throws std::out_of_range.
    const ParamMap&                        params(const std::string& name_space) const;
    const std::map<std::string, ParamMap>& parameters() const { return parameters_; }

    AxisRegistry&       axes() { return axes_; }
    const AxisRegistry& axes() const { return axes_; }
    Axis&               axis(const std::string& name) { return axes_.axis(name); }

    const Element*                               element(const std::string& id) const;
    const std::vector<std::unique_ptr<Element>>& elements() const { return elements_; }
    const std::vector<Argument>&                 global_arguments() const { return global_arguments_; }

    // Every accepted boundary key in declaration order.
    const std::vector<BoundaryArgument>& boundary_arguments() const { return boundary_; }

    // Help text listing every boundary key with its description and default.
    std::string usage(const std::string& program) const;

   protected:
    // Hooks run before the elements' read steps and after their plot steps.
    virtual void read_global(const ParamMap& global, AxisRegistry& axes);
    virtual void plot_global(const ParamMap& global, Canvas& canvas);

   private:
    void require_phase(Phase expected, const char* step) const;
    void register_key(const std::string& key, const std::string& name_space, const Argument& arg);

    std::string                           log_id_;
    std::vector<Argument>                 global_arguments_;
    std::vector<std::unique_ptr<Element>> elements_;
    std::vector<BoundaryArgument>         boundary_;
    std::map<std::string, size_t>         boundary_index_;
    std::map<std::string, ParamMap>       parameters_;
    AxisRegistry                          axes_;
    Phase                                 phase_ = Phase::Constructed;
};

}   // namespace gigmap
