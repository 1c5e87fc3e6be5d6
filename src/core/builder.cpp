#include <cctype>
#include <gigmap/builder.hpp>
#include <gigmap/canvas.hpp>
#include <gigmap/error.hpp>
#include <gigmap/logger.hpp>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace gigmap
{

const char* phase_name(Phase phase)
{
    switch (phase)
    {
        case Phase::Constructed:
            return "constructed";
        case Phase::ArgumentsParsed:
            return "arguments-parsed";
        case Phase::DataRead:
            return "data-read";
        case Phase::Rendered:
            return "rendered";
    }
    return "unknown";
}

// ─── Construction ───────────────────────────────────────────────────────────

Builder::Builder(std::vector<Argument>                 global_arguments,
                 std::vector<std::unique_ptr<Element>> elements,
                 std::string                           log_id)
    : log_id_(std::move(log_id)),
      global_arguments_(std::move(global_arguments)),
      elements_(std::move(elements))
{
    for (const auto& arg : global_arguments_)
    {
        register_key(arg.key(), global_namespace, arg);
    }

    std::unordered_set<std::string> declared;
    for (const auto& element : elements_)
    {
        if (!element)
        {
            throw ConfigError("null element in builder");
        }
        const std::string& id = element->id();
        if (id.empty())
        {
            throw ConfigError("element id must not be empty");
        }
        for (char c : id)
        {
            if (std::isspace(static_cast<unsigned char>(c)))
            {
                throw ConfigError("element id cannot contain whitespace: '" + id + "'");
            }
        }
        if (id == global_namespace)
        {
            throw ConfigError("element id '" + id + "' is reserved");
        }
        if (declared.count(id) > 0)
        {
            throw ConfigError("duplicate element id '" + id + "'");
        }

        for (const auto& dep : element->depends_on())
        {
            if (declared.count(dep) == 0)
            {
                throw ConfigError("element '" + id + "' depends on '" + dep
                                  + "', which is not declared before it");
            }
        }
        declared.insert(id);

        for (const auto& arg : element->arguments())
        {
            register_key(id + "-" + arg.key(), id, arg);
        }
    }

    GIGMAP_LOG_DEBUG(log_id_,
                     "Builder constructed with {} elements and {} boundary arguments",
                     elements_.size(),
                     boundary_.size());
}

void Builder::register_key(const std::string& key, const std::string& name_space, const Argument& arg)
{
    auto [it, inserted] = boundary_index_.emplace(key, boundary_.size());
    if (!inserted)
    {
        const auto& prior = boundary_[it->second];
        throw ConfigError("argument --" + key + " of '" + name_space + "' collides with --"
                          + prior.key + " of '" + prior.name_space + "'");
    }
    boundary_.push_back({key, name_space, &arg});
}

// ─── Phases ─────────────────────────────────────────────────────────────────

void Builder::require_phase(Phase expected, const char* step) const
{
    if (phase_ != expected)
    {
        throw std::logic_error(std::string(step) + " requires phase '" + phase_name(expected)
                               + "', builder is in phase '" + phase_name(phase_) + "'");
    }
}

void Builder::parse_args(const RawParams& raw)
{
    require_phase(Phase::Constructed, "parse_args");

    std::map<std::string, ParamMap> parsed;
    parsed[global_namespace];
    for (const auto& element : elements_)
        parsed[element->id()];

    for (const auto& [key, value] : raw)
    {
        auto it = boundary_index_.find(key);
        if (it == boundary_index_.end())
        {
            throw ConfigError("unrecognized argument --" + key);
        }
        const auto& b = boundary_[it->second];
        parsed[b.name_space].set(b.argument->key(), b.argument->parse(value, key));
    }

    for (const auto& b : boundary_)
    {
        auto& ns = parsed[b.name_space];
        if (!ns.has(b.argument->key()) && b.argument->default_value())
        {
            ns.set(b.argument->key(), *b.argument->default_value());
        }
    }

    parameters_ = std::move(parsed);
    phase_      = Phase::ArgumentsParsed;
    GIGMAP_LOG_DEBUG(log_id_, "Parsed {} boundary arguments", raw.size());
}

void Builder::read_data()
{
    require_phase(Phase::ArgumentsParsed, "read_data");

    read_global(params(global_namespace), axes_);

    for (const auto& element : elements_)
    {
        GIGMAP_LOG_DEBUG(element->id(), "Reading data");
        ReadContext ctx(*this, *element);
        ReadResult  result = element->read(ctx);
        if (!result.is_ready())
        {
            GIGMAP_LOG_INFO(element->id(), "Disabled: {}", result.reason());
            element->set_disabled(result.reason());
        }
    }

    phase_ = Phase::DataRead;
}

void Builder::make_plots(Canvas& canvas)
{
    require_phase(Phase::DataRead, "make_plots");

    for (const auto& element : elements_)
    {
        if (!element->enabled())
            continue;
        GIGMAP_LOG_DEBUG(element->id(), "Plotting");
        PlotContext ctx(*this, *element, canvas);
        element->plot(ctx);
    }

    plot_global(params(global_namespace), canvas);
    phase_ = Phase::Rendered;
}

void Builder::run(const RawParams& raw, Canvas& canvas)
{
    parse_args(raw);
    read_data();
    make_plots(canvas);
}

void Builder::read_global(const ParamMap&, AxisRegistry&) {}

void Builder::plot_global(const ParamMap&, Canvas&) {}

// ─── Lookup ─────────────────────────────────────────────────────────────────

const ParamMap& Builder::params(const std::string& name_space) const
{
    auto it = parameters_.find(name_space);
    if (it == parameters_.end())
    {
        throw std::out_of_range("no parameters for namespace '" + name_space + "'");
    }
    return it->second;
}

const Element* Builder::element(const std::string& id) const
{
    for (const auto& element : elements_)
    {
        if (element->id() == id)
            return element.get();
    }
    return nullptr;
}

std::string Builder::usage(const std::string& program) const
{
    std::ostringstream out;
    out << "Usage: " << program << " [--key value]...\n";

    std::string current;
    bool        first = true;
    for (const auto& b : boundary_)
    {
        if (first || b.name_space != current)
        {
            current = b.name_space;
            first   = false;
            out << "\n"
                << (current == global_namespace ? std::string("Global") : "Element '" + current + "'")
                << " arguments:\n";
        }
        out << "  --" << b.key << " <" << arg_type_name(b.argument->type()) << ">\n      "
            << b.argument->description();
        if (b.argument->default_value())
        {
            out << " (default: " << arg_value_to_string(*b.argument->default_value()) << ")";
        }
        out << "\n";
    }
    return out.str();
}

}   // namespace gigmap
