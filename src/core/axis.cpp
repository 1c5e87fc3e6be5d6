#include <gigmap/axis.hpp>
#include <gigmap/error.hpp>
#include <gigmap/logger.hpp>
#include <stdexcept>

namespace gigmap
{

Axis::Axis(std::string name) : name_(std::move(name)) {}

void Axis::append_member(const std::string& id)
{
    if (known_.insert(id).second)
    {
        order_.push_back(id);
    }
}

void Axis::set(const LabelSeries& series)
{
    if (!exists_)
    {
        for (const auto& [id, label] : series)
        {
            if (known_.count(id) > 0)
            {
                throw DataError("duplicate id '" + id + "' supplied for axis '" + name_ + "'");
            }
            append_member(id);
            label_of_[id] = label;
        }
        exists_ = true;
        GIGMAP_LOG_DEBUG("axis", "Axis '{}' initialized with {} members", name_, order_.size());
        return;
    }

    size_t added = 0;
    for (const auto& [id, label] : series)
    {
        label_of_[id] = label;
        if (known_.count(id) > 0)
            continue;
        if (fixed_)
        {
            // Known for labelling only; the fixed order stays as it is.
            known_.insert(id);
            continue;
        }
        append_member(id);
        ++added;
    }
    GIGMAP_LOG_DEBUG("axis", "Axis '{}' extended by {} members ({} total)", name_, added, order_.size());
}

void Axis::extend(const std::vector<std::string>& ids)
{
    if (fixed_)
    {
        GIGMAP_LOG_DEBUG("axis", "Axis '{}' is fixed, not extending membership", name_);
        return;
    }
    for (const auto& id : ids)
    {
        append_member(id);
    }
    exists_ = exists_ || !ids.empty();
}

bool Axis::set_order(const std::vector<std::string>& order, std::string_view writer)
{
    if (fixed_)
    {
        GIGMAP_LOG_WARN(writer,
                        "Ignoring order for axis '{}': already fixed by '{}'",
                        name_,
                        fixed_by_);
        return false;
    }

    std::unordered_set<std::string> seen;
    seen.reserve(order.size());
    for (const auto& id : order)
    {
        if (!seen.insert(id).second)
        {
            throw DataError("order for axis '" + name_ + "' from '" + std::string(writer)
                            + "' repeats id '" + id + "'");
        }
        if (exists_ && known_.count(id) == 0)
        {
            throw DataError("order for axis '" + name_ + "' from '" + std::string(writer)
                            + "' contains unknown id '" + id + "'");
        }
    }

    if (!exists_)
    {
        known_.insert(order.begin(), order.end());
        exists_ = true;
    }
    order_ = order;
    GIGMAP_LOG_DEBUG(writer, "Ordered axis '{}' ({} members)", name_, order_.size());
    return true;
}

bool Axis::fix(std::string_view writer)
{
    if (!exists_)
    {
        throw std::logic_error("cannot fix axis '" + name_ + "' before it has members");
    }
    if (fixed_)
    {
        if (fixed_by_ != writer)
        {
            GIGMAP_LOG_WARN(writer,
                            "Axis '{}' already fixed by '{}', ignoring fix",
                            name_,
                            fixed_by_);
            return false;
        }
        return true;
    }
    fixed_    = true;
    fixed_by_ = std::string(writer);
    GIGMAP_LOG_INFO(writer, "Fixed order of axis '{}'", name_);
    return true;
}

bool Axis::contains(const std::string& id) const
{
    for (const auto& member : order_)
    {
        if (member == id)
            return true;
    }
    return false;
}

bool Axis::is_known(const std::string& id) const
{
    return known_.count(id) > 0;
}

std::unordered_set<std::string> Axis::member_set() const
{
    return {order_.begin(), order_.end()};
}

std::string Axis::label(const std::string& id) const
{
    auto it = label_of_.find(id);
    return it != label_of_.end() ? it->second : id;
}

std::vector<std::string> Axis::labels() const
{
    std::vector<std::string> out;
    out.reserve(order_.size());
    for (const auto& id : order_)
    {
        out.push_back(label(id));
    }
    return out;
}

}   // namespace gigmap
