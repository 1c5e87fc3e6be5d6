#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <gigmap/canvas.hpp>
#include <gigmap/elements/annotation.hpp>
#include <gigmap/error.hpp>
#include <gigmap/logger.hpp>
#include <gigmap/table.hpp>
#include <iterator>
#include <limits>
#include <unordered_map>

namespace gigmap
{

namespace
{

std::vector<Argument> annotation_arguments(const std::string& axis_name)
{
    return {
        Argument("csv", "Table of " + axis_name + " annotations (CSV/TSV, optionally gzipped)"),
        Argument("index-col",
                 "Column of the annotation table holding " + axis_name + " ids",
                 ArgType::String,
                 ArgValue{axis_name + "_id"}),
        Argument("label-col", "Column used for " + axis_name + " labels"),
        Argument("max-label-len",
                 "Labels longer than this are truncated",
                 ArgType::Integer,
                 ArgValue{60LL}),
        Argument("order", "File listing " + axis_name + " ids in display order, one per line"),
        Argument("color-col", "Column drawn as a colored strip along the " + axis_name + " axis"),
    };
}

// Cell parses as a finite or missing number.
bool is_numeric_cell(const std::string& cell)
{
    if (cell.empty() || cell == "NA" || cell == "NaN" || cell == "nan")
        return true;
    char*       end = nullptr;
    const char* s   = cell.c_str();
    std::strtod(s, &end);
    return end != s && *end == '\0';
}

double to_number(const std::string& cell)
{
    char*       end = nullptr;
    const char* s   = cell.c_str();
    double      v   = std::strtod(s, &end);
    if (end == s || *end != '\0')
        return std::numeric_limits<double>::quiet_NaN();
    return v;
}

}   // namespace

std::string truncate_label(const std::string& label, size_t max_len)
{
    if (label.size() <= max_len)
        return label;
    return label.substr(0, max_len);
}

AnnotationElement::AnnotationElement(std::string      id,
                                     std::string      axis_name,
                                     StripOrientation orientation,
                                     int              x_index,
                                     int              y_index)
    : Element(std::move(id), annotation_arguments(axis_name)),
      axis_name_(std::move(axis_name)),
      orientation_(orientation),
      x_index_(x_index),
      y_index_(y_index)
{
}

// ─── Read ───────────────────────────────────────────────────────────────────

ReadResult AnnotationElement::read(ReadContext& ctx)
{
    const ParamMap& p   = ctx.params();
    auto            csv = p.get_string("csv");
    if (!csv)
    {
        if (p.has("label-col"))
        {
            GIGMAP_LOG_WARN(id(),
                            "--{}-label-col given without --{}-csv, ignoring",
                            id(),
                            id());
        }
        return ReadResult::disabled("no --" + id() + "-csv given");
    }

    const long long max_len = p.get_int("max-label-len").value_or(60);
    if (max_len < 1)
    {
        throw ConfigError("--" + id() + "-max-label-len must be at least 1, got "
                          + std::to_string(max_len));
    }

    const std::string index_col = *p.get_string("index-col");
    Table             table     = read_table(*csv, index_col);

    const auto& ids = table.row_labels();
    std::unordered_map<std::string, size_t> row_of;
    for (size_t i = 0; i < ids.size(); ++i)
    {
        if (!row_of.emplace(ids[i], i).second)
        {
            throw DataError("Duplicate value '" + ids[i] + "' in column '" + index_col + "' of '"
                            + *csv + "'");
        }
    }

    const std::vector<std::string>* label_cells = nullptr;
    if (auto label_col = p.get_string("label-col"))
        label_cells = &table.column(*label_col);

    // Rows in display order: the order file when given, else table order.
    std::vector<size_t> rows;
    auto                order_path = p.get_string("order");
    if (order_path)
    {
        for (const auto& value : read_lines(*order_path))
        {
            auto it = row_of.find(value);
            if (it == row_of.end())
            {
                throw DataError("Value '" + value + "' from '" + *order_path
                                + "' not found in column '" + index_col + "' of '" + *csv + "'");
            }
            rows.push_back(it->second);
        }
    }
    else
    {
        rows.resize(ids.size());
        for (size_t i = 0; i < rows.size(); ++i)
            rows[i] = i;
    }

    labels_.clear();
    labels_.reserve(rows.size());
    for (size_t r : rows)
    {
        const std::string& raw = label_cells ? (*label_cells)[r] : ids[r];
        labels_.emplace_back(ids[r], truncate_label(raw, static_cast<size_t>(max_len)));
    }

    Axis& axis = ctx.axis(axis_name_);
    axis.set(labels_);

    if (order_path)
    {
        std::vector<std::string> order;
        order.reserve(labels_.size());
        for (const auto& [member, label] : labels_)
            order.push_back(member);
        if (axis.set_order(order, id()))
            axis.fix(id());
    }

    color_col_.clear();
    color_values_.clear();
    if (auto color_col = p.get_string("color-col"))
    {
        const auto& cells = table.column(*color_col);
        color_col_        = *color_col;
        numeric_colors_   = std::all_of(cells.begin(), cells.end(), is_numeric_cell);
        for (size_t r : rows)
            color_values_[ids[r]] = cells[r];
    }

    GIGMAP_LOG_INFO(id(),
                    "read {} {} labels from {}",
                    labels_.size(),
                    axis_name_,
                    *csv);
    return ReadResult::ready();
}

// ─── Plot ───────────────────────────────────────────────────────────────────

void AnnotationElement::plot(PlotContext& ctx)
{
    // Without a color column the element only contributes labels and order.
    if (color_col_.empty())
        return;

    const Axis& axis    = ctx.axis(axis_name_);
    const auto& members = axis.order();
    const auto  labels  = axis.labels();
    const size_t n      = members.size();
    const bool vertical = orientation_ == StripOrientation::Vertical;

    HeatmapTrace strip;
    strip.name = color_col_;
    if (vertical)
    {
        strip.z.resize(static_cast<Eigen::Index>(n), 1);
        strip.y_labels = labels;
        strip.x_labels = {color_col_};
    }
    else
    {
        strip.z.resize(1, static_cast<Eigen::Index>(n));
        strip.x_labels = labels;
        strip.y_labels = {color_col_};
    }

    std::vector<double> values(n, std::numeric_limits<double>::quiet_NaN());
    if (numeric_colors_)
    {
        double lo = std::numeric_limits<double>::infinity();
        double hi = -std::numeric_limits<double>::infinity();
        for (size_t i = 0; i < n; ++i)
        {
            auto it = color_values_.find(members[i]);
            if (it == color_values_.end())
                continue;
            values[i] = to_number(it->second);
            if (std::isfinite(values[i]))
            {
                lo = std::min(lo, values[i]);
                hi = std::max(hi, values[i]);
            }
        }
        strip.colorscale = "viridis";
        strip.zmin       = std::isfinite(lo) ? lo : 0.0;
        strip.zmax       = std::isfinite(hi) ? hi : 1.0;
    }
    else
    {
        // Categories take palette slots in the order they appear on the axis.
        std::unordered_map<std::string, size_t> slot_of;
        for (size_t i = 0; i < n; ++i)
        {
            auto it = color_values_.find(members[i]);
            if (it == color_values_.end() || it->second.empty())
                continue;
            const size_t slot = slot_of.emplace(it->second, slot_of.size()).first->second;
            values[i]         = static_cast<double>(slot % palette::default_cycle_size);
        }
        strip.palette.assign(std::begin(palette::default_cycle), std::end(palette::default_cycle));
        strip.zmin = 0.0;
        strip.zmax = static_cast<double>(palette::default_cycle_size - 1);
    }

    for (size_t i = 0; i < n; ++i)
    {
        if (vertical)
            strip.z(static_cast<Eigen::Index>(i), 0) = values[i];
        else
            strip.z(0, static_cast<Eigen::Index>(i)) = values[i];
    }

    std::vector<double> positions(n);
    for (size_t i = 0; i < n; ++i)
        positions[i] = static_cast<double>(i);

    AxisFormat along;
    along.tickvals = positions;
    along.ticktext = labels;

    AxisFormat across;
    across.tickvals = {0.0};
    across.ticktext = {color_col_};

    Canvas&      canvas = ctx.canvas();
    PanelOptions options;
    if (vertical)
    {
        options.share_y = true;
        options.width   = 0.03;
        options.padding = 0.01;
        across.tick_angle = -90.0f;
        canvas.add(id(), x_index_, y_index_, options);
        canvas.format_axis(id(), AxisDim::X, across);
        canvas.format_axis(id(), AxisDim::Y, along);
    }
    else
    {
        options.share_x = true;
        options.height  = 0.03;
        options.padding = 0.01;
        along.tick_angle = -90.0f;
        canvas.add(id(), x_index_, y_index_, options);
        canvas.format_axis(id(), AxisDim::X, along);
        canvas.format_axis(id(), AxisDim::Y, across);
    }
    canvas.plot(id(), std::move(strip));
}

}   // namespace gigmap
