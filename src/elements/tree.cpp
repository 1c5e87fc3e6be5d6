#include <gigmap/canvas.hpp>
#include <gigmap/elements/tree.hpp>
#include <gigmap/error.hpp>
#include <gigmap/logger.hpp>
#include <gigmap/table.hpp>
#include <utility>

namespace gigmap
{

TreeElement::TreeElement(std::string id, std::string axis_name, int x_index, int y_index)
    : Element(std::move(id),
              {Argument("distmat",
                        "Square table of pairwise " + axis_name
                            + " distances, first column holding the ids")}),
      axis_name_(std::move(axis_name)),
      x_index_(x_index),
      y_index_(y_index)
{
}

ReadResult TreeElement::read(ReadContext& ctx)
{
    auto distmat = ctx.params().get_string("distmat");
    if (!distmat)
        return ReadResult::disabled("no --" + id() + "-distmat given");

    Axis& axis = ctx.axis(axis_name_);
    if (axis.is_fixed())
    {
        GIGMAP_LOG_WARN(id(),
                        "{} order already fixed by '{}', the tree cannot be drawn against it",
                        axis_name_,
                        axis.fixed_by());
        return ReadResult::disabled(axis_name_ + " order fixed by '" + axis.fixed_by() + "'");
    }

    LabelledMatrix distances = numeric_matrix(read_table_indexed(*distmat));

    std::vector<std::string> ids;
    if (axis.exists())
    {
        const auto members = axis.member_set();
        for (const auto& label : distances.row_labels)
        {
            if (members.count(label) > 0)
                ids.push_back(label);
        }
    }
    else
    {
        ids = distances.row_labels;
    }

    if (ids.size() < 2)
    {
        throw DataError("'" + *distmat + "' shares fewer than two " + axis_name_
                        + " ids with the " + axis_name_ + " axis");
    }

    tree_ = make_nj_tree(ids, distances);

    axis.set_order(tree_->leaf_order(), id());
    axis.fix(id());

    GIGMAP_LOG_INFO(id(), "built tree over {} {}s", ids.size(), axis_name_);
    return ReadResult::ready();
}

void TreeElement::plot(PlotContext& ctx)
{
    const Axis& axis = ctx.axis(axis_name_);
    Canvas&     canvas = ctx.canvas();

    PanelOptions options;
    options.share_y = true;
    canvas.add(id(), x_index_, y_index_, options);

    LineTrace branches;
    branches.name  = id();
    branches.x     = tree_->x_coords();
    branches.y     = tree_->y_coords();
    branches.text  = tree_->text();
    branches.color = colors::black;
    canvas.plot(id(), std::move(branches));

    LineTrace guides;
    guides.name  = id() + "-extensions";
    guides.x     = tree_->extension_x_coords();
    guides.y     = tree_->extension_y_coords();
    guides.color = colors::black;
    guides.width = 1.0f;
    guides.dash  = LineDash::Dot;
    canvas.plot(id(), std::move(guides));

    // A tree of zero-length branches still gets a drawable range.
    const double span = tree_->max_x() > 0.0 ? tree_->max_x() : 1.0;
    AxisFormat   x_format;
    x_format.range = std::make_pair(-0.025 * span, 1.025 * span);
    canvas.format_axis(id(), AxisDim::X, x_format);

    AxisFormat y_format;
    for (size_t i = 0; i < axis.length(); ++i)
        y_format.tickvals.push_back(static_cast<double>(i));
    y_format.ticktext = axis.labels();
    canvas.format_axis(id(), AxisDim::Y, y_format);
    canvas.anchor_yaxis(y_index_, Side::Right);
}

}   // namespace gigmap
