#include <algorithm>
#include <cmath>
#include <cstdio>
#include <gigmap/error.hpp>
#include <gigmap/logger.hpp>
#include <gigmap/nj_tree.hpp>
#include <limits>
#include <unordered_set>

namespace gigmap
{

namespace
{

constexpr double nan_value = std::numeric_limits<double>::quiet_NaN();

std::string branch_text(const TreeLayout::Node& node)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.4g", node.length);
    if (node.name.empty())
        return std::string("branch length: ") + buf;
    return node.name + " (" + buf + ")";
}

}   // namespace

// ─── TreeLayout ─────────────────────────────────────────────────────────────

TreeLayout::TreeLayout(std::vector<Node> nodes, size_t root) : nodes_(std::move(nodes)), root_(root)
{
    layout();
}

void TreeLayout::layout()
{
    // Pre-order walk: x from branch lengths, leaves numbered in visit order.
    std::vector<size_t> preorder;
    preorder.reserve(nodes_.size());
    std::vector<size_t> stack{root_};
    while (!stack.empty())
    {
        size_t id = stack.back();
        stack.pop_back();
        preorder.push_back(id);

        auto& node = nodes_[id];
        if (node.parent >= 0)
            node.x = nodes_[static_cast<size_t>(node.parent)].x + node.length;
        else
            node.x = 0.0;

        for (auto it = node.children.rbegin(); it != node.children.rend(); ++it)
            stack.push_back(*it);
    }

    leaf_order_.clear();
    for (size_t id : preorder)
    {
        auto& node = nodes_[id];
        if (node.children.empty())
        {
            node.y = static_cast<double>(leaf_order_.size());
            leaf_order_.push_back(node.name);
        }
        max_x_ = std::max(max_x_, node.x);
    }

    // Internal nodes centre on the span of their children.
    for (auto it = preorder.rbegin(); it != preorder.rend(); ++it)
    {
        auto& node = nodes_[*it];
        if (node.children.empty())
            continue;
        double lo = std::numeric_limits<double>::infinity();
        double hi = -std::numeric_limits<double>::infinity();
        for (size_t c : node.children)
        {
            lo = std::min(lo, nodes_[c].y);
            hi = std::max(hi, nodes_[c].y);
        }
        node.y = (lo + hi) * 0.5;
    }

    auto segment = [&](double x0, double y0, double x1, double y1, const std::string& label)
    {
        x_.insert(x_.end(), {x0, x1, nan_value});
        y_.insert(y_.end(), {y0, y1, nan_value});
        text_.insert(text_.end(), {label, label, std::string()});
    };

    for (size_t id : preorder)
    {
        const auto& node = nodes_[id];
        if (node.children.empty())
            continue;

        double lo = std::numeric_limits<double>::infinity();
        double hi = -std::numeric_limits<double>::infinity();
        for (size_t c : node.children)
        {
            const auto& child = nodes_[c];
            lo                = std::min(lo, child.y);
            hi                = std::max(hi, child.y);
            segment(node.x, child.y, child.x, child.y, branch_text(child));
        }
        segment(node.x, lo, node.x, hi, std::string());
    }

    for (size_t id : preorder)
    {
        const auto& node = nodes_[id];
        if (!node.children.empty() || node.x >= max_x_)
            continue;
        ext_x_.insert(ext_x_.end(), {node.x, max_x_, nan_value});
        ext_y_.insert(ext_y_.end(), {node.y, node.y, nan_value});
    }
}

// ─── Neighbor joining ───────────────────────────────────────────────────────

TreeLayout make_nj_tree(const std::vector<std::string>& ids, const LabelledMatrix& distances)
{
    const size_t n = ids.size();
    if (n < 2)
    {
        throw DataError("cannot build a tree from " + std::to_string(n)
                        + " genomes: at least two are required");
    }
    std::unordered_set<std::string> unique(ids.begin(), ids.end());
    if (unique.size() != n)
    {
        throw DataError("tree ids must be unique");
    }
    for (const auto& id : ids)
    {
        if (!distances.row_position(id) || !distances.col_position(id))
        {
            throw DataError("distance matrix has no row and column for '" + id + "'");
        }
    }

    const LabelledMatrix sub = distances.subset(ids, ids);

    // Working distances between active clusters, symmetrised.
    std::vector<std::vector<double>> d(n, std::vector<double>(n, 0.0));
    for (size_t i = 0; i < n; ++i)
    {
        for (size_t j = 0; j < n; ++j)
        {
            if (i == j)
                continue;
            double a = sub.values(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));
            double b = sub.values(static_cast<Eigen::Index>(j), static_cast<Eigen::Index>(i));
            if (std::isnan(a) || std::isnan(b))
            {
                throw DataError("missing distance between '" + ids[i] + "' and '" + ids[j] + "'");
            }
            d[i][j] = (a + b) * 0.5;
        }
    }

    std::vector<TreeLayout::Node> nodes(n);
    for (size_t i = 0; i < n; ++i)
        nodes[i].name = ids[i];

    // active[k] is the node id held in working slot k.
    std::vector<size_t> active(n);
    for (size_t i = 0; i < n; ++i)
        active[i] = i;

    auto attach = [&](size_t parent, size_t child, double length)
    {
        nodes[child].parent = static_cast<int>(parent);
        nodes[child].length = std::max(0.0, length);
        nodes[parent].children.push_back(child);
    };

    while (active.size() > 3)
    {
        const size_t        r = active.size();
        std::vector<double> row_sum(r, 0.0);
        for (size_t i = 0; i < r; ++i)
        {
            for (size_t j = 0; j < r; ++j)
                row_sum[i] += d[i][j];
        }

        // Minimise Q; the first pair found wins ties.
        size_t best_i = 0;
        size_t best_j = 1;
        double best_q = std::numeric_limits<double>::infinity();
        for (size_t i = 0; i < r; ++i)
        {
            for (size_t j = i + 1; j < r; ++j)
            {
                double q = static_cast<double>(r - 2) * d[i][j] - row_sum[i] - row_sum[j];
                if (q < best_q)
                {
                    best_q = q;
                    best_i = i;
                    best_j = j;
                }
            }
        }

        const double dij = d[best_i][best_j];
        const double li  = dij * 0.5 + (row_sum[best_i] - row_sum[best_j]) / (2.0 * static_cast<double>(r - 2));
        const double lj  = dij - li;

        const size_t u = nodes.size();
        nodes.emplace_back();
        attach(u, active[best_i], li);
        attach(u, active[best_j], lj);

        // Slot best_i becomes the new cluster; slot best_j is removed.
        std::vector<double> du(r, 0.0);
        for (size_t k = 0; k < r; ++k)
        {
            if (k == best_i || k == best_j)
                continue;
            du[k] = (d[best_i][k] + d[best_j][k] - dij) * 0.5;
        }
        for (size_t k = 0; k < r; ++k)
        {
            d[best_i][k] = du[k];
            d[k][best_i] = du[k];
        }
        d[best_i][best_i] = 0.0;
        active[best_i]    = u;

        d.erase(d.begin() + static_cast<std::ptrdiff_t>(best_j));
        for (auto& row : d)
            row.erase(row.begin() + static_cast<std::ptrdiff_t>(best_j));
        active.erase(active.begin() + static_cast<std::ptrdiff_t>(best_j));
    }

    const size_t root = nodes.size();
    nodes.emplace_back();
    if (active.size() == 2)
    {
        attach(root, active[0], d[0][1] * 0.5);
        attach(root, active[1], d[0][1] * 0.5);
    }
    else
    {
        attach(root, active[0], (d[0][1] + d[0][2] - d[1][2]) * 0.5);
        attach(root, active[1], (d[0][1] + d[1][2] - d[0][2]) * 0.5);
        attach(root, active[2], (d[0][2] + d[1][2] - d[0][1]) * 0.5);
    }

    GIGMAP_LOG_DEBUG("tree", "Built neighbor-joining tree over {} leaves ({} nodes)", n, nodes.size());
    return TreeLayout(std::move(nodes), root);
}

}   // namespace gigmap
