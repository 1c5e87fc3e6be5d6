#include <algorithm>
#include <cctype>
#include <cmath>
#include <gigmap/error.hpp>
#include <gigmap/logger.hpp>
#include <gigmap/ordering.hpp>
#include <limits>
#include <stdexcept>
#include <utility>

namespace gigmap
{

namespace
{

std::string lowercase(std::string_view s)
{
    std::string out(s);
    for (auto& c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

// Distance from cluster k to the union of clusters i and j.
double lance_williams(LinkageMethod method,
                      double        d_ki,
                      double        d_kj,
                      double        d_ij,
                      double        n_i,
                      double        n_j,
                      double        n_k)
{
    switch (method)
    {
        case LinkageMethod::Single:
            return std::min(d_ki, d_kj);
        case LinkageMethod::Complete:
            return std::max(d_ki, d_kj);
        case LinkageMethod::Average:
            return (n_i * d_ki + n_j * d_kj) / (n_i + n_j);
        case LinkageMethod::Ward:
        {
            double t = n_i + n_j + n_k;
            double v = ((n_i + n_k) * d_ki * d_ki + (n_j + n_k) * d_kj * d_kj - n_k * d_ij * d_ij) / t;
            return std::sqrt(std::max(0.0, v));
        }
    }
    return d_ki;
}

struct RawMerge
{
    size_t a;
    size_t b;
    double distance;
};

// Maps leaf representatives to cluster labels n, n+1, ... as merges happen.
class UnionFind
{
   public:
    explicit UnionFind(size_t n) : parent_(2 * n - 1), size_(2 * n - 1, 1), next_(n)
    {
        for (size_t i = 0; i < parent_.size(); ++i)
            parent_[i] = i;
    }

    size_t find(size_t x)
    {
        size_t root = x;
        while (parent_[root] != root)
            root = parent_[root];
        while (parent_[x] != root)
        {
            size_t next = parent_[x];
            parent_[x]  = root;
            x           = next;
        }
        return root;
    }

    size_t merge(size_t x, size_t y)
    {
        parent_[x]   = next_;
        parent_[y]   = next_;
        size_[next_] = size_[x] + size_[y];
        return size_[next_++];
    }

   private:
    std::vector<size_t> parent_;
    std::vector<size_t> size_;
    size_t              next_;
};

// Leaf order of the dendrogram plus the contiguous span each node covers.
struct Spans
{
    std::vector<size_t> order;
    std::vector<size_t> position;   // leaf -> index in order
    std::vector<size_t> begin;      // node -> first index in order
    std::vector<size_t> end;        // node -> one past last index
};

Spans compute_spans(const Linkage& steps)
{
    const size_t n = steps.size() + 1;
    Spans        s;
    s.order = leaves_list(steps);
    s.position.resize(n);
    for (size_t i = 0; i < n; ++i)
        s.position[s.order[i]] = i;

    s.begin.resize(2 * n - 1);
    s.end.resize(2 * n - 1);
    for (size_t leaf = 0; leaf < n; ++leaf)
    {
        s.begin[leaf] = s.position[leaf];
        s.end[leaf]   = s.position[leaf] + 1;
    }
    // Children always carry smaller ids than their parent.
    for (size_t i = 0; i < steps.size(); ++i)
    {
        const size_t node = n + i;
        s.begin[node]     = std::min(s.begin[steps[i].left], s.begin[steps[i].right]);
        s.end[node]       = std::max(s.end[steps[i].left], s.end[steps[i].right]);
    }
    return s;
}

}   // namespace

// ─── Names ──────────────────────────────────────────────────────────────────

std::optional<LinkageMethod> parse_linkage_method(std::string_view name)
{
    const std::string s = lowercase(name);
    if (s == "ward")
        return LinkageMethod::Ward;
    if (s == "single")
        return LinkageMethod::Single;
    if (s == "complete")
        return LinkageMethod::Complete;
    if (s == "average")
        return LinkageMethod::Average;
    return std::nullopt;
}

std::optional<DistanceMetric> parse_distance_metric(std::string_view name)
{
    const std::string s = lowercase(name);
    if (s == "euclidean")
        return DistanceMetric::Euclidean;
    if (s == "cityblock" || s == "manhattan")
        return DistanceMetric::Cityblock;
    if (s == "cosine")
        return DistanceMetric::Cosine;
    return std::nullopt;
}

const char* linkage_method_name(LinkageMethod method)
{
    switch (method)
    {
        case LinkageMethod::Ward:
            return "ward";
        case LinkageMethod::Single:
            return "single";
        case LinkageMethod::Complete:
            return "complete";
        case LinkageMethod::Average:
            return "average";
    }
    return "unknown";
}

const char* distance_metric_name(DistanceMetric metric)
{
    switch (metric)
    {
        case DistanceMetric::Euclidean:
            return "euclidean";
        case DistanceMetric::Cityblock:
            return "cityblock";
        case DistanceMetric::Cosine:
            return "cosine";
    }
    return "unknown";
}

// ─── Distances ──────────────────────────────────────────────────────────────

Eigen::MatrixXd pairwise_distances(const Eigen::MatrixXd& data, DistanceMetric metric)
{
    const Eigen::Index n = data.rows();
    Eigen::MatrixXd    d = Eigen::MatrixXd::Zero(n, n);

    Eigen::VectorXd norms;
    if (metric == DistanceMetric::Cosine)
        norms = data.rowwise().norm();

    for (Eigen::Index i = 0; i < n; ++i)
    {
        for (Eigen::Index j = i + 1; j < n; ++j)
        {
            double v = 0.0;
            switch (metric)
            {
                case DistanceMetric::Euclidean:
                    v = (data.row(i) - data.row(j)).norm();
                    break;
                case DistanceMetric::Cityblock:
                    v = (data.row(i) - data.row(j)).cwiseAbs().sum();
                    break;
                case DistanceMetric::Cosine:
                    if (norms(i) == 0.0 || norms(j) == 0.0)
                        v = (norms(i) == 0.0 && norms(j) == 0.0) ? 0.0 : 1.0;
                    else
                        v = std::max(0.0, 1.0 - data.row(i).dot(data.row(j)) / (norms(i) * norms(j)));
                    break;
            }
            d(i, j) = v;
            d(j, i) = v;
        }
    }
    return d;
}

// ─── Agglomeration ──────────────────────────────────────────────────────────

Linkage linkage(const Eigen::MatrixXd& distances, LinkageMethod method)
{
    if (distances.rows() != distances.cols())
    {
        throw std::invalid_argument("linkage requires a square distance matrix");
    }
    const size_t n = static_cast<size_t>(distances.rows());
    if (n < 2)
    {
        throw std::invalid_argument("linkage requires at least two points");
    }

    Eigen::MatrixXd     d = distances;
    std::vector<double> size(n, 1.0);
    std::vector<bool>   active(n, true);
    std::vector<size_t> chain;
    std::vector<RawMerge> merges;
    merges.reserve(n - 1);

    // Nearest-neighbour chain: follow nearest neighbours until two clusters
    // are each other's nearest, then merge them.
    for (size_t step = 0; step < n - 1; ++step)
    {
        if (chain.empty())
        {
            for (size_t i = 0; i < n; ++i)
            {
                if (active[i])
                {
                    chain.push_back(i);
                    break;
                }
            }
        }

        size_t x       = 0;
        size_t y       = 0;
        double current = 0.0;
        while (true)
        {
            x = chain.back();

            size_t best_i = n;
            double best   = std::numeric_limits<double>::infinity();
            // The previous chain element wins ties so the chain cannot cycle.
            if (chain.size() > 1)
            {
                best_i = chain[chain.size() - 2];
                best   = d(static_cast<Eigen::Index>(x), static_cast<Eigen::Index>(best_i));
            }
            for (size_t i = 0; i < n; ++i)
            {
                if (!active[i] || i == x)
                    continue;
                double v = d(static_cast<Eigen::Index>(x), static_cast<Eigen::Index>(i));
                if (v < best || best_i == n)
                {
                    best   = v;
                    best_i = i;
                }
            }

            if (chain.size() > 1 && best_i == chain[chain.size() - 2])
            {
                y       = best_i;
                current = best;
                break;
            }
            chain.push_back(best_i);
        }

        chain.pop_back();
        chain.pop_back();
        if (x > y)
            std::swap(x, y);
        merges.push_back({x, y, current});

        // The merged cluster lives on in slot y.
        const double nx = size[x];
        const double ny = size[y];
        const auto   ex = static_cast<Eigen::Index>(x);
        const auto   ey = static_cast<Eigen::Index>(y);
        for (size_t k = 0; k < n; ++k)
        {
            if (!active[k] || k == x || k == y)
                continue;
            const auto ek = static_cast<Eigen::Index>(k);
            double     v  = lance_williams(method, d(ek, ex), d(ek, ey), current, nx, ny, size[k]);
            d(ek, ey)     = v;
            d(ey, ek)     = v;
        }
        active[x] = false;
        size[y]   = nx + ny;
    }

    std::stable_sort(merges.begin(),
                     merges.end(),
                     [](const RawMerge& a, const RawMerge& b) { return a.distance < b.distance; });

    UnionFind uf(n);
    Linkage   steps;
    steps.reserve(merges.size());
    for (const auto& m : merges)
    {
        size_t a = uf.find(m.a);
        size_t b = uf.find(m.b);
        if (a > b)
            std::swap(a, b);
        size_t merged_size = uf.merge(a, b);
        steps.push_back({a, b, m.distance, merged_size});
    }
    return steps;
}

std::vector<size_t> leaves_list(const Linkage& steps)
{
    const size_t        n = steps.size() + 1;
    std::vector<size_t> out;
    out.reserve(n);
    if (steps.empty())
    {
        out.push_back(0);
        return out;
    }

    std::vector<size_t> stack{2 * n - 2};
    while (!stack.empty())
    {
        size_t node = stack.back();
        stack.pop_back();
        if (node < n)
        {
            out.push_back(node);
            continue;
        }
        const auto& s = steps[node - n];
        stack.push_back(s.right);
        stack.push_back(s.left);
    }
    return out;
}

// ─── Optimal leaf ordering ──────────────────────────────────────────────────

std::vector<size_t> optimal_leaf_order(const Linkage& steps, const Eigen::MatrixXd& distances)
{
    if (steps.empty())
        return {0};

    const size_t n = steps.size() + 1;
    if (static_cast<size_t>(distances.rows()) != n || static_cast<size_t>(distances.cols()) != n)
    {
        throw std::invalid_argument("distance matrix does not match the linkage");
    }

    const Spans s = compute_spans(steps);

    auto leaf_range = [&](size_t node)
    { return std::make_pair(s.begin[node], s.end[node]); };
    auto contains = [&](size_t node, size_t leaf)
    { return s.position[leaf] >= s.begin[node] && s.position[leaf] < s.end[node]; };
    // Leaves an outer end may pair with: the sibling subtree of the one
    // holding `leaf`, or the leaf itself for a single-leaf node.
    auto inner_candidates = [&](size_t node, size_t leaf)
    {
        if (node < n)
            return std::make_pair(s.position[leaf], s.position[leaf] + 1);
        const auto& st = steps[node - n];
        return contains(st.left, leaf) ? leaf_range(st.right) : leaf_range(st.left);
    };

    auto D = [&](size_t i, size_t j)
    { return distances(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)); };

    // M(u, w): cost of the best ordering of LCA(u, w) that starts at u and ends at w.
    Eigen::MatrixXd M = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(n));
    auto            Mv = [&](size_t i, size_t j) -> double&
    { return M(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)); };

    std::vector<double> t;
    for (size_t i = 0; i < steps.size(); ++i)
    {
        const size_t a = steps[i].left;
        const size_t b = steps[i].right;
        const auto [a_begin, a_end] = leaf_range(a);
        const auto [b_begin, b_end] = leaf_range(b);

        t.assign(a_end - a_begin, 0.0);
        for (size_t wi = b_begin; wi < b_end; ++wi)
        {
            const size_t w              = s.order[wi];
            const auto [k_begin, k_end] = inner_candidates(b, w);

            // t[m] = min over k of D(m, k) + M(k, w)
            for (size_t mi = a_begin; mi < a_end; ++mi)
            {
                const size_t m    = s.order[mi];
                double       best = std::numeric_limits<double>::infinity();
                for (size_t ki = k_begin; ki < k_end; ++ki)
                {
                    const size_t k = s.order[ki];
                    best           = std::min(best, D(m, k) + Mv(k, w));
                }
                t[mi - a_begin] = best;
            }

            for (size_t ui = a_begin; ui < a_end; ++ui)
            {
                const size_t u              = s.order[ui];
                const auto [m_begin, m_end] = inner_candidates(a, u);
                double       best           = std::numeric_limits<double>::infinity();
                for (size_t mi = m_begin; mi < m_end; ++mi)
                {
                    const size_t m = s.order[mi];
                    best           = std::min(best, Mv(u, m) + t[mi - a_begin]);
                }
                Mv(u, w) = best;
                Mv(w, u) = best;
            }
        }
    }

    // Outer ends of the root
    const size_t root = 2 * n - 2;
    const auto   [ra_begin, ra_end] = leaf_range(steps.back().left);
    const auto   [rb_begin, rb_end] = leaf_range(steps.back().right);
    size_t       best_u = s.order[ra_begin];
    size_t       best_w = s.order[rb_begin];
    double       best   = std::numeric_limits<double>::infinity();
    for (size_t ui = ra_begin; ui < ra_end; ++ui)
    {
        for (size_t wi = rb_begin; wi < rb_end; ++wi)
        {
            double v = Mv(s.order[ui], s.order[wi]);
            if (v < best)
            {
                best   = v;
                best_u = s.order[ui];
                best_w = s.order[wi];
            }
        }
    }

    // Walk back down, recovering the inner ends chosen at each node.
    struct Task
    {
        size_t node;
        size_t u;
        size_t w;
    };
    std::vector<size_t> order;
    order.reserve(n);
    std::vector<Task> stack{{root, best_u, best_w}};
    while (!stack.empty())
    {
        Task task = stack.back();
        stack.pop_back();
        if (task.node < n)
        {
            order.push_back(task.u);
            continue;
        }

        size_t a = steps[task.node - n].left;
        size_t b = steps[task.node - n].right;
        if (!contains(a, task.u))
            std::swap(a, b);

        const auto [m_begin, m_end] = inner_candidates(a, task.u);
        const auto [k_begin, k_end] = inner_candidates(b, task.w);
        size_t     best_m           = s.order[m_begin];
        size_t     best_k           = s.order[k_begin];
        double     cost             = std::numeric_limits<double>::infinity();
        for (size_t mi = m_begin; mi < m_end; ++mi)
        {
            const size_t m = s.order[mi];
            for (size_t ki = k_begin; ki < k_end; ++ki)
            {
                const size_t k = s.order[ki];
                double       v = Mv(task.u, m) + D(m, k) + Mv(k, task.w);
                if (v < cost)
                {
                    cost   = v;
                    best_m = m;
                    best_k = k;
                }
            }
        }
        stack.push_back({b, best_k, task.w});
        stack.push_back({a, task.u, best_m});
    }
    return order;
}

// ─── Entry points ───────────────────────────────────────────────────────────

std::vector<size_t> order_rows(const Eigen::MatrixXd& data, const OrderingOptions& options)
{
    if (data.rows() < 2)
    {
        throw DataError("cannot order " + std::to_string(data.rows())
                        + " rows: clustering needs at least two");
    }
    if (options.method == LinkageMethod::Ward && options.metric != DistanceMetric::Euclidean)
    {
        throw std::invalid_argument(std::string("ward linkage requires euclidean distances, not ")
                                    + distance_metric_name(options.metric));
    }

    Eigen::MatrixXd dist  = pairwise_distances(data, options.metric);
    Linkage         steps = linkage(dist, options.method);
    return options.optimal ? optimal_leaf_order(steps, dist) : leaves_list(steps);
}

std::vector<std::string> order_by_linkage(const LabelledMatrix& matrix, const OrderingOptions& options)
{
    GIGMAP_LOG_INFO("ordering",
                    "Ordering {} rows by {} linkage and {} distances",
                    matrix.rows(),
                    linkage_method_name(options.method),
                    distance_metric_name(options.metric));

    Eigen::MatrixXd data = matrix.values.unaryExpr([](double v) { return std::isnan(v) ? 0.0 : v; });

    std::vector<std::string> out;
    out.reserve(matrix.rows());
    for (size_t i : order_rows(data, options))
        out.push_back(matrix.row_labels[i]);
    return out;
}

}   // namespace gigmap
