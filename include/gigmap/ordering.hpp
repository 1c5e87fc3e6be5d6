#pragma once

#include <cstddef>
#include <eigen3/Eigen/Core>
#include <gigmap/labelled_matrix.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gigmap
{

enum class LinkageMethod
{
    Ward,
    Single,
    Complete,
    Average,
};

enum class DistanceMetric
{
    Euclidean,
    Cityblock,
    Cosine,
};

std::optional<LinkageMethod>  parse_linkage_method(std::string_view name);
std::optional<DistanceMetric> parse_distance_metric(std::string_view name);
const char*                   linkage_method_name(LinkageMethod method);
const char*                   distance_metric_name(DistanceMetric metric);

// One agglomeration step. Leaves are 0..n-1; the cluster formed by step i is
// n + i. left < right.
struct LinkageStep
{
    size_t left     = 0;
    size_t right    = 0;
    double distance = 0.0;
    size_t size     = 0;
};

using Linkage = std::vector<LinkageStep>;

struct OrderingOptions
{
    LinkageMethod  method  = LinkageMethod::Ward;
    DistanceMetric metric  = DistanceMetric::Euclidean;
    bool           optimal = true;
};

// Condensed pairwise distances between the rows of `data`, as a symmetric
// n x n matrix with a zero diagonal.
Eigen::MatrixXd pairwise_distances(const Eigen::MatrixXd& data, DistanceMetric metric);

// Agglomerative clustering of a square distance matrix. Steps are sorted by
// merge distance. Throws std::invalid_argument for fewer than two points or
// a non-square matrix.
Linkage linkage(const Eigen::MatrixXd& distances, LinkageMethod method);

// Left-to-right leaf order of the dendrogram as built.
std::vector<size_t> leaves_list(const Linkage& steps);

// Leaf order that flips subtrees to minimise the summed distance between
// adjacent leaves (Bar-Joseph, Gifford and Jaakkola, 2001).
std::vector<size_t> optimal_leaf_order(const Linkage& steps, const Eigen::MatrixXd& distances);

// Row order grouping similar rows. Deterministic for identical input.
// Throws DataError for fewer than two rows and std::invalid_argument for
// Ward linkage with a non-Euclidean metric.
std::vector<size_t> order_rows(const Eigen::MatrixXd& data, const OrderingOptions& options = {});

// Row labels of `matrix` in clustered order. NaN cells count as zero.
std::vector<std::string> order_by_linkage(const LabelledMatrix&  matrix,
                                          const OrderingOptions& options = {});

}   // namespace gigmap
