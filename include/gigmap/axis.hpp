#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace gigmap
{

// Member id -> display label, in the writer's order.
using LabelSeries = std::vector<std::pair<std::string, std::string>>;

/**
 * Axis — a named categorical dimension shared by every panel ("gene", "genome").
 *
 * State only advances: unset -> set (exists) -> fixed. Once fixed, the order
 * belongs to the writer that fixed it and every later set_order() is refused.
 * Labels may still be updated; an id without a label displays as itself.
 */
class Axis
{
   public:
    explicit Axis(std::string name);

    const std::string& name() const { return name_; }
    bool               exists() const { return exists_; }
    bool               is_fixed() const { return fixed_; }
    // Id of the writer that fixed the axis, empty while unfixed.
    const std::string& fixed_by() const { return fixed_by_; }

    // First call initializes order and labels from the series. Later calls
    // overwrite labels of known ids and append new ids to the end of the
    // order; on a fixed axis the order is left untouched.
    void set(const LabelSeries& series);

    // Append ids not yet on the axis with identity labels. No-op once fixed.
    void extend(const std::vector<std::string>& ids);

    // Replace the order with a permutation or subset of the known members.
    // Returns false (and logs) when the axis is fixed. On an axis that does
    // not exist yet the sequence also defines membership. Throws DataError
    // for duplicate or unknown ids.
    bool set_order(const std::vector<std::string>& order, std::string_view writer);

    // Mark the current order authoritative. The first writer wins; later
    // calls from other writers are ignored and return false.
    bool fix(std::string_view writer);

    const std::vector<std::string>& order() const { return order_; }
    size_t                          length() const { return order_.size(); }
    bool                            contains(const std::string& id) const;
    bool                            is_known(const std::string& id) const;
    std::unordered_set<std::string> member_set() const;

    // Display label for one id, falling back to the id itself.
    std::string label(const std::string& id) const;
    // Labels matching order(), one per member.
    std::vector<std::string> labels() const;
    // Labels for every id that has one explicitly supplied.
    const std::unordered_map<std::string, std::string>& label_dict() const { return label_of_; }

   private:
    void append_member(const std::string& id);

    std::string                                  name_;
    bool                                         exists_ = false;
    bool                                         fixed_  = false;
    std::string                                  fixed_by_;
    std::vector<std::string>                     order_;
    std::unordered_set<std::string>              known_;
    std::unordered_map<std::string, std::string> label_of_;
};

}   // namespace gigmap
