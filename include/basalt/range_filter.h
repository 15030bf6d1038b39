/**
 * RangeFilter - conservative predicate over block statistics
 *
 * A filter expression is compiled once per query into a tree of range
 * checks. Evaluating the tree against the statistics of a block (or the
 * summary of a segment) answers "might any row satisfy the filter?".
 * A false answer is a proof that no row does; true only means maybe.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include <arrow/api.h>
#include <arrow/compute/expression.h>
#include <basalt/statistics.h>
#include <basalt/status.h>

namespace basalt {

class RangeFilter {
public:
    virtual ~RangeFilter() = default;

    /**
     * @brief Compile a filter expression against a table schema
     *
     * Recognized shapes: comparisons (equal, not_equal, less, less_equal,
     * greater, greater_equal) between one column and one literal in
     * either order, and/or trees of those, is_null and is_valid on a
     * column, boolean literals and boolean columns. Calls that range
     * statistics cannot decide (invert, is_in, string matching, column vs
     * column) compile to a filter that always answers true.
     *
     * Fails with InvalidPredicate for unknown columns, unknown functions
     * or literals not castable to the column type, and with
     * UnsupportedType for a column type without statistics. Failures are
     * tagged OperationStage::kCompilePredicate.
     */
    static Status Create(const arrow::compute::Expression& expr,
                         const arrow::Schema& schema,
                         std::unique_ptr<RangeFilter>* filter);

    /**
     * @brief Compile a list of top-level filters
     *
     * No filter compiles to an always-true filter. Otherwise only the
     * first filter is used unless `conjoin` is set, in which case all of
     * them must hold.
     */
    static Status Create(const std::vector<arrow::compute::Expression>& filters,
                         const arrow::Schema& schema,
                         bool conjoin,
                         std::unique_ptr<RangeFilter>* filter);

    // Filter that never prunes anything
    static std::unique_ptr<RangeFilter> MakeAlwaysTrue();

    /**
     * @brief Decide whether any row described by `stats` may match
     *
     * Columns missing from `stats` are treated as unknown.
     */
    virtual Status Eval(const BlockStatistics& stats, bool* may_match) const = 0;

    virtual std::string ToString() const = 0;
};

} // namespace basalt
