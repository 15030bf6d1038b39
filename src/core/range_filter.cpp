#include "basalt/range_filter.h"

#include <cmath>
#include <set>
#include <sstream>
#include <arrow/compute/cast.h>
#include <arrow/type_traits.h>

namespace basalt {

namespace {

using arrow::compute::Expression;

enum class CompareOp {
    kEqual,
    kNotEqual,
    kLess,
    kLessEqual,
    kGreater,
    kGreaterEqual,
};

const char* CompareOpName(CompareOp op) {
    switch (op) {
        case CompareOp::kEqual: return "=";
        case CompareOp::kNotEqual: return "!=";
        case CompareOp::kLess: return "<";
        case CompareOp::kLessEqual: return "<=";
        case CompareOp::kGreater: return ">";
        case CompareOp::kGreaterEqual: return ">=";
    }
    return "?";
}

bool ParseCompareOp(const std::string& name, CompareOp* op) {
    if (name == "equal") { *op = CompareOp::kEqual; return true; }
    if (name == "not_equal") { *op = CompareOp::kNotEqual; return true; }
    if (name == "less") { *op = CompareOp::kLess; return true; }
    if (name == "less_equal") { *op = CompareOp::kLessEqual; return true; }
    if (name == "greater") { *op = CompareOp::kGreater; return true; }
    if (name == "greater_equal") { *op = CompareOp::kGreaterEqual; return true; }
    return false;
}

// `literal op column` is `column Flip(op) literal`
CompareOp Flip(CompareOp op) {
    switch (op) {
        case CompareOp::kLess: return CompareOp::kGreater;
        case CompareOp::kLessEqual: return CompareOp::kGreaterEqual;
        case CompareOp::kGreater: return CompareOp::kLess;
        case CompareOp::kGreaterEqual: return CompareOp::kLessEqual;
        default: return op;
    }
}

// Functions whose result range statistics cannot bound
const std::set<std::string>& NonPrunableFunctions() {
    static const std::set<std::string> functions = {
        "invert", "is_in", "xor", "and_not", "and_not_kleene",
        "match_substring", "match_substring_regex", "match_like",
        "starts_with", "ends_with", "is_nan", "is_finite", "is_inf",
        "true_unless_null",
    };
    return functions;
}

bool IsNaNScalar(const arrow::Scalar& scalar) {
    if (scalar.type->id() == arrow::Type::FLOAT) {
        return std::isnan(static_cast<const arrow::FloatScalar&>(scalar).value);
    }
    if (scalar.type->id() == arrow::Type::DOUBLE) {
        return std::isnan(static_cast<const arrow::DoubleScalar&>(scalar).value);
    }
    return false;
}

//==============================================================================
// Filter nodes
//==============================================================================

class ConstantFilter : public RangeFilter {
public:
    explicit ConstantFilter(bool value) : value_(value) {}

    Status Eval(const BlockStatistics&, bool* may_match) const override {
        *may_match = value_;
        return Status::OK();
    }

    std::string ToString() const override { return value_ ? "true" : "false"; }

private:
    bool value_;
};

class ComparisonFilter : public RangeFilter {
public:
    ComparisonFilter(ColumnId column, std::string name, CompareOp op,
                     std::shared_ptr<arrow::Scalar> literal)
        : column_(column), name_(std::move(name)), op_(op), literal_(std::move(literal)) {}

    Status Eval(const BlockStatistics& stats, bool* may_match) const override {
        *may_match = true;
        auto it = stats.find(column_);
        if (it == stats.end()) {
            return Status::OK();
        }
        const ColumnStatistics& column = it->second;

        if (!column.HasBounds()) {
            // Nulls never satisfy a comparison
            *may_match = !column.AllNull();
            return Status::OK();
        }
        if (!column.type || !column.type->Equals(*literal_->type)) {
            return Status::OK();
        }

        int cmp_min = 0;
        int cmp_max = 0;
        BASALT_RETURN_NOT_OK(CompareScalars(*column.min, *literal_, &cmp_min));
        BASALT_RETURN_NOT_OK(CompareScalars(*column.max, *literal_, &cmp_max));

        switch (op_) {
            case CompareOp::kEqual:
                *may_match = cmp_min <= 0 && cmp_max >= 0;
                break;
            case CompareOp::kNotEqual:
                // Only a block holding nothing but the literal is excluded.
                // Float bounds skip NaN, which is unequal to every literal.
                *may_match = arrow::is_floating(literal_->type->id()) ||
                             !(cmp_min == 0 && cmp_max == 0);
                break;
            case CompareOp::kLess:
                *may_match = cmp_min < 0;
                break;
            case CompareOp::kLessEqual:
                *may_match = cmp_min <= 0;
                break;
            case CompareOp::kGreater:
                *may_match = cmp_max > 0;
                break;
            case CompareOp::kGreaterEqual:
                *may_match = cmp_max >= 0;
                break;
        }
        return Status::OK();
    }

    std::string ToString() const override {
        return name_ + " " + CompareOpName(op_) + " " + literal_->ToString();
    }

private:
    ColumnId column_;
    std::string name_;
    CompareOp op_;
    std::shared_ptr<arrow::Scalar> literal_;
};

class NullFilter : public RangeFilter {
public:
    NullFilter(ColumnId column, std::string name, bool want_null)
        : column_(column), name_(std::move(name)), want_null_(want_null) {}

    Status Eval(const BlockStatistics& stats, bool* may_match) const override {
        *may_match = true;
        auto it = stats.find(column_);
        if (it == stats.end()) {
            return Status::OK();
        }
        const ColumnStatistics& column = it->second;
        *may_match = want_null_ ? column.null_count > 0
                                : column.null_count < column.row_count;
        return Status::OK();
    }

    std::string ToString() const override {
        return name_ + (want_null_ ? " IS NULL" : " IS NOT NULL");
    }

private:
    ColumnId column_;
    std::string name_;
    bool want_null_;
};

// Shared storage of and/or nodes
class ConnectiveFilter : public RangeFilter {
public:
    explicit ConnectiveFilter(std::vector<std::unique_ptr<RangeFilter>> children)
        : children_(std::move(children)) {}

protected:
    std::string Join(const char* separator) const {
        std::ostringstream out;
        out << "(";
        for (size_t i = 0; i < children_.size(); ++i) {
            if (i > 0) out << separator;
            out << children_[i]->ToString();
        }
        out << ")";
        return out.str();
    }

    std::vector<std::unique_ptr<RangeFilter>> children_;
};

class AndFilter : public ConnectiveFilter {
public:
    using ConnectiveFilter::ConnectiveFilter;

    Status Eval(const BlockStatistics& stats, bool* may_match) const override {
        for (const auto& child : children_) {
            BASALT_RETURN_NOT_OK(child->Eval(stats, may_match));
            if (!*may_match) return Status::OK();
        }
        *may_match = true;
        return Status::OK();
    }

    std::string ToString() const override { return Join(" AND "); }
};

class OrFilter : public ConnectiveFilter {
public:
    using ConnectiveFilter::ConnectiveFilter;

    Status Eval(const BlockStatistics& stats, bool* may_match) const override {
        for (const auto& child : children_) {
            BASALT_RETURN_NOT_OK(child->Eval(stats, may_match));
            if (*may_match) return Status::OK();
        }
        *may_match = false;
        return Status::OK();
    }

    std::string ToString() const override { return Join(" OR "); }
};

//==============================================================================
// Compiler
//==============================================================================

class FilterCompiler {
public:
    explicit FilterCompiler(const arrow::Schema& schema) : schema_(schema) {}

    Status Compile(const Expression& expr, std::unique_ptr<RangeFilter>* filter) {
        if (const auto* literal = expr.literal()) {
            return CompileLiteral(*literal, filter);
        }
        if (const auto* ref = expr.field_ref()) {
            return CompileBooleanColumn(*ref, filter);
        }
        const auto* call = expr.call();
        if (!call) {
            return Status::InvalidPredicate("unrecognized expression " + expr.ToString());
        }

        const std::string& name = call->function_name;
        if (name == "and" || name == "and_kleene") {
            return CompileChildren<AndFilter>(call->arguments, filter);
        }
        if (name == "or" || name == "or_kleene") {
            return CompileChildren<OrFilter>(call->arguments, filter);
        }
        if (name == "is_null" || name == "is_valid") {
            return CompileNullCheck(*call, name == "is_null", filter);
        }
        CompareOp op;
        if (ParseCompareOp(name, &op)) {
            return CompileComparison(*call, op, filter);
        }
        if (NonPrunableFunctions().count(name) > 0) {
            *filter = RangeFilter::MakeAlwaysTrue();
            return Status::OK();
        }
        return Status::InvalidPredicate("unsupported function '" + name + "'");
    }

private:
    Status ResolveColumn(const arrow::FieldRef& ref, ColumnId* id,
                         std::shared_ptr<arrow::Field>* field) {
        auto paths = ref.FindAll(schema_);
        if (paths.empty()) {
            return Status::InvalidPredicate("unknown column " + ref.ToString());
        }
        if (paths.size() > 1) {
            return Status::InvalidPredicate("ambiguous column " + ref.ToString());
        }
        if (paths[0].indices().size() != 1) {
            return Status::InvalidPredicate("nested column " + ref.ToString() +
                                            " has no statistics");
        }
        int index = paths[0].indices()[0];
        *id = static_cast<ColumnId>(index);
        *field = schema_.field(index);
        return Status::OK();
    }

    Status CheckStatisticsType(const arrow::Field& field) {
        if (!IsStatisticsSupported(*field.type())) {
            return Status::UnsupportedType("column '" + field.name() + "' of type " +
                                           field.type()->ToString() +
                                           " has no statistics");
        }
        return Status::OK();
    }

    Status CompileLiteral(const arrow::Datum& literal, std::unique_ptr<RangeFilter>* filter) {
        if (!literal.is_scalar() || literal.type()->id() != arrow::Type::BOOL) {
            return Status::InvalidPredicate("non-boolean literal used as filter: " +
                                            literal.ToString());
        }
        const auto& scalar = literal.scalar_as<arrow::BooleanScalar>();
        // A null filter keeps no rows, same as false
        *filter = std::make_unique<ConstantFilter>(scalar.is_valid && scalar.value);
        return Status::OK();
    }

    Status CompileBooleanColumn(const arrow::FieldRef& ref,
                                std::unique_ptr<RangeFilter>* filter) {
        ColumnId id;
        std::shared_ptr<arrow::Field> field;
        BASALT_RETURN_NOT_OK(ResolveColumn(ref, &id, &field));
        if (field->type()->id() != arrow::Type::BOOL) {
            return Status::InvalidPredicate("non-boolean column '" + field->name() +
                                            "' used as filter");
        }
        *filter = std::make_unique<ComparisonFilter>(
            id, field->name(), CompareOp::kEqual, std::make_shared<arrow::BooleanScalar>(true));
        return Status::OK();
    }

    template <typename Node>
    Status CompileChildren(const std::vector<Expression>& arguments,
                           std::unique_ptr<RangeFilter>* filter) {
        if (arguments.empty()) {
            return Status::InvalidPredicate("boolean connective without operands");
        }
        std::vector<std::unique_ptr<RangeFilter>> children;
        children.reserve(arguments.size());
        for (const auto& argument : arguments) {
            std::unique_ptr<RangeFilter> child;
            BASALT_RETURN_NOT_OK(Compile(argument, &child));
            children.push_back(std::move(child));
        }
        *filter = std::make_unique<Node>(std::move(children));
        return Status::OK();
    }

    Status CompileNullCheck(const Expression::Call& call, bool want_null,
                            std::unique_ptr<RangeFilter>* filter) {
        if (call.arguments.size() != 1) {
            return Status::InvalidPredicate(call.function_name + " takes one argument");
        }
        const auto* ref = call.arguments[0].field_ref();
        if (!ref) {
            *filter = RangeFilter::MakeAlwaysTrue();
            return Status::OK();
        }
        ColumnId id;
        std::shared_ptr<arrow::Field> field;
        BASALT_RETURN_NOT_OK(ResolveColumn(*ref, &id, &field));
        BASALT_RETURN_NOT_OK(CheckStatisticsType(*field));
        *filter = std::make_unique<NullFilter>(id, field->name(), want_null);
        return Status::OK();
    }

    Status CompileComparison(const Expression::Call& call, CompareOp op,
                             std::unique_ptr<RangeFilter>* filter) {
        if (call.arguments.size() != 2) {
            return Status::InvalidPredicate(call.function_name + " takes two arguments");
        }
        const Expression& lhs = call.arguments[0];
        const Expression& rhs = call.arguments[1];

        const arrow::FieldRef* ref = nullptr;
        const arrow::Datum* literal = nullptr;
        if (lhs.field_ref() && rhs.literal()) {
            ref = lhs.field_ref();
            literal = rhs.literal();
        } else if (lhs.literal() && rhs.field_ref()) {
            ref = rhs.field_ref();
            literal = lhs.literal();
            op = Flip(op);
        } else {
            // Column vs column, literal vs literal or computed operands
            for (const auto& argument : call.arguments) {
                if (const auto* column = argument.field_ref()) {
                    ColumnId id;
                    std::shared_ptr<arrow::Field> field;
                    BASALT_RETURN_NOT_OK(ResolveColumn(*column, &id, &field));
                }
            }
            *filter = RangeFilter::MakeAlwaysTrue();
            return Status::OK();
        }

        ColumnId id;
        std::shared_ptr<arrow::Field> field;
        BASALT_RETURN_NOT_OK(ResolveColumn(*ref, &id, &field));
        BASALT_RETURN_NOT_OK(CheckStatisticsType(*field));

        std::shared_ptr<arrow::Scalar> value;
        bool exact = true;
        BASALT_RETURN_NOT_OK(CastLiteral(*literal, field->type(), &value, &exact));
        if (!exact || !value || IsNaNScalar(*value)) {
            // Null, NaN and inexactly cast literals are left to the scan
            *filter = RangeFilter::MakeAlwaysTrue();
            return Status::OK();
        }

        *filter = std::make_unique<ComparisonFilter>(id, field->name(), op, std::move(value));
        return Status::OK();
    }

    // `exact` turns false when the literal has the column's kind of value
    // but not an exact representation in its type (2.5 against int64).
    Status CastLiteral(const arrow::Datum& literal,
                       const std::shared_ptr<arrow::DataType>& type,
                       std::shared_ptr<arrow::Scalar>* value,
                       bool* exact) {
        *exact = true;
        if (!literal.is_scalar()) {
            return Status::InvalidPredicate("literal is not a scalar: " + literal.ToString());
        }
        const auto& scalar = literal.scalar();
        if (!scalar->is_valid) {
            *value = nullptr;
            return Status::OK();
        }
        if (scalar->type->Equals(*type)) {
            *value = scalar;
            return Status::OK();
        }

        BASALT_RETURN_NOT_OK(EnsureComputeInitialized());
        auto cast = arrow::compute::Cast(literal, type);
        if (cast.ok()) {
            *value = cast->scalar();
            return Status::OK();
        }
        // Truncation or overflow: the value is comparable, just not exactly
        auto lossy = arrow::compute::Cast(literal, type, arrow::compute::CastOptions::Unsafe());
        if (lossy.ok()) {
            *exact = false;
            *value = nullptr;
            return Status::OK();
        }
        return Status::InvalidPredicate("cannot cast " + scalar->ToString() + " to " +
                                        type->ToString() + ": " +
                                        cast.status().message());
    }

    const arrow::Schema& schema_;
};

} // namespace

std::unique_ptr<RangeFilter> RangeFilter::MakeAlwaysTrue() {
    return std::make_unique<ConstantFilter>(true);
}

Status RangeFilter::Create(const arrow::compute::Expression& expr,
                           const arrow::Schema& schema,
                           std::unique_ptr<RangeFilter>* filter) {
    FilterCompiler compiler(schema);
    auto status = compiler.Compile(expr, filter);
    if (!status.ok()) {
        return status.WithContext("filter " + expr.ToString())
            .WithStage(OperationStage::kCompilePredicate);
    }
    return Status::OK();
}

Status RangeFilter::Create(const std::vector<arrow::compute::Expression>& filters,
                           const arrow::Schema& schema,
                           bool conjoin,
                           std::unique_ptr<RangeFilter>* filter) {
    if (filters.empty()) {
        *filter = MakeAlwaysTrue();
        return Status::OK();
    }
    if (!conjoin || filters.size() == 1) {
        return Create(filters.front(), schema, filter);
    }

    std::vector<std::unique_ptr<RangeFilter>> children;
    children.reserve(filters.size());
    for (const auto& expr : filters) {
        std::unique_ptr<RangeFilter> child;
        BASALT_RETURN_NOT_OK(Create(expr, schema, &child));
        children.push_back(std::move(child));
    }
    *filter = std::make_unique<AndFilter>(std::move(children));
    return Status::OK();
}

} // namespace basalt
