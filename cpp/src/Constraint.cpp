#include "Constraint.h"
#include "Error.h"

using namespace ensemble;

std::string ensemble::toString(const ConstraintOp op) {
    switch (op) {
        case ConstraintOp::Equal: return "equal";
        case ConstraintOp::NotEqual: return "notEqual";
        case ConstraintOp::StartsWith: return "startswith";
        case ConstraintOp::EndsWith: return "endswith";
        case ConstraintOp::Contains: return "contains";
    }
    return "equal";
}

ConstraintOp ensemble::constraintOpFromString(const std::string& text) {
    if (text == "equal" || text == "==" || text == "eq") return ConstraintOp::Equal;
    if (text == "notEqual" || text == "!=" || text == "neq" || text == "<>") return ConstraintOp::NotEqual;
    if (text == "startswith" || text == "startsWith") return ConstraintOp::StartsWith;
    if (text == "endswith" || text == "endsWith") return ConstraintOp::EndsWith;
    if (text == "contains") return ConstraintOp::Contains;
    throw ConfigurationError("Unknown constraint operator '" + text + "'");
}

// ColumnConstraint
ColumnConstraint::ColumnConstraint(std::string column, const ConstraintOp op, std::string value)
    : column_(std::move(column)), op_(op), value_(std::move(value)) {
    if (column_.empty()) throw ConfigurationError("Constraint without a column");
}

bool ColumnConstraint::matches(const CsvTable& table, const size_t row) const {
    const std::string& cell = table.cell(row, column_);
    switch (op_) {
        case ConstraintOp::Equal: return cell == value_;
        case ConstraintOp::NotEqual: return cell != value_;
        case ConstraintOp::StartsWith: return cell.compare(0, value_.size(), value_) == 0;
        case ConstraintOp::EndsWith:
            return cell.size() >= value_.size() && cell.compare(cell.size() - value_.size(), value_.size(), value_) == 0;
        case ConstraintOp::Contains: return cell.find(value_) != std::string::npos;
    }
    return false;
}

std::string ColumnConstraint::describe() const {
    return column_ + " " + toString(op_) + " '" + value_ + "'";
}

std::unique_ptr<Constraint> ColumnConstraint::clone() const {
    return std::make_unique<ColumnConstraint>(*this);
}

// ConstraintGroup
ConstraintGroup::ConstraintGroup(const std::vector<std::unique_ptr<Constraint>>& constraints) {
    constraints_.reserve(constraints.size());
    for (const auto& c : constraints)
        constraints_.push_back(c->clone());
}

ConstraintGroup::ConstraintGroup(const ConstraintGroup& other) {
    constraints_.reserve(other.constraints_.size());
    for (const auto& c : other.constraints_)
        constraints_.push_back(c->clone());
}

ConstraintGroup& ConstraintGroup::operator=(const ConstraintGroup& other) {
    if (this != &other) {
        ConstraintGroup copy(other);
        constraints_ = std::move(copy.constraints_);
    }
    return *this;
}

bool ConstraintGroup::matches(const CsvTable& table, const size_t row) const {
    for (const auto& c : constraints_)
        if (!c->matches(table, row)) return false;
    return true;
}

std::vector<std::string> ConstraintGroup::columns() const {
    std::vector<std::string> cols;
    for (const auto& c : constraints_)
        for (auto& col : c->columns())
            cols.push_back(std::move(col));
    return cols;
}

std::string ConstraintGroup::describe() const {
    std::string out;
    for (const auto& c : constraints_) {
        if (!out.empty()) out += " and ";
        out += c->describe();
    }
    return out.empty() ? "all rows" : out;
}

std::unique_ptr<Constraint> ConstraintGroup::clone() const {
    return std::make_unique<ConstraintGroup>(*this);
}
