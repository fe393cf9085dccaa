#pragma once
/**
 * @file Constraint.h
 * @brief Row filters applied to query-result tables.
 */
#include <memory>
#include <string>
#include <vector>

#include "CsvTable.h"

namespace ensemble {
    enum class ConstraintOp { Equal, NotEqual, StartsWith, EndsWith, Contains };

    std::string toString(ConstraintOp op);

    /**
     * @brief Accepts equal/==/eq, notEqual/!=/neq, startswith, endswith and contains.
     * @throws ConfigurationError for an unknown operator
     */
    ConstraintOp constraintOpFromString(const std::string& text);

    /**
     * @brief Base interface for row filters.
     */
    class Constraint {
    public:
        virtual ~Constraint() = default;

        /** @brief true if row `row` of `table` passes; the table must have every column() */
        virtual bool matches(const CsvTable& table, size_t row) const = 0;

        /** @brief columns the constraint reads */
        virtual std::vector<std::string> columns() const = 0;

        virtual std::string describe() const = 0;

        virtual std::unique_ptr<Constraint> clone() const = 0;
    };

    /**
     * @brief Compare the text of one column with a fixed value.
     */
    class ColumnConstraint final : public Constraint {
    public:
        ColumnConstraint(std::string column, ConstraintOp op, std::string value);

        bool matches(const CsvTable& table, size_t row) const override;
        std::vector<std::string> columns() const override { return {column_}; }
        std::string describe() const override;

        std::unique_ptr<Constraint> clone() const override;

        const std::string& column() const noexcept { return column_; }
        ConstraintOp op() const noexcept { return op_; }
        const std::string& value() const noexcept { return value_; }

    private:
        std::string column_;
        ConstraintOp op_;
        std::string value_;
    };

    /**
     * @brief Conjunction of constraints; an empty group matches every row.
     */
    class ConstraintGroup final : public Constraint {
    public:
        ConstraintGroup() = default;
        explicit ConstraintGroup(const std::vector<std::unique_ptr<Constraint>>& constraints);
        ConstraintGroup(const ConstraintGroup& other);
        ConstraintGroup& operator=(const ConstraintGroup& other);
        ConstraintGroup(ConstraintGroup&&) noexcept = default;
        ConstraintGroup& operator=(ConstraintGroup&&) noexcept = default;

        void add(const Constraint& constraint) { constraints_.push_back(constraint.clone()); }

        bool matches(const CsvTable& table, size_t row) const override;
        std::vector<std::string> columns() const override;
        std::string describe() const override;

        std::unique_ptr<Constraint> clone() const override;

        bool empty() const noexcept { return constraints_.empty(); }
        size_t size() const noexcept { return constraints_.size(); }

    private:
        std::vector<std::unique_ptr<Constraint>> constraints_;
    };
}
