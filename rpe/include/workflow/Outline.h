// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#pragma once

#include "common/JsonUtils.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace RPE {

class Workflow;

/**
 * @brief Unit of work of an outline step
 *
 * May record results in workflow.ctx() or request children with toContext().
 * Exceptions thrown here fail the workflow.
 */
using StepFunction = std::function<void(Workflow &workflow)>;

/**
 * @brief Condition of if_/elif_/while_
 *
 * Booleans are used as is, numbers are true when non-zero and null is false.
 * Any other JSON type fails the workflow with PredicateTypeError.
 */
using Predicate = std::function<json(Workflow &workflow)>;

/**
 * @brief Outcome of one Stepper::step() call
 */
struct StepResult {
    bool finished = false;
    // A return_ instruction ended the outline early
    bool returned = false;
    std::optional<int64_t> exitCode;
};

/**
 * @brief Cursor over one instruction
 *
 * The saved state is the part of the workflow continuation that locates
 * the next node, including open branch and loop frames.
 */
class Stepper {
public:
    virtual ~Stepper() = default;

    /**
     * @brief Execute one unit of work
     */
    virtual StepResult step(Workflow &workflow) = 0;

    virtual bool finished() const = 0;

    virtual json saveState() const = 0;

    /**
     * @throws ReconstructionError if state does not fit this instruction
     */
    virtual void loadState(const json &state) = 0;
};

/**
 * @brief Immutable outline node
 */
class Instruction {
public:
    virtual ~Instruction() = default;

    virtual std::unique_ptr<Stepper> createStepper() const = 0;

    virtual json describe() const = 0;
};

using InstructionPtr = std::shared_ptr<const Instruction>;
using Block = std::vector<InstructionPtr>;

/**
 * @brief Conditional instruction, see if_()
 */
class If : public Instruction, public std::enable_shared_from_this<If> {
public:
    struct Branch {
        std::string label;
        std::string name;
        Predicate predicate;
        Block body;
    };

    /**
     * @brief Pending branch waiting for its body
     */
    class BranchBuilder {
    public:
        BranchBuilder(std::shared_ptr<If> owner, std::string label, std::string name, Predicate predicate);

        std::shared_ptr<If> operator()(Block body);

    private:
        std::shared_ptr<If> owner_;
        std::string label_;
        std::string name_;
        Predicate predicate_;
    };

    BranchBuilder elif_(const std::string &name, Predicate predicate);

    std::shared_ptr<If> else_(Block body);

    const std::vector<Branch> &branches() const {
        return branches_;
    }

    std::unique_ptr<Stepper> createStepper() const override;
    json describe() const override;

private:
    void addBranch(Branch branch);

    std::vector<Branch> branches_;
    bool hasElse_ = false;
};

/**
 * @brief Loop instruction waiting for its body, see while_()
 */
class WhileBuilder {
public:
    WhileBuilder(std::string name, Predicate predicate);

    InstructionPtr operator()(Block body) const;

private:
    std::string name_;
    Predicate predicate_;
};

/**
 * @brief Run fn as one workflow step
 */
InstructionPtr step(const std::string &name, StepFunction fn);

/**
 * @brief Conditional, each predicate is evaluated once when reached
 *
 * @code
 * if_("is_small", isSmall)({step("a", a)})
 *     ->elif_("is_medium", isMedium)({step("b", b)})
 *     ->else_({step("c", c)})
 * @endcode
 */
If::BranchBuilder if_(const std::string &name, Predicate predicate);

/**
 * @brief Loop, the predicate is re-evaluated before every pass over the body
 */
WhileBuilder while_(const std::string &name, Predicate predicate);

/**
 * @brief Stop the outline and finish the workflow
 *
 * With an exit code the workflow emits it as output "exit_code" and is
 * successful only for 0.
 */
InstructionPtr return_();
InstructionPtr return_(int64_t exitCode);

/**
 * @brief Static instruction tree executed by a Workflow
 */
class Outline {
public:
    explicit Outline(Block block);

    /**
     * @brief Cursor positioned before the first instruction
     */
    std::unique_ptr<Stepper> createStepper() const;

    json describe() const;

    size_t size() const {
        return block_.size();
    }

private:
    Block block_;
};

/**
 * @brief Boolean value of a predicate result
 * @throws PredicateTypeError for strings, arrays, objects and binary values
 */
bool evaluatePredicate(const std::string &name, const json &value);

}  // namespace RPE
