// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "workflow/Outline.h"
#include "common/Exceptions.h"
#include "common/Logger.h"
#include "workflow/Workflow.h"

namespace RPE {

namespace {

json describeBlock(const Block &block) {
    json description = json::array();
    for (const auto &instruction : block) {
        description.push_back(instruction->describe());
    }
    return description;
}

class FunctionStepper : public Stepper {
public:
    FunctionStepper(const std::string &name, const StepFunction &fn) : name_(name), fn_(fn) {}

    StepResult step(Workflow &workflow) override {
        LOG_DEBUG("Workflow<{}>: Step '{}'", workflow.pid(), name_);
        fn_(workflow);
        done_ = true;
        return StepResult{true};
    }

    bool finished() const override {
        return done_;
    }

    json saveState() const override {
        return json::object();
    }

    void loadState(const json &state) override {
        if (!state.is_object()) {
            throw ReconstructionError("Invalid state for step '" + name_ + "': " + state.dump());
        }
    }

private:
    const std::string &name_;
    const StepFunction &fn_;
    bool done_ = false;
};

class FunctionCall : public Instruction {
public:
    FunctionCall(std::string name, StepFunction fn) : name_(std::move(name)), fn_(std::move(fn)) {
        if (!fn_) {
            throw ValidationError("Step '" + name_ + "' has no function");
        }
    }

    std::unique_ptr<Stepper> createStepper() const override {
        return std::make_unique<FunctionStepper>(name_, fn_);
    }

    json describe() const override {
        return name_;
    }

private:
    std::string name_;
    StepFunction fn_;
};

class BlockStepper : public Stepper {
public:
    explicit BlockStepper(const Block &block) : block_(block) {
        if (!block_.empty()) {
            child_ = block_[0]->createStepper();
        }
    }

    StepResult step(Workflow &workflow) override {
        if (finished()) {
            return StepResult{true};
        }

        StepResult result = child_->step(workflow);
        if (result.returned) {
            pos_ = block_.size();
            child_.reset();
            return result;
        }
        if (result.finished) {
            nextInstruction();
        }
        return StepResult{finished()};
    }

    bool finished() const override {
        return pos_ >= block_.size();
    }

    json saveState() const override {
        json state = {{"pos", pos_}};
        if (child_) {
            state["child"] = child_->saveState();
        }
        return state;
    }

    void loadState(const json &state) override {
        if (!state.is_object() || !state.contains("pos") || !state["pos"].is_number_integer() ||
            state["pos"].get<int64_t>() < 0) {
            throw ReconstructionError("Invalid block cursor: " + state.dump());
        }
        size_t pos = state["pos"].get<size_t>();
        if (pos > block_.size()) {
            throw ReconstructionError("Block cursor " + std::to_string(pos) + " is past the end of a block of " +
                                      std::to_string(block_.size()));
        }

        pos_ = pos;
        child_.reset();
        if (!finished()) {
            child_ = block_[pos_]->createStepper();
            if (state.contains("child")) {
                child_->loadState(state["child"]);
            }
        }
    }

private:
    void nextInstruction() {
        pos_++;
        child_ = finished() ? nullptr : block_[pos_]->createStepper();
    }

    const Block &block_;
    size_t pos_ = 0;
    std::unique_ptr<Stepper> child_;
};

class IfStepper : public Stepper {
public:
    explicit IfStepper(const If &instruction) : instruction_(instruction) {}

    StepResult step(Workflow &workflow) override {
        if (finished()) {
            return StepResult{true};
        }

        const auto &branches = instruction_.branches();
        if (!child_) {
            // Predicates are evaluated once, the chosen branch is part of the cursor
            pos_ = 0;
            while (pos_ < branches.size() && !isTrue(branches[pos_], workflow)) {
                pos_++;
            }
            if (finished()) {
                LOG_DEBUG("Workflow<{}>: No branch taken", workflow.pid());
                return StepResult{true};
            }
            child_ = std::make_unique<BlockStepper>(branches[pos_].body);
        }

        StepResult result = child_->step(workflow);
        if (result.finished || result.returned) {
            pos_ = branches.size();
            child_.reset();
        }
        result.finished = finished();
        return result;
    }

    bool finished() const override {
        return pos_ >= instruction_.branches().size();
    }

    json saveState() const override {
        json state = {{"pos", pos_}};
        if (child_) {
            state["child"] = child_->saveState();
        }
        return state;
    }

    void loadState(const json &state) override {
        if (!state.is_object() || !state.contains("pos") || !state["pos"].is_number_integer() ||
            state["pos"].get<int64_t>() < 0) {
            throw ReconstructionError("Invalid conditional cursor: " + state.dump());
        }
        size_t pos = state["pos"].get<size_t>();
        const auto &branches = instruction_.branches();
        if (pos > branches.size()) {
            throw ReconstructionError("Conditional cursor " + std::to_string(pos) + " is past the last branch");
        }

        pos_ = pos;
        child_.reset();
        if (!finished() && state.contains("child")) {
            child_ = std::make_unique<BlockStepper>(branches[pos_].body);
            child_->loadState(state["child"]);
        }
    }

private:
    static bool isTrue(const If::Branch &branch, Workflow &workflow) {
        if (!branch.predicate) {
            return true;
        }
        return evaluatePredicate(branch.name, branch.predicate(workflow));
    }

    const If &instruction_;
    size_t pos_ = 0;
    std::unique_ptr<Stepper> child_;
};

class While : public Instruction {
public:
    While(std::string name, Predicate predicate, Block body)
        : name_(std::move(name)), predicate_(std::move(predicate)), body_(std::move(body)) {}

    const std::string &name() const {
        return name_;
    }

    const Predicate &predicate() const {
        return predicate_;
    }

    const Block &body() const {
        return body_;
    }

    std::unique_ptr<Stepper> createStepper() const override;

    json describe() const override {
        return json{{"while(" + name_ + ")", describeBlock(body_)}};
    }

private:
    std::string name_;
    Predicate predicate_;
    Block body_;
};

class WhileStepper : public Stepper {
public:
    explicit WhileStepper(const While &instruction) : instruction_(instruction) {}

    StepResult step(Workflow &workflow) override {
        if (done_) {
            return StepResult{true};
        }

        if (!child_) {
            if (!evaluatePredicate(instruction_.name(), instruction_.predicate()(workflow))) {
                done_ = true;
                return StepResult{true};
            }
            child_ = std::make_unique<BlockStepper>(instruction_.body());
        }

        StepResult result = child_->step(workflow);
        if (result.returned) {
            done_ = true;
            child_.reset();
            return result;
        }
        if (result.finished) {
            // Next pass starts with a fresh predicate evaluation
            child_.reset();
        }
        return StepResult{false};
    }

    bool finished() const override {
        return done_;
    }

    json saveState() const override {
        json state = {{"done", done_}};
        if (child_) {
            state["child"] = child_->saveState();
        }
        return state;
    }

    void loadState(const json &state) override {
        if (!state.is_object() || !state.contains("done") || !state["done"].is_boolean()) {
            throw ReconstructionError("Invalid loop cursor: " + state.dump());
        }
        done_ = state["done"].get<bool>();
        child_.reset();
        if (!done_ && state.contains("child")) {
            child_ = std::make_unique<BlockStepper>(instruction_.body());
            child_->loadState(state["child"]);
        }
    }

private:
    const While &instruction_;
    bool done_ = false;
    std::unique_ptr<Stepper> child_;
};

std::unique_ptr<Stepper> While::createStepper() const {
    return std::make_unique<WhileStepper>(*this);
}

class ReturnStepper : public Stepper {
public:
    explicit ReturnStepper(std::optional<int64_t> exitCode) : exitCode_(exitCode) {}

    StepResult step(Workflow &workflow) override {
        LOG_DEBUG("Workflow<{}>: Return{}", workflow.pid(),
                  exitCode_ ? " with exit code " + std::to_string(*exitCode_) : "");
        return StepResult{true, true, exitCode_};
    }

    bool finished() const override {
        return false;
    }

    json saveState() const override {
        return json::object();
    }

    void loadState(const json &state) override {
        if (!state.is_object()) {
            throw ReconstructionError("Invalid return state: " + state.dump());
        }
    }

private:
    std::optional<int64_t> exitCode_;
};

class Return : public Instruction {
public:
    explicit Return(std::optional<int64_t> exitCode) : exitCode_(exitCode) {}

    std::unique_ptr<Stepper> createStepper() const override {
        return std::make_unique<ReturnStepper>(exitCode_);
    }

    json describe() const override {
        return exitCode_ ? "return(" + std::to_string(*exitCode_) + ")" : "return";
    }

private:
    std::optional<int64_t> exitCode_;
};

}  // namespace

If::BranchBuilder::BranchBuilder(std::shared_ptr<If> owner, std::string label, std::string name, Predicate predicate)
    : owner_(std::move(owner)), label_(std::move(label)), name_(std::move(name)), predicate_(std::move(predicate)) {}

std::shared_ptr<If> If::BranchBuilder::operator()(Block body) {
    owner_->addBranch(Branch{label_, name_, predicate_, std::move(body)});
    return owner_;
}

If::BranchBuilder If::elif_(const std::string &name, Predicate predicate) {
    return BranchBuilder(shared_from_this(), "elif", name, std::move(predicate));
}

std::shared_ptr<If> If::else_(Block body) {
    addBranch(Branch{"else", "", nullptr, std::move(body)});
    hasElse_ = true;
    return shared_from_this();
}

void If::addBranch(Branch branch) {
    if (hasElse_) {
        throw ValidationError("Conditional already has an else branch, cannot add " + branch.label);
    }
    if (branch.label != "else" && !branch.predicate) {
        throw ValidationError("Branch " + branch.label + "(" + branch.name + ") has no predicate");
    }
    branches_.push_back(std::move(branch));
}

std::unique_ptr<Stepper> If::createStepper() const {
    return std::make_unique<IfStepper>(*this);
}

json If::describe() const {
    json description = json::array();
    for (const auto &branch : branches_) {
        std::string key = branch.label == "else" ? branch.label : branch.label + "(" + branch.name + ")";
        description.push_back(json{{key, describeBlock(branch.body)}});
    }
    return description;
}

WhileBuilder::WhileBuilder(std::string name, Predicate predicate)
    : name_(std::move(name)), predicate_(std::move(predicate)) {
    if (!predicate_) {
        throw ValidationError("while_(" + name_ + ") has no predicate");
    }
}

InstructionPtr WhileBuilder::operator()(Block body) const {
    return std::make_shared<While>(name_, predicate_, std::move(body));
}

InstructionPtr step(const std::string &name, StepFunction fn) {
    return std::make_shared<FunctionCall>(name, std::move(fn));
}

If::BranchBuilder if_(const std::string &name, Predicate predicate) {
    return If::BranchBuilder(std::make_shared<If>(), "if", name, std::move(predicate));
}

WhileBuilder while_(const std::string &name, Predicate predicate) {
    return WhileBuilder(name, std::move(predicate));
}

InstructionPtr return_() {
    return std::make_shared<Return>(std::nullopt);
}

InstructionPtr return_(int64_t exitCode) {
    return std::make_shared<Return>(exitCode);
}

Outline::Outline(Block block) : block_(std::move(block)) {
    for (const auto &instruction : block_) {
        if (!instruction) {
            throw ValidationError("Outline contains a null instruction");
        }
    }
}

std::unique_ptr<Stepper> Outline::createStepper() const {
    return std::make_unique<BlockStepper>(block_);
}

json Outline::describe() const {
    return describeBlock(block_);
}

bool evaluatePredicate(const std::string &name, const json &value) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number_integer()) {
        return value.get<int64_t>() != 0;
    }
    if (value.is_number_float()) {
        return value.get<double>() != 0.0;
    }
    if (value.is_null()) {
        return false;
    }

    LOG_WARN("Predicate '{}' returned {} ({}), which is not boolean-like", name, value.dump(), value.type_name());
    throw PredicateTypeError("Predicate '" + name + "' returned a " + std::string(value.type_name()) +
                             ", expected a boolean");
}

}  // namespace RPE
