#include "workflow/dag.hpp"

#include <algorithm>
#include <set>
#include "workflow/validation_error.hpp"

namespace ael::workflow {

namespace {

enum class Mark {
    Unvisited,
    InProgress,
    Done
};

// Depth-first search that records the first back edge as a readable path.
bool find_cycle(const std::size_t node,
                const std::vector<std::vector<std::size_t>>& successors,
                std::vector<Mark>& marks,
                std::vector<std::size_t>& stack,
                std::vector<std::size_t>& cycle) {
    marks[node] = Mark::InProgress;
    stack.push_back(node);
    for (const std::size_t next : successors[node]) {
        if (marks[next] == Mark::InProgress) {
            const auto start = std::find(stack.begin(), stack.end(), next);
            cycle.assign(start, stack.end());
            cycle.push_back(next);
            return true;
        }
        if (marks[next] == Mark::Unvisited && find_cycle(next, successors, marks, stack, cycle)) {
            return true;
        }
    }
    stack.pop_back();
    marks[node] = Mark::Done;
    return false;
}

}  // namespace

core::errors::Result<WorkflowDag> WorkflowDag::build(
    const protocol::WorkflowDefinition& definition) {
    WorkflowDag dag;
    dag.ids_.reserve(definition.steps.size());
    for (const auto& step : definition.steps) {
        if (dag.index_.count(step.id) != 0) {
            return make_validation_error(ValidationErrorKind::BadSyntax,
                                         "Duplicate step id: " + step.id);
        }
        dag.index_[step.id] = dag.ids_.size();
        dag.ids_.push_back(step.id);
    }

    dag.predecessors_.resize(dag.ids_.size());
    dag.successors_.resize(dag.ids_.size());
    for (std::size_t i = 0; i < definition.steps.size(); ++i) {
        const auto& step = definition.steps[i];
        for (const auto& dependency : step.depends_on) {
            const auto found = dag.index_.find(dependency);
            if (found == dag.index_.end()) {
                return make_validation_error(
                    ValidationErrorKind::UnknownDependency,
                    "Step " + step.id + " depends on undeclared step " + dependency);
            }
            auto& preds = dag.predecessors_[i];
            if (std::find(preds.begin(), preds.end(), found->second) != preds.end()) {
                continue;
            }
            preds.push_back(found->second);
            dag.successors_[found->second].push_back(i);
        }
    }

    std::vector<Mark> marks(dag.ids_.size(), Mark::Unvisited);
    std::vector<std::size_t> stack;
    std::vector<std::size_t> cycle;
    for (std::size_t i = 0; i < dag.ids_.size(); ++i) {
        if (marks[i] != Mark::Unvisited) {
            continue;
        }
        if (find_cycle(i, dag.successors_, marks, stack, cycle)) {
            std::string path;
            for (const std::size_t node : cycle) {
                path += (path.empty() ? "" : " -> ") + dag.ids_[node];
            }
            return make_validation_error(ValidationErrorKind::CyclicDependency,
                                         "Dependency cycle: " + path);
        }
    }

    return dag;
}

std::optional<std::size_t> WorkflowDag::index_of(const std::string& id) const {
    const auto found = index_.find(id);
    if (found == index_.end()) {
        return std::nullopt;
    }
    return found->second;
}

std::vector<std::size_t> WorkflowDag::topological_order() const {
    std::vector<std::size_t> remaining(ids_.size());
    std::set<std::size_t> ready;
    for (std::size_t i = 0; i < ids_.size(); ++i) {
        remaining[i] = predecessors_[i].size();
        if (remaining[i] == 0) {
            ready.insert(i);
        }
    }

    std::vector<std::size_t> order;
    order.reserve(ids_.size());
    while (!ready.empty()) {
        const std::size_t next = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(next);
        for (const std::size_t successor : successors_[next]) {
            if (--remaining[successor] == 0) {
                ready.insert(successor);
            }
        }
    }
    return order;
}

std::vector<std::size_t> WorkflowDag::transitive_dependents(const std::size_t index) const {
    std::vector<bool> seen(ids_.size(), false);
    std::vector<std::size_t> frontier = successors_.at(index);
    while (!frontier.empty()) {
        const std::size_t node = frontier.back();
        frontier.pop_back();
        if (seen[node]) {
            continue;
        }
        seen[node] = true;
        frontier.insert(frontier.end(), successors_[node].begin(), successors_[node].end());
    }

    std::vector<std::size_t> dependents;
    for (std::size_t i = 0; i < seen.size(); ++i) {
        if (seen[i]) {
            dependents.push_back(i);
        }
    }
    return dependents;
}

}  // namespace ael::workflow
