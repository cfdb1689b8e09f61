#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/ael_errors.hpp"
#include "protocol/workflow_contract.hpp"

namespace ael::workflow {

// Dependency graph over a workflow's steps: an arena of step ids indexed in
// declaration order, with adjacency lists in both directions.
class WorkflowDag {
public:
    // Fails with unknown_dependency or cyclic_dependency.
    static core::errors::Result<WorkflowDag> build(const protocol::WorkflowDefinition& definition);

    std::size_t size() const { return ids_.size(); }
    const std::vector<std::string>& ids() const { return ids_; }
    const std::string& id(const std::size_t index) const { return ids_.at(index); }
    std::optional<std::size_t> index_of(const std::string& id) const;

    const std::vector<std::size_t>& predecessors(const std::size_t index) const {
        return predecessors_.at(index);
    }
    const std::vector<std::size_t>& successors(const std::size_t index) const {
        return successors_.at(index);
    }

    // Kahn's algorithm; among ready steps the earliest declared goes first.
    std::vector<std::size_t> topological_order() const;

    // Every step reachable from `index`, in declaration order.
    std::vector<std::size_t> transitive_dependents(std::size_t index) const;

private:
    std::vector<std::string> ids_;
    std::unordered_map<std::string, std::size_t> index_;
    std::vector<std::vector<std::size_t>> predecessors_;
    std::vector<std::vector<std::size_t>> successors_;
};

}  // namespace ael::workflow
