/// @file context.cpp
/// @brief Resolution context: deduplication, indexing and the ordering graph

#include <plughost/plugin/context.hpp>
#include <plughost/core/log.hpp>
#include <sstream>

namespace plughost_plugin {

using plughost_core::Err;
using plughost_core::Error;
using plughost_core::Ok;
using plughost_core::ResolutionError;
using plughost_core::Result;

ResolutionContext::ResolutionContext(std::vector<const Descriptor*> input)
    : m_input(std::move(input)) {}

Result<ResolutionContext> ResolutionContext::build(std::vector<const Descriptor*> input) {
    for (std::size_t pos = 0; pos < input.size(); ++pos) {
        if (input[pos] == nullptr) {
            return Err<ResolutionContext>(ResolutionError::null_descriptor(pos));
        }
    }

    ResolutionContext context(std::move(input));
    auto logger = plughost_core::resolver_logger();

    for (Position pos = 0; pos < context.m_input.size(); ++pos) {
        const Descriptor& descriptor = *context.m_input[pos];

        auto [it, inserted] = context.m_index.emplace(descriptor.descriptor_id, pos);
        if (!inserted) {
            const Descriptor& first = *context.m_input[it->second];
            logger->warn("[DescriptorResolver] Duplicate descriptor id {} at position {} ('{}' v{}, owner {}); "
                         "keeping the first occurrence at position {} ('{}' v{}).",
                descriptor.descriptor_id.to_string(), pos, descriptor.label(), descriptor.version,
                descriptor.owner_id.to_string(), it->second, first.label(), first.version);

            context.m_duplicates.insert(pos);
            context.m_reasons[pos].push_back(
                "Duplicate descriptor id; position " + std::to_string(it->second) + " is used instead");
            continue;
        }

        context.m_survivors.push_back(pos);
        context.m_graph.emplace(pos, std::set<Position>{});
    }

    return Ok(std::move(context));
}

Result<std::optional<ResolutionContext::Position>> ResolutionContext::find(const Uuid& descriptor_id) const {
    auto it = m_index.find(descriptor_id);
    if (it == m_index.end()) {
        return Ok(std::optional<Position>{});
    }

    const Position pos = it->second;
    if (pos >= m_input.size() || m_input[pos] == nullptr) {
        return Err<std::optional<Position>>(ResolutionError::index_corrupted(
            descriptor_id.to_string(), "index points at position " + std::to_string(pos) + " with no descriptor"));
    }
    if (m_input[pos]->descriptor_id != descriptor_id || m_duplicates.count(pos) > 0) {
        return Err<std::optional<Position>>(ResolutionError::index_corrupted(
            descriptor_id.to_string(), "index points at position " + std::to_string(pos) +
            " which holds " + m_input[pos]->descriptor_id.to_string()));
    }

    return Ok(std::optional<Position>{pos});
}

void ResolutionContext::disable_for_dependency(Position pos, std::string reason) {
    m_dependency_disabled.insert(pos);
    m_reasons[pos].push_back(std::move(reason));
}

void ResolutionContext::disable_for_conflict(Position pos, std::string reason) {
    m_conflict_disabled.insert(pos);
    m_reasons[pos].push_back(std::move(reason));
}

std::vector<std::string> ResolutionContext::exclusion_reasons(Position pos) const {
    auto it = m_reasons.find(pos);
    return it != m_reasons.end() ? it->second : std::vector<std::string>{};
}

std::string ResolutionContext::exclusion_reason(Position pos) const {
    std::string joined;
    for (const auto& reason : exclusion_reasons(pos)) {
        if (!joined.empty()) joined += "; ";
        joined += reason;
    }
    return joined;
}

bool ResolutionContext::add_ordering(Position before, Position after) {
    if (before == after) {
        return false;
    }

    auto it = m_graph.find(before);
    if (it == m_graph.end() || m_graph.count(after) == 0) {
        return false;
    }

    it->second.insert(after);
    return true;
}

void ResolutionContext::prune() {
    std::set<Position> invalid = m_dependency_disabled;
    invalid.insert(m_conflict_disabled.begin(), m_conflict_disabled.end());

    for (Position pos : invalid) {
        m_graph.erase(pos);
    }

    for (auto& [node, successors] : m_graph) {
        for (Position pos : invalid) {
            successors.erase(pos);
        }
    }
}

SortOutcome ResolutionContext::sort(CyclePolicy policy) const {
    return stable_topological_sort(m_graph, policy);
}

Result<std::vector<const Descriptor*>> ResolutionContext::sorted(CyclePolicy policy) const {
    SortOutcome outcome = sort(policy);

    if (!outcome.complete()) {
        return Err<std::vector<const Descriptor*>>(
            ResolutionError::cycle_detected(format_positions(outcome.stalled)));
    }

    std::vector<const Descriptor*> result;
    result.reserve(outcome.order.size());
    for (Position pos : outcome.order) {
        result.push_back(m_input[pos]);
    }

    return Ok(std::move(result));
}

std::string ResolutionContext::format_positions(const std::vector<Position>& positions) const {
    std::ostringstream oss;
    for (std::size_t i = 0; i < positions.size(); ++i) {
        if (i > 0) oss << " -> ";
        oss << "'" << m_input.at(positions[i])->label() << "'";
    }
    return oss.str();
}

std::string ResolutionContext::to_dot_graph() const {
    std::ostringstream oss;
    oss << "digraph descriptors {\n";
    oss << "  rankdir=LR;\n";
    oss << "  node [shape=box];\n\n";

    for (const auto& [node, _] : m_graph) {
        const Descriptor& d = *m_input[node];
        oss << "  n" << node << " [label=\"" << d.label() << "\\nv" << d.version << "\"];\n";
    }
    oss << "\n";

    for (const auto& [node, successors] : m_graph) {
        for (Position succ : successors) {
            oss << "  n" << node << " -> n" << succ << ";\n";
        }
    }

    oss << "}\n";
    return oss.str();
}

} // namespace plughost_plugin
