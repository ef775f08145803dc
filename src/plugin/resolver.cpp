/// @file resolver.cpp
/// @brief Constraint evaluation, pruning and ordering

#include <plughost/plugin/resolver.hpp>
#include <plughost/plugin/manifest.hpp>
#include <plughost/core/log.hpp>

#include <iomanip>
#include <map>
#include <sstream>

namespace plughost_plugin {

using plughost_core::Err;
using plughost_core::Error;
using plughost_core::Ok;
using plughost_core::ResolutionError;
using plughost_core::Result;

namespace {

std::string describe(const Descriptor& d) {
    return "'" + d.label() + "' v" + d.version;
}

/// Log a failure before it is handed to the caller
Error report_fatal(Error error) {
    auto level = error.code() == plughost_core::ErrorCode::InvalidState
        ? spdlog::level::critical : spdlog::level::err;
    plughost_core::resolver_logger()->log(level, "[DescriptorResolver] {}",
        plughost_core::build_error_chain(error));
    return error;
}

} // anonymous namespace

// =============================================================================
// ResolutionReport
// =============================================================================

const char* descriptor_status_name(DescriptorStatus status) noexcept {
    switch (status) {
        case DescriptorStatus::Resolved: return "Resolved";
        case DescriptorStatus::Duplicate: return "Duplicate";
        case DescriptorStatus::DependencyDisabled: return "DependencyDisabled";
        case DescriptorStatus::ConflictDisabled: return "ConflictDisabled";
        case DescriptorStatus::ManifestDisabled: return "ManifestDisabled";
    }
    return "Unknown";
}

std::size_t ResolutionReport::count(DescriptorStatus status) const {
    std::size_t n = 0;
    for (const auto& row : rows) {
        if (row.status == status) ++n;
    }
    return n;
}

const ReportRow* ResolutionReport::find(const Uuid& descriptor_id) const {
    for (const auto& row : rows) {
        if (row.descriptor_id == descriptor_id) {
            return &row;
        }
    }
    return nullptr;
}

std::string ResolutionReport::format() const {
    std::ostringstream ss;
    ss << std::left
       << std::setw(4) << "#"
       << std::setw(24) << "descriptor"
       << std::setw(12) << "version"
       << std::setw(20) << "status"
       << std::setw(7) << "order"
       << "message\n";

    for (const auto& row : rows) {
        ss << std::setw(4) << row.input_position
           << std::setw(24) << row.label
           << std::setw(12) << row.version
           << std::setw(20) << descriptor_status_name(row.status)
           << std::setw(7) << (row.sort_index ? std::to_string(*row.sort_index) : std::string("-"))
           << row.message << "\n";
    }
    return ss.str();
}

// =============================================================================
// DescriptorResolver
// =============================================================================

Result<ResolutionContext> DescriptorResolver::resolve_context(
    std::vector<const Descriptor*> descriptors) const {
    PLUGHOST_LOG_SCOPE("DescriptorResolver::resolve_context", "plughost.resolver");

    auto built = ResolutionContext::build(std::move(descriptors));
    if (!built) {
        return Err<ResolutionContext>(report_fatal(built.error()));
    }
    ResolutionContext context = std::move(*built);

    if (auto r = evaluate(context); !r) {
        return Err<ResolutionContext>(r.error());
    }
    return Ok(std::move(context));
}

Result<void> DescriptorResolver::evaluate(ResolutionContext& context) const {
    for (Position pos : context.survivors()) {
        if (auto r = process_dependencies(pos, context); !r) {
            return Err(report_fatal(r.error()));
        }
        process_conflicts(pos, context);
        if (auto r = process_load_before(pos, context); !r) {
            return Err(report_fatal(r.error()));
        }
        if (auto r = process_load_after(pos, context); !r) {
            return Err(report_fatal(r.error()));
        }
    }

    context.prune();

    if (m_config.trace_graph) {
        plughost_core::resolver_logger()->debug("[DescriptorResolver] Pruned graph:\n{}", context.to_dot_graph());
    }

    return Ok();
}

Result<std::vector<const Descriptor*>> DescriptorResolver::resolve_pointers(
    std::vector<const Descriptor*> descriptors) const {

    auto context = resolve_context(std::move(descriptors));
    if (!context) {
        return Err<std::vector<const Descriptor*>>(context.error());
    }

    auto positions = order(*context);
    if (!positions) {
        return Err<std::vector<const Descriptor*>>(positions.error());
    }

    std::vector<const Descriptor*> result;
    result.reserve(positions->size());
    for (Position pos : *positions) {
        result.push_back(&context->at(pos));
    }
    return Ok(std::move(result));
}

Result<ResolutionReport> DescriptorResolver::report(
    std::vector<const Descriptor*> descriptors,
    const ManifestStore* manifest) const {

    // Input position of each descriptor handed to the resolver
    std::vector<std::size_t> origin;
    std::vector<const Descriptor*> admitted;
    std::vector<bool> manifest_disabled(descriptors.size(), false);

    for (std::size_t i = 0; i < descriptors.size(); ++i) {
        const Descriptor* d = descriptors[i];
        if (d == nullptr) {
            return Err<ResolutionReport>(report_fatal(ResolutionError::null_descriptor(i)));
        }
        if (manifest && !manifest->is_enabled(d->owner_id, d->descriptor_id)) {
            plughost_core::resolver_logger()->warn(
                "[DescriptorResolver] {} is disabled in the manifest and was not resolved.", describe(*d));
            manifest_disabled[i] = true;
            continue;
        }
        origin.push_back(i);
        admitted.push_back(d);
    }

    auto context = resolve_context(std::move(admitted));
    if (!context) {
        return Err<ResolutionReport>(context.error());
    }

    auto positions = order(*context);
    if (!positions) {
        return Err<ResolutionReport>(positions.error());
    }

    // Sort index by resolver-local position
    std::map<Position, std::size_t> sort_index;
    for (std::size_t i = 0; i < positions->size(); ++i) {
        sort_index.emplace((*positions)[i], i);
    }

    std::vector<std::optional<Position>> local(descriptors.size());
    for (Position pos = 0; pos < origin.size(); ++pos) {
        local[origin[pos]] = pos;
    }

    ResolutionReport result;
    result.rows.reserve(descriptors.size());

    for (std::size_t i = 0; i < descriptors.size(); ++i) {
        const Descriptor& d = *descriptors[i];

        ReportRow row;
        row.input_position = i;
        row.owner_id = d.owner_id;
        row.descriptor_id = d.descriptor_id;
        row.label = d.label();
        row.version = d.version;

        if (manifest_disabled[i]) {
            row.status = DescriptorStatus::ManifestDisabled;
            row.message = "Disabled in the manifest";
        } else {
            const Position pos = *local[i];
            if (context->duplicates().count(pos) > 0) {
                row.status = DescriptorStatus::Duplicate;
            } else if (context->dependency_disabled().count(pos) > 0) {
                row.status = DescriptorStatus::DependencyDisabled;
            } else if (context->conflict_disabled().count(pos) > 0) {
                row.status = DescriptorStatus::ConflictDisabled;
            } else {
                row.status = DescriptorStatus::Resolved;
                auto it = sort_index.find(pos);
                if (it != sort_index.end()) {
                    row.sort_index = it->second;
                }
            }
            row.message = context->exclusion_reason(pos);
        }

        result.rows.push_back(std::move(row));
    }

    return Ok(std::move(result));
}

// =============================================================================
// Constraint Evaluation
// =============================================================================

Result<void> DescriptorResolver::process_dependencies(Position pos, ResolutionContext& context) const {
    const Descriptor& current = context.at(pos);
    auto logger = plughost_core::resolver_logger();

    for (const auto& ref : current.depends_on) {
        auto found = context.find(ref.descriptor_id);
        if (!found) {
            return Err(found.error());
        }

        if (!found->has_value()) {
            logger->warn("[DescriptorResolver] {} depends on {} which is missing; {} is disabled.",
                describe(current), ref.to_string(), describe(current));
            context.disable_for_dependency(pos, "Missing dependency " + ref.to_string());
            continue;
        }

        const Descriptor& target = context.at(**found);
        ReferenceMatch match = ref.check(target.owner_id, target.descriptor_id, target.version);
        if (match != ReferenceMatch::Matched) {
            logger->warn("[DescriptorResolver] {} depends on {} but found {} ({}); {} is disabled.",
                describe(current), ref.to_string(), describe(target), reference_match_name(match),
                describe(current));
            context.disable_for_dependency(pos, "Dependency " + ref.to_string() + " not satisfied by " +
                describe(target) + " (" + reference_match_name(match) + ")");
        }
    }

    return Ok();
}

void DescriptorResolver::process_conflicts(Position pos, ResolutionContext& context) const {
    const Descriptor& current = context.at(pos);
    if (current.conflicts_with.empty()) {
        return;
    }

    for (const auto& [other_pos, _] : context.graph()) {
        if (other_pos == pos) {
            continue;
        }

        const Descriptor& other = context.at(other_pos);
        for (const auto& ref : current.conflicts_with) {
            if (!ref.matches(other.owner_id, other.descriptor_id, other.version)) {
                continue;
            }

            plughost_core::resolver_logger()->warn(
                "[DescriptorResolver] {} conflicts with {} (declared as {}); {} is disabled.",
                describe(current), describe(other), ref.to_string(), describe(current));
            context.disable_for_conflict(pos, "Conflicts with " + describe(other));
            return;
        }
    }
}

Result<std::optional<ResolutionContext::Position>> DescriptorResolver::hint_target(
    Position pos, const DescriptorReference& ref, const char* relation,
    const ResolutionContext& context) const {

    auto found = context.find(ref.descriptor_id);
    if (!found) {
        return Err<std::optional<Position>>(found.error());
    }
    if (!found->has_value() || **found == pos) {
        return Ok(std::optional<Position>{});
    }

    const Position target_pos = **found;
    const Descriptor& target = context.at(target_pos);
    ReferenceMatch match = ref.check(target.owner_id, target.descriptor_id, target.version);
    if (match != ReferenceMatch::Matched) {
        plughost_core::resolver_logger()->debug("[DescriptorResolver] Ignoring {} hint {} -> {}: {}",
            relation, describe(context.at(pos)), describe(target), reference_match_name(match));
        return Ok(std::optional<Position>{});
    }
    if (context.is_disabled(target_pos)) {
        return Ok(std::optional<Position>{});
    }

    return Ok(std::optional<Position>{target_pos});
}

Result<void> DescriptorResolver::process_load_before(Position pos, ResolutionContext& context) const {
    for (const auto& ref : context.at(pos).load_before) {
        auto target = hint_target(pos, ref, "load_before", context);
        if (!target) {
            return Err(target.error());
        }
        if (target->has_value()) {
            context.add_ordering(pos, **target);
        }
    }
    return Ok();
}

Result<void> DescriptorResolver::process_load_after(Position pos, ResolutionContext& context) const {
    for (const auto& ref : context.at(pos).load_after) {
        auto target = hint_target(pos, ref, "load_after", context);
        if (!target) {
            return Err(target.error());
        }
        if (target->has_value()) {
            context.add_ordering(**target, pos);
        }
    }
    return Ok();
}

// =============================================================================
// Ordering
// =============================================================================

Result<std::vector<ResolutionContext::Position>> DescriptorResolver::order(const ResolutionContext& context) const {
    auto logger = plughost_core::resolver_logger();
    SortOutcome outcome = context.sort(m_config.cycle_policy);

    for (Position forced : outcome.forced) {
        logger->warn("[DescriptorResolver] Load order hints around {} form a cycle; "
                     "placing it at its input position.", describe(context.at(forced)));
    }

    if (!outcome.complete()) {
        Error error = ResolutionError::cycle_detected(context.format_positions(outcome.stalled));
        logger->error("[DescriptorResolver] {}", plughost_core::build_error_chain(error));
        return Err<std::vector<Position>>(std::move(error));
    }

    return Ok(std::move(outcome.order));
}

} // namespace plughost_plugin
