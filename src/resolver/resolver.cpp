#include "devshell/resolver.hpp"
#include "devshell/warnings.hpp"

#include <set>

namespace devshell {

namespace {

ResolutionResult fail(ResolutionResult& result, ResolveError error, const std::string& context,
                      const WarningCollector& collector) {
    result.ok = false;
    result.error = error;
    result.error_context = context;
    result.warnings = collector.get_warnings();
    result.spec = ShellSpecification{};
    result.trace.reset();
    return std::move(result);
}

} // namespace

ResolutionResult resolve(const Descriptor& descriptor,
                         const Platform& platform,
                         const PlatformEnumerator& enumerator,
                         const PackageSnapshotEvaluator& evaluator,
                         const ResolveOptions& options) {
    ResolutionResult result;
    result.platform = platform.to_string();
    WarningCollector collector(options.warning_policy);

    if (options.enable_trace) {
        result.trace = std::unordered_map<std::string, TraceEntry>{};
    }

    // =========================================================================
    // Step 1: Cancellation
    // =========================================================================

    if (options.cancellation.is_cancelled()) {
        return fail(result, ResolveError::CANCELLED,
                    "resolution for " + result.platform + " was cancelled", collector);
    }

    // =========================================================================
    // Step 2: Platform must come from the enumerator
    // =========================================================================

    if (!enumerator.supports(platform)) {
        return fail(result, ResolveError::UNSUPPORTED_PLATFORM,
                    "platform '" + result.platform + "' is not a supported platform",
                    collector);
    }

    // =========================================================================
    // Step 3: Every symbolic name in outputs must be a declared input
    // =========================================================================

    auto refs = validate_references(descriptor);
    if (!refs.ok) {
        const auto& first = refs.unresolved.front();
        return fail(result, ResolveError::UNRESOLVED_INPUT,
                    "input '" + first.name + "' referenced by " + first.context +
                    " is not declared in inputs",
                    collector);
    }

    for (const auto& name : unused_inputs(descriptor)) {
        collector.emit(Warning::unused_input, warnings::unused_input(name));
    }

    // =========================================================================
    // Step 4: Import one snapshot per tool input, in first-use order
    // =========================================================================

    std::unordered_map<std::string, PackageSet> snapshots;
    for (const auto& input_name : tool_inputs(descriptor)) {
        if (options.cancellation.is_cancelled()) {
            return fail(result, ResolveError::CANCELLED,
                        "resolution for " + result.platform + " was cancelled", collector);
        }

        const auto& input = descriptor.inputs.at(input_name);
        if (!input.reference.is_pinned()) {
            collector.emit(Warning::unlocked_input,
                      warnings::unlocked_input(input_name, input.url));
        }

        auto imported = evaluator.import_snapshot(input.reference, platform);
        if (!imported.ok) {
            return fail(result, ResolveError::UNREACHABLE_SOURCE,
                        "input '" + input_name + "' (" + input.url + "): " + imported.error,
                        collector);
        }

        result.spec.inputs[input_name] = imported.package_set.rev;
        snapshots.emplace(input_name, std::move(imported.package_set));
    }

    // =========================================================================
    // Step 5: Look up every build input
    // =========================================================================

    const auto& shell = descriptor.outputs.dev_shell;
    std::set<std::string> seen;

    for (const auto& tool : shell.build_inputs) {
        if (!seen.insert(tool).second) {
            collector.emit(Warning::duplicate_build_input, warnings::duplicate_build_input(tool));
            continue;
        }

        auto id = parse_tool_id(tool, shell.packages);
        if (!id) {
            return fail(result, ResolveError::TOOL_NOT_FOUND,
                        "invalid tool identifier '" + tool + "'", collector);
        }

        const auto& package_set = snapshots.at(id->input);
        auto found = package_set.lookup(id->attr_path);
        if (!found.found) {
            return fail(result, ResolveError::TOOL_NOT_FOUND,
                        "tool '" + tool + "' not found in input '" + id->input + "' (rev " +
                        package_set.rev + ") for " + result.platform,
                        collector);
        }

        found.reference.tool_id = tool;
        found.reference.input = id->input;
        result.spec.tools.push_back(found.reference);

        if (result.trace) {
            (*result.trace)[tool] = TraceEntry{id->input, package_set.source,
                                               package_set.rev, package_set.nar_hash};
        }
    }

    // =========================================================================
    // Step 6: Shell specification
    // =========================================================================

    result.spec.platform = result.platform;
    result.spec.env = shell.env;
    result.spec.shell_hook = shell.shell_hook;
    result.warnings = collector.get_warnings();
    result.ok = true;
    return result;
}

} // namespace devshell
