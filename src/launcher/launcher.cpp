#include "dotenv/launcher.hpp"
#include "dotenv/platform.hpp"

#include <spdlog/spdlog.h>

namespace dotenv {

std::unique_ptr<Launcher> Launcher::create(EnvironmentList ambient, std::string search_path) {
    return std::unique_ptr<Launcher>(new Launcher(std::move(ambient), std::move(search_path)));
}

std::unique_ptr<Launcher> Launcher::create() {
    return create(current_environment(), get_env("PATH").value_or(""));
}

Result<LaunchPlan> Launcher::resolve(const LaunchRequest& request) const {
    LaunchPlan result;

    auto layers = load_layers(request.load);
    if (layers.isErr()) {
        return Result<LaunchPlan>::err(layers.error());
    }
    for (const auto& layer : layers.value()) {
        if (layer.present) {
            result.sources.push_back(layer.path);
        }
    }

    auto merged = merge(ambient_, tables_of(layers.value()), request.invocation);
    if (merged.isErr()) {
        return Result<LaunchPlan>::err(merged.error());
    }
    result.merged = std::move(merged.value());

    spdlog::debug("{} variable(s) for {} (strict: {})",
                  result.merged.environment.size(), result.merged.command, result.merged.strict);

    return Result<LaunchPlan>::ok(std::move(result));
}

Result<void> Launcher::locate(LaunchPlan& plan) const {
    // Looked up on the launcher's PATH, not the child's
    auto binary = exec::resolve_executable(plan.merged.command, search_path_);
    if (binary.isErr()) {
        return Result<void>::err(binary.error());
    }
    plan.binary = binary.value();
    return Result<void>::ok();
}

exec::ExecResult Launcher::launch(const LaunchPlan& plan) const {
    exec::ExecSpec spec;
    spec.binary = plan.binary;
    spec.argv.push_back(plan.merged.command);
    spec.argv.insert(spec.argv.end(), plan.merged.args.begin(), plan.merged.args.end());
    spec.environment = plan.merged.environment;
    return exec::execute(spec);
}

} // namespace dotenv
