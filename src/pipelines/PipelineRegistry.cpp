#include "PipelineRegistry.hpp"

// Standard
#include <stdexcept>
#include <utility>

// Internal
#include "FluviewerHooks.hpp"
#include "Logger.hpp"

namespace autorun::pipelines {

void PipelineRegistry::registerHooks(const std::string &pipelineName,
                                     std::unique_ptr<PipelineHooks> hooks) {
    if (!hooks) {
        throw std::invalid_argument("Cannot register empty hooks for " + pipelineName);
    }

    Logger::log(LogLevel::DEBUG, "Registering hooks for pipeline ", pipelineName);
    registeredHooks[pipelineName] = std::move(hooks);
}

auto PipelineRegistry::find(const std::string &pipelineName) const -> const PipelineHooks * {
    const auto iterator = registeredHooks.find(pipelineName);
    if (iterator == registeredHooks.end()) {
        return nullptr;
    }
    return iterator->second.get();
}

auto PipelineRegistry::withDefaultHooks() -> PipelineRegistry {
    PipelineRegistry registry;
    registry.registerHooks(fluviewerPipelineName, std::make_unique<FluviewerHooks>());
    return registry;
}

}  // namespace autorun::pipelines
