#pragma once

#include "../document_executor.hpp"
#include "../host_capability.hpp"
#include "scene_document.hpp"

#include <memory>
#include <mutex>

namespace modelbridge::scene {

/**
 * HostCapability backed by an in-memory SceneDocument. All document work runs
 * on a private DocumentExecutor thread.
 */
class SceneHost final : public HostCapability {
public:
    explicit SceneHost(bool open_initial_document = true);
    ~SceneHost() override;

    bool has_active_document() const override;
    CommandResult execute(const std::string& operation, const json& params) override;
    void run_on_document_context(Work work) override;

    /// Replaces the active document with a new empty one.
    void open_document();
    void close_document();

    /// Stops the document context. Pending work still runs.
    void shutdown();

private:
    CommandResult execute_on(SceneDocument& doc, const std::string& operation, const json& params);

    mutable std::mutex document_mutex_;
    std::unique_ptr<SceneDocument> document_;
    DocumentExecutor executor_;
};

} // namespace modelbridge::scene
