#pragma once

#include "protocol.hpp"

#include <functional>
#include <string>

namespace modelbridge {

/**
 * Capability surface of the modeling host.
 *
 * has_active_document() and run_on_document_context() may be called from any
 * thread. execute() must only be called from inside a unit of work passed to
 * run_on_document_context().
 */
class HostCapability {
public:
    using Work = std::function<void()>;

    virtual ~HostCapability() = default;

    virtual bool has_active_document() const = 0;

    /// Runs a named operation against the active document.
    virtual CommandResult execute(const std::string& operation, const json& params) = 0;

    /// Queues @p work on the document-owning context. Work items run in the order they were posted.
    virtual void run_on_document_context(Work work) = 0;
};

} // namespace modelbridge
