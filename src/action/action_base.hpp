#pragma once

#include "../host_capability.hpp"
#include "../protocol.hpp"

#include <string>

namespace modelbridge::actions {

struct ActionContext {
	const std::string& action;
	HostCapability& host;
	const json& params;
	bool server_running;
};

class ActionHandler {
public:
	virtual ~ActionHandler() = default;
	virtual const char* name() const = 0;

	/// Parameter schema checked before handle(); nullptr means no checking.
	virtual const ToolDescriptor* schema() const { return nullptr; }

	/// When true, handle() runs on the document context and only with an active document.
	virtual bool requires_document() const { return true; }

	virtual CommandResult handle(ActionContext& ctx) = 0;
};

} // namespace modelbridge::actions
