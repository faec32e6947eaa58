#pragma once

// Public interface for embedders which link the `xclone` library directly. A v8 isolate and
// context must be entered on the calling thread, with an active `v8::HandleScope`.

#include "../clone/capability.h"
#include "../clone/function_capability.h"
#include "../clone/sanitize.h"
#include "../clone/serializer.h"
#include "../host/host_environment.h"
#include "../isolate/generic/error.h"

namespace xclone_api {
	using xclone::BrowserFilter;
	using xclone::BrowserIdentity;
	using xclone::CloneCapability;
	using xclone::FunctionCloneCapability;
	using xclone::HostEnvironment;
	using xclone::StructuredCloneCapability;
	using xclone::TransportSanitizer;
	using xclone::Unserializable;
	using xclone::kUnserializable;
} // namespace xclone_api
