#include "binding.h"
#include "isolate/generic/error.h"

#include <node.h>

using namespace v8;

namespace xclone {

// Module entry point
void init(Local<Object> target, Local<Value> /*module*/, Local<Context> context, void* /*priv*/) {
	detail::RunBarrier([&]() {
		InitializeBinding(context, target);
	});
}

} // namespace xclone

NODE_MODULE_CONTEXT_AWARE(xclone, xclone::init) // NOLINT
