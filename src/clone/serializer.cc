#include "serializer.h"
#include "isolate/generic/error.h"

using namespace v8;

namespace xclone {

/**
 * StructuredCloneCapability implementation
 */
void StructuredCloneCapability::Check(Local<Value> value) const {
	auto* isolate = Isolate::GetCurrent();
	auto context = isolate->GetCurrentContext();
	detail::CloneCheckDelegate delegate;
	ValueSerializer serializer{isolate, &delegate};
	serializer.WriteHeader();
	Unmaybe(serializer.WriteValue(context, value));
}

} // namespace xclone
