#include "function_capability.h"
#include "isolate/generic/error.h"

using namespace v8;

namespace xclone {

FunctionCloneCapability::FunctionCloneCapability(Local<Function> function) :
	function{Isolate::GetCurrent(), function} {}

void FunctionCloneCapability::Check(Local<Value> value) const {
	auto* isolate = Isolate::GetCurrent();
	auto context = isolate->GetCurrentContext();
	Local<Value> argv[] = { value };
	Unmaybe(function.Get(isolate)->Call(context, Undefined(isolate), 1, argv));
}

} // namespace xclone
