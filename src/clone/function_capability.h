#pragma once
#include "capability.h"
#include <v8.h>

namespace xclone {

/**
 * Wraps a JS function with the shape of `structuredClone(value)`, or of a structured clone
 * ponyfill. The value is considered clonable if the function returns without throwing.
 */
class FunctionCloneCapability : public CloneCapability {
	public:
		explicit FunctionCloneCapability(v8::Local<v8::Function> function);
		void Check(v8::Local<v8::Value> value) const final;
		auto Name() const -> const char* final { return "function"; }

	private:
		v8::Global<v8::Function> function;
};

} // namespace xclone
