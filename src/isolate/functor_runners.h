#pragma once
#include "clone/sanitize.h"
#include "generic/error.h"
#include "generic/handle_cast.h"
#include "util.h"

namespace xclone {

/**
 * Helpers to run a function and catch the various exceptions defined above
 */
namespace FunctorRunners {

template <typename F>
inline void RunCallback(const v8::FunctionCallbackInfo<v8::Value>& info, F fn) {
	// This function is used when C++ code is invoked from a JS callback. C++ exceptions will be
	// caught, converted to JS exceptions, and then thrown back to JS.
	try {
		v8::Local<v8::Value> result = fn();
		if (result.IsEmpty()) {
			throw std::logic_error("Callback returned empty Local<> but did not set exception");
		}
		info.GetReturnValue().Set(result);
	} catch (const Unserializable& signal) {
		// The relay compares the thrown value against `UNSERIALIZABLE` by identity
		info.GetIsolate()->ThrowException(v8_symbol(signal.what()));
	} catch (const ParamIncorrect& cc_error) {
		info.GetIsolate()->ThrowException(RuntimeTypeError{std::string{"Argument must be "}+ cc_error.type}.ConstructError());
	} catch (const FatalRuntimeError& cc_error) {
		// Execution is terminating
	} catch (const detail::RuntimeErrorConstructible& cc_error) {
		v8::Local<v8::Value> error = cc_error.ConstructError();
		if (!error.IsEmpty()) {
			info.GetIsolate()->ThrowException(error);
		}
	} catch (const RuntimeError& cc_error) {
		// A JS error is waiting in the isolate
	}
}

} // namespace FunctorRunners
} // namespace xclone
