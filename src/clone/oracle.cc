#include "oracle.h"
#include "isolate/util.h"
#include "lib/debug.h"

#include <string>

using namespace v8;

namespace xclone {
namespace {

constexpr auto kObjectConstructorSource = "function Object() { [native code] }";

/**
 * lodash `isPlainObject`. The constructor is compared by source text so objects from other
 * contexts are still recognized.
 */
auto IsPlainObject(Local<Context> context, Local<Object> object, const std::string& tag) -> bool {
	if (tag != "[object Object]") {
		return false;
	}
	auto prototype = object->GetPrototype();
	if (prototype->IsNull()) {
		return true;
	} else if (!prototype->IsObject()) {
		return false;
	}
	auto constructor_key = v8_symbol("constructor");
	if (!Unmaybe(prototype.As<Object>()->HasOwnProperty(context, constructor_key))) {
		return false;
	}
	auto constructor = Unmaybe(prototype.As<Object>()->Get(context, constructor_key));
	if (!constructor->IsFunction()) {
		return false;
	}
	auto source = Unmaybe(constructor.As<Function>()->FunctionProtoToString(context));
	return HandleCast<std::string>(source) == kObjectConstructorSource;
}

} // anonymous namespace

auto IsErrorLike(Local<Value> value) -> bool {
	if (!value->IsObject() || value->IsFunction()) {
		return false;
	} else if (value->IsNativeError()) {
		return true;
	}
	auto context = Isolate::GetCurrent()->GetCurrentContext();
	auto object = value.As<Object>();
	auto tag = HandleCast<std::string>(Unmaybe(object->ObjectProtoToString(context)));
	if (tag == "[object Error]" || tag == "[object DOMException]") {
		return true;
	}
	auto message = Unmaybe(object->Get(context, v8_symbol("message")));
	auto name = Unmaybe(object->Get(context, v8_symbol("name")));
	return message->IsString() && name->IsString() && !IsPlainObject(context, object, tag);
}

/**
 * SerializabilityOracle implementation
 */
auto SerializabilityOracle::IsSerializable(Local<Value> value) const -> bool {
	auto* isolate = Isolate::GetCurrent();
	TryCatch try_catch{isolate};
	try {
		environment.ActiveCapability().Check(value);
		return !RejectedByHostTransport(value);
	} catch (const FatalRuntimeError&) {
		throw;
	} catch (const RuntimeError&) {
		if (try_catch.HasTerminated()) {
			try_catch.ReThrow();
			throw FatalRuntimeError{"Execution terminated while checking serializability"};
		}
		if (per_process::enabled_debug_list().enabled(DebugCategory::ORACLE) && try_catch.HasCaught()) {
			String::Utf8Value message{isolate, Exception::CreateMessage(isolate, try_catch.Exception())->Get()};
			per_process::Debug(DebugCategory::ORACLE, "%s rejected value: %s",
				environment.ActiveCapability().Name(), *message == nullptr ? "" : *message);
		}
		return false;
	}
}

auto SerializabilityOracle::RejectedByHostTransport(Local<Value> value) const -> bool {
	// Only a ponyfill can be wrong here, the native primitive is the transport's own check
	if (environment.UsingNativeCapability() || !environment.IsBrowser(kErrorRejectingBrowserFamily)) {
		return false;
	}
	if (IsErrorLike(value)) {
		per_process::Debug(DebugCategory::ORACLE,
			"%s accepted an error but %s cannot post it, treating it as unserializable",
			environment.ActiveCapability().Name(), kErrorRejectingBrowserFamily);
		return true;
	}
	return false;
}

} // namespace xclone
