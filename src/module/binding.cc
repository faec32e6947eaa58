#include "binding.h"
#include "clone/function_capability.h"
#include "clone/sanitize.h"
#include "clone/serializer.h"
#include "host/host_environment.h"
#include "isolate/functor_runners.h"
#include "isolate/generic/read_option.h"
#include "isolate/util.h"

#include <memory>

using namespace v8;

namespace xclone {
namespace {

/**
 * Builds the host environment for a single call out of the `options` argument:
 *   { browser: { name, family, channel, majorVersion }, structuredClone, nativeStructuredClone, ponyfill }
 */
auto ReadHostEnvironment(Local<Value> options_handle) -> HostEnvironment {
	OptionReader options{options_handle};

	BrowserIdentity browser;
	auto browser_options = options.Nested("browser");
	browser.name = browser_options.Read<std::string>("name", {});
	browser.family = browser_options.Read<std::string>("family", {});
	browser.channel = browser_options.Read<std::string>("channel", {});
	browser.major_version = browser_options.Read<int32_t>("majorVersion", 0);

	std::unique_ptr<CloneCapability> native_capability;
	Local<Function> structured_clone;
	if (options.Read<MaybeLocal<Function>>("structuredClone", {}).ToLocal(&structured_clone)) {
		native_capability = std::make_unique<FunctionCloneCapability>(structured_clone);
	} else if (options.Read<bool>("nativeStructuredClone", true)) {
		native_capability = std::make_unique<StructuredCloneCapability>();
	}

	std::unique_ptr<CloneCapability> fallback_capability;
	Local<Function> ponyfill;
	if (options.Read<MaybeLocal<Function>>("ponyfill", {}).ToLocal(&ponyfill)) {
		fallback_capability = std::make_unique<FunctionCloneCapability>(ponyfill);
	} else {
		fallback_capability = std::make_unique<StructuredCloneCapability>();
	}

	return HostEnvironment{std::move(browser), std::move(native_capability), std::move(fallback_capability)};
}

// isSerializable(value, options?)
void IsSerializable(const FunctionCallbackInfo<Value>& info) {
	FunctorRunners::RunCallback(info, [&]() -> Local<Value> {
		auto environment = ReadHostEnvironment(info[1]);
		TransportSanitizer sanitizer{environment};
		return HandleCast<Local<Boolean>>(sanitizer.IsSerializable(info[0]), info);
	});
}

// omitUnserializable(object, options?)
void OmitUnserializable(const FunctionCallbackInfo<Value>& info) {
	FunctorRunners::RunCallback(info, [&]() -> Local<Value> {
		auto object = HandleCast<Local<Object>>(info[0], info);
		auto environment = ReadHostEnvironment(info[1]);
		TransportSanitizer sanitizer{environment};
		return sanitizer.OmitUnserializable(object);
	});
}

// sanitizeForTransport(value, options?), throws `UNSERIALIZABLE`
void SanitizeForTransport(const FunctionCallbackInfo<Value>& info) {
	FunctorRunners::RunCallback(info, [&]() -> Local<Value> {
		auto environment = ReadHostEnvironment(info[1]);
		TransportSanitizer sanitizer{environment};
		return sanitizer.SanitizeForTransport(info[0]);
	});
}

void SetFunction(Local<Context> context, Local<Object> target, const char* name, FunctionCallback callback) {
	auto* isolate = context->GetIsolate();
	auto function = Unmaybe(FunctionTemplate::New(isolate, callback)->GetFunction(context));
	function->SetName(v8_symbol(name));
	Unmaybe(target->Set(context, v8_symbol(name), function));
}

} // anonymous namespace

void InitializeBinding(Local<Context> context, Local<Object> target) {
	SetFunction(context, target, "isSerializable", IsSerializable);
	SetFunction(context, target, "omitUnserializable", OmitUnserializable);
	SetFunction(context, target, "sanitizeForTransport", SanitizeForTransport);
	Unmaybe(target->DefineOwnProperty(context, v8_symbol("UNSERIALIZABLE"), v8_symbol(kUnserializable),
		static_cast<PropertyAttribute>(PropertyAttribute::ReadOnly | PropertyAttribute::DontDelete)));
}

} // namespace xclone
