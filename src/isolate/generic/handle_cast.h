#pragma once
#include <cstdint>
#include <string>
#include <v8.h>
#include "error.h"

namespace xclone {

// Internal handle conversion error. All these `HandleCastImpl` functions are templated and inlined
// and throwing generates verbose asm so this is implemented as a static function to clean up the
// typical case
struct ParamIncorrect : std::exception {
	explicit ParamIncorrect(const char* type) : type{type} {}
	[[noreturn]] static void Throw(const char* type) { throw ParamIncorrect{type}; }
	const char* type;
};

// Common arguments for casting functions
class HandleCastArguments {
	private:
		// Only calls GetCurrentContext() when a conversion actually needs it
		class ContextHolder {
			public:
				explicit ContextHolder(v8::Isolate* isolate) : isolate{isolate} {}
				inline operator v8::Local<v8::Context>() const { // NOLINT(hicpp-explicit-conversions)
					if (context.IsEmpty()) {
						context = isolate->GetCurrentContext();
					}
					return context;
				}

			private:
				v8::Isolate* const isolate;
				mutable v8::Local<v8::Context> context{};
		};

	public:
		HandleCastArguments() : HandleCastArguments{true, v8::Isolate::GetCurrent()} {}

		HandleCastArguments(bool strict, v8::Isolate* isolate) :
			isolate{isolate}, context{isolate}, strict{strict} {}

		HandleCastArguments(const v8::FunctionCallbackInfo<v8::Value>& info) : // NOLINT(hicpp-explicit-conversions)
			HandleCastArguments{true, info.GetIsolate()} {}

		v8::Isolate* const isolate;
		const ContextHolder context;
		const bool strict;
};

template <class Type>
struct HandleCastTag {};

// Explicit casts: HandleCast<std::string>(value)
template <class Type, class Value>
auto HandleCast(Value&& value, HandleCastArguments arguments = {}) -> Type {
	return HandleCastImpl(std::forward<Value>(value), arguments, HandleCastTag<Type>{});
}

// Identity cast
template <class Type>
inline auto HandleCastImpl(Type value, const HandleCastArguments& /*arguments*/, HandleCastTag<Type> /*tag*/) {
	return value;
}

// Local<Value> -> Local<...> conversions
inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& arguments, HandleCastTag<v8::Local<v8::Boolean>> /*tag*/) {
	if (value->IsBoolean()) {
		return value.As<v8::Boolean>();
	} else if (!arguments.strict) {
		return value->ToBoolean(arguments.isolate);
	}
	ParamIncorrect::Throw("a boolean");
}

inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& /*arguments*/, HandleCastTag<v8::Local<v8::Int32>> /*tag*/) {
	if (value->IsInt32()) {
		return value.As<v8::Int32>();
	}
	ParamIncorrect::Throw("a 32-bit number");
}

inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& /*arguments*/, HandleCastTag<v8::Local<v8::Object>> /*tag*/) {
	if (value->IsObject()) {
		return value.As<v8::Object>();
	}
	ParamIncorrect::Throw("an object");
}

inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& arguments, HandleCastTag<v8::Local<v8::String>> /*tag*/) {
	if (value->IsString()) {
		return value.As<v8::String>();
	} else if (!arguments.strict) {
		return Unmaybe(value->ToString(arguments.context));
	}
	ParamIncorrect::Throw("a string");
}

// Local<Value> -> MaybeLocal<...> conversions, `null` and `undefined` are empty
inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& /*arguments*/, HandleCastTag<v8::MaybeLocal<v8::Function>> /*tag*/)
-> v8::MaybeLocal<v8::Function> {
	if (value->IsNullOrUndefined()) {
		return {};
	} else if (value->IsFunction()) {
		return {value.As<v8::Function>()};
	}
	ParamIncorrect::Throw("a function");
}

inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& /*arguments*/, HandleCastTag<v8::MaybeLocal<v8::Object>> /*tag*/)
-> v8::MaybeLocal<v8::Object> {
	if (value->IsNullOrUndefined()) {
		return {};
	} else if (value->IsObject()) {
		return {value.As<v8::Object>()};
	}
	ParamIncorrect::Throw("an object");
}

// Local<...> -> native C++ conversions
inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& arguments, HandleCastTag<bool> /*tag*/) {
	return HandleCast<v8::Local<v8::Boolean>>(value, arguments)->Value();
}

inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& arguments, HandleCastTag<int32_t> /*tag*/) {
	return HandleCast<v8::Local<v8::Int32>>(value, arguments)->Value();
}

inline auto HandleCastImpl(v8::Local<v8::String> value, const HandleCastArguments& arguments, HandleCastTag<std::string> /*tag*/) {
	v8::String::Utf8Value utf8_value{arguments.isolate, value};
	return std::string{*utf8_value, static_cast<size_t>(utf8_value.length())};
}

inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& arguments, HandleCastTag<std::string> /*tag*/) {
	return HandleCast<std::string>(HandleCast<v8::Local<v8::String>>(value, arguments), arguments);
}

// native C++ -> Local<Value> conversions
inline auto HandleCastImpl(bool value, const HandleCastArguments& arguments, HandleCastTag<v8::Local<v8::Boolean>> /*tag*/) {
	return v8::Boolean::New(arguments.isolate, value);
}

inline auto HandleCastImpl(const char* value, const HandleCastArguments& arguments, HandleCastTag<v8::Local<v8::String>> /*tag*/) {
	return Unmaybe(v8::String::NewFromUtf8(arguments.isolate, value, v8::NewStringType::kNormal));
}

} // namespace xclone
