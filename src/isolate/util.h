#pragma once
#include <string>
#include <v8.h>
#include "generic/error.h"
#include "generic/handle_cast.h"

namespace xclone {

/**
 * Easy strings
 */
inline auto v8_symbol(const char* string) -> v8::Local<v8::String> {
	return Unmaybe(v8::String::NewFromOneByte(v8::Isolate::GetCurrent(), (const uint8_t*)string, v8::NewStringType::kInternalized)); // NOLINT
}

/**
 * Printable form of a property key for debug output. Symbols print as their description.
 */
inline auto DescribeKey(v8::Local<v8::Value> key) -> std::string {
	auto* isolate = v8::Isolate::GetCurrent();
	if (key->IsSymbol()) {
		auto description = key.As<v8::Symbol>()->Description(isolate);
		return description->IsString() ?
			"Symbol(" + HandleCast<std::string>(description.As<v8::String>()) + ")" : "Symbol()";
	}
	v8::String::Utf8Value utf8_value{isolate, key};
	if (*utf8_value == nullptr) {
		return {};
	}
	return std::string{*utf8_value, static_cast<size_t>(utf8_value.length())};
}

} // namespace xclone
