#include "sanitize.h"
#include "isolate/util.h"
#include "lib/debug.h"

#include <algorithm>
#include <vector>

using namespace v8;

namespace xclone {

TransportSanitizer::TransportSanitizer(const HostEnvironment& environment) :
	oracle{environment},
	flattener{oracle} {}

auto TransportSanitizer::IsSerializable(Local<Value> value) const -> bool {
	return oracle.IsSerializable(value);
}

auto TransportSanitizer::OmitUnserializable(Local<Object> object) const -> Local<Object> {
	auto* isolate = Isolate::GetCurrent();
	auto context = isolate->GetCurrentContext();
	auto keys = Unmaybe(object->GetOwnPropertyNames(
		context, PropertyFilter::ONLY_ENUMERABLE, KeyConversionMode::kConvertToString));
	auto result = Object::New(isolate);
	uint32_t length = keys->Length();
	for (uint32_t ii = 0; ii < length; ++ii) {
		auto key = Unmaybe(keys->Get(context, ii)).As<Name>();
		auto value = Unmaybe(object->Get(context, key));
		if (oracle.IsSerializable(value)) {
			Unmaybe(result->CreateDataProperty(context, key, value));
		} else {
			per_process::Debug(DebugCategory::SANITIZE, "omitting `%s`", DescribeKey(key).c_str());
		}
	}
	return result;
}

auto TransportSanitizer::SanitizeForTransport(Local<Value> value) const -> Local<Value> {
	std::vector<Local<Array>> ancestors;
	return Sanitize(value, ancestors);
}

auto TransportSanitizer::Sanitize(Local<Value> value, std::vector<Local<Array>>& ancestors) const -> Local<Value> {
	// Functions are tested as scalars, never flattened
	if (value->IsArray()) {
		return SanitizeSequence(value.As<Array>(), ancestors);
	} else if (value->IsObject() && !value->IsFunction()) {
		return SanitizeComposite(value.As<Object>());
	} else if (!oracle.IsSerializable(value)) {
		per_process::Debug(DebugCategory::SANITIZE, "scalar value is not serializable");
		throw Unserializable{};
	}
	return value;
}

auto TransportSanitizer::SanitizeSequence(Local<Array> sequence, std::vector<Local<Array>>& ancestors) const -> Local<Array> {
	// An array which contains itself can't be flattened into a finite copy
	if (std::find(ancestors.begin(), ancestors.end(), sequence) != ancestors.end()) {
		per_process::Debug(DebugCategory::SANITIZE, "array contains itself");
		throw Unserializable{};
	}
	if (ancestors.size() >= kMaxSequenceDepth) {
		throw RuntimeRangeError{"Maximum array nesting depth exceeded"};
	}
	ancestors.push_back(sequence);
	auto* isolate = Isolate::GetCurrent();
	auto context = isolate->GetCurrentContext();
	uint32_t length = sequence->Length();
	std::vector<Local<Value>> elements;
	for (uint32_t ii = 0; ii < length; ++ii) {
		auto element = Unmaybe(sequence->Get(context, ii));
		try {
			elements.emplace_back(Sanitize(element, ancestors));
		} catch (const Unserializable&) {
			per_process::Debug(DebugCategory::SANITIZE, "dropping element %u", ii);
		}
	}
	ancestors.pop_back();
	return Array::New(isolate, elements.data(), elements.size());
}

auto TransportSanitizer::SanitizeComposite(Local<Object> object) const -> Local<Object> {
	TryCatch try_catch{Isolate::GetCurrent()};
	try {
		return flattener.Flatten(object);
	} catch (const FatalRuntimeError&) {
		throw;
	} catch (const RuntimeError&) {
		if (try_catch.HasTerminated()) {
			try_catch.ReThrow();
			throw FatalRuntimeError{"Execution terminated while flattening an object"};
		}
		// The pending exception is discarded along with `try_catch`
		per_process::Debug(DebugCategory::SANITIZE, "object could not be flattened");
		throw Unserializable{};
	}
}

} // namespace xclone
